// ============================================================================
// File: shared/common/result_helper.hpp
// Description: Result<T> helper macros
// Depends on: shared/common/result.h
// ============================================================================

#pragma once
#include "result.h"
#include <fmt/core.h>

// ----------------------------------------------------------------------------
// RETURN_IF_ERR
// ----------------------------------------------------------------------------
// usage:
//   auto r = applyLogging(node);
//   RETURN_IF_ERR(r);
// ----------------------------------------------------------------------------
#define RETURN_IF_ERR(res)                                     \
    do {                                                       \
        if (!(res)) {                                          \
            return Result<void>::Error((res).code(), (res).error()); \
        }                                                      \
    } while (0)

// Propagates the error of a Result<void> out of a function returning Result<T>.
#define RETURN_IF_ERR_AS(T, res, msg)                          \
    do {                                                       \
        if (!(res)) {                                          \
            auto err_str = (res).error().has_value()           \
                ? fmt::format("{}: {}", msg, *(res).error())   \
                : std::string(msg);                            \
            return Result<T>::Error((res).code(), err_str);    \
        }                                                      \
    } while (0)

// ----------------------------------------------------------------------------
// LOG_IF_ERR (needs logging.hpp and a LOG_TAG in scope)
// ----------------------------------------------------------------------------
#define LOG_IF_ERR(res)                                        \
    do {                                                       \
        if (!(res)) {                                          \
            if ((res).error().has_value())                     \
                LOGE("{}", *(res).error());                    \
            else                                               \
                LOGE("Error: {}", to_string((res).code()));    \
        }                                                      \
    } while (0)
