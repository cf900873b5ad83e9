// ============================================================================
// File: shared/common/result.h
// Description: Result / error code type shared by every portwire module
// ============================================================================

#pragma once
#include <string>
#include <utility>
#include <optional>
#include <cstdint>


// NOTE: int-based so codes can be logged and compared across modules.
//       Extendable by appending new codes.
enum class ResultCode : int32_t {
    OK                  = 0,
    Fail                = 1,

    // input & state error
    InvalidArgument     = 100,
    AlreadyExists       = 101,
    NotFound            = 103,
    OutOfRange          = 104,
    InvalidState        = 204,

    // graph validation error
    DuplicateProvider   = 500,
    MissingDependency   = 501,

    // resolution error
    CircularDependency  = 600,
    DisposedResolver    = 601,
    ScopeRequired       = 602,
    FactoryFailed       = 603,
    PortTypeMismatch    = 604,

    // disposal error
    FinalizerFailed     = 700,

    Unknown
};

inline constexpr bool isSuccess(ResultCode code) noexcept {
    return code == ResultCode::OK;
}

inline constexpr bool isFailure(ResultCode code) noexcept {
    return !isSuccess(code);
}

// ----------------------------------------------------------------------------
// Result<T, E>
// ----------------------------------------------------------------------------

template <typename T, typename E = std::optional<std::string>>
class Result {
public:
    // Default constructor: success by default
    Result() : code_(ResultCode::OK), error_(std::nullopt) {}

    static Result OK(T value) { return Result(std::move(value)); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = std::nullopt) { return Result(code, std::move(error)); }

    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] ResultCode code() const noexcept { return code_; }
    [[nodiscard]] const T& value() const noexcept { return value_; }
    [[nodiscard]] T& value() noexcept  { return value_; }
    [[nodiscard]] const E& error() const noexcept  { return error_; }

private:
    ResultCode code_;
    T value_{};
    E error_;

    explicit Result(T val)
        : code_(ResultCode::OK), value_(std::move(val)), error_(std::nullopt) {}

    Result(ResultCode code, E err)
        : code_(code), error_(std::move(err)) {}
};

// ----------------------------------------------------------------------------
// Partial specialization for void
// ----------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    Result() : code_(ResultCode::OK), error_(std::nullopt) {}
    static Result OK() { return Result(ResultCode::OK, std::nullopt); }
    static Result Fail() { return Error(ResultCode::Fail); }
    static Result Error(ResultCode code, E error = std::nullopt) { return Result(code, std::move(error)); }

    [[nodiscard]] bool hasError() const noexcept { return isFailure(code_); }
    [[nodiscard]] explicit operator bool() const noexcept { return isSuccess(code_); }

    [[nodiscard]] const E& error() const noexcept  { return error_; }
    [[nodiscard]] ResultCode code() const noexcept  { return code_; }

    [[nodiscard]] const char* c_str() const noexcept  {
        return error_.has_value() ? error_->c_str() : "";
    }

private:
    ResultCode code_;
    E error_;

    Result(ResultCode code, E e)
        : code_(code), error_(std::move(e)) {}
};

// ----------------------------------------------------------------------------
// String conversion (for logging / error messages)
// ----------------------------------------------------------------------------

constexpr const char* to_string(ResultCode code) {
    switch (code) {
        case ResultCode::OK:                 return "OK";
        case ResultCode::Fail:               return "Fail";
        case ResultCode::InvalidArgument:    return "InvalidArgument";
        case ResultCode::AlreadyExists:      return "AlreadyExists";
        case ResultCode::NotFound:           return "NotFound";
        case ResultCode::OutOfRange:         return "OutOfRange";
        case ResultCode::InvalidState:       return "InvalidState";
        case ResultCode::DuplicateProvider:  return "DuplicateProvider";
        case ResultCode::MissingDependency:  return "MissingDependency";
        case ResultCode::CircularDependency: return "CircularDependency";
        case ResultCode::DisposedResolver:   return "DisposedResolver";
        case ResultCode::ScopeRequired:      return "ScopeRequired";
        case ResultCode::FactoryFailed:      return "FactoryFailed";
        case ResultCode::PortTypeMismatch:   return "PortTypeMismatch";
        case ResultCode::FinalizerFailed:    return "FinalizerFailed";
        default:                             return "Unknown";
    }
}

// LOGI("config: {}", to_string(result));
inline std::string to_string(const Result<void>& r) {
    return std::string(to_string(r.code())) +
           (r.error().has_value() ? (": " + *r.error()) : "");
}


inline Result<void> OK() noexcept { return Result<void>::OK(); }
inline Result<void> Fail() noexcept { return Result<void>::Fail(); }
inline Result<void> Error(ResultCode code, std::optional<std::string> msg = std::nullopt) noexcept  {
    return Result<void>::Error(code, std::move(msg));
}
