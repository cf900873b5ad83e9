#include "errors.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <fmt/format.h>

namespace portwire {

const char* errorCodeName(ResultCode code) noexcept
{
    switch (code) {
        case ResultCode::DuplicateProvider:  return "DUPLICATE_PROVIDER";
        case ResultCode::MissingDependency:  return "MISSING_DEPENDENCY";
        case ResultCode::CircularDependency: return "CIRCULAR_DEPENDENCY";
        case ResultCode::DisposedResolver:   return "DISPOSED_SCOPE";
        case ResultCode::ScopeRequired:      return "SCOPE_REQUIRED";
        case ResultCode::FactoryFailed:      return "FACTORY_FAILED";
        case ResultCode::NotFound:           return "PORT_NOT_FOUND";
        case ResultCode::PortTypeMismatch:   return "PORT_TYPE_MISMATCH";
        case ResultCode::FinalizerFailed:    return "FINALIZER_FAILED";
        default:                             return "CONTAINER_ERROR";
    }
}

ContainerError::ContainerError(ResultCode code, const std::string& message)
    : std::runtime_error(message), code_(code)
{
}

DuplicateProviderError::DuplicateProviderError(const std::string& port)
    : ContainerError(ResultCode::DuplicateProvider, fmt::format("Duplicate provider for: {}", port)),
      port_(port)
{
}

namespace {

std::vector<std::string> sortedUnique(std::vector<std::string> names)
{
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

std::vector<std::string> missingMessages(const std::vector<std::string>& ports)
{
    std::vector<std::string> messages;
    messages.reserve(ports.size());
    for (const auto& port : ports) {
        messages.push_back(fmt::format("Missing dependencies: {}", port));
    }
    return messages;
}

} // namespace

MissingDependencyError::MissingDependencyError(std::vector<std::string> missing_ports)
    : ContainerError(ResultCode::MissingDependency,
                     fmt::format("{}", fmt::join(missingMessages(sortedUnique(missing_ports)), "\n"))),
      missing_ports_(sortedUnique(std::move(missing_ports))),
      messages_(missingMessages(missing_ports_))
{
}

CircularDependencyError::CircularDependencyError(std::vector<std::string> chain)
    : ContainerError(ResultCode::CircularDependency,
                     fmt::format("Circular dependency detected: {}", fmt::join(chain, " -> "))),
      chain_(std::move(chain))
{
}

DisposedResolverError::DisposedResolverError(const std::string& resolver_id, const std::string& operation)
    : ContainerError(ResultCode::DisposedResolver,
                     fmt::format("Cannot {} on '{}': the resolver has already been disposed", operation, resolver_id)),
      resolver_id_(resolver_id)
{
}

ScopeRequiredError::ScopeRequiredError(const std::string& port)
    : ContainerError(ResultCode::ScopeRequired,
                     fmt::format("Cannot resolve scoped port '{}' from the root container. "
                                 "Scoped ports must be resolved from a scope created via createScope()", port)),
      port_(port)
{
}

FactoryError::FactoryError(const std::string& port, const std::string& cause)
    : ContainerError(ResultCode::FactoryFailed, fmt::format("Factory for port '{}' threw: {}", port, cause)),
      port_(port),
      cause_(cause)
{
}

PortNotFoundError::PortNotFoundError(const std::string& port, const std::string& context)
    : ContainerError(ResultCode::NotFound,
                     context.empty()
                        ? fmt::format("Port '{}' is not registered in this container", port)
                        : fmt::format("Port '{}' is not registered in this container ({})", port, context)),
      port_(port)
{
}

PortTypeMismatchError::PortTypeMismatchError(const std::string& port, const std::string& expected, const std::string& actual)
    : ContainerError(ResultCode::PortTypeMismatch,
                     fmt::format("Port '{}' provides '{}' but was requested as '{}'", port, expected, actual)),
      port_(port)
{
}

FinalizerError::FinalizerError(std::vector<FinalizerFailure> failures)
    : ContainerError(ResultCode::FinalizerFailed,
                     fmt::format("{} finalizer(s) failed during disposal", failures.size())),
      failures_(std::move(failures))
{
}

} // namespace portwire
