#pragma once
#include <stdexcept>
#include <string>
#include <vector>

#include "result.h"

namespace portwire {

    // Stable, upper-case identifier of a container error code ("CIRCULAR_DEPENDENCY").
    const char* errorCodeName(ResultCode code) noexcept;

    // Base of every exception thrown by graph construction, resolution and disposal.
    class ContainerError : public std::runtime_error
    {
    public:
        ContainerError(ResultCode code, const std::string& message);
        ~ContainerError() override = default;

        ResultCode code() const noexcept { return code_; }
        const char* codeName() const noexcept { return errorCodeName(code_); }

        // true when the failure points at a wiring mistake rather than a runtime condition
        virtual bool isProgrammingError() const noexcept { return true; }

    private:
        ResultCode code_;
    }; // class ContainerError


    class DuplicateProviderError : public ContainerError
    {
    public:
        explicit DuplicateProviderError(const std::string& port);
        const std::string& port() const noexcept { return port_; }

    private:
        std::string port_;
    }; // class DuplicateProviderError


    // Every missing port is reported, each with its own message.
    class MissingDependencyError : public ContainerError
    {
    public:
        explicit MissingDependencyError(std::vector<std::string> missing_ports);

        const std::vector<std::string>& missingPorts() const noexcept { return missing_ports_; }
        const std::vector<std::string>& messages() const noexcept { return messages_; }

    private:
        std::vector<std::string> missing_ports_;
        std::vector<std::string> messages_;
    }; // class MissingDependencyError


    class CircularDependencyError : public ContainerError
    {
    public:
        explicit CircularDependencyError(std::vector<std::string> chain);

        // from the first occurrence of the repeated port back to itself
        const std::vector<std::string>& dependencyChain() const noexcept { return chain_; }

    private:
        std::vector<std::string> chain_;
    }; // class CircularDependencyError


    class DisposedResolverError : public ContainerError
    {
    public:
        DisposedResolverError(const std::string& resolver_id, const std::string& operation);

        const std::string& resolverId() const noexcept { return resolver_id_; }

    private:
        std::string resolver_id_;
    }; // class DisposedResolverError


    class ScopeRequiredError : public ContainerError
    {
    public:
        explicit ScopeRequiredError(const std::string& port);
        const std::string& port() const noexcept { return port_; }

    private:
        std::string port_;
    }; // class ScopeRequiredError


    class FactoryError : public ContainerError
    {
    public:
        FactoryError(const std::string& port, const std::string& cause);

        const std::string& port() const noexcept { return port_; }
        const std::string& cause() const noexcept { return cause_; }
        bool isProgrammingError() const noexcept override { return false; }

    private:
        std::string port_;
        std::string cause_;
    }; // class FactoryError


    class PortNotFoundError : public ContainerError
    {
    public:
        explicit PortNotFoundError(const std::string& port, const std::string& context = "");
        const std::string& port() const noexcept { return port_; }

    private:
        std::string port_;
    }; // class PortNotFoundError


    class PortTypeMismatchError : public ContainerError
    {
    public:
        PortTypeMismatchError(const std::string& port, const std::string& expected, const std::string& actual);
        const std::string& port() const noexcept { return port_; }

    private:
        std::string port_;
    }; // class PortTypeMismatchError


    struct FinalizerFailure {
        std::string port_name;
        std::string message;
    };

    // Aggregate of every finalizer that failed during one dispose().
    class FinalizerError : public ContainerError
    {
    public:
        explicit FinalizerError(std::vector<FinalizerFailure> failures);

        const std::vector<FinalizerFailure>& failures() const noexcept { return failures_; }
        bool isProgrammingError() const noexcept override { return false; }

    private:
        std::vector<FinalizerFailure> failures_;
    }; // class FinalizerError

}; // namespace portwire
