#pragma once
#include <memory>
#include <string>
#include <vector>

#include "graph.hpp"

namespace portwire {

    // Immutable accumulator of adapters.
    // provide() returns a new builder that shares every earlier registration
    // with the receiver, so builders can branch from a common prefix.
    class GraphBuilder
    {
    public:
        static GraphBuilder create() { return GraphBuilder(); }

        // Throws DuplicateProviderError when the port is already provided.
        [[nodiscard]] GraphBuilder provide(AdapterPtr adapter) const;

        // Provides every adapter of `other`, in its registration order.
        [[nodiscard]] GraphBuilder merge(const GraphBuilder& other) const;

        // Throws MissingDependencyError listing every unsatisfied port.
        [[nodiscard]] GraphPtr build() const;

        // registration order
        std::vector<AdapterPtr> adapters() const;
        size_t size() const { return head_ ? head_->size : 0; }

        // sorted
        std::vector<std::string> providedPorts() const;
        std::vector<std::string> requiredPorts() const;
        std::vector<std::string> missingPorts() const;

        bool provides(const std::string& port_name) const;

        static constexpr const char* LOG_TAG = "portwire.graph";

    private:
        struct Node {
            AdapterPtr adapter;
            std::shared_ptr<const Node> prev;
            size_t size;
        };

        GraphBuilder() = default;
        explicit GraphBuilder(std::shared_ptr<const Node> head) : head_(std::move(head)) {}

        std::shared_ptr<const Node> head_;
    }; // class GraphBuilder

}; // namespace portwire
