#pragma once
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "adapter.hpp"

namespace portwire {

    // Frozen, validated set of adapters. Read-only once built, so one instance
    // can back any number of containers on any thread.
    class Graph
    {
    public:
        const std::vector<AdapterPtr>& adapters() const { return adapters_; }

        // nullptr when no adapter provides `port_name`
        AdapterPtr findAdapter(const std::string& port_name) const;

        bool contains(const std::string& port_name) const { return index_.count(port_name) != 0; }
        size_t size() const { return adapters_.size(); }
        bool empty() const { return adapters_.empty(); }

        // sorted
        std::vector<std::string> portNames() const;

    private:
        friend class GraphBuilder;
        explicit Graph(std::vector<AdapterPtr> adapters);

        std::vector<AdapterPtr> adapters_;
        std::unordered_map<std::string, size_t> index_;
    }; // class Graph

    using GraphPtr = std::shared_ptr<const Graph>;


    // An adapter that outlives one of its dependencies, e.g. a singleton holding
    // on to a scoped instance.
    struct CaptiveDependency {
        std::string port_name;
        Lifetime lifetime;
        std::string dependency_name;
        Lifetime dependency_lifetime;

        std::string message() const;
    };

    std::vector<CaptiveDependency> findCaptiveDependencies(const Graph& graph);

}; // namespace portwire
