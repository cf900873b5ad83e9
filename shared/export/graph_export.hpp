#pragma once
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "graph.hpp"

namespace portwire {

    struct ExportedNode {
        std::string id;
        std::string label;
        Lifetime lifetime = Lifetime::Singleton;
    };

    struct ExportedEdge {
        std::string from;
        std::string to;
    };

    // Node / edge view of a graph, keyed by port name.
    struct ExportedGraph {
        std::vector<ExportedNode> nodes;    // sorted by id
        std::vector<ExportedEdge> edges;    // sorted by (from, to)
    };

    struct DotOptions {
        enum class Direction { TB, LR };
        enum class Preset { Minimal, Styled };

        Direction direction = Direction::TB;
        Preset preset = Preset::Minimal;
    };

    using NodePredicate = std::function<bool(const ExportedNode&)>;

    ExportedGraph toExportedGraph(const Graph& graph);

    nlohmann::json toJson(const ExportedGraph& graph);

    // Graphviz digraph; styled nodes are filled by lifetime
    std::string toDot(const ExportedGraph& graph, const DotOptions& options = DotOptions{});

    // Keeps the matching nodes and the edges between them.
    ExportedGraph filterGraph(const ExportedGraph& graph, const NodePredicate& predicate);

    NodePredicate byLifetime(Lifetime lifetime);

    // ECMAScript regex searched in the node id; throws std::regex_error on a bad pattern
    NodePredicate byPortName(const std::string& pattern);

    void to_json(nlohmann::json& j, const ExportedNode& node);
    void to_json(nlohmann::json& j, const ExportedEdge& edge);

}; // namespace portwire
