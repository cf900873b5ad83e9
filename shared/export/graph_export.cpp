#include "graph_export.hpp"

#include <algorithm>
#include <memory>
#include <regex>
#include <unordered_set>
#include <fmt/core.h>

namespace portwire {

namespace {

const char* fillColor(Lifetime lifetime)
{
    switch (lifetime) {
        case Lifetime::Singleton: return "#E8F5E9";
        case Lifetime::Scoped:    return "#E3F2FD";
        case Lifetime::Request:   return "#FFF3E0";
    }
    return "#FFFFFF";
}

std::string escapeDot(const std::string& value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '"') escaped.push_back('\\');
        escaped.push_back(c);
    }
    return escaped;
}

} // namespace

ExportedGraph toExportedGraph(const Graph& graph)
{
    ExportedGraph exported;
    for (const auto& adapter : graph.adapters()) {
        exported.nodes.push_back(ExportedNode{ adapter->portName(), adapter->portName(), adapter->lifetime() });
        for (const auto& dependency : adapter->dependencies()) {
            exported.edges.push_back(ExportedEdge{ adapter->portName(), dependency.name() });
        }
    }

    std::sort(exported.nodes.begin(), exported.nodes.end(),
        [](const ExportedNode& a, const ExportedNode& b) { return a.id < b.id; });
    std::sort(exported.edges.begin(), exported.edges.end(),
        [](const ExportedEdge& a, const ExportedEdge& b) {
            return a.from != b.from ? a.from < b.from : a.to < b.to;
        });
    return exported;
}

void to_json(nlohmann::json& j, const ExportedNode& node)
{
    j = nlohmann::json{ {"id", node.id}, {"label", node.label}, {"lifetime", to_string(node.lifetime)} };
}

void to_json(nlohmann::json& j, const ExportedEdge& edge)
{
    j = nlohmann::json{ {"from", edge.from}, {"to", edge.to} };
}

nlohmann::json toJson(const ExportedGraph& graph)
{
    nlohmann::json j;
    j["nodes"] = graph.nodes;
    j["edges"] = graph.edges;
    return j;
}

std::string toDot(const ExportedGraph& graph, const DotOptions& options)
{
    const bool styled = options.preset == DotOptions::Preset::Styled;

    std::string out = "digraph DependencyGraph {\n";
    out += fmt::format("  rankdir={};\n", options.direction == DotOptions::Direction::LR ? "LR" : "TB");
    out += "  node [shape=box];\n";

    if (!graph.nodes.empty()) out += "\n";
    for (const auto& node : graph.nodes) {
        if (styled) {
            out += fmt::format("  \"{}\" [label=\"{}\\n({})\", style=filled, fillcolor=\"{}\"];\n",
                escapeDot(node.id), escapeDot(node.label), to_string(node.lifetime), fillColor(node.lifetime));
        } else {
            out += fmt::format("  \"{}\" [label=\"{}\\n({})\"];\n",
                escapeDot(node.id), escapeDot(node.label), to_string(node.lifetime));
        }
    }

    if (!graph.edges.empty()) out += "\n";
    for (const auto& edge : graph.edges) {
        out += fmt::format("  \"{}\" -> \"{}\";\n", escapeDot(edge.from), escapeDot(edge.to));
    }
    out += "}";
    return out;
}

ExportedGraph filterGraph(const ExportedGraph& graph, const NodePredicate& predicate)
{
    ExportedGraph filtered;
    std::unordered_set<std::string> kept;
    for (const auto& node : graph.nodes) {
        if (!predicate(node)) continue;
        kept.insert(node.id);
        filtered.nodes.push_back(node);
    }
    for (const auto& edge : graph.edges) {
        if (kept.count(edge.from) && kept.count(edge.to))
            filtered.edges.push_back(edge);
    }
    return filtered;
}

NodePredicate byLifetime(Lifetime lifetime)
{
    return [lifetime](const ExportedNode& node) { return node.lifetime == lifetime; };
}

NodePredicate byPortName(const std::string& pattern)
{
    auto regex = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    return [regex](const ExportedNode& node) { return std::regex_search(node.id, *regex); };
}

} // namespace portwire
