#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>

namespace dconf {

using NodeId = uint64_t;

/// A node of a dynamic network.
/// Carries categorical labels (label name → value) that stay fixed for
/// the lifetime of the graph; snapshots copy them verbatim.
struct Node {
    NodeId id = 0;
    std::unordered_map<std::string, std::string> labels;

    Node() = default;
    explicit Node(NodeId id) : id(id) {}
    Node(NodeId id, std::unordered_map<std::string, std::string> labels)
        : id(id), labels(std::move(labels)) {}

    void setLabel(const std::string& name, const std::string& value) {
        labels[name] = value;
    }

    std::string getLabel(const std::string& name, const std::string& default_val = "") const {
        auto it = labels.find(name);
        return it != labels.end() ? it->second : default_val;
    }

    bool hasLabel(const std::string& name) const {
        return labels.count(name) > 0;
    }
};

} // namespace dconf
