#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <utility>
#include <vector>
#include "../document.hpp"

namespace vecindex_cpp::index {

/// Dense arena position of a node inside one index
using NodeSlot = std::uint32_t;

/// Node in the HNSW graph
/// Each node owns a copy of its document and one neighbor list per layer.
struct HNSWNode {
    std::string id;                           ///< Document id
    std::string owner_id;                     ///< Opaque owner reference
    Vector vector;                            ///< Embedded vector (owned copy)
    Metadata metadata;                        ///< Passed through to results
    Timestamp created_at;                     ///< Document creation time
    std::uint64_t sequence = 0;               ///< Insertion ordinal, breaks distance ties
    std::vector<std::vector<NodeSlot>> edges; ///< edges[layer] = neighbor slots

    /// Construct node from a document, with empty neighbor lists for layers 0..max_layer
    HNSWNode(const VectorDocument& doc, std::size_t max_layer, std::uint64_t seq)
        : id(doc.id), owner_id(doc.owner_id), vector(doc.vector), metadata(doc.metadata),
          created_at(doc.created_at), sequence(seq), edges(max_layer + 1) {}

    /// Construct node taking ownership of the document's buffers
    HNSWNode(VectorDocument&& doc, std::size_t max_layer, std::uint64_t seq)
        : id(std::move(doc.id)), owner_id(std::move(doc.owner_id)), vector(std::move(doc.vector)),
          metadata(std::move(doc.metadata)), created_at(doc.created_at), sequence(seq),
          edges(max_layer + 1) {}

    /// Get connections at specific layer
    std::span<const NodeSlot> neighbors(std::size_t layer) const {
        if (layer >= edges.size())
            return {};
        return edges[layer];
    }

    /// Add edge at layer (duplicates are ignored)
    void add_edge(NodeSlot neighbor, std::size_t layer) {
        if (layer >= edges.size())
            return;
        auto& layer_edges = edges[layer];
        if (std::find(layer_edges.begin(), layer_edges.end(), neighbor) == layer_edges.end()) {
            layer_edges.push_back(neighbor);
        }
    }

    /// Remove edge at layer, returns true if it was present
    bool remove_edge(NodeSlot neighbor, std::size_t layer) {
        if (layer >= edges.size())
            return false;
        auto& layer_edges = edges[layer];
        auto it = std::remove(layer_edges.begin(), layer_edges.end(), neighbor);
        const bool removed = it != layer_edges.end();
        layer_edges.erase(it, layer_edges.end());
        return removed;
    }

    /// Get vector as span
    std::span<const float> as_span() const { return std::span{vector}; }

    /// Highest layer this node participates in
    std::size_t level() const { return edges.empty() ? 0 : edges.size() - 1; }

    /// Number of layers (highest layer + 1)
    std::size_t num_layers() const { return edges.size(); }

    /// Check if node has any connections at layer
    bool has_connections(std::size_t layer) const {
        return layer < edges.size() && !edges[layer].empty();
    }
};

/// Persisted form of a node: neighbor lists refer to document ids instead of slots
struct NodeRecord {
    std::uint64_t sequence = 0;
    std::string document_id;
    std::string owner_id;
    Vector vector;
    Metadata metadata;
    Timestamp created_at;
    std::vector<std::vector<std::string>> neighbors; ///< neighbors[layer] = document ids
};

} // namespace vecindex_cpp::index
