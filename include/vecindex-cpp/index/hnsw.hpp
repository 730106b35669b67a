#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <queue>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>
#include "../concepts/distance_metric.hpp"
#include "../distances/l2.hpp"
#include "../document.hpp"
#include "../utils/error.hpp"
#include "../utils/logging.hpp"
#include "hnsw_node.hpp"
#include "level_generator.hpp"

namespace vecindex_cpp::index {

/// Hierarchical Navigable Small World (HNSW) index for approximate nearest neighbor search
///
/// Nodes live in a slot arena addressed by dense integer positions, with an id -> slot
/// map for lookups by document id. Neighbor lists store slots, so following an edge is O(1).
///
/// Not internally synchronized: search() and stats() may run concurrently with each
/// other, but never with add(), remove() or restore().
template <concepts::DistanceMetric<float> Metric = distances::SquaredL2Metric<float>>
class HNSWIndex {
public:
    /// Configuration parameters
    struct Config {
        std::size_t M = 16;                      ///< Connections made per node per layer
        std::size_t M_max = 32;                  ///< Hard cap on neighbors per layer
        std::size_t ef_construction = 200;       ///< Candidate breadth during insertion
        std::size_t ef_search = 100;             ///< Candidate breadth during queries
        std::size_t max_level = 16;              ///< Highest layer a node can be assigned
        float ml_factor = 1.0f / std::log(2.0f); ///< Layer selection multiplier
        std::uint32_t seed = 42;                 ///< Level generator seed
        Metric metric{};                         ///< Distance metric

        /// Check every parameter against its valid domain
        [[nodiscard]] VoidResult validate() const {
            if (M == 0)
                return err_void(Error::invalid_parameter("M must be at least 1"));
            if (M_max < M)
                return err_void(Error::invalid_parameter("M_max (" + std::to_string(M_max) +
                                                         ") must be >= M (" + std::to_string(M) +
                                                         ")"));
            if (ef_construction == 0)
                return err_void(Error::invalid_parameter("ef_construction must be at least 1"));
            if (ef_search == 0)
                return err_void(Error::invalid_parameter("ef_search must be at least 1"));
            if (max_level > 64)
                return err_void(Error::invalid_parameter("max_level must not exceed 64"));
            if (!std::isfinite(ml_factor) || ml_factor <= 0.0f)
                return err_void(Error::invalid_parameter("ml_factor must be positive"));
            return ok();
        }
    };

    /// Construct empty index with default configuration
    HNSWIndex() : HNSWIndex(Config{}) {}

    /// Construct empty index
    /// @throws std::invalid_argument if the configuration is invalid
    explicit HNSWIndex(Config config)
        : config_(std::move(config)),
          level_generator_(config_.ml_factor, config_.max_level, std::mt19937(config_.seed)),
          build_start_(std::chrono::steady_clock::now()) {
        if (auto valid = config_.validate(); !valid) {
            throw std::invalid_argument(valid.error().message);
        }
    }

    /// Insert a batch of documents
    /// The whole batch is validated before the graph is touched; on error nothing is inserted.
    VoidResult add(std::span<const VectorDocument> documents) {
        if (documents.empty())
            return ok();

        if (auto valid = validate_documents(documents); !valid) {
            return valid;
        }

        if (dimension_ == 0) {
            dimension_ = documents.front().vector.size();
        }

        for (const auto& doc : documents) {
            HNSWNode node(doc, level_generator_(), next_sequence_++);
            if (node.id.empty()) {
                node.id = generate_uuid();
            }
            insert_node(std::move(node));
        }
        return ok();
    }

    /// Check a batch against the index without inserting it
    [[nodiscard]] VoidResult validate_documents(std::span<const VectorDocument> documents) const {
        if (documents.empty())
            return ok();

        const std::size_t expected =
            dimension_ != 0 ? dimension_ : documents.front().vector.size();
        if (expected == 0) {
            return err_void(Error::invalid_parameter("vectors must not be empty"));
        }
        if (size() + documents.size() > std::numeric_limits<NodeSlot>::max()) {
            return err_void(Error::invalid_parameter("index capacity exceeded"));
        }

        std::unordered_set<std::string_view> batch_ids;
        batch_ids.reserve(documents.size());
        for (const auto& doc : documents) {
            if (doc.vector.size() != expected) {
                return err_void(Error::dimension_mismatch(expected, doc.vector.size()));
            }
            if (!all_finite(doc.vector)) {
                return err_void(Error::invalid_parameter("vector of document '" + doc.id +
                                                         "' has a non-finite component"));
            }
            if (doc.id.empty())
                continue;
            if (slot_by_id_.count(doc.id) != 0 || !batch_ids.insert(doc.id).second) {
                return err_void(Error::invalid_parameter("duplicate document id '" + doc.id + "'"));
            }
        }
        return ok();
    }

    /// Remove a document and repair the neighbor lists that pointed at it
    /// @return NotFound if the id is not in the index
    VoidResult remove(std::string_view id) {
        auto it = slot_by_id_.find(std::string(id));
        if (it == slot_by_id_.end()) {
            return err_void(Error::not_found(id));
        }

        const NodeSlot slot = it->second;
        slot_by_id_.erase(it);
        HNSWNode removed = std::move(*slots_[slot]);
        slots_[slot].reset();
        free_slots_.push_back(slot);

        repair_neighbors(slot, removed);

        if (entry_point_ == slot) {
            std::tie(entry_point_, entry_layer_) = elect_entry_point(slots_);
            log::logger()->debug("entry point '{}' removed, new entry layer {}", removed.id,
                                 entry_layer_);
        }
        return ok();
    }

    /// Search for the k nearest neighbors using the configured ef_search
    Result<std::vector<SearchResult>> search(std::span<const float> query, std::size_t k) const {
        return search(query, k, config_.ef_search);
    }

    /// Search for the k nearest neighbors
    /// @param query Query vector (must match the index dimension)
    /// @param k Number of results to return
    /// @param ef Exploration factor (raised to k when smaller)
    /// @return Results sorted by ascending distance; empty if the index is empty
    Result<std::vector<SearchResult>> search(std::span<const float> query, std::size_t k,
                                             std::size_t ef) const {
        std::vector<SearchResult> results;
        if (empty())
            return Result<std::vector<SearchResult>>{std::move(results)};

        if (query.size() != dimension_) {
            return err<std::vector<SearchResult>>(
                Error::dimension_mismatch(dimension_, query.size()));
        }
        if (!all_finite(query)) {
            return err<std::vector<SearchResult>>(
                Error::invalid_parameter("query has a non-finite component"));
        }
        if (k == 0)
            return Result<std::vector<SearchResult>>{std::move(results)};

        auto nearest = search_candidates(query, k, std::max(ef, k));
        results.reserve(nearest.size());
        for (const auto& candidate : nearest) {
            const HNSWNode& node = *slots_[candidate.slot];
            const double dist = candidate.distance;
            results.push_back(SearchResult{generate_uuid(), node.id, node.owner_id,
                                           1.0 / (1.0 + dist), dist, node.metadata});
        }
        return Result<std::vector<SearchResult>>{std::move(results)};
    }

    /// Derived statistics over the current graph
    [[nodiscard]] IndexStats stats() const {
        IndexStats stats;
        stats.document_count = size();
        stats.vector_dimension = dimension_;
        for (const auto& slot : slots_) {
            if (!slot)
                continue;
            stats.memory_usage += sizeof(HNSWNode) + slot->vector.size() * sizeof(float);
            for (const auto& layer : slot->edges) {
                stats.memory_usage += layer.size() * sizeof(NodeSlot);
            }
        }
        stats.build_time =
            std::chrono::duration<double>(std::chrono::steady_clock::now() - build_start_)
                .count();
        return stats;
    }

    /// Export all nodes, ordered by insertion sequence, with neighbor ids resolved
    [[nodiscard]] std::vector<NodeRecord> snapshot() const {
        std::vector<const HNSWNode*> ordered;
        ordered.reserve(size());
        for (const auto& slot : slots_) {
            if (slot)
                ordered.push_back(&*slot);
        }
        std::sort(ordered.begin(), ordered.end(),
                  [](const HNSWNode* a, const HNSWNode* b) { return a->sequence < b->sequence; });

        std::vector<NodeRecord> records;
        records.reserve(ordered.size());
        for (const HNSWNode* node : ordered) {
            NodeRecord record{node->sequence, node->id,       node->owner_id, node->vector,
                              node->metadata, node->created_at, {}};
            record.neighbors.resize(node->edges.size());
            for (std::size_t layer = 0; layer < node->edges.size(); ++layer) {
                for (NodeSlot neighbor : node->edges[layer]) {
                    if (const HNSWNode* target = node_at(neighbor)) {
                        record.neighbors[layer].push_back(target->id);
                    }
                }
            }
            records.push_back(std::move(record));
        }
        return records;
    }

    /// Replace the whole graph with previously exported records
    /// Records are validated in a staging area; on error the live graph is untouched.
    VoidResult restore(std::vector<NodeRecord> records, std::string_view entry_point_id) {
        std::sort(records.begin(), records.end(),
                  [](const NodeRecord& a, const NodeRecord& b) { return a.sequence < b.sequence; });

        if (records.size() > std::numeric_limits<NodeSlot>::max()) {
            return err_void(Error::parse_error("snapshot holds too many nodes"));
        }

        const std::size_t dimension = records.empty() ? 0 : records.front().vector.size();
        std::unordered_map<std::string, NodeSlot> slot_by_id;
        slot_by_id.reserve(records.size());

        for (std::size_t i = 0; i < records.size(); ++i) {
            const auto& record = records[i];
            const std::string where = "snapshot node " + std::to_string(record.sequence);
            if (record.document_id.empty()) {
                return err_void(Error::parse_error(where + " has no document id"));
            }
            if (dimension == 0 || record.vector.size() != dimension) {
                return err_void(Error::parse_error(where + " has inconsistent dimension " +
                                                   std::to_string(record.vector.size())));
            }
            if (!all_finite(record.vector)) {
                return err_void(Error::parse_error(where + " has a non-finite component"));
            }
            if (record.neighbors.empty()) {
                return err_void(Error::parse_error(where + " has no layers"));
            }
            if (i > 0 && record.sequence == records[i - 1].sequence) {
                return err_void(Error::parse_error(where + " is duplicated"));
            }
            if (!slot_by_id.emplace(record.document_id, static_cast<NodeSlot>(i)).second) {
                return err_void(
                    Error::parse_error("duplicate document id '" + record.document_id + "'"));
            }
        }

        std::vector<std::optional<HNSWNode>> slots;
        slots.reserve(records.size());
        for (auto& record : records) {
            auto neighbors = std::move(record.neighbors);
            HNSWNode node(VectorDocument{std::move(record.document_id), std::move(record.owner_id),
                                         std::move(record.vector), std::move(record.metadata),
                                         record.created_at},
                          neighbors.size() - 1, record.sequence);
            for (std::size_t layer = 0; layer < neighbors.size(); ++layer) {
                for (const auto& neighbor_id : neighbors[layer]) {
                    auto it = slot_by_id.find(neighbor_id);
                    if (it == slot_by_id.end()) {
                        return err_void(Error::parse_error("node '" + node.id +
                                                           "' references unknown neighbor '" +
                                                           neighbor_id + "'"));
                    }
                    node.add_edge(it->second, layer);
                }
            }
            slots.emplace_back(std::move(node));
        }

        // Lists written under a larger M_max are cut back to the live bound
        for (std::size_t i = 0; i < slots.size(); ++i) {
            for (std::size_t layer = 0; layer < slots[i]->edges.size(); ++layer) {
                if (slots[i]->edges[layer].size() > config_.M_max)
                    prune_connections(slots, static_cast<NodeSlot>(i), layer);
            }
        }

        // The stored entry point is kept only while it sits on the top layer
        std::optional<NodeSlot> entry_point;
        std::size_t entry_layer = 0;
        std::tie(entry_point, entry_layer) = elect_entry_point(slots);
        if (auto it = slot_by_id.find(std::string(entry_point_id));
            it != slot_by_id.end() && slots[it->second]->level() == entry_layer) {
            entry_point = it->second;
        }

        const std::uint64_t next_sequence = slots.empty() ? 0 : slots.back()->sequence + 1;

        slots_ = std::move(slots);
        free_slots_.clear();
        slot_by_id_ = std::move(slot_by_id);
        entry_point_ = entry_point;
        entry_layer_ = entry_layer;
        dimension_ = dimension;
        next_sequence_ = next_sequence;
        return ok();
    }

    /// Get number of documents in index
    std::size_t size() const { return slot_by_id_.size(); }

    /// Check if index is empty
    bool empty() const { return slot_by_id_.empty(); }

    /// Established vector dimension (0 until the first insert)
    std::size_t dimension() const { return dimension_; }

    /// Get maximum layer in index
    std::size_t max_layer() const { return entry_layer_; }

    /// Entry point node, or nullptr when empty
    const HNSWNode* entry_point() const {
        return entry_point_ ? node_at(*entry_point_) : nullptr;
    }

    /// Get configuration
    const Config& config() const { return config_; }

    /// Check whether a document id is indexed
    bool contains(std::string_view id) const { return slot_by_id_.count(std::string(id)) != 0; }

    /// Get node by document id
    const HNSWNode* get_node(std::string_view id) const {
        auto it = slot_by_id_.find(std::string(id));
        return it != slot_by_id_.end() ? node_at(it->second) : nullptr;
    }

    /// Get node by slot; nullptr for vacant or out-of-range slots
    const HNSWNode* node_at(NodeSlot slot) const {
        if (slot >= slots_.size() || !slots_[slot])
            return nullptr;
        return &*slots_[slot];
    }

    /// Visit every live node in slot order
    template <typename Fn> void for_each_node(Fn&& fn) const {
        for (const auto& slot : slots_) {
            if (slot)
                fn(*slot);
        }
    }

private:
    /// Scored reference to a node; ties on distance resolve by insertion order
    struct Candidate {
        float distance;
        std::uint64_t sequence;
        NodeSlot slot;
    };

    static bool closer(const Candidate& a, const Candidate& b) {
        if (a.distance != b.distance)
            return a.distance < b.distance;
        return a.sequence < b.sequence;
    }

    Config config_;
    LevelGenerator<std::mt19937> level_generator_;
    std::vector<std::optional<HNSWNode>> slots_;
    std::vector<NodeSlot> free_slots_;
    std::unordered_map<std::string, NodeSlot> slot_by_id_;
    std::optional<NodeSlot> entry_point_;
    std::size_t entry_layer_ = 0;
    std::size_t dimension_ = 0;
    std::uint64_t next_sequence_ = 0;
    std::chrono::steady_clock::time_point build_start_;

    static bool all_finite(std::span<const float> values) {
        return std::all_of(values.begin(), values.end(), [](float v) { return std::isfinite(v); });
    }

    /// Highest-level live node (earliest inserted on ties)
    static std::pair<std::optional<NodeSlot>, std::size_t>
    elect_entry_point(const std::vector<std::optional<HNSWNode>>& slots) {
        std::optional<NodeSlot> best;
        std::size_t best_level = 0;
        std::uint64_t best_sequence = 0;
        for (std::size_t i = 0; i < slots.size(); ++i) {
            if (!slots[i])
                continue;
            const HNSWNode& node = *slots[i];
            if (!best || node.level() > best_level ||
                (node.level() == best_level && node.sequence < best_sequence)) {
                best = static_cast<NodeSlot>(i);
                best_level = node.level();
                best_sequence = node.sequence;
            }
        }
        return {best, best_level};
    }

    NodeSlot allocate_slot(HNSWNode node) {
        NodeSlot slot;
        if (!free_slots_.empty()) {
            slot = free_slots_.back();
            free_slots_.pop_back();
            slots_[slot].emplace(std::move(node));
        } else {
            slot = static_cast<NodeSlot>(slots_.size());
            slots_.emplace_back(std::move(node));
        }
        slot_by_id_.emplace(slots_[slot]->id, slot);
        return slot;
    }

    void insert_node(HNSWNode node) {
        const std::size_t level = node.level();
        const NodeSlot slot = allocate_slot(std::move(node));
        const std::span<const float> query = slots_[slot]->as_span();

        // First node becomes entry point
        if (!entry_point_) {
            entry_point_ = slot;
            entry_layer_ = level;
            return;
        }

        const HNSWNode& entry = *slots_[*entry_point_];
        Candidate current{distance(query, entry), entry.sequence, *entry_point_};

        // Phase 1: greedy descent through layers above the node's level
        for (std::size_t lc = entry_layer_; lc > level; --lc) {
            current = greedy_search_layer(query, current, lc);
        }

        // Phase 2: beam search + connect at the node's level and below
        std::vector<Candidate> entry_points{current};
        for (std::size_t lc = std::min(level, entry_layer_);; --lc) {
            auto candidates = search_layer(query, entry_points, config_.ef_construction, lc);
            connect_neighbors(slot, candidates, lc);

            if (lc == 0)
                break; // Guard against underflow
            entry_points = std::move(candidates);
        }

        if (level > entry_layer_) {
            entry_point_ = slot;
            entry_layer_ = level;
        }
    }

    /// Greedy search at single layer: move to a strictly closer neighbor until none exists
    Candidate greedy_search_layer(std::span<const float> query, Candidate current,
                                  std::size_t layer) const {
        bool changed = true;
        while (changed) {
            changed = false;
            const HNSWNode* node = node_at(current.slot);
            if (node == nullptr)
                break;
            for (NodeSlot neighbor_slot : node->neighbors(layer)) {
                const HNSWNode* neighbor = node_at(neighbor_slot);
                if (neighbor == nullptr)
                    continue;
                const float neighbor_dist = distance(query, *neighbor);
                if (neighbor_dist < current.distance) {
                    current = Candidate{neighbor_dist, neighbor->sequence, neighbor_slot};
                    changed = true;
                }
            }
        }
        return current;
    }

    /// Beam search at single layer (returns up to ef nearest, ascending)
    std::vector<Candidate> search_layer(std::span<const float> query,
                                        const std::vector<Candidate>& entry_points, std::size_t ef,
                                        std::size_t layer) const {
        // Max heap: worst admitted result at top
        auto cmp = [](const Candidate& a, const Candidate& b) { return closer(a, b); };
        std::priority_queue<Candidate, std::vector<Candidate>, decltype(cmp)> top_candidates(cmp);

        // Min heap: closest unexplored candidate at top
        auto cmp_min = [](const Candidate& a, const Candidate& b) { return closer(b, a); };
        std::priority_queue<Candidate, std::vector<Candidate>, decltype(cmp_min)> candidates(
            cmp_min);

        std::unordered_set<NodeSlot> visited;
        for (const auto& entry : entry_points) {
            if (!visited.insert(entry.slot).second)
                continue;
            candidates.push(entry);
            top_candidates.push(entry);
            if (top_candidates.size() > ef)
                top_candidates.pop();
        }

        while (!candidates.empty()) {
            const Candidate current = candidates.top();

            // Early termination: nothing left that could improve a full result set
            if (top_candidates.size() >= ef && closer(top_candidates.top(), current))
                break;
            candidates.pop();

            const HNSWNode* node = node_at(current.slot);
            if (node == nullptr)
                continue;

            for (NodeSlot neighbor_slot : node->neighbors(layer)) {
                if (!visited.insert(neighbor_slot).second)
                    continue;
                const HNSWNode* neighbor = node_at(neighbor_slot);
                if (neighbor == nullptr)
                    continue;

                const Candidate next{distance(query, *neighbor), neighbor->sequence,
                                     neighbor_slot};
                if (top_candidates.size() < ef || closer(next, top_candidates.top())) {
                    candidates.push(next);
                    top_candidates.push(next);
                    if (top_candidates.size() > ef)
                        top_candidates.pop();
                }
            }
        }

        std::vector<Candidate> result;
        result.reserve(top_candidates.size());
        while (!top_candidates.empty()) {
            result.push_back(top_candidates.top());
            top_candidates.pop();
        }
        std::reverse(result.begin(), result.end());
        return result;
    }

    /// Descend from the entry point and return the k best candidates at layer 0
    std::vector<Candidate> search_candidates(std::span<const float> query, std::size_t k,
                                             std::size_t ef) const {
        const HNSWNode& entry = *slots_[*entry_point_];
        Candidate current{distance(query, entry), entry.sequence, *entry_point_};

        for (std::size_t lc = entry_layer_; lc > 0; --lc) {
            current = greedy_search_layer(query, current, lc);
        }

        auto candidates = search_layer(query, std::vector<Candidate>{current}, ef, 0);
        if (candidates.size() > k) {
            candidates.resize(k);
        }
        return candidates;
    }

    /// Connect node to the M nearest candidates at layer, with back-edges
    void connect_neighbors(NodeSlot slot, const std::vector<Candidate>& candidates,
                           std::size_t layer) {
        const std::size_t num_connections = std::min(config_.M, candidates.size());

        for (std::size_t i = 0; i < num_connections; ++i) {
            const NodeSlot neighbor_slot = candidates[i].slot;
            if (neighbor_slot == slot)
                continue;

            slots_[slot]->add_edge(neighbor_slot, layer);
            HNSWNode& neighbor = *slots_[neighbor_slot];
            neighbor.add_edge(slot, layer);

            if (neighbor.neighbors(layer).size() > config_.M_max) {
                prune_connections(neighbor_slot, layer);
            }
        }
    }

    /// Keep only the M_max neighbors closest to the node itself
    void prune_connections(NodeSlot slot, std::size_t layer) {
        prune_connections(slots_, slot, layer);
    }

    /// Same, on an arbitrary arena (the live one or a restore staging area)
    void prune_connections(std::vector<std::optional<HNSWNode>>& slots, NodeSlot slot,
                           std::size_t layer) const {
        HNSWNode& node = *slots[slot];
        auto& layer_edges = node.edges[layer];

        std::vector<Candidate> scored;
        scored.reserve(layer_edges.size());
        for (NodeSlot neighbor_slot : layer_edges) {
            if (neighbor_slot < slots.size() && slots[neighbor_slot]) {
                const HNSWNode& neighbor = *slots[neighbor_slot];
                scored.push_back(Candidate{distance(node.as_span(), neighbor), neighbor.sequence,
                                           neighbor_slot});
            }
        }
        std::sort(scored.begin(), scored.end(), closer);
        if (scored.size() > config_.M_max) {
            scored.resize(config_.M_max);
        }

        layer_edges.clear();
        for (const auto& candidate : scored) {
            layer_edges.push_back(candidate.slot);
        }
    }

    /// Scrub a removed slot from every neighbor list, reconnecting affected nodes
    /// through the removed node's own neighbors (closest first, up to M)
    void repair_neighbors(NodeSlot removed_slot, const HNSWNode& removed) {
        for (std::size_t i = 0; i < slots_.size(); ++i) {
            if (!slots_[i])
                continue;
            HNSWNode& node = *slots_[i];
            const auto slot = static_cast<NodeSlot>(i);

            for (std::size_t layer = 0; layer < node.edges.size(); ++layer) {
                if (!node.remove_edge(removed_slot, layer))
                    continue;

                std::vector<Candidate> replacements;
                for (NodeSlot candidate_slot : removed.neighbors(layer)) {
                    const HNSWNode* candidate = node_at(candidate_slot);
                    if (candidate == nullptr || candidate_slot == slot)
                        continue;
                    replacements.push_back(Candidate{distance(node.as_span(), *candidate),
                                                     candidate->sequence, candidate_slot});
                }
                std::sort(replacements.begin(), replacements.end(), closer);

                for (const auto& replacement : replacements) {
                    if (node.edges[layer].size() >= config_.M)
                        break;
                    node.add_edge(replacement.slot, layer);
                }
            }
        }
    }

    float distance(std::span<const float> query, const HNSWNode& node) const {
        return config_.metric(query, node.as_span());
    }
};

} // namespace vecindex_cpp::index
