#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <span>
#include <string_view>
#include <vector>
#include "../document.hpp"
#include "../index/hnsw.hpp"
#include "../utils/error.hpp"

namespace vecindex_cpp::store {

using Index = index::HNSWIndex<>;

/// Vector store configuration
struct StoreConfig {
    std::filesystem::path index_path; ///< Snapshot file; empty keeps the store in memory only
    std::size_t batch_size = 100;     ///< Documents inserted per write-lock acquisition
    bool autosave = true;             ///< Save after every mutation
    Index::Config index;

    [[nodiscard]] VoidResult validate() const;
};

/// One query of a batch search
struct BatchQuery {
    Vector vector;
    std::size_t limit = 10;
};

/// Progress callback: fraction of documents indexed so far, in (0, 1]
using ProgressCallback = std::function<void(double)>;

/// Thread-safe owner of one HNSW index tied to a snapshot file
///
/// Readers (search, stats, save) share the index; writers (indexing, removal,
/// clear, reload) take it exclusively. Indexing releases the write lock
/// between batches so queries interleave with long imports.
class VectorStore {
public:
    /// Open a store, loading the snapshot at config.index_path when one exists
    /// A snapshot that fails to load is logged and the store starts empty.
    [[nodiscard]] static Result<std::unique_ptr<VectorStore>> open(StoreConfig config);

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /// Validate and insert documents in batches, then autosave
    VoidResult index_documents(std::span<const VectorDocument> documents,
                               const ProgressCallback& progress = {});

    /// k nearest documents to query
    Result<std::vector<SearchResult>> search_similar(std::span<const float> query,
                                                     std::size_t limit = 10) const;

    /// Run several queries under one read lock; each uses min(limit, query.limit)
    Result<std::vector<std::vector<SearchResult>>>
    batch_search(std::span<const BatchQuery> queries, std::size_t limit = 10) const;

    /// Remove one document, then autosave
    VoidResult remove_document(std::string_view id);

    /// Drop every document, then autosave
    VoidResult clear();

    /// Write the snapshot file
    VoidResult save() const;

    /// Replace the index with the snapshot file contents
    VoidResult reload();

    [[nodiscard]] IndexStats stats() const;

    [[nodiscard]] bool is_indexing() const noexcept {
        return active_imports_.load(std::memory_order_acquire) > 0;
    }

    [[nodiscard]] const StoreConfig& config() const noexcept { return config_; }

private:
    explicit VectorStore(StoreConfig config);

    bool persistent() const { return !config_.index_path.empty(); }

    VoidResult save_locked() const;
    VoidResult autosave_locked() const;

    StoreConfig config_;
    mutable std::shared_mutex mutex_;
    mutable std::mutex save_mutex_; // Serializes snapshot writers sharing the read lock
    std::unique_ptr<Index> index_;
    std::atomic<int> active_imports_{0}; // index_documents calls in flight
};

} // namespace vecindex_cpp::store
