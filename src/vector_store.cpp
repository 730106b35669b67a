// SPDX-License-Identifier: Apache-2.0 OR MIT

#include <vecindex-cpp/store/vector_store.hpp>

#include <algorithm>
#include <mutex>
#include <string>
#include <system_error>
#include <vecindex-cpp/index/hnsw_persistence.hpp>
#include <vecindex-cpp/utils/logging.hpp>

namespace vecindex_cpp::store {

VoidResult StoreConfig::validate() const {
    if (batch_size == 0)
        return err_void(Error::invalid_parameter("batch_size must be at least 1"));
    return index.validate();
}

Result<std::unique_ptr<VectorStore>> VectorStore::open(StoreConfig config) {
    if (auto valid = config.validate(); !valid) {
        return err<std::unique_ptr<VectorStore>>(valid.error());
    }

    std::unique_ptr<VectorStore> store(new VectorStore(std::move(config)));
    const auto& path = store->config_.index_path;

    if (store->persistent()) {
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            if (auto loaded = index::load_hnsw_index(*store->index_, path); !loaded) {
                log::logger()->warn("{}; starting with an empty index", loaded.error().message);
            }
        } else if (ec) {
            log::logger()->warn("cannot inspect '{}': {}; starting with an empty index",
                                path.string(), ec.message());
        }
    }

    log::logger()->info("vector store opened ({} documents, {})", store->index_->size(),
                        store->persistent() ? path.string() : std::string("in memory"));
    return Result<std::unique_ptr<VectorStore>>{std::move(store)};
}

VectorStore::VectorStore(StoreConfig config)
    : config_(std::move(config)), index_(std::make_unique<Index>(config_.index)) {}

VoidResult VectorStore::index_documents(std::span<const VectorDocument> documents,
                                        const ProgressCallback& progress) {
    if (documents.empty())
        return ok();

    {
        std::shared_lock lock(mutex_);
        if (auto valid = index_->validate_documents(documents); !valid) {
            return valid;
        }
    }

    active_imports_.fetch_add(1, std::memory_order_acq_rel);
    const std::size_t total = documents.size();
    std::size_t done = 0;

    while (done < total) {
        const std::size_t count = std::min(config_.batch_size, total - done);
        {
            std::unique_lock lock(mutex_);
            if (auto added = index_->add(documents.subspan(done, count)); !added) {
                active_imports_.fetch_sub(1, std::memory_order_acq_rel);
                return err_void(added.error().with_context(
                    "indexing stopped after " + std::to_string(done) + " of " +
                    std::to_string(total) + " documents"));
            }
        }
        done += count;
        if (progress) {
            progress(static_cast<double>(done) / static_cast<double>(total));
        }
    }
    active_imports_.fetch_sub(1, std::memory_order_acq_rel);

    log::logger()->info("indexed {} documents", total);

    std::shared_lock lock(mutex_);
    if (auto saved = autosave_locked(); !saved) {
        return err_void(saved.error().with_context("indexed " + std::to_string(total) +
                                                   " documents; autosave failed"));
    }
    return ok();
}

Result<std::vector<SearchResult>> VectorStore::search_similar(std::span<const float> query,
                                                              std::size_t limit) const {
    std::shared_lock lock(mutex_);
    return index_->search(query, limit);
}

Result<std::vector<std::vector<SearchResult>>>
VectorStore::batch_search(std::span<const BatchQuery> queries, std::size_t limit) const {
    std::vector<std::vector<SearchResult>> all;
    all.reserve(queries.size());

    std::shared_lock lock(mutex_);
    for (const auto& query : queries) {
        auto results = index_->search(query.vector, std::min(limit, query.limit));
        if (!results) {
            return err<std::vector<std::vector<SearchResult>>>(results.error().with_context(
                "batch query " + std::to_string(all.size())));
        }
        all.push_back(std::move(*results));
    }
    return Result<std::vector<std::vector<SearchResult>>>{std::move(all)};
}

VoidResult VectorStore::remove_document(std::string_view id) {
    std::unique_lock lock(mutex_);
    if (auto removed = index_->remove(id); !removed) {
        return removed;
    }
    if (auto saved = autosave_locked(); !saved) {
        return err_void(
            saved.error().with_context("removed '" + std::string(id) + "'; autosave failed"));
    }
    return ok();
}

VoidResult VectorStore::clear() {
    std::unique_lock lock(mutex_);
    index_ = std::make_unique<Index>(config_.index);
    log::logger()->info("vector store cleared");
    if (auto saved = autosave_locked(); !saved) {
        return err_void(saved.error().with_context("cleared; autosave failed"));
    }
    return ok();
}

VoidResult VectorStore::save() const {
    if (!persistent())
        return err_void(Error::invalid_parameter("store has no index path"));
    std::shared_lock lock(mutex_);
    return save_locked();
}

VoidResult VectorStore::reload() {
    if (!persistent())
        return err_void(Error::invalid_parameter("store has no index path"));
    std::unique_lock lock(mutex_);
    if (auto loaded = index::load_hnsw_index(*index_, config_.index_path); !loaded) {
        return loaded;
    }
    log::logger()->info("reloaded {} documents from '{}'", index_->size(),
                        config_.index_path.string());
    return ok();
}

IndexStats VectorStore::stats() const {
    std::shared_lock lock(mutex_);
    return index_->stats();
}

VoidResult VectorStore::save_locked() const {
    std::lock_guard save_lock(save_mutex_);
    return index::save_hnsw_index(*index_, config_.index_path);
}

VoidResult VectorStore::autosave_locked() const {
    if (!config_.autosave || !persistent())
        return ok();
    return save_locked();
}

} // namespace vecindex_cpp::store
