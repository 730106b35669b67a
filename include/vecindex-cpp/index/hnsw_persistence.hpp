#pragma once

#include <sqlite3.h>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include "../document.hpp"
#include "../utils/error.hpp"
#include "../utils/logging.hpp"
#include "hnsw.hpp"
#include "hnsw_node.hpp"

namespace vecindex_cpp::index {

/// HNSW Index Persistence Layer
/// A snapshot is a single SQLite database file holding the complete graph:
///
/// - vecindex_meta:     key/value pairs (format version, config, entry point, dimension)
/// - vecindex_nodes:    one row per node; node_id is the insertion sequence, the vector is a
///                      little-endian float32 blob and edges hold per-layer neighbor document ids
/// - vecindex_metadata: document metadata, one row per key
///
/// Saves go to "<path>.tmp" and are renamed over the target once committed.

inline constexpr std::uint32_t SNAPSHOT_FORMAT_VERSION = 1;

/// Decoded snapshot contents, independent of any index instance
struct Snapshot {
    std::uint32_t format_version = SNAPSHOT_FORMAT_VERSION;
    std::vector<std::uint8_t> config_blob;
    std::string entry_point_id;
    std::size_t dimension = 0;
    std::string saved_at;
    std::vector<NodeRecord> nodes;
};

namespace detail {

/// Little-endian blob encoder
class BlobWriter {
public:
    void write_u32(std::uint32_t val) {
        for (int i = 0; i < 4; ++i) {
            blob_.push_back((val >> (i * 8)) & 0xFF);
        }
    }

    void write_u64(std::uint64_t val) {
        for (int i = 0; i < 8; ++i) {
            blob_.push_back((val >> (i * 8)) & 0xFF);
        }
    }

    void write_f32(float val) {
        std::uint32_t bits;
        std::memcpy(&bits, &val, sizeof(float));
        write_u32(bits);
    }

    void write_string(const std::string& val) {
        write_u64(val.size());
        blob_.insert(blob_.end(), val.begin(), val.end());
    }

    std::vector<std::uint8_t> take() { return std::move(blob_); }

private:
    std::vector<std::uint8_t> blob_;
};

/// Little-endian blob decoder; throws std::runtime_error on truncation
class BlobReader {
public:
    BlobReader(const void* data, std::size_t size)
        : data_(static_cast<const std::uint8_t*>(data)), size_(data ? size : 0) {}

    std::uint32_t read_u32() {
        require(4);
        std::uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            val |= (static_cast<std::uint32_t>(data_[offset_++]) << (i * 8));
        }
        return val;
    }

    std::uint64_t read_u64() {
        require(8);
        std::uint64_t val = 0;
        for (int i = 0; i < 8; ++i) {
            val |= (static_cast<std::uint64_t>(data_[offset_++]) << (i * 8));
        }
        return val;
    }

    float read_f32() {
        const std::uint32_t bits = read_u32();
        float val;
        std::memcpy(&val, &bits, sizeof(float));
        return val;
    }

    std::string read_string() {
        const std::uint64_t length = read_u64();
        require(length);
        std::string val(reinterpret_cast<const char*>(data_ + offset_), length);
        offset_ += length;
        return val;
    }

    std::size_t remaining() const { return size_ - offset_; }

private:
    void require(std::uint64_t bytes) const {
        if (bytes > size_ - offset_)
            throw std::runtime_error("snapshot blob truncated");
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t offset_ = 0;
};

inline std::vector<std::uint8_t> encode_vector(const Vector& vector) {
    BlobWriter writer;
    for (float v : vector) {
        writer.write_f32(v);
    }
    return writer.take();
}

inline Vector decode_vector(const void* blob, std::size_t size) {
    if (size % sizeof(float) != 0)
        throw std::runtime_error("vector blob size is not a multiple of 4");
    BlobReader reader(blob, size);
    Vector vector(size / sizeof(float));
    for (auto& v : vector) {
        v = reader.read_f32();
    }
    return vector;
}

inline std::vector<std::uint8_t>
encode_edges(const std::vector<std::vector<std::string>>& neighbors) {
    BlobWriter writer;
    writer.write_u64(neighbors.size());
    for (const auto& layer : neighbors) {
        writer.write_u64(layer.size());
        for (const auto& id : layer) {
            writer.write_string(id);
        }
    }
    return writer.take();
}

inline std::vector<std::vector<std::string>> decode_edges(const void* blob, std::size_t size) {
    BlobReader reader(blob, size);
    const std::uint64_t num_layers = reader.read_u64();
    // Every layer needs at least its 8-byte count
    if (num_layers > reader.remaining() / 8)
        throw std::runtime_error("edge blob declares more layers than it holds");

    std::vector<std::vector<std::string>> neighbors(num_layers);
    for (auto& layer : neighbors) {
        const std::uint64_t count = reader.read_u64();
        if (count > reader.remaining() / 8)
            throw std::runtime_error("edge blob declares more neighbors than it holds");
        layer.reserve(count);
        for (std::uint64_t i = 0; i < count; ++i) {
            layer.push_back(reader.read_string());
        }
    }
    if (reader.remaining() != 0)
        throw std::runtime_error("edge blob has trailing bytes");
    return neighbors;
}

struct DatabaseCloser {
    void operator()(sqlite3* db) const noexcept { sqlite3_close(db); }
};
using DatabaseHandle = std::unique_ptr<sqlite3, DatabaseCloser>;

struct StatementFinalizer {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};
using StatementHandle = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

inline Error sqlite_failure(sqlite3* db, int rc, const std::string& what) {
    const char* message = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    return Error::sqlite_error(what + ": " + message, rc);
}

inline Result<DatabaseHandle> open_database(const std::filesystem::path& path, int flags) {
    sqlite3* raw = nullptr;
    const int rc = sqlite3_open_v2(path.string().c_str(), &raw, flags, nullptr);
    DatabaseHandle db(raw);
    if (rc != SQLITE_OK) {
        return err<DatabaseHandle>(sqlite_failure(db.get(), rc, "cannot open database"));
    }
    return Result<DatabaseHandle>{std::move(db)};
}

inline VoidResult exec(sqlite3* db, const char* sql) {
    char* message = nullptr;
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &message);
    if (rc != SQLITE_OK) {
        std::string text = message ? message : sqlite3_errmsg(db);
        sqlite3_free(message);
        return err_void(Error::sqlite_error(std::string(sql) + ": " + text, rc));
    }
    return ok();
}

inline Result<StatementHandle> prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
    StatementHandle stmt(raw);
    if (rc != SQLITE_OK) {
        return err<StatementHandle>(sqlite_failure(db, rc, "cannot prepare statement"));
    }
    return Result<StatementHandle>{std::move(stmt)};
}

/// Step a bound statement that returns no rows, then reset it for reuse
inline VoidResult step_done(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        return err_void(sqlite_failure(db, rc, what));
    }
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    return ok();
}

inline std::string column_string(sqlite3_stmt* stmt, int col) {
    const auto* text = sqlite3_column_text(stmt, col);
    if (text == nullptr)
        return {};
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt, col)));
}

inline constexpr const char* SCHEMA_SQL =
    "CREATE TABLE vecindex_meta (key TEXT PRIMARY KEY, value BLOB);"
    "CREATE TABLE vecindex_nodes ("
    "node_id INTEGER PRIMARY KEY, "
    "document_id TEXT NOT NULL UNIQUE, "
    "owner_id TEXT NOT NULL, "
    "created_at TEXT NOT NULL, "
    "vector BLOB NOT NULL, "
    "edges BLOB NOT NULL);"
    "CREATE TABLE vecindex_metadata ("
    "node_id INTEGER NOT NULL, "
    "key TEXT NOT NULL, "
    "value TEXT NOT NULL, "
    "PRIMARY KEY (node_id, key));";

inline VoidResult write_tables(sqlite3* db, const Snapshot& snapshot) {
    if (auto rc = exec(db, SCHEMA_SQL); !rc)
        return rc;

    // Meta rows
    {
        auto stmt = prepare(db, "INSERT INTO vecindex_meta (key, value) VALUES (?, ?)");
        if (!stmt)
            return err_void(stmt.error());
        sqlite3_stmt* s = stmt->get();

        int rc = sqlite3_bind_text(s, 1, "format_version", -1, SQLITE_STATIC);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_int64(s, 2, snapshot.format_version);
        if (rc != SQLITE_OK)
            return err_void(sqlite_failure(db, rc, "cannot bind format version"));
        if (auto done = step_done(db, s, "cannot write format version"); !done)
            return done;

        rc = sqlite3_bind_text(s, 1, "config", -1, SQLITE_STATIC);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_blob(s, 2, snapshot.config_blob.data(),
                                   static_cast<int>(snapshot.config_blob.size()),
                                   SQLITE_TRANSIENT);
        if (rc != SQLITE_OK)
            return err_void(sqlite_failure(db, rc, "cannot bind config"));
        if (auto done = step_done(db, s, "cannot write config"); !done)
            return done;

        rc = sqlite3_bind_text(s, 1, "entry_point", -1, SQLITE_STATIC);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_text(s, 2, snapshot.entry_point_id.data(),
                                   static_cast<int>(snapshot.entry_point_id.size()),
                                   SQLITE_TRANSIENT);
        if (rc != SQLITE_OK)
            return err_void(sqlite_failure(db, rc, "cannot bind entry point"));
        if (auto done = step_done(db, s, "cannot write entry point"); !done)
            return done;

        rc = sqlite3_bind_text(s, 1, "dimension", -1, SQLITE_STATIC);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_int64(s, 2, static_cast<sqlite3_int64>(snapshot.dimension));
        if (rc != SQLITE_OK)
            return err_void(sqlite_failure(db, rc, "cannot bind dimension"));
        if (auto done = step_done(db, s, "cannot write dimension"); !done)
            return done;

        rc = sqlite3_bind_text(s, 1, "saved_at", -1, SQLITE_STATIC);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_text(s, 2, snapshot.saved_at.c_str(), -1, SQLITE_TRANSIENT);
        if (rc != SQLITE_OK)
            return err_void(sqlite_failure(db, rc, "cannot bind save time"));
        if (auto done = step_done(db, s, "cannot write save time"); !done)
            return done;
    }

    auto node_stmt = prepare(db, "INSERT INTO vecindex_nodes "
                                 "(node_id, document_id, owner_id, created_at, vector, edges) "
                                 "VALUES (?, ?, ?, ?, ?, ?)");
    if (!node_stmt)
        return err_void(node_stmt.error());
    auto meta_stmt =
        prepare(db, "INSERT INTO vecindex_metadata (node_id, key, value) VALUES (?, ?, ?)");
    if (!meta_stmt)
        return err_void(meta_stmt.error());

    for (const auto& node : snapshot.nodes) {
        const auto node_id = static_cast<sqlite3_int64>(node.sequence);
        const std::string created_at = format_timestamp(node.created_at);
        const auto vector_blob = encode_vector(node.vector);
        const auto edges_blob = encode_edges(node.neighbors);

        sqlite3_stmt* s = node_stmt->get();
        int rc = sqlite3_bind_int64(s, 1, node_id);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_text(s, 2, node.document_id.data(),
                                   static_cast<int>(node.document_id.size()), SQLITE_TRANSIENT);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_text(s, 3, node.owner_id.data(),
                                   static_cast<int>(node.owner_id.size()), SQLITE_TRANSIENT);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_text(s, 4, created_at.c_str(), -1, SQLITE_TRANSIENT);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_blob(s, 5, vector_blob.data(), static_cast<int>(vector_blob.size()),
                                   SQLITE_TRANSIENT);
        if (rc == SQLITE_OK)
            rc = sqlite3_bind_blob(s, 6, edges_blob.data(), static_cast<int>(edges_blob.size()),
                                   SQLITE_TRANSIENT);
        if (rc != SQLITE_OK)
            return err_void(sqlite_failure(db, rc, "cannot bind node '" + node.document_id + "'"));
        if (auto done = step_done(db, s, "cannot write node"); !done)
            return done;

        sqlite3_stmt* m = meta_stmt->get();
        for (const auto& [key, value] : node.metadata) {
            rc = sqlite3_bind_int64(m, 1, node_id);
            if (rc == SQLITE_OK)
                rc = sqlite3_bind_text(m, 2, key.c_str(), static_cast<int>(key.size()),
                                       SQLITE_TRANSIENT);
            if (rc == SQLITE_OK)
                rc = sqlite3_bind_text(m, 3, value.c_str(), static_cast<int>(value.size()),
                                       SQLITE_TRANSIENT);
            if (rc != SQLITE_OK)
                return err_void(sqlite_failure(db, rc, "cannot bind metadata"));
            if (auto done = step_done(db, m, "cannot write metadata"); !done)
                return done;
        }
    }
    return ok();
}

/// Write a snapshot into a fresh database file at `path`
inline VoidResult write_snapshot(const std::filesystem::path& path, const Snapshot& snapshot) {
    auto db = open_database(path, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    if (!db)
        return err_void(db.error());

    if (auto rc = exec(db->get(), "BEGIN TRANSACTION"); !rc)
        return rc;

    if (auto written = write_tables(db->get(), snapshot); !written) {
        if (auto rollback = exec(db->get(), "ROLLBACK"); !rollback) {
            log::logger()->warn("rollback failed: {}", rollback.error().message);
        }
        return written;
    }

    return exec(db->get(), "COMMIT");
}

/// Read every table of a snapshot file
inline Result<Snapshot> read_snapshot(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return err<Snapshot>(Error::io_error(
            "snapshot file does not exist" + (ec ? " (" + ec.message() + ")" : std::string{})));
    }

    auto db = open_database(path, SQLITE_OPEN_READONLY);
    if (!db)
        return err<Snapshot>(db.error());

    Snapshot snapshot;
    bool have_version = false;

    try {
        // Meta
        {
            auto stmt = prepare(db->get(), "SELECT key, value FROM vecindex_meta");
            if (!stmt)
                return err<Snapshot>(stmt.error());
            int rc;
            while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
                sqlite3_stmt* s = stmt->get();
                const std::string key = column_string(s, 0);
                if (key == "format_version") {
                    snapshot.format_version = static_cast<std::uint32_t>(sqlite3_column_int64(s, 1));
                    have_version = true;
                } else if (key == "config") {
                    const auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(s, 1));
                    const int bytes = sqlite3_column_bytes(s, 1);
                    if (blob != nullptr)
                        snapshot.config_blob.assign(blob, blob + bytes);
                } else if (key == "entry_point") {
                    snapshot.entry_point_id = column_string(s, 1);
                } else if (key == "dimension") {
                    snapshot.dimension = static_cast<std::size_t>(sqlite3_column_int64(s, 1));
                } else if (key == "saved_at") {
                    snapshot.saved_at = column_string(s, 1);
                }
            }
            if (rc != SQLITE_DONE)
                return err<Snapshot>(sqlite_failure(db->get(), rc, "cannot read meta"));
        }

        if (!have_version)
            return err<Snapshot>(Error::parse_error("snapshot has no format version"));
        if (snapshot.format_version != SNAPSHOT_FORMAT_VERSION) {
            return err<Snapshot>(Error::parse_error("unsupported snapshot format version " +
                                                    std::to_string(snapshot.format_version)));
        }

        // Nodes
        std::unordered_map<std::int64_t, std::size_t> position_by_node_id;
        {
            auto stmt = prepare(db->get(),
                                "SELECT node_id, document_id, owner_id, created_at, vector, edges "
                                "FROM vecindex_nodes ORDER BY node_id");
            if (!stmt)
                return err<Snapshot>(stmt.error());
            int rc;
            while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
                sqlite3_stmt* s = stmt->get();
                const std::int64_t node_id = sqlite3_column_int64(s, 0);
                if (node_id < 0)
                    return err<Snapshot>(Error::parse_error("negative node id"));

                NodeRecord record;
                record.sequence = static_cast<std::uint64_t>(node_id);
                record.document_id = column_string(s, 1);
                record.owner_id = column_string(s, 2);

                auto created_at = parse_timestamp(column_string(s, 3));
                if (!created_at)
                    return err<Snapshot>(created_at.error());
                record.created_at = *created_at;

                record.vector = decode_vector(sqlite3_column_blob(s, 4),
                                              static_cast<std::size_t>(sqlite3_column_bytes(s, 4)));
                record.neighbors = decode_edges(sqlite3_column_blob(s, 5),
                                                static_cast<std::size_t>(sqlite3_column_bytes(s, 5)));

                position_by_node_id.emplace(node_id, snapshot.nodes.size());
                snapshot.nodes.push_back(std::move(record));
            }
            if (rc != SQLITE_DONE)
                return err<Snapshot>(sqlite_failure(db->get(), rc, "cannot read nodes"));
        }

        // Metadata
        {
            auto stmt = prepare(db->get(), "SELECT node_id, key, value FROM vecindex_metadata");
            if (!stmt)
                return err<Snapshot>(stmt.error());
            int rc;
            while ((rc = sqlite3_step(stmt->get())) == SQLITE_ROW) {
                sqlite3_stmt* s = stmt->get();
                auto it = position_by_node_id.find(sqlite3_column_int64(s, 0));
                if (it == position_by_node_id.end())
                    return err<Snapshot>(Error::parse_error("metadata row for unknown node"));
                snapshot.nodes[it->second].metadata.emplace(column_string(s, 1),
                                                            column_string(s, 2));
            }
            if (rc != SQLITE_DONE)
                return err<Snapshot>(sqlite_failure(db->get(), rc, "cannot read metadata"));
        }
    } catch (const std::exception& e) {
        return err<Snapshot>(Error::parse_error(e.what()));
    }

    return Result<Snapshot>{std::move(snapshot)};
}

} // namespace detail

/// Serialize HNSW index configuration to blob
template <typename Metric>
std::vector<std::uint8_t> serialize_hnsw_config(const typename HNSWIndex<Metric>::Config& config) {
    constexpr std::uint32_t version = 1;

    detail::BlobWriter writer;
    writer.write_u32(version);
    writer.write_u64(config.M);
    writer.write_u64(config.M_max);
    writer.write_u64(config.ef_construction);
    writer.write_u64(config.ef_search);
    writer.write_u64(config.max_level);
    writer.write_f32(config.ml_factor);
    writer.write_u32(config.seed);
    return writer.take();
}

/// Deserialize HNSW index configuration from blob
/// @throws std::runtime_error on a truncated blob or unknown version
template <typename Metric>
typename HNSWIndex<Metric>::Config deserialize_hnsw_config(const std::vector<std::uint8_t>& blob) {
    detail::BlobReader reader(blob.data(), blob.size());

    const std::uint32_t version = reader.read_u32();
    if (version != 1) {
        throw std::runtime_error("Unsupported HNSW config version");
    }

    typename HNSWIndex<Metric>::Config config;
    config.M = reader.read_u64();
    config.M_max = reader.read_u64();
    config.ef_construction = reader.read_u64();
    config.ef_search = reader.read_u64();
    config.max_level = reader.read_u64();
    config.ml_factor = reader.read_f32();
    config.seed = reader.read_u32();
    return config;
}

/// Save the complete index to a snapshot file
/// The target is replaced atomically; on failure any previous file at `path` is kept.
template <typename Metric>
VoidResult save_hnsw_index(const HNSWIndex<Metric>& index, const std::filesystem::path& path) {
    const auto started = std::chrono::steady_clock::now();
    const std::string context = "failed to save index to '" + path.string() + "'";

    Snapshot snapshot;
    snapshot.config_blob = serialize_hnsw_config<Metric>(index.config());
    if (const HNSWNode* entry = index.entry_point()) {
        snapshot.entry_point_id = entry->id;
    }
    snapshot.dimension = index.dimension();
    snapshot.saved_at = format_timestamp(std::chrono::system_clock::now());
    snapshot.nodes = index.snapshot();

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
            return err_void(Error::io_error(context + ": " + ec.message()));
    }

    std::filesystem::path tmp = path;
    tmp += ".tmp";
    std::filesystem::remove(tmp, ec);
    if (ec)
        return err_void(Error::io_error(context + ": cannot clear '" + tmp.string() +
                                        "': " + ec.message()));

    if (auto written = detail::write_snapshot(tmp, snapshot); !written) {
        std::filesystem::remove(tmp, ec);
        if (ec) {
            log::logger()->warn("cannot remove partial snapshot '{}': {}", tmp.string(),
                                ec.message());
        }
        return err_void(written.error().with_context(context));
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        auto failure = Error::io_error(context + ": rename failed: " + ec.message());
        std::filesystem::remove(tmp, ec);
        return err_void(std::move(failure));
    }

    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();
    log::logger()->debug("saved {} nodes to '{}' in {:.1f} ms", snapshot.nodes.size(),
                         path.string(), elapsed_ms);
    return ok();
}

/// Replace the index contents with a snapshot file
/// All-or-nothing: on any failure the index is left exactly as it was.
template <typename Metric>
VoidResult load_hnsw_index(HNSWIndex<Metric>& index, const std::filesystem::path& path) {
    const auto started = std::chrono::steady_clock::now();
    const std::string context = "failed to load index from '" + path.string() + "'";

    auto snapshot = detail::read_snapshot(path);
    if (!snapshot)
        return err_void(snapshot.error().with_context(context));

    typename HNSWIndex<Metric>::Config saved;
    try {
        saved = deserialize_hnsw_config<Metric>(snapshot->config_blob);
    } catch (const std::exception& e) {
        return err_void(Error::parse_error(e.what()).with_context(context));
    }

    const auto& live = index.config();
    if (saved.M != live.M || saved.M_max != live.M_max || saved.max_level != live.max_level) {
        log::logger()->warn("snapshot '{}' was built with M={} M_max={} max_level={}, "
                            "index uses M={} M_max={} max_level={}",
                            path.string(), saved.M, saved.M_max, saved.max_level, live.M,
                            live.M_max, live.max_level);
        if (saved.M_max > live.M_max)
            log::logger()->warn("neighbor lists longer than {} will be pruned", live.M_max);
    }

    const std::size_t node_count = snapshot->nodes.size();
    if (node_count > 0 && snapshot->dimension != snapshot->nodes.front().vector.size()) {
        return err_void(Error::parse_error("stored dimension " +
                                           std::to_string(snapshot->dimension) +
                                           " does not match node vectors")
                            .with_context(context));
    }

    if (auto restored = index.restore(std::move(snapshot->nodes), snapshot->entry_point_id);
        !restored) {
        return err_void(restored.error().with_context(context));
    }

    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();
    log::logger()->debug("loaded {} nodes from '{}' (saved {}) in {:.1f} ms", node_count,
                         path.string(), snapshot->saved_at, elapsed_ms);
    return ok();
}

} // namespace vecindex_cpp::index
