#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include "utils/error.hpp"

namespace vecindex_cpp {

/// Embedding vector (fixed length within one index)
using Vector = std::vector<float>;

/// Free-form string metadata, opaque to the index
using Metadata = std::map<std::string, std::string>;

/// Wall-clock timestamp (persisted as ISO-8601 UTC)
using Timestamp = std::chrono::system_clock::time_point;

/// Caller-facing unit of insertion
struct VectorDocument {
    std::string id;       ///< Unique document id; the index generates one when empty
    std::string owner_id; ///< Back-reference to the external entity (never dereferenced)
    Vector vector;        ///< Embedding
    Metadata metadata;    ///< Copied verbatim into search results
    Timestamp created_at; ///< Informational only

    /// Create a document with a fresh UUID and the current time
    [[nodiscard]] static VectorDocument create(std::string owner_id, Vector vector,
                                               Metadata metadata = {});
};

/// One ranked hit returned by a query
struct SearchResult {
    std::string id;          ///< Fresh id for this result
    std::string document_id; ///< Id of the matched document
    std::string owner_id;
    double similarity = 0.0; ///< 1 / (1 + distance), in (0, 1]
    double distance = 0.0;   ///< Raw metric value, >= 0
    Metadata metadata;
};

/// Read-only snapshot of index statistics
struct IndexStats {
    std::size_t document_count = 0;
    std::size_t vector_dimension = 0;
    std::uint64_t memory_usage = 0; ///< Estimated bytes
    double build_time = 0.0;        ///< Seconds since the index was constructed
};

/// Random RFC 4122 version-4 UUID, lowercase hex ("xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx")
/// Uses a thread-local generator, safe to call from concurrent readers.
[[nodiscard]] std::string generate_uuid();

/// Format as "YYYY-MM-DDTHH:MM:SS.mmmZ"
[[nodiscard]] std::string format_timestamp(Timestamp timestamp);

/// Parse "YYYY-MM-DDTHH:MM:SS[.fff]Z"
[[nodiscard]] Result<Timestamp> parse_timestamp(std::string_view text);

} // namespace vecindex_cpp
