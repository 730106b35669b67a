// SPDX-License-Identifier: Apache-2.0 OR MIT
// Unit tests for HNSW snapshot save/load

#include <catch2/catch_test_macros.hpp>

#include <vecindex-cpp/index/hnsw.hpp>
#include <vecindex-cpp/index/hnsw_persistence.hpp>

#include <sqlite3.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using namespace vecindex_cpp;
using namespace vecindex_cpp::index;
namespace fs = std::filesystem;

namespace {

/// Scratch directory removed at scope exit
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / ("vecindex-test-" + generate_uuid())) {
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

std::vector<VectorDocument> random_docs(std::size_t count, std::size_t dim, std::uint32_t seed) {
    std::mt19937 rng(seed);
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    std::vector<VectorDocument> docs;
    docs.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        Vector v(dim);
        for (auto& x : v) {
            x = dist(rng);
        }
        docs.push_back(VectorDocument::create("owner-" + std::to_string(i % 7), std::move(v),
                                              {{"index", std::to_string(i)}, {"kind", "test"}}));
    }
    return docs;
}

Vector random_query(std::size_t dim, std::mt19937& rng) {
    std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
    Vector v(dim);
    for (auto& x : v) {
        x = dist(rng);
    }
    return v;
}

/// Run raw SQL against a snapshot file to simulate corruption
void tamper(const fs::path& path, const char* sql) {
    sqlite3* db = nullptr;
    REQUIRE(sqlite3_open(path.string().c_str(), &db) == SQLITE_OK);
    const int rc = sqlite3_exec(db, sql, nullptr, nullptr, nullptr);
    sqlite3_close(db);
    REQUIRE(rc == SQLITE_OK);
}

std::vector<std::string> top_ids(const HNSWIndex<>& index, const Vector& query, std::size_t k) {
    auto results = index.search(query, k);
    REQUIRE(results);
    std::vector<std::string> ids;
    for (const auto& r : *results) {
        ids.push_back(r.document_id);
    }
    return ids;
}

} // namespace

TEST_CASE("Persistence: round trip", "[persistence]") {
    TempDir dir;
    const fs::path path = dir / "index.db";

    HNSWIndex<> original;
    auto docs = random_docs(300, 24, 17);
    REQUIRE(original.add(docs));
    REQUIRE(original.remove(docs[10].id));

    REQUIRE(save_hnsw_index(original, path));
    REQUIRE(fs::exists(path));
    REQUIRE_FALSE(fs::exists(fs::path(path.string() + ".tmp")));

    HNSWIndex<> loaded;
    REQUIRE(load_hnsw_index(loaded, path));

    SECTION("Shape is preserved") {
        REQUIRE(loaded.size() == original.size());
        REQUIRE(loaded.dimension() == original.dimension());
        REQUIRE(loaded.max_layer() == original.max_layer());
        REQUIRE(loaded.entry_point()->id == original.entry_point()->id);
        REQUIRE_FALSE(loaded.contains(docs[10].id));
    }

    SECTION("Search results are identical") {
        std::mt19937 rng(5);
        for (int q = 0; q < 25; ++q) {
            auto query = random_query(24, rng);
            auto before = original.search(query, 10);
            auto after = loaded.search(query, 10);
            REQUIRE(before);
            REQUIRE(after);
            REQUIRE(before->size() == after->size());
            for (std::size_t i = 0; i < before->size(); ++i) {
                REQUIRE((*before)[i].document_id == (*after)[i].document_id);
                REQUIRE((*before)[i].distance == (*after)[i].distance);
            }
        }
    }

    SECTION("Node contents survive") {
        const HNSWNode* node = loaded.get_node(docs[42].id);
        REQUIRE(node != nullptr);
        REQUIRE(node->vector == docs[42].vector);
        REQUIRE(node->owner_id == docs[42].owner_id);
        REQUIRE(node->metadata == docs[42].metadata);
        REQUIRE(node->created_at ==
                std::chrono::time_point_cast<std::chrono::milliseconds>(docs[42].created_at));
        REQUIRE(node->edges.size() == original.get_node(docs[42].id)->edges.size());
    }

    SECTION("Loaded index accepts new documents") {
        auto more = random_docs(5, 24, 99);
        REQUIRE(loaded.add(more));
        REQUIRE(loaded.size() == original.size() + 5);
        REQUIRE(top_ids(loaded, more[2].vector, 1).front() == more[2].id);
    }

    SECTION("Saving again overwrites the previous snapshot") {
        REQUIRE(loaded.remove(docs[0].id));
        REQUIRE(save_hnsw_index(loaded, path));
        HNSWIndex<> reloaded;
        REQUIRE(load_hnsw_index(reloaded, path));
        REQUIRE(reloaded.size() == original.size() - 1);
    }
}

TEST_CASE("Persistence: empty index", "[persistence]") {
    TempDir dir;
    const fs::path path = dir / "empty.db";

    HNSWIndex<> empty;
    REQUIRE(save_hnsw_index(empty, path));

    HNSWIndex<> target;
    auto docs = random_docs(20, 4, 1);
    REQUIRE(target.add(docs));
    REQUIRE(load_hnsw_index(target, path));

    REQUIRE(target.empty());
    REQUIRE(target.dimension() == 0);
    REQUIRE(target.entry_point() == nullptr);

    // Dimension is re-established by the next insert
    auto wider = random_docs(3, 9, 2);
    REQUIRE(target.add(wider));
    REQUIRE(target.dimension() == 9);
}

TEST_CASE("Persistence: failed loads leave the index untouched", "[persistence][errors]") {
    TempDir dir;

    HNSWIndex<> index;
    auto docs = random_docs(50, 8, 3);
    REQUIRE(index.add(docs));
    const auto expected = top_ids(index, docs[0].vector, 5);

    auto require_untouched = [&] {
        REQUIRE(index.size() == 50);
        REQUIRE(index.dimension() == 8);
        REQUIRE(top_ids(index, docs[0].vector, 5) == expected);
    };

    SECTION("Missing file") {
        auto result = load_hnsw_index(index, dir / "does-not-exist.db");
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::IoError);
        REQUIRE(result.error().message.find("does-not-exist.db") != std::string::npos);
        require_untouched();
    }

    SECTION("File that is not a database") {
        const fs::path path = dir / "garbage.db";
        {
            std::ofstream out(path, std::ios::binary);
            for (int i = 0; i < 4096; ++i) {
                out.put(static_cast<char>('A' + i % 26));
            }
        }
        auto result = load_hnsw_index(index, path);
        REQUIRE_FALSE(result);
        REQUIRE(result.error().code == ErrorCode::SQLiteError);
        require_untouched();
    }

    SECTION("Corrupt snapshots") {
        const fs::path path = dir / "snapshot.db";
        HNSWIndex<> other;
        auto other_docs = random_docs(30, 8, 4);
        REQUIRE(other.add(other_docs));
        REQUIRE(save_hnsw_index(other, path));

        SECTION("Truncated edge blob") {
            tamper(path, "UPDATE vecindex_nodes SET edges = x'0100' WHERE node_id = 3");
            auto result = load_hnsw_index(index, path);
            REQUIRE_FALSE(result);
            REQUIRE(result.error().code == ErrorCode::ParseError);
            require_untouched();
        }

        SECTION("Vector blob of the wrong dimension") {
            tamper(path, "UPDATE vecindex_nodes SET vector = x'0000803f' WHERE node_id = 5");
            auto result = load_hnsw_index(index, path);
            REQUIRE_FALSE(result);
            REQUIRE(result.error().code == ErrorCode::ParseError);
            require_untouched();
        }

        SECTION("Neighbor that no longer exists") {
            tamper(path, "DELETE FROM vecindex_nodes WHERE node_id = "
                         "(SELECT node_id FROM vecindex_nodes WHERE length(edges) > 16 LIMIT 1)");
            auto result = load_hnsw_index(index, path);
            REQUIRE_FALSE(result);
            REQUIRE(result.error().code == ErrorCode::ParseError);
            require_untouched();
        }

        SECTION("Unsupported format version") {
            tamper(path, "UPDATE vecindex_meta SET value = 99 WHERE key = 'format_version'");
            auto result = load_hnsw_index(index, path);
            REQUIRE_FALSE(result);
            REQUIRE(result.error().code == ErrorCode::ParseError);
            require_untouched();
        }

        SECTION("Missing table") {
            tamper(path, "DROP TABLE vecindex_metadata");
            auto result = load_hnsw_index(index, path);
            REQUIRE_FALSE(result);
            REQUIRE(result.error().code == ErrorCode::SQLiteError);
            require_untouched();
        }
    }
}

TEST_CASE("Persistence: config blob", "[persistence][config]") {
    HNSWIndex<>::Config config{.M = 8, .M_max = 24, .ef_construction = 64, .ef_search = 32,
                               .max_level = 10, .ml_factor = 0.5f, .seed = 7};

    auto blob = serialize_hnsw_config<distances::SquaredL2Metric<float>>(config);
    auto decoded = deserialize_hnsw_config<distances::SquaredL2Metric<float>>(blob);

    REQUIRE(decoded.M == 8);
    REQUIRE(decoded.M_max == 24);
    REQUIRE(decoded.ef_construction == 64);
    REQUIRE(decoded.ef_search == 32);
    REQUIRE(decoded.max_level == 10);
    REQUIRE(decoded.ml_factor == 0.5f);
    REQUIRE(decoded.seed == 7);

    SECTION("Truncated blob throws") {
        blob.resize(blob.size() - 3);
        REQUIRE_THROWS_AS(deserialize_hnsw_config<distances::SquaredL2Metric<float>>(blob),
                          std::runtime_error);
    }

    SECTION("Unknown version throws") {
        blob[0] = 2;
        REQUIRE_THROWS_AS(deserialize_hnsw_config<distances::SquaredL2Metric<float>>(blob),
                          std::runtime_error);
    }
}

TEST_CASE("Persistence: live config wins over the snapshot", "[persistence][config]") {
    TempDir dir;
    const fs::path path = dir / "config.db";

    HNSWIndex<>::Config saved_config{.M = 4, .M_max = 8};
    HNSWIndex<> saved(saved_config);
    auto docs = random_docs(40, 6, 8);
    REQUIRE(saved.add(docs));
    REQUIRE(save_hnsw_index(saved, path));

    HNSWIndex<> loaded;
    REQUIRE(load_hnsw_index(loaded, path));
    REQUIRE(loaded.size() == 40);
    REQUIRE(loaded.config().M == 16);
    REQUIRE(top_ids(loaded, docs[3].vector, 1).front() == docs[3].id);
}

TEST_CASE("Persistence: wider snapshot is pruned to the live M_max", "[persistence][config]") {
    TempDir dir;
    const fs::path path = dir / "wide.db";

    HNSWIndex<> wide;
    auto docs = random_docs(500, 8, 21);
    REQUIRE(wide.add(docs));

    std::size_t longest_saved = 0;
    wide.for_each_node([&](const HNSWNode& node) {
        for (const auto& layer : node.edges) {
            longest_saved = std::max(longest_saved, layer.size());
        }
    });
    REQUIRE(longest_saved > 4);
    REQUIRE(save_hnsw_index(wide, path));

    HNSWIndex<> narrow(HNSWIndex<>::Config{.M = 2, .M_max = 4});
    REQUIRE(load_hnsw_index(narrow, path));
    REQUIRE(narrow.size() == 500);

    narrow.for_each_node([&](const HNSWNode& node) {
        for (std::size_t layer = 0; layer < node.edges.size(); ++layer) {
            REQUIRE(node.edges[layer].size() <= 4);
            for (NodeSlot slot : node.edges[layer]) {
                REQUIRE(narrow.node_at(slot) != nullptr);
            }
        }
    });

    SECTION("Kept neighbors are the closest ones") {
        const HNSWNode* before = wide.get_node(docs[7].id);
        const HNSWNode* after = narrow.get_node(docs[7].id);
        REQUIRE(after != nullptr);

        std::vector<float> saved_distances;
        for (NodeSlot slot : before->edges[0]) {
            saved_distances.push_back(
                distances::squared_l2_distance(before->as_span(), wide.node_at(slot)->as_span()));
        }
        std::sort(saved_distances.begin(), saved_distances.end());

        REQUIRE(after->edges[0].size() == std::min<std::size_t>(4, saved_distances.size()));
        for (std::size_t i = 0; i < after->edges[0].size(); ++i) {
            const float kept = distances::squared_l2_distance(
                after->as_span(), narrow.node_at(after->edges[0][i])->as_span());
            REQUIRE(kept <= saved_distances[after->edges[0].size() - 1]);
        }
    }

    SECTION("Pruned graph still finds exact matches") {
        REQUIRE(top_ids(narrow, docs[11].vector, 1).front() == docs[11].id);
    }
}

TEST_CASE("Persistence: ids with embedded NUL bytes", "[persistence]") {
    TempDir dir;
    const fs::path path = dir / "binary-ids.db";

    const std::string first_id("doc\0one", 7);
    const std::string second_id("doc\0two", 7);
    const std::string owner("file\0a.txt", 10);

    HNSWIndex<> index;
    std::vector<VectorDocument> docs = {
        VectorDocument{first_id, owner, {1.0f, 0.0f}, {}, {}},
        VectorDocument{second_id, owner, {0.0f, 1.0f}, {}, {}},
    };
    REQUIRE(index.add(docs));
    REQUIRE(save_hnsw_index(index, path));

    HNSWIndex<> loaded;
    REQUIRE(load_hnsw_index(loaded, path));
    REQUIRE(loaded.size() == 2);
    REQUIRE(loaded.contains(first_id));
    REQUIRE(loaded.contains(second_id));
    REQUIRE_FALSE(loaded.contains("doc"));
    REQUIRE(loaded.get_node(first_id)->owner_id == owner);
    REQUIRE(loaded.entry_point()->id == index.entry_point()->id);
    REQUIRE(top_ids(loaded, docs[1].vector, 1).front() == second_id);
}

TEST_CASE("Persistence: stored entry point below the top layer", "[persistence][graph]") {
    HNSWIndex<> index;
    auto docs = random_docs(300, 8, 33);
    REQUIRE(index.add(docs));
    REQUIRE(index.max_layer() > 0);

    std::string ground_id;
    index.for_each_node([&](const HNSWNode& node) {
        if (ground_id.empty() && node.level() == 0)
            ground_id = node.id;
    });
    REQUIRE_FALSE(ground_id.empty());

    HNSWIndex<> restored;
    REQUIRE(restored.restore(index.snapshot(), ground_id));

    REQUIRE(restored.max_layer() == index.max_layer());
    REQUIRE(restored.entry_point()->level() == index.max_layer());
    REQUIRE(restored.entry_point()->id == index.entry_point()->id);
    REQUIRE(top_ids(restored, docs[50].vector, 1).front() == docs[50].id);
}
