// SPDX-License-Identifier: Apache-2.0 OR MIT
// Document, UUID and timestamp tests

#include <catch2/catch_test_macros.hpp>

#include <vecindex-cpp/document.hpp>

#include <chrono>
#include <set>
#include <string>

using namespace vecindex_cpp;

namespace {

bool is_lower_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
}

} // namespace

TEST_CASE("UUID generation", "[document][uuid]") {
    SECTION("Version 4 layout") {
        const std::string id = generate_uuid();
        REQUIRE(id.size() == 36);
        REQUIRE(id[8] == '-');
        REQUIRE(id[13] == '-');
        REQUIRE(id[18] == '-');
        REQUIRE(id[23] == '-');
        REQUIRE(id[14] == '4');
        const char variant = id[19];
        REQUIRE((variant == '8' || variant == '9' || variant == 'a' || variant == 'b'));
        for (std::size_t i = 0; i < id.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23)
                continue;
            REQUIRE(is_lower_hex(id[i]));
        }
    }

    SECTION("Ids are unique") {
        std::set<std::string> ids;
        for (int i = 0; i < 1000; ++i) {
            ids.insert(generate_uuid());
        }
        REQUIRE(ids.size() == 1000);
    }
}

TEST_CASE("VectorDocument::create", "[document]") {
    const auto before = std::chrono::system_clock::now();
    auto doc = VectorDocument::create("owner-1", {1.0f, 2.0f}, {{"path", "/tmp/a.txt"}});
    const auto after = std::chrono::system_clock::now();

    REQUIRE(doc.id.size() == 36);
    REQUIRE(doc.owner_id == "owner-1");
    REQUIRE(doc.vector == Vector{1.0f, 2.0f});
    REQUIRE(doc.metadata.at("path") == "/tmp/a.txt");
    REQUIRE(doc.created_at >= before);
    REQUIRE(doc.created_at <= after);
}

TEST_CASE("Timestamp formatting", "[document][timestamp]") {
    using namespace std::chrono;

    SECTION("Known instant") {
        const Timestamp ts = sys_days{year{2024} / 3 / 9} + hours{7} + minutes{5} + seconds{2} +
                             milliseconds{45};
        REQUIRE(format_timestamp(ts) == "2024-03-09T07:05:02.045Z");
    }

    SECTION("Epoch") {
        REQUIRE(format_timestamp(Timestamp{}) == "1970-01-01T00:00:00.000Z");
    }

    SECTION("Round trip keeps millisecond precision") {
        const auto now = time_point_cast<milliseconds>(system_clock::now());
        auto parsed = parse_timestamp(format_timestamp(now));
        REQUIRE(parsed);
        REQUIRE(*parsed == now);
    }
}

TEST_CASE("Timestamp parsing", "[document][timestamp]") {
    using namespace std::chrono;

    SECTION("Without fraction") {
        auto parsed = parse_timestamp("2023-12-31T23:59:59Z");
        REQUIRE(parsed);
        REQUIRE(format_timestamp(*parsed) == "2023-12-31T23:59:59.000Z");
    }

    SECTION("Short and long fractions") {
        auto short_frac = parse_timestamp("2023-01-01T00:00:00.5Z");
        REQUIRE(short_frac);
        REQUIRE(format_timestamp(*short_frac) == "2023-01-01T00:00:00.500Z");

        auto long_frac = parse_timestamp("2023-01-01T00:00:00.123456789Z");
        REQUIRE(long_frac);
        REQUIRE(format_timestamp(*long_frac) == "2023-01-01T00:00:00.123Z");
    }

    SECTION("Malformed input is a parse error") {
        for (const char* bad : {"", "2023-01-01", "2023-01-01T00:00:00", "2023-13-01T00:00:00Z",
                                "2023-02-30T00:00:00Z", "2023-01-01T24:00:00Z",
                                "2023-01-01T00:00:00.Z", "2023-01-01T00:00:00.12aZ",
                                "2023/01/01T00:00:00Z"}) {
            auto parsed = parse_timestamp(bad);
            REQUIRE_FALSE(parsed);
            REQUIRE(parsed.error().code == ErrorCode::ParseError);
        }
    }
}
