// SPDX-License-Identifier: Apache-2.0 OR MIT

#include <vecindex-cpp/document.hpp>

#include <array>
#include <charconv>
#include <cstdio>
#include <random>

namespace vecindex_cpp {

namespace {

std::mt19937_64& thread_rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

/// Parse exactly `width` decimal digits starting at text[pos]
bool parse_digits(std::string_view text, std::size_t pos, std::size_t width, int& out) {
    if (pos + width > text.size())
        return false;
    const char* first = text.data() + pos;
    const char* last = first + width;
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

} // namespace

VectorDocument VectorDocument::create(std::string owner_id, Vector vector, Metadata metadata) {
    return VectorDocument{generate_uuid(), std::move(owner_id), std::move(vector),
                          std::move(metadata), std::chrono::system_clock::now()};
}

std::string generate_uuid() {
    auto& rng = thread_rng();
    std::array<std::uint8_t, 16> bytes{};
    for (std::size_t i = 0; i < bytes.size(); i += 8) {
        const std::uint64_t word = rng();
        for (std::size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<std::uint8_t>(word >> (j * 8));
        }
    }
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80); // RFC 4122 variant

    static constexpr char hex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(hex[bytes[i] >> 4]);
        out.push_back(hex[bytes[i] & 0x0F]);
    }
    return out;
}

std::string format_timestamp(Timestamp timestamp) {
    using namespace std::chrono;

    const auto ms = time_point_cast<milliseconds>(timestamp);
    const auto day = floor<days>(ms);
    const year_month_day ymd{day};

    auto rem = ms - day;
    const auto h = duration_cast<hours>(rem);
    rem -= h;
    const auto m = duration_cast<minutes>(rem);
    rem -= m;
    const auto s = duration_cast<seconds>(rem);
    rem -= s;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                  static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()), static_cast<int>(h.count()),
                  static_cast<int>(m.count()), static_cast<int>(s.count()),
                  static_cast<int>(rem.count()));
    return buf;
}

Result<Timestamp> parse_timestamp(std::string_view text) {
    using namespace std::chrono;

    auto fail = [&] {
        return err<Timestamp>(Error::parse_error("Invalid timestamp: '" + std::string(text) + "'"));
    };

    // YYYY-MM-DDTHH:MM:SS is 19 characters
    if (text.size() < 20 || text[4] != '-' || text[7] != '-' || text[10] != 'T' ||
        text[13] != ':' || text[16] != ':' || text.back() != 'Z') {
        return fail();
    }

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (!parse_digits(text, 0, 4, year) || !parse_digits(text, 5, 2, month) ||
        !parse_digits(text, 8, 2, day) || !parse_digits(text, 11, 2, hour) ||
        !parse_digits(text, 14, 2, minute) || !parse_digits(text, 17, 2, second)) {
        return fail();
    }

    int millis = 0;
    if (text.size() > 20) {
        // Fractional seconds: ".f", ".ff", ".fff" (anything finer is truncated)
        const std::size_t frac_len = text.size() - 21;
        if (text[19] != '.' || frac_len == 0 || frac_len > 9) {
            return fail();
        }
        int frac = 0;
        const std::size_t used = frac_len < 3 ? frac_len : 3;
        if (!parse_digits(text, 20, used, frac)) {
            return fail();
        }
        for (std::size_t i = used; i < 3; ++i) {
            frac *= 10;
        }
        for (std::size_t i = 20 + used; i < text.size() - 1; ++i) {
            if (text[i] < '0' || text[i] > '9')
                return fail();
        }
        millis = frac;
    }

    const year_month_day ymd{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)},
                             std::chrono::day{static_cast<unsigned>(day)}};
    if (!ymd.ok() || hour > 23 || minute > 59 || second > 60) {
        return fail();
    }

    const auto tp = sys_days{ymd} + hours{hour} + minutes{minute} + seconds{second} +
                    milliseconds{millis};
    return Result<Timestamp>{time_point_cast<Timestamp::duration>(tp)};
}

} // namespace vecindex_cpp
