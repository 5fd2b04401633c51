#include "core/duration.hpp"

#include <array>
#include <cstdint>
#include <format>
#include <limits>

namespace bwproxy::duration {

namespace {

struct Unit {
    std::string_view suffix;
    int64_t nanos;
};

constexpr std::array<Unit, 8> kUnits{{
    {"ns", 1},
    {"us", 1'000},
    {"\xC2\xB5s", 1'000},   // U+00B5 micro sign
    {"\xCE\xBCs", 1'000},   // U+03BC greek mu
    {"ms", 1'000'000},
    {"s", 1'000'000'000},
    {"m", 60LL * 1'000'000'000},
    {"h", 3600LL * 1'000'000'000},
}};

std::optional<int64_t> match_unit(std::string_view& rest) {
    // Two-letter suffixes first so "ms" is never read as "m" followed by garbage.
    for (const auto& unit : kUnits) {
        if (unit.suffix.size() > 1 && rest.starts_with(unit.suffix)) {
            rest.remove_prefix(unit.suffix.size());
            return unit.nanos;
        }
    }
    for (const auto& unit : kUnits) {
        if (unit.suffix.size() == 1 && rest.starts_with(unit.suffix)) {
            rest.remove_prefix(1);
            return unit.nanos;
        }
    }
    return std::nullopt;
}

bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // anonymous namespace

std::optional<std::chrono::nanoseconds> parse(std::string_view text) {
    std::string_view rest = text;
    bool negative = false;
    if (!rest.empty() && (rest.front() == '-' || rest.front() == '+')) {
        negative = rest.front() == '-';
        rest.remove_prefix(1);
    }
    if (rest == "0") return std::chrono::nanoseconds{0};
    if (rest.empty()) return std::nullopt;

    constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
    int64_t total = 0;

    while (!rest.empty()) {
        int64_t whole = 0;
        size_t int_digits = 0;
        while (!rest.empty() && is_digit(rest.front())) {
            const int d = rest.front() - '0';
            if (whole > (kMax - d) / 10) return std::nullopt;
            whole = whole * 10 + d;
            rest.remove_prefix(1);
            ++int_digits;
        }

        // Fraction kept as digits/scale, at most 18 significant digits
        int64_t frac = 0;
        int64_t frac_scale = 1;
        size_t frac_digits = 0;
        if (!rest.empty() && rest.front() == '.') {
            rest.remove_prefix(1);
            while (!rest.empty() && is_digit(rest.front())) {
                if (frac_scale < 1'000'000'000'000'000'000LL) {
                    frac = frac * 10 + (rest.front() - '0');
                    frac_scale *= 10;
                }
                rest.remove_prefix(1);
                ++frac_digits;
            }
        }
        if (int_digits == 0 && frac_digits == 0) return std::nullopt;

        const auto unit = match_unit(rest);
        if (!unit) return std::nullopt;

        if (whole > kMax / *unit) return std::nullopt;
        int64_t value = whole * *unit;
        if (frac > 0) {
            const auto frac_nanos = static_cast<int64_t>(
                static_cast<long double>(frac) * static_cast<long double>(*unit) /
                static_cast<long double>(frac_scale));
            if (value > kMax - frac_nanos) return std::nullopt;
            value += frac_nanos;
        }
        if (total > kMax - value) return std::nullopt;
        total += value;
    }

    return std::chrono::nanoseconds{negative ? -total : total};
}

std::string format(std::chrono::nanoseconds d) {
    int64_t ns = d.count();
    if (ns == 0) return "0s";

    std::string sign;
    if (ns < 0) {
        sign = "-";
        ns = -ns;
    }

    const auto trimmed_fraction = [](int64_t value, int64_t scale, int width) {
        const int64_t whole = value / scale;
        int64_t frac = value % scale;
        if (frac == 0) return std::format("{}", whole);
        std::string digits = std::format("{:0{}}", frac, width);
        while (!digits.empty() && digits.back() == '0') digits.pop_back();
        return std::format("{}.{}", whole, digits);
    };

    if (ns < 1'000) return std::format("{}{}ns", sign, ns);
    if (ns < 1'000'000) return std::format("{}{}\xC2\xB5s", sign, trimmed_fraction(ns, 1'000, 3));
    if (ns < 1'000'000'000) return std::format("{}{}ms", sign, trimmed_fraction(ns, 1'000'000, 6));

    constexpr int64_t kSecond = 1'000'000'000;
    const int64_t hours = ns / (3600 * kSecond);
    ns %= 3600 * kSecond;
    const int64_t minutes = ns / (60 * kSecond);
    ns %= 60 * kSecond;

    std::string out = sign;
    if (hours > 0) out += std::format("{}h", hours);
    if (hours > 0 || minutes > 0) out += std::format("{}m", minutes);
    out += std::format("{}s", trimmed_fraction(ns, kSecond, 9));
    return out;
}

} // namespace bwproxy::duration
