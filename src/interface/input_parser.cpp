/**
 * @file input_parser.cpp
 * @brief Front-end text parsing implementation
 */

#include "firestorm/interface/input_parser.h"
#include "firestorm/sim/storm_config.h"
#include <charconv>
#include <cmath>
#include <system_error>
#include <utility>

namespace firestorm::interface {

std::string_view trim(std::string_view text) noexcept {
    constexpr std::string_view blanks = " \t\r\n";
    auto first = text.find_first_not_of(blanks);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = text.find_last_not_of(blanks);
    return text.substr(first, last - first + 1);
}

StormResult parse_real(std::string_view text, Real& out) {
    std::string_view s = trim(text);
    if (s.empty()) {
        return StormResult::InvalidNumber;
    }

    Real value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size() || !std::isfinite(value)) {
        return StormResult::InvalidNumber;
    }
    out = value;
    return StormResult::Success;
}

StormResult parse_count(std::string_view text, Int64& out) {
    std::string_view s = trim(text);
    if (s.empty()) {
        return StormResult::InvalidNumber;
    }

    Int64 value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return StormResult::InvalidNumber;
    }
    if (value < 0) {
        return StormResult::NegativeCount;
    }
    out = value;
    return StormResult::Success;
}

StormResult parse_ignites(std::string_view text, Int64& out) {
    StormResult result = parse_count(text, out);
    return result == StormResult::NegativeCount ? StormResult::NegativeIgnites : result;
}

StormResult parse_trial_count(std::string_view text, Int64& out) {
    Int64 value = 0;
    StormResult result = parse_count(text, value);
    if (result == StormResult::NegativeCount) {
        return StormResult::InvalidTrialCount;
    }
    if (result != StormResult::Success) {
        return result;
    }
    if (value < 1) {
        return StormResult::InvalidTrialCount;
    }
    out = value;
    return StormResult::Success;
}

StormResult parse_hitbox_radii(std::string_view text, std::vector<Real>& out) {
    if (trim(text).empty()) {
        return StormResult::EmptyHitboxSet;
    }

    std::vector<Real> radii;
    SizeT start = 0;
    while (start <= text.size()) {
        SizeT comma = text.find(',', start);
        if (comma == std::string_view::npos) {
            comma = text.size();
        }

        std::string_view item = trim(text.substr(start, comma - start));
        if (item.empty()) {
            return StormResult::ParseError;
        }

        Real value = 0.0;
        StormResult result = parse_real(item, value);
        if (result != StormResult::Success) {
            return result;
        }
        radii.push_back(value);
        start = comma + 1;
    }

    StormResult result = sim::validate_hitbox_radii(radii);
    if (result != StormResult::Success) {
        return result;
    }
    out = std::move(radii);
    return StormResult::Success;
}

} // namespace firestorm::interface
