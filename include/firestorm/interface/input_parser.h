#pragma once
/**
 * @file input_parser.h
 * @brief Text-to-value parsing for front ends
 *
 * Front ends collect free text (entry fields, command-line arguments, XML
 * element text). These functions turn that text into typed values and
 * report a StormResult instead of throwing, so a caller can show a precise
 * message before the engine is ever invoked. The output parameter is only
 * written on success.
 */

#include "firestorm/core/types.h"
#include "firestorm/core/error.h"
#include <string>
#include <string_view>
#include <vector>

namespace firestorm::interface {

/**
 * @brief Parse a finite real number (surrounding blanks allowed)
 * @return Success or InvalidNumber
 */
StormResult parse_real(std::string_view text, Real& out);

/**
 * @brief Parse a whole non-negative integer
 * @return Success, InvalidNumber, or NegativeCount for a negative value
 */
StormResult parse_count(std::string_view text, Int64& out);

/**
 * @brief Parse an ignite count
 * @return Success, InvalidNumber or NegativeIgnites
 */
StormResult parse_ignites(std::string_view text, Int64& out);

/**
 * @brief Parse a trial count (whole integer >= 1)
 *
 * A count of 1 parses; the engine rejects it later as degenerate.
 *
 * @return Success, InvalidNumber or InvalidTrialCount
 */
StormResult parse_trial_count(std::string_view text, Int64& out);

/**
 * @brief Parse a comma-separated hitbox radius list such as "0.5, 1.0"
 *
 * @return Success, EmptyHitboxSet, ParseError (empty item), InvalidNumber,
 *         NonPositiveRadius or DuplicateHitboxRadius
 */
StormResult parse_hitbox_radii(std::string_view text, std::vector<Real>& out);

/**
 * @brief Convert an area modifier given in percent to a fraction
 */
constexpr Real area_percent_to_fraction(Real percent) noexcept {
    return percent / 100.0;
}

/**
 * @brief Strip leading and trailing whitespace
 */
std::string_view trim(std::string_view text) noexcept;

} // namespace firestorm::interface
