#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace chromatone::utility {

/**
 * @brief Splits a string on every occurrence of a delimiter.
 * @param s Input string
 * @param delimiter Non-empty separator
 * @return Pieces in order; an empty input yields an empty vector
 */
std::vector<std::string> split(std::string_view s, std::string_view delimiter);

/**
 * @brief Joins strings with a separator.
 */
std::string join(const std::vector<std::string> &parts,
                 std::string_view separator);

/** @brief Strips leading and trailing ASCII whitespace. */
std::string trim(std::string_view s);

std::string to_lower(std::string_view s);

/**
 * @brief Upper-cases the first letter of every word and lower-cases the rest.
 *
 * A word starts after any non-alphabetic character, so "light-beige" becomes
 * "Light-Beige".
 */
std::string title_case(std::string_view s);

} // namespace chromatone::utility
