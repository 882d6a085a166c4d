#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line values to numeric types with validation
 - Consistent error handling for the CLI front end

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParseUInt64: Parse unsigned 64-bit integer (seeds)
 - SplitString: Split a delimited list ("chain,sim")
 - EscapeDotString: Escape a string for a quoted Graphviz identifier

 All parse functions validate that the entire input is consumed and return
 std::nullopt on any error (no exceptions thrown).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace forksim {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse uint64_t string (full range)
 *
 * Rejects leading '-' (std::stoull would silently wrap it).
 */
std::optional<uint64_t> SafeParseUInt64(const std::string& str);

// Split on delimiter, dropping empty items: "a,,b" -> {"a", "b"}
std::vector<std::string> SplitString(const std::string& str, char delimiter = ',');

/**
 * Escape special characters for a double-quoted Graphviz ID
 *
 * Escapes: " \ and newlines
 */
std::string EscapeDotString(const std::string& str);

} // namespace util
} // namespace forksim
