#pragma once
#include "schemapp/types.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace schemapp::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent);
}

/// Numeric value that is not a boolean and has no fractional part.
bool is_integral(const json& j);

/// Reads a non-negative integral bound such as `maxLength`. Returns nullopt
/// for any other shape, and for floats too large for size_t, so the keyword
/// is ignored.
std::optional<std::size_t> as_count(const json& j);

/// Number of Unicode code points in a UTF-8 string. This is the unit of
/// `maxLength` / `minLength`: a base letter plus a combining mark counts as
/// two, not as one grapheme cluster.
std::size_t utf8_length(const std::string& s);

/// Equality used by `uniqueItems`: ordinary value equality, except that the
/// boolean `true` equals the number 1 and `false` equals 0.
bool equal_for_uniqueness(const json& a, const json& b);

/// True if `j` is an array whose every element is an object.
bool is_schema_array(const json& j);

/// True if `j` is an array whose every element is a string.
bool is_string_array(const json& j);

} // namespace schemapp::util::json
