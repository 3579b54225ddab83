#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace schemapp::util::pointer
{

/// Decodes %XX escapes. Returns nullopt on a truncated or non-hex escape.
std::optional<std::string> percent_decode(const std::string& s);

/// Replaces "~1" with "/" and "~0" with "~" (RFC 6901).
std::string unescape_token(const std::string& token);

/// Splits "a/b/c" into {"a", "b", "c"}. An empty string yields one empty token.
std::vector<std::string> split(const std::string& path);

/// Parses a decimal array index without sign or leading "+".
std::optional<std::size_t> parse_index(const std::string& token);

} // namespace schemapp::util::pointer
