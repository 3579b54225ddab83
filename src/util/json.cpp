#include "schemapp/util/json.hpp"

#include <cmath>
#include <cstdint>
#include <limits>

namespace schemapp::util::json
{

bool is_integral(const json& j)
{
    if (j.is_number_integer())
        return true;
    if (!j.is_number_float())
        return false;
    double d = j.get<double>();
    return std::isfinite(d) && d == std::floor(d);
}

std::optional<std::size_t> as_count(const json& j)
{
    if (j.is_number_unsigned())
        return static_cast<std::size_t>(j.get<std::uint64_t>());
    if (j.is_number_integer())
    {
        auto v = j.get<std::int64_t>();
        if (v < 0)
            return std::nullopt;
        return static_cast<std::size_t>(v);
    }
    if (is_integral(j))
    {
        double d = j.get<double>();
        // Counts beyond size_t are ignored like any other unusable bound.
        if (d < 0 || d >= static_cast<double>(std::numeric_limits<std::size_t>::max()))
            return std::nullopt;
        return static_cast<std::size_t>(d);
    }
    return std::nullopt;
}

std::size_t utf8_length(const std::string& s)
{
    std::size_t count = 0;
    for (unsigned char c : s)
        if ((c & 0xC0) != 0x80)
            ++count;
    return count;
}

static std::optional<double> numeric_or_bool(const json& j)
{
    if (j.is_boolean())
        return j.get<bool>() ? 1.0 : 0.0;
    if (j.is_number())
        return j.get<double>();
    return std::nullopt;
}

bool equal_for_uniqueness(const json& a, const json& b)
{
    if (a.is_boolean() != b.is_boolean())
    {
        auto x = numeric_or_bool(a);
        auto y = numeric_or_bool(b);
        return x && y && *x == *y;
    }
    return a == b;
}

bool is_schema_array(const json& j)
{
    if (!j.is_array())
        return false;
    for (const auto& item : j)
        if (!item.is_object())
            return false;
    return true;
}

bool is_string_array(const json& j)
{
    if (!j.is_array())
        return false;
    for (const auto& item : j)
        if (!item.is_string())
            return false;
    return true;
}

} // namespace schemapp::util::json
