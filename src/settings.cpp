#include "schemapp/settings.hpp"

#include "schemapp/exceptions.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>

namespace schemapp
{

static std::string getenv_str(const char* key, const std::string& defv)
{
    if (const char* v = std::getenv(key))
        return std::string(v);
    return defv;
}

static bool parse_flag(const std::string& v)
{
    return v == "1" || v == "true" || v == "TRUE";
}

Settings Settings::from_env()
{
    Settings s;
    auto lvl = getenv_str("SCHEMAPP_LOG_LEVEL", s.log_level);
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), ::toupper);
    s.log_level = lvl;

    auto depth = getenv_str("SCHEMAPP_MAX_REF_DEPTH", "");
    if (!depth.empty())
    {
        try
        {
            size_t pos = 0;
            unsigned long v = std::stoul(depth, &pos, 10);
            if (pos != depth.size() || v == 0)
                throw ConfigError("SCHEMAPP_MAX_REF_DEPTH must be a positive integer");
            s.max_reference_depth = static_cast<std::size_t>(v);
        }
        catch (const std::logic_error&)
        {
            throw ConfigError("SCHEMAPP_MAX_REF_DEPTH must be a positive integer");
        }
    }

    auto cache = getenv_str("SCHEMAPP_CACHE_COMPILED", "");
    if (!cache.empty())
        s.cache_compiled = parse_flag(cache);
    return s;
}

Settings Settings::from_json(const Json& j)
{
    Settings s;
    if (j.contains("log_level"))
    {
        const auto& level = j.at("log_level");
        if (!level.is_string())
            throw ConfigError("log_level must be a string");
        s.log_level = level.get<std::string>();
    }
    if (j.contains("max_reference_depth"))
    {
        const auto& depth = j.at("max_reference_depth");
        bool positive = depth.is_number_unsigned()
                            ? depth.get<std::uint64_t>() > 0
                            : depth.is_number_integer() && depth.get<std::int64_t>() > 0;
        if (!positive)
            throw ConfigError("max_reference_depth must be a positive integer");
        s.max_reference_depth = depth.get<std::size_t>();
    }
    if (j.contains("cache_compiled"))
    {
        const auto& cache = j.at("cache_compiled");
        if (!cache.is_boolean())
            throw ConfigError("cache_compiled must be a boolean");
        s.cache_compiled = cache.get<bool>();
    }
    return s;
}

} // namespace schemapp
