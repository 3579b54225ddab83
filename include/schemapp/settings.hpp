#pragma once
#include "schemapp/types.hpp"

#include <cstddef>
#include <string>

namespace schemapp
{

struct Settings
{
    std::string log_level{"INFO"};
    /// Ceiling on nested `$ref` expansions during one evaluation.
    std::size_t max_reference_depth{256};
    /// Compile the rule tree once per Schema instead of on every validate().
    bool cache_compiled{true};

    static Settings from_env();
    static Settings from_json(const Json& j);
};

} // namespace schemapp
