#include "schemapp/types.hpp"

#include "schemapp/util/json.hpp"

namespace schemapp
{

bool matches_type(const Json& value, Type type)
{
    switch (type)
    {
    case Type::Object:
        return value.is_object();
    case Type::Array:
        return value.is_array();
    case Type::String:
        return value.is_string();
    case Type::Boolean:
        return value.is_boolean();
    case Type::Integer:
        return util::json::is_integral(value);
    case Type::Number:
        return value.is_number();
    case Type::Null:
        return value.is_null();
    }
    return false;
}

bool matches_type(const Json& value, const std::string& type_name)
{
    auto type = type_from_string(type_name);
    if (!type)
        return false;
    return matches_type(value, *type);
}

} // namespace schemapp
