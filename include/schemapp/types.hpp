#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace schemapp
{

using Json = nlohmann::json;

/// Primitive type names recognised by the `type` keyword.
enum class Type
{
    Object,
    Array,
    String,
    Integer,
    Number,
    Boolean,
    Null
};

inline std::string to_string(Type type)
{
    switch (type)
    {
    case Type::Object:
        return "object";
    case Type::Array:
        return "array";
    case Type::String:
        return "string";
    case Type::Integer:
        return "integer";
    case Type::Number:
        return "number";
    case Type::Boolean:
        return "boolean";
    case Type::Null:
        return "null";
    }
    return "null";
}

inline std::optional<Type> type_from_string(const std::string& s)
{
    if (s == "object")
        return Type::Object;
    if (s == "array")
        return Type::Array;
    if (s == "string")
        return Type::String;
    if (s == "integer")
        return Type::Integer;
    if (s == "number")
        return Type::Number;
    if (s == "boolean")
        return Type::Boolean;
    if (s == "null")
        return Type::Null;
    return std::nullopt;
}

/// True if `value` satisfies the JSON Schema primitive type `type`.
/// Booleans are never numbers; a float with no fractional part is an integer.
bool matches_type(const Json& value, Type type);

/// Same as above for a raw type name. Unknown names never match.
bool matches_type(const Json& value, const std::string& type_name);

} // namespace schemapp
