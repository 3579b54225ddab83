#include "schemapp/errors.hpp"

#include <cstdio>

namespace schemapp
{

bool operator==(const UnmatchingTypeError& a, const UnmatchingTypeError& b)
{
    return a.value == b.value && a.expected_type == b.expected_type;
}
bool operator==(const InvalidTypeError& a, const InvalidTypeError& b)
{
    return a.value == b.value;
}
bool operator==(const AnyOfError& a, const AnyOfError& b)
{
    return a.value == b.value;
}
bool operator==(const OneOfError& a, const OneOfError& b)
{
    return a.passing == b.passing;
}
bool operator==(const NotError& a, const NotError& b)
{
    return a.value == b.value;
}
bool operator==(const EnumError& a, const EnumError& b)
{
    return a.value == b.value && a.values == b.values;
}
bool operator==(const UnmatchingRegexError& a, const UnmatchingRegexError& b)
{
    return a.value == b.value && a.pattern == b.pattern;
}
bool operator==(const InvalidRegexError& a, const InvalidRegexError& b)
{
    return a.pattern == b.pattern;
}
bool operator==(const MultipleOfError& a, const MultipleOfError& b)
{
    return a.value == b.value && a.divisor == b.divisor;
}
bool operator==(const UniqueItemsError& a, const UniqueItemsError& b)
{
    return a.value == b.value;
}
bool operator==(const RequiredError& a, const RequiredError& b)
{
    return a.required == b.required;
}
bool operator==(const InvalidIPError& a, const InvalidIPError& b)
{
    return a.value == b.value && a.version == b.version;
}
bool operator==(const ReferenceNotFoundError& a, const ReferenceNotFoundError& b)
{
    return a.reference == b.reference && a.component == b.component;
}
bool operator==(const RemoteReferenceUnsupportedError& a,
                const RemoteReferenceUnsupportedError& b)
{
    return a.reference == b.reference;
}
bool operator==(const LengthError& a, const LengthError& b)
{
    return a.length == b.length && a.item == b.item && a.comparison == b.comparison;
}
bool operator==(const ValueBoundsError& a, const ValueBoundsError& b)
{
    return a.bound == b.bound && a.comparison == b.comparison && a.exclusive == b.exclusive;
}
bool operator==(const AdditionalPropertiesError& a, const AdditionalPropertiesError& b)
{
    return a.item == b.item;
}
bool operator==(const DependencyMissingError& a, const DependencyMissingError& b)
{
    return a.key == b.key && a.dependency == b.dependency;
}
bool operator==(const FormatUnsupportedError& a, const FormatUnsupportedError& b)
{
    return a.format == b.format;
}
bool operator==(const RecursionLimitError& a, const RecursionLimitError& b)
{
    return a.reference == b.reference && a.depth == b.depth;
}

namespace
{

template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string format_double(double d)
{
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%g", d);
    return buf;
}

std::string join(const std::vector<std::string>& items)
{
    std::string out;
    for (const auto& item : items)
    {
        if (!out.empty())
            out += ", ";
        out += item;
    }
    return out;
}

const char* length_subject(LengthKind kind)
{
    switch (kind)
    {
    case LengthKind::String:
        return "string";
    case LengthKind::Array:
        return "array";
    case LengthKind::Properties:
        return "properties";
    }
    return "string";
}

const char* container_name(ContainerKind kind)
{
    return kind == ContainerKind::Array ? "array" : "object";
}

} // namespace

std::string kind_name(const Violation& violation)
{
    return std::visit(
        overloaded{
            [](const UnmatchingTypeError&) { return "type"; },
            [](const InvalidTypeError&) { return "invalid_type"; },
            [](const AnyOfError&) { return "any_of"; },
            [](const OneOfError&) { return "one_of"; },
            [](const NotError&) { return "not"; },
            [](const EnumError&) { return "enum"; },
            [](const UnmatchingRegexError&) { return "pattern"; },
            [](const InvalidRegexError&) { return "invalid_regex"; },
            [](const MultipleOfError&) { return "multiple_of"; },
            [](const UniqueItemsError&) { return "unique_items"; },
            [](const RequiredError&) { return "required"; },
            [](const InvalidIPError&) { return "invalid_ip"; },
            [](const ReferenceNotFoundError&) { return "reference_not_found"; },
            [](const RemoteReferenceUnsupportedError&) { return "remote_reference"; },
            [](const LengthError&) { return "length"; },
            [](const ValueBoundsError&) { return "bounds"; },
            [](const AdditionalPropertiesError&) { return "additional_properties"; },
            [](const DependencyMissingError&) { return "dependency_missing"; },
            [](const FormatUnsupportedError&) { return "format_unsupported"; },
            [](const RecursionLimitError&) { return "recursion_limit"; },
        },
        violation);
}

std::string to_string(const Violation& violation)
{
    return std::visit(
        overloaded{
            [](const UnmatchingTypeError& e) -> std::string
            { return "'" + e.value.dump() + "' is not of type '" + e.expected_type + "'."; },
            [](const InvalidTypeError& e) -> std::string
            { return "'" + e.value.dump() + "' is not a valid 'type'."; },
            [](const AnyOfError& e) -> std::string
            { return "'" + e.value.dump() + "' does not meet anyOf validation rules."; },
            [](const OneOfError& e) -> std::string
            { return std::to_string(e.passing) + " validations passed instead of only 1."; },
            [](const NotError& e) -> std::string
            { return "'" + e.value.dump() + "' validated when it should not."; },
            [](const EnumError& e) -> std::string
            {
                return "'" + e.value.dump() + "' is not a valid enumeration value of '" +
                       e.values.dump() + "'.";
            },
            [](const UnmatchingRegexError& e) -> std::string
            { return "'" + e.value + "' does not match pattern: '" + e.pattern + "'."; },
            [](const InvalidRegexError& e) -> std::string
            { return "[Schema] Regex pattern '" + e.pattern + "' is not valid."; },
            [](const MultipleOfError& e) -> std::string
            {
                return format_double(e.value) + " is not a multiple of " +
                       format_double(e.divisor) + ".";
            },
            [](const UniqueItemsError& e) -> std::string
            { return e.value.dump() + " does not have unique items."; },
            [](const RequiredError& e) -> std::string
            { return "Required properties are missing '" + join(e.required) + "'."; },
            [](const InvalidIPError& e) -> std::string
            {
                return "'" + e.value + "' is not a valid " +
                       (e.version == IPVersion::V4 ? "IPv4" : "IPv6") + " address.";
            },
            [](const ReferenceNotFoundError& e) -> std::string
            { return "Reference not found '" + e.component + "' in '" + e.reference + "'."; },
            [](const RemoteReferenceUnsupportedError& e) -> std::string
            { return "Remote $ref '" + e.reference + "' is not supported."; },
            [](const LengthError& e) -> std::string
            {
                std::string subject = length_subject(e.item);
                bool large = e.comparison == Comparison::TooLarge;
                if (e.item == LengthKind::Properties)
                    return std::string("The number of properties is ") +
                           (large ? "larger than maximum" : "smaller than minimum") +
                           " number of " + std::to_string(e.length) + ".";
                return "Length of " + subject + " is " +
                       (large ? "larger than maximum" : "smaller than minimum") +
                       " length of " + std::to_string(e.length) + ".";
            },
            [](const ValueBoundsError& e) -> std::string
            {
                if (e.comparison == Comparison::TooLarge)
                    return std::string("Value exceeds the ") +
                           (e.exclusive ? "exclusive " : "") + "maximum value of " +
                           format_double(e.bound) + ".";
                return std::string("Value is lower than the ") +
                       (e.exclusive ? "exclusive " : "") + "minimum value of " +
                       format_double(e.bound) + ".";
            },
            [](const AdditionalPropertiesError& e) -> std::string
            {
                return std::string("Additional results are not permitted in this ") +
                       container_name(e.item) + ".";
            },
            [](const DependencyMissingError& e) -> std::string
            { return "'" + e.key + "' is missing its dependency of '" + e.dependency + "'."; },
            [](const FormatUnsupportedError& e) -> std::string
            { return "'format' validation of '" + e.format + "' is not supported."; },
            [](const RecursionLimitError& e) -> std::string
            {
                return "Reference '" + e.reference + "' exceeded the expansion depth of " +
                       std::to_string(e.depth) + ".";
            },
        },
        violation);
}

Json violation_to_json(const Violation& violation)
{
    Json j = {{"kind", kind_name(violation)}, {"message", to_string(violation)}};
    std::visit(
        overloaded{
            [&j](const UnmatchingTypeError& e)
            {
                j["value"] = e.value;
                j["expectedType"] = e.expected_type;
            },
            [&j](const InvalidTypeError& e) { j["value"] = e.value; },
            [&j](const AnyOfError& e) { j["value"] = e.value; },
            [&j](const OneOfError& e) { j["passing"] = e.passing; },
            [&j](const NotError& e) { j["value"] = e.value; },
            [&j](const EnumError& e)
            {
                j["value"] = e.value;
                j["values"] = e.values;
            },
            [&j](const UnmatchingRegexError& e)
            {
                j["value"] = e.value;
                j["pattern"] = e.pattern;
            },
            [&j](const InvalidRegexError& e) { j["pattern"] = e.pattern; },
            [&j](const MultipleOfError& e)
            {
                j["value"] = e.value;
                j["divisor"] = e.divisor;
            },
            [&j](const UniqueItemsError& e) { j["value"] = e.value; },
            [&j](const RequiredError& e) { j["required"] = e.required; },
            [&j](const InvalidIPError& e)
            {
                j["value"] = e.value;
                j["version"] = e.version == IPVersion::V4 ? "ipv4" : "ipv6";
            },
            [&j](const ReferenceNotFoundError& e)
            {
                j["reference"] = e.reference;
                j["component"] = e.component;
            },
            [&j](const RemoteReferenceUnsupportedError& e) { j["reference"] = e.reference; },
            [&j](const LengthError& e)
            {
                j["length"] = e.length;
                j["item"] = length_subject(e.item);
                j["comparison"] = e.comparison == Comparison::TooLarge ? "tooLarge" : "tooSmall";
            },
            [&j](const ValueBoundsError& e)
            {
                j["bound"] = e.bound;
                j["comparison"] = e.comparison == Comparison::TooLarge ? "tooLarge" : "tooSmall";
                j["exclusive"] = e.exclusive;
            },
            [&j](const AdditionalPropertiesError& e) { j["item"] = container_name(e.item); },
            [&j](const DependencyMissingError& e)
            {
                j["key"] = e.key;
                j["dependency"] = e.dependency;
            },
            [&j](const FormatUnsupportedError& e) { j["format"] = e.format; },
            [&j](const RecursionLimitError& e)
            {
                j["reference"] = e.reference;
                j["depth"] = e.depth;
            },
        },
        violation);
    return j;
}

} // namespace schemapp
