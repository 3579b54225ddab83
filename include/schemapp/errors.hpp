#pragma once
#include "schemapp/types.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace schemapp
{

/// Direction of a failed bound check.
enum class Comparison
{
    TooLarge,
    TooSmall
};

/// What a LengthError counted.
enum class LengthKind
{
    String,
    Array,
    Properties
};

/// Container that rejected extra members (`additionalItems` / `additionalProperties`).
enum class ContainerKind
{
    Array,
    Object
};

enum class IPVersion
{
    V4,
    V6
};

struct UnmatchingTypeError
{
    Json value;
    std::string expected_type;
};

/// The `type` keyword itself is neither a string nor an array of strings.
struct InvalidTypeError
{
    Json value;
};

struct AnyOfError
{
    Json value;
};

struct OneOfError
{
    std::size_t passing = 0;
};

struct NotError
{
    Json value;
};

struct EnumError
{
    Json value;
    Json values;
};

struct UnmatchingRegexError
{
    std::string value;
    std::string pattern;
};

struct InvalidRegexError
{
    std::string pattern;
};

struct MultipleOfError
{
    double value = 0.0;
    double divisor = 0.0;
};

struct UniqueItemsError
{
    Json value;
};

/// One or more keys of `required` are absent; lists the whole keyword.
struct RequiredError
{
    std::vector<std::string> required;
};

struct InvalidIPError
{
    std::string value;
    IPVersion version = IPVersion::V4;
};

struct ReferenceNotFoundError
{
    std::string reference;
    std::string component;
};

struct RemoteReferenceUnsupportedError
{
    std::string reference;
};

struct LengthError
{
    std::size_t length = 0;
    LengthKind item = LengthKind::String;
    Comparison comparison = Comparison::TooLarge;
};

struct ValueBoundsError
{
    double bound = 0.0;
    Comparison comparison = Comparison::TooLarge;
    bool exclusive = false;
};

struct AdditionalPropertiesError
{
    ContainerKind item = ContainerKind::Object;
};

struct DependencyMissingError
{
    std::string key;
    std::string dependency;
};

struct FormatUnsupportedError
{
    std::string format;
};

/// Reference expansion nested deeper than Settings::max_reference_depth.
struct RecursionLimitError
{
    std::string reference;
    std::size_t depth = 0;
};

using Violation =
    std::variant<UnmatchingTypeError, InvalidTypeError, AnyOfError, OneOfError, NotError,
                 EnumError, UnmatchingRegexError, InvalidRegexError, MultipleOfError,
                 UniqueItemsError, RequiredError, InvalidIPError, ReferenceNotFoundError,
                 RemoteReferenceUnsupportedError, LengthError, ValueBoundsError,
                 AdditionalPropertiesError, DependencyMissingError, FormatUnsupportedError,
                 RecursionLimitError>;

bool operator==(const UnmatchingTypeError& a, const UnmatchingTypeError& b);
bool operator==(const InvalidTypeError& a, const InvalidTypeError& b);
bool operator==(const AnyOfError& a, const AnyOfError& b);
bool operator==(const OneOfError& a, const OneOfError& b);
bool operator==(const NotError& a, const NotError& b);
bool operator==(const EnumError& a, const EnumError& b);
bool operator==(const UnmatchingRegexError& a, const UnmatchingRegexError& b);
bool operator==(const InvalidRegexError& a, const InvalidRegexError& b);
bool operator==(const MultipleOfError& a, const MultipleOfError& b);
bool operator==(const UniqueItemsError& a, const UniqueItemsError& b);
bool operator==(const RequiredError& a, const RequiredError& b);
bool operator==(const InvalidIPError& a, const InvalidIPError& b);
bool operator==(const ReferenceNotFoundError& a, const ReferenceNotFoundError& b);
bool operator==(const RemoteReferenceUnsupportedError& a,
                const RemoteReferenceUnsupportedError& b);
bool operator==(const LengthError& a, const LengthError& b);
bool operator==(const ValueBoundsError& a, const ValueBoundsError& b);
bool operator==(const AdditionalPropertiesError& a, const AdditionalPropertiesError& b);
bool operator==(const DependencyMissingError& a, const DependencyMissingError& b);
bool operator==(const FormatUnsupportedError& a, const FormatUnsupportedError& b);
bool operator==(const RecursionLimitError& a, const RecursionLimitError& b);

/// Short machine-readable name of the violation kind, e.g. "required".
std::string kind_name(const Violation& violation);

/// English rendering of a violation.
std::string to_string(const Violation& violation);

/// Structured form: {"kind": ..., "message": ..., plus the violation's fields}.
Json violation_to_json(const Violation& violation);

} // namespace schemapp
