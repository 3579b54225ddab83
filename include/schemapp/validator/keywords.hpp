#pragma once
#include "schemapp/formats.hpp"
#include "schemapp/validator/rule.hpp"

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace schemapp::validator
{

/// A regex source plus its compiled form. `regex` is empty when the source is
/// not a valid ECMAScript pattern.
struct CompiledPattern
{
    std::string source;
    std::optional<std::regex> regex;

    static CompiledPattern compile(const std::string& source);

    /// Unanchored search: true if any substring of `s` matches.
    bool search(const std::string& s) const;
};

// ---------------------------------------------------------------------------
// Generic
// ---------------------------------------------------------------------------

class TypeRule : public Rule
{
  public:
    explicit TypeRule(std::string type_name) : type_name_(std::move(type_name)) {}

    RuleKind kind() const override
    {
        return RuleKind::Type;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

    const std::string& type_name() const
    {
        return type_name_;
    }

  private:
    std::string type_name_;
};

class EnumRule : public Rule
{
  public:
    explicit EnumRule(Json values) : values_(std::move(values)) {}

    RuleKind kind() const override
    {
        return RuleKind::Enum;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

  private:
    Json values_;
};

class FormatRule : public Rule
{
  public:
    FormatRule(std::string name, FormatValidator validator)
        : name_(std::move(name)), validator_(std::move(validator))
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::Format;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

    const std::string& name() const
    {
        return name_;
    }

  private:
    std::string name_;
    FormatValidator validator_;
};

// ---------------------------------------------------------------------------
// Strings
// ---------------------------------------------------------------------------

/// `maxLength` (TooLarge) or `minLength` (TooSmall), counted in code points.
class StringLengthRule : public Rule
{
  public:
    StringLengthRule(std::size_t bound, Comparison comparison)
        : bound_(bound), comparison_(comparison)
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::StringLength;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

  private:
    std::size_t bound_;
    Comparison comparison_;
};

class PatternRule : public Rule
{
  public:
    explicit PatternRule(const std::string& pattern) : pattern_(CompiledPattern::compile(pattern))
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::Pattern;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

    const CompiledPattern& pattern() const
    {
        return pattern_;
    }

  private:
    CompiledPattern pattern_;
};

// ---------------------------------------------------------------------------
// Numbers
// ---------------------------------------------------------------------------

/// `multipleOf`. A divisor <= 0 disables the check.
class MultipleOfRule : public Rule
{
  public:
    explicit MultipleOfRule(double divisor) : divisor_(divisor) {}

    RuleKind kind() const override
    {
        return RuleKind::MultipleOf;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

  private:
    double divisor_;
};

/// `maximum` (TooLarge) or `minimum` (TooSmall), strict when `exclusive`.
class BoundsRule : public Rule
{
  public:
    BoundsRule(double bound, Comparison comparison, bool exclusive)
        : bound_(bound), comparison_(comparison), exclusive_(exclusive)
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::Bounds;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

  private:
    double bound_;
    Comparison comparison_;
    bool exclusive_;
};

// ---------------------------------------------------------------------------
// Arrays
// ---------------------------------------------------------------------------

class ItemCountRule : public Rule
{
  public:
    ItemCountRule(std::size_t bound, Comparison comparison)
        : bound_(bound), comparison_(comparison)
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::ItemCount;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

  private:
    std::size_t bound_;
    Comparison comparison_;
};

class UniqueItemsRule : public Rule
{
  public:
    RuleKind kind() const override
    {
        return RuleKind::UniqueItems;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
};

/// `items` given as a single schema: applies to every element.
class ItemsRule : public Rule
{
  public:
    explicit ItemsRule(RulePtr item) : item_(std::move(item)) {}

    RuleKind kind() const override
    {
        return RuleKind::Items;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
    std::vector<RulePtr> children() const override
    {
        return {item_};
    }

  private:
    RulePtr item_;
};

/// `items` given as an array: positional, with `additionalItems` for the rest.
class TupleItemsRule : public Rule
{
  public:
    TupleItemsRule(std::vector<RulePtr> items, RulePtr additional)
        : items_(std::move(items)), additional_(std::move(additional))
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::TupleItems;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
    std::vector<RulePtr> children() const override;

  private:
    std::vector<RulePtr> items_;
    RulePtr additional_;
};

// ---------------------------------------------------------------------------
// Objects
// ---------------------------------------------------------------------------

/// `maxProperties` (TooLarge) or `minProperties` (TooSmall).
class PropertyCountRule : public Rule
{
  public:
    PropertyCountRule(std::size_t bound, Comparison comparison)
        : bound_(bound), comparison_(comparison)
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::PropertyCount;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

  private:
    std::size_t bound_;
    Comparison comparison_;
};

/// Every listed key must be present. A non-object value fails with the same
/// single RequiredError.
class RequiredRule : public Rule
{
  public:
    explicit RequiredRule(std::vector<std::string> required) : required_(std::move(required)) {}

    RuleKind kind() const override
    {
        return RuleKind::Required;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

  private:
    std::vector<std::string> required_;
};

/// `properties`, `patternProperties` and `additionalProperties` together.
class PropertiesRule : public Rule
{
  public:
    using Named = std::vector<std::pair<std::string, RulePtr>>;
    using Patterned = std::vector<std::pair<CompiledPattern, RulePtr>>;

    PropertiesRule(Named properties, Patterned pattern_properties, RulePtr additional)
        : properties_(std::move(properties)), pattern_properties_(std::move(pattern_properties)),
          additional_(std::move(additional))
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::Properties;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
    std::vector<RulePtr> children() const override;

  private:
    Named properties_;
    Patterned pattern_properties_;
    RulePtr additional_;
};

/// Schema dependency: when `key` is present, the whole object must match.
class SchemaDependencyRule : public Rule
{
  public:
    SchemaDependencyRule(std::string key, RulePtr rule) : key_(std::move(key)), rule_(std::move(rule))
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::SchemaDependency;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
    std::vector<RulePtr> children() const override
    {
        return {rule_};
    }

  private:
    std::string key_;
    RulePtr rule_;
};

/// Property dependency: when `key` is present, every name must be present too.
class PropertyDependencyRule : public Rule
{
  public:
    PropertyDependencyRule(std::string key, std::vector<std::string> dependencies)
        : key_(std::move(key)), dependencies_(std::move(dependencies))
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::PropertyDependency;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

  private:
    std::string key_;
    std::vector<std::string> dependencies_;
};

} // namespace schemapp::validator
