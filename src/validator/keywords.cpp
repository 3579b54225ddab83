#include "schemapp/validator/keywords.hpp"

#include "schemapp/util/json.hpp"

#include <cmath>
#include <set>

namespace schemapp::validator
{

CompiledPattern CompiledPattern::compile(const std::string& source)
{
    CompiledPattern p;
    p.source = source;
    try
    {
        p.regex.emplace(source, std::regex::ECMAScript);
    }
    catch (const std::regex_error&)
    {
        p.regex.reset();
    }
    return p;
}

bool CompiledPattern::search(const std::string& s) const
{
    return regex && std::regex_search(s, *regex);
}

static bool exceeds(std::size_t actual, std::size_t bound, Comparison comparison)
{
    return comparison == Comparison::TooLarge ? actual > bound : actual < bound;
}

Result TypeRule::evaluate(const Json& value, EvalContext&) const
{
    if (matches_type(value, type_name_))
        return Result::valid();
    return Result::invalid(UnmatchingTypeError{value, type_name_});
}

Result EnumRule::evaluate(const Json& value, EvalContext&) const
{
    for (const auto& candidate : values_)
        if (candidate == value)
            return Result::valid();
    return Result::invalid(EnumError{value, values_});
}

Result FormatRule::evaluate(const Json& value, EvalContext&) const
{
    return validator_(value);
}

Result StringLengthRule::evaluate(const Json& value, EvalContext&) const
{
    if (!value.is_string())
        return Result::valid();
    auto length = util::json::utf8_length(value.get_ref<const std::string&>());
    if (exceeds(length, bound_, comparison_))
        return Result::invalid(LengthError{bound_, LengthKind::String, comparison_});
    return Result::valid();
}

Result PatternRule::evaluate(const Json& value, EvalContext&) const
{
    if (!value.is_string())
        return Result::valid();
    if (!pattern_.regex)
        return Result::invalid(InvalidRegexError{pattern_.source});
    const auto& s = value.get_ref<const std::string&>();
    if (!pattern_.search(s))
        return Result::invalid(UnmatchingRegexError{s, pattern_.source});
    return Result::valid();
}

Result MultipleOfRule::evaluate(const Json& value, EvalContext&) const
{
    // Non-positive divisors are accepted silently.
    if (!value.is_number() || !(divisor_ > 0))
        return Result::valid();
    double v = value.get<double>();
    double quotient = v / divisor_;
    if (quotient != std::floor(quotient))
        return Result::invalid(MultipleOfError{v, divisor_});
    return Result::valid();
}

Result BoundsRule::evaluate(const Json& value, EvalContext&) const
{
    if (!value.is_number())
        return Result::valid();
    double v = value.get<double>();
    bool ok = true;
    if (comparison_ == Comparison::TooSmall)
        ok = exclusive_ ? v > bound_ : v >= bound_;
    else
        ok = exclusive_ ? v < bound_ : v <= bound_;
    if (ok)
        return Result::valid();
    return Result::invalid(ValueBoundsError{bound_, comparison_, exclusive_});
}

Result ItemCountRule::evaluate(const Json& value, EvalContext&) const
{
    if (value.is_array() && exceeds(value.size(), bound_, comparison_))
        return Result::invalid(LengthError{bound_, LengthKind::Array, comparison_});
    return Result::valid();
}

Result UniqueItemsRule::evaluate(const Json& value, EvalContext&) const
{
    if (!value.is_array())
        return Result::valid();
    for (std::size_t i = 0; i < value.size(); ++i)
        for (std::size_t j = i + 1; j < value.size(); ++j)
            if (util::json::equal_for_uniqueness(value[i], value[j]))
                return Result::invalid(UniqueItemsError{value});
    return Result::valid();
}

Result ItemsRule::evaluate(const Json& value, EvalContext& ctx) const
{
    if (!value.is_array())
        return Result::valid();
    Result out;
    for (const auto& element : value)
        out.merge(item_->evaluate(element, ctx));
    return out;
}

Result TupleItemsRule::evaluate(const Json& value, EvalContext& ctx) const
{
    if (!value.is_array())
        return Result::valid();
    Result out;
    for (std::size_t i = 0; i < value.size(); ++i)
    {
        const auto& rule = i < items_.size() ? items_[i] : additional_;
        out.merge(rule->evaluate(value[i], ctx));
    }
    return out;
}

std::vector<RulePtr> TupleItemsRule::children() const
{
    auto out = items_;
    out.push_back(additional_);
    return out;
}

Result PropertyCountRule::evaluate(const Json& value, EvalContext&) const
{
    if (value.is_object() && exceeds(value.size(), bound_, comparison_))
        return Result::invalid(LengthError{bound_, LengthKind::Properties, comparison_});
    return Result::valid();
}

Result RequiredRule::evaluate(const Json& value, EvalContext&) const
{
    // Unlike the count keywords, `required` rejects non-objects.
    if (!value.is_object())
        return Result::invalid(RequiredError{required_});
    for (const auto& key : required_)
        if (!value.contains(key))
            return Result::invalid(RequiredError{required_});
    return Result::valid();
}

Result PropertiesRule::evaluate(const Json& value, EvalContext& ctx) const
{
    if (!value.is_object())
        return Result::valid();

    std::set<std::string> matched;
    Result out;

    for (const auto& [key, rule] : properties_)
    {
        matched.insert(key);
        auto it = value.find(key);
        if (it != value.end())
            out.merge(rule->evaluate(*it, ctx));
    }

    for (const auto& [pattern, rule] : pattern_properties_)
    {
        if (!pattern.regex)
            return Result::invalid(InvalidRegexError{pattern.source});
        for (const auto& [key, member] : value.items())
        {
            if (!pattern.search(key))
                continue;
            matched.insert(key);
            out.merge(rule->evaluate(member, ctx));
        }
    }

    for (const auto& [key, member] : value.items())
        if (matched.count(key) == 0)
            out.merge(additional_->evaluate(member, ctx));

    return out;
}

std::vector<RulePtr> PropertiesRule::children() const
{
    std::vector<RulePtr> out;
    for (const auto& kv : properties_)
        out.push_back(kv.second);
    for (const auto& kv : pattern_properties_)
        out.push_back(kv.second);
    out.push_back(additional_);
    return out;
}

Result SchemaDependencyRule::evaluate(const Json& value, EvalContext& ctx) const
{
    if (value.is_object() && value.contains(key_))
        return rule_->evaluate(value, ctx);
    return Result::valid();
}

Result PropertyDependencyRule::evaluate(const Json& value, EvalContext&) const
{
    if (!value.is_object() || !value.contains(key_))
        return Result::valid();
    Result out;
    for (const auto& dependency : dependencies_)
        if (!value.contains(dependency))
            out.merge(Result::invalid(DependencyMissingError{key_, dependency}));
    return out;
}

} // namespace schemapp::validator
