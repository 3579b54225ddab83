#include "schemapp/validator/combinators.hpp"

namespace schemapp::validator
{

Result AllOfRule::evaluate(const Json& value, EvalContext& ctx) const
{
    Result out;
    for (const auto& rule : rules_)
        out.merge(rule->evaluate(value, ctx));
    return out;
}

Result AnyOfRule::evaluate(const Json& value, EvalContext& ctx) const
{
    for (const auto& rule : rules_)
        if (rule->evaluate(value, ctx).is_valid())
            return Result::valid();
    return Result::invalid(AnyOfError{value});
}

Result OneOfRule::evaluate(const Json& value, EvalContext& ctx) const
{
    std::size_t passing = 0;
    for (const auto& rule : rules_)
        if (rule->evaluate(value, ctx).is_valid())
            ++passing;
    if (passing == 1)
        return Result::valid();
    return Result::invalid(OneOfError{passing});
}

Result NotRule::evaluate(const Json& value, EvalContext& ctx) const
{
    if (rule_->evaluate(value, ctx).is_valid())
        return Result::invalid(NotError{value});
    return Result::valid();
}

Result ConstantRule::evaluate(const Json&, EvalContext&) const
{
    if (error_)
        return Result::invalid(*error_);
    return Result::valid();
}

RulePtr all_of(std::vector<RulePtr> rules)
{
    return std::make_shared<AllOfRule>(std::move(rules));
}

RulePtr any_of(std::vector<RulePtr> rules)
{
    return std::make_shared<AnyOfRule>(std::move(rules));
}

RulePtr one_of(std::vector<RulePtr> rules)
{
    return std::make_shared<OneOfRule>(std::move(rules));
}

RulePtr not_rule(RulePtr rule)
{
    return std::make_shared<NotRule>(std::move(rule));
}

RulePtr always_valid()
{
    static const RulePtr rule = std::make_shared<ConstantRule>();
    return rule;
}

RulePtr always_invalid(Violation error)
{
    return std::make_shared<ConstantRule>(std::move(error));
}

} // namespace schemapp::validator
