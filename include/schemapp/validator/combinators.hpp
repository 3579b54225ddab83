#pragma once
#include "schemapp/validator/rule.hpp"

#include <optional>
#include <vector>

namespace schemapp::validator
{

/// Conjunction. Every child is evaluated, even after a failure, and the
/// errors are concatenated in child order.
class AllOfRule : public Rule
{
  public:
    explicit AllOfRule(std::vector<RulePtr> rules) : rules_(std::move(rules)) {}

    RuleKind kind() const override
    {
        return RuleKind::AllOf;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
    std::vector<RulePtr> children() const override
    {
        return rules_;
    }

  private:
    std::vector<RulePtr> rules_;
};

/// Valid iff at least one child is valid. Failure collapses to a single
/// AnyOfError; child errors are dropped.
class AnyOfRule : public Rule
{
  public:
    explicit AnyOfRule(std::vector<RulePtr> rules) : rules_(std::move(rules)) {}

    RuleKind kind() const override
    {
        return RuleKind::AnyOf;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
    std::vector<RulePtr> children() const override
    {
        return rules_;
    }

  private:
    std::vector<RulePtr> rules_;
};

/// Valid iff exactly one child is valid; otherwise reports how many passed.
class OneOfRule : public Rule
{
  public:
    explicit OneOfRule(std::vector<RulePtr> rules) : rules_(std::move(rules)) {}

    RuleKind kind() const override
    {
        return RuleKind::OneOf;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
    std::vector<RulePtr> children() const override
    {
        return rules_;
    }

  private:
    std::vector<RulePtr> rules_;
};

class NotRule : public Rule
{
  public:
    explicit NotRule(RulePtr rule) : rule_(std::move(rule)) {}

    RuleKind kind() const override
    {
        return RuleKind::Not;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;
    std::vector<RulePtr> children() const override
    {
        return {rule_};
    }

  private:
    RulePtr rule_;
};

/// Always valid, or always invalid with a fixed error.
class ConstantRule : public Rule
{
  public:
    ConstantRule() = default;
    explicit ConstantRule(Violation error) : error_(std::move(error)) {}

    RuleKind kind() const override
    {
        return RuleKind::Constant;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

    const std::optional<Violation>& error() const
    {
        return error_;
    }

  private:
    std::optional<Violation> error_;
};

RulePtr all_of(std::vector<RulePtr> rules);
RulePtr any_of(std::vector<RulePtr> rules);
RulePtr one_of(std::vector<RulePtr> rules);
RulePtr not_rule(RulePtr rule);
RulePtr always_valid();
RulePtr always_invalid(Violation error);

} // namespace schemapp::validator
