#pragma once
#include "schemapp/validator/rule.hpp"

#include <memory>
#include <optional>
#include <string>

namespace schemapp::validator
{

/// Outcome of walking a local reference: the target node, or the error.
struct Resolution
{
    const Json* node = nullptr;
    std::optional<Violation> error;

    bool ok() const
    {
        return node != nullptr;
    }
};

/// Resolves `reference` ("#", "#/definitions/a", "#/items/0", ...) inside
/// `root`. Anything not starting with '#' is reported as a remote reference.
/// Never performs I/O.
Resolution resolve_reference(const Json& root, const std::string& reference);

/// Compiled target of a reference. Created empty before its schema is
/// compiled so cyclic references can point at it.
struct ReferenceTarget
{
    std::string reference;
    RulePtr rule;
};

/// Evaluates the rule behind a `$ref`. Holds its target weakly; the owning
/// CompiledSchema keeps targets alive.
class ReferenceRule : public Rule
{
  public:
    ReferenceRule(std::string reference, std::weak_ptr<const ReferenceTarget> target)
        : reference_(std::move(reference)), target_(std::move(target))
    {
    }

    RuleKind kind() const override
    {
        return RuleKind::Reference;
    }
    Result evaluate(const Json& value, EvalContext& ctx) const override;

    const std::string& reference() const
    {
        return reference_;
    }

  private:
    std::string reference_;
    std::weak_ptr<const ReferenceTarget> target_;
};

} // namespace schemapp::validator
