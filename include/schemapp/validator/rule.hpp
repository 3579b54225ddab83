#pragma once
#include "schemapp/result.hpp"
#include "schemapp/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace schemapp::validator
{

/// Tag of a compiled rule node, one per keyword family plus the combinators.
enum class RuleKind
{
    AllOf,
    AnyOf,
    OneOf,
    Not,
    Constant,
    Type,
    Enum,
    StringLength,
    Pattern,
    MultipleOf,
    Bounds,
    ItemCount,
    UniqueItems,
    Items,
    TupleItems,
    PropertyCount,
    Required,
    Properties,
    SchemaDependency,
    PropertyDependency,
    Format,
    Reference
};

/// Per-evaluation state. Tracks how many `$ref` expansions are currently
/// nested so self-referencing schemas terminate. Once the ceiling is hit the
/// context stays exhausted and every further expansion fails immediately.
class EvalContext
{
  public:
    explicit EvalContext(std::size_t max_reference_depth) : max_depth_(max_reference_depth) {}

    bool exhausted() const
    {
        return exhausted_.has_value();
    }
    /// The error recorded when the ceiling was first hit.
    const std::optional<RecursionLimitError>& exhaustion() const
    {
        return exhausted_;
    }
    void mark_exhausted(RecursionLimitError error)
    {
        if (!exhausted_)
            exhausted_ = std::move(error);
    }

    std::size_t depth() const
    {
        return depth_;
    }
    std::size_t max_depth() const
    {
        return max_depth_;
    }

    /// Increments the depth for its lifetime.
    class Scope
    {
      public:
        explicit Scope(EvalContext& ctx) : ctx_(ctx)
        {
            ++ctx_.depth_;
        }
        ~Scope()
        {
            --ctx_.depth_;
        }
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

      private:
        EvalContext& ctx_;
    };

  private:
    std::size_t depth_ = 0;
    std::size_t max_depth_;
    std::optional<RecursionLimitError> exhausted_;
};

/// A compiled, immutable evaluator for one keyword (or a combination of them).
class Rule
{
  public:
    virtual ~Rule() = default;

    virtual RuleKind kind() const = 0;
    virtual Result evaluate(const Json& value, EvalContext& ctx) const = 0;

    /// Child rules, for inspection. Leaf rules return an empty list.
    virtual std::vector<std::shared_ptr<const Rule>> children() const
    {
        return {};
    }
};

using RulePtr = std::shared_ptr<const Rule>;

} // namespace schemapp::validator
