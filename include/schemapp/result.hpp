#pragma once
#include "schemapp/errors.hpp"

#include <utility>
#include <vector>

namespace schemapp
{

/// Outcome of evaluating a rule: valid, or invalid with the violations in the
/// order they were found. An invalid result always carries at least one error.
class Result
{
  public:
    Result() = default;

    static Result valid()
    {
        return Result();
    }
    static Result invalid(Violation error)
    {
        Result r;
        r.errors_.push_back(std::move(error));
        return r;
    }

    bool is_valid() const noexcept
    {
        return errors_.empty();
    }
    explicit operator bool() const noexcept
    {
        return is_valid();
    }

    const std::vector<Violation>& errors() const noexcept
    {
        return errors_;
    }

    /// Appends the other result's errors after this one's.
    Result& merge(Result other)
    {
        if (errors_.empty())
        {
            errors_ = std::move(other.errors_);
            return *this;
        }
        errors_.reserve(errors_.size() + other.errors_.size());
        for (auto& e : other.errors_)
            errors_.push_back(std::move(e));
        return *this;
    }

    /// Concatenation of all results, in order.
    static Result merged(std::vector<Result> results)
    {
        Result out;
        for (auto& r : results)
            out.merge(std::move(r));
        return out;
    }

    friend bool operator==(const Result& a, const Result& b)
    {
        return a.errors_ == b.errors_;
    }
    friend bool operator!=(const Result& a, const Result& b)
    {
        return !(a == b);
    }

  private:
    std::vector<Violation> errors_;
};

} // namespace schemapp
