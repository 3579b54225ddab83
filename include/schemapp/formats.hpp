#pragma once
#include "schemapp/result.hpp"
#include "schemapp/types.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace schemapp
{

/// Validates a value against a named `format`. Non-applicable values
/// (for the built-ins: anything that is not a string) are valid.
using FormatValidator = std::function<Result(const Json&)>;

Result validate_ipv4(const Json& value);
Result validate_ipv6(const Json& value);

/// Immutable name -> validator table consulted by the `format` keyword.
class FormatRegistry
{
  public:
    class Builder;

    /// Registry holding the built-in formats (`ipv4`, `ipv6`).
    static FormatRegistry defaults();

    /// Returns nullptr when no validator is registered under `name`.
    const FormatValidator* find(const std::string& name) const
    {
        auto it = formats_.find(name);
        if (it == formats_.end())
            return nullptr;
        return &it->second;
    }

    bool contains(const std::string& name) const
    {
        return formats_.count(name) != 0;
    }

    std::vector<std::string> names() const
    {
        std::vector<std::string> out;
        out.reserve(formats_.size());
        for (const auto& kv : formats_)
            out.push_back(kv.first);
        return out;
    }

  private:
    explicit FormatRegistry(std::map<std::string, FormatValidator> formats)
        : formats_(std::move(formats))
    {
    }

    std::map<std::string, FormatValidator> formats_;
};

/// Builds a registry from the built-ins plus custom entries.
///
/// Usage:
/// @code
/// auto formats = FormatRegistry::Builder()
///                    .add("even", [](const Json& v) { ... })
///                    .build();
/// Schema schema(document, formats);
/// @endcode
class FormatRegistry::Builder
{
  public:
    /// Starts from the built-in formats.
    Builder();

    /// Registers (or replaces) a format.
    Builder& add(std::string name, FormatValidator validator)
    {
        formats_[std::move(name)] = std::move(validator);
        return *this;
    }

    Builder& remove(const std::string& name)
    {
        formats_.erase(name);
        return *this;
    }

    FormatRegistry build() const
    {
        return FormatRegistry(formats_);
    }

  private:
    std::map<std::string, FormatValidator> formats_;
};

} // namespace schemapp
