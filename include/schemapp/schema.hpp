#pragma once
#include "schemapp/exceptions.hpp"
#include "schemapp/formats.hpp"
#include "schemapp/result.hpp"
#include "schemapp/settings.hpp"
#include "schemapp/types.hpp"
#include "schemapp/validator/compiler.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace schemapp
{

/// A schema document ready for validation.
///
/// Owns a copy of the document (needed to resolve `$ref`s from the root), the
/// format registry and the settings. `title`, `description`, `type` and
/// `properties` are extracted for introspection only.
///
/// Usage:
/// @code
/// schemapp::Schema schema(Json{{"type", "object"}, {"required", Json::array({"name"})}});
/// auto result = schema.validate(Json{{"name", "Eggs"}});
/// if (!result)
///     for (const auto& e : result.errors())
///         std::cerr << schemapp::to_string(e) << "\n";
/// @endcode
class Schema
{
  public:
    explicit Schema(Json document, FormatRegistry formats = FormatRegistry::defaults(),
                    Settings settings = Settings());
    Schema(Json document, Settings settings);

    /// Parses `text` as JSON. @throws SchemaLoadError on malformed input.
    static Schema from_string(const std::string& text,
                              FormatRegistry formats = FormatRegistry::defaults(),
                              Settings settings = Settings());

    /// Reads and parses a file. @throws SchemaLoadError on I/O or parse failure.
    static Schema from_file(const std::string& path,
                            FormatRegistry formats = FormatRegistry::defaults(),
                            Settings settings = Settings());

    const std::optional<std::string>& title() const
    {
        return title_;
    }
    const std::optional<std::string>& description() const
    {
        return description_;
    }
    /// Recognised names of the `type` keyword; empty when absent or unrecognised.
    const std::vector<Type>& type() const
    {
        return type_;
    }
    const std::optional<Json>& properties() const
    {
        return properties_;
    }

    const Json& document() const
    {
        return document_;
    }
    const FormatRegistry& formats() const
    {
        return formats_;
    }
    const Settings& settings() const
    {
        return settings_;
    }

    /// Compiled rule tree. Cached after the first call when
    /// Settings::cache_compiled is set, rebuilt on every call otherwise.
    std::shared_ptr<const validator::CompiledSchema> compiled() const;

    Result validate(const Json& value) const;

  private:
    struct CompileCache
    {
        std::once_flag once;
        std::shared_ptr<const validator::CompiledSchema> compiled;
    };

    std::shared_ptr<const validator::CompiledSchema> compile() const;

    Json document_;
    FormatRegistry formats_;
    Settings settings_;
    std::optional<std::string> title_;
    std::optional<std::string> description_;
    std::vector<Type> type_;
    std::optional<Json> properties_;
    std::shared_ptr<CompileCache> cache_;
};

/// Validates `value` against `schema` with default formats and settings.
Result validate(const Json& value, const Json& schema);

/// Like validate(), but throws ValidationError when the value is invalid.
void require_valid(const Json& value, const Json& schema);

/// Reads a JSON document from disk. @throws SchemaLoadError
Json load_document(const std::string& path);

/// Parses a JSON document. @throws SchemaLoadError
Json parse_document(const std::string& text);

} // namespace schemapp
