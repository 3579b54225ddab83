#include "schemapp/schema.hpp"

#include "schemapp/util/json.hpp"
#include "schemapp/util/log.hpp"

#include <fstream>
#include <sstream>

namespace schemapp
{

Schema::Schema(Json document, FormatRegistry formats, Settings settings)
    : document_(std::move(document)), formats_(std::move(formats)), settings_(std::move(settings)),
      cache_(std::make_shared<CompileCache>())
{
    if (!document_.is_object())
    {
        log::warn("schema document is not an object; it places no constraints");
        return;
    }

    if (auto it = document_.find("title"); it != document_.end() && it->is_string())
        title_ = it->get<std::string>();
    if (auto it = document_.find("description"); it != document_.end() && it->is_string())
        description_ = it->get<std::string>();
    if (auto it = document_.find("properties"); it != document_.end() && it->is_object())
        properties_ = *it;

    if (auto it = document_.find("type"); it != document_.end())
    {
        if (it->is_string())
        {
            if (auto t = type_from_string(it->get<std::string>()))
                type_.push_back(*t);
        }
        else if (it->is_array())
        {
            for (const auto& name : *it)
                if (name.is_string())
                    if (auto t = type_from_string(name.get<std::string>()))
                        type_.push_back(*t);
        }
    }
}

Schema::Schema(Json document, Settings settings)
    : Schema(std::move(document), FormatRegistry::defaults(), std::move(settings))
{
}

Schema Schema::from_string(const std::string& text, FormatRegistry formats, Settings settings)
{
    return Schema(parse_document(text), std::move(formats), std::move(settings));
}

Schema Schema::from_file(const std::string& path, FormatRegistry formats, Settings settings)
{
    return Schema(load_document(path), std::move(formats), std::move(settings));
}

std::shared_ptr<const validator::CompiledSchema> Schema::compile() const
{
    validator::SchemaCompiler compiler(document_, formats_);
    return compiler.compile_document();
}

std::shared_ptr<const validator::CompiledSchema> Schema::compiled() const
{
    if (!settings_.cache_compiled)
        return compile();
    std::call_once(cache_->once, [this]() { cache_->compiled = compile(); });
    return cache_->compiled;
}

Result Schema::validate(const Json& value) const
{
    return compiled()->evaluate(value, settings_.max_reference_depth);
}

Result validate(const Json& value, const Json& schema)
{
    return Schema(schema).validate(value);
}

void require_valid(const Json& value, const Json& schema)
{
    Result result = validate(value, schema);
    if (result)
        return;
    std::string message = to_string(result.errors().front());
    if (result.errors().size() > 1)
        message += " (+" + std::to_string(result.errors().size() - 1) + " more)";
    throw ValidationError(message, std::move(result));
}

Json parse_document(const std::string& text)
{
    try
    {
        return util::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw SchemaLoadError(std::string("invalid JSON: ") + e.what());
    }
}

Json load_document(const std::string& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw SchemaLoadError("cannot open " + path);
    std::ostringstream buf;
    buf << in.rdbuf();
    try
    {
        return util::json::parse(buf.str());
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw SchemaLoadError(path + ": invalid JSON: " + e.what());
    }
}

} // namespace schemapp
