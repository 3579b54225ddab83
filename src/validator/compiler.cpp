#include "schemapp/validator/compiler.hpp"

#include "schemapp/util/json.hpp"
#include "schemapp/util/log.hpp"
#include "schemapp/validator/combinators.hpp"
#include "schemapp/validator/keywords.hpp"

namespace schemapp::validator
{

namespace json = schemapp::util::json;

namespace
{

const Json* member(const Json& node, const char* key)
{
    if (!node.is_object())
        return nullptr;
    auto it = node.find(key);
    if (it == node.end())
        return nullptr;
    return &*it;
}

bool flag_set(const Json& node, const char* key)
{
    const Json* v = member(node, key);
    return v && v->is_boolean() && v->get<bool>();
}

} // namespace

Result CompiledSchema::evaluate(const Json& value, std::size_t max_reference_depth) const
{
    EvalContext ctx(max_reference_depth);
    Result result = root_->evaluate(value, ctx);
    if (ctx.exhausted())
    {
        // A combinator may have folded the limit error into its own summary.
        const auto& limit = *ctx.exhaustion();
        bool reported = false;
        for (const auto& e : result.errors())
            if (std::holds_alternative<RecursionLimitError>(e))
                reported = true;
        if (!reported)
            result.merge(Result::invalid(limit));
    }
    return result;
}

SchemaCompiler::SchemaCompiler(const Json& root, const FormatRegistry& formats)
    : root_(root), formats_(formats)
{
}

std::shared_ptr<const CompiledSchema> SchemaCompiler::compile_document()
{
    auto self = std::make_shared<ReferenceTarget>();
    self->reference = "#";
    targets_["#"] = self;
    self->rule = compile(root_);

    auto compiled = std::make_shared<CompiledSchema>();
    compiled->root_ = self->rule;
    compiled->targets_ = std::move(targets_);
    targets_.clear();
    return compiled;
}

RulePtr SchemaCompiler::compile(const Json& node)
{
    return all_of(compile_rules(node));
}

std::vector<RulePtr> SchemaCompiler::compile_rules(const Json& node)
{
    std::vector<RulePtr> rules;
    if (!node.is_object())
        return rules;

    if (const Json* ref = member(node, "$ref"); ref && ref->is_string())
        rules.push_back(compile_reference(ref->get<std::string>()));

    if (const Json* type = member(node, "type"))
        rules.push_back(compile_type(*type));

    if (const Json* all = member(node, "allOf"); all && json::is_schema_array(*all))
        for (const auto& sub : *all)
            for (auto& rule : compile_rules(sub))
                rules.push_back(std::move(rule));

    if (const Json* any = member(node, "anyOf"); any && json::is_schema_array(*any))
    {
        std::vector<RulePtr> branches;
        for (const auto& sub : *any)
            branches.push_back(compile(sub));
        rules.push_back(any_of(std::move(branches)));
    }

    if (const Json* one = member(node, "oneOf"); one && json::is_schema_array(*one))
    {
        std::vector<RulePtr> branches;
        for (const auto& sub : *one)
            branches.push_back(compile(sub));
        rules.push_back(one_of(std::move(branches)));
    }

    if (const Json* negated = member(node, "not"); negated && negated->is_object())
        rules.push_back(not_rule(compile(*negated)));

    if (const Json* values = member(node, "enum"); values && values->is_array())
        rules.push_back(std::make_shared<EnumRule>(*values));

    // Strings

    if (const Json* v = member(node, "maxLength"))
        if (auto bound = json::as_count(*v))
            rules.push_back(std::make_shared<StringLengthRule>(*bound, Comparison::TooLarge));

    if (const Json* v = member(node, "minLength"))
        if (auto bound = json::as_count(*v))
            rules.push_back(std::make_shared<StringLengthRule>(*bound, Comparison::TooSmall));

    if (const Json* pattern = member(node, "pattern"); pattern && pattern->is_string())
    {
        auto rule = std::make_shared<PatternRule>(pattern->get<std::string>());
        if (!rule->pattern().regex)
            log::debug("invalid pattern '" + pattern->get<std::string>() + "'");
        rules.push_back(std::move(rule));
    }

    // Numbers

    if (const Json* v = member(node, "multipleOf"); v && v->is_number())
        rules.push_back(std::make_shared<MultipleOfRule>(v->get<double>()));

    if (const Json* v = member(node, "minimum"); v && v->is_number())
        rules.push_back(std::make_shared<BoundsRule>(v->get<double>(), Comparison::TooSmall,
                                                     flag_set(node, "exclusiveMinimum")));

    if (const Json* v = member(node, "maximum"); v && v->is_number())
        rules.push_back(std::make_shared<BoundsRule>(v->get<double>(), Comparison::TooLarge,
                                                     flag_set(node, "exclusiveMaximum")));

    // Arrays

    if (const Json* v = member(node, "minItems"))
        if (auto bound = json::as_count(*v))
            rules.push_back(std::make_shared<ItemCountRule>(*bound, Comparison::TooSmall));

    if (const Json* v = member(node, "maxItems"))
        if (auto bound = json::as_count(*v))
            rules.push_back(std::make_shared<ItemCountRule>(*bound, Comparison::TooLarge));

    if (flag_set(node, "uniqueItems"))
        rules.push_back(std::make_shared<UniqueItemsRule>());

    if (const Json* items = member(node, "items"))
    {
        if (items->is_object())
        {
            rules.push_back(std::make_shared<ItemsRule>(compile(*items)));
        }
        else if (json::is_schema_array(*items))
        {
            std::vector<RulePtr> positional;
            for (const auto& sub : *items)
                positional.push_back(compile(sub));
            auto additional =
                compile_subschema_or_flag(member(node, "additionalItems"), ContainerKind::Array);
            rules.push_back(
                std::make_shared<TupleItemsRule>(std::move(positional), std::move(additional)));
        }
    }

    // Objects

    if (const Json* v = member(node, "maxProperties"))
        if (auto bound = json::as_count(*v))
            rules.push_back(std::make_shared<PropertyCountRule>(*bound, Comparison::TooLarge));

    if (const Json* v = member(node, "minProperties"))
        if (auto bound = json::as_count(*v))
            rules.push_back(std::make_shared<PropertyCountRule>(*bound, Comparison::TooSmall));

    if (const Json* required = member(node, "required"); required && json::is_string_array(*required))
        rules.push_back(std::make_shared<RequiredRule>(required->get<std::vector<std::string>>()));

    if (member(node, "properties") || member(node, "patternProperties") ||
        member(node, "additionalProperties"))
        rules.push_back(compile_properties(node));

    if (const Json* deps = member(node, "dependencies"); deps && deps->is_object())
        compile_dependencies(*deps, rules);

    if (const Json* format = member(node, "format"); format && format->is_string())
        rules.push_back(compile_format(format->get<std::string>()));

    return rules;
}

RulePtr SchemaCompiler::compile_reference(const std::string& reference)
{
    auto it = targets_.find(reference);
    if (it != targets_.end())
        return std::make_shared<ReferenceRule>(reference, it->second);

    Resolution resolution = resolve_reference(root_, reference);
    if (!resolution.ok())
    {
        log::debug("unresolvable $ref '" + reference + "': " + to_string(*resolution.error));
        return always_invalid(*resolution.error);
    }

    auto target = std::make_shared<ReferenceTarget>();
    target->reference = reference;
    targets_[reference] = target;
    target->rule = compile(*resolution.node);
    return std::make_shared<ReferenceRule>(reference, target);
}

RulePtr SchemaCompiler::compile_type(const Json& type)
{
    if (type.is_string())
        return std::make_shared<TypeRule>(type.get<std::string>());

    if (json::is_string_array(type))
    {
        std::vector<RulePtr> alternatives;
        for (const auto& name : type)
            alternatives.push_back(std::make_shared<TypeRule>(name.get<std::string>()));
        return any_of(std::move(alternatives));
    }

    log::debug("invalid 'type' keyword: " + type.dump());
    return always_invalid(InvalidTypeError{type});
}

RulePtr SchemaCompiler::compile_subschema_or_flag(const Json* value, ContainerKind kind)
{
    if (value && value->is_object())
        return compile(*value);
    if (value && value->is_boolean() && !value->get<bool>())
        return always_invalid(AdditionalPropertiesError{kind});
    return always_valid();
}

RulePtr SchemaCompiler::compile_properties(const Json& node)
{
    PropertiesRule::Named named;
    if (const Json* properties = member(node, "properties"); properties && properties->is_object())
        for (const auto& [key, sub] : properties->items())
            if (sub.is_object())
                named.emplace_back(key, compile(sub));

    PropertiesRule::Patterned patterned;
    if (const Json* patterns = member(node, "patternProperties"); patterns && patterns->is_object())
    {
        for (const auto& [source, sub] : patterns->items())
        {
            if (!sub.is_object())
                continue;
            auto pattern = CompiledPattern::compile(source);
            if (!pattern.regex)
                log::debug("invalid patternProperties regex '" + source + "'");
            patterned.emplace_back(std::move(pattern), compile(sub));
        }
    }

    auto additional =
        compile_subschema_or_flag(member(node, "additionalProperties"), ContainerKind::Object);
    return std::make_shared<PropertiesRule>(std::move(named), std::move(patterned),
                                            std::move(additional));
}

void SchemaCompiler::compile_dependencies(const Json& dependencies, std::vector<RulePtr>& out)
{
    for (const auto& [key, dependency] : dependencies.items())
    {
        if (dependency.is_object())
            out.push_back(std::make_shared<SchemaDependencyRule>(key, compile(dependency)));
        else if (json::is_string_array(dependency))
            out.push_back(std::make_shared<PropertyDependencyRule>(
                key, dependency.get<std::vector<std::string>>()));
    }
}

RulePtr SchemaCompiler::compile_format(const std::string& name)
{
    if (const FormatValidator* validator = formats_.find(name))
        return std::make_shared<FormatRule>(name, *validator);
    log::debug("unsupported format '" + name + "'");
    return always_invalid(FormatUnsupportedError{name});
}

} // namespace schemapp::validator
