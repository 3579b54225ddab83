#pragma once
#include "schemapp/formats.hpp"
#include "schemapp/validator/reference.hpp"
#include "schemapp/validator/rule.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace schemapp::validator
{

/// The rule tree of a whole schema document plus the reference targets it
/// points into. Immutable; safe to evaluate from several threads.
class CompiledSchema
{
  public:
    const RulePtr& root() const
    {
        return root_;
    }

    /// Number of distinct `$ref` strings the document compiled.
    std::size_t reference_count() const
    {
        return targets_.size();
    }

    Result evaluate(const Json& value, std::size_t max_reference_depth) const;

  private:
    friend class SchemaCompiler;

    RulePtr root_;
    std::map<std::string, std::shared_ptr<ReferenceTarget>> targets_;
};

/// Turns schema documents into rule trees.
///
/// Each recognised keyword of a schema node becomes one rule; the node as a
/// whole is the conjunction of those rules. `$ref` targets are compiled once
/// per reference string, so recursive schemas produce a finite graph.
class SchemaCompiler
{
  public:
    /// `root` and `formats` must outlive the compiler.
    SchemaCompiler(const Json& root, const FormatRegistry& formats);

    /// Compiles the root document. The returned object owns every reference
    /// target; the compiler is left empty.
    std::shared_ptr<const CompiledSchema> compile_document();

    /// Rules for one schema node, in keyword order.
    std::vector<RulePtr> compile_rules(const Json& node);

    /// Conjunction of compile_rules(node).
    RulePtr compile(const Json& node);

  private:
    RulePtr compile_reference(const std::string& reference);
    RulePtr compile_type(const Json& type);
    RulePtr compile_subschema_or_flag(const Json* value, ContainerKind kind);
    RulePtr compile_properties(const Json& node);
    void compile_dependencies(const Json& dependencies, std::vector<RulePtr>& out);
    RulePtr compile_format(const std::string& name);

    const Json& root_;
    const FormatRegistry& formats_;
    std::map<std::string, std::shared_ptr<ReferenceTarget>> targets_;
};

} // namespace schemapp::validator
