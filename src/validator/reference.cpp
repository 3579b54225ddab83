#include "schemapp/validator/reference.hpp"

#include "schemapp/util/pointer.hpp"

namespace schemapp::validator
{

namespace ptr = schemapp::util::pointer;

Resolution resolve_reference(const Json& root, const std::string& reference)
{
    Resolution out;
    if (reference.empty() || reference[0] != '#')
    {
        out.error = RemoteReferenceUnsupportedError{reference};
        return out;
    }

    std::string fragment = reference.substr(1);
    if (fragment.empty())
    {
        out.node = &root;
        return out;
    }

    std::optional<std::string> decoded;
    if (fragment[0] == '/')
        decoded = ptr::percent_decode(fragment.substr(1));
    if (!decoded)
    {
        out.error = RemoteReferenceUnsupportedError{reference};
        return out;
    }

    auto tokens = ptr::split(*decoded);
    const Json* node = &root;
    for (size_t i = 0; i < tokens.size(); ++i)
    {
        std::string key = ptr::unescape_token(tokens[i]);
        auto not_found = [&]()
        {
            out.error = ReferenceNotFoundError{reference, key};
            return out;
        };

        if (!node->is_object())
            return not_found();
        auto it = node->find(key);
        if (it == node->end())
            return not_found();

        if (it->is_object())
        {
            node = &*it;
            continue;
        }
        if (it->is_array() && i + 1 < tokens.size())
        {
            auto index = ptr::parse_index(tokens[i + 1]);
            if (index && *index < it->size() && (*it)[*index].is_object())
            {
                node = &(*it)[*index];
                ++i;
                continue;
            }
        }
        return not_found();
    }

    out.node = node;
    return out;
}

Result ReferenceRule::evaluate(const Json& value, EvalContext& ctx) const
{
    if (ctx.exhausted() || ctx.depth() >= ctx.max_depth())
    {
        RecursionLimitError error{reference_, ctx.max_depth()};
        ctx.mark_exhausted(error);
        return Result::invalid(std::move(error));
    }

    auto target = target_.lock();
    if (!target || !target->rule)
        return Result::invalid(ReferenceNotFoundError{reference_, ""});

    EvalContext::Scope scope(ctx);
    return target->rule->evaluate(value, ctx);
}

} // namespace schemapp::validator
