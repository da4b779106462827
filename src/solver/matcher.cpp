#include "solver/matcher.h"

namespace tyclass::solver {

MatchResult TypeMatcher::match(const std::vector<Type>& head,
                               const std::vector<Type>& args) const {
    return match(head, args, std::vector<bool>(head.size(), false));
}

MatchResult TypeMatcher::match(const std::vector<Type>& head, const std::vector<Type>& args,
                               const std::vector<bool>& skip) const {
    if (head.size() != args.size())
        return NoMatch{};

    Substitution subst;
    MatchKind overall = MatchKind::Matched;
    for (size_t i = 0; i < head.size(); ++i) {
        if (i < skip.size() && skip[i])
            continue;
        overall = combine(overall, match_type(head[i], args[i], subst));
        // Nothing later can undo a structural mismatch.
        if (overall == MatchKind::NoMatch)
            return NoMatch{};
    }

    if (overall == MatchKind::Ambiguous)
        return Ambiguous{};
    return Matched{std::move(subst)};
}

MatchKind TypeMatcher::match_type(const Type& head, const Type& actual,
                                  Substitution& subst) const {
    switch (head.kind) {
    case TypeKind::Var: {
        auto it = subst.find(head.name);
        if (it == subst.end()) {
            subst.emplace(head.name, actual);
            return MatchKind::Matched;
        }
        // Second occurrence of the same head variable: both bindings must agree.
        return compare_types(it->second, actual);
    }

    case TypeKind::Constructor:
        if (actual.is_existential())
            return MatchKind::Ambiguous;
        if (!actual.is_constructor() || actual.name != head.name ||
            actual.args.size() != head.args.size())
            return MatchKind::NoMatch;
        {
            MatchKind result = MatchKind::Matched;
            for (size_t i = 0; i < head.args.size(); ++i) {
                result = combine(result, match_type(head.args[i], actual.args[i], subst));
                if (result == MatchKind::NoMatch)
                    return result;
            }
            return result;
        }

    case TypeKind::Existential:
    case TypeKind::Skolem:
        return compare_types(head, actual);
    }
    return MatchKind::NoMatch;
}

MatchKind TypeMatcher::compare_types(const Type& a, const Type& b) {
    if (a.is_existential() && b.is_existential() && a.name == b.name)
        return MatchKind::Matched;
    if (a.is_existential() || b.is_existential())
        return MatchKind::Ambiguous;

    if (a.kind != b.kind || a.name != b.name || a.args.size() != b.args.size())
        return MatchKind::NoMatch;

    MatchKind result = MatchKind::Matched;
    for (size_t i = 0; i < a.args.size(); ++i) {
        result = combine(result, compare_types(a.args[i], b.args[i]));
        if (result == MatchKind::NoMatch)
            return result;
    }
    return result;
}

} // namespace tyclass::solver
