#include "solver/fundeps.h"

#include "diag/diagnostic.h"

#include <algorithm>

namespace tyclass::solver {

std::set<uint32_t> FunDepPropagator::required_concrete(
    const ClassInfo& cls, const std::set<uint32_t>& known_concrete) const {
    std::set<uint32_t> result = known_concrete;
    if (cls.fundeps.empty())
        return result;

    // Every productive pass adds at least one index.
    const uint32_t max_passes = cls.arity() + 1;
    uint32_t passes = 0;
    bool changed = true;
    while (changed) {
        if (++passes > max_passes) {
            throw LoadError(LoadErrorKind::FunctionalDependencyCycle, cls.name,
                            "functional dependencies of class '" + cls.name +
                                "' do not reach a fixpoint",
                            cls.loc);
        }
        changed = false;
        for (const auto& dep : cls.fundeps) {
            bool all_known = std::all_of(dep.determiners.begin(), dep.determiners.end(),
                                         [&](uint32_t i) { return result.contains(i); });
            if (!all_known)
                continue;
            for (uint32_t i : dep.determined) {
                if (result.insert(i).second)
                    changed = true;
            }
        }
    }
    return result;
}

std::set<uint32_t> FunDepPropagator::known_concrete(const std::vector<Type>& args) {
    std::set<uint32_t> known;
    for (uint32_t i = 0; i < args.size(); ++i) {
        if (!contains_existential(args[i]))
            known.insert(i);
    }
    return known;
}

std::vector<bool> FunDepPropagator::output_positions(const ClassInfo& cls,
                                                     const std::vector<Type>& args) const {
    std::vector<bool> outputs(args.size(), false);
    if (cls.fundeps.empty())
        return outputs;

    auto known = known_concrete(args);
    for (uint32_t i : required_concrete(cls, known)) {
        if (i < outputs.size() && !known.contains(i))
            outputs[i] = true;
    }
    return outputs;
}

MatchKind FunDepPropagator::improve(const Type& head, const Type& actual, Substitution& subst,
                                    Substitution& improvements) const {
    Type target = apply_improvements(improvements, actual);

    if (head.is_var()) {
        auto it = subst.find(head.name);
        if (it == subst.end()) {
            subst.emplace(head.name, target);
            return MatchKind::Matched;
        }
        return unify_improving(it->second, target, improvements);
    }

    if (target.is_existential()) {
        Type determined = apply_subst(subst, head);
        // The head leaves part of this position undetermined.
        if (contains_var(determined))
            return MatchKind::Ambiguous;
        return unify_improving(determined, target, improvements);
    }

    if (!head.is_constructor())
        return TypeMatcher::compare_types(head, target);
    if (!target.is_constructor() || target.name != head.name ||
        target.args.size() != head.args.size())
        return MatchKind::NoMatch;

    MatchKind result = MatchKind::Matched;
    for (size_t i = 0; i < head.args.size(); ++i) {
        result = combine(result, improve(head.args[i], target.args[i], subst, improvements));
        if (result == MatchKind::NoMatch)
            return result;
    }
    return result;
}

static bool occurs_existential(const std::string& name, const Type& type) {
    if (type.is_existential())
        return type.name == name;
    return std::any_of(type.args.begin(), type.args.end(),
                       [&](const Type& arg) { return occurs_existential(name, arg); });
}

MatchKind FunDepPropagator::unify_improving(const Type& a, const Type& b,
                                            Substitution& improvements) const {
    Type lhs = apply_improvements(improvements, a);
    Type rhs = apply_improvements(improvements, b);

    if (lhs.is_existential() && rhs.is_existential() && lhs.name == rhs.name)
        return MatchKind::Matched;
    if (lhs.is_existential() || rhs.is_existential()) {
        const Type& unknown = lhs.is_existential() ? lhs : rhs;
        const Type& other = lhs.is_existential() ? rhs : lhs;
        if (occurs_existential(unknown.name, other))
            return MatchKind::NoMatch;
        improvements[unknown.name] = other;
        return MatchKind::Matched;
    }

    if (lhs.kind != rhs.kind || lhs.name != rhs.name || lhs.args.size() != rhs.args.size())
        return MatchKind::NoMatch;

    MatchKind result = MatchKind::Matched;
    for (size_t i = 0; i < lhs.args.size(); ++i) {
        result = combine(result, unify_improving(lhs.args[i], rhs.args[i], improvements));
        if (result == MatchKind::NoMatch)
            return result;
    }
    return result;
}

std::vector<std::string> FunDepPropagator::validate(const ClassInfo& cls) {
    std::vector<std::string> errors;
    for (size_t d = 0; d < cls.fundeps.size(); ++d) {
        const auto& dep = cls.fundeps[d];
        std::string where = "functional dependency #" + std::to_string(d + 1) + " of class '" +
                            cls.name + "'";

        auto out_of_range = [&](uint32_t i) { return i >= cls.arity(); };
        if (std::any_of(dep.determiners.begin(), dep.determiners.end(), out_of_range) ||
            std::any_of(dep.determined.begin(), dep.determined.end(), out_of_range)) {
            errors.push_back(where + " refers to a parameter the class does not have");
            continue;
        }
        if (dep.determined.empty()) {
            errors.push_back(where + " determines no parameters");
            continue;
        }
        for (uint32_t i : dep.determined) {
            if (std::find(dep.determiners.begin(), dep.determiners.end(), i) !=
                dep.determiners.end()) {
                errors.push_back(where + " determines its own determiner '" + cls.params[i] +
                                 "'");
                break;
            }
        }
    }
    return errors;
}

} // namespace tyclass::solver
