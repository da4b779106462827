#include "types/substitution.h"

namespace tyclass {

Type apply_subst(const Substitution& subst, const Type& type) {
    if (type.is_var()) {
        auto it = subst.find(type.name);
        return it != subst.end() ? it->second : type;
    }
    if (type.args.empty())
        return type;
    Type result(type.kind, type.name);
    result.args.reserve(type.args.size());
    for (const auto& arg : type.args)
        result.args.push_back(apply_subst(subst, arg));
    return result;
}

std::vector<Type> apply_subst(const Substitution& subst,
                              const std::vector<Type>& types) {
    std::vector<Type> result;
    result.reserve(types.size());
    for (const auto& t : types)
        result.push_back(apply_subst(subst, t));
    return result;
}

Constraint apply_subst(const Substitution& subst, const Constraint& constraint) {
    return {constraint.class_name, apply_subst(subst, constraint.args), constraint.loc};
}

static Type apply_improvements_bounded(const Substitution& improvements, const Type& type,
                                       size_t budget) {
    if (type.is_existential()) {
        auto it = improvements.find(type.name);
        if (it == improvements.end() || budget == 0)
            return type;
        return apply_improvements_bounded(improvements, it->second, budget - 1);
    }
    if (type.args.empty())
        return type;
    Type result(type.kind, type.name);
    result.args.reserve(type.args.size());
    for (const auto& arg : type.args)
        result.args.push_back(apply_improvements_bounded(improvements, arg, budget));
    return result;
}

Type apply_improvements(const Substitution& improvements, const Type& type) {
    return apply_improvements_bounded(improvements, type, improvements.size());
}

Constraint apply_improvements(const Substitution& improvements, const Constraint& constraint) {
    Constraint result{constraint.class_name, {}, constraint.loc};
    result.args.reserve(constraint.args.size());
    for (const auto& arg : constraint.args)
        result.args.push_back(apply_improvements(improvements, arg));
    return result;
}

Type rename_vars(const Type& type, const std::string& prefix) {
    if (type.is_var())
        return var(prefix + type.name);
    Type result(type.kind, type.name);
    result.args.reserve(type.args.size());
    for (const auto& arg : type.args)
        result.args.push_back(rename_vars(arg, prefix));
    return result;
}

// Follow bindings of a variable until reaching a non-variable or an unbound one.
static Type resolve_var(const Substitution& subst, Type type) {
    while (type.is_var()) {
        auto it = subst.find(type.name);
        if (it == subst.end())
            break;
        type = it->second;
    }
    return type;
}

static bool occurs(const std::string& name, const Type& type, const Substitution& subst) {
    Type t = resolve_var(subst, type);
    if (t.is_var())
        return t.name == name;
    for (const auto& arg : t.args) {
        if (occurs(name, arg, subst))
            return true;
    }
    return false;
}

std::optional<Substitution> unify(const Type& lhs, const Type& rhs, Substitution subst) {
    Type a = resolve_var(subst, lhs);
    Type b = resolve_var(subst, rhs);

    if (a.is_var() && b.is_var() && a.name == b.name)
        return subst;
    if (a.is_var()) {
        if (occurs(a.name, b, subst))
            return std::nullopt;
        subst[a.name] = b;
        return subst;
    }
    if (b.is_var()) {
        if (occurs(b.name, a, subst))
            return std::nullopt;
        subst[b.name] = a;
        return subst;
    }

    if (a.kind != b.kind || a.name != b.name || a.args.size() != b.args.size())
        return std::nullopt;
    return unify(a.args, b.args, std::move(subst));
}

std::optional<Substitution> unify(const std::vector<Type>& lhs, const std::vector<Type>& rhs,
                                  Substitution subst) {
    if (lhs.size() != rhs.size())
        return std::nullopt;
    for (size_t i = 0; i < lhs.size(); ++i) {
        auto next = unify(lhs[i], rhs[i], std::move(subst));
        if (!next)
            return std::nullopt;
        subst = std::move(*next);
    }
    return subst;
}

} // namespace tyclass
