#ifndef TYCLASS_SUBSTITUTION_H
#define TYCLASS_SUBSTITUTION_H

#include "types/type.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tyclass {

// Maps a variable name to the type it stands for. Which variables are keyed
// depends on use: pattern variables of an instance head, or existentials of
// a constraint (improvements).
using Substitution = std::map<std::string, Type>;

// Replaces pattern variables bound in `subst`. Unbound variables stay.
Type apply_subst(const Substitution& subst, const Type& type);
std::vector<Type> apply_subst(const Substitution& subst, const std::vector<Type>& types);
Constraint apply_subst(const Substitution& subst, const Constraint& constraint);

// Replaces existentials bound in `improvements`, following chains of
// improvements (`?a := ?b`, `?b := Int`).
Type apply_improvements(const Substitution& improvements, const Type& type);
Constraint apply_improvements(const Substitution& improvements, const Constraint& constraint);

// Renames every pattern variable `a` to `<prefix>a`.
Type rename_vars(const Type& type, const std::string& prefix);

// Most general unifier of two types whose pattern variables are the
// unknowns. Existentials and skolems are treated as rigid. Returns nullopt
// if the types do not unify.
std::optional<Substitution> unify(const Type& lhs, const Type& rhs,
                                  Substitution subst = Substitution{});
std::optional<Substitution> unify(const std::vector<Type>& lhs, const std::vector<Type>& rhs,
                                  Substitution subst = Substitution{});

} // namespace tyclass

#endif // TYCLASS_SUBSTITUTION_H
