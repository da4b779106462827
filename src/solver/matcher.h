#ifndef TYCLASS_MATCHER_H
#define TYCLASS_MATCHER_H

#include "types/substitution.h"
#include "types/type.h"

#include <variant>
#include <vector>

namespace tyclass::solver {

// Ordered by dominance: combining two outcomes keeps the larger.
enum class MatchKind {
    Matched,
    Ambiguous,
    NoMatch,
};

inline MatchKind combine(MatchKind a, MatchKind b) {
    return a > b ? a : b;
}

struct Matched {
    Substitution subst; // instance-head variable -> constraint-side type
};
struct NoMatch {};
struct Ambiguous {};

using MatchResult = std::variant<Matched, NoMatch, Ambiguous>;

inline MatchKind kind_of(const MatchResult& result) {
    if (std::holds_alternative<Matched>(result))
        return MatchKind::Matched;
    if (std::holds_alternative<Ambiguous>(result))
        return MatchKind::Ambiguous;
    return MatchKind::NoMatch;
}

/// Structural matcher of instance heads against constraint arguments.
///
/// Head-side pattern variables bind to whatever they meet. Constraint-side
/// existentials may still be instantiated later, so a concrete head
/// constructor facing one is Ambiguous rather than a match or a mismatch.
/// Skolems, and pattern variables that leak into a constraint, are rigid.
class TypeMatcher {
  public:
    MatchResult match(const std::vector<Type>& head, const std::vector<Type>& args) const;

    /// Match only the positions where `skip[i]` is false. Skipped positions
    /// are left to functional-dependency improvement.
    MatchResult match(const std::vector<Type>& head, const std::vector<Type>& args,
                      const std::vector<bool>& skip) const;

    /// Match one head type, extending `subst`. On NoMatch or Ambiguous,
    /// `subst` may hold partial bindings.
    MatchKind match_type(const Type& head, const Type& actual, Substitution& subst) const;

    /// Three-valued equality of two constraint-side types: Matched if equal,
    /// NoMatch if apart, Ambiguous if equal only for some instantiation of
    /// their existentials.
    static MatchKind compare_types(const Type& a, const Type& b);
};

} // namespace tyclass::solver

#endif // TYCLASS_MATCHER_H
