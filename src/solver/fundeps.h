#ifndef TYCLASS_FUNDEPS_H
#define TYCLASS_FUNDEPS_H

#include "program/program.h"
#include "solver/matcher.h"
#include "types/substitution.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tyclass::solver {

/// Functional-dependency propagation for multi-parameter classes.
///
/// Before an instance head is matched, the constraint positions that are
/// already concrete are closed under the class's dependencies. Positions
/// that are determined but not yet concrete are outputs: they are not
/// matched, but filled in ("improved") from the selected instance.
class FunDepPropagator {
  public:
    /// Fixpoint: for each dependency whose determiners are all in the set,
    /// add its determined indices. Throws LoadError(FunctionalDependencyCycle)
    /// instead of iterating past the bound a well-formed class can need.
    std::set<uint32_t> required_concrete(const ClassInfo& cls,
                                         const std::set<uint32_t>& known_concrete) const;

    /// Positions whose argument contains no existential.
    static std::set<uint32_t> known_concrete(const std::vector<Type>& args);

    /// `result[i]` is true when position i is determined but not known.
    /// All false for classes without dependencies.
    std::vector<bool> output_positions(const ClassInfo& cls, const std::vector<Type>& args) const;

    /// Fill an output position from the instance head. Head variables bound
    /// by the matched positions are substituted; existentials on the
    /// constraint side are recorded in `improvements`.
    MatchKind improve(const Type& head, const Type& actual, Substitution& subst,
                      Substitution& improvements) const;

    /// Declaration-level problems with the class's dependencies, one message
    /// each. Empty when the dependencies are well formed.
    static std::vector<std::string> validate(const ClassInfo& cls);

  private:
    MatchKind unify_improving(const Type& a, const Type& b, Substitution& improvements) const;
};

} // namespace tyclass::solver

#endif // TYCLASS_FUNDEPS_H
