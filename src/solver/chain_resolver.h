#ifndef TYCLASS_CHAIN_RESOLVER_H
#define TYCLASS_CHAIN_RESOLVER_H

#include "program/program.h"
#include "solver/fundeps.h"
#include "solver/matcher.h"
#include "types/substitution.h"

#include <cstdint>
#include <ostream>
#include <variant>

namespace tyclass::solver {

struct Resolved {
    InstanceId instance = 0;
    Substitution subst;        // instance-head variables
    Substitution improvements; // constraint existentials fixed by functional dependencies
};
struct NotFound {};
struct AmbiguousStop {
    InstanceId blocking = 0;
};

using ResolutionResult = std::variant<Resolved, NotFound, AmbiguousStop>;

/// Selects an instance for a constraint by walking instance chains.
///
/// Within a chain the first Matched entry wins, and the first Ambiguous
/// entry ends the walk: a later entry must not be chosen while an earlier
/// one might still apply once existentials are known. Instance
/// prerequisites take no part in selection.
class ChainResolver {
  public:
    explicit ChainResolver(const Program& program, std::ostream* trace = nullptr)
        : program_(program), trace_(trace) {}

    /// Resolve against every chain of the class, in load order. Chains of one
    /// class never overlap, so at most one of them resolves. `depth` only
    /// indents the trace.
    ResolutionResult resolve(ClassId class_id, const Constraint& constraint,
                             uint32_t depth = 0) const;

    ResolutionResult resolve_chain(ChainId chain_id, const Constraint& constraint,
                                   uint32_t depth = 0) const;

    /// Match one instance: head matching on the non-output positions, then
    /// improvement of the output positions.
    MatchResult try_instance(const InstanceInfo& instance, const std::vector<Type>& args,
                             const std::vector<bool>& outputs, Substitution& improvements) const;

  private:
    const Program& program_;
    std::ostream* trace_;
    TypeMatcher matcher_;
    FunDepPropagator fundeps_;
};

} // namespace tyclass::solver

#endif // TYCLASS_CHAIN_RESOLVER_H
