#ifndef TYCLASS_CONSTRAINT_SOLVER_H
#define TYCLASS_CONSTRAINT_SOLVER_H

#include "program/program.h"
#include "solver/chain_resolver.h"
#include "solver/evidence.h"
#include "solver/superclass_graph.h"

#include <cstdint>
#include <ostream>
#include <vector>

namespace tyclass::solver {

struct SolverOptions {
    // Nesting limit for prerequisites of selected instances.
    uint32_t max_depth = 64;
    // When set, every resolution step is written here.
    std::ostream* trace = nullptr;
};

/// Entry point of instance resolution.
///
/// A constraint is first resolved through its class's own chains. Only if
/// they yield nothing is superclass discharge from the givens attempted; an
/// ambiguous chain is final. The prerequisites of a selected instance are
/// then solved recursively with the same givens. A prerequisite that is
/// ambiguous is retried once its siblings have contributed improvements,
/// so the order prerequisites are written in does not matter.
///
/// The solver only reads the program and keeps no state between calls.
/// Resolution failures are thrown as ResolutionError and leave the solver
/// usable. A class whose functional dependencies bypassed load validation
/// surfaces as LoadError(FunctionalDependencyCycle).
class ConstraintSolver {
  public:
    explicit ConstraintSolver(const Program& program, SolverOptions options = {});

    Evidence solve(const Constraint& constraint,
                   const std::vector<Constraint>& givens = {}) const;

    const SuperclassGraph& superclass_graph() const {
        return superclasses_;
    }
    const SolverOptions& options() const {
        return options_;
    }

  private:
    Evidence solve_at(const Constraint& constraint, const std::vector<Constraint>& givens,
                      uint32_t depth) const;
    Evidence from_instance(const Constraint& constraint, Resolved resolved,
                           const std::vector<Constraint>& givens, uint32_t depth) const;

    void trace(uint32_t depth, const std::string& message) const;

    const Program& program_;
    SolverOptions options_;
    ChainResolver chains_;
    SuperclassGraph superclasses_;
};

} // namespace tyclass::solver

#endif // TYCLASS_CONSTRAINT_SOLVER_H
