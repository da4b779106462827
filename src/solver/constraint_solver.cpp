#include "solver/constraint_solver.h"

#include "diag/diagnostic.h"
#include "types/type_printer.h"

#include <numeric>
#include <optional>

namespace tyclass::solver {

static std::string no_instance_message(const std::string& constraint) {
    return "no type class instance was found for '" + constraint + "'";
}

ConstraintSolver::ConstraintSolver(const Program& program, SolverOptions options)
    : program_(program), options_(options), chains_(program, options.trace),
      superclasses_(program) {}

Evidence ConstraintSolver::solve(const Constraint& constraint,
                                 const std::vector<Constraint>& givens) const {
    return solve_at(constraint, givens, 0);
}

Evidence ConstraintSolver::solve_at(const Constraint& constraint,
                                    const std::vector<Constraint>& givens, uint32_t depth) const {
    const std::string printed = TypePrinter::constraint_to_string(constraint);

    if (depth > options_.max_depth) {
        throw ResolutionError(ResolutionErrorKind::ResolutionDepthExceeded, printed,
                              "constraint resolution did not terminate: depth limit of " +
                                  std::to_string(options_.max_depth) +
                                  " exceeded while solving '" + printed + "'",
                              constraint.loc);
    }

    auto class_id = program_.find_class(constraint.class_name);
    if (!class_id) {
        throw ResolutionError(ResolutionErrorKind::InvalidConstraint, printed,
                              "unknown class '" + constraint.class_name + "'", constraint.loc);
    }
    const auto& cls = program_.class_info(*class_id);
    if (constraint.args.size() != cls.arity()) {
        throw ResolutionError(ResolutionErrorKind::InvalidConstraint, printed,
                              "class '" + cls.name + "' expects " + std::to_string(cls.arity()) +
                                  " argument(s), got " + std::to_string(constraint.args.size()),
                              constraint.loc);
    }

    trace(depth, "solve " + printed);
    ResolutionResult result = chains_.resolve(*class_id, constraint, depth);

    if (auto* resolved = std::get_if<Resolved>(&result))
        return from_instance(constraint, std::move(*resolved), givens, depth);

    if (auto* stop = std::get_if<AmbiguousStop>(&result)) {
        const auto& blocking = program_.instance(stop->blocking).name;
        trace(depth, "stopped by ambiguous instance " + blocking);
        throw ResolutionError(ResolutionErrorKind::AmbiguousInstance, printed,
                              no_instance_message(printed), constraint.loc, blocking);
    }

    if (auto path = superclasses_.find_discharge(constraint, givens)) {
        trace(depth, "discharged by given #" + std::to_string(path->given_index));
        Evidence evidence;
        evidence.kind = EvidenceKind::Given;
        evidence.constraint = constraint;
        evidence.given_index = path->given_index;
        evidence.steps = std::move(path->steps);
        return evidence;
    }

    trace(depth, "no instance");
    throw ResolutionError(ResolutionErrorKind::NoInstanceFound, printed,
                          no_instance_message(printed), constraint.loc);
}

Evidence ConstraintSolver::from_instance(const Constraint& constraint, Resolved resolved,
                                         const std::vector<Constraint>& givens,
                                         uint32_t depth) const {
    const auto& instance = program_.instance(resolved.instance);
    trace(depth, "selected " + instance.name);

    Evidence evidence;
    evidence.kind = EvidenceKind::Instance;
    evidence.instance = resolved.instance;
    evidence.subst = std::move(resolved.subst);
    evidence.improvements = std::move(resolved.improvements);

    // A prerequisite left ambiguous may be settled by improvements from its
    // siblings, so it is retried for as long as some sibling succeeds.
    std::vector<std::optional<Evidence>> solved(instance.constraints.size());
    std::vector<size_t> pending(instance.constraints.size());
    std::iota(pending.begin(), pending.end(), size_t{0});
    while (!pending.empty()) {
        std::vector<size_t> blocked;
        std::optional<ResolutionError> first_blocked;
        for (size_t i : pending) {
            Constraint sub = apply_improvements(
                evidence.improvements, apply_subst(evidence.subst, instance.constraints[i]));
            sub.loc = constraint.loc;
            try {
                Evidence child = solve_at(sub, givens, depth + 1);
                for (const auto& [name, type] : child.improvements)
                    evidence.improvements.emplace(name, type);
                solved[i] = std::move(child);
            } catch (const ResolutionError& e) {
                if (e.kind() != ResolutionErrorKind::AmbiguousInstance)
                    throw;
                trace(depth, "deferred " + e.constraint());
                blocked.push_back(i);
                if (!first_blocked)
                    first_blocked = e;
            }
        }
        if (blocked.size() == pending.size())
            throw *first_blocked;
        pending = std::move(blocked);
    }

    evidence.prerequisites.reserve(solved.size());
    for (auto& child : solved) {
        child->constraint = apply_improvements(evidence.improvements, child->constraint);
        evidence.prerequisites.push_back(std::move(*child));
    }

    evidence.constraint = apply_improvements(evidence.improvements, constraint);
    return evidence;
}

void ConstraintSolver::trace(uint32_t depth, const std::string& message) const {
    if (!options_.trace)
        return;
    *options_.trace << std::string(static_cast<size_t>(depth) * 2, ' ') << message << "\n";
}

} // namespace tyclass::solver
