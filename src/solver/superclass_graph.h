#ifndef TYCLASS_SUPERCLASS_GRAPH_H
#define TYCLASS_SUPERCLASS_GRAPH_H

#include "program/program.h"
#include "types/type.h"

#include <cstdint>
#include <optional>
#include <set>
#include <vector>

namespace tyclass::solver {

struct SuperclassEdge {
    ClassId subclass = 0;
    uint32_t index = 0; // position in the subclass's superclass list
    ClassId superclass = 0;
    std::vector<Type> args; // over the subclass's parameters
};

// Projection of superclass `index` out of evidence for class `subclass`.
struct SuperclassStep {
    ClassId subclass = 0;
    uint32_t index = 0;
};

struct DischargePath {
    std::size_t given_index = 0;
    std::vector<SuperclassStep> steps; // empty when the given is the target itself
};

/// Subclass -> superclass edges over the classes of a program.
/// Superclass references to undeclared classes are skipped here; the class
/// check pass reports them.
class SuperclassGraph {
  public:
    explicit SuperclassGraph(const Program& program);

    const std::vector<SuperclassEdge>& edges_from(ClassId id) const {
        return edges_.at(id);
    }

    /// Every class reachable through one or more superclass edges.
    std::set<ClassId> superclasses_of(ClassId id) const;

    /// Classes on some superclass cycle, each reported once, in id order.
    std::vector<ClassId> classes_on_cycles() const;

    /// Breadth-first search from each given, in order, for a chain of
    /// superclass projections whose instantiated constraint equals `target`.
    /// Only exact equality counts, so existentials must coincide by name.
    std::optional<DischargePath> find_discharge(const Constraint& target,
                                                const std::vector<Constraint>& givens) const;

  private:
    const Program& program_;
    std::vector<std::vector<SuperclassEdge>> edges_;
};

} // namespace tyclass::solver

#endif // TYCLASS_SUPERCLASS_GRAPH_H
