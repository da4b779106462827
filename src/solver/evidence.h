#ifndef TYCLASS_EVIDENCE_H
#define TYCLASS_EVIDENCE_H

#include "program/program.h"
#include "solver/superclass_graph.h"
#include "types/substitution.h"
#include "types/type.h"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace tyclass::solver {

enum class EvidenceKind {
    Instance, // a selected instance, applied to evidence for its prerequisites
    Given,    // an in-scope given, possibly projected through superclasses
};

/// How one constraint was discharged. Instance evidence nests evidence for
/// each prerequisite of the instance, in declaration order.
struct Evidence {
    EvidenceKind kind = EvidenceKind::Instance;
    Constraint constraint; // with improvements applied

    // Instance
    InstanceId instance = 0;
    Substitution subst;
    std::vector<Evidence> prerequisites;

    // Given
    std::size_t given_index = 0;
    std::vector<SuperclassStep> steps;

    // Existentials fixed while solving this constraint and its prerequisites.
    Substitution improvements;
};

class EvidencePrinter {
  public:
    explicit EvidencePrinter(const Program& program) : program_(program) {}

    void print(const Evidence& evidence, std::ostream& os, int indent = 0) const;
    std::string to_string(const Evidence& evidence) const;

  private:
    const Program& program_;
};

} // namespace tyclass::solver

#endif // TYCLASS_EVIDENCE_H
