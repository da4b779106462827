#include "solver/evidence.h"

#include "types/type_printer.h"

#include <sstream>

namespace tyclass::solver {

void EvidencePrinter::print(const Evidence& evidence, std::ostream& os, int indent) const {
    os << std::string(static_cast<size_t>(indent) * 2, ' ')
       << TypePrinter::constraint_to_string(evidence.constraint) << " <= ";

    if (evidence.kind == EvidenceKind::Given) {
        os << "given #" << evidence.given_index;
        for (const auto& step : evidence.steps) {
            os << " . super " << program_.class_info(step.subclass).name << "#" << step.index;
        }
        os << "\n";
        return;
    }

    os << program_.instance(evidence.instance).name;
    if (!evidence.subst.empty())
        os << " " << TypePrinter::substitution_to_string(evidence.subst);
    os << "\n";
    for (const auto& child : evidence.prerequisites)
        print(child, os, indent + 1);
}

std::string EvidencePrinter::to_string(const Evidence& evidence) const {
    std::ostringstream os;
    print(evidence, os);
    return os.str();
}

} // namespace tyclass::solver
