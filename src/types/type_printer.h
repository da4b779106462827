#ifndef TYCLASS_TYPE_PRINTER_H
#define TYCLASS_TYPE_PRINTER_H

#include "types/substitution.h"
#include "types/type.h"

#include <string>

namespace tyclass {

/// Source-like text for types and constraints, used by diagnostics and
/// solver traces. Existentials print as `?t`, skolems as `t'`.
class TypePrinter {
  public:
    static std::string type_to_string(const Type& type);
    static std::string constraint_to_string(const Constraint& constraint);
    static std::string substitution_to_string(const Substitution& subst);

  private:
    static std::string atom_to_string(const Type& type);
};

} // namespace tyclass

#endif // TYCLASS_TYPE_PRINTER_H
