#include "types/type_printer.h"

#include <sstream>

namespace tyclass {

std::string TypePrinter::type_to_string(const Type& type) {
    switch (type.kind) {
    case TypeKind::Var:
        return type.name;
    case TypeKind::Existential:
        return "?" + type.name;
    case TypeKind::Skolem:
        return type.name + "'";
    case TypeKind::Constructor:
        break;
    }

    std::string result = type.name;
    for (const auto& arg : type.args) {
        result += " ";
        result += atom_to_string(arg);
    }
    return result;
}

// Applied constructors need parentheses in argument position.
std::string TypePrinter::atom_to_string(const Type& type) {
    if (type.is_constructor() && !type.args.empty())
        return "(" + type_to_string(type) + ")";
    return type_to_string(type);
}

std::string TypePrinter::constraint_to_string(const Constraint& constraint) {
    std::string result = constraint.class_name;
    for (const auto& arg : constraint.args) {
        result += " ";
        result += atom_to_string(arg);
    }
    return result;
}

std::string TypePrinter::substitution_to_string(const Substitution& subst) {
    std::ostringstream os;
    os << "{";
    bool first = true;
    for (const auto& [name, type] : subst) {
        if (!first)
            os << ", ";
        first = false;
        os << name << " := " << type_to_string(type);
    }
    os << "}";
    return os.str();
}

} // namespace tyclass
