#ifndef TYCLASS_TYPE_H
#define TYCLASS_TYPE_H

#include "diag/diagnostic.h"

#include <string>
#include <vector>

namespace tyclass {

enum class TypeKind {
    Constructor, // nominal type constructor applied to zero or more arguments
    Var,         // pattern variable of an instance head or class declaration
    Existential, // unknown of the constraint being solved, may be instantiated later
    Skolem,      // rigid variable bound by an enclosing signature
};

struct Type {
    TypeKind kind;
    std::string name; // e.g. "Array", "a", "t3"
    std::vector<Type> args;

    Type(TypeKind k = TypeKind::Constructor, std::string n = "", std::vector<Type> a = {})
        : kind(k), name(std::move(n)), args(std::move(a)) {}

    bool is_constructor() const {
        return kind == TypeKind::Constructor;
    }
    bool is_var() const {
        return kind == TypeKind::Var;
    }
    bool is_existential() const {
        return kind == TypeKind::Existential;
    }
    bool is_skolem() const {
        return kind == TypeKind::Skolem;
    }

    bool operator==(const Type& other) const {
        if (kind != other.kind || name != other.name || args.size() != other.args.size())
            return false;
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] != other.args[i])
                return false;
        }
        return true;
    }

    bool operator!=(const Type& other) const {
        return !(*this == other);
    }
};

inline Type con(std::string name, std::vector<Type> args = {}) {
    return Type(TypeKind::Constructor, std::move(name), std::move(args));
}
inline Type var(std::string name) {
    return Type(TypeKind::Var, std::move(name));
}
inline Type existential(std::string name) {
    return Type(TypeKind::Existential, std::move(name));
}
inline Type skolem(std::string name) {
    return Type(TypeKind::Skolem, std::move(name));
}

/// A class applied to argument types: the obligation `Show (Array a)`.
struct Constraint {
    std::string class_name;
    std::vector<Type> args;
    SourceLoc loc;

    bool operator==(const Constraint& other) const {
        return class_name == other.class_name && args == other.args;
    }
    bool operator!=(const Constraint& other) const {
        return !(*this == other);
    }
};

bool contains_existential(const Type& type);
bool contains_var(const Type& type);
bool contains_kind(const Type& type, TypeKind kind);

// Appends the names of pattern variables in first-occurrence order.
void collect_vars(const Type& type, std::vector<std::string>& out);

} // namespace tyclass

#endif // TYCLASS_TYPE_H
