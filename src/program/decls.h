#ifndef TYCLASS_DECLS_H
#define TYCLASS_DECLS_H

#include "diag/diagnostic.h"
#include "types/type.h"

#include <cstdint>
#include <string>
#include <vector>

namespace tyclass {

// Declaration records produced by the declaration-collection pass of the
// front end. The builder consumes these; nothing here is resolved yet.

struct FunctionalDependency {
    std::vector<uint32_t> determiners; // parameter indices
    std::vector<uint32_t> determined;
};

struct TypeDecl {
    std::string name;
    uint32_t arity = 0;
    SourceLoc loc;
};

struct ClassDecl {
    std::string name;
    std::vector<std::string> params;
    // Written over `params` as pattern variables, e.g. Monad m => Applicative m.
    std::vector<Constraint> superclasses;
    std::vector<FunctionalDependency> fundeps;
    SourceLoc loc;
};

enum class InstanceOrigin {
    Declared,       // instance
    Derived,        // derive instance
    NewtypeDerived, // derive newtype instance
};

struct InstanceDecl {
    std::string name;
    std::string class_name;
    std::vector<Type> head;
    std::vector<Constraint> constraints; // prerequisites left of `=>`
    InstanceOrigin origin = InstanceOrigin::Declared;
    SourceLoc loc;
};

// `instance A ... else instance B ... else instance C ...`
// A bare `instance` is a chain of one.
using ChainDecl = std::vector<InstanceDecl>;

struct ModuleDecl {
    std::string name;
    std::vector<std::string> imports;
    std::vector<TypeDecl> types;
    std::vector<ClassDecl> classes;
    std::vector<ChainDecl> chains;
};

} // namespace tyclass

#endif // TYCLASS_DECLS_H
