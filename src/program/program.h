#ifndef TYCLASS_PROGRAM_H
#define TYCLASS_PROGRAM_H

#include "program/decls.h"
#include "types/type.h"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tyclass {

using ModuleId = uint32_t;
using TypeId = uint32_t;
using ClassId = uint32_t;
using InstanceId = uint32_t;
using ChainId = uint32_t;

struct TypeInfo {
    std::string name;
    ModuleId module = 0;
    uint32_t arity = 0;
    SourceLoc loc;
};

struct ClassInfo {
    std::string name;
    ModuleId module = 0;
    std::vector<std::string> params;
    std::vector<Constraint> superclasses;
    std::vector<FunctionalDependency> fundeps;
    std::vector<ChainId> chains; // in load order
    SourceLoc loc;

    uint32_t arity() const {
        return static_cast<uint32_t>(params.size());
    }
};

struct InstanceInfo {
    std::string name;
    ClassId class_id = 0;
    ModuleId module = 0;
    ChainId chain = 0;
    uint32_t chain_index = 0;
    std::vector<Type> head;
    std::vector<Constraint> constraints;
    InstanceOrigin origin = InstanceOrigin::Declared;
    SourceLoc loc;
};

struct ChainInfo {
    ClassId class_id = 0;
    ModuleId module = 0;
    std::vector<InstanceId> instances; // declaration order, never reordered
};

struct ModuleInfo {
    std::string name;
    std::vector<std::string> imports;
    std::vector<TypeId> types;
    std::vector<ClassId> classes;
    std::vector<ChainId> chains;
};

/// Immutable snapshot of every loaded module: the instance store.
/// Produced by ProgramBuilder::build() only after all load-time checks pass;
/// never mutated afterwards, so it may be shared between concurrent solvers.
class Program {
  public:
    const std::vector<ModuleInfo>& modules() const {
        return modules_;
    }
    const std::vector<TypeInfo>& types() const {
        return types_;
    }
    const std::vector<ClassInfo>& classes() const {
        return classes_;
    }
    const std::vector<InstanceInfo>& instances() const {
        return instances_;
    }
    const std::vector<ChainInfo>& chains() const {
        return chains_;
    }

    const ModuleInfo& module(ModuleId id) const {
        return modules_.at(id);
    }
    const TypeInfo& type_info(TypeId id) const {
        return types_.at(id);
    }
    const ClassInfo& class_info(ClassId id) const {
        return classes_.at(id);
    }
    const InstanceInfo& instance(InstanceId id) const {
        return instances_.at(id);
    }
    const ChainInfo& chain(ChainId id) const {
        return chains_.at(id);
    }

    std::optional<ModuleId> find_module(const std::string& name) const;
    std::optional<TypeId> find_type(const std::string& name) const;
    std::optional<ClassId> find_class(const std::string& name) const;
    std::optional<InstanceId> find_instance(const std::string& name) const;

    // Defining module of a constructor name, or nullopt for undeclared names.
    std::optional<ModuleId> defining_module_of_type(const std::string& name) const;

    // Every instance of the class, chain by chain in load order.
    std::vector<InstanceId> instances_of(ClassId id) const;

  private:
    friend class ProgramBuilder;

    std::vector<ModuleInfo> modules_;
    std::vector<TypeInfo> types_;
    std::vector<ClassInfo> classes_;
    std::vector<InstanceInfo> instances_;
    std::vector<ChainInfo> chains_;

    std::unordered_map<std::string, ModuleId> module_ids_;
    std::unordered_map<std::string, TypeId> type_ids_;
    std::unordered_map<std::string, ClassId> class_ids_;
    std::unordered_map<std::string, InstanceId> instance_ids_;
};

} // namespace tyclass

#endif // TYCLASS_PROGRAM_H
