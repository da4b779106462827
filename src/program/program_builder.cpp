#include "program/program_builder.h"

#include "checks/chain_check.h"
#include "checks/check_pass.h"
#include "checks/class_check.h"
#include "checks/orphan_check.h"
#include "checks/overlap_check.h"

#include <memory>
#include <optional>

namespace tyclass {

void ProgramBuilder::add_module(ModuleDecl module) {
    modules_.push_back(std::move(module));
}

void ProgramBuilder::add_prim_module() {
    ModuleDecl prim;
    prim.name = "Prim";
    for (const char* name : {"Int", "Number", "String", "Char", "Boolean"})
        prim.types.push_back({name, 0, {}});
    prim.types.push_back({"Array", 1, {}});
    prim.types.push_back({"Record", 1, {}});
    prim.types.push_back({"Function", 2, {}});
    add_module(std::move(prim));
}

Program ProgramBuilder::build() {
    Program program;
    diagnostics_.clear();

    // First declare every name so that links may point forwards or across modules.
    std::vector<std::optional<ModuleId>> ids;
    ids.reserve(modules_.size());
    for (const auto& decl : modules_) {
        if (program.module_ids_.contains(decl.name)) {
            diagnostics_.emplace_back(LoadErrorKind::InvalidDeclaration, decl.name,
                                      "duplicate module '" + decl.name + "'");
            ids.push_back(std::nullopt);
            continue;
        }
        ids.push_back(static_cast<ModuleId>(program.modules_.size()));
        declare_module(program, decl);
    }

    for (size_t i = 0; i < modules_.size(); ++i) {
        if (ids[i])
            link_module(program, *ids[i], modules_[i]);
    }
    fail_if_errors();

    std::vector<std::unique_ptr<checks::CheckPass>> passes;
    passes.push_back(std::make_unique<checks::ChainCheckPass>());
    passes.push_back(std::make_unique<checks::ClassCheckPass>());
    passes.push_back(std::make_unique<checks::OrphanCheckPass>());
    passes.push_back(std::make_unique<checks::OverlapCheckPass>());
    if (checks::run_checks(program, passes, diagnostics_, options_.diagnostics) != 0)
        fail_if_errors();

    return program;
}

void ProgramBuilder::declare_module(Program& program, const ModuleDecl& decl) {
    auto module_id = static_cast<ModuleId>(program.modules_.size());
    program.module_ids_[decl.name] = module_id;
    ModuleInfo module{decl.name, decl.imports, {}, {}, {}};

    for (const auto& type : decl.types) {
        if (program.type_ids_.contains(type.name)) {
            diagnostics_.emplace_back(LoadErrorKind::InvalidDeclaration, type.name,
                                      "duplicate type '" + type.name + "' in module '" +
                                          decl.name + "'",
                                      type.loc);
            continue;
        }
        auto id = static_cast<TypeId>(program.types_.size());
        program.type_ids_[type.name] = id;
        program.types_.push_back({type.name, module_id, type.arity, type.loc});
        module.types.push_back(id);
    }

    for (const auto& cls : decl.classes) {
        if (program.class_ids_.contains(cls.name)) {
            diagnostics_.emplace_back(LoadErrorKind::InvalidDeclaration, cls.name,
                                      "duplicate class '" + cls.name + "' in module '" +
                                          decl.name + "'",
                                      cls.loc);
            continue;
        }
        if (cls.params.empty()) {
            diagnostics_.emplace_back(LoadErrorKind::InvalidDeclaration, cls.name,
                                      "class '" + cls.name + "' has no parameters", cls.loc);
            continue;
        }
        auto id = static_cast<ClassId>(program.classes_.size());
        program.class_ids_[cls.name] = id;

        ClassInfo info;
        info.name = cls.name;
        info.module = module_id;
        info.params = cls.params;
        info.superclasses = cls.superclasses;
        info.fundeps = cls.fundeps;
        info.loc = cls.loc;
        program.classes_.push_back(std::move(info));
        module.classes.push_back(id);
    }

    program.modules_.push_back(std::move(module));
}

void ProgramBuilder::link_module(Program& program, ModuleId module_id, const ModuleDecl& decl) {
    for (const auto& chain : decl.chains)
        link_chain(program, module_id, chain);
}

void ProgramBuilder::link_chain(Program& program, ModuleId module_id, const ChainDecl& decl) {
    const std::string& module_name = program.modules_[module_id].name;
    if (decl.empty()) {
        diagnostics_.emplace_back(LoadErrorKind::InvalidDeclaration, module_name,
                                  "empty instance chain in module '" + module_name + "'");
        return;
    }

    // A chain belongs to the class of its first entry; the chain check
    // reports later entries that name another class.
    auto class_id = program.find_class(decl.front().class_name);
    if (!class_id) {
        diagnostics_.emplace_back(LoadErrorKind::InvalidDeclaration, decl.front().name,
                                  "instance '" + decl.front().name + "' is for unknown class '" +
                                      decl.front().class_name + "'",
                                  decl.front().loc);
        return;
    }

    auto chain_id = static_cast<ChainId>(program.chains_.size());
    ChainInfo chain{*class_id, module_id, {}};

    for (const auto& inst : decl) {
        if (program.instance_ids_.contains(inst.name)) {
            diagnostics_.emplace_back(LoadErrorKind::InvalidDeclaration, inst.name,
                                      "duplicate instance '" + inst.name + "'", inst.loc);
            continue;
        }
        auto inst_class = program.find_class(inst.class_name);
        if (!inst_class) {
            diagnostics_.emplace_back(LoadErrorKind::InvalidDeclaration, inst.name,
                                      "instance '" + inst.name + "' is for unknown class '" +
                                          inst.class_name + "'",
                                      inst.loc);
            continue;
        }

        auto id = static_cast<InstanceId>(program.instances_.size());
        program.instance_ids_[inst.name] = id;

        InstanceInfo info;
        info.name = inst.name;
        info.class_id = *inst_class;
        info.module = module_id;
        info.chain = chain_id;
        info.chain_index = static_cast<uint32_t>(chain.instances.size());
        info.head = inst.head;
        info.constraints = inst.constraints;
        info.origin = inst.origin;
        info.loc = inst.loc;
        program.instances_.push_back(std::move(info));
        chain.instances.push_back(id);
    }

    program.chains_.push_back(std::move(chain));
    program.classes_[*class_id].chains.push_back(chain_id);
    program.modules_[module_id].chains.push_back(chain_id);
}

void ProgramBuilder::fail_if_errors() {
    if (diagnostics_.empty())
        return;

    if (options_.diagnostics) {
        *options_.diagnostics << "Program check errors:\n";
        for (const auto& err : diagnostics_)
            *options_.diagnostics << "  " << err.what() << "\n";
    }
    throw diagnostics_.front();
}

} // namespace tyclass
