#ifndef TYCLASS_PROGRAM_BUILDER_H
#define TYCLASS_PROGRAM_BUILDER_H

#include "diag/diagnostic.h"
#include "program/decls.h"
#include "program/program.h"

#include <iostream>
#include <ostream>
#include <string>
#include <vector>

namespace tyclass {

struct BuildOptions {
    // Where load-time diagnostics are printed. Null silences them; they
    // remain available through ProgramBuilder::diagnostics().
    std::ostream* diagnostics = &std::cerr;
};

/// Load phase of the engine. Collects the declaration records of every
/// module, then interns them into a Program and runs the load-time checks.
/// Resolution may only start on the Program that build() returns.
class ProgramBuilder {
  public:
    explicit ProgramBuilder(BuildOptions options = {}) : options_(options) {}

    void add_module(ModuleDecl module);

    /// Declare the built-in module `Prim` with its primitive types.
    void add_prim_module();

    /// Intern all modules and check them. Throws the first LoadError found;
    /// every error found is kept in diagnostics().
    Program build();

    const std::vector<LoadError>& diagnostics() const {
        return diagnostics_;
    }

  private:
    void declare_module(Program& program, const ModuleDecl& decl);
    void link_module(Program& program, ModuleId module_id, const ModuleDecl& decl);
    void link_chain(Program& program, ModuleId module_id, const ChainDecl& decl);
    void fail_if_errors();

    BuildOptions options_;
    std::vector<ModuleDecl> modules_;
    std::vector<LoadError> diagnostics_;
};

} // namespace tyclass

#endif // TYCLASS_PROGRAM_BUILDER_H
