#ifndef TYCLASS_EVIDENCE_EMITTER_H
#define TYCLASS_EVIDENCE_EMITTER_H

#include "program/program.h"
#include "solver/evidence.h"

#include <llvm-c/Core.h>

#include <cstddef>
#include <cstdint>
#include <string>

namespace tyclass::codegen {

struct EmitterOptions {
    std::string module_name = "evidence";
};

/// Lowers evidence trees to LLVM IR in evidence-passing style.
///
/// Each emitted function takes the dictionaries of the givens as pointer
/// parameters and returns the dictionary for the solved constraint:
///   - an instance without prerequisites is the external global @dict.<name>
///   - an instance with prerequisites is built by calling @dict.<name> with
///     the dictionaries of its prerequisites
///   - a given is its parameter, projected through @super.<Class>.<index>
///     once per superclass step
class EvidenceEmitter {
  public:
    explicit EvidenceEmitter(const Program& program, EmitterOptions options = {});
    ~EvidenceEmitter();

    EvidenceEmitter(const EvidenceEmitter&) = delete;
    EvidenceEmitter& operator=(const EvidenceEmitter&) = delete;

    LLVMValueRef emit(const std::string& function_name, const solver::Evidence& evidence,
                      std::size_t given_count);

    /// Runs the LLVM verifier; on failure `error` receives its report.
    bool verify(std::string& error) const;

    std::string to_string() const;

  private:
    LLVMValueRef lower(const solver::Evidence& evidence, LLVMValueRef function);
    LLVMValueRef dictionary_global(const std::string& name);
    LLVMValueRef dictionary_constructor(const std::string& name, unsigned arity);
    LLVMValueRef superclass_accessor(const std::string& class_name, uint32_t index);
    LLVMTypeRef dict_type() const;

    const Program& program_;
    LLVMContextRef context;
    LLVMModuleRef llvm_module;
    LLVMBuilderRef builder;
};

} // namespace tyclass::codegen

#endif // TYCLASS_EVIDENCE_EMITTER_H
