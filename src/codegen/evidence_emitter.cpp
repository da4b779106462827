#include "codegen/evidence_emitter.h"

#include <llvm-c/Analysis.h>
#include <llvm-c/Core.h>

#include <stdexcept>
#include <vector>

namespace tyclass::codegen {

EvidenceEmitter::EvidenceEmitter(const Program& program, EmitterOptions options)
    : program_(program) {
    context = LLVMContextCreate();
    builder = LLVMCreateBuilderInContext(context);
    llvm_module = LLVMModuleCreateWithNameInContext(options.module_name.c_str(), context);
}

EvidenceEmitter::~EvidenceEmitter() {
    if (builder)
        LLVMDisposeBuilder(builder);
    if (llvm_module)
        LLVMDisposeModule(llvm_module);
    if (context)
        LLVMContextDispose(context);
}

LLVMTypeRef EvidenceEmitter::dict_type() const {
    // Dictionaries are opaque to this layer.
    return LLVMPointerType(LLVMInt8TypeInContext(context), 0);
}

LLVMValueRef EvidenceEmitter::emit(const std::string& function_name,
                                   const solver::Evidence& evidence,
                                   std::size_t given_count) {
    std::vector<LLVMTypeRef> params(given_count, dict_type());
    LLVMTypeRef fn_type =
        LLVMFunctionType(dict_type(), params.data(), static_cast<unsigned>(params.size()), 0);
    LLVMValueRef function = LLVMAddFunction(llvm_module, function_name.c_str(), fn_type);

    for (unsigned i = 0; i < given_count; ++i) {
        std::string name = "given" + std::to_string(i);
        LLVMSetValueName2(LLVMGetParam(function, i), name.c_str(), name.size());
    }

    LLVMBasicBlockRef entry = LLVMAppendBasicBlockInContext(context, function, "entry");
    LLVMPositionBuilderAtEnd(builder, entry);
    LLVMBuildRet(builder, lower(evidence, function));
    return function;
}

LLVMValueRef EvidenceEmitter::lower(const solver::Evidence& evidence, LLVMValueRef function) {
    if (evidence.kind == solver::EvidenceKind::Given) {
        if (evidence.given_index >= LLVMCountParams(function))
            throw std::runtime_error("EvidenceEmitter: given #" +
                                     std::to_string(evidence.given_index) +
                                     " is not a parameter of the emitted function");

        LLVMValueRef dict = LLVMGetParam(function, static_cast<unsigned>(evidence.given_index));
        for (const auto& step : evidence.steps) {
            const auto& cls = program_.class_info(step.subclass);
            LLVMValueRef accessor = superclass_accessor(cls.name, step.index);
            LLVMTypeRef param = dict_type();
            LLVMTypeRef accessor_type = LLVMFunctionType(dict_type(), &param, 1, 0);
            dict = LLVMBuildCall2(builder, accessor_type, accessor, &dict, 1, "super");
        }
        return dict;
    }

    const auto& instance = program_.instance(evidence.instance);
    if (evidence.prerequisites.empty())
        return dictionary_global(instance.name);

    std::vector<LLVMValueRef> args;
    args.reserve(evidence.prerequisites.size());
    for (const auto& child : evidence.prerequisites)
        args.push_back(lower(child, function));

    auto arity = static_cast<unsigned>(args.size());
    LLVMValueRef constructor = dictionary_constructor(instance.name, arity);
    std::vector<LLVMTypeRef> params(arity, dict_type());
    LLVMTypeRef constructor_type = LLVMFunctionType(dict_type(), params.data(), arity, 0);
    return LLVMBuildCall2(builder, constructor_type, constructor, args.data(), arity, "dict");
}

LLVMValueRef EvidenceEmitter::dictionary_global(const std::string& name) {
    std::string symbol = "dict." + name;
    if (LLVMValueRef existing = LLVMGetNamedGlobal(llvm_module, symbol.c_str()))
        return existing;
    // Declared only; the instance's own module provides the definition.
    return LLVMAddGlobal(llvm_module, LLVMInt8TypeInContext(context), symbol.c_str());
}

LLVMValueRef EvidenceEmitter::dictionary_constructor(const std::string& name, unsigned arity) {
    std::string symbol = "dict." + name;
    if (LLVMValueRef existing = LLVMGetNamedFunction(llvm_module, symbol.c_str()))
        return existing;
    std::vector<LLVMTypeRef> params(arity, dict_type());
    LLVMTypeRef fn_type = LLVMFunctionType(dict_type(), params.data(), arity, 0);
    return LLVMAddFunction(llvm_module, symbol.c_str(), fn_type);
}

LLVMValueRef EvidenceEmitter::superclass_accessor(const std::string& class_name,
                                                  uint32_t index) {
    std::string symbol = "super." + class_name + "." + std::to_string(index);
    if (LLVMValueRef existing = LLVMGetNamedFunction(llvm_module, symbol.c_str()))
        return existing;
    LLVMTypeRef param = dict_type();
    LLVMTypeRef fn_type = LLVMFunctionType(dict_type(), &param, 1, 0);
    return LLVMAddFunction(llvm_module, symbol.c_str(), fn_type);
}

bool EvidenceEmitter::verify(std::string& error) const {
    char* message = nullptr;
    bool broken = LLVMVerifyModule(llvm_module, LLVMReturnStatusAction, &message) != 0;
    if (message) {
        if (broken)
            error = message;
        LLVMDisposeMessage(message);
    }
    return !broken;
}

std::string EvidenceEmitter::to_string() const {
    if (!llvm_module)
        return "";
    char* ir = LLVMPrintModuleToString(llvm_module);
    std::string result(ir);
    LLVMDisposeMessage(ir);
    return result;
}

} // namespace tyclass::codegen
