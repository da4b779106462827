#include "checks/orphan_check.h"

#include "types/type_printer.h"

#include <algorithm>

namespace tyclass::checks {

void OrphanCheckPass::run(const Program& program, std::vector<LoadError>& errors) {
    for (const auto& instance : program.instances()) {
        if (auto reason = check_instance(program, instance))
            errors.emplace_back(LoadErrorKind::OrphanInstance, instance.name, *reason,
                                instance.loc);
    }
}

std::optional<std::string> OrphanCheckPass::check_instance(const Program& program,
                                                           const InstanceInfo& instance) {
    const auto& cls = program.class_info(instance.class_id);
    if (instance.module == cls.module)
        return std::nullopt;

    // Single-parameter classes only look at the one head type; for
    // multi-parameter classes any top-level head type will do.
    size_t candidates = cls.arity() == 1 ? std::min<size_t>(1, instance.head.size())
                                         : instance.head.size();
    for (size_t i = 0; i < candidates; ++i) {
        const Type& type = instance.head[i];
        if (!type.is_constructor())
            continue;
        auto owner = program.defining_module_of_type(type.name);
        if (owner && *owner == instance.module)
            return std::nullopt;
    }

    Constraint head{cls.name, instance.head, instance.loc};
    return "orphan instance '" + instance.name + "' for '" +
           TypePrinter::constraint_to_string(head) + "' in module '" +
           program.module(instance.module).name + "': it must be declared in the module of the class or of one of its types";
}

} // namespace tyclass::checks
