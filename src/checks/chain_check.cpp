#include "checks/chain_check.h"

#include "types/type_printer.h"

#include <algorithm>

namespace tyclass::checks {

static LoadError invalid(const InstanceInfo& instance, const std::string& message) {
    return LoadError(LoadErrorKind::InvalidDeclaration, instance.name,
                     "instance '" + instance.name + "' " + message, instance.loc);
}

void ChainCheckPass::run(const Program& program, std::vector<LoadError>& errors) {
    for (ChainId id = 0; id < program.chains().size(); ++id)
        check_chain(program, id, errors);
}

void ChainCheckPass::check_chain(const Program& program, ChainId id,
                                 std::vector<LoadError>& errors) {
    const auto& chain = program.chain(id);
    const auto& cls = program.class_info(chain.class_id);

    if (chain.instances.empty()) {
        errors.emplace_back(LoadErrorKind::InvalidDeclaration, cls.name,
                            "empty instance chain for class '" + cls.name + "'");
        return;
    }

    for (InstanceId instance_id : chain.instances) {
        const auto& instance = program.instance(instance_id);
        if (instance.class_id != chain.class_id) {
            errors.push_back(invalid(instance, "is for class '" +
                                                   program.class_info(instance.class_id).name +
                                                   "' but its chain is for class '" + cls.name +
                                                   "'"));
            continue;
        }
        check_instance(program, instance, errors);
    }
}

void ChainCheckPass::check_instance(const Program& program, const InstanceInfo& instance,
                                    std::vector<LoadError>& errors) {
    const auto& cls = program.class_info(instance.class_id);
    if (instance.head.size() != cls.arity()) {
        errors.push_back(invalid(instance, "has " + std::to_string(instance.head.size()) +
                                               " head type(s) but class '" + cls.name +
                                               "' has " + std::to_string(cls.arity()) +
                                               " parameter(s)"));
        return;
    }

    for (const auto& type : instance.head)
        check_head_type(program, instance, type, errors);
    check_coverage(instance, cls, errors);

    for (const auto& prerequisite : instance.constraints) {
        auto id = program.find_class(prerequisite.class_name);
        if (!id) {
            errors.push_back(
                invalid(instance, "requires unknown class '" + prerequisite.class_name + "'"));
            continue;
        }
        if (prerequisite.args.size() != program.class_info(*id).arity()) {
            errors.push_back(invalid(instance, "requires '" +
                                                   TypePrinter::constraint_to_string(prerequisite) +
                                                   "' with the wrong number of arguments"));
        }
    }
}

// Every variable in a determined head type must be bound by the determining
// head types, otherwise improvement could not fill that position in.
void ChainCheckPass::check_coverage(const InstanceInfo& instance, const ClassInfo& cls,
                                    std::vector<LoadError>& errors) {
    for (size_t d = 0; d < cls.fundeps.size(); ++d) {
        const auto& dep = cls.fundeps[d];
        auto out_of_range = [&](uint32_t i) { return i >= cls.arity(); };
        // Reported by the class check.
        if (std::any_of(dep.determiners.begin(), dep.determiners.end(), out_of_range) ||
            std::any_of(dep.determined.begin(), dep.determined.end(), out_of_range))
            continue;

        std::vector<std::string> bound;
        for (uint32_t i : dep.determiners)
            collect_vars(instance.head[i], bound);

        for (uint32_t i : dep.determined) {
            std::vector<std::string> used;
            collect_vars(instance.head[i], used);
            auto unbound = std::find_if(used.begin(), used.end(), [&](const std::string& v) {
                return std::find(bound.begin(), bound.end(), v) == bound.end();
            });
            if (unbound == used.end())
                continue;
            errors.push_back(invalid(instance,
                                     "leaves '" + *unbound + "' in '" +
                                         TypePrinter::type_to_string(instance.head[i]) +
                                         "' undetermined by functional dependency #" +
                                         std::to_string(d + 1) + " of class '" + cls.name +
                                         "'"));
            break;
        }
    }
}

void ChainCheckPass::check_head_type(const Program& program, const InstanceInfo& instance,
                                     const Type& type, std::vector<LoadError>& errors) {
    switch (type.kind) {
    case TypeKind::Var:
        return;
    case TypeKind::Existential:
    case TypeKind::Skolem:
        errors.push_back(invalid(instance, "has a non-pattern variable '" +
                                               TypePrinter::type_to_string(type) +
                                               "' in its head"));
        return;
    case TypeKind::Constructor:
        break;
    }

    auto id = program.find_type(type.name);
    if (!id) {
        errors.push_back(invalid(instance, "mentions unknown type '" + type.name + "'"));
    } else if (type.args.size() > program.type_info(*id).arity) {
        errors.push_back(invalid(instance, "applies type '" + type.name + "' to too many arguments"));
    }
    for (const auto& arg : type.args)
        check_head_type(program, instance, arg, errors);
}

} // namespace tyclass::checks
