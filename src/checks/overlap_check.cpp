#include "checks/overlap_check.h"

#include "types/substitution.h"

namespace tyclass::checks {

static std::vector<Type> renamed(const std::vector<Type>& head, const std::string& prefix) {
    std::vector<Type> result;
    result.reserve(head.size());
    for (const auto& t : head)
        result.push_back(rename_vars(t, prefix));
    return result;
}

static std::vector<Type> pick(const std::vector<Type>& types,
                         const std::vector<uint32_t>& indices) {
    std::vector<Type> result;
    for (uint32_t i : indices) {
        if (i < types.size())
            result.push_back(types[i]);
    }
    return result;
}

void OverlapCheckPass::run(const Program& program, std::vector<LoadError>& errors) {
    for (ClassId class_id = 0; class_id < program.classes().size(); ++class_id) {
        const auto& cls = program.class_info(class_id);
        auto ids = program.instances_of(class_id);
        for (size_t i = 0; i < ids.size(); ++i) {
            for (size_t j = i + 1; j < ids.size(); ++j) {
                const auto& first = program.instance(ids[i]);
                const auto& second = program.instance(ids[j]);
                if (first.chain == second.chain)
                    continue;
                check_pair(program, cls, first, second, errors);
            }
        }
    }
}

void OverlapCheckPass::check_pair(const Program& program, const ClassInfo& cls,
                                  const InstanceInfo& first, const InstanceInfo& second,
                                  std::vector<LoadError>& errors) {
    if (first.head.size() != cls.arity() || second.head.size() != cls.arity())
        return;

    // Variables of the two heads are unrelated.
    auto lhs = renamed(first.head, "1.");
    auto rhs = renamed(second.head, "2.");

    if (unify(lhs, rhs)) {
        errors.emplace_back(LoadErrorKind::OverlappingInstances, second.name,
                            "instance '" + second.name + "' in module '" +
                                program.module(second.module).name + "' overlaps instance '" +
                                first.name + "' in module '" + program.module(first.module).name +
                                "'; use an instance chain to order them",
                            second.loc);
        return;
    }

    for (const auto& dep : cls.fundeps) {
        auto determiners = unify(pick(lhs, dep.determiners), pick(rhs, dep.determiners));
        if (!determiners)
            continue;
        if (!unify(pick(lhs, dep.determined), pick(rhs, dep.determined), *determiners)) {
            errors.emplace_back(LoadErrorKind::FunctionalDependencyConflict, second.name,
                                "instances '" + first.name + "' and '" + second.name +
                                    "' of class '" + cls.name +
                                    "' disagree on a functionally determined parameter",
                                second.loc);
            return;
        }
    }
}

} // namespace tyclass::checks
