#include "checks/class_check.h"

#include "solver/fundeps.h"
#include "solver/superclass_graph.h"

#include <algorithm>

namespace tyclass::checks {

void ClassCheckPass::run(const Program& program, std::vector<LoadError>& errors) {
    for (const auto& cls : program.classes()) {
        check_superclasses(program, cls, errors);
        for (const auto& message : solver::FunDepPropagator::validate(cls)) {
            errors.emplace_back(LoadErrorKind::FunctionalDependencyCycle, cls.name, message,
                                cls.loc);
        }
    }

    solver::SuperclassGraph graph(program);
    for (ClassId id : graph.classes_on_cycles()) {
        const auto& cls = program.class_info(id);
        errors.emplace_back(LoadErrorKind::SuperclassCycle, cls.name,
                            "class '" + cls.name + "' is its own superclass", cls.loc);
    }
}

void ClassCheckPass::check_superclasses(const Program& program, const ClassInfo& cls,
                                        std::vector<LoadError>& errors) {
    for (const auto& super : cls.superclasses) {
        auto id = program.find_class(super.class_name);
        if (!id) {
            errors.emplace_back(LoadErrorKind::InvalidDeclaration, cls.name,
                                "class '" + cls.name + "' has unknown superclass '" +
                                    super.class_name + "'",
                                cls.loc);
            continue;
        }
        if (super.args.size() != program.class_info(*id).arity()) {
            errors.emplace_back(LoadErrorKind::InvalidDeclaration, cls.name,
                                "superclass '" + super.class_name + "' of class '" + cls.name +
                                    "' has the wrong number of arguments",
                                cls.loc);
            continue;
        }

        std::vector<std::string> vars;
        for (const auto& arg : super.args)
            collect_vars(arg, vars);
        for (const auto& v : vars) {
            if (std::find(cls.params.begin(), cls.params.end(), v) == cls.params.end()) {
                errors.emplace_back(LoadErrorKind::InvalidDeclaration, cls.name,
                                    "superclass '" + super.class_name + "' of class '" +
                                        cls.name + "' mentions '" + v +
                                        "', which is not a parameter of the class",
                                    cls.loc);
            }
        }
    }
}

} // namespace tyclass::checks
