#include "solver/superclass_graph.h"

#include "types/substitution.h"
#include "types/type_printer.h"

#include <deque>
#include <unordered_set>

namespace tyclass::solver {

SuperclassGraph::SuperclassGraph(const Program& program) : program_(program) {
    edges_.resize(program.classes().size());
    for (ClassId id = 0; id < program.classes().size(); ++id) {
        const auto& cls = program.class_info(id);
        for (uint32_t i = 0; i < cls.superclasses.size(); ++i) {
            const auto& super = cls.superclasses[i];
            auto super_id = program.find_class(super.class_name);
            if (!super_id)
                continue;
            edges_[id].push_back({id, i, *super_id, super.args});
        }
    }
}

std::set<ClassId> SuperclassGraph::superclasses_of(ClassId id) const {
    std::set<ClassId> seen;
    std::vector<ClassId> worklist{id};
    while (!worklist.empty()) {
        ClassId current = worklist.back();
        worklist.pop_back();
        for (const auto& edge : edges_from(current)) {
            if (seen.insert(edge.superclass).second)
                worklist.push_back(edge.superclass);
        }
    }
    return seen;
}

std::vector<ClassId> SuperclassGraph::classes_on_cycles() const {
    std::vector<ClassId> result;
    for (ClassId id = 0; id < edges_.size(); ++id) {
        if (superclasses_of(id).contains(id))
            result.push_back(id);
    }
    return result;
}

std::optional<DischargePath>
SuperclassGraph::find_discharge(const Constraint& target,
                                const std::vector<Constraint>& givens) const {
    auto target_id = program_.find_class(target.class_name);
    if (!target_id)
        return std::nullopt;

    struct Node {
        Constraint constraint;
        ClassId class_id;
        std::vector<SuperclassStep> steps;
    };

    for (std::size_t g = 0; g < givens.size(); ++g) {
        auto given_id = program_.find_class(givens[g].class_name);
        if (!given_id)
            continue;

        std::deque<Node> queue;
        std::unordered_set<std::string> visited;
        queue.push_back({givens[g], *given_id, {}});
        visited.insert(TypePrinter::constraint_to_string(givens[g]));

        while (!queue.empty()) {
            Node node = std::move(queue.front());
            queue.pop_front();

            if (node.class_id == *target_id && node.constraint.args == target.args)
                return DischargePath{g, std::move(node.steps)};

            const auto& cls = program_.class_info(node.class_id);
            if (node.constraint.args.size() != cls.arity())
                continue;
            Substitution params;
            for (uint32_t i = 0; i < cls.arity(); ++i)
                params[cls.params[i]] = node.constraint.args[i];

            for (const auto& edge : edges_from(node.class_id)) {
                // Only climb towards classes that can still reach the target.
                if (edge.superclass != *target_id &&
                    !superclasses_of(edge.superclass).contains(*target_id))
                    continue;

                Node next{{program_.class_info(edge.superclass).name,
                           apply_subst(params, edge.args), target.loc},
                          edge.superclass,
                          node.steps};
                next.steps.push_back({edge.subclass, edge.index});
                if (visited.insert(TypePrinter::constraint_to_string(next.constraint)).second)
                    queue.push_back(std::move(next));
            }
        }
    }
    return std::nullopt;
}

} // namespace tyclass::solver
