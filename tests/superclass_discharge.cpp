#include "program/program_builder.h"
#include "solver/constraint_solver.h"
#include "solver/superclass_graph.h"
#include "types/type_printer.h"

#include <cassert>
#include <iostream>
#include <set>

using namespace tyclass;
using namespace tyclass::solver;

static InstanceDecl make_instance(std::string name, std::string cls, std::vector<Type> head,
                                  std::vector<Constraint> constraints = {}) {
    InstanceDecl decl;
    decl.name = std::move(name);
    decl.class_name = std::move(cls);
    decl.head = std::move(head);
    decl.constraints = std::move(constraints);
    return decl;
}

static Constraint over(const std::string& cls, const std::string& param) {
    return {cls, {var(param)}, {}};
}

// Functor <= Apply <= Applicative <= Monad => MonadFail
//            Apply <= Bind <= Monad
static Program build_program() {
    ProgramBuilder builder;
    builder.add_prim_module();

    ModuleDecl monad;
    monad.name = "Control.Monad";
    monad.classes.push_back({"Functor", {"f"}, {}, {}, {}});
    monad.classes.push_back({"Apply", {"f"}, {over("Functor", "f")}, {}, {}});
    monad.classes.push_back({"Applicative", {"f"}, {over("Apply", "f")}, {}, {}});
    monad.classes.push_back({"Bind", {"m"}, {over("Apply", "m")}, {}, {}});
    monad.classes.push_back(
        {"Monad", {"m"}, {over("Applicative", "m"), over("Bind", "m")}, {}, {}});
    monad.classes.push_back({"MonadFail", {"m"}, {over("Monad", "m")}, {}, {}});
    monad.chains.push_back({make_instance("applicativeArray", "Applicative", {con("Array")})});
    builder.add_module(std::move(monad));

    ModuleDecl show;
    show.name = "Data.Show";
    show.classes.push_back({"Show", {"a"}, {}, {}, {}});
    show.chains.push_back({make_instance("showInt", "Show", {con("Int")})});
    show.chains.push_back({make_instance("showArray", "Show", {con("Array", {var("a")})},
                                         {{"Show", {var("a")}, {}}})});
    builder.add_module(std::move(show));

    return builder.build();
}

static std::string class_name(const Program& program, ClassId id) {
    return program.class_info(id).name;
}

void test_superclass_closure() {
    Program program = build_program();
    SuperclassGraph graph(program);

    std::set<std::string> names;
    for (ClassId id : graph.superclasses_of(*program.find_class("MonadFail")))
        names.insert(class_name(program, id));
    assert((names == std::set<std::string>{"Monad", "Applicative", "Bind", "Apply", "Functor"}));

    assert(graph.superclasses_of(*program.find_class("Functor")).empty());
    assert(graph.classes_on_cycles().empty());
    assert(graph.edges_from(*program.find_class("Monad")).size() == 2);
    std::cout << "Superclass closure: PASS\n";
}

void test_discharge_through_superclasses() {
    Program program = build_program();
    ConstraintSolver solver(program);

    std::vector<Constraint> givens = {{"MonadFail", {skolem("m")}, {}}};
    Evidence evidence = solver.solve({"Applicative", {skolem("m")}, {}}, givens);

    assert(evidence.kind == EvidenceKind::Given);
    assert(evidence.given_index == 0);
    assert(evidence.steps.size() == 2);
    assert(class_name(program, evidence.steps[0].subclass) == "MonadFail");
    assert(evidence.steps[0].index == 0);
    assert(class_name(program, evidence.steps[1].subclass) == "Monad");
    assert(evidence.steps[1].index == 0);

    const auto& graph = solver.superclass_graph();
    assert(graph.superclasses_of(*program.find_class("MonadFail"))
               .contains(*program.find_class("Applicative")));
    std::cout << "Discharge through superclasses: PASS\n";
}

void test_shortest_path_is_taken() {
    Program program = build_program();
    SuperclassGraph graph(program);

    auto path = graph.find_discharge({"Functor", {skolem("m")}, {}},
                                     {{"MonadFail", {skolem("m")}, {}}});
    assert(path);
    assert(path->steps.size() == 4);
    assert(class_name(program, path->steps[1].subclass) == "Monad");
    assert(path->steps[1].index == 0 && "Applicative is listed before Bind");

    // The given itself, with no projection.
    path = graph.find_discharge({"Monad", {skolem("m")}, {}},
                                {{"Show", {con("Int")}, {}}, {"Monad", {skolem("m")}, {}}});
    assert(path && path->given_index == 1 && path->steps.empty());
    std::cout << "Shortest path is taken: PASS\n";
}

void test_own_instances_come_first() {
    Program program = build_program();
    ConstraintSolver solver(program);

    std::vector<Constraint> givens = {{"MonadFail", {con("Array")}, {}}};
    Evidence evidence = solver.solve({"Applicative", {con("Array")}, {}}, givens);
    assert(evidence.kind == EvidenceKind::Instance);
    assert(program.instance(evidence.instance).name == "applicativeArray");
    std::cout << "Own instances come first: PASS\n";
}

void test_ambiguity_is_not_discharged() {
    Program program = build_program();
    ConstraintSolver solver(program);

    // applicativeArray might apply once ?m is known, so the givens are not consulted.
    std::vector<Constraint> givens = {{"Monad", {existential("m")}, {}}};
    bool threw = false;
    try {
        solver.solve({"Applicative", {existential("m")}, {}}, givens);
    } catch (const ResolutionError& e) {
        threw = true;
        assert(e.kind() == ResolutionErrorKind::AmbiguousInstance);
        assert(e.blocking_instance() == "applicativeArray");
    }
    assert(threw);

    // Bind has no instances at all, so the same given discharges it.
    Evidence evidence = solver.solve({"Bind", {existential("m")}, {}}, givens);
    assert(evidence.kind == EvidenceKind::Given);
    assert(evidence.steps.size() == 1);
    assert(evidence.steps[0].index == 1);
    std::cout << "Ambiguity is not discharged: PASS\n";
}

void test_discharge_requires_exact_arguments() {
    Program program = build_program();
    ConstraintSolver solver(program);

    auto expect_no_instance = [&](const Constraint& goal, const std::vector<Constraint>& givens) {
        bool threw = false;
        try {
            solver.solve(goal, givens);
        } catch (const ResolutionError& e) {
            threw = true;
            assert(e.kind() == ResolutionErrorKind::NoInstanceFound);
        }
        assert(threw);
    };

    expect_no_instance({"Applicative", {skolem("m")}, {}}, {});
    expect_no_instance({"Applicative", {skolem("m")}, {}}, {{"Monad", {skolem("n")}, {}}});
    // Superclasses run upwards only.
    expect_no_instance({"MonadFail", {skolem("m")}, {}}, {{"Monad", {skolem("m")}, {}}});
    std::cout << "Discharge requires exact arguments: PASS\n";
}

void test_prerequisite_discharged_by_given() {
    Program program = build_program();
    ConstraintSolver solver(program);

    std::vector<Constraint> givens = {{"Show", {skolem("a")}, {}}};
    Evidence evidence = solver.solve({"Show", {con("Array", {skolem("a")})}, {}}, givens);

    assert(evidence.kind == EvidenceKind::Instance);
    assert(program.instance(evidence.instance).name == "showArray");
    assert(evidence.prerequisites.size() == 1);
    const Evidence& inner = evidence.prerequisites[0];
    assert(inner.kind == EvidenceKind::Given);
    assert(inner.given_index == 0 && inner.steps.empty());
    assert(TypePrinter::constraint_to_string(inner.constraint) == "Show a'");
    std::cout << "Prerequisite discharged by given: PASS\n";
}

int main() {
    test_superclass_closure();
    test_discharge_through_superclasses();
    test_shortest_path_is_taken();
    test_own_instances_come_first();
    test_ambiguity_is_not_discharged();
    test_discharge_requires_exact_arguments();
    test_prerequisite_discharged_by_given();
    return 0;
}
