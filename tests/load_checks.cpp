#include "program/program_builder.h"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>

using namespace tyclass;

static InstanceDecl make_instance(std::string name, std::string cls, std::vector<Type> head,
                                  std::vector<Constraint> constraints = {}) {
    InstanceDecl decl;
    decl.name = std::move(name);
    decl.class_name = std::move(cls);
    decl.head = std::move(head);
    decl.constraints = std::move(constraints);
    return decl;
}

static ClassDecl make_class(std::string name, std::vector<std::string> params,
                            std::vector<Constraint> superclasses = {},
                            std::vector<FunctionalDependency> fundeps = {}) {
    return {std::move(name), std::move(params), std::move(superclasses), std::move(fundeps), {}};
}

static size_t count_kind(const std::vector<LoadError>& errors, LoadErrorKind kind) {
    size_t n = 0;
    for (const auto& e : errors) {
        if (e.kind() == kind)
            ++n;
    }
    return n;
}

// Builds a program of Prim plus one module "Main" filled in by `fill` and
// expects it to be rejected with `kind`. Returns every diagnostic reported.
static std::vector<LoadError> expect_rejected(const std::function<void(ModuleDecl&)>& fill,
                                              LoadErrorKind kind) {
    ProgramBuilder builder(BuildOptions{nullptr});
    builder.add_prim_module();
    ModuleDecl module;
    module.name = "Main";
    fill(module);
    builder.add_module(std::move(module));

    bool threw = false;
    try {
        builder.build();
    } catch (const LoadError& e) {
        threw = true;
        if (e.kind() != kind)
            std::cerr << "unexpected " << to_string(e.kind()) << ": " << e.what() << "\n";
        assert(e.kind() == kind);
    }
    assert(threw && "Program should have been rejected");
    return builder.diagnostics();
}

void test_superclass_cycle() {
    auto errors = expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("A", {"a"}, {{"B", {var("a")}, {}}}));
            m.classes.push_back(make_class("B", {"a"}, {{"A", {var("a")}, {}}}));
        },
        LoadErrorKind::SuperclassCycle);
    assert(count_kind(errors, LoadErrorKind::SuperclassCycle) == 2);

    errors = expect_rejected(
        [](ModuleDecl& m) { m.classes.push_back(make_class("C", {"a"}, {{"C", {var("a")}, {}}})); },
        LoadErrorKind::SuperclassCycle);
    assert(errors.size() == 1);
    assert(errors[0].subject() == "C");
    std::cout << "Superclass cycle: PASS\n";
}

void test_invalid_superclass() {
    expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("Ord", {"a"}, {{"Eq", {var("a")}, {}}}));
        },
        LoadErrorKind::InvalidDeclaration);

    expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("Eq", {"a"}));
            m.classes.push_back(make_class("Ord", {"a"}, {{"Eq", {var("b")}, {}}}));
        },
        LoadErrorKind::InvalidDeclaration);
    std::cout << "Invalid superclass: PASS\n";
}

void test_functional_dependency_errors() {
    expect_rejected(
        [](ModuleDecl& m) { m.classes.push_back(make_class("F", {"a", "b"}, {}, {{{0}, {0}}})); },
        LoadErrorKind::FunctionalDependencyCycle);
    expect_rejected(
        [](ModuleDecl& m) { m.classes.push_back(make_class("F", {"a", "b"}, {}, {{{0}, {5}}})); },
        LoadErrorKind::FunctionalDependencyCycle);
    std::cout << "Functional dependency errors: PASS\n";
}

void test_overlapping_chains() {
    auto errors = expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("Show", {"a"}));
            m.chains.push_back({make_instance("showInt", "Show", {con("Int")})});
            m.chains.push_back({make_instance("showAny", "Show", {var("a")})});
        },
        LoadErrorKind::OverlappingInstances);
    assert(errors.size() == 1);
    assert(errors[0].subject() == "showAny");

    // The same two instances ordered in one chain are fine.
    ProgramBuilder builder(BuildOptions{nullptr});
    builder.add_prim_module();
    ModuleDecl module;
    module.name = "Main";
    module.classes.push_back(make_class("Show", {"a"}));
    module.chains.push_back({make_instance("showInt", "Show", {con("Int")}),
                             make_instance("showAny", "Show", {var("a")})});
    builder.add_module(std::move(module));
    Program program = builder.build();
    assert(program.instances().size() == 2);
    std::cout << "Overlapping chains: PASS\n";
}

void test_functional_dependency_conflict() {
    // class Collection c e | c -> e
    // instance collectionInt :: Collection (Array a) Int
    // instance collectionString :: Collection (Array a) String
    auto errors = expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("Collection", {"c", "e"}, {}, {{{0}, {1}}}));
            m.chains.push_back({make_instance("collectionInt", "Collection",
                                              {con("Array", {var("a")}), con("Int")})});
            m.chains.push_back({make_instance("collectionString", "Collection",
                                              {con("Array", {var("a")}), con("String")})});
        },
        LoadErrorKind::FunctionalDependencyConflict);
    assert(errors.size() == 1);
    assert(errors[0].subject() == "collectionString");
    std::cout << "Functional dependency conflict: PASS\n";
}

void test_undetermined_dependency_output() {
    // class Elem c e | c -> e
    // instance elemInt :: Elem Int (Array b)
    auto errors = expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("Elem", {"c", "e"}, {}, {{{0}, {1}}}));
            m.chains.push_back(
                {make_instance("elemInt", "Elem", {con("Int"), con("Array", {var("b")})})});
        },
        LoadErrorKind::InvalidDeclaration);
    assert(errors.size() == 1);
    assert(errors[0].subject() == "elemInt");
    assert(std::string(errors[0].what()).find("leaves 'b' in 'Array b' undetermined") !=
           std::string::npos);

    // The output may reuse variables of the determining position.
    ProgramBuilder builder(BuildOptions{nullptr});
    builder.add_prim_module();
    ModuleDecl module;
    module.name = "Main";
    module.classes.push_back(make_class("Elem", {"c", "e"}, {}, {{{0}, {1}}}));
    module.chains.push_back(
        {make_instance("elemArray", "Elem", {con("Array", {var("b")}), var("b")})});
    builder.add_module(std::move(module));
    Program program = builder.build();
    assert(program.instances().size() == 1);
    std::cout << "Undetermined dependency output: PASS\n";
}

void test_malformed_instances() {
    auto show = [](ModuleDecl& m) { m.classes.push_back(make_class("Show", {"a"})); };

    // Wrong number of head types.
    expect_rejected(
        [&](ModuleDecl& m) {
            show(m);
            m.chains.push_back({make_instance("showPair", "Show", {con("Int"), con("Int")})});
        },
        LoadErrorKind::InvalidDeclaration);

    // An existential is not a pattern.
    expect_rejected(
        [&](ModuleDecl& m) {
            show(m);
            m.chains.push_back({make_instance("showSome", "Show", {existential("t")})});
        },
        LoadErrorKind::InvalidDeclaration);

    // Unknown type constructor.
    expect_rejected(
        [&](ModuleDecl& m) {
            show(m);
            m.chains.push_back({make_instance("showMissing", "Show", {con("Missing")})});
        },
        LoadErrorKind::InvalidDeclaration);

    // Prerequisite on an unknown class.
    expect_rejected(
        [&](ModuleDecl& m) {
            show(m);
            m.chains.push_back({make_instance("showArray", "Show", {con("Array", {var("a")})},
                                              {{"Display", {var("a")}, {}}})});
        },
        LoadErrorKind::InvalidDeclaration);

    // Instance for an unknown class.
    expect_rejected(
        [](ModuleDecl& m) {
            m.chains.push_back({make_instance("displayInt", "Display", {con("Int")})});
        },
        LoadErrorKind::InvalidDeclaration);
    std::cout << "Malformed instances: PASS\n";
}

void test_malformed_chains() {
    // A chain mixes classes.
    expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("Show", {"a"}));
            m.classes.push_back(make_class("Eq", {"a"}));
            m.chains.push_back({make_instance("showInt", "Show", {con("Int")}),
                                make_instance("eqInt", "Eq", {con("Int")})});
        },
        LoadErrorKind::InvalidDeclaration);

    // Empty chain.
    expect_rejected([](ModuleDecl& m) { m.chains.push_back({}); },
                    LoadErrorKind::InvalidDeclaration);

    // Duplicate instance names.
    auto errors = expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("Show", {"a"}));
            m.chains.push_back({make_instance("showInt", "Show", {con("Int")})});
            m.chains.push_back({make_instance("showInt", "Show", {con("String")})});
        },
        LoadErrorKind::InvalidDeclaration);
    assert(errors.size() == 1);
    std::cout << "Malformed chains: PASS\n";
}

void test_duplicate_declarations() {
    expect_rejected(
        [](ModuleDecl& m) {
            m.classes.push_back(make_class("Show", {"a"}));
            m.classes.push_back(make_class("Show", {"b"}));
        },
        LoadErrorKind::InvalidDeclaration);

    expect_rejected([](ModuleDecl& m) { m.types.push_back({"Int", 0, {}}); },
                    LoadErrorKind::InvalidDeclaration);

    expect_rejected([](ModuleDecl& m) { m.classes.push_back(make_class("Unit", {})); },
                    LoadErrorKind::InvalidDeclaration);

    ProgramBuilder builder(BuildOptions{nullptr});
    builder.add_prim_module();
    builder.add_prim_module();
    bool threw = false;
    try {
        builder.build();
    } catch (const LoadError& e) {
        threw = true;
        assert(e.kind() == LoadErrorKind::InvalidDeclaration);
        assert(e.subject() == "Prim");
    }
    assert(threw);
    std::cout << "Duplicate declarations: PASS\n";
}

void test_accepted_program_tables() {
    ProgramBuilder builder;
    builder.add_prim_module();

    ModuleDecl module;
    module.name = "Data.Show";
    module.classes.push_back(make_class("Show", {"a"}));
    module.classes.push_back(make_class("Pretty", {"a"}, {{"Show", {var("a")}, {}}}));
    module.chains.push_back({make_instance("showString", "Show", {con("String")}),
                             make_instance("showAny", "Show", {var("a")})});
    InstanceDecl derived = make_instance("prettyInt", "Pretty", {con("Int")});
    derived.origin = InstanceOrigin::Derived;
    module.chains.push_back({derived});
    builder.add_module(std::move(module));

    Program program = builder.build();
    assert(builder.diagnostics().empty());
    assert(program.modules().size() == 2);
    assert(program.find_module("Data.Show"));
    assert(!program.find_class("Eq"));

    auto show = *program.find_class("Show");
    auto ids = program.instances_of(show);
    assert(ids.size() == 2);
    assert(program.instance(ids[0]).name == "showString");
    assert(program.instance(ids[1]).chain_index == 1);

    const auto& pretty = program.instance(*program.find_instance("prettyInt"));
    assert(pretty.origin == InstanceOrigin::Derived);
    assert(program.class_info(pretty.class_id).name == "Pretty");

    auto prim = *program.find_module("Prim");
    assert(program.defining_module_of_type("Array") == prim);
    assert(!program.defining_module_of_type("Missing"));
    std::cout << "Accepted program tables: PASS\n";
}

int main() {
    test_superclass_cycle();
    test_invalid_superclass();
    test_functional_dependency_errors();
    test_overlapping_chains();
    test_functional_dependency_conflict();
    test_undetermined_dependency_output();
    test_malformed_instances();
    test_malformed_chains();
    test_duplicate_declarations();
    test_accepted_program_tables();
    return 0;
}
