#include "call_graph.hpp"
#include "class_registry.hpp"
#include "field_propagator.hpp"
#include "property_access.hpp"
#include "support/ddd_fixtures.hpp"

#include <format>
#include <set>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace fieldlens::analyzer::test {

using fieldlens::test::kGoods;
using fieldlens::test::kGoodsRepository;
using fieldlens::test::kHandler;
using fieldlens::test::method;

namespace {

using Fields = std::set<std::string>;

struct ProgramGraph
{
    ClassRegistry registry;
    CallGraph graph;
};

ProgramGraph build_graph(const std::vector<stream::ClassUnit>& units)
{
    ProgramGraph program;
    const PropertyAccessClassifier classifier;
    diag::DiagnosticSink sink;
    for (const auto& unit : units) {
        ClassFacts facts{.name = unit.name, .is_interface = unit.is_interface, .methods = {}};
        for (const auto& body : unit.methods) {
            facts.methods.push_back(classifier.classify(unit.name, body, sink));
        }
        program.registry.add(std::move(facts));
    }
    program.registry.set_aggregate_roots({kGoods});

    CallGraphBuilder builder({RepositoryMapping{.aggregate_root_class = kGoods,
                                                .repository_class = kGoodsRepository,
                                                .match_kind = RepositoryMatchKind::kGenericInterface}});
    for (const auto& [_, facts] : program.registry.classes()) {
        builder.add_class(facts);
    }
    program.graph = std::move(builder).build();
    return program;
}

stream::Event goods_call(std::string name, std::string descriptor = "()V")
{
    return stream::call_event(kGoods, std::move(name), std::move(descriptor));
}

/// Handler.run loads Goods and calls each of `goods_methods` on it
stream::ClassUnit handler_calling(std::vector<stream::Event> goods_calls)
{
    std::vector<stream::Event> events = {
        stream::line_event(50),
        stream::call_event(kGoodsRepository, "findByIdOrErr", fieldlens::test::kFindByIdOrErr)};
    events.insert(events.end(), goods_calls.begin(), goods_calls.end());
    events.push_back(stream::line_event(55));

    stream::ClassUnit unit{.name = kHandler};
    unit.methods.push_back(method("run", "(J)V", std::move(events)));
    return unit;
}

/// Goods with a chain a -> b -> c -> d, each reading one field
stream::ClassUnit chained_goods()
{
    stream::ClassUnit unit{.name = kGoods};
    unit.methods.push_back(method("a", "()V", {stream::field_read(kGoods, "f1"), goods_call("b")}));
    unit.methods.push_back(method("b", "()V", {stream::field_read(kGoods, "f2"), goods_call("c")}));
    unit.methods.push_back(method("c", "()V", {stream::field_read(kGoods, "f3"), goods_call("d")}));
    unit.methods.push_back(method("d", "()V", {stream::field_read(kGoods, "f4")}));
    return unit;
}

/// Goods where validate and check call each other
stream::ClassUnit cyclic_goods()
{
    stream::ClassUnit unit{.name = kGoods};
    unit.methods.push_back(
        method("ship", "()V", {stream::field_write(kGoods, "shipped"), goods_call("validate")}));
    unit.methods.push_back(
        method("validate", "()V", {stream::field_read(kGoods, "status"), goods_call("check")}));
    unit.methods.push_back(
        method("check", "()V", {stream::field_read(kGoods, "items"), goods_call("validate")}));
    return unit;
}

FieldRequirement propagate_single(const ProgramGraph& program,
                                  FieldAccessConfig config,
                                  diag::DiagnosticSink& sink)
{
    const FieldRequirementPropagator propagator(program.graph, program.registry, config);
    EXPECT_EQ(program.graph.repository_call_sites().size(), 1U);
    return propagator.propagate(program.graph.repository_call_sites().at(0), sink);
}

}  // namespace

TEST(FieldPropagatorTest, MethodCalledAfterLoadContributesItsFields)
{
    const auto program = build_graph(fieldlens::test::goods_program());
    diag::DiagnosticSink sink;
    const auto requirement = propagate_single(program, FieldAccessConfig{}, sink);

    EXPECT_EQ(requirement.required_fields, (Fields{"name", "nowAddress1"}));
    ASSERT_EQ(requirement.called_methods.size(), 1U);
    EXPECT_EQ(requirement.called_methods[0].method.name, "changeAddress");
    EXPECT_EQ(requirement.called_methods[0].required_fields, (Fields{"name", "nowAddress1"}));
    EXPECT_FALSE(requirement.truncated);
    EXPECT_TRUE(sink.empty());
}

TEST(FieldPropagatorTest, CallerAccessorCallsCount)
{
    auto units = fieldlens::test::goods_program();
    units[2] = handler_calling({goods_call("getName", "()Ljava/lang/String;"),
                                goods_call("getPrice", "()J")});
    const auto program = build_graph(units);
    diag::DiagnosticSink sink;
    const auto requirement = propagate_single(program, FieldAccessConfig{}, sink);

    EXPECT_EQ(requirement.required_fields, (Fields{"name", "price"}));
    EXPECT_EQ(requirement.called_methods.size(), 2U);
}

TEST(FieldPropagatorTest, TransitiveCallsAreFollowed)
{
    const auto program = build_graph({chained_goods(), handler_calling({goods_call("a")})});
    diag::DiagnosticSink sink;
    const auto requirement = propagate_single(program, FieldAccessConfig{}, sink);

    EXPECT_EQ(requirement.required_fields, (Fields{"f1", "f2", "f3", "f4"}));
    EXPECT_FALSE(requirement.truncated);
}

TEST(FieldPropagatorTest, DepthBoundTruncatesAndReports)
{
    const auto program = build_graph({chained_goods(), handler_calling({goods_call("a")})});
    diag::DiagnosticSink sink;
    const auto requirement =
        propagate_single(program, FieldAccessConfig{.max_recursion_depth = 1}, sink);

    // a is depth 0, b depth 1; c would be depth 2.
    EXPECT_EQ(requirement.required_fields, (Fields{"f1", "f2"}));
    EXPECT_TRUE(requirement.truncated);
    ASSERT_EQ(sink.count(diag::DiagnosticKind::kPropagationDepthExceeded), 1U);
    EXPECT_EQ(sink.diagnostics()[0].class_name, kGoods);
    EXPECT_EQ(sink.diagnostics()[0].element, "a()V");
}

TEST(FieldPropagatorTest, ZeroDepthKeepsOnlyDirectlyCalledMethods)
{
    const auto program = build_graph({chained_goods(), handler_calling({goods_call("a")})});
    diag::DiagnosticSink sink;
    const auto requirement =
        propagate_single(program, FieldAccessConfig{.max_recursion_depth = 0}, sink);

    EXPECT_EQ(requirement.required_fields, (Fields{"f1"}));
    EXPECT_TRUE(requirement.truncated);
}

TEST(FieldPropagatorTest, CyclesAreCutAndReported)
{
    const auto program = build_graph({cyclic_goods(), handler_calling({goods_call("ship")})});
    diag::DiagnosticSink sink;
    const auto requirement = propagate_single(program, FieldAccessConfig{}, sink);

    EXPECT_EQ(requirement.required_fields, (Fields{"items", "shipped", "status"}));
    EXPECT_TRUE(requirement.truncated);
    EXPECT_EQ(sink.count(diag::DiagnosticKind::kPropagationCycleDetected), 1U);
    EXPECT_EQ(sink.count(diag::DiagnosticKind::kPropagationDepthExceeded), 0U);
}

TEST(FieldPropagatorTest, WithoutCycleDetectionDepthStillBoundsTheWalk)
{
    const auto program = build_graph({cyclic_goods(), handler_calling({goods_call("ship")})});
    diag::DiagnosticSink sink;
    const auto requirement = propagate_single(
        program, FieldAccessConfig{.max_recursion_depth = 4, .enable_cycle_detection = false}, sink);

    EXPECT_EQ(requirement.required_fields, (Fields{"items", "shipped", "status"}));
    EXPECT_TRUE(requirement.truncated);
    EXPECT_EQ(sink.count(diag::DiagnosticKind::kPropagationCycleDetected), 0U);
    EXPECT_EQ(sink.count(diag::DiagnosticKind::kPropagationDepthExceeded), 1U);
}

TEST(FieldPropagatorTest, SetterMethodsAreExcludedByDefault)
{
    stream::ClassUnit goods{.name = kGoods};
    goods.methods.push_back(
        method("setPrice", "(J)V", {stream::field_write(kGoods, "price"), goods_call("audit")}));
    goods.methods.push_back(method("audit", "()V", {stream::field_read(kGoods, "auditLog")}));
    goods.methods.push_back(
        method("getName", "()Ljava/lang/String;", {stream::field_read(kGoods, "name")}));
    const auto program = build_graph(
        {goods, handler_calling({goods_call("setPrice", "(J)V"),
                                 goods_call("getName", "()Ljava/lang/String;")})});

    diag::DiagnosticSink sink;
    const auto excluded = propagate_single(program, FieldAccessConfig{}, sink);
    EXPECT_EQ(excluded.required_fields, (Fields{"name"}));
    ASSERT_EQ(excluded.called_methods.size(), 1U);
    EXPECT_EQ(excluded.called_methods[0].method.name, "getName");

    const auto included =
        propagate_single(program, FieldAccessConfig{.exclude_setter_methods = false}, sink);
    EXPECT_EQ(included.required_fields, (Fields{"auditLog", "name", "price"}));
    EXPECT_EQ(included.called_methods.size(), 2U);
}

TEST(FieldPropagatorTest, FieldsOfSharedCalleeAreCountedOnce)
{
    stream::ClassUnit goods{.name = kGoods};
    goods.methods.push_back(
        method("top", "()V", {goods_call("left"), goods_call("right")}));
    goods.methods.push_back(method("left", "()V", {goods_call("shared")}));
    goods.methods.push_back(method("right", "()V", {goods_call("shared")}));
    goods.methods.push_back(method("shared", "()V", {stream::field_read(kGoods, "stock")}));
    const auto program = build_graph({goods, handler_calling({goods_call("top")})});

    diag::DiagnosticSink sink;
    const FieldRequirementPropagator propagator(program.graph, program.registry, FieldAccessConfig{});
    bool truncated = false;
    const auto fields = propagator.fields_of(
        MethodId{.owner_class = kGoods, .name = "top", .descriptor = "()V"}, kGoods, sink, truncated);
    EXPECT_EQ(fields, (Fields{"stock"}));
    // A diamond is not a cycle.
    EXPECT_FALSE(truncated);
    EXPECT_TRUE(sink.empty());
}

TEST(FieldPropagatorTest, ShorterPathRecoversBranchCutOnLongerPath)
{
    // a -> b -> x -> y is too deep for depth 2, but a -> x -> y is not.
    stream::ClassUnit goods{.name = kGoods};
    goods.methods.push_back(method("a", "()V", {goods_call("b"), goods_call("x")}));
    goods.methods.push_back(method("b", "()V", {goods_call("x")}));
    goods.methods.push_back(method("x", "()V", {goods_call("y")}));
    goods.methods.push_back(method("y", "()V", {stream::field_read(kGoods, "weight")}));
    const auto program = build_graph({goods, handler_calling({goods_call("a")})});

    diag::DiagnosticSink sink;
    const auto requirement =
        propagate_single(program, FieldAccessConfig{.max_recursion_depth = 2}, sink);

    EXPECT_EQ(requirement.required_fields, (Fields{"weight"}));
    EXPECT_FALSE(requirement.truncated);
    EXPECT_EQ(sink.count(diag::DiagnosticKind::kPropagationDepthExceeded), 0U);
}

TEST(FieldPropagatorTest, DenseCallGroupWithoutCycleDetectionStaysBounded)
{
    // Ten methods that all call each other; a naive walk would take 10^10 steps.
    stream::ClassUnit goods{.name = kGoods};
    for (int i = 0; i < 10; ++i) {
        std::vector<stream::Event> events{stream::field_read(kGoods, std::format("f{}", i))};
        for (int j = 0; j < 10; ++j) {
            events.push_back(goods_call(std::format("m{}", j)));
        }
        goods.methods.push_back(method(std::format("m{}", i), "()V", std::move(events)));
    }
    const auto program = build_graph({goods, handler_calling({goods_call("m0")})});

    diag::DiagnosticSink sink;
    const auto requirement = propagate_single(
        program, FieldAccessConfig{.max_recursion_depth = 10, .enable_cycle_detection = false},
        sink);

    EXPECT_EQ(requirement.required_fields.size(), 10U);
    EXPECT_TRUE(requirement.required_fields.contains("f9"));
    EXPECT_TRUE(requirement.truncated);
    EXPECT_EQ(sink.count(diag::DiagnosticKind::kPropagationCycleDetected), 0U);
}

TEST(FieldPropagatorTest, CallSiteWithoutAggregateCallsNeedsNoFields)
{
    const auto program = build_graph({chained_goods(), handler_calling({})});
    diag::DiagnosticSink sink;
    const auto requirement = propagate_single(program, FieldAccessConfig{}, sink);
    EXPECT_TRUE(requirement.required_fields.empty());
    EXPECT_TRUE(requirement.called_methods.empty());
}

}  // namespace fieldlens::analyzer::test
