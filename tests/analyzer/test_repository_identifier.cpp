#include "repository_identifier.hpp"
#include "support/ddd_fixtures.hpp"

#include <format>
#include <string>

#include <gtest/gtest.h>

namespace fieldlens::analyzer::test {

using fieldlens::test::kGoods;
using fieldlens::test::kOrder;

namespace {

constexpr const char* kGood = "com.example.domain.Good";

RepositoryIdentifier make_identifier(RepositoryConfig config = {})
{
    return RepositoryIdentifier(std::move(config), {kGood, kGoods, kOrder});
}

stream::ClassUnit repository(std::string name)
{
    stream::ClassUnit unit{.name = std::move(name)};
    unit.is_interface = true;
    return unit;
}

stream::ClassUnit with_marker(stream::ClassUnit unit, std::string_view aggregate_internal_name)
{
    unit.interfaces = {"org.morecup.pragmaddd.core.repository.DomainRepository"};
    unit.generic_signature = std::format(
        "Ljava/lang/Object;Lorg/morecup/pragmaddd/core/repository/DomainRepository<L{};>;",
        aggregate_internal_name);
    return unit;
}

}  // namespace

TEST(RepositoryIdentifierTest, GenericInterfaceMatch)
{
    diag::DiagnosticSink sink;
    auto mapping = make_identifier().identify(fieldlens::test::goods_repository_class(), sink);
    ASSERT_TRUE(mapping);
    EXPECT_EQ(mapping->aggregate_root_class, kGoods);
    EXPECT_EQ(mapping->repository_class, fieldlens::test::kGoodsRepository);
    EXPECT_EQ(mapping->match_kind, RepositoryMatchKind::kGenericInterface);
    // The naming rule agrees, so nothing to report.
    EXPECT_TRUE(sink.empty());
}

TEST(RepositoryIdentifierTest, GenericInterfaceWinsOverNamingConvention)
{
    auto unit = with_marker(repository("com.example.domain.GoodRepository"), "com/example/domain/Order");

    diag::DiagnosticSink sink;
    auto mapping = make_identifier().identify(unit, sink);
    ASSERT_TRUE(mapping);
    EXPECT_EQ(mapping->aggregate_root_class, kOrder);
    EXPECT_EQ(mapping->match_kind, RepositoryMatchKind::kGenericInterface);
    ASSERT_EQ(sink.count(diag::DiagnosticKind::kRepositoryAmbiguityWarning), 1U);
    EXPECT_EQ(sink.diagnostics()[0].severity, diag::Severity::kInfo);
    EXPECT_NE(sink.diagnostics()[0].message.find(kGood), std::string::npos);
}

TEST(RepositoryIdentifierTest, AnnotationMatchWithClassLiteral)
{
    auto unit = repository("com.example.infra.OrderStore");
    unit.annotations.push_back(stream::Annotation{
        .name = "org.morecup.pragmaddd.core.annotation.DomainRepository",
        .arguments = {{"targetType", "com.example.domain.Order::class"}}});

    diag::DiagnosticSink sink;
    auto mapping = make_identifier().identify(unit, sink);
    ASSERT_TRUE(mapping);
    EXPECT_EQ(mapping->aggregate_root_class, kOrder);
    EXPECT_EQ(mapping->match_kind, RepositoryMatchKind::kAnnotation);
}

TEST(RepositoryIdentifierTest, AnnotationWithSimpleTargetResolvesKnownRoot)
{
    auto unit = repository("com.example.infra.Warehouse");
    unit.annotations.push_back(
        stream::Annotation{.name = "DomainRepository", .arguments = {{"value", "Goods.class"}}});

    diag::DiagnosticSink sink;
    auto mapping = make_identifier().identify(unit, sink);
    ASSERT_TRUE(mapping);
    EXPECT_EQ(mapping->aggregate_root_class, kGoods);
}

TEST(RepositoryIdentifierTest, AnnotationWithoutTargetFallsThrough)
{
    auto unit = repository("com.example.infra.OrderRepository");
    unit.annotations.push_back(stream::Annotation{
        .name = "org.morecup.pragmaddd.core.annotation.DomainRepository", .arguments = {}});

    diag::DiagnosticSink sink;
    auto mapping = make_identifier().identify(unit, sink);
    ASSERT_TRUE(mapping);
    EXPECT_EQ(mapping->aggregate_root_class, kOrder);
    EXPECT_EQ(mapping->match_kind, RepositoryMatchKind::kNamingConvention);
}

TEST(RepositoryIdentifierTest, NamingRulesAndPackagePreference)
{
    RepositoryIdentifier identifier(RepositoryConfig{},
                                    {"com.example.billing.Order", "com.example.domain.Order"});
    diag::DiagnosticSink sink;

    auto same_package = identifier.identify(repository("com.example.domain.IOrderRepository"), sink);
    ASSERT_TRUE(same_package);
    EXPECT_EQ(same_package->aggregate_root_class, "com.example.domain.Order");

    auto other_package = identifier.identify(repository("com.example.infra.OrderRepo"), sink);
    ASSERT_TRUE(other_package);
    EXPECT_EQ(other_package->aggregate_root_class, "com.example.billing.Order");

    EXPECT_FALSE(identifier.identify(repository("com.example.domain.OrderService"), sink));
}

TEST(RepositoryIdentifierTest, UnknownAggregateIsNotNamedRepository)
{
    diag::DiagnosticSink sink;
    EXPECT_FALSE(make_identifier().identify(repository("com.example.domain.CustomerRepository"), sink));
}

TEST(RepositoryIdentifierTest, PackageFiltersAndGeneratedProxies)
{
    RepositoryConfig config;
    config.include_packages = {"com.example.**"};
    config.exclude_packages = {"**.fake.**"};
    auto identifier = make_identifier(config);
    diag::DiagnosticSink sink;

    EXPECT_TRUE(identifier.identify(repository("com.example.domain.OrderRepository"), sink));
    EXPECT_FALSE(identifier.identify(repository("com.example.fake.OrderRepository"), sink));
    EXPECT_FALSE(identifier.identify(repository("org.other.OrderRepository"), sink));
    EXPECT_FALSE(identifier.identify(
        repository("com.example.domain.OrderRepository$$EnhancerBySpringCGLIB$$1"), sink));
}

TEST(RepositoryIdentifierTest, TestPackagesAreExcludedByDefault)
{
    auto identifier = make_identifier();
    diag::DiagnosticSink sink;

    EXPECT_FALSE(identifier.identify(repository("com.example.test.OrderRepository"), sink));
    EXPECT_FALSE(identifier.identify(repository("com.example.tests.support.OrderRepository"), sink));
    EXPECT_TRUE(identifier.identify(repository("com.example.testing.OrderRepository"), sink));
}

TEST(RepositoryIdentifierTest, GenericTypeArgumentForms)
{
    auto identifier = make_identifier();
    EXPECT_EQ(identifier.generic_type_argument(
                  "Lorg/morecup/pragmaddd/core/repository/DomainRepository<Lcom/example/domain/Order;>;"),
              kOrder);
    EXPECT_EQ(identifier.generic_type_argument("DomainRepository<com.example.domain.Order>"), kOrder);
    EXPECT_EQ(identifier.generic_type_argument(
                  "Lcom/x/DomainRepository<Lcom/x/Box<Lcom/example/domain/Order;>;>;"),
              "com.x.Box");
    EXPECT_FALSE(identifier.generic_type_argument("DomainRepository<TT;>"));
    EXPECT_FALSE(identifier.generic_type_argument("DomainRepository<*>"));
    EXPECT_FALSE(identifier.generic_type_argument("DomainRepository<Lcom/a/A;Lcom/b/B;>"));
    EXPECT_FALSE(identifier.generic_type_argument("Lcom/x/MyDomainRepository<Lcom/a/A;>;"));
    EXPECT_FALSE(identifier.generic_type_argument("Ljava/util/List<Lcom/a/A;>;"));
}

TEST(RepositoryIdentifierTest, HasAnnotationMatchesQualifiedOrSimpleName)
{
    const auto goods = fieldlens::test::goods_class();
    EXPECT_TRUE(has_annotation(goods, "org.morecup.pragmaddd.core.annotation.AggregateRoot"));
    EXPECT_TRUE(has_annotation(goods, "AggregateRoot"));
    EXPECT_FALSE(has_annotation(goods, "org.morecup.pragmaddd.core.annotation.DomainEntity"));
}

}  // namespace fieldlens::analyzer::test
