#include "fieldlens/common.hpp"

#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace fieldlens::common::test {

TEST(QualifiedNameTest, ConvertsInternalAndDescriptorForms)
{
    EXPECT_EQ(to_qualified_name("com/example/Order"), "com.example.Order");
    EXPECT_EQ(to_qualified_name("Lcom/example/Order;"), "com.example.Order");
    EXPECT_EQ(to_qualified_name("com.example.Order"), "com.example.Order");
}

TEST(QualifiedNameTest, RejectsMalformedNames)
{
    EXPECT_TRUE(is_valid_qualified_name("com.example.Order$Line"));
    EXPECT_FALSE(is_valid_qualified_name(""));
    EXPECT_FALSE(is_valid_qualified_name(".Order"));
    EXPECT_FALSE(is_valid_qualified_name("com..Order"));
    EXPECT_FALSE(is_valid_qualified_name("com.example.Order "));
    EXPECT_FALSE(is_valid_qualified_name("com.example.Order."));
}

TEST(QualifiedNameTest, SplitsSimpleAndPackageNames)
{
    EXPECT_EQ(simple_name("com.example.Order"), "Order");
    EXPECT_EQ(simple_name("Order"), "Order");
    EXPECT_EQ(package_name("com.example.Order"), "com.example");
    EXPECT_EQ(package_name("Order"), "");
}

TEST(QualifiedNameTest, NamesMatchBySimpleName)
{
    EXPECT_TRUE(names_match("org.morecup.pragmaddd.core.annotation.AggregateRoot",
                            "org.morecup.pragmaddd.core.annotation.AggregateRoot"));
    EXPECT_TRUE(names_match("com.other.AggregateRoot", "AggregateRoot"));
    EXPECT_TRUE(names_match("AggregateRoot", "org.morecup.pragmaddd.core.annotation.AggregateRoot"));
    EXPECT_FALSE(names_match("com.example.Entity", "AggregateRoot"));
}

TEST(PropertyNameTest, ValidatesIdentifiers)
{
    EXPECT_TRUE(is_valid_property_name("status"));
    EXPECT_TRUE(is_valid_property_name("_id"));
    EXPECT_TRUE(is_valid_property_name("address1"));
    EXPECT_FALSE(is_valid_property_name(""));
    EXPECT_FALSE(is_valid_property_name("1address"));
    EXPECT_FALSE(is_valid_property_name("now-address"));
}

TEST(PackagePatternTest, SupportsAllPatternForms)
{
    EXPECT_TRUE(matches_package_pattern("com.example.Order", "**"));
    EXPECT_TRUE(matches_package_pattern("com.example.domain.Order", "com.example.**"));
    EXPECT_FALSE(matches_package_pattern("org.example.Order", "com.example.**"));
    EXPECT_TRUE(matches_package_pattern("com.example.Order", "com.example.*"));
    EXPECT_FALSE(matches_package_pattern("com.example.domain.Order", "com.example.*"));
    EXPECT_TRUE(matches_package_pattern("com.example.test.FakeRepository", "**.test.**"));
    EXPECT_FALSE(matches_package_pattern("com.example.testing.Repository", "**.test.**"));
    EXPECT_TRUE(matches_package_pattern("com.example.Order", "com.example"));
}

TEST(PackagePatternTest, ExcludeWinsOverInclude)
{
    const std::vector<std::string> include = {"com.example.**"};
    const std::vector<std::string> exclude = {"**.tests.**"};
    EXPECT_TRUE(is_package_included("com.example.OrderRepository", include, exclude));
    EXPECT_FALSE(is_package_included("com.example.tests.OrderRepository", include, exclude));
    EXPECT_FALSE(is_package_included("org.other.OrderRepository", include, exclude));
    EXPECT_TRUE(is_package_included("org.other.OrderRepository", {}, {}));
}

TEST(DescriptorTest, SplitsArgumentTypes)
{
    auto args = parse_descriptor_arguments("(JLjava/lang/String;[I[[Lcom/x/A;Z)V");
    ASSERT_TRUE(args);
    EXPECT_EQ(*args, (std::vector<std::string>{"J", "Ljava/lang/String;", "[I", "[[Lcom/x/A;", "Z"}));

    auto empty = parse_descriptor_arguments("()Ljava/lang/String;");
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty->empty());
}

TEST(DescriptorTest, RejectsMalformedDescriptors)
{
    EXPECT_FALSE(parse_descriptor_arguments(""));
    EXPECT_FALSE(parse_descriptor_arguments("V"));
    EXPECT_FALSE(parse_descriptor_arguments("(Ljava/lang/String"));
    EXPECT_FALSE(parse_descriptor_arguments("(Q)V"));
    auto error = parse_descriptor_arguments("(L;)V");
    ASSERT_FALSE(error);
    EXPECT_EQ(error.error().code, "InvalidDescriptor");
}

}  // namespace fieldlens::common::test
