#include "fieldlens/canonical_json.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace fieldlens::canonical::test {

TEST(CanonicalJsonTest, SortsKeysRecursively)
{
    nlohmann::json j = {
        {"b", 1},
        {"a", {{"z", 2}, {"y", 3}}}
    };
    auto result = canonicalize(j);
    ASSERT_TRUE(result);
    EXPECT_EQ(*result, R"({"a":{"y":3,"z":2},"b":1})");
}

TEST(CanonicalJsonTest, IndentedOutputIsStable)
{
    nlohmann::json j = {
        {"requiredFields", {"name", "nowAddress1"}},
        {"method",         "handle"              }
    };
    auto first = canonicalize(j, 2);
    auto second = canonicalize(nlohmann::json::parse(j.dump()), 2);
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(*first, *second);
    EXPECT_NE(first->find("\n  \"method\""), std::string::npos);
}

TEST(CanonicalJsonTest, RejectsFloatingPoint)
{
    nlohmann::json j = {
        {"calls", {{"depth", 1.5}}}
    };
    auto result = canonicalize(j);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "FloatingPointNotAllowed");
    EXPECT_NE(result.error().message.find("$.calls.depth"), std::string::npos);
    EXPECT_FALSE(validate_for_canonical(j));
}

}  // namespace fieldlens::canonical::test
