#include "fieldlens/program.hpp"
#include "support/ddd_fixtures.hpp"

#include <fstream>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace fieldlens::stream::test {

using fieldlens::test::TempDir;

namespace {

nlohmann::json make_document(nlohmann::json classes)
{
    return nlohmann::json{
        {"schema_version", "program.v1"      },
        {"classes",        std::move(classes)}
    };
}

}  // namespace

TEST(ProgramReaderTest, ClassRecordRoundTrip)
{
    const ClassUnit original = fieldlens::test::goods_class();
    auto parsed = class_from_json(to_json(original));
    ASSERT_TRUE(parsed) << parsed.error().message;
    EXPECT_EQ(*parsed, original);
}

TEST(ProgramReaderTest, NormalizesInternalNames)
{
    nlohmann::json record = {
        {"name",        "com/example/domain/Goods"                                },
        {"super_class", "java/lang/Object"                                        },
        {"interfaces",  nlohmann::json::array({"com/example/domain/Identifiable"})},
        {"annotations", nlohmann::json::array({"org.morecup.pragmaddd.core.annotation.AggregateRoot"})}
    };
    auto unit = class_from_json(record);
    ASSERT_TRUE(unit) << unit.error().message;
    EXPECT_EQ(unit->name, "com.example.domain.Goods");
    EXPECT_EQ(unit->super_class, "java.lang.Object");
    EXPECT_EQ(unit->interfaces, std::vector<std::string>{"com.example.domain.Identifiable"});
    ASSERT_EQ(unit->annotations.size(), 1U);
    EXPECT_TRUE(unit->annotations[0].arguments.empty());
}

TEST(ProgramReaderTest, AnnotationArgumentsAreKept)
{
    nlohmann::json record = {
        {"name", "com.example.domain.GoodsStore"},
        {"annotations",
         nlohmann::json::array({nlohmann::json{
             {"name", "org.morecup.pragmaddd.core.annotation.DomainRepository"},
             {"arguments", {{"targetType", "com.example.domain.Goods::class"}}}}})}
    };
    auto unit = class_from_json(record);
    ASSERT_TRUE(unit) << unit.error().message;
    ASSERT_EQ(unit->annotations.size(), 1U);
    EXPECT_EQ(unit->annotations[0].arguments.at("targetType"), "com.example.domain.Goods::class");
}

TEST(ProgramReaderTest, UnknownEventKindsAreKeptForTheClassifier)
{
    nlohmann::json record = {
        {"name", "com.example.domain.Goods"},
        {"methods",
         nlohmann::json::array({nlohmann::json{
             {"name", "touch"},
             {"descriptor", "()V"},
             {"events", nlohmann::json::array({nlohmann::json{{"kind", "monitor_enter"}}})}}})}
    };
    auto unit = class_from_json(record);
    ASSERT_TRUE(unit) << unit.error().message;
    ASSERT_EQ(unit->methods.size(), 1U);
    ASSERT_EQ(unit->methods[0].events.size(), 1U);
    EXPECT_EQ(unit->methods[0].events[0].kind, EventKind::kUnknown);
    EXPECT_EQ(unit->methods[0].events[0].raw_kind, "monitor_enter");
}

TEST(ProgramReaderTest, NonStringEventMembersDoNotFailTheClass)
{
    nlohmann::json events = nlohmann::json::array({
        nlohmann::json{{"kind", "field_read"}, {"owner", 7}, {"name", "status"}},
        nlohmann::json{{"kind", 3}},
        nlohmann::json{{"kind", "call"}, {"owner", "com.example.domain.Goods"}, {"name", false}}
    });
    nlohmann::json record = {
        {"name",    "com.example.domain.Goods"},
        {"methods",
         nlohmann::json::array(
             {nlohmann::json{{"name", "touch"}, {"descriptor", "()V"}, {"events", events}}})}
    };
    auto unit = class_from_json(record);
    ASSERT_TRUE(unit) << unit.error().message;
    const auto& parsed = unit->methods.at(0).events;
    ASSERT_EQ(parsed.size(), 3U);
    EXPECT_EQ(parsed[0].kind, EventKind::kFieldRead);
    EXPECT_TRUE(parsed[0].owner.empty());
    EXPECT_EQ(parsed[0].name, "status");
    EXPECT_EQ(parsed[1].kind, EventKind::kUnknown);
    EXPECT_EQ(parsed[1].raw_kind, "3");
    EXPECT_EQ(parsed[2].kind, EventKind::kCall);
    EXPECT_TRUE(parsed[2].name.empty());
}

TEST(ProgramReaderTest, MethodWithoutDescriptorIsRejected)
{
    nlohmann::json record = {
        {"name",    "com.example.domain.Goods"                                },
        {"methods", nlohmann::json::array({nlohmann::json{{"name", "touch"}}})}
    };
    auto unit = class_from_json(record);
    ASSERT_FALSE(unit);
    EXPECT_EQ(unit.error().code, "MissingField");
}

TEST(ProgramReaderTest, DocumentSourceParsesRecordsLazily)
{
    auto source = ProgramDocumentSource::from_json(make_document(nlohmann::json::array(
        {to_json(fieldlens::test::goods_class()),
         nlohmann::json{{"name", "com.example.Broken"}, {"methods", "not-an-array"}}})));
    ASSERT_TRUE(source) << source.error().message;

    EXPECT_EQ(source->class_names(),
              (std::vector<std::string>{fieldlens::test::kGoods, "com.example.Broken"}));
    EXPECT_TRUE(source->load_class(0));
    auto broken = source->load_class(1);
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, "InvalidFieldType");
    EXPECT_FALSE(source->load_class(2));
}

TEST(ProgramReaderTest, DocumentEnvelopeIsChecked)
{
    auto wrong_version = ProgramDocumentSource::from_json(
        nlohmann::json{{"schema_version", "program.v2"}, {"classes", nlohmann::json::array()}});
    ASSERT_FALSE(wrong_version);
    EXPECT_EQ(wrong_version.error().code, "UnsupportedSchemaVersion");

    auto no_classes = ProgramDocumentSource::from_json(nlohmann::json{{"schema_version", "program.v1"}});
    EXPECT_FALSE(no_classes);
}

TEST(ProgramReaderTest, DeclaredAggregateRootsAreNormalized)
{
    nlohmann::json document = make_document(nlohmann::json::array());
    document["aggregate_roots"] = nlohmann::json::array({"com/example/domain/Order"});
    auto source = ProgramDocumentSource::from_json(document);
    ASSERT_TRUE(source) << source.error().message;
    EXPECT_EQ(source->declared_aggregate_roots(), std::vector<std::string>{"com.example.domain.Order"});
}

TEST(ProgramReaderTest, ReadsDocumentFromDiskWithSchema)
{
    TempDir dir("fieldlens_program_reader_test");
    nlohmann::json classes = nlohmann::json::array();
    for (const auto& unit : fieldlens::test::goods_program()) {
        classes.push_back(to_json(unit));
    }
    const auto path = (dir.path() / "program.json").string();
    {
        std::ofstream out(path);
        out << make_document(classes).dump(2);
    }

    auto source = read_program_document(path, std::string(FIELDLENS_SCHEMA_DIR));
    ASSERT_TRUE(source) << source.error().message;
    EXPECT_EQ(source->class_names().size(), 3U);

    auto missing = read_program_document((dir.path() / "missing.json").string(), std::nullopt);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, "FileOpenFailed");
}

TEST(InMemorySourceTest, DeliversClassesInOrder)
{
    InMemorySource source(fieldlens::test::goods_program(), {fieldlens::test::kOrder});
    EXPECT_EQ(source.class_names(),
              (std::vector<std::string>{fieldlens::test::kGoods, fieldlens::test::kGoodsRepository,
                                        fieldlens::test::kHandler}));
    auto unit = source.load_class(2);
    ASSERT_TRUE(unit);
    EXPECT_EQ(unit->name, fieldlens::test::kHandler);
    EXPECT_FALSE(source.load_class(3));
    EXPECT_EQ(source.declared_aggregate_roots(), std::vector<std::string>{fieldlens::test::kOrder});
}

}  // namespace fieldlens::stream::test
