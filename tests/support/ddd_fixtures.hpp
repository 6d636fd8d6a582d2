#pragma once

/**
 * @file ddd_fixtures.hpp
 * @brief Small domain models expressed as instruction event streams
 */

#include "fieldlens/model.hpp"
#include "fieldlens/program.hpp"

#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fieldlens::test {

inline constexpr const char* kGoods = "com.example.domain.Goods";
inline constexpr const char* kGoodsRepository = "com.example.domain.GoodsRepository";
inline constexpr const char* kHandler = "com.example.app.Handler";
inline constexpr const char* kOrder = "com.example.domain.Order";
inline constexpr const char* kFindByIdOrErr = "(J)Lcom/example/domain/Goods;";
inline constexpr const char* kMarkerSignature =
    "Ljava/lang/Object;Lorg/morecup/pragmaddd/core/repository/DomainRepository<Lcom/example/domain/Goods;>;";

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / name)
    {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

[[nodiscard]] inline stream::MethodBody method(std::string name,
                                               std::string descriptor,
                                               std::vector<stream::Event> events)
{
    return stream::MethodBody{.name = std::move(name),
                              .descriptor = std::move(descriptor),
                              .modifiers = {"public"},
                              .events = std::move(events)};
}

[[nodiscard]] inline stream::ClassUnit goods_class()
{
    stream::ClassUnit unit{.name = kGoods};
    unit.annotations.push_back(
        stream::Annotation{.name = "org.morecup.pragmaddd.core.annotation.AggregateRoot",
                           .arguments = {}});
    unit.methods.push_back(method("changeAddress", "(Ljava/lang/String;)V",
                                  {stream::line_event(20),
                                   stream::field_read(kGoods, "name"),
                                   stream::call_event("kotlin.jvm.internal.Intrinsics",
                                                      "checkNotNullParameter",
                                                      "(Ljava/lang/Object;Ljava/lang/String;)V"),
                                   stream::line_event(21),
                                   stream::field_write(kGoods, "nowAddress1", "Ljava/lang/String;"),
                                   stream::line_event(22)}));
    unit.methods.push_back(method("getName", "()Ljava/lang/String;",
                                  {stream::line_event(30), stream::field_read(kGoods, "name")}));
    unit.methods.push_back(method("getPrice", "()J",
                                  {stream::line_event(34), stream::field_read(kGoods, "price")}));
    return unit;
}

[[nodiscard]] inline stream::ClassUnit goods_repository_class()
{
    stream::ClassUnit unit{.name = kGoodsRepository};
    unit.is_interface = true;
    unit.interfaces = {"org.morecup.pragmaddd.core.repository.DomainRepository"};
    unit.generic_signature = kMarkerSignature;
    unit.methods.push_back(method("findByIdOrErr", kFindByIdOrErr, {}));
    return unit;
}

[[nodiscard]] inline stream::ClassUnit handler_class()
{
    stream::ClassUnit unit{.name = kHandler};
    unit.methods.push_back(method(
        "handle", "(J)V",
        {stream::line_event(10),
         stream::call_event(kGoodsRepository, "findByIdOrErr", kFindByIdOrErr),
         stream::line_event(11),
         stream::call_event(kGoods, "changeAddress", "(Ljava/lang/String;)V"),
         stream::line_event(12)}));
    return unit;
}

/// Handler.handle -> GoodsRepository.findByIdOrErr, then Goods.changeAddress
[[nodiscard]] inline std::vector<stream::ClassUnit> goods_program()
{
    return {goods_class(), goods_repository_class(), handler_class()};
}

/// `if (status == PENDING && items.isNotEmpty()) { status = CONFIRMED }` on Order
[[nodiscard]] inline stream::MethodBody order_confirm_body()
{
    return method("confirm", "()V",
                  {stream::line_event(40),
                   stream::field_read(kOrder, "status"),
                   stream::field_read("com.example.domain.OrderStatus", "PENDING"),
                   stream::call_event("kotlin.jvm.internal.Intrinsics", "areEqual",
                                      "(Ljava/lang/Object;Ljava/lang/Object;)Z"),
                   stream::branch_event(),
                   stream::field_read(kOrder, "items"),
                   stream::call_event("kotlin.collections.CollectionsKt", "isNotEmpty",
                                      "(Ljava/util/Collection;)Z"),
                   stream::branch_event(),
                   stream::line_event(41),
                   stream::field_read("com.example.domain.OrderStatus", "CONFIRMED"),
                   stream::field_write(kOrder, "status", "Lcom/example/domain/OrderStatus;"),
                   stream::branch_end_event(),
                   stream::branch_end_event(),
                   stream::line_event(43)});
}

/// Call analysis of goods_program(), as the analyzer reports it
[[nodiscard]] inline AnalysisResult goods_analysis_result(std::string timestamp = "2026-01-01T00:00:00Z")
{
    CallSiteAnalysis call{.method_class = kHandler,
                          .method = "handle",
                          .method_descriptor = "(J)V",
                          .repository = kGoodsRepository,
                          .repository_method = "findByIdOrErr",
                          .repository_method_descriptor = kFindByIdOrErr,
                          .aggregate_root = kGoods,
                          .called_methods = {CalledAggregateMethod{
                              .method = "changeAddress",
                              .descriptor = "(Ljava/lang/String;)V",
                              .required_fields = {"name", "nowAddress1"}}},
                          .required_fields = {"name", "nowAddress1"}};
    AnalysisResult result{.version = "1.0", .timestamp = std::move(timestamp), .call_graph = {}};
    result.call_graph[kGoods].methods[std::string("findByIdOrErr") + kFindByIdOrErr]
        .calls["com.example.app.Handler.handle+10-12"] = std::move(call);
    return result;
}

}  // namespace fieldlens::test
