#include <gtest/gtest.h>
#include <api/json_api.hpp>

TEST(JsonApi, DecodesFullPlan) {
    const char* body = R"({
      "data": {
        "id": "plan-8F5JFydVYAmtTjET",
        "type": "plans",
        "attributes": {
          "status": "finished",
          "log-read-url": "http://archivist.test/v1/object/dmF1bHQ6djE6OFA1eEdlSFVHRSs4YUcwaW83a1dRRDA0U2E1M3h4d0=",
          "has-changes": true,
          "generated-configuration": false,
          "resource-additions": 3,
          "resource-changes": 1,
          "resource-destructions": 0,
          "resource-imports": 2,
          "status-timestamps": {
            "queued-at": "2024-03-01T10:00:00+00:00",
            "started-at": "2024-03-01T10:00:05+00:00",
            "finished-at": "2024-03-01T10:01:00+00:00"
          }
        }
      }
    })";

    auto r = decode_plan(body);
    ASSERT_TRUE(r.is_ok()) << r.error;
    const Plan& p = r.value;
    EXPECT_EQ(p.id, "plan-8F5JFydVYAmtTjET");
    EXPECT_EQ(p.status, PlanStatus::Finished);
    EXPECT_EQ(p.raw_status, "finished");
    EXPECT_EQ(p.log_read_url.rfind("http://archivist.test/v1/object/", 0), 0u);
    EXPECT_TRUE(p.has_changes);
    EXPECT_FALSE(p.generated_configuration);
    EXPECT_EQ(p.resource_additions, 3);
    EXPECT_EQ(p.resource_changes, 1);
    EXPECT_EQ(p.resource_destructions, 0);
    EXPECT_EQ(p.resource_imports, 2);
    ASSERT_TRUE(p.status_timestamps.has_value());
    EXPECT_EQ(p.status_timestamps->started_at, "2024-03-01T10:00:05+00:00");
    EXPECT_EQ(p.status_timestamps->errored_at, "");
}

TEST(JsonApi, NullLogUrlIsEmpty) {
    auto r = decode_plan(R"({"data":{"id":"plan-1","attributes":{"status":"pending","log-read-url":null}}})");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.log_read_url.empty());
    EXPECT_FALSE(r.value.status_timestamps.has_value());
}

TEST(JsonApi, UnknownStatusIsKeptRaw) {
    auto r = decode_plan(R"({"data":{"id":"plan-1","attributes":{"status":"policy_checking"}}})");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.status, PlanStatus::Unknown);
    EXPECT_EQ(r.value.raw_status, "policy_checking");
}

TEST(JsonApi, RejectsMalformedDocuments) {
    EXPECT_EQ(decode_plan("not json").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_plan("[]").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_plan(R"({"data":null})").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_plan(R"({"data":{"attributes":{"status":"running"}}})").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_plan(R"({"data":{"id":"plan-1"}})").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_plan(R"({"data":{"id":"plan-1","attributes":{}}})").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_plan(R"({"data":{"id":"run-1","type":"runs","attributes":{"status":"planned"}}})").kind,
              ErrorKind::Parse);
}

TEST(JsonApi, SummarisesErrors) {
    EXPECT_EQ(decode_api_errors(R"({"errors":[{"status":"404","title":"not found"}]})"), "not found");
    EXPECT_EQ(decode_api_errors(R"({"errors":[{"title":"invalid","detail":"bad id"},{"detail":"second"}]})"),
              "invalid: bad id; second");
    EXPECT_EQ(decode_api_errors(R"({"errors":["unauthorized"]})"), "unauthorized");
    EXPECT_EQ(decode_api_errors("<html></html>"), "");
    EXPECT_EQ(decode_api_errors(R"({"data":{}})"), "");
}

// ── Execution plan resource changes ─────────────────────────

TEST(JsonApi, DecodesResourceChanges) {
    auto r = decode_resource_changes(R"({
        "format_version": "1.2",
        "resource_changes": [
            {"address": "aws_instance.web[0]", "mode": "managed", "type": "aws_instance",
             "name": "web", "index": 0, "provider_name": "registry.terraform.io/hashicorp/aws",
             "change": {"actions": ["delete", "create"], "before": {}, "after": {}}},
            {"address": "random_pet.name[\"blue\"]", "mode": "managed", "type": "random_pet",
             "name": "name", "index": "blue", "provider_name": "registry.terraform.io/hashicorp/random",
             "change": {"actions": ["no-op"]}},
            {"address": "data.http.ip", "mode": "data", "type": "http", "name": "ip",
             "change": {"actions": ["read"]}}
        ]
    })");
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 3u);

    const auto& web = r.value[0];
    EXPECT_EQ(web.address, "aws_instance.web[0]");
    EXPECT_EQ(web.mode, "managed");
    EXPECT_EQ(web.type, "aws_instance");
    EXPECT_EQ(web.name, "web");
    EXPECT_EQ(web.index, "0");
    EXPECT_EQ(web.provider_name, "registry.terraform.io/hashicorp/aws");
    EXPECT_EQ(web.actions, (std::vector<std::string>{"delete", "create"}));

    EXPECT_EQ(r.value[1].index, "blue");
    EXPECT_EQ(r.value[2].mode, "data");
    EXPECT_TRUE(r.value[2].index.empty());
    EXPECT_EQ(r.value[2].actions, (std::vector<std::string>{"read"}));
}

TEST(JsonApi, ResourceChangesMissingOrMalformed) {
    auto none = decode_resource_changes(R"({"format_version": "1.2"})");
    ASSERT_TRUE(none.is_ok());
    EXPECT_TRUE(none.value.empty());

    EXPECT_EQ(decode_resource_changes("[]").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_resource_changes("not json").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_resource_changes(R"({"resource_changes": {}})").kind, ErrorKind::Parse);
    EXPECT_EQ(decode_resource_changes(R"({"resource_changes": [1]})").kind, ErrorKind::Parse);
}
