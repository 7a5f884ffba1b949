#include "json_api.hpp"
#include <core/plan_status.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

using nlohmann::json;

static std::string string_attr(const json& attrs, const char* key) {
    if (attrs.contains(key) && attrs[key].is_string()) {
        return attrs[key].get<std::string>();
    }
    return "";
}

static int int_attr(const json& attrs, const char* key) {
    if (attrs.contains(key) && attrs[key].is_number_integer()) {
        return attrs[key].get<int>();
    }
    return 0;
}

static bool bool_attr(const json& attrs, const char* key) {
    if (attrs.contains(key) && attrs[key].is_boolean()) {
        return attrs[key].get<bool>();
    }
    return false;
}

static PlanStatusTimestamps decode_timestamps(const json& ts) {
    PlanStatusTimestamps out;
    out.queued_at = string_attr(ts, "queued-at");
    out.started_at = string_attr(ts, "started-at");
    out.finished_at = string_attr(ts, "finished-at");
    out.errored_at = string_attr(ts, "errored-at");
    out.canceled_at = string_attr(ts, "canceled-at");
    out.force_canceled_at = string_attr(ts, "force-canceled-at");
    return out;
}

Result<Plan> decode_plan(const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) {
        return Result<Plan>::Err(ErrorKind::Parse, "plan response is not valid JSON");
    }

    if (!doc.is_object() || !doc.contains("data") || !doc["data"].is_object()) {
        return Result<Plan>::Err(ErrorKind::Parse, "plan response has no data object");
    }
    const json& data = doc["data"];

    if (data.contains("type") && data["type"].is_string() && data["type"] != "plans") {
        return Result<Plan>::Err(ErrorKind::Parse,
            fmt::format("expected resource type 'plans', got '{}'", data["type"].get<std::string>()));
    }

    Plan plan;
    plan.id = string_attr(data, "id");
    if (plan.id.empty()) {
        return Result<Plan>::Err(ErrorKind::Parse, "plan response has no id");
    }

    if (!data.contains("attributes") || !data["attributes"].is_object()) {
        return Result<Plan>::Err(ErrorKind::Parse,
                                 fmt::format("plan {} has no attributes", plan.id));
    }
    const json& attrs = data["attributes"];

    plan.raw_status = string_attr(attrs, "status");
    if (plan.raw_status.empty()) {
        return Result<Plan>::Err(ErrorKind::Parse, fmt::format("plan {} has no status", plan.id));
    }
    plan.status = parse_plan_status(plan.raw_status);

    // null and "" both mean "no log yet"
    plan.log_read_url = string_attr(attrs, "log-read-url");
    plan.has_changes = bool_attr(attrs, "has-changes");
    plan.generated_configuration = bool_attr(attrs, "generated-configuration");
    plan.resource_additions = int_attr(attrs, "resource-additions");
    plan.resource_changes = int_attr(attrs, "resource-changes");
    plan.resource_destructions = int_attr(attrs, "resource-destructions");
    plan.resource_imports = int_attr(attrs, "resource-imports");

    if (attrs.contains("status-timestamps") && attrs["status-timestamps"].is_object()) {
        plan.status_timestamps = decode_timestamps(attrs["status-timestamps"]);
    }

    return Result<Plan>::Ok(plan);
}

std::string decode_api_errors(const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() ||
        !doc.contains("errors") || !doc["errors"].is_array()) {
        return "";
    }

    std::string out;
    for (const auto& e : doc["errors"]) {
        std::string msg;
        if (e.is_string()) {
            msg = e.get<std::string>();
        } else if (e.is_object()) {
            std::string title = string_attr(e, "title");
            std::string detail = string_attr(e, "detail");
            if (!title.empty() && !detail.empty()) {
                msg = title + ": " + detail;
            } else {
                msg = title.empty() ? detail : title;
            }
        }
        if (msg.empty()) continue;
        if (!out.empty()) out += "; ";
        out += msg;
    }
    return out;
}

// index is the count number or the for_each key
static std::string index_text(const json& change) {
    if (!change.contains("index")) return "";
    const json& idx = change["index"];
    if (idx.is_string()) return idx.get<std::string>();
    if (idx.is_number()) return idx.dump();
    return "";
}

Result<std::vector<ResourceChange>> decode_resource_changes(const std::string& body) {
    using Changes = std::vector<ResourceChange>;

    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Result<Changes>::Err(ErrorKind::Parse, "execution plan is not a JSON object");
    }
    if (!doc.contains("resource_changes") || doc["resource_changes"].is_null()) {
        return Result<Changes>::Ok(Changes{});
    }
    if (!doc["resource_changes"].is_array()) {
        return Result<Changes>::Err(ErrorKind::Parse, "resource_changes is not an array");
    }

    Changes out;
    for (const auto& rc : doc["resource_changes"]) {
        if (!rc.is_object()) {
            return Result<Changes>::Err(ErrorKind::Parse, "resource change is not an object");
        }
        ResourceChange change;
        change.address = string_attr(rc, "address");
        change.mode = string_attr(rc, "mode");
        change.type = string_attr(rc, "type");
        change.name = string_attr(rc, "name");
        change.index = index_text(rc);
        change.provider_name = string_attr(rc, "provider_name");
        if (rc.contains("change") && rc["change"].is_object()) {
            const json& c = rc["change"];
            if (c.contains("actions") && c["actions"].is_array()) {
                for (const auto& a : c["actions"]) {
                    if (a.is_string()) change.actions.push_back(a.get<std::string>());
                }
            }
        }
        out.push_back(std::move(change));
    }
    return Result<Changes>::Ok(std::move(out));
}
