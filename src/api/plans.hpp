#pragma once

#include <memory>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/cancel_token.hpp>
#include <core/types.hpp>
#include <stream/log_reader.hpp>
#include "transport.hpp"

// Plan endpoints of the run service. All calls validate the plan ID first
// and fail with InvalidIdentifier without touching the network.
class Plans {
public:
    // transport and config must outlive this object and any reader it returns.
    Plans(Transport& transport, const Config& config);

    // GET plans/<id>
    Result<Plan> read(const std::string& plan_id, const CancelToken& cancel = CancelToken());

    // Open a streaming reader over the plan's log. Fails with
    // MissingLogLocation if the plan has no log URL, InvalidLogUrl if the URL
    // cannot be parsed. No log chunk is fetched here.
    Result<std::unique_ptr<LogReader>> logs(const std::string& plan_id,
                                            const CancelToken& cancel = CancelToken());

    // GET plans/<id>/json-output: the JSON execution plan, raw bytes.
    Result<std::string> read_json_output(const std::string& plan_id,
                                         const CancelToken& cancel = CancelToken());

    // GET plans/<id>/json-output-redacted: same, with sensitive values removed.
    Result<std::string> read_json_output_redacted(const std::string& plan_id,
                                                  const CancelToken& cancel = CancelToken());

    // Typed resource_changes[] from the redacted JSON execution plan.
    Result<std::vector<ResourceChange>> read_resource_changes(const std::string& plan_id,
                                                              const CancelToken& cancel = CancelToken());

private:
    Result<std::string> get_plan_path(const char* path_template, const std::string& plan_id,
                                      const CancelToken& cancel);

    Transport& transport_;
    const Config& config_;
};
