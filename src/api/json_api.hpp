#pragma once

#include <string>
#include <core/types.hpp>

// Decode a JSON-API plan document:
//   {"data": {"id": "plan-...", "type": "plans", "attributes": {...}}}
// Missing optional attributes take their defaults; a missing data object,
// id or status is a Parse error.
Result<Plan> decode_plan(const std::string& body);

// Summarise a JSON-API error document ({"errors": [{"title", "detail"}]})
// as "title: detail; ...". Returns an empty string if body is not one.
std::string decode_api_errors(const std::string& body);

// Decode resource_changes[] from a JSON execution plan. A document without
// the array yields an empty list; a non-object document is a Parse error.
Result<std::vector<ResourceChange>> decode_resource_changes(const std::string& body);
