#pragma once

#include <string>
#include <optional>
#include <functional>
#include <cstddef>
#include <cstdint>
#include <vector>

// Classification for failed operations. None means success.
enum class ErrorKind {
    None,
    InvalidIdentifier,   // ID failed format validation (no network call made)
    MissingLogLocation,  // plan exists but has no log-read-url
    InvalidLogUrl,       // log-read-url present but unparsable
    NotFound,            // HTTP 404
    Unauthorized,        // HTTP 401
    Transport,           // connect/timeout/malformed HTTP/other HTTP error status
    Parse,               // malformed JSON or missing JSON-API fields
    Canceled,            // caller's CancelToken fired
    Config,              // invalid or missing configuration
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    // Re-wrap another Result's failure under this value type.
    template <typename U>
    static Result<T> Err(const Result<U>& other) {
        return {false, T{}, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    template <typename U>
    static Result<void> Err(const Result<U>& other) {
        return {false, other.error, other.kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Plan model ──────────────────────────────────────────────

enum class PlanStatus {
    Unknown,
    Created,
    Queued,
    Pending,
    Running,
    MFAWaiting,
    Finished,
    Errored,
    Canceled,
    Unreachable,
};

// ISO 8601 strings as returned by the API; empty when the state was never reached.
struct PlanStatusTimestamps {
    std::string queued_at;
    std::string started_at;
    std::string finished_at;
    std::string errored_at;
    std::string canceled_at;
    std::string force_canceled_at;
};

struct Plan {
    std::string id;
    PlanStatus status = PlanStatus::Unknown;
    std::string raw_status;        // status string as sent by the server
    std::string log_read_url;      // empty if the plan has produced no log
    bool has_changes = false;
    bool generated_configuration = false;
    int resource_additions = 0;
    int resource_changes = 0;
    int resource_destructions = 0;
    int resource_imports = 0;
    std::optional<PlanStatusTimestamps> status_timestamps;
};

// One entry of resource_changes[] in the JSON execution plan.
struct ResourceChange {
    std::string address;           // e.g. "aws_instance.web[0]"
    std::string mode;              // "managed" or "data"
    std::string type;
    std::string name;
    std::string index;             // count/for_each key as text, empty if none
    std::string provider_name;
    std::vector<std::string> actions;  // "create", "update", "delete", "no-op", ...
};

// ── Configuration ───────────────────────────────────────────

struct PollConfig {
    int min_ms;
    int max_ms;
};

struct TimeoutConfig {
    int connect_secs;
    int request_secs;
};

struct ClientConfig {
    std::string address;           // e.g. "http://tfe.internal:8080"
    std::string base_path;         // e.g. "/api/v2/"
    PollConfig poll;
    std::size_t chunk_size;
    TimeoutConfig timeouts;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
