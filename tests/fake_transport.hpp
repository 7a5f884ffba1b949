#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <api/transport.hpp>
#include <core/utils.hpp>
#include <stream/completion_oracle.hpp>

// Value of a query parameter in url, or fallback if absent.
inline long long query_param(const std::string& url, const std::string& name, long long fallback = -1) {
    auto q = url.find('?');
    if (q == std::string::npos) return fallback;
    std::string query = url.substr(q + 1);
    size_t pos = 0;
    while (pos <= query.size()) {
        auto amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == name) {
            try { return std::stoll(pair.substr(eq + 1)); } catch (...) { return fallback; }
        }
        if (amp == std::string::npos) break;
        pos = amp + 1;
    }
    return fallback;
}

// Transport that records every URL and answers through handler.
class FakeTransport : public Transport {
public:
    using Handler = std::function<Result<std::string>(const std::string& url)>;

    explicit FakeTransport(Handler h = nullptr) : handler(std::move(h)) {}

    Result<std::string> get(const std::string& url, const CancelToken& cancel) override {
        requests.push_back(url);
        if (cancel.is_canceled()) {
            return Result<std::string>::Err(ErrorKind::Canceled, "request canceled");
        }
        if (!handler) {
            return Result<std::string>::Err(ErrorKind::NotFound, "resource not found");
        }
        return handler(url);
    }

    size_t count_containing(const std::string& needle) const {
        size_t n = 0;
        for (const auto& r : requests) {
            if (r.find(needle) != std::string::npos) n++;
        }
        return n;
    }

    Handler handler;
    std::vector<std::string> requests;
};

// Remote append-only log. Before serving each fetch, the next pending
// append (if any) lands in content; the fetch then returns
// content[offset, offset + limit).
struct GrowingLog {
    std::string content;
    std::deque<std::string> pending;
    int fetches = 0;

    Result<std::string> serve(const std::string& url) {
        fetches++;
        if (!pending.empty()) {
            content += pending.front();
            pending.pop_front();
        }
        long long offset = query_param(url, "offset", 0);
        long long limit = query_param(url, "limit", static_cast<long long>(content.size()));
        if (offset >= static_cast<long long>(content.size())) {
            return Result<std::string>::Ok("");
        }
        return Result<std::string>::Ok(content.substr(static_cast<size_t>(offset),
                                                      static_cast<size_t>(limit)));
    }
};

// Oracle replaying a scripted sequence of answers; the last answer repeats.
struct OracleScript {
    std::vector<Result<bool>> answers;
    int calls = 0;
    std::function<void()> on_call;   // runs before answering
};

class ScriptedOracle : public CompletionOracle {
public:
    explicit ScriptedOracle(std::shared_ptr<OracleScript> script) : script_(std::move(script)) {}

    Result<bool> is_done() override {
        int idx = script_->calls++;
        if (script_->on_call) script_->on_call();
        if (script_->answers.empty()) return Result<bool>::Ok(true);
        if (idx >= static_cast<int>(script_->answers.size())) {
            idx = static_cast<int>(script_->answers.size()) - 1;
        }
        return script_->answers[static_cast<size_t>(idx)];
    }

private:
    std::shared_ptr<OracleScript> script_;
};

inline Result<bool> running() { return Result<bool>::Ok(false); }
inline Result<bool> terminal() { return Result<bool>::Ok(true); }
