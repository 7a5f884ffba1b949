#include "log_reader.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

LogReader::LogReader(Transport& transport, Url log_url,
                     std::unique_ptr<CompletionOracle> oracle,
                     PollConfig poll, CancelToken cancel)
    : transport_(transport), log_url_(std::move(log_url)), oracle_(std::move(oracle)),
      poll_(poll), cancel_(std::move(cancel)) {}

int LogReader::backoff_ms(const PollConfig& poll, int attempt) {
    double delay = std::pow(2.0, static_cast<double>(attempt) / LOG_POLL_BACKOFF_DIVISOR) * poll.min_ms;
    if (delay > poll.max_ms) delay = poll.max_ms;
    return static_cast<int>(delay);
}

// ── Read loop ───────────────────────────────────────────────

Result<ReadChunk> LogReader::read(char* buf, std::size_t len) {
    if (state_ == State::Done) {
        return Result<ReadChunk>::Ok(ReadChunk{0, true});
    }
    if (state_ == State::Errored) {
        return Result<ReadChunk>::Err(error_kind_, error_);
    }
    if (len == 0) {
        return Result<ReadChunk>::Ok(ReadChunk{0, false});
    }

    while (true) {
        if (cancel_.is_canceled()) {
            return fail(ErrorKind::Canceled, "log read canceled");
        }

        state_ = State::Fetching;
        auto got = fetch(buf, len);
        if (got.is_err()) {
            return fail(got.kind, got.error);
        }
        if (got.value > 0) {
            polls_ = 0;
            return Result<ReadChunk>::Ok(ReadChunk{got.value, false});
        }

        // Nothing new. Only a terminal plan ends the stream.
        state_ = State::AwaitingCompletion;
        auto done = oracle_->is_done();
        if (done.is_err()) {
            return fail(done.kind, done.error);
        }
        if (done.value) {
            state_ = State::Done;
            planlog_log(fmt::format("log_reader: end of stream at offset {}", offset_));
            return Result<ReadChunk>::Ok(ReadChunk{0, true});
        }

        ++polls_;
        int delay = backoff_ms(poll_, polls_);
        if (!cancel_.sleep_for(delay)) {
            return fail(ErrorKind::Canceled, "log read canceled");
        }
    }
}

Result<std::size_t> LogReader::drain(const Sink& sink, std::size_t chunk_size) {
    std::vector<char> buf(std::max<std::size_t>(chunk_size, 1));
    std::size_t total = 0;

    while (true) {
        auto r = read(buf.data(), buf.size());
        if (r.is_err()) return Result<std::size_t>::Err(r);
        if (r.value.eof) break;
        if (r.value.bytes > 0) {
            sink(buf.data(), r.value.bytes);
            total += r.value.bytes;
        }
    }
    return Result<std::size_t>::Ok(total);
}

// ── Fetch ───────────────────────────────────────────────────

std::string LogReader::chunk_url(std::size_t len) const {
    Url u = log_url_;
    std::string range = fmt::format("limit={}&offset={}", len, offset_);
    u.query = u.query.empty() ? range : u.query + "&" + range;
    return u.to_string();
}

Result<std::size_t> LogReader::fetch(char* buf, std::size_t len) {
    auto body = transport_.get(chunk_url(len), cancel_);
    if (body.is_err()) {
        return Result<std::size_t>::Err(body);
    }

    const std::string& chunk = body.value;
    std::size_t received = std::min(len, chunk.size());
    if (received == 0) {
        return Result<std::size_t>::Ok(0);
    }

    std::size_t begin = 0;
    std::size_t end = received;

    if (!start_of_text_ && offset_ == 0 && chunk[0] == LOG_STX) {
        start_of_text_ = true;
        begin = 1;
    }
    if (start_of_text_ && !end_of_text_ && end > begin && chunk[end - 1] == LOG_ETX) {
        end_of_text_ = true;
        --end;
    }

    offset_ += received;

    std::size_t delivered = end - begin;
    if (delivered > 0) {
        std::memcpy(buf, chunk.data() + begin, delivered);
    }
    return Result<std::size_t>::Ok(delivered);
}

Result<ReadChunk> LogReader::fail(ErrorKind kind, const std::string& error) {
    state_ = State::Errored;
    error_kind_ = kind;
    error_ = error;
    planlog_log(fmt::format("log_reader: {} at offset {}: {}", error_kind_name(kind), offset_, error));
    return Result<ReadChunk>::Err(kind, error);
}
