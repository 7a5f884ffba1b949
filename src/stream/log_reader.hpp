#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <api/transport.hpp>
#include <api/url.hpp>
#include "completion_oracle.hpp"

// Outcome of one read: bytes copied into the caller's buffer, and whether
// the stream has ended. eof is reported with bytes == 0.
struct ReadChunk {
    std::size_t bytes = 0;
    bool eof = false;
};

// Sequential reader over a remote, append-only plan log.
//
// Each read() fetches "<log-url>?limit=<len>&offset=<offset>". Bytes are
// delivered as soon as they arrive. When a fetch comes back empty the
// completion oracle is consulted: a terminal plan ends the stream, otherwise
// the reader backs off and fetches again inside the same read() call.
// End-of-stream therefore requires both an empty fetch and a terminal status,
// so trailing output that races the status flip is never truncated.
//
// STX (0x02) at the start of the log and ETX (0x03) at the end of a chunk
// are framing markers: they are stripped from delivered bytes but still
// advance the offset.
//
// Once end-of-stream is reported every later read() reports it again
// without network traffic. Errors are sticky the same way. Not safe for
// concurrent reads.
class LogReader {
public:
    enum class State {
        Fetching,            // next read() will fetch from offset()
        AwaitingCompletion,  // last fetch was empty, oracle being consulted
        Done,                // end-of-stream reported
        Errored,             // a fetch, the oracle or cancellation failed
    };

    using Sink = std::function<void(const char* data, std::size_t len)>;

    // transport must outlive the reader.
    LogReader(Transport& transport, Url log_url,
              std::unique_ptr<CompletionOracle> oracle,
              PollConfig poll, CancelToken cancel);

    Result<ReadChunk> read(char* buf, std::size_t len);

    // Read until end-of-stream, handing every non-empty chunk to sink.
    // Returns the total number of bytes delivered.
    Result<std::size_t> drain(const Sink& sink, std::size_t chunk_size);

    State state() const { return state_; }
    std::uint64_t offset() const { return offset_; }
    const Url& log_url() const { return log_url_; }

    // Delay before the n-th consecutive poll (n >= 1):
    // min_ms * 2^(n/5), capped at max_ms.
    static int backoff_ms(const PollConfig& poll, int attempt);

private:
    // One fetch attempt. Returns the number of bytes copied into buf after
    // stripping framing markers.
    Result<std::size_t> fetch(char* buf, std::size_t len);

    std::string chunk_url(std::size_t len) const;

    Result<ReadChunk> fail(ErrorKind kind, const std::string& error);

    Transport& transport_;
    Url log_url_;
    std::unique_ptr<CompletionOracle> oracle_;
    PollConfig poll_;
    CancelToken cancel_;

    State state_ = State::Fetching;
    std::uint64_t offset_ = 0;
    int polls_ = 0;               // consecutive empty fetches, drives backoff
    bool start_of_text_ = false;  // STX seen
    bool end_of_text_ = false;    // ETX seen
    ErrorKind error_kind_ = ErrorKind::None;
    std::string error_;
};
