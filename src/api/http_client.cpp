#include "http_client.hpp"
#include "json_api.hpp"
#include "url.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <fmt/format.h>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <type_traits>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using Clock = std::chrono::steady_clock;

namespace {

using PlainStream = beast::tcp_stream;
using TlsStream = beast::ssl_stream<beast::tcp_stream>;

std::string to_std(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// One GET over a fresh connection: resolve, connect, handshake (https),
// write, read. Each step chains to the next and the first failure ends the
// chain. Handlers hold a shared_ptr, so an abandoned exchange stays alive
// until its pending operation drains on a later run of the io_context.
template <class Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
public:
    template <class... StreamArgs>
    Exchange(net::io_context& ioc, Url url, TimeoutConfig timeouts, StreamArgs&&... stream_args)
        : resolver_(ioc), stream_(std::forward<StreamArgs>(stream_args)...),
          url_(std::move(url)), timeouts_(timeouts) {
        req_.method(http::verb::get);
        req_.target(url_.target());
        req_.version(11);
        req_.set(http::field::host, url_.host_header());
        req_.set(http::field::user_agent, HTTP_USER_AGENT);
        req_.set(http::field::accept, "application/vnd.api+json");
        req_.keep_alive(false);

        parser_.header_limit(static_cast<std::uint32_t>(HTTP_MAX_HEADER_BYTES));
        parser_.body_limit(HTTP_MAX_BODY_BYTES);
    }

    void start() {
        auto self = this->shared_from_this();
        resolver_.async_resolve(url_.host, std::to_string(url_.port),
            [self](beast::error_code ec, tcp::resolver::results_type results) {
                self->on_resolve(ec, results);
            });
    }

    // Abandon whichever step is in flight.
    void cancel() {
        resolver_.cancel();
        beast::get_lowest_layer(stream_).cancel();
    }

    bool done() const { return done_; }
    const beast::error_code& error() const { return ec_; }
    const char* failed_step() const { return step_; }
    http::response<http::string_body>& response() { return parser_.get(); }

private:
    void on_resolve(beast::error_code ec, const tcp::resolver::results_type& results) {
        if (ec) return fail(ec, "resolve");

        auto self = this->shared_from_this();
        auto& layer = beast::get_lowest_layer(stream_);
        layer.expires_after(std::chrono::seconds(timeouts_.connect_secs));
        layer.async_connect(results, [self](beast::error_code ec, const tcp::endpoint&) {
            self->on_connect(ec);
        });
    }

    void on_connect(beast::error_code ec) {
        if (ec) return fail(ec, "connect");

        if constexpr (std::is_same_v<Stream, TlsStream>) {
            // SNI, then check the certificate against the host name.
            if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
                return fail(beast::error_code(static_cast<int>(::ERR_get_error()),
                                              net::error::get_ssl_category()), "handshake");
            }
            stream_.set_verify_callback(ssl::host_name_verification(url_.host));

            auto self = this->shared_from_this();
            beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(timeouts_.request_secs));
            stream_.async_handshake(ssl::stream_base::client, [self](beast::error_code ec) {
                if (ec) return self->fail(ec, "handshake");
                self->write();
            });
        } else {
            beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(timeouts_.request_secs));
            write();
        }
    }

    // The request_secs deadline set before write covers write and read together.
    void write() {
        auto self = this->shared_from_this();
        http::async_write(stream_, req_, [self](beast::error_code ec, std::size_t) {
            if (ec) return self->fail(ec, "write");
            self->read();
        });
    }

    void read() {
        auto self = this->shared_from_this();
        http::async_read(stream_, buffer_, parser_, [self](beast::error_code ec, std::size_t) {
            if (ec) return self->fail(ec, "read");
            self->done_ = true;
        });
    }

    void fail(beast::error_code ec, const char* step) {
        if (done_) return;
        ec_ = ec;
        step_ = step;
        done_ = true;
    }

    tcp::resolver resolver_;
    Stream stream_;
    Url url_;
    TimeoutConfig timeouts_;
    http::request<http::empty_body> req_;
    http::response_parser<http::string_body> parser_;
    beast::flat_buffer buffer_;
    bool done_ = false;
    beast::error_code ec_;
    const char* step_ = "";
};

// Drive one exchange to completion. Resolve has no stream timer, so the
// whole exchange also runs against an overall deadline.
template <class Stream>
Result<HttpResponse> run_exchange(net::io_context& ioc, const std::shared_ptr<Exchange<Stream>>& ex,
                                  const Url& url, const TimeoutConfig& timeouts,
                                  const CancelToken& cancel) {
    ioc.restart();
    ex->start();

    auto deadline = Clock::now() + std::chrono::seconds(timeouts.connect_secs + timeouts.request_secs);
    while (!ex->done()) {
        if (cancel.is_canceled()) {
            ex->cancel();
            return Result<HttpResponse>::Err(ErrorKind::Canceled, "request canceled");
        }
        if (Clock::now() >= deadline) {
            ex->cancel();
            return Result<HttpResponse>::Err(ErrorKind::Transport,
                                             "Request timed out: " + url.to_string());
        }
        ioc.run_for(std::chrono::milliseconds(CANCEL_CHECK_SLICE_MS));
        if (ioc.stopped() && !ex->done()) {
            return Result<HttpResponse>::Err(ErrorKind::Transport,
                                             "HTTP exchange stalled: " + url.to_string());
        }
    }

    if (ex->error()) {
        const beast::error_code& ec = ex->error();
        if (ec == beast::error::timeout) {
            return Result<HttpResponse>::Err(ErrorKind::Transport,
                fmt::format("{} timed out: {}", ex->failed_step(), url.to_string()));
        }
        return Result<HttpResponse>::Err(ErrorKind::Transport,
            fmt::format("{} {} failed: {}", ex->failed_step(), url.host_header(), ec.message()));
    }

    auto& res = ex->response();
    HttpResponse out;
    out.status = static_cast<int>(res.result_int());
    out.reason = to_std(res.reason());
    for (const auto& field : res) {
        out.headers[lower(to_std(field.name_string()))] = to_std(field.value());
    }
    out.body = std::move(res.body());
    return Result<HttpResponse>::Ok(std::move(out));
}

} // namespace

Result<std::string> check_response(const HttpResponse& response, const std::string& url) {
    if (response.status >= 200 && response.status <= 299) {
        return Result<std::string>::Ok(response.body);
    }

    std::string detail = decode_api_errors(response.body);
    switch (response.status) {
        case 401:
            return Result<std::string>::Err(ErrorKind::Unauthorized,
                detail.empty() ? "unauthorized" : "unauthorized: " + detail);
        case 404:
            return Result<std::string>::Err(ErrorKind::NotFound,
                detail.empty() ? "resource not found" : "resource not found: " + detail);
        default:
            break;
    }

    if (detail.empty()) {
        detail = response.reason.empty() ? "no details" : response.reason;
    }
    return Result<std::string>::Err(ErrorKind::Transport,
        fmt::format("GET {} failed with HTTP {}: {}", url, response.status, detail));
}

// ── HttpClient ──────────────────────────────────────────────

HttpClient::HttpClient(const TimeoutConfig& timeouts)
    : timeouts_(timeouts), ssl_ctx_(ssl::context::tls_client) {
    ssl_ctx_.set_verify_mode(ssl::verify_peer);
    beast::error_code ec;
    ssl_ctx_.set_default_verify_paths(ec);
    if (ec) {
        // https requests will then fail certificate verification.
        planlog_log(fmt::format("http: system CA paths unavailable: {}", ec.message()));
    }
}

Result<std::string> HttpClient::get(const std::string& url, const CancelToken& cancel) {
    auto resp = request(url, cancel);
    if (resp.is_err()) return Result<std::string>::Err(resp);
    return check_response(resp.value, url);
}

Result<HttpResponse> HttpClient::request(const std::string& url_text, const CancelToken& cancel) {
    if (cancel.is_canceled()) {
        return Result<HttpResponse>::Err(ErrorKind::Canceled, "request canceled");
    }

    auto parsed = parse_url(url_text);
    if (parsed.is_err()) {
        return Result<HttpResponse>::Err(ErrorKind::Transport, "malformed URL: " + parsed.error);
    }
    const Url& url = parsed.value;

    planlog_log(fmt::format("http: GET {}", url.to_string()));

    Result<HttpResponse> resp = Result<HttpResponse>::Err(ErrorKind::Transport, "");
    if (url.is_tls()) {
        auto ex = std::make_shared<Exchange<TlsStream>>(ioc_, url, timeouts_, ioc_, ssl_ctx_);
        resp = run_exchange(ioc_, ex, url, timeouts_, cancel);
    } else {
        auto ex = std::make_shared<Exchange<PlainStream>>(ioc_, url, timeouts_, ioc_);
        resp = run_exchange(ioc_, ex, url, timeouts_, cancel);
    }

    if (resp.is_ok()) {
        planlog_log(fmt::format("http: {} -> {} ({} bytes)", url.to_string(),
                                resp.value.status, resp.value.body.size()));
    } else {
        planlog_log(fmt::format("http: {} -> {}", url.to_string(), resp.error));
    }
    return resp;
}
