#pragma once

#include <map>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <core/types.hpp>
#include "transport.hpp"

struct HttpResponse {
    int status = 0;
    std::string reason;
    std::map<std::string, std::string> headers;  // lower-cased names
    std::string body;
};

// Map a response to the Transport contract: body on 2xx, classified error
// otherwise. JSON-API error titles/details are folded into the message.
Result<std::string> check_response(const HttpResponse& response, const std::string& url);

// HTTP/1.1 GET over Boost.Beast, one connection per request. https URLs go
// through asio::ssl with peer verification against the system trust store.
// The io_context is run in short slices so a cancelled token abandons
// resolve, connect, handshake and read promptly.
class HttpClient : public Transport {
public:
    explicit HttpClient(const TimeoutConfig& timeouts);

    Result<std::string> get(const std::string& url, const CancelToken& cancel) override;

    // Lower-level variant returning the full response without status checks.
    Result<HttpResponse> request(const std::string& url, const CancelToken& cancel);

private:
    TimeoutConfig timeouts_;
    boost::asio::ssl::context ssl_ctx_;
    boost::asio::io_context ioc_;  // destroyed first: abandoned exchanges still hold streams
};
