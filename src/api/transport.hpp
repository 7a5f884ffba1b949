#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>

// The HTTP collaborator used by Plans and LogReader. One call is one GET.
//
// Implementations return the response body for 2xx statuses and classify
// everything else: 404 → NotFound, 401 → Unauthorized, connection failures,
// timeouts and other statuses → Transport. A cancelled token must make the
// call return ErrorKind::Canceled promptly. Implementations do not retry.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<std::string> get(const std::string& url, const CancelToken& cancel) = 0;
};
