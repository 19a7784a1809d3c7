#pragma once

#include <chrono>
#include <stop_token>
#include <string>
#include <sift/core/types.h>

namespace sift::net {

struct HttpResponse {
    long status = 0;
    std::string body;
};

/**
 * @brief POST a JSON body and collect the response.
 *
 * Transport failures map to NetworkError or Timeout; a stop request aborts the
 * transfer with OperationCancelled. Non-2xx statuses are returned as NetworkError
 * with the body in the message.
 */
Result<HttpResponse> postJson(const std::string& url, const std::string& body,
                              std::chrono::seconds timeout, std::stop_token stop = {});

} // namespace sift::net
