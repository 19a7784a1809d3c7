#include <sift/net/http_client.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string_view>

namespace sift::net {

namespace {

std::once_flag g_curlInitOnce;

void ensureCurlInitialized() {
    std::call_once(g_curlInitOnce, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_ABORTED_BY_CALLBACK:
            err.code = ErrorCode::OperationCancelled;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, total);
    return total;
}

int xferinfo_cb(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* stop = static_cast<std::stop_token*>(userdata);
    return stop->stop_requested() ? 1 : 0;
}

struct CurlDeleter {
    void operator()(CURL* h) const { curl_easy_cleanup(h); }
};

struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};

} // namespace

Result<HttpResponse> postJson(const std::string& url, const std::string& body,
                              std::chrono::seconds timeout, std::stop_token stop) {
    if (stop.stop_requested()) {
        return Error{ErrorCode::OperationCancelled, "Request cancelled before start"};
    }

    ensureCurlInitialized();
    std::unique_ptr<CURL, CurlDeleter> handle(curl_easy_init());
    if (!handle) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    curl_slist* rawHeaders = nullptr;
    rawHeaders = curl_slist_append(rawHeaders, "Content-Type: application/json");
    rawHeaders = curl_slist_append(rawHeaders, "Accept: application/json");
    std::unique_ptr<curl_slist, SlistDeleter> headers(rawHeaders);

    HttpResponse response;
    CURL* h = handle.get();
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(h, CURLOPT_TIMEOUT, static_cast<long>(timeout.count()));
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &write_cb);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, &xferinfo_cb);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &stop);

    CURLcode rc = curl_easy_perform(h);
    if (rc != CURLE_OK) {
        auto err = makeCurlError(rc, "POST " + url);
        spdlog::debug("HTTP request failed: {}", err.message);
        return err;
    }

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status < 200 || response.status >= 300) {
        return Error{ErrorCode::NetworkError,
                     "HTTP " + std::to_string(response.status) + " from " + url + ": " +
                         response.body.substr(0, 256)};
    }
    return response;
}

} // namespace sift::net
