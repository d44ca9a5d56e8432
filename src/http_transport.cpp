#include "sengled/http_transport.h"
#include "sengled/errors.h"
#include "sengled/logger.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace sengled {

namespace {

std::once_flag curl_init_flag;

size_t write_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlHttpTransport::CurlHttpTransport(long timeout_secs) : timeout_secs_(timeout_secs) {
    // curl_global_init is not thread-safe; run it once per process
    std::call_once(curl_init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw TransportError("curl_global_init failed");
        }
    });
}

CurlHttpTransport::~CurlHttpTransport() = default;

std::string CurlHttpTransport::post(const HttpRequest& request) {
    auto& logger = Logger::instance();

    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) throw TransportError("curl_easy_init failed");

    curl_slist* header_list = nullptr;
    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(header_list, line.c_str());
        if (!appended) {
            curl_slist_free_all(header_list);
            throw TransportError("curl_slist_append failed");
        }
        header_list = appended;
    }
    std::unique_ptr<curl_slist, HeaderListDeleter> headers(header_list);

    std::string response_body;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_secs_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    logger.debugf("POST %s (%zu bytes)", request.url.c_str(), request.body.size());
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string reason = error_buffer[0] ? error_buffer : curl_easy_strerror(res);
        logger.errorf("POST %s failed: %s", request.url.c_str(), reason.c_str());
        throw TransportError("HTTP request to " + request.url + " failed: " + reason);
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        logger.errorf("POST %s returned HTTP %ld", request.url.c_str(), status);
        throw TransportError("HTTP request to " + request.url + " returned status " + std::to_string(status));
    }

    logger.debugf("POST %s -> HTTP %ld (%zu bytes)", request.url.c_str(), status, response_body.size());
    return response_body;
}

} // namespace sengled
