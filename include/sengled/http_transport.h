#pragma once

#include <string>
#include <utility>
#include <vector>

namespace sengled {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
    std::string url;
    std::string body;       // sent as-is, may be empty
    HeaderList headers;
};

class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Returns the response body of a 2xx answer; throws TransportError otherwise
    virtual std::string post(const HttpRequest& request) = 0;
};

// libcurl implementation. One easy handle per request, so concurrent posts are safe.
class CurlHttpTransport : public HttpTransport {
public:
    explicit CurlHttpTransport(long timeout_secs);
    ~CurlHttpTransport() override;

    CurlHttpTransport(const CurlHttpTransport&) = delete;
    CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

    std::string post(const HttpRequest& request) override;

private:
    long timeout_secs_;
};

} // namespace sengled
