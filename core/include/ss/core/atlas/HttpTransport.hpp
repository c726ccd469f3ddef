#pragma once

#include <memory>
#include <string>

namespace ss::allen {

// Blocking HTTP GET. Implementations throw ss::CollaboratorError on transport
// failures and on HTTP error statuses; no retries.
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual std::string get(const std::string& url) = 0;
};

class CurlHandle;

// libcurl based transport. One easy handle is reused across requests, so an
// instance must not be shared between threads.
class CurlTransport : public IHttpTransport {
public:
    // timeoutSeconds == 0 leaves the request unbounded.
    explicit CurlTransport(long timeoutSeconds = 0);
    ~CurlTransport() override;

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    std::string get(const std::string& url) override;

private:
    std::unique_ptr<CurlHandle> handle_;
    long timeoutSeconds_;
};

} // namespace ss::allen
