#include "ss/core/atlas/HttpTransport.hpp"

#include <string>

#include <curl/curl.h>

#include "ss/core/util/Errors.hpp"
#include "ss/core/util/Logging.hpp"

namespace ss::allen {

namespace {

struct CurlGlobal {
    CURLcode status;
    CurlGlobal() : status(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() { if (status == CURLE_OK) curl_global_cleanup(); }
};

void ensure_curl_global()
{
    static CurlGlobal global;
    if (global.status != CURLE_OK) {
        throw CollaboratorError(std::string("curl_global_init failed: ") + curl_easy_strerror(global.status));
    }
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

class CurlHandle {
public:
    CurlHandle()
    {
        ensure_curl_global();
        easy = curl_easy_init();
        if (!easy) {
            throw CollaboratorError("curl_easy_init failed");
        }
    }
    ~CurlHandle() { curl_easy_cleanup(easy); }

    CURL* easy = nullptr;
};

CurlTransport::CurlTransport(long timeoutSeconds)
    : handle_(std::make_unique<CurlHandle>()), timeoutSeconds_(timeoutSeconds)
{
}

CurlTransport::~CurlTransport() = default;

std::string CurlTransport::get(const std::string& url)
{
    CURL* easy = handle_->easy;
    curl_easy_reset(easy);

    std::string body;
    char errbuf[CURL_ERROR_SIZE] = {0};

    curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
    curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(easy, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(easy, CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(easy, CURLOPT_FOLLOWLOCATION, 1L);
    if (timeoutSeconds_ > 0) {
        curl_easy_setopt(easy, CURLOPT_CONNECTTIMEOUT, timeoutSeconds_);
        curl_easy_setopt(easy, CURLOPT_TIMEOUT, timeoutSeconds_);
    }

    Logger()->debug("GET {}", url);
    CURLcode res = curl_easy_perform(easy);
    if (res != CURLE_OK) {
        std::string reason = errbuf[0] ? errbuf : curl_easy_strerror(res);
        throw CollaboratorError("GET " + url + " failed: " + reason);
    }

    long status = 0;
    res = curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
    if (res != CURLE_OK) {
        throw CollaboratorError("GET " + url + ": no response code: " + curl_easy_strerror(res));
    }
    if (status >= 400) {
        throw CollaboratorError("GET " + url + " returned HTTP " + std::to_string(status));
    }

    Logger()->debug("GET {} -> {} bytes", url, body.size());
    return body;
}

} // namespace ss::allen
