#include <remoteimage/fetch/curl_fetcher.hpp>

#include <remoteimage/key/image_key.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace
{
struct BodyBuffer
{
    std::string &body;
    size_t limit;
    bool overflowed = false;
};

struct EasyHandleDeleter
{
    void operator()(CURL *curl) const
    {
        curl_easy_cleanup(curl);
    }
};
} // namespace

namespace remoteimage
{

CurlFetcher::CurlFetcher(const FetchOptions &options) : _options(options)
{
}

bool CurlFetcher::globalInit()
{
    CURLcode res = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (res != CURLE_OK)
    {
        spdlog::error("curl_global_init failed: {}", curl_easy_strerror(res));
        return false;
    }
    return true;
}

void CurlFetcher::globalCleanup()
{
    curl_global_cleanup();
}

size_t CurlFetcher::writeCallback(void *contents, size_t size, size_t nmemb, void *userp)
{
    size_t total_size = size * nmemb;
    BodyBuffer *buffer = static_cast<BodyBuffer *>(userp);
    if (buffer->limit > 0 && buffer->body.size() + total_size > buffer->limit)
    {
        // anything other than total_size makes curl abort with CURLE_WRITE_ERROR
        buffer->overflowed = true;
        return 0;
    }
    buffer->body.append(static_cast<const char *>(contents), total_size);
    return total_size;
}

FetchResult CurlFetcher::fetch(const std::string &url)
{
    FetchResult result;

    std::unique_ptr<CURL, EasyHandleDeleter> handle(curl_easy_init());
    if (!handle)
    {
        result.error = "curl_easy_init failed";
        return result;
    }
    CURL *curl = handle.get();

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(_options.timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(_options.connect_timeout_seconds));

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, _options.follow_redirects ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, static_cast<long>(_options.max_redirects));

    if (!_options.user_agent.empty())
    {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, _options.user_agent.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    BodyBuffer buffer{result.body, _options.max_body_bytes};
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buffer);

    spdlog::debug("HTTP GET {}", url);
    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK)
    {
        if (buffer.overflowed)
        {
            result.error = "response body exceeds " + std::to_string(_options.max_body_bytes) + " bytes";
        }
        else
        {
            result.error = curl_easy_strerror(res);
        }
        result.body.clear();
        spdlog::warn("Fetch of {} failed: {}", url, result.error);
        return result;
    }

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    result.status_code = static_cast<int>(http_code);

    if (url_scheme(url) == "file")
    {
        // no status line for local files, a completed transfer is a success
        result.success = true;
    }
    else
    {
        result.success = http_code >= 200 && http_code < 300;
        if (!result.success)
        {
            result.error = "HTTP status " + std::to_string(http_code);
        }
    }

    spdlog::debug("HTTP response: {} ({} bytes)", result.status_code, result.body.size());
    return result;
}

} // namespace remoteimage
