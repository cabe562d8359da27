#pragma once

#include <remoteimage/fetch/fetcher.hpp>

#include <cstddef>
#include <string>

namespace remoteimage
{

struct FetchOptions
{
    int timeout_seconds = 30;
    int connect_timeout_seconds = 15;
    bool follow_redirects = true;
    int max_redirects = 10;
    std::string user_agent = "remoteimage/1.0";
    size_t max_body_bytes = 128 * 1024 * 1024; // 0 for no limit
};

/**
 * HTTP GET through libcurl. Every fetch uses its own easy handle, so one
 * instance can be shared by all worker threads.
 */
class CurlFetcher : public Fetcher
{
  public:
    explicit CurlFetcher(const FetchOptions &options = FetchOptions());

    // Initialize/cleanup libcurl, call once per process before any fetch
    static bool globalInit();
    static void globalCleanup();

    FetchResult fetch(const std::string &url) override;

    const FetchOptions &options() const
    {
        return _options;
    }

  private:
    static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);

    FetchOptions _options;
};

} // namespace remoteimage
