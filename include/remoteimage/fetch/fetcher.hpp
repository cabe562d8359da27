#pragma once

#include <string>

namespace remoteimage
{

struct FetchResult
{
    bool success = false;
    int status_code = 0;
    std::string body;
    std::string error;
};

// Retrieves the raw bytes behind a URL. Called concurrently from worker threads.
class Fetcher
{
  public:
    virtual ~Fetcher() = default;
    virtual FetchResult fetch(const std::string &url) = 0;
};

} // namespace remoteimage
