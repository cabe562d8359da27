#pragma once

#include <remoteimage/cache/image_cache.hpp>
#include <remoteimage/fetch/curl_fetcher.hpp>

namespace remoteimage
{

struct LoaderConfig
{
    CacheConfig cache;
    FetchOptions fetch;
    size_t worker_threads = 4; // 0 --> one per hardware thread
};

} // namespace remoteimage
