#include <remoteimage/loader/image_loader.hpp>

#include <remoteimage/cache/image_cache.hpp>
#include <remoteimage/decode/image_decoder.hpp>
#include <remoteimage/fetch/fetcher.hpp>
#include <remoteimage/key/image_key.hpp>
#include <remoteimage/runtime/delivery_queue.hpp>
#include <remoteimage/runtime/worker_pool.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace
{
remoteimage::LoadEvent make_event(const std::string &key, remoteimage::LoadStatus status)
{
    remoteimage::LoadEvent event;
    event.key = key;
    event.status = status;
    return event;
}

remoteimage::LoadEvent make_failure(const std::string &key, remoteimage::FailureReason reason,
                                    const std::string &message)
{
    remoteimage::LoadEvent event = make_event(key, remoteimage::LoadStatus::FAILED);
    event.failure = reason;
    event.message = message;
    return event;
}
} // namespace

namespace remoteimage
{

struct ImageLoader::Shared
{
    Shared(ImageCache &c, Fetcher &f, DeliveryQueue &d) : cache(c), fetcher(f), delivery(d)
    {
    }

    ImageCache &cache;
    Fetcher &fetcher;
    DeliveryQueue &delivery;

    // key --> requests waiting on the one fetch for that key
    mutable std::mutex registry_mutex;
    std::unordered_map<std::string, std::vector<std::weak_ptr<LoadRequest>>> in_flight;
    LoaderStatistics statistics;
};

ImageLoader::ImageLoader(ImageCache &cache, Fetcher &fetcher, WorkerPool &workers, DeliveryQueue &delivery)
    : _shared(std::make_shared<Shared>(cache, fetcher, delivery)), _workers(workers)
{
}

ImageLoader::~ImageLoader() = default;

std::shared_ptr<LoadRequest> ImageLoader::load(const std::string &url, Observer observer)
{
    std::optional<std::string> normalized = normalize_url(url);
    if (!normalized)
    {
        auto request = std::make_shared<LoadRequest>(url, std::move(observer));
        {
            std::lock_guard<std::mutex> lock(_shared->registry_mutex);
            _shared->statistics.requests++;
            _shared->statistics.rejected++;
        }
        spdlog::warn("Rejecting image request for malformed url '{}'", url);
        request->publish(make_failure(url, FailureReason::INVALID_KEY, "malformed url"));
        return request;
    }

    const std::string &key = *normalized;
    auto request = std::make_shared<LoadRequest>(key, std::move(observer));

    // the cache lookup and the registration happen under one lock, a fetch that
    // completes in between has already filled the cache before leaving the registry
    ImagePtr cached;
    bool start_fetch = false;
    {
        std::lock_guard<std::mutex> lock(_shared->registry_mutex);
        _shared->statistics.requests++;

        auto it = _shared->in_flight.find(key);
        if (auto entry = _shared->cache.get(key))
        {
            cached = entry->payload;
            _shared->statistics.cache_hits++;
        }
        else if (it != _shared->in_flight.end())
        {
            it->second.push_back(request);
            _shared->statistics.coalesced++;
        }
        else
        {
            _shared->in_flight.emplace(key, std::vector<std::weak_ptr<LoadRequest>>{request});
            _shared->statistics.fetches++;
            start_fetch = true;
        }
    }

    if (cached)
    {
        spdlog::debug("Cache hit for {}", key);
        LoadEvent event = make_event(key, LoadStatus::LOADED);
        event.image = cached;
        request->publish(event);
        return request;
    }

    request->publish(make_event(key, LoadStatus::LOADING));

    if (!start_fetch)
    {
        spdlog::debug("Joined running fetch for {}", key);
        return request;
    }

    std::shared_ptr<Shared> shared = _shared;
    bool submitted = _workers.submit([shared, key]() { runFetch(shared, key); });
    if (!submitted)
    {
        // the pool is gone, nothing will ever finish this fetch
        spdlog::warn("Worker pool is shut down, failing request for {}", key);
        std::vector<std::weak_ptr<LoadRequest>> waiting;
        {
            std::lock_guard<std::mutex> lock(_shared->registry_mutex);
            auto it = _shared->in_flight.find(key);
            if (it != _shared->in_flight.end())
            {
                waiting = std::move(it->second);
                _shared->in_flight.erase(it);
            }
            _shared->statistics.failed++;
        }
        LoadEvent event = make_failure(key, FailureReason::NETWORK_ERROR, "worker pool is shut down");
        for (auto &w : waiting)
        {
            if (auto r = w.lock())
            {
                r->publish(event);
            }
        }
    }

    return request;
}

void ImageLoader::runFetch(const std::shared_ptr<Shared> &shared, const std::string &key)
{
    // nothing may escape a worker task, and the registry entry must always be completed
    LoadEvent event;
    try
    {
        event = fetchAndDecode(shared, key);
    }
    catch (const std::exception &e)
    {
        spdlog::error("Loading {} threw: {}", key, e.what());
        event = make_failure(key, FailureReason::NETWORK_ERROR, e.what());
    }
    catch (...)
    {
        spdlog::error("Loading {} threw an unknown exception", key);
        event = make_failure(key, FailureReason::NETWORK_ERROR, "unknown exception");
    }

    complete(shared, event);
}

LoadEvent ImageLoader::fetchAndDecode(const std::shared_ptr<Shared> &shared, const std::string &key)
{
    FetchResult result = shared->fetcher.fetch(key);
    if (!result.success)
    {
        std::string message = result.error.empty() ? "fetch failed" : result.error;
        spdlog::warn("Failed to fetch {}: {}", key, message);
        return make_failure(key, FailureReason::NETWORK_ERROR, message);
    }

    std::optional<cv::Mat> decoded = decode_image(result.body);
    if (!decoded)
    {
        spdlog::warn("Failed to decode {} ({} bytes)", key, result.body.size());
        return make_failure(key, FailureReason::DECODE_ERROR,
                            "undecodable image data (" + std::to_string(result.body.size()) + " bytes)");
    }

    LoadEvent event = make_event(key, LoadStatus::LOADED);
    event.image = std::make_shared<const cv::Mat>(std::move(*decoded));

    // cache before the registry entry goes away, so later requests hit instead of refetching
    shared->cache.set(key, event.image);
    spdlog::debug("Loaded {} ({}x{})", key, event.image->cols, event.image->rows);
    return event;
}

void ImageLoader::complete(const std::shared_ptr<Shared> &shared, const LoadEvent &event)
{
    std::vector<std::shared_ptr<LoadRequest>> waiting;
    {
        std::lock_guard<std::mutex> lock(shared->registry_mutex);
        auto it = shared->in_flight.find(event.key);
        if (it != shared->in_flight.end())
        {
            for (auto &w : it->second)
            {
                auto r = w.lock();
                if (r && !r->is_detached())
                {
                    waiting.push_back(std::move(r));
                }
            }
            shared->in_flight.erase(it);
        }

        if (event.status == LoadStatus::LOADED)
        {
            shared->statistics.loaded++;
        }
        else
        {
            shared->statistics.failed++;
        }
    }

    if (waiting.empty())
    {
        spdlog::debug("No requests left waiting on {}", event.key);
        return;
    }

    shared->delivery.post([waiting, event]() {
        // a throwing observer must not cost its siblings their terminal event
        std::exception_ptr first_error;
        for (const auto &r : waiting)
        {
            try
            {
                r->publish(event);
            }
            catch (...)
            {
                if (!first_error)
                {
                    first_error = std::current_exception();
                }
            }
        }
        if (first_error)
        {
            std::rethrow_exception(first_error);
        }
    });
}

size_t ImageLoader::cancel_all()
{
    size_t detached = 0;
    std::lock_guard<std::mutex> lock(_shared->registry_mutex);
    for (auto &entry : _shared->in_flight)
    {
        for (auto &w : entry.second)
        {
            if (auto r = w.lock())
            {
                if (!r->is_detached())
                {
                    r->cancel();
                    detached++;
                }
            }
        }
        entry.second.clear();
    }
    spdlog::debug("Detached {} requests from {} running fetches", detached, _shared->in_flight.size());
    return detached;
}

size_t ImageLoader::in_flight_count() const
{
    std::lock_guard<std::mutex> lock(_shared->registry_mutex);
    return _shared->in_flight.size();
}

bool ImageLoader::is_in_flight(const std::string &url) const
{
    std::optional<std::string> key = normalize_url(url);
    if (!key)
    {
        return false;
    }
    std::lock_guard<std::mutex> lock(_shared->registry_mutex);
    return _shared->in_flight.find(*key) != _shared->in_flight.end();
}

LoaderStatistics ImageLoader::statistics() const
{
    std::lock_guard<std::mutex> lock(_shared->registry_mutex);
    return _shared->statistics;
}

} // namespace remoteimage
