#pragma once

#include <remoteimage/loader/load_request.hpp>

#include <memory>
#include <string>

namespace remoteimage
{

class DeliveryQueue;
class Fetcher;
class ImageCache;
class WorkerPool;

struct LoaderStatistics
{
    size_t requests = 0;
    size_t rejected = 0;   // invalid keys
    size_t cache_hits = 0;
    size_t fetches = 0;    // network fetches started
    size_t coalesced = 0;  // requests that joined a running fetch
    size_t loaded = 0;     // fetches that produced an image
    size_t failed = 0;     // fetches that failed to transfer or decode
};

/**
 * Resolves URLs to decoded images through the shared cache, coalescing
 * concurrent requests for the same key into a single fetch.
 *
 * load() is meant to be called from the thread that drains the delivery
 * queue. Cache hits, invalid keys and the LOADING transition are published
 * synchronously inside load(); fetch results are posted to the delivery queue,
 * every request attached to one fetch in the same notification.
 *
 * The cache, fetcher, worker pool and delivery queue must outlive the worker
 * pool's threads.
 */
class ImageLoader
{
  public:
    using Observer = LoadRequest::Observer;

    ImageLoader(ImageCache &cache, Fetcher &fetcher, WorkerPool &workers, DeliveryQueue &delivery);
    ~ImageLoader();

    ImageLoader(const ImageLoader &) = delete;
    ImageLoader &operator=(const ImageLoader &) = delete;

    std::shared_ptr<LoadRequest> load(const std::string &url, Observer observer = nullptr);

    // Detaches every request waiting on a fetch. Fetches still complete and fill the cache.
    size_t cancel_all();

    size_t in_flight_count() const;
    bool is_in_flight(const std::string &url) const;

    LoaderStatistics statistics() const;

  private:
    struct Shared;

    static void runFetch(const std::shared_ptr<Shared> &shared, const std::string &key);
    static LoadEvent fetchAndDecode(const std::shared_ptr<Shared> &shared, const std::string &key);
    static void complete(const std::shared_ptr<Shared> &shared, const LoadEvent &event);

    std::shared_ptr<Shared> _shared;
    WorkerPool &_workers;
};

} // namespace remoteimage
