#pragma once

#include <remoteimage/types/load_state.hpp>

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace remoteimage
{

class ImageLoader;

/**
 * One consumer's interest in one image. Handed out by ImageLoader::load and
 * only ever advanced by the loader: IDLE -> LOADING -> LOADED | FAILED, or
 * straight to a terminal state on a cache hit or an invalid key.
 *
 * Dropping the last shared_ptr or calling cancel() detaches the request;
 * a detached request is never notified again.
 */
class LoadRequest
{
  public:
    using Observer = std::function<void(const LoadEvent &)>;

    LoadRequest(std::string key, Observer observer);

    LoadRequest(const LoadRequest &) = delete;
    LoadRequest &operator=(const LoadRequest &) = delete;

    const std::string &key() const
    {
        return _key;
    }

    LoadStatus state() const;
    ImagePtr image() const;
    std::optional<FailureReason> failure() const;
    bool is_terminal() const;

    void cancel();
    bool is_detached() const;

  private:
    friend class ImageLoader;

    // Applies the transition and notifies the observer. Ignored once detached or terminal.
    void publish(const LoadEvent &event);

    const std::string _key;
    const Observer _observer;
    std::atomic<bool> _detached{false};

    mutable std::mutex _state_mutex;
    LoadStatus _state = LoadStatus::IDLE;
    ImagePtr _image;
    std::optional<FailureReason> _failure;
};

} // namespace remoteimage
