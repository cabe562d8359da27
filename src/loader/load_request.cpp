#include <remoteimage/loader/load_request.hpp>

namespace remoteimage
{

LoadRequest::LoadRequest(std::string key, Observer observer) : _key(std::move(key)), _observer(std::move(observer))
{
}

LoadStatus LoadRequest::state() const
{
    std::lock_guard<std::mutex> lock(_state_mutex);
    return _state;
}

ImagePtr LoadRequest::image() const
{
    std::lock_guard<std::mutex> lock(_state_mutex);
    return _image;
}

std::optional<FailureReason> LoadRequest::failure() const
{
    std::lock_guard<std::mutex> lock(_state_mutex);
    return _failure;
}

bool LoadRequest::is_terminal() const
{
    return isTerminal(state());
}

void LoadRequest::cancel()
{
    _detached.store(true);
}

bool LoadRequest::is_detached() const
{
    return _detached.load();
}

void LoadRequest::publish(const LoadEvent &event)
{
    if (_detached.load())
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (isTerminal(_state) || _state == event.status)
        {
            return;
        }
        _state = event.status;
        _image = event.image;
        _failure = event.failure;
    }

    if (_observer)
    {
        _observer(event);
    }
}

} // namespace remoteimage
