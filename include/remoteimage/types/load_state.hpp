#pragma once

#include <opencv2/core.hpp>

#include <memory>
#include <optional>
#include <string>

namespace remoteimage
{

using ImagePtr = std::shared_ptr<const cv::Mat>;

enum class LoadStatus
{
    IDLE,
    LOADING,
    LOADED,
    FAILED
};

enum class FailureReason
{
    INVALID_KEY,
    NETWORK_ERROR,
    DECODE_ERROR
};

struct LoadEvent
{
    std::string key;
    LoadStatus status = LoadStatus::IDLE;

    // only set when status == LOADED
    ImagePtr image;

    // only set when status == FAILED
    std::optional<FailureReason> failure;
    std::string message;
};

inline std::string loadStatusToString(LoadStatus status)
{
    switch (status)
    {
    case LoadStatus::IDLE:
        return "IDLE";
    case LoadStatus::LOADING:
        return "LOADING";
    case LoadStatus::LOADED:
        return "LOADED";
    case LoadStatus::FAILED:
        return "FAILED";
    }
    return "";
}

inline std::string failureReasonToString(FailureReason reason)
{
    switch (reason)
    {
    case FailureReason::INVALID_KEY:
        return "INVALID_KEY";
    case FailureReason::NETWORK_ERROR:
        return "NETWORK_ERROR";
    case FailureReason::DECODE_ERROR:
        return "DECODE_ERROR";
    }
    return "";
}

inline bool isTerminal(LoadStatus status)
{
    return status == LoadStatus::LOADED || status == LoadStatus::FAILED;
}

} // namespace remoteimage
