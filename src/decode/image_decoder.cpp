#include <remoteimage/decode/image_decoder.hpp>

#include <opencv2/imgcodecs.hpp>
#include <spdlog/spdlog.h>

namespace remoteimage
{

std::optional<cv::Mat> decode_image(const std::string &bytes)
{
    if (bytes.empty())
    {
        return std::nullopt;
    }

    // workers already run in parallel, don't let OpenCV spawn more threads
    if (cv::getNumThreads() != 1)
    {
        cv::setNumThreads(1);
    }

    cv::Mat image;
    try
    {
        const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<char *>(bytes.data()));
        image = cv::imdecode(raw, cv::IMREAD_COLOR);
    }
    catch (const cv::Exception &e)
    {
        spdlog::warn("Image decode raised: {}", e.what());
        return std::nullopt;
    }

    if (image.empty())
    {
        return std::nullopt;
    }
    return image;
}

size_t image_byte_size(const cv::Mat &image)
{
    return image.total() * image.elemSize();
}

} // namespace remoteimage
