#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string>

namespace remoteimage
{

// Decodes an encoded image (PNG, JPEG, ...) into a BGR matrix.
// Returns nullopt for empty or unrecognized data, never throws.
std::optional<cv::Mat> decode_image(const std::string &bytes);

// Approximate resident cost of a decoded image
size_t image_byte_size(const cv::Mat &image);

} // namespace remoteimage
