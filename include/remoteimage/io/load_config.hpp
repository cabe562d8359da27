#pragma once

#include <remoteimage/types/loader_config.hpp>

#include <string>

namespace remoteimage
{

// Reads a JSON configuration file over the values already in config.
// Keys that are absent keep their current value.
bool load_config(const std::string &path, LoaderConfig &config);

// Same, from an in-memory JSON document
bool parse_config(const std::string &json, LoaderConfig &config);

} // namespace remoteimage
