#pragma once

#include <optional>
#include <string>

namespace remoteimage
{

// Validates a URL and converts it to the canonical form used as a cache key.
// Accepts http, https and file URLs. Scheme and host are lower-cased, the
// fragment is dropped and an empty http(s) path becomes "/".
std::optional<std::string> normalize_url(const std::string &url);

// Scheme of an already normalized key, empty if there is none
std::string url_scheme(const std::string &key);

} // namespace remoteimage
