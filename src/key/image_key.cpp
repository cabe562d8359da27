#include <remoteimage/key/image_key.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace
{
std::string toLower(const std::string &s)
{
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::string trim(const std::string &s)
{
    const char *whitespace = " \t\r\n\f\v";
    size_t begin = s.find_first_not_of(whitespace);
    if (begin == std::string::npos)
    {
        return "";
    }
    size_t end = s.find_last_not_of(whitespace);
    return s.substr(begin, end - begin + 1);
}

bool validScheme(const std::string &scheme)
{
    if (scheme.empty() || !std::isalpha(static_cast<unsigned char>(scheme[0])))
    {
        return false;
    }
    return std::all_of(scheme.begin(), scheme.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '+' || c == '-' || c == '.';
    });
}

bool hasSpaceOrControl(const std::string &s)
{
    return std::any_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) || std::iscntrl(c); });
}
} // namespace

namespace remoteimage
{

std::optional<std::string> normalize_url(const std::string &url)
{
    std::string trimmed = trim(url);
    if (trimmed.empty())
    {
        spdlog::debug("Rejecting empty url");
        return std::nullopt;
    }

    if (hasSpaceOrControl(trimmed))
    {
        spdlog::debug("Rejecting url with embedded whitespace: '{}'", trimmed);
        return std::nullopt;
    }

    size_t scheme_end = trimmed.find("://");
    if (scheme_end == std::string::npos)
    {
        spdlog::debug("Rejecting url without scheme: '{}'", trimmed);
        return std::nullopt;
    }

    std::string scheme = toLower(trimmed.substr(0, scheme_end));
    if (!validScheme(scheme) || (scheme != "http" && scheme != "https" && scheme != "file"))
    {
        spdlog::debug("Rejecting url with unsupported scheme '{}': '{}'", scheme, trimmed);
        return std::nullopt;
    }

    // drop the fragment, it never reaches the server
    std::string rest = trimmed.substr(scheme_end + 3);
    size_t fragment = rest.find('#');
    if (fragment != std::string::npos)
    {
        rest = rest.substr(0, fragment);
    }

    size_t path_begin = rest.find_first_of("/?");
    std::string authority = rest.substr(0, path_begin);
    std::string path = path_begin == std::string::npos ? "" : rest.substr(path_begin);

    if (scheme == "file")
    {
        if (path.empty() || path[0] != '/')
        {
            spdlog::debug("Rejecting file url without path: '{}'", trimmed);
            return std::nullopt;
        }
        return scheme + "://" + toLower(authority) + path;
    }

    // userinfo is kept verbatim, only the host part is case-insensitive
    std::string userinfo;
    std::string host = authority;
    size_t at = authority.rfind('@');
    if (at != std::string::npos)
    {
        userinfo = authority.substr(0, at + 1);
        host = authority.substr(at + 1);
    }

    std::string hostname;
    if (!host.empty() && host[0] == '[')
    {
        hostname = host.substr(0, host.find(']'));
    }
    else
    {
        hostname = host.substr(0, host.find(':'));
    }
    if (hostname.empty() || hostname == "[")
    {
        spdlog::debug("Rejecting url without host: '{}'", trimmed);
        return std::nullopt;
    }

    if (path.empty() || path[0] == '?')
    {
        path = "/" + path;
    }

    return scheme + "://" + userinfo + toLower(host) + path;
}

std::string url_scheme(const std::string &key)
{
    size_t scheme_end = key.find("://");
    if (scheme_end == std::string::npos)
    {
        return "";
    }
    return key.substr(0, scheme_end);
}

} // namespace remoteimage
