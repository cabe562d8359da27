#include <remoteimage/io/load_config.hpp>

#include <spdlog/spdlog.h>

#define RAPIDJSON_HAS_STDSTRING 1
#include <rapidjson/document.h>

#include <fstream>
#include <sstream>

namespace
{
bool readSize(const rapidjson::Value &object, const char *name, size_t &out)
{
    if (!object.HasMember(name))
    {
        return true;
    }
    const auto &v = object[name];
    if (!v.IsUint64())
    {
        spdlog::error("Config value '{}' must be a non-negative integer", name);
        return false;
    }
    out = static_cast<size_t>(v.GetUint64());
    return true;
}

bool readInt(const rapidjson::Value &object, const char *name, int &out)
{
    if (!object.HasMember(name))
    {
        return true;
    }
    const auto &v = object[name];
    if (!v.IsInt() || v.GetInt() < 0)
    {
        spdlog::error("Config value '{}' must be a non-negative integer", name);
        return false;
    }
    out = v.GetInt();
    return true;
}

bool readBool(const rapidjson::Value &object, const char *name, bool &out)
{
    if (!object.HasMember(name))
    {
        return true;
    }
    const auto &v = object[name];
    if (!v.IsBool())
    {
        spdlog::error("Config value '{}' must be true or false", name);
        return false;
    }
    out = v.GetBool();
    return true;
}

bool readString(const rapidjson::Value &object, const char *name, std::string &out)
{
    if (!object.HasMember(name))
    {
        return true;
    }
    const auto &v = object[name];
    if (!v.IsString())
    {
        spdlog::error("Config value '{}' must be a string", name);
        return false;
    }
    out = v.GetString();
    return true;
}
} // namespace

namespace remoteimage
{

bool load_config(const std::string &path, LoaderConfig &config)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        spdlog::warn("Config file not found at: {}", path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (!parse_config(buffer.str(), config))
    {
        spdlog::error("Failed to load config from {}", path);
        return false;
    }
    spdlog::info("Loaded config from {}", path);
    return true;
}

bool parse_config(const std::string &json, LoaderConfig &config)
{
    rapidjson::Document doc;
    doc.Parse(json.c_str());

    if (doc.HasParseError())
    {
        spdlog::error("Failed to parse config JSON: error at offset {}", doc.GetErrorOffset());
        return false;
    }
    if (!doc.IsObject())
    {
        spdlog::error("Config JSON must be an object");
        return false;
    }

    // only touch the caller's config once everything parsed
    LoaderConfig parsed = config;
    bool ok = readSize(doc, "worker_threads", parsed.worker_threads);

    if (doc.HasMember("cache"))
    {
        const auto &cache = doc["cache"];
        if (!cache.IsObject())
        {
            spdlog::error("Config value 'cache' must be an object");
            return false;
        }
        ok = ok && readSize(cache, "max_bytes", parsed.cache.max_bytes);
        ok = ok && readSize(cache, "max_entries", parsed.cache.max_entries);
    }

    if (doc.HasMember("fetch"))
    {
        const auto &fetch = doc["fetch"];
        if (!fetch.IsObject())
        {
            spdlog::error("Config value 'fetch' must be an object");
            return false;
        }
        ok = ok && readInt(fetch, "timeout_seconds", parsed.fetch.timeout_seconds);
        ok = ok && readInt(fetch, "connect_timeout_seconds", parsed.fetch.connect_timeout_seconds);
        ok = ok && readBool(fetch, "follow_redirects", parsed.fetch.follow_redirects);
        ok = ok && readInt(fetch, "max_redirects", parsed.fetch.max_redirects);
        ok = ok && readString(fetch, "user_agent", parsed.fetch.user_agent);
        ok = ok && readSize(fetch, "max_body_bytes", parsed.fetch.max_body_bytes);
    }

    if (!ok)
    {
        return false;
    }

    config = parsed;
    return true;
}

} // namespace remoteimage
