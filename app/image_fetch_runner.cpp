#include <remoteimage/cache/image_cache.hpp>
#include <remoteimage/fetch/curl_fetcher.hpp>
#include <remoteimage/io/load_config.hpp>
#include <remoteimage/loader/image_loader.hpp>
#include <remoteimage/runtime/delivery_queue.hpp>
#include <remoteimage/runtime/worker_pool.hpp>

#include <opencv2/imgcodecs.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include "CommandLine.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace remoteimage;
using namespace std::chrono_literals;

namespace
{
std::vector<std::string> read_url_list(const std::string &path)
{
    std::vector<std::string> urls;
    std::ifstream input(path);
    if (!input.is_open())
    {
        spdlog::error("Could not open url list {}", path);
        return urls;
    }

    std::string line;
    while (std::getline(input, line))
    {
        if (line.empty() || line[0] == '#')
        {
            continue;
        }
        urls.push_back(line);
    }
    return urls;
}
} // namespace

int main(int argc, char *argv[])
{
    std::string url = "";
    std::string url_list_file = "";
    std::string config_file = "";
    std::string output_dir = "";
    std::string log_file = "";
    uint32_t debug_level = 2;
    int32_t cache_megabytes = -1;
    int32_t max_entries = -1;
    int32_t threads = -1;
    int32_t timeout = -1;
    uint32_t repeat = 1;
    bool printHelp = false;

    CommandLine args("Load images from urls through the remoteimage cache and loader");
    args.addArgument({"-u", "--url"}, &url, "Single image url to load");
    args.addArgument({"-i", "--input"}, &url_list_file, "File with one image url per line");
    args.addArgument({"-c", "--config"}, &config_file, "JSON configuration file");
    args.addArgument({"-o", "--output-dir"}, &output_dir, "Write every loaded image as PNG into this directory");
    args.addArgument({"-b", "--cache-mb"}, &cache_megabytes, "Cache capacity in megabytes, 0 for unlimited");
    args.addArgument({"-n", "--max-entries"}, &max_entries, "Maximum number of cached images, 0 for unlimited");
    args.addArgument({"-t", "--threads"}, &threads, "Number of fetch threads, 0 for one per core");
    args.addArgument({"--timeout"}, &timeout, "Per request timeout in seconds");
    args.addArgument({"-r", "--repeat"}, &repeat, "Load the whole list this many times");
    args.addArgument({"-d", "--debug"}, &debug_level, "none=0, critical=1, error=2, warn=3, info=4, debug=5");
    args.addArgument({"-l", "--log-file"}, &log_file, "Output logging file, overwrites existing files");
    args.addArgument({"-h", "--help"}, &printHelp, "You must specify at least one url or an url list");

    try
    {
        args.parse(argc, argv);
    }
    catch (std::runtime_error const &e)
    {
        std::cout << e.what() << std::endl;
        return -1;
    }

    if (printHelp)
    {
        args.printHelp();
        return 0;
    }

    auto level = spdlog::level::err;
    std::string log_level_str = "err";
    switch (debug_level)
    {
    case 0:
        level = spdlog::level::off;
        log_level_str = "off";
        break;
    case 1:
        level = spdlog::level::critical;
        log_level_str = "critical";
        break;
    case 2:
        level = spdlog::level::err;
        log_level_str = "err";
        break;
    case 3:
        level = spdlog::level::warn;
        log_level_str = "warn";
        break;
    case 4:
        level = spdlog::level::info;
        log_level_str = "info";
        break;
    case 5:
        level = spdlog::level::debug;
        log_level_str = "debug";
        break;
    }
    spdlog::set_level(level);
    if (log_file.size() > 0)
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
        spdlog::default_logger()->sinks().push_back(std::move(file_sink));
    }
    spdlog::info("Log level set to {}", log_level_str);

    LoaderConfig config;
    if (config_file.size() > 0 && !load_config(config_file, config))
    {
        std::cout << "Could not load config file " << config_file << std::endl;
        return -1;
    }
    if (cache_megabytes >= 0)
        config.cache.max_bytes = static_cast<size_t>(cache_megabytes) * 1024 * 1024;
    if (max_entries >= 0)
        config.cache.max_entries = static_cast<size_t>(max_entries);
    if (threads >= 0)
        config.worker_threads = static_cast<size_t>(threads);
    if (timeout > 0)
        config.fetch.timeout_seconds = timeout;

    std::vector<std::string> urls;
    if (url.size() > 0)
    {
        urls.push_back(url);
    }
    if (url_list_file.size() > 0)
    {
        std::vector<std::string> listed = read_url_list(url_list_file);
        urls.insert(urls.end(), listed.begin(), listed.end());
    }
    if (urls.empty())
    {
        args.printHelp();
        return -1;
    }

    if (output_dir.size() > 0)
    {
        std::filesystem::create_directories(output_dir);
    }

    if (!CurlFetcher::globalInit())
    {
        return -1;
    }

    size_t failures = 0;
    {
        ImageCache cache(config.cache);
        CurlFetcher fetcher(config.fetch);
        DeliveryQueue delivery;
        WorkerPool workers(config.worker_threads);
        ImageLoader loader(cache, fetcher, workers, delivery);

        spdlog::info("Loading {} urls {} times with {} threads", urls.size(), repeat, workers.size());

        for (uint32_t round = 0; round < std::max(1u, repeat); round++)
        {
            std::vector<std::shared_ptr<LoadRequest>> requests;
            requests.reserve(urls.size());
            for (const auto &u : urls)
            {
                requests.push_back(loader.load(u));
            }

            auto all_done = [&requests]() {
                return std::all_of(requests.begin(), requests.end(),
                                   [](const std::shared_ptr<LoadRequest> &r) { return r->is_terminal(); });
            };
            while (!all_done())
            {
                delivery.wait_and_run(100ms);
            }

            for (size_t i = 0; i < requests.size(); i++)
            {
                const auto &r = requests[i];
                std::cout << loadStatusToString(r->state()) << " ";
                if (r->state() == LoadStatus::LOADED)
                {
                    ImagePtr image = r->image();
                    std::cout << image->cols << "x" << image->rows;
                    if (output_dir.size() > 0 && round == 0)
                    {
                        std::filesystem::path out = std::filesystem::path(output_dir) / (std::to_string(i) + ".png");
                        if (!cv::imwrite(out.string(), *image))
                        {
                            spdlog::error("Failed to write {}", out.string());
                        }
                    }
                }
                else
                {
                    std::cout << failureReasonToString(r->failure().value_or(FailureReason::NETWORK_ERROR));
                    failures++;
                }
                std::cout << " " << r->key() << std::endl;
            }
        }

        LoaderStatistics stats = loader.statistics();
        std::cout << "requests: " << stats.requests << " cache hits: " << stats.cache_hits
                  << " fetches: " << stats.fetches << " coalesced: " << stats.coalesced << " loaded: " << stats.loaded
                  << " failed: " << stats.failed << " rejected: " << stats.rejected << std::endl;
        std::cout << "cache: " << cache.size_entries() << " entries, " << cache.size_bytes() << " bytes, "
                  << cache.getEvictions() << " evictions" << std::endl;
    }

    CurlFetcher::globalCleanup();
    return failures > 0 ? 1 : 0;
}
