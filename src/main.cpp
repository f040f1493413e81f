#include "fetcher/curl_http_client.hpp"
#include "fetcher/downloader.hpp"
#include "fetcher/progress_panel.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] <url>[=<file>] [<url>[=<file>] ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Download directory (default: $HOME/Download)\n"
              << "  -c <count>       Maximum concurrent downloads (default: 1)\n"
              << "  -o <policy>      Existing files: fail, overwrite or rename (default: fail)\n"
              << "  -H <header>      Extra request header \"Name: value\" (repeatable)\n"
              << "  -x <proxy>       Proxy for http and https (default: http_proxy/https_proxy)\n"
              << "  -v               More logging (repeatable)\n"
              << "  -h, --help       Show this message" << std::endl;
}

fetcher::OverwritePolicy parsePolicy(const std::string& value) {
    if (value == "fail") {
        return fetcher::OverwritePolicy::fail_if_exists;
    }
    if (value == "overwrite") {
        return fetcher::OverwritePolicy::overwrite;
    }
    if (value == "rename") {
        return fetcher::OverwritePolicy::rename_on_conflict;
    }
    throw std::runtime_error("Invalid overwrite policy: " + value);
}

std::pair<std::string, std::string> parseHeader(const std::string& value) {
    const auto colon = value.find(':');
    if (colon == std::string::npos || colon == 0) {
        throw std::runtime_error("Invalid header: " + value);
    }
    std::string name = value.substr(0, colon);
    std::string content = value.substr(colon + 1);
    const auto first = content.find_first_not_of(' ');
    content = first == std::string::npos ? std::string{} : content.substr(first);
    return {std::move(name), std::move(content)};
}

void setupLogging(int verbosity) {
    auto logger = spdlog::stderr_color_mt("fetcher");
    spdlog::set_default_logger(logger);
    if (verbosity >= 2) {
        spdlog::set_level(spdlog::level::debug);
    } else if (verbosity == 1) {
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        fetcher::DownloaderSettings settings;
        settings.agent = fetcher::TransportAgent::fromEnvironment();
        int verbosity = 0;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option == "-v" || option == "-vv") {
                verbosity += static_cast<int>(option.size()) - 1;
                arg_index += 1;
                continue;
            }
            if (option != "-d" && option != "-c" && option != "-o" && option != "-H" &&
                option != "-x") {
                printUsage(argv[0]);
                return 1;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            const std::string value = argv[arg_index + 1];
            if (option == "-d") {
                settings.directory = value;
            } else if (option == "-c") {
                int count = 0;
                try {
                    count = std::stoi(value);
                } catch (const std::exception&) {
                    throw std::runtime_error("Invalid download count: " + value);
                }
                if (count <= 0 || count > 64) {
                    throw std::runtime_error("Download count must be between 1 and 64.");
                }
                settings.max_concurrent_downloads = static_cast<std::size_t>(count);
            } else if (option == "-o") {
                settings.overwrite = parsePolicy(value);
            } else if (option == "-H") {
                auto header = parseHeader(value);
                settings.headers[header.first] = header.second;
            } else if (option == "-x") {
                settings.agent = fetcher::TransportAgent::forProxy(value);
            }
            arg_index += 2;
        }

        if (arg_index >= argc) {
            printUsage(argv[0]);
            return 1;
        }

        setupLogging(verbosity);

        fetcher::Downloader downloader(std::make_shared<fetcher::CurlHttpClient>(),
                                       std::make_shared<fetcher::LocalFileSystem>(),
                                       std::move(settings));

        std::vector<fetcher::DownloadPtr> downloads;
        for (int i = arg_index; i < argc; ++i) {
            const std::string argument = argv[i];
            fetcher::DownloadOptions options;
            std::string url = argument;
            const auto separator = argument.rfind('=');
            const auto scheme = argument.find("://");
            if (separator != std::string::npos && scheme != std::string::npos &&
                separator > scheme && argument.find('/', separator) == std::string::npos &&
                argument.find('?') == std::string::npos) {
                url = argument.substr(0, separator);
                options.out = argument.substr(separator + 1);
            }
            downloads.push_back(downloader.add(url, options));
        }

        fetcher::ProgressPanel panel(downloader);
        while (downloader.hasPending()) {
            downloader.poll(std::chrono::milliseconds{200});
            panel.redraw();
        }
        panel.redraw();

        int failures = 0;
        for (const auto& download : downloads) {
            if (const auto* error = download->error()) {
                std::cerr << download->url() << ": " << error->what() << " ["
                          << fetcher::toString(error->code()) << "]" << std::endl;
                ++failures;
            }
        }
        return failures == 0 ? 0 : 2;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
