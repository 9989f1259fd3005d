#include "core/CacheDirectory.hpp"
#include "core/Errors.hpp"
#include "core/FeedSourceSet.hpp"
#include "core/NewsPipeline.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace newsfeed::core;

struct CliOptions {
    PipelineConfig config;
    std::filesystem::path feedsFile;  // Empty: <cache root>/feeds.json
};

void printHelp() {
    std::cout << "\nNewsfeed Commands:\n"
              << "Usage: newsfeed [options] [command] [arguments]\n\n"
              << "News:\n"
              << "  fetch                - Fetch all enabled feeds and print the stored items\n"
              << "  list [n]             - Print the newest n stored items (default: all)\n"
              << "  watch <seconds>      - Fetch repeatedly until interrupted\n\n"
              << "Feed Sources:\n"
              << "  sources              - List configured feeds\n"
              << "  add <url> [name]     - Add a feed\n"
              << "  remove <url|name>    - Remove a feed\n"
              << "  enable <url|name>    - Enable a feed\n"
              << "  disable <url|name>   - Disable a feed\n\n"
              << "General:\n"
              << "  help                 - Show this help\n"
              << "  quit                 - Exit program\n\n"
              << "Options:\n"
              << "  --cache-dir <dir>    - Cache root (default: $XDG_CACHE_HOME/newsfeed)\n"
              << "  --feeds <file>       - Feed list file (default: <cache root>/feeds.json)\n"
              << "  --workers <n>        - Concurrent downloads (default: 8)\n"
              << "  --timeout <seconds>  - HTTP timeout (default: 30)\n"
              << "  --no-images          - Do not download thumbnails\n"
              << "  --quiet              - Only print errors and results\n"
              << "\n"
              << "If no command is provided, the program will start in interactive mode.\n\n";
}

void printItemList(const std::vector<NewsItem>& items, std::size_t limit = 0) {
    if (items.empty()) {
        std::cout << "No news items stored.\n";
        return;
    }

    const std::size_t count = (limit == 0 || limit > items.size()) ? items.size() : limit;
    for (std::size_t i = 0; i < count; ++i) {
        const auto& item = items[i];
        std::cout << std::left << std::setw(26)
                  << (item.publishDate ? item.publishDate->toIso8601() : std::string("-"))
                  << item.toString() << "\n";
    }
    std::cout << count << " of " << items.size() << " items\n";
}

void printSourceList(const FeedSourceSet& sources) {
    auto feeds = sources.getFeeds();
    if (feeds.empty()) {
        std::cout << "No feeds configured.\n";
        return;
    }

    std::cout << "\nConfigured Feeds:\n";
    std::cout << std::string(60, '-') << "\n";
    for (const auto& feed : feeds) {
        std::string marker = feed.enabled ? "* " : "  ";
        std::cout << marker << std::left << std::setw(20) << feed.label()
                  << " | " << feed.url << "\n";
    }
    std::cout << std::string(60, '-') << "\n";
    std::cout << "* = Enabled\n";
}

void printFailures(const RunReport& report) {
    for (const auto& failure : report.feedFailures) {
        std::cerr << "Feed failed: " << failure.url << ": " << failure.reason << "\n";
    }
    for (const auto& failure : report.imageFailures) {
        std::cerr << "Image failed: " << failure.url << ": " << failure.error << "\n";
    }
}

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

// Sleep in short steps so a signal ends the wait promptly.
void waitFor(std::chrono::seconds interval) {
    const auto deadline = std::chrono::steady_clock::now() + interval;
    while (g_running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

std::size_t parseCount(const std::string& text, const std::string& what) {
    std::size_t consumed = 0;
    long value = 0;
    try {
        value = std::stol(text, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError("Invalid " + what + ": " + text);
    }
    if (consumed != text.size() || value < 0) {
        throw ConfigurationError("Invalid " + what + ": " + text);
    }
    return static_cast<std::size_t>(value);
}

void handleCommand(const CliOptions& options, FeedSourceSet& sources, const std::string& command,
                   const std::vector<std::string>& args = {}) {
    try {
        if (command == "fetch") {
            NewsPipeline pipeline(options.config, sources.getFeeds());
            auto result = pipeline.run();
            printFailures(result.report);
            printItemList(result.items);
        }
        else if (command == "list") {
            std::size_t limit = args.empty() ? 0 : parseCount(args[0], "item count");
            NewsPipeline pipeline(options.config, sources.getFeeds());
            printItemList(pipeline.storedItems(), limit);
        }
        else if (command == "watch") {
            if (args.empty()) {
                std::cout << "Usage: watch <seconds>\n";
                return;
            }
            std::size_t seconds = parseCount(args[0], "interval");
            if (seconds == 0) {
                throw ConfigurationError("Interval must be at least one second");
            }

            std::cout << "Fetching every " << seconds << "s. Press Ctrl+C to stop.\n";
            NewsPipeline pipeline(options.config, sources.getFeeds());
            while (g_running) {
                auto result = pipeline.run();
                printFailures(result.report);
                if (!options.config.verbose) {
                    std::cout << result.report.summary() << "\n";
                }
                waitFor(std::chrono::seconds(seconds));
            }
        }
        else if (command == "sources") {
            printSourceList(sources);
        }
        else if (command == "add") {
            if (args.empty()) {
                std::cout << "Usage: add <url> [name]\n";
                return;
            }
            std::string name = args.size() > 1 ? args[1] : "";
            sources.addFeed(args[0], name);
        }
        else if (command == "remove") {
            if (args.empty()) {
                std::cout << "Usage: remove <url|name>\n";
                return;
            }
            sources.removeFeed(args[0]);
        }
        else if (command == "enable" || command == "disable") {
            if (args.empty()) {
                std::cout << "Usage: " << command << " <url|name>\n";
                return;
            }
            if (sources.setEnabled(args[0], command == "enable")) {
                std::cout << (command == "enable" ? "Enabled" : "Disabled") << " feed: " << args[0] << "\n";
            }
        }
        else if (command == "help") {
            printHelp();
        }
        else {
            std::cout << "Unknown command. Type 'help' for available commands.\n";
        }
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        throw;
    }
}

std::vector<std::string> parseArguments(const std::string& input) {
    std::vector<std::string> args;
    std::stringstream ss(input);
    std::string arg;

    while (ss >> arg) {
        args.push_back(arg);
    }

    return args;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        CliOptions options;
        std::vector<std::string> commands;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help") {
                printHelp();
                return 0;
            } else if (arg == "--cache-dir" && i + 1 < argc) {
                options.config.cacheRoot = argv[++i];
            } else if (arg == "--feeds" && i + 1 < argc) {
                options.feedsFile = argv[++i];
            } else if (arg == "--workers" && i + 1 < argc) {
                options.config.workers = parseCount(argv[++i], "worker count");
                if (options.config.workers == 0) {
                    throw ConfigurationError("Worker count must be at least 1");
                }
            } else if (arg == "--timeout" && i + 1 < argc) {
                options.config.timeout = std::chrono::seconds(parseCount(argv[++i], "timeout"));
            } else if (arg == "--no-images") {
                options.config.downloadImages = false;
            } else if (arg == "--quiet") {
                options.config.verbose = false;
            } else if (arg.rfind("--", 0) == 0) {
                std::cerr << "Unknown option: " << arg << "\n";
                printHelp();
                return 1;
            } else {
                commands.push_back(arg);
            }
        }

        if (options.feedsFile.empty()) {
            options.feedsFile = resolveCacheRoot(options.config.cacheRoot) / "feeds.json";
        }
        FeedSourceSet sources(options.feedsFile);

        // Handle command line arguments if provided
        if (!commands.empty()) {
            std::string command = commands[0];
            std::vector<std::string> args(commands.begin() + 1, commands.end());

            try {
                handleCommand(options, sources, command, args);
            }
            catch (const std::exception&) {
                return 1;
            }
            return 0;
        }

        // Interactive mode
        std::cout << "Welcome to Newsfeed!\n";
        printHelp();

        std::string input;

        while (g_running) {
            std::cout << "\nEnter command: ";
            if (!std::getline(std::cin, input)) {
                break;
            }

            try {
                if (input.empty()) {
                    continue;
                }
                else if (input == "quit") {
                    g_running = false;
                }
                else {
                    auto parsedArgs = parseArguments(input);
                    if (!parsedArgs.empty()) {
                        std::string command = parsedArgs[0];
                        std::vector<std::string> args(parsedArgs.begin() + 1, parsedArgs.end());
                        handleCommand(options, sources, command, args);
                        if (command == "watch") {
                            g_running = true;
                        }
                    }
                }
            }
            catch (const std::exception&) {
                // Already reported by handleCommand
            }
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
