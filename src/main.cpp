#include "core/Config.hpp"
#include "core/Errors.hpp"
#include "core/Format.hpp"
#include "core/HttpClient.hpp"
#include "core/Orchestrator.hpp"
#include "core/ShowSort.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace showgrab::core;

namespace {

std::atomic<bool> g_running{true};
std::atomic<int> g_interrupts{0};

const std::chrono::milliseconds kPumpInterval(100);
const std::chrono::milliseconds kStatusInterval(250);

// Prints what the core reports; remembers when a fetch or download settles
class ConsoleSink : public EventSink {
public:
    void onShowsLoaded(std::size_t count, const std::string& channelTitle) override {
        feedSettled_ = true;
        feedFailed_ = false;
        if (!channelTitle.empty()) {
            std::cout << channelTitle << "\n";
        }
        std::cout << "Loaded " << count << " shows.\n";
    }

    void onFeedError(ErrorKind kind, const std::string& message) override {
        feedSettled_ = true;
        feedFailed_ = true;
        std::cerr << "Error: Failed to fetch shows (" << toString(kind) << "): " << message << "\n";
    }

    void onDownloadProgress(const ProgressSnapshot& progress) override {
        auto now = std::chrono::steady_clock::now();
        if (now - lastStatus_ < kStatusInterval) {
            return;
        }
        lastStatus_ = now;

        std::string rate = formatBytes(progress.rateBytesPerSec) + "/s";
        std::ostringstream line;
        if (progress.totalBytes > 0) {
            line << "Downloading: " << progress.percent() << "% - " << rate
                 << " - ETA " << formatDuration(progress.etaSeconds);
        } else {
            line << "Downloading: " << formatBytes(static_cast<double>(progress.bytesDownloaded))
                 << " - " << rate;
        }
        std::string text = line.str();
        std::cout << "\r" << std::left << std::setw(static_cast<int>(std::max(text.size(), lastWidth_)))
                  << text << std::flush;
        lastWidth_ = text.size();
    }

    void onDownloadFinished(const DownloadOutcome& outcome) override {
        downloadSettled_ = true;
        std::cout << "\n";
        switch (outcome.state) {
            case DownloadState::Completed:
                std::cout << "Download complete: " << outcome.destination << " ("
                          << formatBytes(static_cast<double>(outcome.progress.bytesDownloaded)) << ")\n";
                break;
            case DownloadState::Canceled:
                std::cout << "Download canceled.\n";
                if (outcome.errorKind != ErrorKind::None) {
                    std::cerr << "Warning: " << outcome.errorMessage << "\n";
                }
                break;
            default:
                std::cerr << "Error: Download failed (" << toString(outcome.errorKind) << "): "
                          << outcome.errorMessage << "\n";
                break;
        }
    }

    void resetFeed() { feedSettled_ = false; feedFailed_ = false; }
    void resetDownload() {
        downloadSettled_ = false;
        lastWidth_ = 0;
        lastStatus_ = std::chrono::steady_clock::time_point{};
    }
    bool feedSettled() const { return feedSettled_; }
    bool feedFailed() const { return feedFailed_; }
    bool downloadSettled() const { return downloadSettled_; }

private:
    bool feedSettled_ = false;
    bool feedFailed_ = false;
    bool downloadSettled_ = false;
    std::size_t lastWidth_ = 0;
    std::chrono::steady_clock::time_point lastStatus_{};
};

void printHelp() {
    std::cout << "\nshowgrab Commands:\n"
              << "Usage: showgrab [options] [command] [arguments]\n\n"
              << "Shows:\n"
              << "  refresh                  - Fetch the show list from the feed\n"
              << "  list [date|size|title]   - List shows (default: newest first)\n"
              << "  show <n>                 - Show details for show number n\n\n"
              << "Downloads:\n"
              << "  download <n> [dir]       - Download show number n (Ctrl+C cancels)\n"
              << "  status                   - Show feed and download status\n\n"
              << "General:\n"
              << "  help                     - Show this help\n"
              << "  quit                     - Exit program\n\n"
              << "Options:\n"
              << "  --config <file>          - Configuration file (default: showgrab.json)\n"
              << "  --feed <url>             - Feed URL, overrides the configuration\n"
              << "  --dir <path>             - Download directory, overrides the configuration\n"
              << "  --help                   - Show this help\n"
              << "\n"
              << "If no command is given, the program starts in interactive mode.\n\n";
}

std::string defaultDownloadDir() {
    const char* home = std::getenv("HOME");
    std::filesystem::path base = home ? std::filesystem::path(home) : std::filesystem::current_path();
    return (base / "Download").string();
}

int parseShowNumber(const std::string& value) {
    try {
        std::size_t consumed = 0;
        int number = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw RangeError("Not a show number: " + value);
        }
        return number - 1;
    } catch (const std::logic_error&) {
        throw RangeError("Not a show number: " + value);
    }
}

bool refreshShows(Orchestrator& orchestrator, ConsoleSink& sink) {
    std::cout << "Fetching show list...\n";
    sink.resetFeed();
    orchestrator.loadShows();
    while (!sink.feedSettled() && g_running) {
        orchestrator.processEvents(kPumpInterval);
    }
    return sink.feedSettled() && !sink.feedFailed();
}

bool ensureShows(Orchestrator& orchestrator, ConsoleSink& sink) {
    if (orchestrator.showCount() > 0) {
        return true;
    }
    return refreshShows(orchestrator, sink);
}

void printShowList(const Orchestrator& orchestrator, ShowColumn column) {
    const ShowList& shows = orchestrator.shows();
    if (shows.empty()) {
        std::cout << "No shows loaded.\n";
        return;
    }

    SortOrder order = column == ShowColumn::Title ? SortOrder::Ascending : SortOrder::Descending;
    auto indices = sortedIndices(shows, column, order);

    std::cout << "\n" << std::right << std::setw(5) << "#" << "  "
              << std::left << std::setw(18) << "Publication Date"
              << std::right << std::setw(10) << "Size (MB)" << "  " << "Title\n";
    std::cout << std::string(80, '-') << "\n";
    for (std::size_t index : indices) {
        const ShowRecord& show = shows[index];
        std::cout << std::right << std::setw(5) << index + 1 << "  "
                  << std::left << std::setw(18) << shortDate(show.publishedRaw)
                  << std::right << std::setw(10) << formatMegabytes(show.lengthBytes) << "  "
                  << show.title << (show.isDownloadable() ? "" : " [no link]") << "\n";
    }
    std::cout << std::string(80, '-') << "\n";
}

void printShow(const ShowRecord& show) {
    std::cout << "Title:       " << show.title << "\n"
              << "Published:   " << show.publishedRaw << "\n"
              << "Size:        " << formatBytes(static_cast<double>(show.lengthBytes)) << "\n"
              << "Link:        " << (show.link.empty() ? "(none)" : show.link) << "\n";
    if (!show.description.empty()) {
        std::cout << "Description: " << show.description << "\n";
    }
}

void runDownload(Orchestrator& orchestrator, ConsoleSink& sink, const std::string& directory) {
    sink.resetDownload();
    g_interrupts = 0;
    std::string destination = orchestrator.startDownload(directory);
    std::cout << "Downloading to " << destination << " (Ctrl+C to cancel)\n";

    bool cancelSent = false;
    while (!sink.downloadSettled()) {
        if (g_interrupts > 0 && !cancelSent) {
            std::cout << "\nCanceling download...\n";
            orchestrator.cancelDownload();
            cancelSent = true;
        }
        orchestrator.processEvents(kPumpInterval);
    }
    g_interrupts = 0;
}

void handleCommand(Orchestrator& orchestrator, ConsoleSink& sink, const std::string& command,
                   const std::vector<std::string>& args = {}) {
    if (command == "refresh") {
        refreshShows(orchestrator, sink);
    }
    else if (command == "list") {
        ShowColumn column = ShowColumn::Published;
        if (!args.empty() && !parseShowColumn(args[0], column)) {
            std::cout << "Usage: list [date|size|title]\n";
            return;
        }
        if (ensureShows(orchestrator, sink)) {
            printShowList(orchestrator, column);
        }
    }
    else if (command == "show") {
        if (args.empty()) {
            std::cout << "Usage: show <n>\n";
            return;
        }
        if (!ensureShows(orchestrator, sink)) {
            return;
        }
        orchestrator.selectShow(parseShowNumber(args[0]));
        printShow(*orchestrator.selectedShow());
    }
    else if (command == "download") {
        if (args.empty()) {
            std::cout << "Usage: download <n> [dir]\n";
            return;
        }
        if (!ensureShows(orchestrator, sink)) {
            return;
        }
        if (!orchestrator.selectShow(parseShowNumber(args[0]))) {
            std::cout << "No download link available for this item.\n";
            return;
        }
        runDownload(orchestrator, sink, args.size() > 1 ? args[1] : "");
    }
    else if (command == "status") {
        std::cout << "Feed:       " << (orchestrator.config().feedUrl.empty() ? "(not configured)"
                                                                                : orchestrator.config().feedUrl) << "\n"
                  << "Shows:      " << orchestrator.showCount() << "\n"
                  << "Directory:  " << orchestrator.config().downloadDir << "\n"
                  << "Download:   " << toString(orchestrator.downloadState()) << "\n";
        if (auto show = orchestrator.selectedShow()) {
            std::cout << "Selected:   " << show->title << "\n";
        }
    }
    else if (command == "help") {
        printHelp();
    }
    else {
        std::cout << "Unknown command. Type 'help' for available commands.\n";
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

void signalHandler(int) {
    // First interrupt cancels a running download, the next one quits
    if (g_interrupts.fetch_add(1) >= 1) {
        g_running = false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    try {
        std::string configPath = "showgrab.json";
        std::string feedOverride;
        std::string dirOverride;
        std::vector<std::string> commands;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help") {
                printHelp();
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--feed" && i + 1 < argc) {
                feedOverride = argv[++i];
            } else if (arg == "--dir" && i + 1 < argc) {
                dirOverride = argv[++i];
            } else {
                commands.push_back(arg);
            }
        }

        Config config = Config::load(configPath);
        if (!feedOverride.empty()) {
            config.feedUrl = feedOverride;
        }
        if (!dirOverride.empty()) {
            config.downloadDir = dirOverride;
        }
        if (config.downloadDir.empty()) {
            config.downloadDir = defaultDownloadDir();
        }

        ConsoleSink sink;
        Orchestrator orchestrator(config, std::make_shared<CprHttpClient>(), sink);

        // Handle command line arguments if provided
        if (!commands.empty()) {
            std::string command = commands[0];
            std::vector<std::string> args(commands.begin() + 1, commands.end());

            try {
                handleCommand(orchestrator, sink, command, args);
            }
            catch (const Error& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
            return 0;
        }

        // Interactive mode
        std::cout << "Welcome to showgrab!\n";
        printHelp();

        if (!config.feedUrl.empty()) {
            refreshShows(orchestrator, sink);
        } else {
            std::cout << "No feed configured. Use --feed <url> or set feedUrl in " << configPath << ".\n";
        }

        std::string input;

        while (g_running) {
            g_interrupts = 0;
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
                        handleCommand(orchestrator, sink, command, args);
                    }
                }
            }
            catch (const Error& e) {
                std::cerr << "Error: " << e.what() << "\n";
            }
        }

        return 0;
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
