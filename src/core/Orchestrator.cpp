#include "core/Orchestrator.hpp"
#include "core/Errors.hpp"
#include <cctype>
#include <filesystem>
#include <system_error>
#include <utility>
#include <variant>
#include <ada.h>

namespace fs = std::filesystem;

namespace showgrab {
namespace core {

namespace {

const char* const kDefaultExtension = ".mp4";
const char* const kFallbackFileName = "episode";

} // namespace

Orchestrator::Orchestrator(Config config, std::shared_ptr<HttpClient> client, EventSink& sink)
    : config_(std::move(config)),
      client_(std::move(client)),
      sink_(sink),
      events_(std::make_shared<EventChannel>()),
      shows_(std::make_shared<const ShowList>()),
      lastDownloadState_(DownloadState::Idle) {
    if (!client_) {
        throw UsageError("Orchestrator requires an HTTP client");
    }
}

Orchestrator::~Orchestrator() {
    // Shutdown reports nothing to the sink: whatever the workers publish from
    // here on is dropped with the channel.
    if (session_) {
        session_->cancel();
        session_->wait();
    }
    joinFetchWorker();
}

void Orchestrator::loadShows(const std::string& source) {
    std::string feedUrl = source.empty() ? config_.feedUrl : source;
    if (feedUrl.empty()) {
        throw ConfigError("No feed source configured");
    }

    if (fetchInFlight_.load()) {
        throw ConflictError("A feed fetch is already in progress");
    }

    joinFetchWorker();
    fetchInFlight_ = true;
    fetchWorker_ = std::thread(&Orchestrator::fetchShows, this, std::move(feedUrl));
}

void Orchestrator::fetchShows(std::string source) {
    FeedEvent event;
    try {
        std::string xml = client_->get(source);
        event.shows = std::make_shared<const ShowList>(parser_.parse(xml));
        event.channelTitle = parser_.parseChannelTitle(xml);
    } catch (const Error& e) {
        event.shows.reset();
        event.errorKind = e.kind();
        event.errorMessage = e.what();
    } catch (const std::exception& e) {
        event.shows.reset();
        event.errorKind = ErrorKind::Fetch;
        event.errorMessage = e.what();
    }

    events_->push(Event{std::move(event)});
    fetchInFlight_ = false;
}

void Orchestrator::joinFetchWorker() {
    if (fetchWorker_.joinable()) {
        fetchWorker_.join();
    }
}

bool Orchestrator::selectShow(int index) {
    if (index < 0 || static_cast<std::size_t>(index) >= shows_->size()) {
        throw RangeError("Show index " + std::to_string(index) + " out of range (have " +
                         std::to_string(shows_->size()) + " shows)");
    }

    selectedIndex_ = static_cast<std::size_t>(index);
    return (*shows_)[*selectedIndex_].isDownloadable();
}

std::optional<ShowRecord> Orchestrator::selectedShow() const {
    if (!selectedIndex_) {
        return std::nullopt;
    }
    return (*shows_)[*selectedIndex_];
}

std::string Orchestrator::startDownload(const std::string& destinationDir) {
    if (isDownloading()) {
        throw ConflictError("A download is already in progress");
    }

    if (!selectedIndex_) {
        throw UsageError("No show selected");
    }
    const ShowRecord& show = (*shows_)[*selectedIndex_];
    if (!show.isDownloadable()) {
        throw UsageError("No download link available for \"" + show.title + "\"");
    }

    std::string directory = destinationDir.empty() ? config_.downloadDir : destinationDir;
    if (directory.empty()) {
        throw ConfigError("No destination directory configured");
    }

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
        throw FilesystemError("Cannot create directory " + directory + ": " + ec.message());
    }

    std::string destination = (fs::path(directory) / deriveFileName(show.title, show.link)).string();

    // Previous attempt is terminal here, though its last events may still be
    // queued. They carry the old id, so they cannot be mistaken for this one.
    session_.reset();
    session_ = std::make_unique<DownloadSession>(client_, events_, ++lastDownloadId_);
    session_->start(show.link, destination);
    return destination;
}

void Orchestrator::cancelDownload() {
    if (!isDownloading()) {
        return;
    }
    session_->cancel();
}

bool Orchestrator::isDownloading() const {
    return session_ && session_->state() == DownloadState::InProgress;
}

DownloadState Orchestrator::downloadState() const {
    return session_ ? session_->state() : lastDownloadState_;
}

std::size_t Orchestrator::processEvents(std::chrono::milliseconds timeout) {
    std::size_t delivered = 0;
    std::optional<Event> event = timeout.count() > 0 ? events_->waitPop(timeout) : events_->tryPop();
    while (event) {
        if (dispatch(*event)) {
            ++delivered;
        }
        event = events_->tryPop();
    }
    return delivered;
}

bool Orchestrator::dispatch(Event& event) {
    if (auto* feed = std::get_if<FeedEvent>(&event)) {
        joinFetchWorker();
        if (feed->shows) {
            // Whole list is replaced; the old selection no longer applies
            shows_ = feed->shows;
            channelTitle_ = feed->channelTitle;
            selectedIndex_.reset();
            sink_.onShowsLoaded(shows_->size(), channelTitle_);
        } else {
            sink_.onFeedError(feed->errorKind, feed->errorMessage);
        }
        return true;
    }

    auto& download = std::get<DownloadEvent>(event);
    if (download.type == DownloadEvent::Type::Progress) {
        // Progress of a superseded attempt is stale
        if (download.downloadId != lastDownloadId_) {
            return false;
        }
        sink_.onDownloadProgress(download.progress);
        return true;
    }

    sink_.onDownloadFinished(download.outcome);
    if (session_ && session_->id() == download.downloadId && isTerminal(session_->state())) {
        lastDownloadState_ = session_->state();
        session_->wait();
        session_.reset();
    }
    return true;
}

std::string Orchestrator::sanitizeTitle(const std::string& title) {
    std::string name;
    for (char c : title) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x80 && (std::isalnum(uc) || c == ' ' || c == '.' || c == '_')) {
            name += c;
        }
    }
    name.erase(name.find_last_not_of(' ') + 1);
    return name;
}

std::string Orchestrator::extensionFromUrl(const std::string& url) {
    std::string path;
    auto parsed_url = ada::parse<ada::url>(url);
    if (parsed_url) {
        path = std::string(parsed_url->get_pathname());
    } else {
        path = url.substr(0, url.find_first_of("?#"));
    }

    std::string segment = path.substr(path.find_last_of('/') + 1);
    auto dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot == segment.size() - 1 ||
        segment.find_first_not_of('.') > dot) {
        // No extension, a trailing dot, or a dot-file name
        return "";
    }
    return segment.substr(dot);
}

std::string Orchestrator::deriveFileName(const std::string& title, const std::string& url) {
    std::string name = sanitizeTitle(title);
    if (name.empty()) {
        name = kFallbackFileName;
    }

    std::string extension = extensionFromUrl(url);
    return name + (extension.empty() ? kDefaultExtension : extension);
}

} // namespace core
} // namespace showgrab
