#include <spdlog/spdlog.h>
#include <eventrelay/client/session.hpp>
#include <eventrelay/client/errors.hpp>
#include <eventrelay/core/config/loader.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace EventRelay;

namespace {

// Set from the signal handler; a watcher thread turns it into a stream cancel.
std::atomic<bool> g_running{true};

void signal_handler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// CancelToken::cancel() takes a lock, so it cannot run inside the handler itself.
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::shared_ptr<CancelToken> token)
        : token_(std::move(token)), thread_([this] { loop(); }) {}
    ~InterruptWatcher() {
        done_.store(true, std::memory_order_release);
        thread_.join();
    }

private:
    void loop() {
        while (!done_.load(std::memory_order_acquire)) {
            if (!g_running.load(std::memory_order_acquire)) {
                spdlog::warn("Interrupted, cancelling active streams...");
                token_->cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }

    std::shared_ptr<CancelToken> token_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

std::vector<std::string> splitCsvLine(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                quoted = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else if (c != '\r') {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

int columnIndex(const std::vector<std::string>& header, const std::string& name) {
    for (size_t i = 0; i < header.size(); ++i) {
        if (header[i] == name) return static_cast<int>(i);
    }
    return -1;
}

// "YYYY-MM-DD HH:MM:SS" (UTC) -> time point
std::optional<Timestamp> parseTimestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream in(text);
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string toRfc3339(Timestamp ts) {
    std::time_t t = std::chrono::system_clock::to_time_t(ts);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

/**
 * Streams every row of a CSV export (columns: userid, event, optional at)
 * into the session. Returns the number of rows submitted.
 */
size_t ingestCsv(const std::string& path, Session& session) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("failed to open " + path);
    }

    std::string line;
    if (!std::getline(file, line)) {
        throw std::runtime_error("failed to read header of " + path);
    }
    const auto header = splitCsvLine(line);
    const int userIdx = columnIndex(header, "userid");
    const int eventIdx = columnIndex(header, "event");
    const int atIdx = columnIndex(header, "at");
    if (userIdx < 0 || eventIdx < 0) {
        throw std::runtime_error("missing required columns (userid, event) in " + path);
    }

    size_t rows = 0;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        const auto record = splitCsvLine(line);
        if (static_cast<int>(record.size()) <= std::max(userIdx, eventIdx)) {
            spdlog::warn("Skipping short row {} in {}", rows + 2, path);
            continue;
        }

        Event event(record[userIdx], record[eventIdx]);
        event.data["source"] = "csv_import";
        if (atIdx >= 0 && atIdx < static_cast<int>(record.size())) {
            const std::string& at = record[atIdx];
            event.data["original_timestamp"] = at;
            if (auto ts = parseTimestamp(at)) {
                event.data["timestamp"] = toRfc3339(*ts);
                event.timestamp = ts;
            }
        }
        session.submitBlocking(makeEvent(std::move(event)));
        ++rows;
    }
    return rows;
}

void configureLogging(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (argc < 3) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> <events.csv> [events.csv...]\n";
        return EXIT_FAILURE;
    }

    AppConfig::AppConfiguration config;
    try {
        config = ConfigLoader::loadConfig(argv[1]);
    } catch (const std::exception& e) {
        spdlog::error("Failed to load configuration: {}", e.what());
        return EXIT_FAILURE;
    }
    configureLogging(config.logging);
    spdlog::info("{} version {} starting up...", config.app_name, config.version);

    const char* apiKey = std::getenv("EVENTRELAY_API_KEY");
    if (apiKey == nullptr || *apiKey == '\0') {
        spdlog::error("EVENTRELAY_API_KEY environment variable is required");
        return EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        Session session(apiKey, config.client);

        StreamContext ctx;
        ctx.cancel_token = std::make_shared<CancelToken>();
        InterruptWatcher watcher(ctx.cancel_token);
        session.start(ctx);

        size_t totalRows = 0;
        for (int i = 2; i < argc && g_running.load(std::memory_order_acquire); ++i) {
            try {
                size_t rows = ingestCsv(argv[i], session);
                spdlog::info("Queued {} event(s) from {}", rows, argv[i]);
                totalRows += rows;
            } catch (const std::runtime_error& e) {
                spdlog::error("Skipping {}: {}", argv[i], e.what());
            }
        }

        StreamStats stats = session.finalize();
        session.close();

        std::cout << "\n========== INGESTION COMPLETE ==========\n"
                  << "Rows read:        " << totalRows << "\n"
                  << "Events sent:      " << stats.total_sent << "\n"
                  << "Succeeded:        " << stats.total_succeeded << "\n"
                  << "Failed:           " << stats.total_failed << "\n"
                  << "Dropped:          " << stats.total_dropped << "\n"
                  << "Streams:          " << stats.active_streams << "\n"
                  << "Duration:         "
                  << std::chrono::duration_cast<std::chrono::milliseconds>(stats.duration).count() << " ms\n"
                  << "Throughput:       " << std::fixed << std::setprecision(2)
                  << stats.events_per_sec << " events/sec\n";
        return stats.total_failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    } catch (const ConnectionError& e) {
        spdlog::error("Could not connect to {}: {}", config.client.endpoint, e.what());
    } catch (const std::exception& e) {
        spdlog::error("Ingestion failed: {}", e.what());
    }
    return EXIT_FAILURE;
}
