#pragma once

#include <spdlog/details/log_msg.h>
#include <spdlog/logger.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/base_sink.h>

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace buckle {
namespace log {

constexpr const char* LOGGER_NAME = "buckle";
constexpr const char* REDACTED = "******";

// ============================================================================
// Secret Registry
// ============================================================================

/**
 * Set of secret values that must never reach a log sink.
 *
 * Shared between the orchestrator (writer) and the sinks, which may run on
 * the async logging thread, so every access takes the mutex.
 */
class Redactor {
public:
    void add_secret(const std::string& value);

    // Replace every registered secret occurring in text with "******".
    // Overlapping occurrences are merged and masked as one run, so no part of
    // any secret survives.
    std::string redact(const std::string& text) const;

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::set<std::string> secrets_;
};

// Process-wide registry consulted by every sink created through init_logging
std::shared_ptr<Redactor> default_redactor();

// Register a secret value with the default redactor
void register_secret(const std::string& value);

// ============================================================================
// Redacting Sink
// ============================================================================

/**
 * Sink wrapper that masks secret values in the message payload and forwards
 * the result to the wrapped sinks.
 */
template<typename Mutex>
class redacting_sink : public spdlog::sinks::base_sink<Mutex> {
public:
    redacting_sink(std::shared_ptr<Redactor> redactor,
                   std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks)
        : redactor_(std::move(redactor)), sinks_(std::move(sinks)) {}

    redacting_sink(const redacting_sink&) = delete;
    redacting_sink& operator=(const redacting_sink&) = delete;

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        std::string payload(msg.payload.data(), msg.payload.size());
        std::string masked = redactor_ ? redactor_->redact(payload) : payload;

        spdlog::details::log_msg redacted(msg.time, msg.source, msg.logger_name, msg.level,
                                          spdlog::string_view_t(masked.data(), masked.size()));
        redacted.thread_id = msg.thread_id;

        for (auto& sink : sinks_) {
            if (sink->should_log(redacted.level)) {
                sink->log(redacted);
            }
        }
    }

    void flush_() override {
        for (auto& sink : sinks_) {
            sink->flush();
        }
    }

    void set_pattern_(const std::string& pattern) override {
        set_formatter_(std::make_unique<spdlog::pattern_formatter>(pattern));
    }

    void set_formatter_(std::unique_ptr<spdlog::formatter> sink_formatter) override {
        spdlog::sinks::base_sink<Mutex>::formatter_ = std::move(sink_formatter);
        for (auto& sink : sinks_) {
            sink->set_formatter(spdlog::sinks::base_sink<Mutex>::formatter_->clone());
        }
    }

private:
    std::shared_ptr<Redactor> redactor_;
    std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks_;
};

using redacting_sink_mt = redacting_sink<std::mutex>;

// ============================================================================
// Logger Setup
// ============================================================================

struct LoggingOptions {
    bool verbose = false;     // debug level
    bool quiet = false;       // errors only
    std::string log_file;     // optional async file sink
};

// Install the "buckle" logger as spdlog's default logger.
// All sinks are wrapped in a redacting_sink bound to default_redactor().
void init_logging(const LoggingOptions& options);

// Install a logger writing only to the given sink (redacted). Used by tests
// to capture log output.
void init_logging_with_sink(std::shared_ptr<spdlog::sinks::sink> sink,
                            spdlog::level::level_enum level = spdlog::level::debug);

// The buckle logger (falls back to spdlog's default logger)
std::shared_ptr<spdlog::logger> logger();

// Flush buffered records and join the async logging thread
void shutdown_logging();

} // namespace log
} // namespace buckle
