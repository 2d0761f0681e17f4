#include "buckle/logging.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace buckle {
namespace log {

// ============================================================================
// Redactor
// ============================================================================

void Redactor::add_secret(const std::string& value) {
    if (value.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_.insert(value);
}

std::string Redactor::redact(const std::string& text) const {
    std::vector<std::pair<size_t, size_t>> spans;  // [begin, end)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& secret : secrets_) {
            for (size_t pos = text.find(secret); pos != std::string::npos;
                 pos = text.find(secret, pos + 1)) {
                spans.emplace_back(pos, pos + secret.size());
            }
        }
    }
    if (spans.empty()) return text;

    std::sort(spans.begin(), spans.end());

    std::string output;
    output.reserve(text.size());
    size_t copied = 0;
    for (size_t i = 0; i < spans.size();) {
        size_t begin = spans[i].first;
        size_t end = spans[i].second;
        for (++i; i < spans.size() && spans[i].first < end; ++i) {
            end = std::max(end, spans[i].second);
        }
        output.append(text, copied, begin - copied);
        output += REDACTED;
        copied = end;
    }
    output.append(text, copied, std::string::npos);
    return output;
}

size_t Redactor::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return secrets_.size();
}

void Redactor::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    secrets_.clear();
}

std::shared_ptr<Redactor> default_redactor() {
    static std::shared_ptr<Redactor> instance = std::make_shared<Redactor>();
    return instance;
}

void register_secret(const std::string& value) {
    default_redactor()->add_secret(value);
}

// ============================================================================
// Logger Setup
// ============================================================================

namespace {

constexpr const char* CONSOLE_PATTERN = "%^%l%$: %v";
constexpr const char* FILE_PATTERN = "[%Y-%m-%dT%H:%M:%S.%e] [%l] %v";

spdlog::level::level_enum level_for(const LoggingOptions& options) {
    if (options.quiet) return spdlog::level::err;
    if (options.verbose) return spdlog::level::debug;
    return spdlog::level::info;
}

void install(std::shared_ptr<spdlog::logger> logger, spdlog::level::level_enum level) {
    spdlog::drop(LOGGER_NAME);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
}

} // namespace

void init_logging(const LoggingOptions& options) {
    auto level = level_for(options);

    auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console->set_pattern(CONSOLE_PATTERN);
    auto console_redacted = std::make_shared<redacting_sink_mt>(
        default_redactor(), std::vector<spdlog::sink_ptr>{console});

    if (options.log_file.empty()) {
        install(std::make_shared<spdlog::logger>(LOGGER_NAME, console_redacted), level);
        return;
    }

    // The file sink is written from spdlog's worker thread; shutdown_logging()
    // joins it before the process exits.
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.log_file, false);
    file->set_pattern(FILE_PATTERN);
    auto file_redacted = std::make_shared<redacting_sink_mt>(
        default_redactor(), std::vector<spdlog::sink_ptr>{file});
    file_redacted->set_level(spdlog::level::debug);

    spdlog::init_thread_pool(8192, 1);
    auto logger = std::make_shared<spdlog::async_logger>(
        LOGGER_NAME,
        spdlog::sinks_init_list{console_redacted, file_redacted},
        spdlog::thread_pool(),
        spdlog::async_overflow_policy::block);

    // Console keeps the requested level; the file always records debug
    console_redacted->set_level(level);
    install(logger, spdlog::level::debug);
}

void init_logging_with_sink(std::shared_ptr<spdlog::sinks::sink> sink,
                            spdlog::level::level_enum level) {
    auto redacted = std::make_shared<redacting_sink_mt>(
        default_redactor(), std::vector<spdlog::sink_ptr>{std::move(sink)});
    install(std::make_shared<spdlog::logger>(LOGGER_NAME, redacted), level);
}

std::shared_ptr<spdlog::logger> logger() {
    auto named = spdlog::get(LOGGER_NAME);
    if (named) return named;
    return spdlog::default_logger();
}

void shutdown_logging() {
    auto named = spdlog::get(LOGGER_NAME);
    if (named) named->flush();
    spdlog::shutdown();
}

} // namespace log
} // namespace buckle
