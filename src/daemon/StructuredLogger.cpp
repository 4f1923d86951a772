#include "cpanbridge/daemon/StructuredLogger.hpp"

#include "cpanbridge/protocol/Json.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cpanbridge::daemon {

StructuredLogger& StructuredLogger::instance() {
    static StructuredLogger logger;
    return logger;
}

void StructuredLogger::log(Level level, std::string_view event, FieldList fields) {
    if (!should_log(level)) {
        return;
    }

    const auto timestamp = format_timestamp();
    std::ostringstream oss;
    oss << '{'
        << "\"ts\":" << escape_json(timestamp) << ',';
    oss << "\"level\":" << escape_json(level_to_string(level)) << ',';
    oss << "\"event\":" << escape_json(event);

    if (!fields.empty()) {
        oss << ",\"fields\":{";
        for (std::size_t i = 0; i < fields.size(); ++i) {
            const auto& [key, value] = fields[i];
            oss << escape_json(key) << ':' << escape_json(value);
            if (i + 1 < fields.size()) {
                oss << ',';
            }
        }
        oss << '}';
    }

    oss << "}\n";
    const auto line = oss.str();
    std::scoped_lock lock(mutex_);
    std::clog << line;
    std::clog.flush();
    if (file_.is_open()) {
        file_ << line;
        file_.flush();
    }
}

void StructuredLogger::set_enabled(bool enabled) {
    enabled_.store(enabled);
}

bool StructuredLogger::enabled() const noexcept {
    return enabled_.load();
}

void StructuredLogger::set_min_level(Level level) {
    min_level_.store(level);
}

bool StructuredLogger::should_log(Level level) const noexcept {
    return enabled_.load() && level >= min_level_.load();
}

bool StructuredLogger::set_log_file(const std::string& path) {
    std::scoped_lock lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
    file_.open(path, std::ios::out | std::ios::app);
    return file_.is_open();
}

std::optional<StructuredLogger::Level> StructuredLogger::level_from_string(std::string_view text) {
    if (text == "debug") {
        return Level::Debug;
    }
    if (text == "info") {
        return Level::Info;
    }
    if (text == "warning" || text == "warn") {
        return Level::Warning;
    }
    if (text == "error") {
        return Level::Error;
    }
    return std::nullopt;
}

std::string StructuredLogger::level_to_string(Level level) {
    switch (level) {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warning:
            return "warning";
        case Level::Error:
            return "error";
    }
    return "info";
}

std::string StructuredLogger::escape_json(std::string_view value) {
    return protocol::quote_json_string(value);
}

std::string StructuredLogger::format_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto fractional = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
    gmtime_r(&now_c, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << fractional << 'Z';
    return oss.str();
}

}  // namespace cpanbridge::daemon
