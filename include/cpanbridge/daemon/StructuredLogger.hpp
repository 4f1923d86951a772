#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cpanbridge::daemon {

class StructuredLogger {
public:
    enum class Level {
        Debug,
        Info,
        Warning,
        Error
    };

    using Field = std::pair<std::string, std::string>;
    using FieldList = std::vector<Field>;

    static StructuredLogger& instance();

    void log(Level level, std::string_view event, FieldList fields = {});

    void set_enabled(bool enabled);
    [[nodiscard]] bool enabled() const noexcept;

    void set_min_level(Level level);
    [[nodiscard]] bool should_log(Level level) const noexcept;

    // Mirrors every line into |path| (append mode) in addition to std::clog.
    // Returns false when the file cannot be opened.
    bool set_log_file(const std::string& path);

    static std::optional<Level> level_from_string(std::string_view text);

private:
    StructuredLogger() = default;

    StructuredLogger(const StructuredLogger&) = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    static std::string level_to_string(Level level);
    // Quoted JSON string literal.
    static std::string escape_json(std::string_view value);

    std::string format_timestamp();

    std::atomic<bool> enabled_{true};
    std::atomic<Level> min_level_{Level::Info};
    std::ofstream file_;
    mutable std::mutex mutex_;
};

inline void log_event(StructuredLogger::Level level,
                      std::string_view event,
                      StructuredLogger::FieldList fields = {}) {
    StructuredLogger::instance().log(level, event, std::move(fields));
}

}  // namespace cpanbridge::daemon
