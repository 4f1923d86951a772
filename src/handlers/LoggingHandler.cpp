#include "cpanbridge/handlers/LoggingHandler.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace cpanbridge::handlers {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

constexpr int kTrace = 5;
constexpr int kDebug = 10;
constexpr int kInfo = 20;
constexpr int kWarn = 30;
constexpr int kError = 40;
constexpr int kFatal = 50;

constexpr std::string_view kDefaultAppender = "sysout";
constexpr std::string_view kDefaultLayout = "%d{EEE yyyy/MM/dd HH:mm:ss}|%m%n";
constexpr std::string_view kDebugLayout = "%d|%p> %m%n";
constexpr std::string_view kSimpleLayout = "%d|%m%n";

struct LoggerState final : NativeState {
    std::string category;
    std::mutex mutex;
    std::string level;  // guarded by mutex
    int threshold{kInfo};
};

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

// Unknown names fall back to INFO.
int level_value(const std::string& name) {
    static const std::map<std::string, int> kLevels = {
        {"TRACE", kTrace},
        {"DEBUG", kDebug},
        {"INFO", kInfo},
        {"WARN", kWarn},
        {"WARNING", kWarn},
        {"ERROR", kError},
        {"FATAL", kFatal},
        {"CRITICAL", kFatal},
    };
    const auto it = kLevels.find(upper(name));
    return it != kLevels.end() ? it->second : kInfo;
}

std::string timestamp() {
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%a %Y/%m/%d %H:%M:%S");
    return oss.str();
}

// Expands %d (with an optional {format} suffix), %p, %c, %m, %n and %%.
// Other sequences are copied as written.
std::string render_layout(std::string_view pattern,
                          const std::string& level,
                          const std::string& category,
                          const std::string& message) {
    std::string out;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '%' || i + 1 >= pattern.size()) {
            out.push_back(pattern[i]);
            continue;
        }
        const char token = pattern[++i];
        switch (token) {
            case 'd':
                out += timestamp();
                if (i + 1 < pattern.size() && pattern[i + 1] == '{') {
                    const auto close = pattern.find('}', i + 1);
                    if (close != std::string_view::npos) {
                        i = close;
                    }
                }
                break;
            case 'p':
                out += level;
                break;
            case 'c':
                out += category;
                break;
            case 'm':
                out += message;
                break;
            case 'n':
                out.push_back('\n');
                break;
            case '%':
                out.push_back('%');
                break;
            default:
                out.push_back('%');
                out.push_back(token);
                break;
        }
    }
    return out;
}

}  // namespace

class LoggingHandler::Impl {
public:
    using Operation = Value (Impl::*)(const Value&, HandlerContext&);

    Impl() {
        operations_ = {
            {"initialized", &Impl::initialized},
            {"init_logger", &Impl::init_logger},
            {"get_logger", &Impl::get_logger},
            {"log_message", &Impl::log_message},
            {"log_trace", &Impl::log_trace},
            {"log_debug", &Impl::log_debug},
            {"log_info", &Impl::log_info},
            {"log_warn", &Impl::log_warn},
            {"log_error", &Impl::log_error},
            {"log_fatal", &Impl::log_fatal},
            {"logdie", &Impl::logdie},
            {"always_log", &Impl::always_log},
            {"is_trace", &Impl::is_trace},
            {"is_debug", &Impl::is_debug},
            {"is_info", &Impl::is_info},
            {"is_warn", &Impl::is_warn},
            {"is_error", &Impl::is_error},
            {"is_fatal", &Impl::is_fatal},
            {"set_level", &Impl::set_level},
            {"get_level", &Impl::get_level},
            {"appender_by_name", &Impl::appender_by_name},
            {"set_layout", &Impl::set_layout},
            {"cleanup_logger", &Impl::cleanup_logger},
            {"wrapper_register", &Impl::wrapper_register},
        };
    }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        for (const auto& [name, _] : operations_) {
            result.push_back(name);
        }
        return result;
    }

    Value invoke(const std::string& function, const Value& params, HandlerContext& context) {
        const auto it = operations_.find(function);
        if (it == operations_.end()) {
            throw_validation_error("Unknown logging function: " + function);
        }
        return (this->*(it->second))(params, context);
    }

private:
    struct LoggerRef {
        HandlePtr handle;
        LoggerState* state;
    };

    static LoggerRef logger_param(const Value& params, HandlerContext& context) {
        auto handle = context.acquire(params::require_string(params, "logger_id"), HandleKind::Logger);
        auto* state = &handle->state_as<LoggerState>();
        return {std::move(handle), state};
    }

    Value initialized(const Value&, HandlerContext&) {
        std::scoped_lock guard(mutex_);
        return Value(initialized_);
    }

    Value init_logger(const Value& params, HandlerContext& context) {
        return create_logger(context,
                             params::string_or(params, "category", "main"),
                             params::string_or(params, "level", "INFO"));
    }

    Value create_logger(HandlerContext& context, const std::string& category, const std::string& level) {
        auto state = std::make_unique<LoggerState>();
        state->category = category;
        state->level = level;
        state->threshold = level_value(level);
        const auto logger_id = context.create(HandleKind::Logger, std::move(state));
        {
            std::scoped_lock guard(mutex_);
            categories_[category] = logger_id;
            appenders_.try_emplace(std::string(kDefaultAppender), std::string(kDefaultLayout));
            initialized_ = true;
        }
        log_event(StructuredLogger::Level::Debug,
                  "logging.logger_created",
                  {{"logger_id", logger_id}, {"category", category}, {"level", level}});

        Value result(Json::objectValue);
        result["logger_id"] = Value(logger_id);
        result["category"] = Value(category);
        result["level"] = Value(level);
        result["appender"] = Value(std::string(kDefaultAppender));
        return result;
    }

    // Returns the live logger for a category, creating one at INFO otherwise.
    Value get_logger(const Value& params, HandlerContext& context) {
        const auto category = params::string_or(params, "category", "main");
        std::string existing;
        {
            std::scoped_lock guard(mutex_);
            const auto it = categories_.find(category);
            if (it != categories_.end()) {
                existing = it->second;
            }
        }
        if (!existing.empty()) {
            auto handle = context.pool().get(existing);
            if (handle && handle->kind() == HandleKind::Logger) {
                handle->touch();
                Value result(Json::objectValue);
                result["logger_id"] = Value(existing);
                result["category"] = Value(category);
                return result;
            }
        }
        return create_logger(context, category, "INFO");
    }

    Value log_message(const Value& params, HandlerContext& context) {
        return write(params, context, params::string_or(params, "level", "INFO"),
                     params::boolean_or(params, "enhanced", false), false);
    }

    Value log_trace(const Value& params, HandlerContext& context) {
        return write(params, context, "TRACE", params::boolean_or(params, "enhanced", false), false);
    }

    Value log_debug(const Value& params, HandlerContext& context) {
        return write(params, context, "DEBUG", true, false);
    }

    Value log_info(const Value& params, HandlerContext& context) {
        return write(params, context, "INFO", params::boolean_or(params, "enhanced", false), false);
    }

    Value log_warn(const Value& params, HandlerContext& context) {
        return write(params, context, "WARN", params::boolean_or(params, "enhanced", false), false);
    }

    Value log_error(const Value& params, HandlerContext& context) {
        return write(params, context, "ERROR", true, false);
    }

    Value log_fatal(const Value& params, HandlerContext& context) {
        return write(params, context, "FATAL", true, false);
    }

    // The daemon keeps running; the caller decides whether to exit.
    Value logdie(const Value& params, HandlerContext& context) {
        Value result = write(params, context, "FATAL", true, false);
        result["should_exit"] = Value(true);
        return result;
    }

    Value always_log(const Value& params, HandlerContext& context) {
        return write(params, context, "TRACE", params::boolean_or(params, "enhanced", false), true);
    }

    Value write(const Value& params, HandlerContext& context, const std::string& level, bool enhanced, bool force) {
        auto ref = logger_param(params, context);
        const auto message = params::string_or(params, "message", "");
        const auto filename = params::string_or(params, "filename", "");
        const auto line = params::string_or(params, "line", "");
        const auto name = upper(level);
        const bool located = enhanced && !filename.empty() && !line.empty() && line != "0";

        std::string formatted = message;
        if (located && name == "DEBUG") {
            formatted = "DEBUG: " + filename + " line:" + line + ": " + message;
        } else if (located && (name == "ERROR" || name == "FATAL")) {
            formatted = filename + " line:" + line + ": " + message;
        }

        int threshold = kInfo;
        {
            std::scoped_lock guard(ref.state->mutex);
            threshold = ref.state->threshold;
        }
        const bool emitted = force || level_value(name) >= threshold;
        if (emitted) {
            std::string layout;
            if (enhanced && (name == "DEBUG" || name == "ERROR" || name == "FATAL")) {
                layout = kDebugLayout;
            } else {
                std::scoped_lock guard(mutex_);
                const auto it = appenders_.find(std::string(kDefaultAppender));
                layout = it != appenders_.end() ? it->second : std::string(kDefaultLayout);
            }
            const auto rendered = render_layout(layout, name, ref.state->category, formatted);
            std::scoped_lock guard(output_mutex_);
            std::cout << rendered << std::flush;
        }

        Value result(Json::objectValue);
        result["logged"] = Value(true);
        result["emitted"] = Value(emitted);
        result["level"] = Value(level);
        result["message"] = Value(formatted);
        return result;
    }

    Value is_trace(const Value& params, HandlerContext& context) { return level_enabled(params, context, kTrace); }
    Value is_debug(const Value& params, HandlerContext& context) { return level_enabled(params, context, kDebug); }
    Value is_info(const Value& params, HandlerContext& context) { return level_enabled(params, context, kInfo); }
    Value is_warn(const Value& params, HandlerContext& context) { return level_enabled(params, context, kWarn); }
    Value is_error(const Value& params, HandlerContext& context) { return level_enabled(params, context, kError); }
    Value is_fatal(const Value& params, HandlerContext& context) { return level_enabled(params, context, kFatal); }

    static Value level_enabled(const Value& params, HandlerContext& context, int level) {
        auto ref = logger_param(params, context);
        std::scoped_lock guard(ref.state->mutex);
        return Value(level >= ref.state->threshold);
    }

    Value set_level(const Value& params, HandlerContext& context) {
        auto ref = logger_param(params, context);
        const auto level = params::require_string(params, "level");
        const int threshold = level_value(level);
        {
            std::scoped_lock guard(ref.state->mutex);
            ref.state->level = level;
            ref.state->threshold = threshold;
        }
        Value result(Json::objectValue);
        result["level"] = Value(level);
        result["numeric_level"] = Value(threshold);
        return result;
    }

    Value get_level(const Value& params, HandlerContext& context) {
        auto ref = logger_param(params, context);
        std::scoped_lock guard(ref.state->mutex);
        Value result(Json::objectValue);
        result["level"] = Value(ref.state->level);
        result["numeric_level"] = Value(ref.state->threshold);
        return result;
    }

    Value appender_by_name(const Value& params, HandlerContext&) {
        const auto name = params::require_string(params, "appender_name");
        require_appender(name);
        Value result(Json::objectValue);
        result["appender_id"] = Value("appender_" + name);
        result["appender_name"] = Value(name);
        return result;
    }

    Value set_layout(const Value& params, HandlerContext&) {
        const auto name = params::require_string(params, "appender_name");
        const auto pattern = params::require_string(params, "layout_pattern");
        std::string layout = pattern;
        if (pattern == "debug") {
            layout = kDebugLayout;
        } else if (pattern == "simple") {
            layout = kSimpleLayout;
        }
        {
            std::scoped_lock guard(mutex_);
            const auto it = appenders_.find(name);
            if (it == appenders_.end()) {
                throw_validation_error("Appender not found: " + name);
            }
            it->second = layout;
        }
        Value result(Json::objectValue);
        result["appender"] = Value(name);
        result["layout"] = Value(pattern);
        return result;
    }

    void require_appender(const std::string& name) {
        std::scoped_lock guard(mutex_);
        if (appenders_.find(name) == appenders_.end()) {
            throw_validation_error("Appender not found: " + name);
        }
    }

    Value cleanup_logger(const Value& params, HandlerContext& context) {
        const auto logger_id = params::require_string(params, "logger_id");
        auto ref = logger_param(params, context);
        {
            std::scoped_lock guard(mutex_);
            const auto it = categories_.find(ref.state->category);
            if (it != categories_.end() && it->second == logger_id) {
                categories_.erase(it);
            }
        }
        context.pool().remove(logger_id);

        Value result(Json::objectValue);
        result["logger_id"] = Value(logger_id);
        result["cleaned_up"] = Value(true);
        return result;
    }

    Value wrapper_register(const Value& params, HandlerContext&) {
        Value result(Json::objectValue);
        result["package"] = Value(params::require_string(params, "package"));
        result["registered"] = Value(true);
        return result;
    }

    std::mutex mutex_;
    bool initialized_{false};
    std::map<std::string, std::string> categories_;  // category -> latest logger id
    std::map<std::string, std::string> appenders_;   // appender name -> layout
    std::mutex output_mutex_;
    std::map<std::string, Operation> operations_;
};

LoggingHandler::LoggingHandler()
    : impl_(std::make_unique<Impl>()) {}

LoggingHandler::~LoggingHandler() = default;

std::vector<std::string> LoggingHandler::functions() const {
    return impl_->names();
}

Value LoggingHandler::invoke(const std::string& function, const Value& params, HandlerContext& context) {
    return impl_->invoke(function, params, context);
}

}  // namespace cpanbridge::handlers
