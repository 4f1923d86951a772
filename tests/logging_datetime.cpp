#include "bridge_fixture.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"

#include <cassert>
#include <ctime>
#include <string>

using namespace cpanbridge;
using cpanbridge::test::BridgeFixture;
using cpanbridge::test::flag;
using cpanbridge::test::integer;
using cpanbridge::test::text;

namespace {

class Logging {
public:
    explicit Logging(BridgeFixture& bridge) : bridge_(bridge) {}

    Value ok(const std::string& function, Value params = Value(Json::objectValue)) {
        auto response = bridge_.call("logging", function, std::move(params));
        assert(response.success);
        return std::move(response.result);
    }

    ErrorKind fails(const std::string& function, Value params) {
        const auto response = bridge_.call("logging", function, std::move(params));
        assert(!response.success);
        return response.error_kind;
    }

    Value on(const std::string& logger_id) {
        Value params(Json::objectValue);
        params["logger_id"] = Value(logger_id);
        return params;
    }

    bool enabled(const std::string& function, const std::string& logger_id) {
        const auto result = ok(function, on(logger_id));
        assert(result.isBool());
        return result.asBool();
    }

private:
    BridgeFixture& bridge_;
};

void datetime_now(BridgeFixture& bridge) {
    const auto before = static_cast<std::int64_t>(std::time(nullptr));
    const auto response = bridge.call("datetime_helper", "now");
    const auto after = static_cast<std::int64_t>(std::time(nullptr));
    assert(response.success);
    const auto epoch = integer(response.result, "epoch");
    assert(epoch >= before - 1);
    assert(epoch <= after + 1);

    assert(!bridge.call("datetime_helper", "strftime").success);
}

// Level checks read atomics only and are safe from any thread.
void daemon_log_threshold() {
    auto& logger = daemon::StructuredLogger::instance();
    using Level = daemon::StructuredLogger::Level;
    logger.set_min_level(Level::Warning);
    assert(!logger.should_log(Level::Info));
    assert(logger.should_log(Level::Warning));
    assert(logger.should_log(Level::Error));
    logger.set_enabled(false);
    assert(!logger.should_log(Level::Error));
    logger.set_enabled(true);
    logger.set_min_level(Level::Info);
    assert(logger.should_log(Level::Info));
    assert(!logger.should_log(Level::Debug));
}

}  // namespace

int main() {
    daemon_log_threshold();

    BridgeFixture bridge;
    datetime_now(bridge);

    Logging logging(bridge);
    assert(!logging.ok("initialized").asBool());

    Value init(Json::objectValue);
    init["category"] = Value("app");
    init["level"] = Value("WARN");
    const auto created = logging.ok("init_logger", init);
    const auto logger = text(created, "logger_id");
    assert(logger.rfind("logger_", 0) == 0);
    assert(text(created, "category") == "app");
    assert(text(created, "appender") == "sysout");
    assert(logging.ok("initialized").asBool());

    // The threshold decides what is emitted.
    assert(!logging.enabled("is_trace", logger));
    assert(!logging.enabled("is_debug", logger));
    assert(!logging.enabled("is_info", logger));
    assert(logging.enabled("is_warn", logger));
    assert(logging.enabled("is_error", logger));
    assert(logging.enabled("is_fatal", logger));

    auto message = logging.on(logger);
    message["message"] = Value("quiet");
    const auto info = logging.ok("log_info", message);
    assert(flag(info, "logged"));
    assert(!flag(info, "emitted"));
    assert(flag(logging.ok("log_warn", message), "emitted"));
    assert(flag(logging.ok("always_log", message), "emitted"));

    message["level"] = Value("error");
    assert(flag(logging.ok("log_message", message), "emitted"));
    message["level"] = Value("no-such-level");
    assert(!flag(logging.ok("log_message", message), "emitted"));

    // Enhanced calls carry their source location.
    auto located = logging.on(logger);
    located["message"] = Value("boom");
    located["filename"] = Value("app.pl");
    located["line"] = Value(42);
    assert(text(logging.ok("log_error", located), "message") == "app.pl line:42: boom");
    assert(text(logging.ok("log_fatal", located), "message") == "app.pl line:42: boom");
    assert(text(logging.ok("log_debug", located), "message") == "DEBUG: app.pl line:42: boom");
    assert(text(logging.ok("log_info", located), "message") == "boom");
    located["line"] = Value(0);
    assert(text(logging.ok("log_error", located), "message") == "boom");

    const auto died = logging.ok("logdie", message);
    assert(flag(died, "should_exit"));
    assert(flag(died, "emitted"));

    // Levels can be changed at runtime.
    auto level = logging.on(logger);
    level["level"] = Value("debug");
    const auto changed = logging.ok("set_level", level);
    assert(integer(changed, "numeric_level") == 10);
    assert(logging.enabled("is_debug", logger));
    assert(!logging.enabled("is_trace", logger));
    const auto current = logging.ok("get_level", logging.on(logger));
    assert(text(current, "level") == "debug");
    assert(integer(current, "numeric_level") == 10);
    level["level"] = Value("CRITICAL");
    assert(integer(logging.ok("set_level", level), "numeric_level") == 50);
    assert(logging.fails("set_level", logging.on(logger)) == ErrorKind::Validation);

    // A category maps to its live logger.
    Value lookup(Json::objectValue);
    lookup["category"] = Value("app");
    assert(text(logging.ok("get_logger", lookup), "logger_id") == logger);
    lookup["category"] = Value("other");
    const auto other = text(logging.ok("get_logger", lookup), "logger_id");
    assert(!other.empty());
    assert(other != logger);
    assert(!logging.enabled("is_debug", other));
    assert(logging.enabled("is_info", other));

    Value appender(Json::objectValue);
    appender["appender_name"] = Value("sysout");
    assert(text(logging.ok("appender_by_name", appender), "appender_id") == "appender_sysout");
    appender["layout_pattern"] = Value("simple");
    assert(text(logging.ok("set_layout", appender), "layout") == "simple");
    appender["layout_pattern"] = Value("%p [%c] %m%n");
    assert(text(logging.ok("set_layout", appender), "layout") == "%p [%c] %m%n");
    appender["appender_name"] = Value("logfile");
    assert(logging.fails("appender_by_name", appender) == ErrorKind::Validation);
    assert(logging.fails("set_layout", appender) == ErrorKind::Validation);

    Value package(Json::objectValue);
    package["package"] = Value("My::Wrapper");
    assert(flag(logging.ok("wrapper_register", package), "registered"));

    // Cleanup releases the handle.
    const auto cleaned = logging.ok("cleanup_logger", logging.on(logger));
    assert(flag(cleaned, "cleaned_up"));
    assert(logging.fails("is_info", logging.on(logger)) == ErrorKind::Handle);
    assert(logging.fails("cleanup_logger", logging.on(logger)) == ErrorKind::Handle);
    assert(logging.fails("log_info", logging.on("logger_999999")) == ErrorKind::Handle);

    // The category no longer resolves to the released logger.
    lookup["category"] = Value("app");
    assert(text(logging.ok("get_logger", lookup), "logger_id") != logger);

    return 0;
}
