#include "cpanbridge/handlers/LockFileHandler.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"

#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <system_error>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

namespace cpanbridge::handlers {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

struct LockManagerState final : NativeState {
    bool nfs{false};
    std::chrono::seconds hold{90};
    std::chrono::seconds delay{1};
    std::optional<std::chrono::seconds> max_wait;
};

// Owns one lock file. The file is removed on destruction unless it was
// released already or another process has since taken it over.
struct LockState final : NativeState {
    std::string filename;
    std::string path;
    pid_t pid{::getpid()};
    bool released{false};

    ~LockState() override {
        if (released) {
            return;
        }
        std::ifstream in(path);
        std::string owner;
        if (in >> owner && owner == std::to_string(pid)) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }
    }
};

std::string replace_all(std::string text, std::string_view token, std::string_view replacement) {
    std::size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        text.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
    return text;
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Expands $VAR and ${VAR}; unknown variables are left as written.
std::string expand_variables(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '$' || i + 1 >= text.size()) {
            out.push_back(text[i]);
            continue;
        }
        std::size_t start = i + 1;
        std::size_t end = start;
        bool braced = false;
        if (text[start] == '{') {
            braced = true;
            end = text.find('}', start);
            if (end == std::string::npos) {
                out.push_back(text[i]);
                continue;
            }
            ++start;
        } else {
            while (end < text.size() && is_name_char(text[end])) {
                ++end;
            }
        }
        const std::string name = text.substr(start, end - start);
        const char* value = name.empty() ? nullptr : std::getenv(name.c_str());
        const std::size_t consumed = braced ? end + 1 : end;
        if (value) {
            out += value;
        } else {
            out += text.substr(i, consumed - i);
        }
        i = consumed - 1;
    }
    return out;
}

bool is_stale(const std::filesystem::path& path, std::chrono::seconds hold) {
    std::error_code ec;
    const auto modified = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return false;
    }
    const auto age = std::filesystem::file_time_type::clock::now() - modified;
    return age > hold;
}

bool create_exclusive(const std::string& path) {
    const int fd = ::open(path.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return false;
        }
        throw_execution_error("Could not create lock file " + path + ": " + std::strerror(errno));
    }
    const std::string pid = std::to_string(::getpid());
    const auto written = ::write(fd, pid.data(), pid.size());
    const int saved = errno;
    ::close(fd);
    if (written != static_cast<ssize_t>(pid.size())) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        throw_execution_error("Could not write lock file " + path + ": " + std::strerror(saved));
    }
    return true;
}

std::chrono::seconds seconds_param(const Value& params, std::string_view key, std::int64_t fallback) {
    const auto value = params::integer_or(params, key, fallback);
    if (value < 0) {
        throw_validation_error("Parameter '" + std::string(key) + "' must not be negative");
    }
    return std::chrono::seconds(value);
}

}  // namespace

class LockFileHandler::Impl {
public:
    using Operation = Value (Impl::*)(const Value&, HandlerContext&);

    Impl() {
        operations_ = {
            {"make", &Impl::make},
            {"trylock", &Impl::trylock},
            {"lock", &Impl::lock},
            {"release", &Impl::release},
            {"cleanup_manager", &Impl::cleanup_manager},
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
            throw_validation_error("Unknown lockfile function: " + function);
        }
        return (this->*(it->second))(params, context);
    }

private:
    Value make(const Value& params, HandlerContext& context) {
        auto state = std::make_unique<LockManagerState>();
        state->nfs = params::boolean_or(params, "nfs", false);
        const auto& max_age = params::member(params, "max_age");
        state->hold = seconds_param(params, max_age.isNull() ? "hold" : "max_age", 90);
        state->delay = seconds_param(params, "delay", 1);
        if (!params::member(params, "max_wait").isNull()) {
            state->max_wait = seconds_param(params, "max_wait", 0);
        }

        Value result(Json::objectValue);
        result["nfs"] = Value(state->nfs);
        result["hold"] = Value(static_cast<std::int64_t>(state->hold.count()));
        result["manager_id"] = Value(context.create(HandleKind::LockManager, std::move(state)));
        return result;
    }

    Value trylock(const Value& params, HandlerContext& context) {
        const auto manager_id = params::require_string(params, "manager_id");
        const auto filename = params::require_string(params, "filename");
        const auto pattern = params::optional_string(params, "lockfile_pattern");
        auto manager = context.acquire(manager_id, HandleKind::LockManager);
        const auto& settings = manager->state_as<LockManagerState>();

        auto result = attempt(manager_id, settings, filename, pattern, context);
        if (!result) {
            throw_execution_error("Could not acquire lock on " + filename + ": Lock file exists");
        }
        return *result;
    }

    // Retries every |delay| seconds until |max_wait| elapses.
    Value lock(const Value& params, HandlerContext& context) {
        const auto manager_id = params::require_string(params, "manager_id");
        const auto filename = params::require_string(params, "filename");
        const auto pattern = params::optional_string(params, "lockfile_pattern");
        auto manager = context.acquire(manager_id, HandleKind::LockManager);
        const auto& settings = manager->state_as<LockManagerState>();

        const auto deadline = std::chrono::steady_clock::now() + settings.max_wait.value_or(std::chrono::seconds(0));
        const auto delay = settings.delay.count() > 0 ? settings.delay : std::chrono::seconds(1);
        while (true) {
            if (auto result = attempt(manager_id, settings, filename, pattern, context)) {
                return *result;
            }
            if (std::chrono::steady_clock::now() + delay > deadline) {
                break;
            }
            std::this_thread::sleep_for(delay);
        }
        throw_execution_error("Could not acquire lock on " + filename + ": timed out waiting for lock file");
    }

    Value release(const Value& params, HandlerContext& context) {
        const auto lock_id = params::require_string(params, "lock_id");
        auto handle = context.acquire(lock_id, HandleKind::Lock);
        {
            std::scoped_lock guard(handle->mutex());
            auto& state = handle->state_as<LockState>();
            std::error_code ec;
            std::filesystem::remove(state.path, ec);
            if (ec) {
                throw_execution_error("Failed to release lock: " + ec.message());
            }
            state.released = true;
        }
        context.pool().remove(lock_id);

        Value result(Json::objectValue);
        result["lock_id"] = Value(lock_id);
        result["released"] = Value(true);
        return result;
    }

    // Releasing an unknown manager is a no-op so cleanup can be repeated.
    Value cleanup_manager(const Value& params, HandlerContext& context) {
        const auto manager_id = params::require_string(params, "manager_id");
        std::size_t released = 0;
        if (context.pool().get(manager_id)) {
            context.acquire(manager_id, HandleKind::LockManager);
            released = context.pool().children_of(manager_id).size();
            context.pool().remove(manager_id);
        }

        Value result(Json::objectValue);
        result["manager_id"] = Value(manager_id);
        result["cleaned_up"] = Value(true);
        result["locks_released"] = Value(static_cast<std::uint64_t>(released));
        return result;
    }

    std::optional<Value> attempt(const std::string& manager_id,
                                 const LockManagerState& settings,
                                 const std::string& filename,
                                 const std::optional<std::string>& pattern,
                                 HandlerContext& context) {
        const std::string path = expand_variables(pattern ? replace_all(*pattern, "%F", filename) : filename + ".lock");

        const auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                throw_execution_error("Could not acquire lock on " + filename + ": " + ec.message());
            }
        }

        if (!create_exclusive(path)) {
            if (!is_stale(path, settings.hold)) {
                return std::nullopt;
            }
            log_event(StructuredLogger::Level::Info, "lockfile.stale_broken", {{"path", path}});
            std::error_code ec;
            std::filesystem::remove(path, ec);
            if (!create_exclusive(path)) {
                return std::nullopt;
            }
        }

        auto state = std::make_unique<LockState>();
        state->filename = filename;
        state->path = path;

        Value result(Json::objectValue);
        result["filename"] = Value(filename);
        result["lockfile"] = Value(path);
        result["lock_id"] = Value(context.create(HandleKind::Lock, std::move(state), manager_id));
        return result;
    }

    std::map<std::string, Operation> operations_;
};

LockFileHandler::LockFileHandler()
    : impl_(std::make_unique<Impl>()) {}

LockFileHandler::~LockFileHandler() = default;

std::vector<std::string> LockFileHandler::functions() const {
    return impl_->names();
}

Value LockFileHandler::invoke(const std::string& function, const Value& params, HandlerContext& context) {
    return impl_->invoke(function, params, context);
}

}  // namespace cpanbridge::handlers
