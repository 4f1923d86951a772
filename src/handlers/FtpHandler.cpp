#include "cpanbridge/handlers/FtpHandler.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"
#include "cpanbridge/handlers/CurlSession.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>

namespace cpanbridge::handlers {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

constexpr std::int64_t kDefaultTimeoutSeconds = 60;
constexpr std::int64_t kDefaultPort = 21;

enum class SessionState {
    Connected,
    LoggedIn
};

enum class TransferMode {
    Binary,
    Ascii
};

// Login is deferred until "login"; "new" only records where to connect.
struct FtpSession final : NativeState {
    curl::EasyHandle easy;
    std::string host;
    long port{21};
    long timeout{60};
    std::string user;
    std::string password;
    SessionState state{SessionState::Connected};
    TransferMode mode{TransferMode::Binary};
    std::string directory{"/"};
    std::string last_message;

    CURL* handle() const { return static_cast<CURL*>(easy.get()); }
};

std::string_view state_name(SessionState state) {
    return state == SessionState::LoggedIn ? "logged_in" : "connected";
}

std::string_view mode_name(TransferMode mode) {
    return mode == TransferMode::Binary ? "binary" : "ascii";
}

// Keeps the last server reply line for "message".
std::size_t capture_reply(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* reply = static_cast<std::string*>(userdata);
    std::string line(ptr, size * nmemb);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    if (!line.empty()) {
        *reply = line;
    }
    return size * nmemb;
}

std::size_t write_to_stream(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ofstream*>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return out->good() ? size * nmemb : 0;
}

std::size_t read_from_stream(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    auto* in = static_cast<std::ifstream*>(userdata);
    in->read(buffer, static_cast<std::streamsize>(size * nitems));
    return static_cast<std::size_t>(in->gcount());
}

// Collapses "." and ".." and joins relative paths onto |base|.
std::string resolve_path(const std::string& base, const std::string& path) {
    std::filesystem::path joined = !path.empty() && path.front() == '/' ? std::filesystem::path(path)
                                                                        : std::filesystem::path(base) / path;
    std::filesystem::path normal;
    for (const auto& part : joined.lexically_normal()) {
        if (part == "..") {
            normal = normal.has_parent_path() ? normal.parent_path() : std::filesystem::path("/");
        } else if (!part.empty() && part != ".") {
            normal /= part;
        }
    }
    std::string result = normal.generic_string();
    if (result.empty() || result.front() != '/') {
        result.insert(result.begin(), '/');
    }
    while (result.size() > 1 && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        auto end = text.find('\n', start);
        if (end == std::string::npos) {
            end = text.size();
        }
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
        start = end + 1;
    }
    return lines;
}

class SlistBuilder {
public:
    ~SlistBuilder() {
        if (list_ != nullptr) {
            curl_slist_free_all(list_);
        }
    }

    void append(const std::string& line) {
        curl_slist* appended = curl_slist_append(list_, line.c_str());
        if (appended == nullptr) {
            throw BridgeError(ErrorKind::Resource, "Unable to allocate FTP command list");
        }
        list_ = appended;
    }

    curl_slist* get() const noexcept { return list_; }

private:
    curl_slist* list_{nullptr};
};

}  // namespace

class FtpHandler::Impl {
public:
    using Operation = Value (Impl::*)(const Value&, HandlerContext&);

    Impl() {
        operations_ = {
            {"new", &Impl::create},
            {"login", &Impl::login},
            {"cwd", &Impl::cwd},
            {"pwd", &Impl::pwd},
            {"dir", &Impl::dir},
            {"ls", &Impl::ls},
            {"binary", &Impl::binary},
            {"ascii", &Impl::ascii},
            {"get", &Impl::get},
            {"put", &Impl::put},
            {"delete", &Impl::remove},
            {"rename", &Impl::rename},
            {"mkdir", &Impl::mkdir},
            {"rmdir", &Impl::rmdir},
            {"message", &Impl::message},
            {"quit", &Impl::quit},
            {"get_connection_info", &Impl::connection_info},
            {"get_pool_stats", &Impl::pool_stats},
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
            throw_validation_error("Unknown ftp function: " + function);
        }
        return (this->*(it->second))(params, context);
    }

private:
    struct Locked {
        HandlePtr handle;
        std::unique_lock<std::mutex> guard;
        FtpSession* session;
    };

    static Locked lock_session(const Value& params, HandlerContext& context) {
        auto handle = context.acquire(params::require_string(params, "connection_id"), HandleKind::FtpSession);
        std::unique_lock<std::mutex> guard(handle->mutex());
        auto* session = &handle->state_as<FtpSession>();
        return {std::move(handle), std::move(guard), session};
    }

    static void require_login(const FtpSession& session) {
        if (session.state != SessionState::LoggedIn) {
            throw_execution_error("Not logged in");
        }
    }

    // ftp://host:port/%2F<escaped segments>; %2F makes the path absolute.
    static std::string url_for(const FtpSession& session, const std::string& absolute, bool directory) {
        std::string url = "ftp://" + session.host + ":" + std::to_string(session.port) + "/%2F";
        std::size_t start = 1;
        bool first = true;
        while (start < absolute.size()) {
            auto end = absolute.find('/', start);
            if (end == std::string::npos) {
                end = absolute.size();
            }
            const std::string segment = absolute.substr(start, end - start);
            char* escaped = curl_easy_escape(session.handle(), segment.c_str(), static_cast<int>(segment.size()));
            if (escaped == nullptr) {
                throw BridgeError(ErrorKind::Resource, "Unable to encode FTP path");
            }
            url += (first ? "" : "/") + std::string(escaped);
            curl_free(escaped);
            first = false;
            start = end + 1;
        }
        if (directory && !first) {
            url += "/";
        }
        return url;
    }

    // Resets per-call options; the connection cache survives curl_easy_reset.
    static void prepare(FtpSession& session, const std::string& url, char* error_buffer) {
        session.easy.reset();
        CURL* handle = session.handle();
        curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
        curl_easy_setopt(handle, CURLOPT_PROTOCOLS_STR, "ftp");
        curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, session.timeout);
        curl_easy_setopt(handle, CURLOPT_SERVER_RESPONSE_TIMEOUT, session.timeout);
        curl_easy_setopt(handle, CURLOPT_USERNAME, session.user.c_str());
        curl_easy_setopt(handle, CURLOPT_PASSWORD, session.password.c_str());
        curl_easy_setopt(handle, CURLOPT_TRANSFERTEXT, session.mode == TransferMode::Ascii ? 1L : 0L);
        curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, capture_reply);
        curl_easy_setopt(handle, CURLOPT_HEADERDATA, &session.last_message);
        curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
        error_buffer[0] = '\0';
    }

    static void perform(FtpSession& session, const std::string& what, const char* error_buffer) {
        const CURLcode rc = curl_easy_perform(session.handle());
        if (rc == CURLE_OK) {
            return;
        }
        std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        if (rc == CURLE_LOGIN_DENIED) {
            session.state = SessionState::Connected;
        }
        log_event(StructuredLogger::Level::Warning,
                  "ftp.command_failed",
                  {{"host", session.host}, {"operation", what}, {"error", detail}});
        if (!session.last_message.empty()) {
            detail += " (" + session.last_message + ")";
        }
        throw_execution_error(what + " failed: " + detail);
    }

    static Value reply(const FtpSession& session) {
        Value result(Json::objectValue);
        result["message"] = Value(session.last_message);
        return result;
    }

    Value create(const Value& params, HandlerContext& context) {
        auto host = params::require_string(params, "host");
        auto port = params::integer_or(params, "port", kDefaultPort);
        if (const auto colon = host.rfind(':'); colon != std::string::npos && host.find(':') == colon) {
            const auto digits = host.substr(colon + 1);
            if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos || digits.size() > 5) {
                throw_validation_error("Invalid port in host: " + host);
            }
            port = std::stoll(digits);
            host.resize(colon);
        }
        const auto timeout = params::integer_or(params, "timeout", kDefaultTimeoutSeconds);
        if (host.empty()) {
            throw_validation_error("Parameter 'host' must not be empty");
        }
        if (port <= 0 || port > 65535) {
            throw_validation_error("Parameter 'port' must be between 1 and 65535");
        }
        if (timeout <= 0) {
            throw_validation_error("Parameter 'timeout' must be positive");
        }

        auto session = std::make_unique<FtpSession>();
        session->host = host;
        session->port = static_cast<long>(port);
        session->timeout = static_cast<long>(timeout);

        Value result(Json::objectValue);
        result["host"] = Value(host);
        result["connection_id"] = Value(context.create(HandleKind::FtpSession, std::move(session)));
        return result;
    }

    Value login(const Value& params, HandlerContext& context) {
        auto locked = lock_session(params, context);
        auto& session = *locked.session;
        session.user = params::string_or(params, "user", "anonymous");
        session.password = params::string_or(params, "password", "");
        session.state = SessionState::Connected;

        char error_buffer[CURL_ERROR_SIZE];
        prepare(session, "ftp://" + session.host + ":" + std::to_string(session.port) + "/", error_buffer);
        curl_easy_setopt(session.handle(), CURLOPT_NOBODY, 1L);
        perform(session, "Login", error_buffer);

        char* entry = nullptr;
        curl_easy_getinfo(session.handle(), CURLINFO_FTP_ENTRY_PATH, &entry);
        session.directory = entry ? resolve_path("/", entry) : "/";
        session.state = SessionState::LoggedIn;

        Value result = reply(session);
        result["logged_in"] = Value(true);
        return result;
    }

    Value cwd(const Value& params, HandlerContext& context) {
        auto locked = lock_session(params, context);
        auto& session = *locked.session;
        require_login(session);
        const auto target = resolve_path(session.directory, params::string_or(params, "directory", "/"));

        char error_buffer[CURL_ERROR_SIZE];
        prepare(session, url_for(session, target, true), error_buffer);
        curl_easy_setopt(session.handle(), CURLOPT_NOBODY, 1L);
        perform(session, "CWD", error_buffer);
        session.directory = target;

        Value result = reply(session);
        result["directory"] = Value(target);
        return result;
    }

    Value pwd(const Value& params, HandlerContext& context) {
        auto locked = lock_session(params, context);
        require_login(*locked.session);
        Value result(Json::objectValue);
        result["directory"] = Value(locked.session->directory);
        return result;
    }

    Value dir(const Value& params, HandlerContext& context) {
        return listing(params, context, false);
    }

    Value ls(const Value& params, HandlerContext& context) {
        return listing(params, context, true);
    }

    Value listing(const Value& params, HandlerContext& context, bool names_only) {
        auto locked = lock_session(params, context);
        auto& session = *locked.session;
        require_login(session);
        const auto target = resolve_path(session.directory, params::string_or(params, "path", ""));

        std::string body;
        char error_buffer[CURL_ERROR_SIZE];
        prepare(session, url_for(session, target, true), error_buffer);
        curl_easy_setopt(session.handle(), CURLOPT_DIRLISTONLY, names_only ? 1L : 0L);
        curl_easy_setopt(session.handle(), CURLOPT_WRITEFUNCTION, curl::append_to_string);
        curl_easy_setopt(session.handle(), CURLOPT_WRITEDATA, &body);
        perform(session, names_only ? "NLST" : "LIST", error_buffer);

        const auto lines = split_lines(body);
        Value result = reply(session);
        result["listing"] = string_array(lines);
        result["count"] = Value(static_cast<std::uint64_t>(lines.size()));
        return result;
    }

    Value binary(const Value& params, HandlerContext& context) {
        return set_mode(params, context, TransferMode::Binary);
    }

    Value ascii(const Value& params, HandlerContext& context) {
        return set_mode(params, context, TransferMode::Ascii);
    }

    Value set_mode(const Value& params, HandlerContext& context, TransferMode mode) {
        auto locked = lock_session(params, context);
        locked.session->mode = mode;
        Value result(Json::objectValue);
        result["transfer_mode"] = Value(std::string(mode_name(mode)));
        return result;
    }

    Value get(const Value& params, HandlerContext& context) {
        auto locked = lock_session(params, context);
        auto& session = *locked.session;
        require_login(session);
        const auto remote = params::require_string(params, "remote_file");
        const auto remote_path = resolve_path(session.directory, remote);
        const auto local = params::string_or(params, "local_file",
                                             std::filesystem::path(remote_path).filename().string());

        std::ofstream out(local, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw_execution_error("Local file error: cannot open " + local);
        }
        char error_buffer[CURL_ERROR_SIZE];
        prepare(session, url_for(session, remote_path, false), error_buffer);
        curl_easy_setopt(session.handle(), CURLOPT_WRITEFUNCTION, write_to_stream);
        curl_easy_setopt(session.handle(), CURLOPT_WRITEDATA, &out);
        try {
            perform(session, "Download", error_buffer);
        } catch (const BridgeError&) {
            out.close();
            std::error_code ec;
            std::filesystem::remove(local, ec);
            throw;
        }
        out.close();

        curl_off_t bytes = 0;
        curl_easy_getinfo(session.handle(), CURLINFO_SIZE_DOWNLOAD_T, &bytes);
        Value result = reply(session);
        result["local_file"] = Value(local);
        result["bytes"] = Value(static_cast<std::int64_t>(bytes));
        return result;
    }

    Value put(const Value& params, HandlerContext& context) {
        auto locked = lock_session(params, context);
        auto& session = *locked.session;
        require_login(session);
        const auto local = params::require_string(params, "local_file");
        const auto remote = params::string_or(params, "remote_file", std::filesystem::path(local).filename().string());
        const auto remote_path = resolve_path(session.directory, remote);

        std::ifstream in(local, std::ios::binary);
        if (!in) {
            throw_execution_error("Local file error: cannot open " + local);
        }
        std::error_code ec;
        const auto size = std::filesystem::file_size(local, ec);

        char error_buffer[CURL_ERROR_SIZE];
        prepare(session, url_for(session, remote_path, false), error_buffer);
        curl_easy_setopt(session.handle(), CURLOPT_UPLOAD, 1L);
        curl_easy_setopt(session.handle(), CURLOPT_READFUNCTION, read_from_stream);
        curl_easy_setopt(session.handle(), CURLOPT_READDATA, &in);
        if (!ec) {
            curl_easy_setopt(session.handle(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(size));
        }
        perform(session, "Upload", error_buffer);

        Value result = reply(session);
        result["remote_file"] = Value(remote_path);
        result["bytes"] = Value(static_cast<std::uint64_t>(ec ? 0 : size));
        return result;
    }

    // Runs raw commands after changing into the session directory.
    Value quote(const Value& params, HandlerContext& context, const std::string& what, const std::vector<std::string>& commands) {
        auto locked = lock_session(params, context);
        auto& session = *locked.session;
        require_login(session);

        SlistBuilder list;
        for (const auto& command : commands) {
            list.append(command);
        }
        char error_buffer[CURL_ERROR_SIZE];
        prepare(session, url_for(session, session.directory, true), error_buffer);
        curl_easy_setopt(session.handle(), CURLOPT_NOBODY, 1L);
        curl_easy_setopt(session.handle(), CURLOPT_QUOTE, list.get());
        perform(session, what, error_buffer);
        return reply(session);
    }

    std::string absolute(const Value& params, HandlerContext& context, std::string_view key) {
        auto locked = lock_session(params, context);
        return resolve_path(locked.session->directory, params::require_string(params, key));
    }

    Value remove(const Value& params, HandlerContext& context) {
        const auto path = absolute(params, context, "remote_file");
        Value result = quote(params, context, "Delete", {"DELE " + path});
        result["deleted"] = Value(path);
        return result;
    }

    Value rename(const Value& params, HandlerContext& context) {
        const auto from = absolute(params, context, "old_name");
        const auto to = absolute(params, context, "new_name");
        Value result = quote(params, context, "Rename", {"RNFR " + from, "RNTO " + to});
        result["renamed"] = Value(to);
        return result;
    }

    Value mkdir(const Value& params, HandlerContext& context) {
        const auto path = absolute(params, context, "directory");
        Value result = quote(params, context, "MKD", {"MKD " + path});
        result["directory"] = Value(path);
        return result;
    }

    Value rmdir(const Value& params, HandlerContext& context) {
        const auto path = absolute(params, context, "directory");
        Value result = quote(params, context, "RMD", {"RMD " + path});
        result["directory"] = Value(path);
        return result;
    }

    Value message(const Value& params, HandlerContext& context) {
        auto locked = lock_session(params, context);
        return reply(*locked.session);
    }

    // Quitting an unknown session succeeds so cleanup can be repeated.
    Value quit(const Value& params, HandlerContext& context) {
        const auto connection_id = params::require_string(params, "connection_id");
        bool closed = false;
        if (context.pool().get(connection_id)) {
            context.acquire(connection_id, HandleKind::FtpSession);
            closed = context.pool().remove(connection_id);
        }
        Value result(Json::objectValue);
        result["connection_id"] = Value(connection_id);
        result["closed"] = Value(closed);
        return result;
    }

    Value connection_info(const Value& params, HandlerContext& context) {
        auto locked = lock_session(params, context);
        const auto& session = *locked.session;
        const auto now = Handle::Clock::now();
        const auto age = std::chrono::duration<double>(now - locked.handle->created_at()).count();

        Value result(Json::objectValue);
        result["connection_id"] = Value(locked.handle->id());
        result["host"] = Value(session.host);
        result["port"] = Value(static_cast<std::int64_t>(session.port));
        result["state"] = Value(std::string(state_name(session.state)));
        result["transfer_mode"] = Value(std::string(mode_name(session.mode)));
        result["current_directory"] = Value(session.directory);
        result["age"] = Value(age);
        result["requests"] = Value(locked.handle->use_count());
        return result;
    }

    Value pool_stats(const Value&, HandlerContext& context) {
        std::uint64_t logged_in = 0;
        std::vector<std::string> ids;
        const auto sessions = context.pool().by_kind(HandleKind::FtpSession);
        for (const auto& handle : sessions) {
            ids.push_back(handle->id());
            std::scoped_lock guard(handle->mutex());
            if (handle->state_as<FtpSession>().state == SessionState::LoggedIn) {
                ++logged_in;
            }
        }
        std::sort(ids.begin(), ids.end());

        Value result(Json::objectValue);
        result["total_connections"] = Value(static_cast<std::uint64_t>(sessions.size()));
        result["connected"] = Value(static_cast<std::uint64_t>(sessions.size()) - logged_in);
        result["logged_in"] = Value(logged_in);
        result["connection_ids"] = string_array(ids);
        return result;
    }

    std::map<std::string, Operation> operations_;
};

FtpHandler::FtpHandler()
    : impl_(std::make_unique<Impl>()) {}

FtpHandler::~FtpHandler() = default;

std::vector<std::string> FtpHandler::functions() const {
    return impl_->names();
}

Value FtpHandler::invoke(const std::string& function, const Value& params, HandlerContext& context) {
    return impl_->invoke(function, params, context);
}

}  // namespace cpanbridge::handlers
