#include "cpanbridge/handlers/HttpHandler.hpp"

#include "cpanbridge/Version.hpp"
#include "cpanbridge/daemon/StructuredLogger.hpp"
#include "cpanbridge/handlers/CurlSession.hpp"
#include "cpanbridge/protocol/Json.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>

namespace cpanbridge::handlers {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

constexpr long kDefaultTimeoutSeconds = 180;
constexpr long kMaxConnectTimeoutSeconds = 30;
constexpr long kMaxRedirects = 7;

struct SlistDeleter {
    void operator()(curl_slist* list) const {
        if (list != nullptr) {
            curl_slist_free_all(list);
        }
    }
};
using UniqueSlist = std::unique_ptr<curl_slist, SlistDeleter>;

// Response headers of the final hop; every new status line starts over so
// redirect responses do not leak into the result.
struct HeaderCapture {
    std::string status_line;
    std::map<std::string, std::string> headers;
};

std::string trim(std::string text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::size_t capture_header(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* capture = static_cast<HeaderCapture*>(userdata);
    const std::size_t length = size * nmemb;
    std::string line = trim(std::string(ptr, length));
    if (line.rfind("HTTP/", 0) == 0) {
        capture->status_line = line;
        capture->headers.clear();
        return length;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
        return length;
    }
    const auto name = trim(line.substr(0, colon));
    const auto value = trim(line.substr(colon + 1));
    auto [it, inserted] = capture->headers.emplace(name, value);
    if (!inserted) {
        it->second += ", " + value;
    }
    return length;
}

// "HTTP/1.1 404 Not Found" -> "Not Found"; HTTP/2 status lines carry no phrase.
std::string reason_from_status_line(const std::string& line) {
    const auto first = line.find(' ');
    if (first == std::string::npos) {
        return {};
    }
    const auto second = line.find(' ', first + 1);
    if (second == std::string::npos) {
        return {};
    }
    return trim(line.substr(second + 1));
}

std::string upper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return text;
}

std::string header_text(const Value& value) {
    return value.isString() ? value.asString() : protocol::to_json(value);
}

bool has_header(const Value& headers, std::string_view name) {
    if (!headers.isObject()) {
        return false;
    }
    for (const auto& key : headers.getMemberNames()) {
        if (upper(key) == upper(std::string(name))) {
            return true;
        }
    }
    return false;
}

Value perform_request(const Value& params, std::string method) {
    const auto url = params::require_string(params, "url");
    if (url.rfind("http://", 0) != 0 && url.rfind("https://", 0) != 0) {
        throw_validation_error("Only http and https URLs are supported: " + url);
    }
    method = upper(method.empty() ? std::string("GET") : method);
    const auto& headers = params::member(params, "headers");
    if (!headers.isNull() && !headers.isObject()) {
        throw_validation_error("Parameter 'headers' must be an object");
    }
    const auto form = params::optional_string(params, "form_encoded_content");
    const auto content = params::optional_string(params, "content");
    const auto timeout = params::integer_or(params, "timeout", kDefaultTimeoutSeconds);
    if (timeout <= 0) {
        throw_validation_error("Parameter 'timeout' must be positive");
    }
    const bool verify_ssl = params::boolean_or(params, "verify_ssl", true);

    curl::EasyHandle easy;
    CURL* handle = static_cast<CURL*>(easy.get());

    UniqueSlist header_list;
    for (const auto& name : headers.getMemberNames()) {
        const auto line = name + ": " + header_text(headers[name]);
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw BridgeError(ErrorKind::Resource, "Unable to allocate request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }
    std::string body;
    bool has_body = false;
    if (form) {
        body = *form;
        has_body = true;
        if (!has_header(headers, "Content-Type")) {
            curl_slist* appended = curl_slist_append(header_list.get(), "Content-Type: application/x-www-form-urlencoded");
            if (!appended) {
                throw BridgeError(ErrorKind::Resource, "Unable to allocate request headers");
            }
            header_list.release();
            header_list.reset(appended);
        }
    } else if (content) {
        body = *content;
        has_body = true;
    }

    std::string response_body;
    HeaderCapture capture;
    char error_buffer[CURL_ERROR_SIZE] = {0};
    const std::string user_agent = "cpanbridge/" + std::string(kDaemonVersion);

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(handle, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, kMaxRedirects);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(timeout));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, std::min(static_cast<long>(timeout), kMaxConnectTimeoutSeconds));
    curl_easy_setopt(handle, CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, verify_ssl ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, verify_ssl ? 2L : 0L);
    curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, curl::append_to_string);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, capture_header);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &capture);
    if (header_list) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    }

    if (method == "GET") {
        curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
    } else if (method == "HEAD") {
        curl_easy_setopt(handle, CURLOPT_NOBODY, 1L);
    } else if (method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
    } else {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (has_body || method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
    }

    const auto started = std::chrono::steady_clock::now();
    const CURLcode rc = curl_easy_perform(handle);
    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
    if (rc != CURLE_OK) {
        const std::string detail = error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc);
        log_event(StructuredLogger::Level::Warning,
                  "http.request_failed",
                  {{"method", method}, {"url", url}, {"error", detail}});
        throw_execution_error("HTTP request failed: " + detail);
    }

    long status = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status);
    char* effective_url = nullptr;
    curl_easy_getinfo(handle, CURLINFO_EFFECTIVE_URL, &effective_url);

    std::string reason = reason_from_status_line(capture.status_line);
    if (reason.empty()) {
        reason = HttpHandler::reason_phrase(status);
    }
    const bool is_success = status >= 200 && status < 300;

    Value result(Json::objectValue);
    result["status_code"] = Value(static_cast<std::int64_t>(status));
    result["reason"] = Value(reason);
    result["status_line"] = Value(std::to_string(status) + " " + reason);
    result["content"] = Value(response_body);
    result["body"] = Value(response_body);
    result["headers"] = Value(Json::objectValue);
    auto& header_values = result["headers"];
    for (const auto& [name, value] : capture.headers) {
        header_values[name] = Value(value);
    }
    result["url"] = Value(effective_url ? std::string(effective_url) : url);
    result["elapsed"] = Value(elapsed);
    result["is_success"] = Value(is_success);
    result["success"] = Value(status < 400);
    if (status >= 400) {
        result["error"] = Value("HTTP " + std::to_string(status) + ": " + reason);
    }
    return result;
}

}  // namespace

std::string HttpHandler::reason_phrase(long status) {
    static const std::map<long, std::string> kPhrases = {
        {200, "OK"},
        {201, "Created"},
        {202, "Accepted"},
        {204, "No Content"},
        {300, "Multiple Choices"},
        {301, "Moved Permanently"},
        {302, "Found"},
        {304, "Not Modified"},
        {307, "Temporary Redirect"},
        {308, "Permanent Redirect"},
        {400, "Bad Request"},
        {401, "Unauthorized"},
        {403, "Forbidden"},
        {404, "Not Found"},
        {405, "Method Not Allowed"},
        {408, "Request Timeout"},
        {409, "Conflict"},
        {410, "Gone"},
        {429, "Too Many Requests"},
        {500, "Internal Server Error"},
        {501, "Not Implemented"},
        {502, "Bad Gateway"},
        {503, "Service Unavailable"},
        {504, "Gateway Timeout"},
        {505, "HTTP Version Not Supported"},
    };
    const auto it = kPhrases.find(status);
    return it != kPhrases.end() ? it->second : "Unknown";
}

std::vector<std::string> HttpHandler::functions() const {
    return {"get", "lwp_request", "post"};
}

Value HttpHandler::invoke(const std::string& function, const Value& params, HandlerContext&) {
    if (function == "lwp_request") {
        return perform_request(params, params::string_or(params, "method", "GET"));
    }
    if (function == "get") {
        return perform_request(params, "GET");
    }
    if (function == "post") {
        return perform_request(params, "POST");
    }
    throw_validation_error("Unknown http function: " + function);
}

}  // namespace cpanbridge::handlers
