#include "cpanbridge/handlers/CurlSession.hpp"

#include "cpanbridge/core/BridgeError.hpp"

#include <curl/curl.h>

namespace cpanbridge::handlers::curl {

void ensure_global_init() {
    static const bool curl_ready = [] {
        return curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    }();
    if (!curl_ready) {
        throw_execution_error("Unable to initialize libcurl");
    }
}

EasyHandle::EasyHandle() {
    ensure_global_init();
    handle_ = curl_easy_init();
    if (!handle_) {
        throw BridgeError(ErrorKind::Resource, "Unable to allocate curl handle");
    }
}

EasyHandle::~EasyHandle() {
    if (handle_) {
        curl_easy_cleanup(static_cast<CURL*>(handle_));
    }
}

void EasyHandle::reset() {
    curl_easy_reset(static_cast<CURL*>(handle_));
}

std::size_t append_to_string(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* buffer = static_cast<std::string*>(userdata);
    buffer->append(ptr, size * nmemb);
    return size * nmemb;
}

}  // namespace cpanbridge::handlers::curl
