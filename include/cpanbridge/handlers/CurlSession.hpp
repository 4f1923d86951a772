#pragma once

#include <cstddef>
#include <string>

// libcurl plumbing shared by the http and ftp handlers. Curl types stay out
// of this header; callers that configure the handle include <curl/curl.h>.
namespace cpanbridge::handlers::curl {

// One-time curl_global_init; throws BridgeError(Execution) when it failed.
void ensure_global_init();

// Owning wrapper over a CURL easy handle.
class EasyHandle {
public:
    EasyHandle();
    ~EasyHandle();

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;

    void* get() const noexcept { return handle_; }

    // Clears every option so the handle can be reused with its connection cache.
    void reset();

private:
    void* handle_{nullptr};
};

// CURLOPT_WRITEFUNCTION / CURLOPT_HEADERFUNCTION target appending to a std::string.
std::size_t append_to_string(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);

}  // namespace cpanbridge::handlers::curl
