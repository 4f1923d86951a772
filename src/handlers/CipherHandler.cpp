#include "cpanbridge/handlers/CipherHandler.hpp"

#include "cpanbridge/daemon/StructuredLogger.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/provider.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <map>

namespace cpanbridge::handlers {

using daemon::StructuredLogger;
using daemon::log_event;

namespace {

using Bytes = std::string;

struct CipherDeleter {
    void operator()(EVP_CIPHER* cipher) const {
        if (cipher != nullptr) {
            EVP_CIPHER_free(cipher);
        }
    }
};
using UniqueCipher = std::unique_ptr<EVP_CIPHER, CipherDeleter>;

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx != nullptr) {
            EVP_CIPHER_CTX_free(ctx);
        }
    }
};
using UniqueCipherContext = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

// Blowfish lives in the legacy provider on OpenSSL 3. Loading any provider
// explicitly disables the implicit default one, so both are loaded together.
bool providers_ready() {
    static const bool ready = [] {
        OSSL_PROVIDER* defaults = OSSL_PROVIDER_load(nullptr, "default");
        OSSL_PROVIDER* legacy = OSSL_PROVIDER_load(nullptr, "legacy");
        if (!legacy) {
            ERR_clear_error();
            log_event(StructuredLogger::Level::Warning,
                      "crypto.legacy_provider_unavailable",
                      {{"effect", "Blowfish disabled"}});
        }
        return defaults != nullptr;
    }();
    return ready;
}

std::string openssl_error(std::string_view context) {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) {
        return std::string(context);
    }
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    return std::string(context) + ": " + buffer;
}

struct Algorithm {
    std::string name;
    const char* evp_name;
};

std::optional<Algorithm> normalize_algorithm(const std::string& requested) {
    std::string lowered;
    std::transform(requested.begin(), requested.end(), std::back_inserter(lowered), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "blowfish" || lowered == "crypt::blowfish") {
        return Algorithm{"Blowfish", "BF-CBC"};
    }
    if (lowered == "aes" || lowered == "rijndael" || lowered == "crypt::rijndael" || lowered == "crypt::openssl::aes") {
        return Algorithm{"AES", nullptr};
    }
    return std::nullopt;
}

const char* aes_evp_name(std::size_t key_length) {
    switch (key_length) {
        case 16:
            return "AES-128-CBC";
        case 24:
            return "AES-192-CBC";
        default:
            return "AES-256-CBC";
    }
}

UniqueCipher fetch_cipher(const char* evp_name) {
    if (!providers_ready()) {
        return nullptr;
    }
    UniqueCipher cipher(EVP_CIPHER_fetch(nullptr, evp_name, nullptr));
    if (!cipher) {
        ERR_clear_error();
    }
    return cipher;
}

bool is_base64(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        return false;
    }
    std::size_t padding = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0 || !(std::isalnum(c) || c == '+' || c == '/')) {
            return false;
        }
    }
    return padding <= 2;
}

std::optional<Bytes> decode_base64(const std::string& text) {
    if (!is_base64(text)) {
        return std::nullopt;
    }
    Bytes out(text.size() / 4 * 3, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        return std::nullopt;
    }
    const auto padding = static_cast<std::size_t>(std::count(text.end() - 2, text.end(), '='));
    out.resize(static_cast<std::size_t>(written) - padding);
    return out;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

std::optional<Bytes> decode_hex(const std::string& text) {
    if (text.size() % 2 != 0) {
        return std::nullopt;
    }
    Bytes out;
    out.reserve(text.size() / 2);
    for (std::size_t i = 0; i < text.size(); i += 2) {
        const int high = hex_digit(text[i]);
        const int low = hex_digit(text[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>((high << 4) | low));
    }
    return out;
}

std::string encode_hex(const Bytes& data) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (const unsigned char c : data) {
        out.push_back(kDigits[c >> 4]);
        out.push_back(kDigits[c & 0x0F]);
    }
    return out;
}

Bytes prepare_key(const std::string& material, const std::string& algorithm) {
    Bytes key;
    if (auto decoded = decode_base64(material)) {
        key = std::move(*decoded);
    } else if (auto hex = decode_hex(material)) {
        key = std::move(*hex);
    } else {
        key = material;
    }

    if (algorithm == "Blowfish") {
        if (key.size() > 56) {
            key.resize(56);
        } else if (key.size() < 4) {
            key.resize(4, '\0');
        }
    } else if (key.size() <= 16) {
        key.resize(16, '\0');
    } else if (key.size() <= 24) {
        key.resize(24, '\0');
    } else {
        key.resize(32, '\0');
    }
    return key;
}

// Strips PEM armour lines and newlines, keeping the base64 body.
std::string read_key_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw_execution_error("Cannot read key file: " + path);
    }
    std::string key;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty() && line.front() == '-' && line.back() == '-') {
            continue;
        }
        key += line;
    }
    return key;
}

struct CipherState final : NativeState {
    std::string algorithm;
    Bytes key;
    UniqueCipher cipher;

    ~CipherState() override {
        OPENSSL_cleanse(key.data(), key.size());
    }
};

Bytes run_cipher(const CipherState& state, const Bytes& iv, const Bytes& input, bool encrypt) {
    UniqueCipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw BridgeError(ErrorKind::Resource, "Cannot allocate cipher context");
    }
    const int mode = encrypt ? 1 : 0;
    if (EVP_CipherInit_ex(ctx.get(), state.cipher.get(), nullptr, nullptr, nullptr, mode) != 1) {
        throw_execution_error(openssl_error("Cipher initialisation failed"));
    }
    if (EVP_CIPHER_CTX_set_key_length(ctx.get(), static_cast<int>(state.key.size())) != 1) {
        throw_execution_error(openssl_error("Unsupported key length"));
    }
    if (EVP_CipherInit_ex(ctx.get(),
                          nullptr,
                          nullptr,
                          reinterpret_cast<const unsigned char*>(state.key.data()),
                          reinterpret_cast<const unsigned char*>(iv.data()),
                          mode) != 1) {
        throw_execution_error(openssl_error("Cipher key setup failed"));
    }

    Bytes output(input.size() + static_cast<std::size_t>(EVP_CIPHER_CTX_get_block_size(ctx.get())), '\0');
    int produced = 0;
    if (EVP_CipherUpdate(ctx.get(),
                         reinterpret_cast<unsigned char*>(output.data()),
                         &produced,
                         reinterpret_cast<const unsigned char*>(input.data()),
                         static_cast<int>(input.size())) != 1) {
        throw_execution_error(openssl_error(encrypt ? "Encryption failed" : "Decryption failed"));
    }
    int tail = 0;
    if (EVP_CipherFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(output.data()) + produced, &tail) != 1) {
        throw_execution_error(openssl_error(encrypt ? "Encryption failed" : "Decryption failed: bad key or corrupted data"));
    }
    output.resize(static_cast<std::size_t>(produced + tail));
    return output;
}

}  // namespace

std::vector<std::string> CipherHandler::supported_algorithms() {
    std::vector<std::string> result;
    if (fetch_cipher("BF-CBC")) {
        result.emplace_back("Blowfish");
    }
    if (fetch_cipher("AES-256-CBC")) {
        result.emplace_back("AES");
    }
    return result;
}

class CipherHandler::Impl {
public:
    using Operation = Value (Impl::*)(const Value&, HandlerContext&);

    Impl() {
        operations_ = {
            {"new", &Impl::create},
            {"encrypt", &Impl::encrypt},
            {"decrypt", &Impl::decrypt},
            {"cleanup_cipher", &Impl::cleanup},
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
            throw_validation_error("Unknown crypto function: " + function);
        }
        return (this->*(it->second))(params, context);
    }

private:
    Value create(const Value& params, HandlerContext& context) {
        const auto requested = params::string_or(params, "cipher", "Blowfish");
        const auto algorithm = normalize_algorithm(requested);
        if (!algorithm) {
            throw_validation_error("Unsupported cipher: " + requested);
        }

        std::string material;
        if (const auto key = params::optional_string(params, "key"); key && !key->empty()) {
            material = *key;
        } else if (const auto key_file = params::optional_string(params, "key_file")) {
            material = read_key_file(*key_file);
        } else {
            throw_validation_error("Missing required parameter: key or key_file");
        }
        if (material.empty()) {
            throw_validation_error("Encryption key is empty");
        }

        auto state = std::make_unique<CipherState>();
        state->algorithm = algorithm->name;
        state->key = prepare_key(material, algorithm->name);
        const char* evp_name = algorithm->evp_name ? algorithm->evp_name : aes_evp_name(state->key.size());
        state->cipher = fetch_cipher(evp_name);
        if (!state->cipher) {
            throw_execution_error("Cipher " + algorithm->name + " is not available in this OpenSSL build");
        }

        const auto key_length = static_cast<std::uint64_t>(state->key.size());
        Value result(Json::objectValue);
        result["cipher"] = Value(algorithm->name);
        result["key_length"] = Value(key_length);
        result["cipher_id"] = Value(context.create(HandleKind::CipherContext, std::move(state)));
        return result;
    }

    Value encrypt(const Value& params, HandlerContext& context) {
        const auto cipher_id = params::require_string(params, "cipher_id");
        const auto plaintext = params::require_string(params, "plaintext");
        auto handle = context.acquire(cipher_id, HandleKind::CipherContext);
        std::scoped_lock guard(handle->mutex());
        const auto& state = handle->state_as<CipherState>();

        Bytes iv(static_cast<std::size_t>(EVP_CIPHER_get_iv_length(state.cipher.get())), '\0');
        if (RAND_bytes(reinterpret_cast<unsigned char*>(iv.data()), static_cast<int>(iv.size())) != 1) {
            throw_execution_error(openssl_error("Cannot generate IV"));
        }
        const auto ciphertext = run_cipher(state, iv, plaintext, true);
        const auto encoded = encode_hex(iv + ciphertext);

        Value result(Json::objectValue);
        result["encrypted"] = Value(encoded);
        result["length"] = Value(static_cast<std::uint64_t>(encoded.size()));
        result["algorithm"] = Value(state.algorithm);
        return result;
    }

    Value decrypt(const Value& params, HandlerContext& context) {
        const auto cipher_id = params::require_string(params, "cipher_id");
        const auto hex = params::require_string(params, "hex_ciphertext");
        auto handle = context.acquire(cipher_id, HandleKind::CipherContext);
        std::scoped_lock guard(handle->mutex());
        const auto& state = handle->state_as<CipherState>();

        const auto data = decode_hex(hex);
        if (!data) {
            throw_validation_error("Invalid hex input");
        }
        const auto iv_length = static_cast<std::size_t>(EVP_CIPHER_get_iv_length(state.cipher.get()));
        if (data->size() <= iv_length) {
            throw_execution_error("Ciphertext too short");
        }
        const auto plaintext = run_cipher(state, data->substr(0, iv_length), data->substr(iv_length), false);

        Value result(Json::objectValue);
        result["decrypted"] = Value(plaintext);
        result["length"] = Value(static_cast<std::uint64_t>(plaintext.size()));
        result["algorithm"] = Value(state.algorithm);
        return result;
    }

    Value cleanup(const Value& params, HandlerContext& context) {
        const auto cipher_id = params::require_string(params, "cipher_id");
        context.acquire(cipher_id, HandleKind::CipherContext);
        context.pool().remove(cipher_id);

        Value result(Json::objectValue);
        result["cipher_id"] = Value(cipher_id);
        result["cleaned_up"] = Value(true);
        return result;
    }

    std::map<std::string, Operation> operations_;
};

CipherHandler::CipherHandler()
    : impl_(std::make_unique<Impl>()) {}

CipherHandler::~CipherHandler() = default;

std::vector<std::string> CipherHandler::functions() const {
    return impl_->names();
}

Value CipherHandler::invoke(const std::string& function, const Value& params, HandlerContext& context) {
    return impl_->invoke(function, params, context);
}

}  // namespace cpanbridge::handlers
