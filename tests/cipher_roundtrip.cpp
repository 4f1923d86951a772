#include "bridge_fixture.hpp"

#include <cassert>
#include <cstdio>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace cpanbridge;
using cpanbridge::test::BridgeFixture;
using cpanbridge::test::flag;
using cpanbridge::test::integer;
using cpanbridge::test::text;

namespace {

std::string new_cipher(BridgeFixture& bridge, const std::string& algorithm, const std::string& key) {
    Value params(Json::objectValue);
    params["cipher"] = Value(algorithm);
    params["key"] = Value(key);
    const auto created = bridge.result_of("crypto", "new", params);
    assert(text(created, "cipher") == algorithm);
    return text(created, "cipher_id");
}

std::string encrypt(BridgeFixture& bridge, const std::string& cipher_id, const std::string& plaintext) {
    Value params(Json::objectValue);
    params["cipher_id"] = Value(cipher_id);
    params["plaintext"] = Value(plaintext);
    const auto result = bridge.result_of("crypto", "encrypt", params);
    const auto& encrypted = text(result, "encrypted");
    assert(integer(result, "length") == static_cast<std::int64_t>(encrypted.size()));
    return encrypted;
}

protocol::Response decrypt(BridgeFixture& bridge, const std::string& cipher_id, const std::string& hex) {
    Value params(Json::objectValue);
    params["cipher_id"] = Value(cipher_id);
    params["hex_ciphertext"] = Value(hex);
    return bridge.call("crypto", "decrypt", params);
}

}  // namespace

int main() {
    BridgeFixture bridge;
    const std::string message = "Hello, World! \xC3\xA9t\xC3\xA9";

    for (const auto& algorithm : handlers::CipherHandler::supported_algorithms()) {
        const auto cipher_id = new_cipher(bridge, algorithm, "my-secret-key!");
        assert(cipher_id.rfind("cipher_", 0) == 0);

        const auto first = encrypt(bridge, cipher_id, message);
        const auto second = encrypt(bridge, cipher_id, message);
        assert(first.size() % 2 == 0);
        // A fresh IV per call.
        assert(first != second);

        const auto plain = decrypt(bridge, cipher_id, first);
        assert(plain.success);
        assert(text(plain.result, "decrypted") == message);
        assert(text(plain.result, "algorithm") == algorithm);

        const auto empty = decrypt(bridge, cipher_id, encrypt(bridge, cipher_id, ""));
        assert(empty.success);
        assert(text(empty.result, "decrypted").empty());

        // A different key never yields the original plaintext.
        const auto other_id = new_cipher(bridge, algorithm, "another-key!!");
        const auto foreign = decrypt(bridge, other_id, first);
        assert(!foreign.success || text(foreign.result, "decrypted") != message);
        if (!foreign.success) {
            assert(foreign.error_kind == ErrorKind::Execution);
        }

        assert(decrypt(bridge, cipher_id, "zz").error_kind == ErrorKind::Validation);
        assert(decrypt(bridge, cipher_id, "abc").error_kind == ErrorKind::Validation);
        assert(decrypt(bridge, cipher_id, "00").error_kind == ErrorKind::Execution);

        Value cleanup(Json::objectValue);
        cleanup["cipher_id"] = Value(cipher_id);
        assert(flag(bridge.result_of("crypto", "cleanup_cipher", cleanup), "cleaned_up"));
        assert(decrypt(bridge, cipher_id, first).error_kind == ErrorKind::Handle);
        assert(bridge.call("crypto", "cleanup_cipher", cleanup).error_kind == ErrorKind::Handle);
    }

    for (const auto& algorithm : handlers::CipherHandler::supported_algorithms()) {
        if (algorithm != "AES") {
            continue;
        }
        Value params(Json::objectValue);
        params["cipher"] = "Crypt::Rijndael";
        params["key"] = "this is a key for aes";
        const auto created = bridge.result_of("crypto", "new", params);
        assert(text(created, "cipher") == "AES");
        assert(integer(created, "key_length") == 24);
    }

    {
        Value unsupported(Json::objectValue);
        unsupported["cipher"] = "DES";
        unsupported["key"] = "whatever";
        assert(bridge.call("crypto", "new", unsupported).error_kind == ErrorKind::Validation);

        Value keyless(Json::objectValue);
        keyless["cipher"] = "AES";
        assert(bridge.call("crypto", "new", keyless).error_kind == ErrorKind::Validation);

        Value missing_file(Json::objectValue);
        missing_file["cipher"] = "AES";
        missing_file["key_file"] = "/nonexistent/cpanbridge.key";
        assert(bridge.call("crypto", "new", missing_file).error_kind == ErrorKind::Execution);
    }

    if (!handlers::CipherHandler::supported_algorithms().empty()) {
        const auto algorithm = handlers::CipherHandler::supported_algorithms().front();
        const std::string path = "/tmp/cpanbridge_cipher_test_" + std::to_string(::getpid()) + ".pem";
        {
            std::ofstream out(path);
            out << "-----BEGIN KEY-----\n"
                << "c2VjcmV0a2V5MTIzNDU2Nzg=\n"
                << "-----END KEY-----\n";
        }
        Value params(Json::objectValue);
        params["cipher"] = Value(algorithm);
        params["key_file"] = Value(path);
        const auto from_file = text(bridge.result_of("crypto", "new", params), "cipher_id");
        const auto from_inline = new_cipher(bridge, algorithm, "c2VjcmV0a2V5MTIzNDU2Nzg=");
        const auto sealed = encrypt(bridge, from_file, message);
        const auto opened = decrypt(bridge, from_inline, sealed);
        assert(opened.success);
        assert(text(opened.result, "decrypted") == message);
        std::remove(path.c_str());
    }

    return 0;
}
