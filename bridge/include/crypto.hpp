#pragma once

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

// Primitives the MyJDownloader API is built on. Byte strings are carried in std::string.
namespace Crypto {
inline std::string sha256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return std::string(reinterpret_cast<const char*>(hash), SHA256_DIGEST_LENGTH);
}

inline std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(), out, &out_len)) {
        throw std::runtime_error("[CRYPTO] HMAC-SHA256 failed");
    }
    return std::string(reinterpret_cast<const char*>(out), out_len);
}

inline std::string to_hex(const std::string& bytes) {
    std::stringstream ss;
    for (unsigned char c : bytes) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
    return ss.str();
}

inline std::string from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) throw std::runtime_error("[CRYPTO] Odd-length hex string");
    std::string out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        out.push_back(static_cast<char>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

inline std::string base64_encode(const std::string& bytes) {
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(bytes.data()), static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

inline std::string base64_decode(const std::string& text) {
    if (text.empty()) return "";
    if (text.size() % 4 != 0) throw std::runtime_error("[CRYPTO] Invalid base64 length");
    std::string out(3 * text.size() / 4, '\0');
    const int n = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  reinterpret_cast<const unsigned char*>(text.data()), static_cast<int>(text.size()));
    if (n < 0) throw std::runtime_error("[CRYPTO] Invalid base64 data");
    // EVP_DecodeBlock counts the padding as decoded zero bytes
    size_t padding = 0;
    if (text[text.size() - 1] == '=') ++padding;
    if (text[text.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(n) - padding);
    return out;
}

namespace detail {
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// The API splits a 32 byte token: first half is the IV, second half the AES-128 key.
inline std::string aes128_cbc(const std::string& secret, const std::string& input, bool encrypt) {
    if (secret.size() != 32) throw std::runtime_error("[CRYPTO] Token must be 32 bytes");
    const auto* iv = reinterpret_cast<const unsigned char*>(secret.data());
    const auto* key = reinterpret_cast<const unsigned char*>(secret.data() + 16);

    CipherCtx ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx || EVP_CipherInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr, key, iv, encrypt ? 1 : 0) != 1) {
        throw std::runtime_error("[CRYPTO] Cipher init failed");
    }
    std::string out(input.size() + 16, '\0');
    int len = 0;
    int total = 0;
    if (EVP_CipherUpdate(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]), &len,
                         reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size())) != 1) {
        throw std::runtime_error("[CRYPTO] Cipher update failed");
    }
    total = len;
    if (EVP_CipherFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(&out[0]) + total, &len) != 1) {
        throw std::runtime_error(encrypt ? "[CRYPTO] Encryption failed" : "[CRYPTO] Decryption failed (bad key or padding)");
    }
    total += len;
    out.resize(static_cast<size_t>(total));
    return out;
}
}  // namespace detail

// Plaintext -> base64(AES-128-CBC(plaintext))
inline std::string encrypt(const std::string& secret, const std::string& plaintext) {
    return base64_encode(detail::aes128_cbc(secret, plaintext, true));
}

inline std::string decrypt(const std::string& secret, const std::string& base64_ciphertext) {
    return detail::aes128_cbc(secret, base64_decode(base64_ciphertext), false);
}
}  // namespace Crypto
