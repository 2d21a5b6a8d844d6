// ==============================================================================
// crypto.cpp - Хэши и симметричная криптография (OpenSSL libcrypto)
// ==============================================================================

#include "chatx/crypto.hpp"

#include "chatx/codec.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <fstream>
#include <openssl/evp.h>
#include <openssl/sha.h>

namespace chatx::crypto {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

UniqueCipherCtx new_cipher_ctx() {
    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        throw CryptoError("cipher context allocation failed");
    }
    return ctx;
}

Bytes pbkdf2(const Bytes& password, const Bytes& salt, std::uint32_t iterations,
             std::size_t key_len, const EVP_MD* md) {
    Bytes out(key_len);
    int ok = PKCS5_PBKDF2_HMAC(reinterpret_cast<const char*>(password.data()),
                               static_cast<int>(password.size()), salt.data(),
                               static_cast<int>(salt.size()), static_cast<int>(iterations), md,
                               static_cast<int>(key_len), out.data());
    if (ok != 1) {
        throw CryptoError("PBKDF2 failed");
    }
    return out;
}

}  // namespace

// ----------------------------------------------------------------------------
// Sha256
// ----------------------------------------------------------------------------

struct Sha256::Impl {
    UniqueMdCtx ctx;
};

Sha256::Sha256() : impl_(std::make_unique<Impl>()) {
    impl_->ctx.reset(EVP_MD_CTX_new());
    if (!impl_->ctx) {
        throw CryptoError("digest context allocation failed");
    }
    if (EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) != 1) {
        throw CryptoError("digest init failed");
    }
}

Sha256::~Sha256() = default;

void Sha256::update(const void* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data, size) != 1) {
        throw CryptoError("digest update failed");
    }
}

std::string Sha256::final_hex() {
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &out_len) != 1) {
        throw CryptoError("digest final failed");
    }
    return codec::hex_encode(out.data(), out_len);
}

std::string sha256_hex(const void* data, std::size_t size) {
    Sha256 h;
    h.update(data, size);
    return h.final_hex();
}

std::string sha1_hex(std::string_view data) {
    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw CryptoError("digest context allocation failed");
    }
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1) {
        throw CryptoError("sha1 failed");
    }
    return codec::hex_encode(out.data(), out_len);
}

std::optional<std::string> sha256_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    Sha256 h;
    std::array<char, 64 * 1024> buf{};
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = in.gcount();
        if (n > 0) {
            h.update(buf.data(), static_cast<std::size_t>(n));
        }
    }
    if (in.bad()) {
        return std::nullopt;
    }
    return h.final_hex();
}

// ----------------------------------------------------------------------------
// KDF
// ----------------------------------------------------------------------------

Bytes pbkdf2_sha256(const Bytes& password, const Bytes& salt, std::uint32_t iterations,
                    std::size_t key_len) {
    return pbkdf2(password, salt, iterations, key_len, EVP_sha256());
}

Bytes pbkdf2_sha1(const Bytes& password, const Bytes& salt, std::uint32_t iterations,
                  std::size_t key_len) {
    return pbkdf2(password, salt, iterations, key_len, EVP_sha1());
}

// ----------------------------------------------------------------------------
// AES key wrap (RFC 3394)
// ----------------------------------------------------------------------------

std::optional<Bytes> aes_key_unwrap(const Bytes& kek, const Bytes& wrapped) {
    if (kek.size() != 32) {
        throw CryptoError("key unwrap requires a 256-bit KEK");
    }
    if (wrapped.size() < 24 || wrapped.size() % 8 != 0) {
        return std::nullopt;
    }

    UniqueCipherCtx ctx = new_cipher_ctx();
    EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, kek.data(), nullptr) != 1) {
        throw CryptoError("key unwrap init failed");
    }

    Bytes out(wrapped.size());
    int len = 0;
    if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, wrapped.data(),
                          static_cast<int>(wrapped.size())) != 1) {
        // integrity check value не совпал: неверный ключ
        return std::nullopt;
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
        return std::nullopt;
    }
    out.resize(static_cast<std::size_t>(len + final_len));
    return out;
}

Bytes aes_key_wrap(const Bytes& kek, const Bytes& plain) {
    if (kek.size() != 32) {
        throw CryptoError("key wrap requires a 256-bit KEK");
    }
    UniqueCipherCtx ctx = new_cipher_ctx();
    EVP_CIPHER_CTX_set_flags(ctx.get(), EVP_CIPHER_CTX_FLAG_WRAP_ALLOW);
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_wrap(), nullptr, kek.data(), nullptr) != 1) {
        throw CryptoError("key wrap init failed");
    }
    Bytes out(plain.size() + 16);
    int len = 0;
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plain.data(),
                          static_cast<int>(plain.size())) != 1) {
        throw CryptoError("key wrap failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
        throw CryptoError("key wrap final failed");
    }
    out.resize(static_cast<std::size_t>(len + final_len));
    return out;
}

// ----------------------------------------------------------------------------
// AES-256-CBC
// ----------------------------------------------------------------------------

std::optional<Bytes> aes256_cbc_decrypt(const Bytes& key, const Bytes& iv, const Bytes& data,
                                        bool strip_padding) {
    if (key.size() != 32 || iv.size() != 16) {
        throw CryptoError("AES-256-CBC requires a 32-byte key and 16-byte IV");
    }
    if (data.size() % 16 != 0) {
        return std::nullopt;
    }

    UniqueCipherCtx ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw CryptoError("AES-CBC init failed");
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    Bytes out(data.size() + 16);
    int len = 0;
    if (!data.empty() && EVP_DecryptUpdate(ctx.get(), out.data(), &len, data.data(),
                                           static_cast<int>(data.size())) != 1) {
        throw CryptoError("AES-CBC update failed");
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
        throw CryptoError("AES-CBC final failed");
    }
    out.resize(static_cast<std::size_t>(len + final_len));

    if (strip_padding && !out.empty()) {
        std::uint8_t pad = out.back();
        if (pad >= 1 && pad <= 16 && pad <= out.size()) {
            bool valid = true;
            for (std::size_t i = out.size() - pad; i < out.size(); ++i) {
                if (out[i] != pad) {
                    valid = false;
                    break;
                }
            }
            if (valid) {
                out.resize(out.size() - pad);
            }
        }
    }
    return out;
}

bool aes256_cbc_decrypt_file(const Bytes& key, const Bytes& iv,
                             const std::filesystem::path& src, const std::filesystem::path& dst,
                             std::optional<std::uint64_t> truncate_to) {
    if (key.size() != 32 || iv.size() != 16) {
        throw CryptoError("AES-256-CBC requires a 32-byte key and 16-byte IV");
    }
    std::error_code ec;
    auto total = std::filesystem::file_size(src, ec);
    if (ec || total % 16 != 0) {
        return false;
    }

    std::ifstream in(src, std::ios::binary);
    std::ofstream out(dst, std::ios::binary | std::ios::trunc);
    if (!in || !out) {
        return false;
    }

    UniqueCipherCtx ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw CryptoError("AES-CBC init failed");
    }
    EVP_CIPHER_CTX_set_padding(ctx.get(), 0);

    // Последний блок задерживается до конца: из него снимается padding
    constexpr std::size_t CHUNK = 64 * 1024;
    std::vector<std::uint8_t> inbuf(CHUNK);
    std::vector<std::uint8_t> outbuf(CHUNK + 16);
    Bytes held;
    std::uint64_t written = 0;
    std::uint64_t limit = truncate_to.value_or(UINT64_MAX);

    auto emit = [&](const std::uint8_t* data, std::size_t n) {
        if (written >= limit) {
            return;
        }
        std::uint64_t room = limit - written;
        std::size_t take = static_cast<std::size_t>(std::min<std::uint64_t>(room, n));
        out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(take));
        written += take;
    };

    while (in) {
        in.read(reinterpret_cast<char*>(inbuf.data()), static_cast<std::streamsize>(CHUNK));
        std::streamsize n = in.gcount();
        if (n <= 0) {
            break;
        }
        int len = 0;
        if (EVP_DecryptUpdate(ctx.get(), outbuf.data(), &len, inbuf.data(),
                              static_cast<int>(n)) != 1) {
            throw CryptoError("AES-CBC update failed");
        }
        if (len <= 0) {
            continue;
        }
        emit(held.data(), held.size());
        std::size_t keep = std::min<std::size_t>(16, static_cast<std::size_t>(len));
        emit(outbuf.data(), static_cast<std::size_t>(len) - keep);
        held.assign(outbuf.data() + len - keep, outbuf.data() + len);
    }
    if (in.bad()) {
        return false;
    }
    int final_len = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), outbuf.data(), &final_len) != 1) {
        throw CryptoError("AES-CBC final failed");
    }

    if (!held.empty()) {
        std::uint8_t pad = held.back();
        if (pad >= 1 && pad <= 16 && pad <= held.size()) {
            bool valid = true;
            for (std::size_t i = held.size() - pad; i < held.size(); ++i) {
                valid = valid && held[i] == pad;
            }
            if (valid) {
                held.resize(held.size() - pad);
            }
        }
        emit(held.data(), held.size());
    }

    out.flush();
    return static_cast<bool>(out);
}

Bytes aes256_cbc_encrypt(const Bytes& key, const Bytes& iv, const Bytes& data) {
    if (key.size() != 32 || iv.size() != 16) {
        throw CryptoError("AES-256-CBC requires a 32-byte key and 16-byte IV");
    }
    UniqueCipherCtx ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_cbc(), nullptr, key.data(), iv.data()) != 1) {
        throw CryptoError("AES-CBC init failed");
    }
    Bytes out(data.size() + 32);
    int len = 0;
    if (!data.empty() && EVP_EncryptUpdate(ctx.get(), out.data(), &len, data.data(),
                                           static_cast<int>(data.size())) != 1) {
        throw CryptoError("AES-CBC update failed");
    }
    int final_len = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + len, &final_len) != 1) {
        throw CryptoError("AES-CBC final failed");
    }
    out.resize(static_cast<std::size_t>(len + final_len));
    return out;
}

}  // namespace chatx::crypto
