// ==============================================================================
// chatx/crypto.hpp - Хэши и симметричная криптография (OpenSSL libcrypto)
// ==============================================================================
//
// Назначение:
// - SHA-256 потоково (хэш материализованных вложений), SHA-1 (fileID бэкапа)
// - PBKDF2-HMAC-SHA256 / PBKDF2-HMAC-SHA1 (разблокировка keybag)
// - AES key wrap RFC 3394 (классовые ключи, ManifestKey, ключи файлов)
// - AES-256-CBC (Manifest.db и файлы зашифрованного бэкапа)
//
// Ошибки OpenSSL API бросаются как CryptoError. Ошибка целостности при
// unwrap или неверный padding возвращаются как std::nullopt: это ожидаемый
// исход при неверном пароле.
//
// ==============================================================================

#ifndef CHATX_CRYPTO_HPP
#define CHATX_CRYPTO_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace chatx::crypto {

using Bytes = std::vector<std::uint8_t>;

class CryptoError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ----------------------------------------------------------------------------
// Хэши
// ----------------------------------------------------------------------------

/// Потоковый SHA-256
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const void* data, std::size_t size);

    /// Завершить и вернуть hex (нижний регистр); объект после этого не используется
    std::string final_hex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string sha256_hex(const void* data, std::size_t size);
std::string sha1_hex(std::string_view data);

/// SHA-256 файла целиком; std::nullopt если файл не читается
std::optional<std::string> sha256_file(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// KDF
// ----------------------------------------------------------------------------

Bytes pbkdf2_sha256(const Bytes& password, const Bytes& salt, std::uint32_t iterations,
                    std::size_t key_len);

Bytes pbkdf2_sha1(const Bytes& password, const Bytes& salt, std::uint32_t iterations,
                  std::size_t key_len);

// ----------------------------------------------------------------------------
// AES
// ----------------------------------------------------------------------------

/// RFC 3394 unwrap с ключом KEK 256 бит; std::nullopt при ошибке целостности
std::optional<Bytes> aes_key_unwrap(const Bytes& kek, const Bytes& wrapped);

/// RFC 3394 wrap (обратная операция, используется при сборке тестовых бэкапов)
Bytes aes_key_wrap(const Bytes& kek, const Bytes& plain);

/// AES-256-CBC расшифровка без автоматического padding.
/// При strip_padding снимается корректный PKCS#7 хвост.
/// std::nullopt если длина не кратна 16.
std::optional<Bytes> aes256_cbc_decrypt(const Bytes& key, const Bytes& iv, const Bytes& data,
                                        bool strip_padding);

/// Потоковая расшифровка файла AES-256-CBC с снятием PKCS#7 padding.
/// При truncate_to результат обрезается до этого размера.
/// false при ошибке чтения/записи или длине, не кратной 16.
bool aes256_cbc_decrypt_file(const Bytes& key, const Bytes& iv,
                             const std::filesystem::path& src, const std::filesystem::path& dst,
                             std::optional<std::uint64_t> truncate_to);

/// AES-256-CBC шифрование с PKCS#7 padding
Bytes aes256_cbc_encrypt(const Bytes& key, const Bytes& iv, const Bytes& data);

}  // namespace chatx::crypto

#endif  // CHATX_CRYPTO_HPP
