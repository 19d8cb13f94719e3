/**
 * @file crypto_stream.hpp
 * @brief Streaming AES-256-CTR encryption for remote copies of backup artifacts.
 *
 * Encrypted payload layout: [salt:16][nonce:16][ciphertext]. The key is derived from the
 * configured passphrase and the salt with PBKDF2-HMAC-SHA256. CTR mode keeps the ciphertext
 * the same length as the plaintext, so an encrypted copy is exactly kEncryptionOverhead bytes
 * larger than its source.
 *
 * @note Requires OpenSSL 3 (libcrypto).
 */

#ifndef CRYPTO_STREAM_HPP
#define CRYPTO_STREAM_HPP

#include <string>
#include <string_view>
#include <expected>
#include <memory>
#include <istream>
#include <cstddef>
#include "byte_stream.hpp"

inline constexpr std::size_t kSaltLength = 16;
inline constexpr std::size_t kNonceLength = 16;
inline constexpr std::size_t kKeyLength = 32;
inline constexpr std::size_t kEncryptionOverhead = kSaltLength + kNonceLength;
inline constexpr int kKdfIterations = 100000;

struct evp_cipher_ctx_st;

/**
 * @brief AES-256-CTR keystream bound to one salt and nonce.
 */
class StreamCipher {
public:
    /**
     * @brief Creates a cipher with a fresh random salt and nonce.
     *
     * @param passphrase Passphrase the key is derived from.
     * @return std::expected<StreamCipher, std::string> The cipher or an error message.
     */
    static std::expected<StreamCipher, std::string> forEncryption(const std::string& passphrase);

    /**
     * @brief Recreates the cipher of an encrypted payload from its header.
     *
     * @param passphrase Passphrase the key is derived from.
     * @param header The first kEncryptionOverhead bytes of the payload.
     */
    static std::expected<StreamCipher, std::string> fromHeader(const std::string& passphrase, std::string_view header);

    StreamCipher(StreamCipher&&) noexcept;
    StreamCipher& operator=(StreamCipher&&) noexcept;
    ~StreamCipher();

    /// Salt followed by nonce, to be written before the ciphertext.
    std::string header() const;

    /**
     * @brief Encrypts or decrypts the next chunk; CTR mode is symmetric.
     */
    std::expected<std::string, std::string> apply(std::string_view input);

private:
    StreamCipher(std::string salt, std::string nonce);
    std::expected<void, std::string> init(const std::string& passphrase);

    struct ContextDeleter {
        void operator()(evp_cipher_ctx_st* ctx) const;
    };

    std::string salt;
    std::string nonce;
    std::unique_ptr<evp_cipher_ctx_st, ContextDeleter> ctx;
};

/**
 * @brief Returns true if a payload starting with @p leadingBytes is treated as encrypted.
 *
 * A payload is encrypted when a full header is present and it does not start with the ZIP
 * signature "PK".
 */
bool looksEncrypted(std::string_view leadingBytes);

/**
 * @brief Streams @p source through a new cipher into @p sink, header first.
 */
std::expected<void, std::string> encryptStream(std::istream& source, const ByteSink& sink, const std::string& passphrase);

/**
 * @brief Streams an encrypted payload from @p source into @p sink as plaintext.
 *
 * A wrong passphrase is not detected; it produces different bytes.
 */
std::expected<void, std::string> decryptStream(std::istream& source, const ByteSink& sink, const std::string& passphrase);

#endif // CRYPTO_STREAM_HPP
