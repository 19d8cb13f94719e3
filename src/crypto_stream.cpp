#include "crypto_stream.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <format>
#include <vector>

namespace {

std::string opensslError(const char* what) {
    unsigned long code = ERR_get_error();
    if (code == 0) {
        return what;
    }
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::format("{}: {}", what, buf);
}

std::expected<std::string, std::string> randomBytes(std::size_t count) {
    std::string bytes(count, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char*>(bytes.data()), static_cast<int>(count)) != 1) {
        return std::unexpected(opensslError("Failed to generate random bytes"));
    }
    return bytes;
}

} // namespace

void StreamCipher::ContextDeleter::operator()(evp_cipher_ctx_st* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
}

StreamCipher::StreamCipher(std::string salt, std::string nonce)
    : salt(std::move(salt)), nonce(std::move(nonce)) {}

StreamCipher::StreamCipher(StreamCipher&&) noexcept = default;
StreamCipher& StreamCipher::operator=(StreamCipher&&) noexcept = default;
StreamCipher::~StreamCipher() = default;

std::expected<StreamCipher, std::string> StreamCipher::forEncryption(const std::string& passphrase) {
    auto salt = randomBytes(kSaltLength);
    if (!salt) {
        return std::unexpected(salt.error());
    }
    auto nonce = randomBytes(kNonceLength);
    if (!nonce) {
        return std::unexpected(nonce.error());
    }
    StreamCipher cipher(std::move(*salt), std::move(*nonce));
    if (auto result = cipher.init(passphrase); !result) {
        return std::unexpected(result.error());
    }
    return cipher;
}

std::expected<StreamCipher, std::string> StreamCipher::fromHeader(const std::string& passphrase, std::string_view header) {
    if (header.size() < kEncryptionOverhead) {
        return std::unexpected(std::format("Encrypted header too short: {} bytes", header.size()));
    }
    StreamCipher cipher(std::string(header.substr(0, kSaltLength)), std::string(header.substr(kSaltLength, kNonceLength)));
    if (auto result = cipher.init(passphrase); !result) {
        return std::unexpected(result.error());
    }
    return cipher;
}

std::expected<void, std::string> StreamCipher::init(const std::string& passphrase) {
    unsigned char key[kKeyLength];
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                          kKdfIterations, EVP_sha256(), static_cast<int>(sizeof(key)), key) != 1) {
        return std::unexpected(opensslError("Key derivation failed"));
    }

    EVP_CIPHER* cipher = EVP_CIPHER_fetch(nullptr, "AES-256-CTR", nullptr);
    if (!cipher) {
        OPENSSL_cleanse(key, sizeof(key));
        return std::unexpected(opensslError("EVP_CIPHER_fetch AES-256-CTR failed"));
    }

    ctx.reset(EVP_CIPHER_CTX_new());
    if (!ctx) {
        EVP_CIPHER_free(cipher);
        OPENSSL_cleanse(key, sizeof(key));
        return std::unexpected("Failed to allocate cipher context");
    }

    int ok = EVP_EncryptInit_ex2(ctx.get(), cipher, key,
                                 reinterpret_cast<const unsigned char*>(nonce.data()), nullptr);
    EVP_CIPHER_free(cipher);
    OPENSSL_cleanse(key, sizeof(key));
    if (ok <= 0) {
        ctx.reset();
        return std::unexpected(opensslError("EncryptInit failed"));
    }
    return {};
}

std::string StreamCipher::header() const {
    return salt + nonce;
}

std::expected<std::string, std::string> StreamCipher::apply(std::string_view input) {
    if (!ctx) {
        return std::unexpected("Cipher is not initialized");
    }
    std::string output(input.size(), '\0');
    int written = 0;
    if (EVP_EncryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(output.data()), &written,
                          reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.size())) <= 0) {
        return std::unexpected(opensslError("EncryptUpdate failed"));
    }
    output.resize(static_cast<std::size_t>(written));
    return output;
}

bool looksEncrypted(std::string_view leadingBytes) {
    if (leadingBytes.size() < kEncryptionOverhead) {
        return false;
    }
    return !(leadingBytes[0] == 'P' && leadingBytes[1] == 'K');
}

namespace {

std::expected<void, std::string> pump(std::istream& source, StreamCipher& cipher, const ByteSink& sink) {
    std::vector<char> buf(kStreamChunkSize);
    while (source) {
        source.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize count = source.gcount();
        if (count <= 0) {
            break;
        }
        auto chunk = cipher.apply(std::string_view(buf.data(), static_cast<std::size_t>(count)));
        if (!chunk) {
            return std::unexpected(chunk.error());
        }
        if (auto result = sink(*chunk); !result) {
            return result;
        }
    }
    if (source.bad()) {
        return std::unexpected("Failed to read input stream");
    }
    return {};
}

} // namespace

std::expected<void, std::string> encryptStream(std::istream& source, const ByteSink& sink, const std::string& passphrase) {
    auto cipher = StreamCipher::forEncryption(passphrase);
    if (!cipher) {
        return std::unexpected(cipher.error());
    }
    if (auto result = sink(cipher->header()); !result) {
        return result;
    }
    return pump(source, *cipher, sink);
}

std::expected<void, std::string> decryptStream(std::istream& source, const ByteSink& sink, const std::string& passphrase) {
    std::string header(kEncryptionOverhead, '\0');
    source.read(header.data(), static_cast<std::streamsize>(header.size()));
    if (static_cast<std::size_t>(source.gcount()) != kEncryptionOverhead) {
        return std::unexpected("Encrypted payload is shorter than its header");
    }
    auto cipher = StreamCipher::fromHeader(passphrase, header);
    if (!cipher) {
        return std::unexpected(cipher.error());
    }
    return pump(source, *cipher, sink);
}
