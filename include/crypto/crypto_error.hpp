#ifndef NEBULA_CRYPTO_ERROR_HPP
#define NEBULA_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>
#include <openssl/err.h>

namespace nebula::crypto {

// Failure inside OpenSSL itself, never caused by the bytes being hashed
class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Drains the OpenSSL error queue into the message
class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& context)
        : CryptoError(context + describe_openssl_errors()) {}

private:
    static std::string describe_openssl_errors() {
        std::string detail;
        char buffer[256];
        while (unsigned long code = ERR_get_error()) {
            ERR_error_string_n(code, buffer, sizeof(buffer));
            detail += detail.empty() ? " (" : "; ";
            detail += buffer;
        }
        return detail.empty() ? detail : detail + ")";
    }
};

} // namespace nebula::crypto

#endif // NEBULA_CRYPTO_ERROR_HPP
