/**
 * @file PasswordDigest.cpp
 * @brief Credential hashing and URL encoding for the provider login exchange
 * 
 * The provider's login action expects the account password as a lowercase
 * hexadecimal MD5 digest rather than in clear text. Uses OpenSSL's EVP
 * interface for the digest computation.
 * 
 * @note MD5 here is a wire-format requirement of the provider, not a security choice
 */

#include "PasswordDigest.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace tripseg {

/**
 * @brief Compute lowercase hex MD5 digest of input
 * 
 * @param input Clear-text value (the provider account password)
 * @return 32-character lowercase hexadecimal digest
 * 
 * @throws std::runtime_error if OpenSSL cannot allocate or run the digest context
 * 
 * @note The EVP context is released by RAII on every path
 */
std::string PasswordDigest::md5Hex(const std::string& input) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;
    
    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
        throw std::runtime_error("MD5 digest computation failed");
    }
    
    return toHex(digest, digestLength);
}

/**
 * @brief Render binary data as lowercase hexadecimal
 * 
 * @param data Bytes to render
 * @param length Number of bytes
 * @return Hex string of 2 * length characters
 */
std::string PasswordDigest::toHex(const unsigned char* data, size_t length) {
    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        hex << std::setw(2) << static_cast<int>(data[i]);
    }
    return hex.str();
}

/**
 * @brief URL-encode string according to RFC 3986
 * 
 * Used for query-string parameters (action, token, server id) of provider
 * requests. Tokens issued by the provider may contain characters that are
 * not safe in a URL.
 * 
 * @param value String to be URL-encoded
 * @return URL-encoded string
 * 
 * @note Preserves unreserved characters: A-Z a-z 0-9 - _ . ~
 * @note Uses uppercase hex digits as per RFC 3986
 */
std::string PasswordDigest::urlEncode(const std::string& value) {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else {
            escaped << std::uppercase;
            escaped << '%' << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
            escaped << std::nouppercase;
        }
    }

    return escaped.str();
}

} // namespace tripseg
