/**
 * @file Checksum.cpp
 * @brief File and text digests for uploaded route data
 *
 * Lets the front end confirm that the spreadsheet or JSON it uploaded is the
 * one the engine analyzed. Digests are computed with OpenSSL's EVP interface
 * and returned as lowercase hex; base64 decoding uses an OpenSSL BIO chain.
 */

#include "Checksum.hpp"
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace routesim {

namespace {

const EVP_MD* digestByName(const std::string& algorithm) {
    if (algorithm == "md5") return EVP_md5();
    if (algorithm == "sha1") return EVP_sha1();
    if (algorithm == "sha256") return EVP_sha256();
    throw std::invalid_argument("Unsupported algorithm: " + algorithm);
}

} // namespace

std::string Checksum::computeBase64(const std::string& contentBase64, const std::string& algorithm) {
    return digestHex(base64Decode(contentBase64), algorithm);
}

/**
 * @brief Digest raw bytes with the named algorithm
 * @param data Bytes to hash
 * @param algorithm "md5", "sha1" or "sha256"
 * @return Lowercase hex digest
 * @throws std::invalid_argument for an unsupported algorithm
 * @throws std::runtime_error if OpenSSL fails
 */
std::string Checksum::digestHex(const std::string& data, const std::string& algorithm) {
    const EVP_MD* md = digestByName(algorithm);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    if (EVP_Digest(data.data(), data.size(), digest, &digestLength, md, nullptr) != 1) {
        throw std::runtime_error("OpenSSL digest failed for " + algorithm);
    }

    return toHex(digest, digestLength);
}

std::string Checksum::md5Text(const std::string& text) {
    return digestHex(text, "md5");
}

/**
 * @brief Decode a single-line Base64 string
 * @return Decoded bytes; empty for empty input
 * @throws std::invalid_argument if non-empty input decodes to nothing
 */
std::string Checksum::base64Decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }

    BIO* bio = BIO_new_mem_buf(encoded.c_str(), static_cast<int>(encoded.length()));
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::string result(encoded.length(), 0);
    int decodedLength = BIO_read(bio, &result[0], static_cast<int>(result.size()));

    BIO_free_all(bio);

    if (decodedLength <= 0) {
        throw std::invalid_argument("Content is not valid base64");
    }
    result.resize(decodedLength);
    return result;
}

std::string Checksum::toHex(const unsigned char* bytes, unsigned int length) {
    std::ostringstream hex;
    hex << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        hex << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return hex.str();
}

} // namespace routesim
