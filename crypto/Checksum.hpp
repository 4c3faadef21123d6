#pragma once

#include <string>

namespace routesim {

class Checksum {
public:
    // Decodes base64 file content and digests it; algorithm is md5, sha1 or sha256.
    static std::string computeBase64(const std::string& contentBase64,
                                     const std::string& algorithm = "sha256");

    static std::string digestHex(const std::string& data, const std::string& algorithm = "sha256");
    static std::string md5Text(const std::string& text);

    static std::string base64Decode(const std::string& encoded);

private:
    static std::string toHex(const unsigned char* bytes, unsigned int length);
};

} // namespace routesim
