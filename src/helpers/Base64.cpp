#include "Base64.hpp"

#include <openssl/evp.h>

std::string NBase64::encode(const uint8_t* data, size_t len) {
    if (len == 0)
        return "";

    // EVP_EncodeBlock writes a trailing NUL
    std::string out(((len + 2) / 3) * 4 + 1, '\0');
    const int   WRITTEN = EVP_EncodeBlock((unsigned char*)out.data(), data, (int)len);

    out.resize(WRITTEN < 0 ? 0 : WRITTEN);
    return out;
}

std::string NBase64::encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}
