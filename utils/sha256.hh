#pragma once
#include <openssl/evp.h>

#include <stdexcept>
#include <string>

// Lower-case hex SHA-256 of an arbitrary byte string; script bodies are hashed as stored on disk.
inline std::string sha256(const std::string &input)
{
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(input.data(), input.size(), digest, &length, EVP_sha256(), nullptr) != 1) throw std::runtime_error("sha256: digest computation failed");

    static const char *kHex = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (unsigned int i = 0; i < length; ++i)
    {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0f]);
    }
    return hex;
}
