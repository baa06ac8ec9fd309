#include "content.hash.hh"
#include "macros.hh"

#include <openssl/evp.h>

#include <array>

std::string
stow::md5_hex(ConstByteSpan data)
{
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;

    EXPECT(EVP_Digest(data.data(),
                      data.size(),
                      digest.data(),
                      &digest_len,
                      EVP_md5(),
                      nullptr) == 1,
           "Failed to compute MD5 digest of ",
           data.size(),
           " bytes");

    static constexpr char hex_digits[] = "0123456789abcdef";

    std::string hex;
    hex.reserve(2 * digest_len);
    for (auto i = 0u; i < digest_len; ++i) {
        hex.push_back(hex_digits[digest[i] >> 4]);
        hex.push_back(hex_digits[digest[i] & 0x0f]);
    }

    return hex;
}
