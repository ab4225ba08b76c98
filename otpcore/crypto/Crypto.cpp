/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */

#include "Crypto.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <new>

namespace otpcore {

DataArray<SHA1_LENGTH>
hmacSha1(DataSlice key, DataSlice data)
{
    // OpenSSL treats a null key as "reuse the previous key",
    // so empty keys need a real pointer:
    static const uint8_t emptyKey[1] = {0};
    const uint8_t *keyData = key.empty() ? emptyKey : key.data();

    DataArray<SHA1_LENGTH> out;
    unsigned outSize = 0;
    if (!HMAC(EVP_sha1(), keyData, static_cast<int>(key.size()),
            data.data(), data.size(),
            out.data(), &outSize) || SHA1_LENGTH != outSize)
        throw std::bad_alloc();

    return out;
}

} // namespace otpcore
