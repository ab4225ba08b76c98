/*
 * Copyright (c) 2026, otpcore developers.
 * All rights reserved.
 */
/**
 * @file
 * Byte buffers used for keys, counters and digests.
 */

#ifndef OTPCORE_UTIL_DATA_HPP
#define OTPCORE_UTIL_DATA_HPP

#include <stdint.h>
#include <array>
#include <string>
#include <vector>

namespace otpcore {

/**
 * Fixed-size bytes, such as a counter block or a SHA-1 digest.
 */
template<size_t Size> using DataArray = std::array<uint8_t, Size>;

/**
 * Bytes whose length is only known at run time, such as a decoded secret.
 */
typedef std::vector<uint8_t> DataChunk;

/**
 * A read-only view of bytes owned by somebody else.
 * Anything with `data()` and `size()` converts to one implicitly.
 */
class DataSlice
{
public:
    template<typename Container>
    DataSlice(const Container &bytes):
        data_(reinterpret_cast<const uint8_t *>(bytes.data())),
        size_(bytes.size())
    {}

    bool empty()            const { return !size_; }
    size_t size()           const { return size_; }
    const uint8_t *data()   const { return data_; }
    const uint8_t *begin()  const { return data_; }
    const uint8_t *end()    const { return data_ + size_; }

private:
    const uint8_t *data_;
    size_t size_;
};

/**
 * Copies raw bytes into a string, for comparing against text.
 */
inline std::string
toString(DataSlice slice)
{
    return std::string(slice.begin(), slice.end());
}

} // namespace otpcore

#endif
