#ifndef STRATA_UTILITIES_TESTING_H
#define STRATA_UTILITIES_TESTING_H

#include <catch2/catch.hpp>

#include <strata/core.h>

namespace strata {

// Generate a deterministic byte sequence of the given length, starting at
// :first and counting up (wrapping at 256).
inline byte_vector
make_byte_sequence(std::size_t length, std::uint8_t first = 0)
{
    byte_vector bytes(length);
    for (std::size_t i = 0; i != length; ++i)
        bytes[i] = std::uint8_t(first + i);
    return bytes;
}

} // namespace strata

#endif
