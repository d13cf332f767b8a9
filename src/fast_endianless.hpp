#pragma once

#include <cstdint>

#include <arpa/inet.h>

// Linux standard functions for endian conversions are ugly because there are no checks about arguments length
// And you could accidentally use ntohs (suitable only for 16 bit) for 32 bit value and nobody will warning you
// With this wrapper functions it's pretty complicated to use them for incorrect length type! :)

// Type safe versions of ntohl, ntohs with type control
inline uint16_t fast_ntoh(uint16_t value) {
    return ntohs(value);
}

inline uint32_t fast_ntoh(uint32_t value) {
    return ntohl(value);
}

// Type safe version of htonl, htons
inline uint16_t fast_hton(uint16_t value) {
    return htons(value);
}

inline uint32_t fast_hton(uint32_t value) {
    return htonl(value);
}

// Explicitly remove all other types to avoid implicit conversion
template <class T> void fast_ntoh(T) = delete;

template <class T> void fast_hton(T) = delete;
