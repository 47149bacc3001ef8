#pragma once

#include <cstddef>
#include <cstdint>

#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
#define MPV_BSWAP16( v ) ( v )
#define MPV_BSWAP32( v ) ( v )
#define MPV_BSWAP64( v ) ( v )
#elif defined(_MSC_VER)
#include <intrin.h>
#define MPV_BSWAP16( v ) ( _byteswap_ushort( v ) )
#define MPV_BSWAP32( v ) ( _byteswap_ulong( v ) )
#define MPV_BSWAP64( v ) ( _byteswap_uint64( v ) )
#elif defined(__GNUC__) || defined(__clang__)
#define MPV_BSWAP16( v ) ( __builtin_bswap16( v ) )
#define MPV_BSWAP32( v ) ( __builtin_bswap32( v ) )
#define MPV_BSWAP64( v ) ( __builtin_bswap64( v ) )
#endif

namespace mpv
{
    using mp_u8 = std::uint8_t;
    using mp_i8 = std::int8_t;

    using mp_u16 = std::uint16_t;
    using mp_i16 = std::int16_t;

    using mp_u32 = std::uint32_t;
    using mp_i32 = std::int32_t;

    using mp_u64 = std::uint64_t;
    using mp_i64 = std::int64_t;

    using mp_size = std::size_t;

    static_assert(
        sizeof( float ) == 4,
        "float32 wire values require a 4 byte `float`."
    );

    static_assert(
        sizeof( double ) == 8,
        "float64 wire values require an 8 byte `double`."
    );
}
