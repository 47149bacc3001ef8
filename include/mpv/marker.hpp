#pragma once

#include <limits>

#include "common.hpp"

namespace mpv
{
    namespace value_limits
    {
        constexpr mp_u64 PosFixIntMax = 0x7f;
        constexpr mp_i64 NegFixIntMin = -32;

        constexpr mp_u64 Uint8Max = std::numeric_limits< mp_u8 >::max ( );
        constexpr mp_u64 Uint16Max = std::numeric_limits< mp_u16 >::max ( );
        constexpr mp_u64 Uint32Max = std::numeric_limits< mp_u32 >::max ( );

        constexpr mp_i64 Int8Min = std::numeric_limits< mp_i8 >::min ( );
        constexpr mp_i64 Int16Min = std::numeric_limits< mp_i16 >::min ( );
        constexpr mp_i64 Int32Min = std::numeric_limits< mp_i32 >::min ( );

        constexpr mp_u64 FixStrMax = 31;
        constexpr mp_u64 FixArrayMax = 15;
        constexpr mp_u64 FixMapMax = 15;

        //  ( 2^32 ) - 1, for every length and count field
        constexpr mp_u64 LengthMax = Uint32Max;
    }

    enum class Marker : mp_u8
    {
        PosFixInt = 0x00,
        FixMap    = 0x80,
        FixArray  = 0x90,
        FixStr    = 0xa0,
        Nil       = 0xc0,
        Unused    = 0xc1,
        False     = 0xc2,
        True      = 0xc3,
        Bin8      = 0xc4,
        Bin16     = 0xc5,
        Bin32     = 0xc6,
        Ext8      = 0xc7,
        Ext16     = 0xc8,
        Ext32     = 0xc9,
        Float32   = 0xca,
        Float64   = 0xcb,
        Uint8     = 0xcc,
        Uint16    = 0xcd,
        Uint32    = 0xce,
        Uint64    = 0xcf,
        Int8      = 0xd0,
        Int16     = 0xd1,
        Int32     = 0xd2,
        Int64     = 0xd3,
        FixExt1   = 0xd4,
        FixExt2   = 0xd5,
        FixExt4   = 0xd6,
        FixExt8   = 0xd7,
        FixExt16  = 0xd8,
        Str8      = 0xd9,
        Str16     = 0xda,
        Str32     = 0xdb,
        Array16   = 0xdc,
        Array32   = 0xdd,
        Map16     = 0xde,
        Map32     = 0xdf,
        NegFixInt = 0xe0
    };

    namespace marker
    {
        /**
         * @brief Map a tag byte onto its marker. Bytes of the inline families (fixint, fixmap, fixarray,
         * fixstr, negative fixint) map onto the family's base marker; the payload stays in the byte.
         * @param byte First byte of an encoded value
         * @return The matching `Marker`, or `Marker::Unused` for the one byte MessagePack never assigns
         */
        inline Marker classify( const mp_u8 byte )
        {
            if ( byte <= 0x7f )
                return Marker::PosFixInt;

            if ( byte >= 0xe0 )
                return Marker::NegFixInt;

            if ( byte <= 0x8f )
                return Marker::FixMap;

            if ( byte <= 0x9f )
                return Marker::FixArray;

            if ( byte <= 0xbf )
                return Marker::FixStr;

            // 0xc0 - 0xdf are one marker per byte.
            return static_cast< Marker >( byte );
        }

        /**
         * @brief Length, count or value stored in the low bits of an inline tag byte.
         * @param byte Tag byte whose family is FixMap, FixArray or FixStr
         * @return mp_u32
         */
        inline mp_u32 inline_length( const mp_u8 byte )
        {
            return classify( byte ) == Marker::FixStr ? byte & 0x1fu : byte & 0x0fu;
        }

        /**
         * @brief Payload size of a fixext marker, not counting the type byte.
         * @param mk One of the FixExt markers
         * @return 1, 2, 4, 8 or 16; 0 for any other marker
         */
        inline mp_u32 fixext_size( const Marker mk )
        {
            switch ( mk )
            {
            case Marker::FixExt1:
                return 1;
            case Marker::FixExt2:
                return 2;
            case Marker::FixExt4:
                return 4;
            case Marker::FixExt8:
                return 8;
            case Marker::FixExt16:
                return 16;
            default:
                return 0;
            }
        }

        /**
         * @brief Width, in bytes, of the length field that follows a length-prefixed marker.
         * @param mk MessagePack marker
         * @return 1, 2 or 4; 0 for markers that carry no separate length field
         */
        inline mp_u32 length_width( const Marker mk )
        {
            switch ( mk )
            {
            case Marker::Str8:
            case Marker::Bin8:
            case Marker::Ext8:
                return 1;
            case Marker::Str16:
            case Marker::Bin16:
            case Marker::Ext16:
            case Marker::Array16:
            case Marker::Map16:
                return 2;
            case Marker::Str32:
            case Marker::Bin32:
            case Marker::Ext32:
            case Marker::Array32:
            case Marker::Map32:
                return 4;
            default:
                return 0;
            }
        }
    }
}
