#pragma once

#include <ostream>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "common.hpp"

namespace mpv
{
    enum class DecodeError : mp_u32
    {
        None,
        UnexpectedEnd,   // buffer ends before the value it declares
        UnknownTag,      // 0xc1, the byte MessagePack never assigns
        InvalidString,   // str payload is not well-formed UTF-8
        TrailingData,    // bytes left after the top-level value
        DepthExceeded,   // containers nested deeper than `DecodeOptions::max_depth`
        IntegerOverflow  // uint64 above the largest Int
    };

    /**
     * @brief Short identifier of an error code, e.g. `UnexpectedEnd`.
     * @param error Error code
     * @return const char *
     */
    inline const char *error_name( const DecodeError error )
    {
        switch ( error )
        {
        case DecodeError::None:
            return "None";
        case DecodeError::UnexpectedEnd:
            return "UnexpectedEnd";
        case DecodeError::UnknownTag:
            return "UnknownTag";
        case DecodeError::InvalidString:
            return "InvalidString";
        case DecodeError::TrailingData:
            return "TrailingData";
        case DecodeError::DepthExceeded:
            return "DepthExceeded";
        case DecodeError::IntegerOverflow:
            return "IntegerOverflow";
        }

        return "Unknown";
    }

    inline const char *error_description( const DecodeError error )
    {
        switch ( error )
        {
        case DecodeError::None:
            return "no error";
        case DecodeError::UnexpectedEnd:
            return "unexpected end of input";
        case DecodeError::UnknownTag:
            return "unknown tag byte";
        case DecodeError::InvalidString:
            return "string is not valid UTF-8";
        case DecodeError::TrailingData:
            return "trailing data after value";
        case DecodeError::DepthExceeded:
            return "maximum nesting depth exceeded";
        case DecodeError::IntegerOverflow:
            return "unsigned integer does not fit a signed 64 bit integer";
        }

        return "unknown error";
    }

    inline std::ostream &operator<<( std::ostream &os, const DecodeError error )
    {
        return os << error_name( error );
    }

    /**
     * @brief Error code of a failed decode plus the offset, from the start of the buffer, of the byte
     * where the decoder detected it.
     */
    struct ParseError
    {
        DecodeError error { DecodeError::None };
        mp_size byte { 0 };

        explicit operator bool( ) const { return error != DecodeError::None; }

        std::string message( ) const
        {
            return fmt::format( "MsgPack parse error at byte {}: {}", byte, error_description( error ) );
        }

        bool operator==( const ParseError &other ) const
        {
            return error == other.error && byte == other.byte;
        }

        bool operator!=( const ParseError &other ) const
        {
            return !( *this == other );
        }
    };
}
