#pragma once

#include <cstring>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "error.hpp"
#include "log.hpp"
#include "marker.hpp"
#include "options.hpp"
#include "stream.hpp"
#include "utf8.hpp"
#include "value.hpp"

namespace mpv
{
    struct DecodeResult
    {
        Value value { };     // Nil whenever `error` is set
        ParseError error { };
        mp_size size { 0 };  // Bytes the value occupied. Mostly relevant for `parse_prefix`.

        explicit operator bool( ) const { return !error; }
    };

    /**
     * @brief Reads complete MessagePack values from a buffer the caller keeps alive. Each `decode_single( )`
     * consumes exactly one value, however deeply nested, and leaves the cursor on the byte after it.
     */
    struct Decoder
    {
    private:
        /**
         * @brief Internal object used for reading from the byte stream.
         */
        stream::StreamReader sr_ { };

        DecodeOptions options_ { };

        /**
         * @brief Containers currently open above the value being decoded.
         */
        mp_u32 depth_ { 0 };

        /**
         * @brief First error hit by the value being decoded.
         */
        ParseError error_ { };

        bool fail( const DecodeError error, const mp_size byte )
        {
            error_ = ParseError { error, byte };
            return false;
        }

        /**
         * @brief Fail with `UnexpectedEnd` unless `count` more bytes are available.
         * @param count Bytes the next read needs
         * @return bool
         */
        bool require( const mp_u64 count )
        {
            if ( count > std::numeric_limits< mp_size >::max ( ) || !sr_.can_read( static_cast< mp_size >( count ) ) )
                return fail( DecodeError::UnexpectedEnd, sr_.position ( ) );

            return true;
        }

        /**
         * @brief Read the 1, 2 or 4 byte length field that follows a length-prefixed marker.
         * @param mk Marker of the value
         * @param length Receives the decoded length
         * @return bool
         */
        bool read_length( const Marker mk, mp_u32 &length )
        {
            const auto width = marker::length_width( mk );

            if ( !require( width ) )
                return false;

            switch ( width )
            {
            case 1:
                length = sr_.read_u8 ( );
                break;
            case 2:
                length = sr_.read_u16 ( );
                break;
            default:
                length = sr_.read_u32 ( );
                break;
            }

            return true;
        }

        bool read_bytes( const mp_u32 length, Bytes &out )
        {
            if ( !require( length ) )
                return false;

            out.resize( length );

            return sr_.read( length, out.data ( ) ) || fail( DecodeError::UnexpectedEnd, sr_.position ( ) );
        }

        bool read_string( const mp_u32 length, Value &out )
        {
            if ( !require( length ) )
                return false;

            const auto payload = sr_.cursor ( );

            if ( !utf8::valid( payload, length ) )
                return fail( DecodeError::InvalidString, sr_.position ( ) );

            out = Value::make_string( std::string( reinterpret_cast< const char* >( payload ), length ) );
            sr_.skip( length );

            return true;
        }

        /**
         * @brief Read the type byte and `length` payload bytes of an extension.
         * @param length Payload size, excluding the type byte
         * @param out Receives the extension
         * @return bool
         */
        bool read_extension( const mp_u32 length, Value &out )
        {
            if ( !require( 1 ) )
                return false;

            Extension extension { };
            extension.type_id = sr_.read_i8 ( );

            if ( !read_bytes( length, extension.value ) )
                return false;

            out = Value::make_extension( std::move( extension ) );

            return true;
        }

        bool enter_container( const mp_size tag_pos )
        {
            if ( depth_ >= options_.max_depth )
            {
                log::logger ( )->warn(
                    "decode: nesting depth limit of {} reached at byte {}",
                    options_.max_depth,
                    tag_pos
                );

                return fail( DecodeError::DepthExceeded, tag_pos );
            }

            depth_++;

            return true;
        }

        bool decode_array( const mp_u32 count, const mp_size tag_pos, Value &out )
        {
            // Every element takes at least one byte, so a count beyond the remaining bytes is truncated input.
            if ( !require( count ) || !enter_container( tag_pos ) )
                return false;

            Array elements { };
            elements.reserve( count );

            for ( mp_u32 index = 0; index < count; index++ )
            {
                Value element { };

                if ( !decode_value( element ) )
                    return false;

                elements.push_back( std::move( element ) );
            }

            depth_--;
            out = Value::make_array( std::move( elements ) );

            return true;
        }

        bool decode_map( const mp_u32 count, const mp_size tag_pos, Value &out )
        {
            if ( !require( static_cast< mp_u64 >( count ) * 2 ) || !enter_container( tag_pos ) )
                return false;

            Map pairs { };
            pairs.reserve( count );

            for ( mp_u32 index = 0; index < count; index++ )
            {
                MapElement element { };

                if ( !decode_value( element.key ) || !decode_value( element.value ) )
                    return false;

                pairs.push_back( std::move( element ) );
            }

            depth_--;
            out = Value::make_map( std::move( pairs ) );

            return true;
        }

        /**
         * @brief Decode one value at the cursor into `out`, recursing into containers.
         * @param out Receives the value; untouched when decoding fails
         * @return `false` with `error_` set if the input is malformed
         */
        bool decode_value( Value &out )
        {
            const auto tag_pos = sr_.position ( );

            if ( !require( 1 ) )
                return false;

            const auto raw = sr_.read_u8 ( );
            const auto mk = marker::classify( raw );

            switch ( mk )
            {
            case Marker::PosFixInt:
                out = Value::make_int( raw );
                return true;
            case Marker::NegFixInt:
                out = Value::make_int( static_cast< mp_i8 >( raw ) );
                return true;
            case Marker::FixMap:
                return decode_map( marker::inline_length( raw ), tag_pos, out );
            case Marker::FixArray:
                return decode_array( marker::inline_length( raw ), tag_pos, out );
            case Marker::FixStr:
                return read_string( marker::inline_length( raw ), out );
            case Marker::Nil:
                out = Value::make_nil ( );
                return true;
            case Marker::False:
            case Marker::True:
                out = Value::make_boolean( mk == Marker::True );
                return true;
            case Marker::Unused:
                return fail( DecodeError::UnknownTag, tag_pos );
            case Marker::Bin8:
            case Marker::Bin16:
            case Marker::Bin32:
                {
                    mp_u32 length { 0 };
                    Bytes bytes { };

                    if ( !read_length( mk, length ) || !read_bytes( length, bytes ) )
                        return false;

                    out = Value::make_binary( std::move( bytes ) );
                    return true;
                }
            case Marker::Ext8:
            case Marker::Ext16:
            case Marker::Ext32:
                {
                    mp_u32 length { 0 };

                    return read_length( mk, length ) && read_extension( length, out );
                }
            case Marker::Float32:
                {
                    if ( !require( sizeof( mp_u32 ) ) )
                        return false;

                    const auto bits = sr_.read_u32 ( );
                    float value { 0.0f };
                    std::memcpy( &value, &bits, sizeof( value ) );

                    out = Value::make_float( static_cast< double >( value ) );
                    return true;
                }
            case Marker::Float64:
                {
                    if ( !require( sizeof( mp_u64 ) ) )
                        return false;

                    const auto bits = sr_.read_u64 ( );
                    double value { 0.0 };
                    std::memcpy( &value, &bits, sizeof( value ) );

                    out = Value::make_float( value );
                    return true;
                }
            case Marker::Uint8:
                if ( !require( sizeof( mp_u8 ) ) )
                    return false;

                out = Value::make_int( sr_.read_u8 ( ) );
                return true;
            case Marker::Uint16:
                if ( !require( sizeof( mp_u16 ) ) )
                    return false;

                out = Value::make_int( sr_.read_u16 ( ) );
                return true;
            case Marker::Uint32:
                if ( !require( sizeof( mp_u32 ) ) )
                    return false;

                out = Value::make_int( sr_.read_u32 ( ) );
                return true;
            case Marker::Uint64:
                {
                    if ( !require( sizeof( mp_u64 ) ) )
                        return false;

                    const auto value = sr_.read_u64 ( );

                    if ( value > static_cast< mp_u64 >( std::numeric_limits< mp_i64 >::max ( ) ) )
                        return fail( DecodeError::IntegerOverflow, tag_pos );

                    out = Value::make_int( static_cast< mp_i64 >( value ) );
                    return true;
                }
            case Marker::Int8:
                if ( !require( sizeof( mp_i8 ) ) )
                    return false;

                out = Value::make_int( sr_.read_i8 ( ) );
                return true;
            case Marker::Int16:
                if ( !require( sizeof( mp_i16 ) ) )
                    return false;

                out = Value::make_int( sr_.read_i16 ( ) );
                return true;
            case Marker::Int32:
                if ( !require( sizeof( mp_i32 ) ) )
                    return false;

                out = Value::make_int( sr_.read_i32 ( ) );
                return true;
            case Marker::Int64:
                if ( !require( sizeof( mp_i64 ) ) )
                    return false;

                out = Value::make_int( sr_.read_i64 ( ) );
                return true;
            case Marker::FixExt1:
            case Marker::FixExt2:
            case Marker::FixExt4:
            case Marker::FixExt8:
            case Marker::FixExt16:
                return read_extension( marker::fixext_size( mk ), out );
            case Marker::Str8:
            case Marker::Str16:
            case Marker::Str32:
                {
                    mp_u32 length { 0 };

                    return read_length( mk, length ) && read_string( length, out );
                }
            case Marker::Array16:
            case Marker::Array32:
                {
                    mp_u32 count { 0 };

                    return read_length( mk, count ) && decode_array( count, tag_pos, out );
                }
            case Marker::Map16:
            case Marker::Map32:
                {
                    mp_u32 count { 0 };

                    return read_length( mk, count ) && decode_map( count, tag_pos, out );
                }
            }

            return fail( DecodeError::UnknownTag, tag_pos );
        }

    public:
        /**
         * @brief Decode from `size` bytes at `buffer`. The decoder does not take ownership of the buffer.
         * @param buffer Start of the encoded data
         * @param size Size, in bytes, of the encoded data
         * @param options Depth limit and trailing data policy
         */
        explicit Decoder(
            const mp_u8 *buffer,
            const mp_size size,
            const DecodeOptions &options = DecodeOptions { }
        )
            : sr_( buffer, size ),
              options_( options )
        {
        }

        explicit Decoder( const std::vector< mp_u8 > &buffer, const DecodeOptions &options = DecodeOptions { } )
            : Decoder( buffer.data ( ), buffer.size ( ), options )
        {
        }

        /* The decoder only borrows the buffer, so it cannot be handed a temporary. */
        Decoder( std::vector< mp_u8 > &&buffer, const DecodeOptions &options = DecodeOptions { } ) = delete;

        /* Disallow copies. */
        Decoder( const Decoder &other ) = delete;
        Decoder &operator=( const Decoder &other ) = delete;

        const DecodeOptions &options( ) const
        {
            return options_;
        }

        /**
         * @brief Position of the read cursor in the buffer.
         * @return mp_size
         */
        mp_size read_cursor( ) const
        {
            return sr_.position ( );
        }

        mp_size remaining( ) const
        {
            return sr_.remaining ( );
        }

        bool at_end( ) const
        {
            return sr_.remaining ( ) == 0;
        }

        void reset_cursor( )
        {
            sr_.reset_cursor ( );
        }

        /**
         * @brief Decode the value under the cursor and advance past it. Trailing bytes are left for the next call.
         * @remark On failure nothing is returned and the cursor stays at the start of the value that failed.
         * @return DecodeResult holding the value and its encoded size, or the error and where it was found
         */
        DecodeResult decode_single( )
        {
            const auto start = sr_.position ( );

            DecodeResult dr { };

            depth_ = 0;
            error_ = ParseError { };

            if ( !decode_value( dr.value ) )
            {
                log::logger ( )->debug(
                    "decode: {} at byte {}",
                    error_name( error_.error ),
                    error_.byte
                );

                dr.value = Value { };
                dr.error = error_;

                sr_.reset_cursor ( );
                sr_.skip( start );

                return dr;
            }

            dr.size = sr_.position ( ) - start;

            return dr;
        }
    };

    /**
     * @brief Decode a buffer that holds exactly one complete value.
     * @param buffer Start of the encoded data
     * @param size Size, in bytes, of the encoded data
     * @param options With `allow_trailing_data` unset, bytes after the value fail with `DecodeError::TrailingData`
     * @return DecodeResult
     */
    inline DecodeResult parse( const mp_u8 *buffer, const mp_size size, const DecodeOptions &options = DecodeOptions { } )
    {
        Decoder decoder( buffer, size, options );

        auto dr = decoder.decode_single ( );

        if ( dr && !options.allow_trailing_data && !decoder.at_end ( ) )
        {
            log::logger ( )->debug(
                "decode: {} trailing bytes after value at byte {}",
                decoder.remaining ( ),
                decoder.read_cursor ( )
            );

            dr.value = Value { };
            dr.error = ParseError { DecodeError::TrailingData, decoder.read_cursor ( ) };
        }

        return dr;
    }

    inline DecodeResult parse( const std::vector< mp_u8 > &buffer, const DecodeOptions &options = DecodeOptions { } )
    {
        return parse( buffer.data ( ), buffer.size ( ), options );
    }

    /**
     * @brief Decode the value at the front of a buffer that may hold more data after it.
     * @return DecodeResult whose `size` is the number of bytes the value occupied
     */
    inline DecodeResult parse_prefix( const mp_u8 *buffer, const mp_size size, DecodeOptions options = DecodeOptions { } )
    {
        options.allow_trailing_data = true;

        return parse( buffer, size, options );
    }

    inline DecodeResult parse_prefix( const std::vector< mp_u8 > &buffer, const DecodeOptions &options = DecodeOptions { } )
    {
        return parse_prefix( buffer.data ( ), buffer.size ( ), options );
    }
}
