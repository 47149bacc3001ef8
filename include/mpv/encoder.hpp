#pragma once

#include <cmath>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "marker.hpp"
#include "options.hpp"
#include "stream.hpp"
#include "value.hpp"

namespace mpv
{
    /**
     * @brief Writes MessagePack into a growable buffer. Every `write_*` picks the smallest wire representation
     * for its argument; the caller cannot force a wider one.
     */
    struct Encoder
    {
    private:
        /**
         * @brief Internal object used for writing to the byte stream.
         */
        stream::StreamWriter wr_ { };

        EncodeOptions options_ { };

        /**
         * @brief Refuse lengths that MessagePack has no field wide enough for.
         * @param length Byte length or element count about to be written
         * @param what Kind of payload, for the message
         */
        static void check_length( const mp_u64 length, const char *what )
        {
            if ( length > value_limits::LengthMax )
            {
                const auto message = fmt::format(
                    "{} of length {} exceeds the MessagePack limit of {}",
                    what,
                    length,
                    value_limits::LengthMax
                );

                log::logger ( )->error( "encode: {}", message );
                throw std::length_error( message );
            }
        }

        /**
         * @brief Write the marker and length field of a str, bin or ext family, choosing the narrowest width.
         * @param length Payload length
         * @param width8 Marker with a 1 byte length field
         * @param width16 Marker with a 2 byte length field
         * @param width32 Marker with a 4 byte length field
         */
        void write_length( const mp_u64 length, const Marker width8, const Marker width16, const Marker width32 )
        {
            if ( length <= value_limits::Uint8Max )
            {
                write_marker( width8 );
                wr_.write_u8( static_cast< mp_u8 >( length ) );
            }
            else if ( length <= value_limits::Uint16Max )
            {
                write_marker( width16 );
                wr_.write_u16( static_cast< mp_u16 >( length ) );
            }
            else
            {
                write_marker( width32 );
                wr_.write_u32( static_cast< mp_u32 >( length ) );
            }
        }

    public:
        explicit Encoder( const EncodeOptions &options = EncodeOptions { } )
            : options_( options )
        {
        }

        /* Disallow copies. */
        Encoder( const Encoder &other ) = delete;
        Encoder &operator=( const Encoder &other ) = delete;

        const EncodeOptions &options( ) const
        {
            return options_;
        }

        /**
         * @brief Bytes written so far.
         * @return const std::vector< mp_u8 > &
         */
        const std::vector< mp_u8 > &buffer( ) const
        {
            return wr_.buffer ( );
        }

        /**
         * @brief Position of the write cursor in the stream.
         * @return mp_size
         */
        mp_size write_cursor( ) const
        {
            return wr_.position ( );
        }

        /**
         * @brief Move the encoded bytes out and leave the encoder empty, ready for reuse.
         * @return std::vector< mp_u8 >
         */
        std::vector< mp_u8 > release( )
        {
            return wr_.release ( );
        }

        void clear( )
        {
            wr_.clear ( );
        }

        void write_marker( const Marker marker )
        {
            wr_.write_u8( static_cast< mp_u8 >( marker ) );
        }

        Encoder &write_nil( )
        {
            write_marker( Marker::Nil );
            return *this;
        }

        /**
         * @brief Write `true` or `false` to the stream depending on `value`. The marker is the value.
         * @param value Boolean value to write
         * @return Encoder&
         */
        Encoder &write_boolean( const bool value )
        {
            write_marker( value ? Marker::True : Marker::False );
            return *this;
        }

        /**
         * @brief Write an unsigned integer to the stream using the smallest possible representation.
         * @param value Integer value to write to the stream
         * @return Encoder&
         */
        Encoder &write_uint( const mp_u64 value )
        {
            if ( value <= value_limits::PosFixIntMax )
            {
                wr_.write_u8( static_cast< mp_u8 >( value ) );
            }
            else if ( value <= value_limits::Uint8Max )
            {
                write_marker( Marker::Uint8 );
                wr_.write_u8( static_cast< mp_u8 >( value ) );
            }
            else if ( value <= value_limits::Uint16Max )
            {
                write_marker( Marker::Uint16 );
                wr_.write_u16( static_cast< mp_u16 >( value ) );
            }
            else if ( value <= value_limits::Uint32Max )
            {
                write_marker( Marker::Uint32 );
                wr_.write_u32( static_cast< mp_u32 >( value ) );
            }
            else
            {
                write_marker( Marker::Uint64 );
                wr_.write_u64( value );
            }

            return *this;
        }

        /**
         * @brief Write a signed integer using the smallest possible representation. Non-negative values take
         * the unsigned families, negative values the negative fixint or signed families.
         * @param value Integer value to write to the stream
         * @return Encoder&
         */
        Encoder &write_int( const mp_i64 value )
        {
            if ( value >= 0 )
                return write_uint( static_cast< mp_u64 >( value ) );

            if ( value >= value_limits::NegFixIntMin )
            {
                // The tag is the two's complement byte itself: 0xe0 - 0xff.
                wr_.write_i8( static_cast< mp_i8 >( value ) );
            }
            else if ( value >= value_limits::Int8Min )
            {
                write_marker( Marker::Int8 );
                wr_.write_i8( static_cast< mp_i8 >( value ) );
            }
            else if ( value >= value_limits::Int16Min )
            {
                write_marker( Marker::Int16 );
                wr_.write_i16( static_cast< mp_i16 >( value ) );
            }
            else if ( value >= value_limits::Int32Min )
            {
                write_marker( Marker::Int32 );
                wr_.write_i32( static_cast< mp_i32 >( value ) );
            }
            else
            {
                write_marker( Marker::Int64 );
                wr_.write_i64( value );
            }

            return *this;
        }

        Encoder &write_float32( const float value )
        {
            mp_u32 bits { 0 };
            std::memcpy( &bits, &value, sizeof( bits ) );

            write_marker( Marker::Float32 );
            wr_.write_u32( bits );

            return *this;
        }

        Encoder &write_float64( const double value )
        {
            mp_u64 bits { 0 };
            std::memcpy( &bits, &value, sizeof( bits ) );

            write_marker( Marker::Float64 );
            wr_.write_u64( bits );

            return *this;
        }

        /**
         * @brief Write a float. With `EncodeOptions::compact_floats` the value goes out as float32 when that
         * loses nothing, i.e. widening the narrowed value reproduces the original bit pattern.
         * @param value Float value to write
         * @return Encoder&
         */
        Encoder &write_float( const double value )
        {
            const auto in_float_range = !std::isfinite( value ) ||
                std::fabs( value ) <= static_cast< double >( std::numeric_limits< float >::max ( ) );

            if ( options_.compact_floats && in_float_range )
            {
                const auto narrowed = static_cast< float >( value );

                if ( detail::float_bits( static_cast< double >( narrowed ) ) == detail::float_bits( value ) )
                    return write_float32( narrowed );
            }

            return write_float64( value );
        }

        /**
         * @brief Write `length` bytes of UTF-8 text as a str family value.
         * @remark The bytes are written verbatim; validity is the caller's contract.
         * @param data Pointer to at least `length` bytes
         * @param length Size, in bytes, of the text
         * @return Encoder&
         */
        Encoder &write_str( const char *data, const mp_u64 length )
        {
            check_length( length, "string" );

            if ( length <= value_limits::FixStrMax )
                wr_.write_u8( static_cast< mp_u8 >( Marker::FixStr ) | static_cast< mp_u8 >( length ) );
            else
                write_length( length, Marker::Str8, Marker::Str16, Marker::Str32 );

            wr_.write( static_cast< mp_size >( length ), reinterpret_cast< const mp_u8* >( data ) );

            return *this;
        }

        Encoder &write_str( const std::string &text )
        {
            return write_str( text.data ( ), text.size ( ) );
        }

        /**
         * @brief Write a byte array as a bin family value. Binary has no inline short form.
         * @param bytes Pointer to at least `count` bytes
         * @param count Size, in bytes, of the byte array
         * @return Encoder&
         */
        Encoder &write_bin( const mp_u8 *bytes, const mp_u64 count )
        {
            check_length( count, "binary" );

            write_length( count, Marker::Bin8, Marker::Bin16, Marker::Bin32 );
            wr_.write( static_cast< mp_size >( count ), bytes );

            return *this;
        }

        Encoder &write_bin( const Bytes &bytes )
        {
            return write_bin( bytes.data ( ), bytes.size ( ) );
        }

        /**
         * @brief Write an extension. Payloads of exactly 1, 2, 4, 8 or 16 bytes use the fixext markers,
         * anything else the ext 8/16/32 markers.
         * @param type_id Application defined type
         * @param data Pointer to at least `length` bytes
         * @param length Size, in bytes, of the payload
         * @return Encoder&
         */
        Encoder &write_ext( const mp_i8 type_id, const mp_u8 *data, const mp_u64 length )
        {
            check_length( length, "extension" );

            switch ( length )
            {
            case 1:
                write_marker( Marker::FixExt1 );
                break;
            case 2:
                write_marker( Marker::FixExt2 );
                break;
            case 4:
                write_marker( Marker::FixExt4 );
                break;
            case 8:
                write_marker( Marker::FixExt8 );
                break;
            case 16:
                write_marker( Marker::FixExt16 );
                break;
            default:
                write_length( length, Marker::Ext8, Marker::Ext16, Marker::Ext32 );
                break;
            }

            wr_.write_i8( type_id );
            wr_.write( static_cast< mp_size >( length ), data );

            return *this;
        }

        Encoder &write_ext( const Extension &extension )
        {
            return write_ext( extension.type_id, extension.value.data ( ), extension.value.size ( ) );
        }

        /**
         * @brief Mark the start of an array. The caller writes `num_elem` values afterwards.
         * @param num_elem Number of elements in the array
         * @return Encoder&
         */
        Encoder &start_array( const mp_u64 num_elem )
        {
            check_length( num_elem, "array" );

            if ( num_elem <= value_limits::FixArrayMax )
            {
                wr_.write_u8( static_cast< mp_u8 >( Marker::FixArray ) | static_cast< mp_u8 >( num_elem ) );
            }
            else if ( num_elem <= value_limits::Uint16Max )
            {
                write_marker( Marker::Array16 );
                wr_.write_u16( static_cast< mp_u16 >( num_elem ) );
            }
            else
            {
                write_marker( Marker::Array32 );
                wr_.write_u32( static_cast< mp_u32 >( num_elem ) );
            }

            return *this;
        }

        /**
         * @brief Mark the start of a map. The caller writes `num_pairs` keys and values afterwards, alternating.
         * @param num_pairs Number of key-value pairs in this map. Both keys and values can be any MessagePack type.
         * @return Encoder&
         */
        Encoder &start_map( const mp_u64 num_pairs )
        {
            check_length( num_pairs, "map" );

            if ( num_pairs <= value_limits::FixMapMax )
            {
                wr_.write_u8( static_cast< mp_u8 >( Marker::FixMap ) | static_cast< mp_u8 >( num_pairs ) );
            }
            else if ( num_pairs <= value_limits::Uint16Max )
            {
                write_marker( Marker::Map16 );
                wr_.write_u16( static_cast< mp_u16 >( num_pairs ) );
            }
            else
            {
                write_marker( Marker::Map32 );
                wr_.write_u32( static_cast< mp_u32 >( num_pairs ) );
            }

            return *this;
        }

        /**
         * @brief Write a whole value tree, recursing into arrays and maps in stored order.
         * @param value Value to encode
         * @return Encoder&
         */
        Encoder &encode( const Value &value )
        {
            switch ( value.type ( ) )
            {
            case Type::Nil:
                return write_nil ( );
            case Type::Boolean:
                return write_boolean( value.boolean_value ( ) );
            case Type::Int:
                return write_int( value.int_value ( ) );
            case Type::Float:
                return write_float( value.float_value ( ) );
            case Type::String:
                return write_str( value.string_value ( ) );
            case Type::Binary:
                return write_bin( value.binary_value ( ) );
            case Type::Extension:
                return write_ext( value.extension_value ( ) );
            case Type::Array:
                {
                    start_array( value.array_value ( ).size ( ) );

                    for ( const auto &element : value.array_value ( ) )
                        encode( element );

                    return *this;
                }
            case Type::Map:
                {
                    start_map( value.map_value ( ).size ( ) );

                    for ( const auto &element : value.map_value ( ) )
                    {
                        encode( element.key );
                        encode( element.value );
                    }

                    return *this;
                }
            }

            return *this;
        }
    };

    /**
     * @brief Encode `value` into a fresh byte vector.
     * @param value Value to encode
     * @param options Encoder settings
     * @return std::vector< mp_u8 >
     */
    inline std::vector< mp_u8 > encode( const Value &value, const EncodeOptions &options = EncodeOptions { } )
    {
        Encoder encoder( options );

        return encoder.encode( value ).release ( );
    }
}
