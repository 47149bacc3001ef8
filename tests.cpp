#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <variant>
#include <vector>

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include "mpv/mpv.hpp"
#include "gtest/gtest.h"

using bytes = std::vector< mpv::mp_u8 >;

namespace
{
    mpv::Value str( const std::string &text )
    {
        return mpv::Value::make_string( text );
    }

    mpv::Value integer( const mpv::mp_i64 value )
    {
        return mpv::Value::make_int( value );
    }

    /* The message the library's own documentation is built around. */
    mpv::Value sample_message( )
    {
        return mpv::Value::make_map( {
            mpv::MapElement { str( "hello" ), integer( 0x424242 ) },
            mpv::MapElement {
                str( "world" ),
                mpv::Value::make_array( {
                    mpv::Value::make_boolean( true ),
                    mpv::Value::make_nil ( ),
                    mpv::Value::make_binary( { 0x42, 0xff } ),
                    mpv::Value::make_extension( 2, { 0x32, 0x4a, 0x67, 0x11 } )
                } )
            }
        } );
    }

    mpv::Value nested_arrays( const mpv::mp_u32 depth )
    {
        auto value = integer( 1 );

        for ( mpv::mp_u32 level = 0; level < depth; level++ )
            value = mpv::Value::make_array( { value } );

        return value;
    }
}

namespace integers
{
    class IntegerFixture : public testing::Test
    {
    protected:
        static bytes encode_int( const mpv::mp_i64 value )
        {
            return mpv::encode( integer( value ) );
        }

        static mpv::mp_i64 decode_int( const bytes &raw )
        {
            const auto dr = mpv::parse( raw );

            EXPECT_TRUE( dr ) << dr.error.message ( );
            EXPECT_TRUE( dr.value.is_int ( ) );

            return dr.value.int_value ( );
        }
    };

    TEST_F( IntegerFixture, TestFixInt )
    {
        EXPECT_EQ( encode_int( 0 ), ( bytes { 0x00 } ) );
        EXPECT_EQ( encode_int( 42 ), ( bytes { 0x2a } ) );
        EXPECT_EQ( encode_int( 127 ), ( bytes { 0x7f } ) );

        EXPECT_EQ( encode_int( -1 ), ( bytes { 0xff } ) );
        EXPECT_EQ( encode_int( -32 ), ( bytes { 0xe0 } ) );

        EXPECT_EQ( decode_int( { 0x7f } ), 127 );
        EXPECT_EQ( decode_int( { 0xe0 } ), -32 );
        EXPECT_EQ( decode_int( { 0xff } ), -1 );
    }

    TEST_F( IntegerFixture, TestUnsignedWidths )
    {
        EXPECT_EQ( encode_int( 128 ), ( bytes { 0xcc, 0x80 } ) );
        EXPECT_EQ( encode_int( 200 ), ( bytes { 0xcc, 0xc8 } ) );
        EXPECT_EQ( encode_int( 0xff ), ( bytes { 0xcc, 0xff } ) );

        EXPECT_EQ( encode_int( 0x100 ), ( bytes { 0xcd, 0x01, 0x00 } ) );
        EXPECT_EQ( encode_int( 0xffff ), ( bytes { 0xcd, 0xff, 0xff } ) );

        EXPECT_EQ( encode_int( 0x10000 ), ( bytes { 0xce, 0x00, 0x01, 0x00, 0x00 } ) );
        EXPECT_EQ( encode_int( 0xffffffff ), ( bytes { 0xce, 0xff, 0xff, 0xff, 0xff } ) );

        EXPECT_EQ(
            encode_int( 0x100000000 ),
            ( bytes { 0xcf, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00 } )
        );

        EXPECT_EQ(
            encode_int( std::numeric_limits< mpv::mp_i64 >::max ( ) ),
            ( bytes { 0xcf, 0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff } )
        );
    }

    TEST_F( IntegerFixture, TestSignedWidths )
    {
        EXPECT_EQ( encode_int( -33 ), ( bytes { 0xd0, 0xdf } ) );
        EXPECT_EQ( encode_int( -128 ), ( bytes { 0xd0, 0x80 } ) );

        EXPECT_EQ( encode_int( -129 ), ( bytes { 0xd1, 0xff, 0x7f } ) );
        EXPECT_EQ( encode_int( -32768 ), ( bytes { 0xd1, 0x80, 0x00 } ) );

        EXPECT_EQ( encode_int( -32769 ), ( bytes { 0xd2, 0xff, 0xff, 0x7f, 0xff } ) );
        EXPECT_EQ(
            encode_int( std::numeric_limits< mpv::mp_i32 >::min ( ) ),
            ( bytes { 0xd2, 0x80, 0x00, 0x00, 0x00 } )
        );

        EXPECT_EQ(
            encode_int( static_cast< mpv::mp_i64 >( std::numeric_limits< mpv::mp_i32 >::min ( ) ) - 1 ),
            ( bytes { 0xd3, 0xff, 0xff, 0xff, 0xff, 0x7f, 0xff, 0xff, 0xff } )
        );
        EXPECT_EQ(
            encode_int( std::numeric_limits< mpv::mp_i64 >::min ( ) ),
            ( bytes { 0xd3, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 } )
        );
    }

    TEST_F( IntegerFixture, TestWidthBoundariesRoundTrip )
    {
        const mpv::mp_i64 boundaries[ ] = {
            0, 127, 128, 255, 256, 65535, 65536, 4294967295LL, 4294967296LL,
            std::numeric_limits< mpv::mp_i64 >::max ( ),
            -1, -32, -33, -128, -129, -32768, -32769,
            std::numeric_limits< mpv::mp_i32 >::min ( ),
            static_cast< mpv::mp_i64 >( std::numeric_limits< mpv::mp_i32 >::min ( ) ) - 1,
            std::numeric_limits< mpv::mp_i64 >::min ( )
        };

        for ( const auto value : boundaries )
            EXPECT_EQ( decode_int( encode_int( value ) ), value ) << "value " << value;
    }

    TEST_F( IntegerFixture, TestNonMinimalWireFormsAreWidened )
    {
        EXPECT_EQ( decode_int( { 0xcd, 0x00, 0x05 } ), 5 );
        EXPECT_EQ( decode_int( { 0xd0, 0x05 } ), 5 );
        EXPECT_EQ( decode_int( { 0xd1, 0xff, 0xfe } ), -2 );
        EXPECT_EQ( decode_int( { 0xd2, 0xff, 0xff, 0xff, 0xfe } ), -2 );
        EXPECT_EQ( decode_int( { 0xd3, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe } ), -2 );
        EXPECT_EQ( decode_int( { 0xce, 0xff, 0xff, 0xff, 0xff } ), 0xffffffffLL );
    }

    TEST_F( IntegerFixture, TestUint64AboveInt64Max )
    {
        const auto dr = mpv::parse( bytes { 0xcf, 0x80, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 } );

        EXPECT_FALSE( dr );
        EXPECT_EQ( dr.error.error, mpv::DecodeError::IntegerOverflow );
        EXPECT_EQ( dr.error.byte, 0u );
        EXPECT_TRUE( dr.value.is_nil ( ) );
    }
}

namespace floats
{
    class FloatFixture : public testing::Test
    {
    protected:
        static mpv::Value round_trip( const double value, const mpv::EncodeOptions &options = mpv::EncodeOptions { } )
        {
            const auto dr = mpv::parse( mpv::encode( mpv::Value::make_float( value ), options ) );

            EXPECT_TRUE( dr ) << dr.error.message ( );

            return dr.value;
        }
    };

    TEST_F( FloatFixture, TestExactFloat32IsNarrowed )
    {
        EXPECT_EQ(
            mpv::encode( mpv::Value::make_float( 1.5 ) ),
            ( bytes { 0xca, 0x3f, 0xc0, 0x00, 0x00 } )
        );

        EXPECT_EQ( round_trip( 1.5 ).float_value ( ), 1.5 );
    }

    TEST_F( FloatFixture, TestInexactFloat32StaysFloat64 )
    {
        EXPECT_EQ(
            mpv::encode( mpv::Value::make_float( 1.1 ) ),
            ( bytes { 0xcb, 0x3f, 0xf1, 0x99, 0x99, 0x99, 0x99, 0x99, 0x9a } )
        );

        EXPECT_EQ( round_trip( 1.1 ).float_value ( ), 1.1 );
        EXPECT_EQ( round_trip( 1e300 ).float_value ( ), 1e300 );
        EXPECT_EQ( mpv::encode( mpv::Value::make_float( 1e300 ) ).front ( ), 0xcb );
    }

    TEST_F( FloatFixture, TestCompactFloatsDisabled )
    {
        mpv::EncodeOptions options { };
        options.compact_floats = false;

        EXPECT_EQ(
            mpv::encode( mpv::Value::make_float( 1.5 ), options ),
            ( bytes { 0xcb, 0x3f, 0xf8, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00 } )
        );

        EXPECT_EQ( round_trip( 1.5, options ).float_value ( ), 1.5 );
    }

    TEST_F( FloatFixture, TestFloat32WireIsWidened )
    {
        const auto dr = mpv::parse( bytes { 0xca, 0x40, 0x49, 0x0f, 0xdb } );

        ASSERT_TRUE( dr );
        EXPECT_TRUE( dr.value.is_float ( ) );
        EXPECT_EQ( dr.value.float_value ( ), static_cast< double >( 3.14159274f ) );
    }

    TEST_F( FloatFixture, TestSpecialValues )
    {
        EXPECT_EQ(
            mpv::encode( mpv::Value::make_float( std::numeric_limits< double >::infinity ( ) ) ),
            ( bytes { 0xca, 0x7f, 0x80, 0x00, 0x00 } )
        );

        EXPECT_EQ(
            mpv::encode( mpv::Value::make_float( -0.0 ) ),
            ( bytes { 0xca, 0x80, 0x00, 0x00, 0x00 } )
        );

        EXPECT_TRUE( std::signbit( round_trip( -0.0 ).float_value ( ) ) );

        const auto nan = mpv::Value::make_float( std::numeric_limits< double >::quiet_NaN ( ) );
        EXPECT_EQ( round_trip( std::numeric_limits< double >::quiet_NaN ( ) ), nan );
    }
}

namespace strings
{
    class StringFixture : public testing::Test
    {
    protected:
        static bytes encode_str( const std::string &text )
        {
            return mpv::encode( str( text ) );
        }

        static mpv::DecodeError decode_error( const bytes &raw )
        {
            return mpv::parse( raw ).error.error;
        }
    };

    TEST_F( StringFixture, TestFixStr )
    {
        EXPECT_EQ( encode_str( "" ), ( bytes { 0xa0 } ) );
        EXPECT_EQ(
            encode_str( "Hello Rust" ),
            ( bytes { 0xaa, 0x48, 0x65, 0x6c, 0x6c, 0x6f, 0x20, 0x52, 0x75, 0x73, 0x74 } )
        );

        const auto dr = mpv::parse( bytes { 0xaa, 0x48, 0x65, 0x6c, 0x6c, 0x6f, 0x20, 0x52, 0x75, 0x73, 0x74 } );

        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value.string_value ( ), "Hello Rust" );
        EXPECT_EQ( dr.size, 11u );
    }

    TEST_F( StringFixture, TestLengthThresholds )
    {
        EXPECT_EQ( encode_str( std::string( 31, 'x' ) ).front ( ), 0xbf );

        const auto str8 = encode_str( std::string( 32, 'x' ) );
        EXPECT_EQ( str8[ 0 ], 0xd9 );
        EXPECT_EQ( str8[ 1 ], 0x20 );
        EXPECT_EQ( str8.size ( ), 34u );

        EXPECT_EQ( encode_str( std::string( 255, 'x' ) )[ 0 ], 0xd9 );

        const auto str16 = encode_str( std::string( 256, 'x' ) );
        EXPECT_EQ( bytes( str16.begin ( ), str16.begin ( ) + 3 ), ( bytes { 0xda, 0x01, 0x00 } ) );

        const auto str32 = encode_str( std::string( 65536, 'x' ) );
        EXPECT_EQ( bytes( str32.begin ( ), str32.begin ( ) + 5 ), ( bytes { 0xdb, 0x00, 0x01, 0x00, 0x00 } ) );

        for ( const auto length : { 0u, 31u, 32u, 255u, 256u, 65535u, 65536u } )
        {
            const auto text = std::string( length, 'y' );
            const auto dr = mpv::parse( encode_str( text ) );

            ASSERT_TRUE( dr ) << "length " << length;
            EXPECT_EQ( dr.value.string_value ( ), text );
        }
    }

    TEST_F( StringFixture, TestLengthIsCountedInBytes )
    {
        EXPECT_EQ( encode_str( "\xc3\xa9" ), ( bytes { 0xa2, 0xc3, 0xa9 } ) );

        const std::string mixed = "h\xc3\xa9llo \xe2\x82\xac \xf0\x9f\x98\x80";
        const auto dr = mpv::parse( encode_str( mixed ) );

        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value.string_value ( ), mixed );
    }

    TEST_F( StringFixture, TestInvalidUtf8IsRejected )
    {
        EXPECT_EQ( decode_error( { 0xa1, 0xff } ), mpv::DecodeError::InvalidString );
        EXPECT_EQ( decode_error( { 0xa2, 0xc3, 0x28 } ), mpv::DecodeError::InvalidString );  // bad continuation
        EXPECT_EQ( decode_error( { 0xa2, 0xc0, 0x80 } ), mpv::DecodeError::InvalidString );  // overlong
        EXPECT_EQ( decode_error( { 0xa3, 0xed, 0xa0, 0x80 } ), mpv::DecodeError::InvalidString );  // surrogate
        EXPECT_EQ( decode_error( { 0xa4, 0xf4, 0x90, 0x80, 0x80 } ), mpv::DecodeError::InvalidString );  // > U+10FFFF
        EXPECT_EQ( decode_error( { 0xa1, 0xc3 } ), mpv::DecodeError::InvalidString );  // sequence cut by the length

        const auto dr = mpv::parse( bytes { 0xd9, 0x02, 0x61, 0x80 } );

        EXPECT_FALSE( dr );
        EXPECT_EQ( dr.error.error, mpv::DecodeError::InvalidString );
        EXPECT_EQ( dr.error.byte, 2u );
        EXPECT_TRUE( dr.value.is_nil ( ) );
    }
}

namespace binary
{
    TEST( BinaryTests, TestLengthWidths )
    {
        EXPECT_EQ( mpv::encode( mpv::Value::make_binary( { } ) ), ( bytes { 0xc4, 0x00 } ) );
        EXPECT_EQ(
            mpv::encode( mpv::Value::make_binary( { 0x42, 0xff } ) ),
            ( bytes { 0xc4, 0x02, 0x42, 0xff } )
        );

        const auto bin16 = mpv::encode( mpv::Value::make_binary( bytes( 256, 0xab ) ) );
        EXPECT_EQ( bytes( bin16.begin ( ), bin16.begin ( ) + 3 ), ( bytes { 0xc5, 0x01, 0x00 } ) );
        EXPECT_EQ( bin16.size ( ), 259u );

        const auto bin32 = mpv::encode( mpv::Value::make_binary( bytes( 65536, 0xab ) ) );
        EXPECT_EQ( bytes( bin32.begin ( ), bin32.begin ( ) + 5 ), ( bytes { 0xc6, 0x00, 0x01, 0x00, 0x00 } ) );
    }

    TEST( BinaryTests, TestBinaryIsOpaque )
    {
        const bytes raw { 0xff, 0x00, 0xc1, 0x80 };
        const auto dr = mpv::parse( mpv::encode( mpv::Value::make_binary( raw ) ) );

        ASSERT_TRUE( dr );
        EXPECT_TRUE( dr.value.is_binary ( ) );
        EXPECT_EQ( dr.value.binary_value ( ), raw );
    }
}

namespace containers
{
    class ContainerFixture : public testing::Test
    {
    protected:
        static mpv::Value array_of( const mpv::mp_u32 count )
        {
            mpv::Array elements { };

            for ( mpv::mp_u32 index = 0; index < count; index++ )
                elements.push_back( integer( index % 100 ) );

            return mpv::Value::make_array( std::move( elements ) );
        }

        static mpv::Value map_of( const mpv::mp_u32 count )
        {
            mpv::Map pairs { };

            for ( mpv::mp_u32 index = 0; index < count; index++ )
                pairs.push_back( mpv::MapElement { integer( index ), mpv::Value::make_nil ( ) } );

            return mpv::Value::make_map( std::move( pairs ) );
        }
    };

    TEST_F( ContainerFixture, TestArrayThresholds )
    {
        EXPECT_EQ( mpv::encode( array_of( 15 ) ).front ( ), 0x9f );

        const auto array16 = mpv::encode( array_of( 16 ) );
        EXPECT_EQ( bytes( array16.begin ( ), array16.begin ( ) + 3 ), ( bytes { 0xdc, 0x00, 0x10 } ) );

        const auto array32 = mpv::encode( array_of( 65536 ) );
        EXPECT_EQ( bytes( array32.begin ( ), array32.begin ( ) + 5 ), ( bytes { 0xdd, 0x00, 0x01, 0x00, 0x00 } ) );

        for ( const auto count : { 15u, 16u, 65535u, 65536u } )
        {
            const auto value = array_of( count );
            const auto dr = mpv::parse( mpv::encode( value ) );

            ASSERT_TRUE( dr ) << "count " << count;
            EXPECT_EQ( dr.value, value );
        }
    }

    TEST_F( ContainerFixture, TestMapThresholds )
    {
        EXPECT_EQ( mpv::encode( map_of( 15 ) ).front ( ), 0x8f );

        const auto map16 = mpv::encode( map_of( 16 ) );
        EXPECT_EQ( bytes( map16.begin ( ), map16.begin ( ) + 3 ), ( bytes { 0xde, 0x00, 0x10 } ) );

        const auto map16_full = mpv::encode( map_of( 65535 ) );
        EXPECT_EQ( bytes( map16_full.begin ( ), map16_full.begin ( ) + 3 ), ( bytes { 0xde, 0xff, 0xff } ) );

        const auto map32 = mpv::encode( map_of( 65536 ) );
        EXPECT_EQ( bytes( map32.begin ( ), map32.begin ( ) + 5 ), ( bytes { 0xdf, 0x00, 0x01, 0x00, 0x00 } ) );

        for ( const auto count : { 15u, 16u, 65535u, 65536u } )
        {
            const auto value = map_of( count );
            const auto dr = mpv::parse( mpv::encode( value ) );

            ASSERT_TRUE( dr ) << "count " << count;
            EXPECT_EQ( dr.value, value );
        }
    }

    TEST_F( ContainerFixture, TestEmptyContainers )
    {
        EXPECT_EQ( mpv::encode( mpv::Value::make_array( { } ) ), ( bytes { 0x90 } ) );
        EXPECT_EQ( mpv::encode( mpv::Value::make_map( { } ) ), ( bytes { 0x80 } ) );

        const auto array = mpv::parse( bytes { 0x90 } );
        ASSERT_TRUE( array );
        EXPECT_TRUE( array.value.is_array ( ) );
        EXPECT_TRUE( array.value.array_value ( ).empty ( ) );

        const auto map = mpv::parse( bytes { 0x80 } );
        ASSERT_TRUE( map );
        EXPECT_TRUE( map.value.is_map ( ) );
        EXPECT_TRUE( map.value.map_value ( ).empty ( ) );

        const auto array16 = mpv::parse( bytes { 0xdc, 0x00, 0x00 } );
        ASSERT_TRUE( array16 );
        EXPECT_EQ( array16.value, mpv::Value::make_array( { } ) );
    }

    TEST_F( ContainerFixture, TestMapOrderIsPreserved )
    {
        const auto value = mpv::Value::make_map( {
            mpv::MapElement { str( "b" ), integer( 2 ) },
            mpv::MapElement { str( "a" ), integer( 1 ) }
        } );

        const auto encoded = mpv::encode( value );
        EXPECT_EQ( encoded, ( bytes { 0x82, 0xa1, 0x62, 0x02, 0xa1, 0x61, 0x01 } ) );

        const auto dr = mpv::parse( encoded );
        ASSERT_TRUE( dr );

        const auto &pairs = dr.value.map_value ( );
        ASSERT_EQ( pairs.size ( ), 2u );
        EXPECT_EQ( pairs[ 0 ].key, str( "b" ) );
        EXPECT_EQ( pairs[ 1 ].key, str( "a" ) );
    }

    TEST_F( ContainerFixture, TestArbitraryAndDuplicateKeys )
    {
        const auto value = mpv::Value::make_map( {
            mpv::MapElement { integer( -7 ), str( "int key" ) },
            mpv::MapElement { mpv::Value::make_array( { mpv::Value::make_nil ( ) } ), str( "array key" ) },
            mpv::MapElement { integer( -7 ), str( "again" ) }
        } );

        const auto dr = mpv::parse( mpv::encode( value ) );

        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value, value );
        EXPECT_EQ( dr.value.map_value ( ).size ( ), 3u );
    }

    TEST_F( ContainerFixture, TestDecodeForeignDocument )
    {
        // {"compact": true, "schema": [1, 2, 1.32]}
        const bytes raw {
            0x82, 0xa7, 0x63, 0x6f, 0x6d, 0x70, 0x61, 0x63, 0x74, 0xc3, 0xa6, 0x73, 0x63, 0x68, 0x65,
            0x6d, 0x61, 0x93, 0x01, 0x02, 0xcb, 0x3f, 0xf5, 0x1e, 0xb8, 0x51, 0xeb, 0x85, 0x1f
        };

        const auto dr = mpv::parse( raw );
        ASSERT_TRUE( dr ) << dr.error.message ( );
        EXPECT_EQ( dr.size, raw.size ( ) );

        const auto &pairs = dr.value.map_value ( );
        ASSERT_EQ( pairs.size ( ), 2u );

        EXPECT_EQ( pairs[ 0 ].key, str( "compact" ) );
        EXPECT_EQ( pairs[ 0 ].value, mpv::Value::make_boolean( true ) );

        EXPECT_EQ( pairs[ 1 ].key, str( "schema" ) );
        EXPECT_EQ(
            pairs[ 1 ].value,
            mpv::Value::make_array( { integer( 1 ), integer( 2 ), mpv::Value::make_float( 1.32 ) } )
        );
    }

    TEST_F( ContainerFixture, TestRoundTrip )
    {
        const auto message = sample_message ( );
        const auto dr = mpv::parse( mpv::encode( message ) );

        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value, message );

        const auto deep = nested_arrays( 64 );
        EXPECT_EQ( mpv::parse( mpv::encode( deep ) ).value, deep );
    }
}

namespace extensions
{
    class ExtensionFixture : public testing::Test
    {
    protected:
        static bytes encode_ext( const mpv::mp_i8 type_id, const mpv::mp_size size )
        {
            return mpv::encode( mpv::Value::make_extension( type_id, bytes( size, 0x5a ) ) );
        }

        static bytes header( const bytes &encoded, const mpv::mp_size count )
        {
            return bytes( encoded.begin ( ), encoded.begin ( ) + count );
        }
    };

    TEST_F( ExtensionFixture, TestFixExt4Fidelity )
    {
        const auto value = mpv::Value::make_extension( 2, { 0x32, 0x4a, 0x67, 0x11 } );
        const auto encoded = mpv::encode( value );

        EXPECT_EQ( encoded, ( bytes { 0xd6, 0x02, 0x32, 0x4a, 0x67, 0x11 } ) );

        const auto dr = mpv::parse( encoded );
        ASSERT_TRUE( dr );
        ASSERT_TRUE( dr.value.is_extension ( ) );
        EXPECT_EQ( dr.value.extension_value ( ).type_id, 2 );
        EXPECT_EQ( dr.value.extension_value ( ).value, ( bytes { 0x32, 0x4a, 0x67, 0x11 } ) );
    }

    TEST_F( ExtensionFixture, TestFixedSizes )
    {
        EXPECT_EQ( header( encode_ext( 1, 1 ), 2 ), ( bytes { 0xd4, 0x01 } ) );
        EXPECT_EQ( header( encode_ext( 1, 2 ), 2 ), ( bytes { 0xd5, 0x01 } ) );
        EXPECT_EQ( header( encode_ext( 1, 4 ), 2 ), ( bytes { 0xd6, 0x01 } ) );
        EXPECT_EQ( header( encode_ext( 1, 8 ), 2 ), ( bytes { 0xd7, 0x01 } ) );
        EXPECT_EQ( header( encode_ext( 1, 16 ), 2 ), ( bytes { 0xd8, 0x01 } ) );

        EXPECT_EQ( encode_ext( 1, 16 ).size ( ), 18u );
    }

    TEST_F( ExtensionFixture, TestVariableSizes )
    {
        EXPECT_EQ( encode_ext( 7, 0 ), ( bytes { 0xc7, 0x00, 0x07 } ) );
        EXPECT_EQ( header( encode_ext( 7, 3 ), 3 ), ( bytes { 0xc7, 0x03, 0x07 } ) );
        EXPECT_EQ( header( encode_ext( 7, 17 ), 3 ), ( bytes { 0xc7, 0x11, 0x07 } ) );
        EXPECT_EQ( header( encode_ext( 7, 256 ), 4 ), ( bytes { 0xc8, 0x01, 0x00, 0x07 } ) );
        EXPECT_EQ( header( encode_ext( 7, 65536 ), 6 ), ( bytes { 0xc9, 0x00, 0x01, 0x00, 0x00, 0x07 } ) );

        for ( const auto size : { 0u, 1u, 3u, 16u, 17u, 256u, 65536u } )
        {
            const auto value = mpv::Value::make_extension( 7, bytes( size, 0x5a ) );
            const auto dr = mpv::parse( mpv::encode( value ) );

            ASSERT_TRUE( dr ) << "size " << size;
            EXPECT_EQ( dr.value, value );
        }
    }

    TEST_F( ExtensionFixture, TestNegativeTypeId )
    {
        // -1 is the type MessagePack reserves for timestamps; the codec treats it as opaque.
        const auto encoded = encode_ext( -1, 4 );
        EXPECT_EQ( header( encoded, 2 ), ( bytes { 0xd6, 0xff } ) );

        const auto dr = mpv::parse( encoded );
        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value.extension_value ( ).type_id, -1 );
    }
}

namespace errors
{
    class DecodeErrorFixture : public testing::Test
    {
    protected:
        static mpv::ParseError error_of( const bytes &raw )
        {
            const auto dr = mpv::parse( raw );

            EXPECT_FALSE( dr );
            EXPECT_TRUE( dr.value.is_nil ( ) );

            return dr.error;
        }
    };

    TEST_F( DecodeErrorFixture, TestEmptyBuffer )
    {
        EXPECT_EQ( error_of( { } ), ( mpv::ParseError { mpv::DecodeError::UnexpectedEnd, 0 } ) );
        EXPECT_EQ( mpv::parse( nullptr, 0 ).error.error, mpv::DecodeError::UnexpectedEnd );
    }

    TEST_F( DecodeErrorFixture, TestUnknownTag )
    {
        EXPECT_EQ( error_of( { 0xc1 } ), ( mpv::ParseError { mpv::DecodeError::UnknownTag, 0 } ) );
        EXPECT_EQ( error_of( { 0x92, 0x01, 0xc1 } ), ( mpv::ParseError { mpv::DecodeError::UnknownTag, 2 } ) );
    }

    TEST_F( DecodeErrorFixture, TestTruncationIsAlwaysUnexpectedEnd )
    {
        const auto encoded = mpv::encode( sample_message ( ) );

        for ( mpv::mp_size length = 0; length < encoded.size ( ); length++ )
        {
            const auto dr = mpv::parse( encoded.data ( ), length );

            EXPECT_FALSE( dr ) << "length " << length;
            EXPECT_EQ( dr.error.error, mpv::DecodeError::UnexpectedEnd ) << "length " << length;
        }

        const bytes scalars[ ] = {
            mpv::encode( integer( 0x1234 ) ),
            mpv::encode( integer( -0x12345678LL ) ),
            mpv::encode( mpv::Value::make_float( 1.1 ) ),
            mpv::encode( str( std::string( 40, 'z' ) ) ),
            mpv::encode( mpv::Value::make_extension( 3, bytes( 20, 0x01 ) ) )
        };

        for ( const auto &raw : scalars )
        {
            for ( mpv::mp_size length = 0; length < raw.size ( ); length++ )
                EXPECT_EQ( mpv::parse( raw.data ( ), length ).error.error, mpv::DecodeError::UnexpectedEnd );
        }
    }

    TEST_F( DecodeErrorFixture, TestDeclaredLengthPastEnd )
    {
        EXPECT_EQ( error_of( { 0xc4, 0x05, 0x01, 0x02 } ), ( mpv::ParseError { mpv::DecodeError::UnexpectedEnd, 2 } ) );
        EXPECT_EQ( error_of( { 0xc5, 0x01 } ), ( mpv::ParseError { mpv::DecodeError::UnexpectedEnd, 1 } ) );
        EXPECT_EQ( error_of( { 0xdb, 0xff, 0xff, 0xff, 0xff } ).error, mpv::DecodeError::UnexpectedEnd );
        EXPECT_EQ( error_of( { 0xdd, 0xff, 0xff, 0xff, 0xff } ).error, mpv::DecodeError::UnexpectedEnd );
        EXPECT_EQ( error_of( { 0xdf, 0xff, 0xff, 0xff, 0xff, 0xc0 } ).error, mpv::DecodeError::UnexpectedEnd );
        EXPECT_EQ( error_of( { 0xd6, 0x01, 0x00 } ).error, mpv::DecodeError::UnexpectedEnd );
        EXPECT_EQ( error_of( { 0xc7, 0x02 } ), ( mpv::ParseError { mpv::DecodeError::UnexpectedEnd, 2 } ) );
    }

    TEST_F( DecodeErrorFixture, TestTrailingData )
    {
        EXPECT_EQ( error_of( { 0xc0, 0xc0 } ), ( mpv::ParseError { mpv::DecodeError::TrailingData, 1 } ) );

        mpv::DecodeOptions options { };
        options.allow_trailing_data = true;

        const auto lenient = mpv::parse( bytes { 0xc0, 0xc0 }, options );
        ASSERT_TRUE( lenient );
        EXPECT_TRUE( lenient.value.is_nil ( ) );
        EXPECT_EQ( lenient.size, 1u );
    }

    TEST_F( DecodeErrorFixture, TestParsePrefix )
    {
        const bytes raw { 0xaa, 0x48, 0x65, 0x6c, 0x6c, 0x6f, 0x20, 0x52, 0x75, 0x73, 0x74, 0x00 };

        const auto dr = mpv::parse_prefix( raw );

        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value, str( "Hello Rust" ) );
        EXPECT_EQ( dr.size, 11u );

        EXPECT_EQ( mpv::parse( raw ).error, ( mpv::ParseError { mpv::DecodeError::TrailingData, 11 } ) );
    }

    TEST_F( DecodeErrorFixture, TestErrorMessages )
    {
        const mpv::ParseError error { mpv::DecodeError::UnexpectedEnd, 3 };

        EXPECT_EQ( error.message ( ), "MsgPack parse error at byte 3: unexpected end of input" );
        EXPECT_STREQ( mpv::error_name( mpv::DecodeError::DepthExceeded ), "DepthExceeded" );
        EXPECT_FALSE( mpv::ParseError { } );
    }
}

namespace depth
{
    class DepthFixture : public testing::Test
    {
    protected:
        /* `levels` nested one element arrays around a fixint. */
        static bytes nested( const mpv::mp_size levels )
        {
            bytes raw( levels, 0x91 );
            raw.push_back( 0x01 );

            return raw;
        }
    };

    TEST_F( DepthFixture, TestConfiguredLimit )
    {
        mpv::DecodeOptions options { };
        options.max_depth = 2;

        EXPECT_TRUE( mpv::parse( nested( 2 ), options ) );

        const auto dr = mpv::parse( nested( 3 ), options );
        EXPECT_FALSE( dr );
        EXPECT_EQ( dr.error, ( mpv::ParseError { mpv::DecodeError::DepthExceeded, 2 } ) );

        // Scalars do not count towards the depth.
        options.max_depth = 0;
        EXPECT_TRUE( mpv::parse( bytes { 0x2a }, options ) );
        EXPECT_EQ( mpv::parse( bytes { 0x80 }, options ).error.error, mpv::DecodeError::DepthExceeded );
    }

    TEST_F( DepthFixture, TestDefaultLimit )
    {
        EXPECT_TRUE( mpv::parse( nested( MPV_DEFAULT_MAX_DEPTH ) ) );

        const auto dr = mpv::parse( nested( MPV_DEFAULT_MAX_DEPTH + 1 ) );
        EXPECT_EQ( dr.error.error, mpv::DecodeError::DepthExceeded );
        EXPECT_EQ( dr.error.byte, static_cast< mpv::mp_size >( MPV_DEFAULT_MAX_DEPTH ) );

        EXPECT_EQ( mpv::parse( nested( 100000 ) ).error.error, mpv::DecodeError::DepthExceeded );
    }

    TEST_F( DepthFixture, TestMapsCountTowardsDepth )
    {
        mpv::DecodeOptions options { };
        options.max_depth = 1;

        // {1: [1]}
        const auto dr = mpv::parse( bytes { 0x81, 0x01, 0x91, 0x01 }, options );

        EXPECT_EQ( dr.error, ( mpv::ParseError { mpv::DecodeError::DepthExceeded, 2 } ) );
    }
}

namespace decoder
{
    TEST( DecoderTests, TestBorrowsOnlyLiveBuffers )
    {
        static_assert( !std::is_constructible< mpv::Decoder, std::vector< mpv::mp_u8 > && >::value,
                       "a temporary buffer would dangle" );
        static_assert( std::is_constructible< mpv::Decoder, const std::vector< mpv::mp_u8 > & >::value,
                       "named buffers are accepted" );

        const auto raw = mpv::encode( str( std::string( 40, 'q' ) ) );

        mpv::Decoder decoder( raw );
        EXPECT_EQ( decoder.decode_single ( ).value, str( std::string( 40, 'q' ) ) );
    }

    TEST( DecoderTests, TestDecodeSequence )
    {
        const bytes raw { 0x01, 0xa1, 0x61, 0xc0 };

        mpv::Decoder decoder( raw );

        auto dr = decoder.decode_single ( );
        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value, integer( 1 ) );
        EXPECT_EQ( dr.size, 1u );

        dr = decoder.decode_single ( );
        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value, str( "a" ) );
        EXPECT_EQ( dr.size, 2u );
        EXPECT_EQ( decoder.read_cursor ( ), 3u );

        dr = decoder.decode_single ( );
        ASSERT_TRUE( dr );
        EXPECT_TRUE( dr.value.is_nil ( ) );
        EXPECT_TRUE( decoder.at_end ( ) );

        dr = decoder.decode_single ( );
        EXPECT_EQ( dr.error, ( mpv::ParseError { mpv::DecodeError::UnexpectedEnd, 4 } ) );
        EXPECT_EQ( decoder.read_cursor ( ), 4u );
    }

    TEST( DecoderTests, TestFailureLeavesCursorAtValue )
    {
        const bytes raw { 0x05, 0x92, 0x01, 0xc1 };

        mpv::Decoder decoder( raw );

        ASSERT_TRUE( decoder.decode_single ( ) );

        const auto dr = decoder.decode_single ( );
        EXPECT_EQ( dr.error, ( mpv::ParseError { mpv::DecodeError::UnknownTag, 3 } ) );
        EXPECT_EQ( decoder.read_cursor ( ), 1u );
        EXPECT_EQ( decoder.remaining ( ), 3u );

        decoder.reset_cursor ( );
        EXPECT_EQ( decoder.decode_single ( ).value, integer( 5 ) );
    }

    TEST( DecoderTests, TestEncoderWritesSequence )
    {
        mpv::Encoder encoder { };

        encoder.start_array( 2 )
               .write_int( -1 )
               .write_str( "x" );

        encoder.write_nil ( );

        EXPECT_EQ( encoder.buffer ( ), ( bytes { 0x92, 0xff, 0xa1, 0x78, 0xc0 } ) );
        EXPECT_EQ( encoder.write_cursor ( ), 5u );

        const auto raw = encoder.release ( );
        EXPECT_TRUE( encoder.buffer ( ).empty ( ) );

        mpv::Decoder decoder( raw );
        EXPECT_EQ( decoder.decode_single ( ).value, mpv::Value::make_array( { integer( -1 ), str( "x" ) } ) );
        EXPECT_TRUE( decoder.decode_single ( ).value.is_nil ( ) );
        EXPECT_TRUE( decoder.at_end ( ) );
    }
}

namespace accessors
{
    TEST( AccessorTests, TestIsVariant )
    {
        EXPECT_TRUE( mpv::Value::make_nil ( ).is_nil ( ) );
        EXPECT_FALSE( mpv::Value::make_boolean( false ).is_nil ( ) );
        EXPECT_TRUE( mpv::Value::make_boolean( false ).is_boolean ( ) );
        EXPECT_TRUE( integer( 42 ).is_int ( ) );
        EXPECT_FALSE( mpv::Value::make_float( 42.0 ).is_int ( ) );
        EXPECT_TRUE( str( "foo" ).is_string ( ) );
        EXPECT_FALSE( mpv::Value::make_binary( { 0x66, 0x6f, 0x6f } ).is_string ( ) );
        EXPECT_TRUE( mpv::Value::make_array( { } ).is_array ( ) );
        EXPECT_FALSE( mpv::Value::make_map( { } ).is_array ( ) );
        EXPECT_TRUE( mpv::Value::make_extension( 42, { 0x42 } ).is_extension ( ) );
    }

    TEST( AccessorTests, TestPayloadIsASingleAlternative )
    {
        static_assert( sizeof( mpv::Value ) <= sizeof( std::string ) + sizeof( std::size_t ),
                       "a value stores only its active payload" );

        EXPECT_THROW( integer( 1 ).string_value ( ), std::bad_variant_access );
        EXPECT_THROW( str( "1" ).int_value ( ), std::bad_variant_access );
        EXPECT_THROW( mpv::Value::make_nil ( ).array_value ( ), std::bad_variant_access );

        // A decoded array of nils costs one value per element and nothing more.
        bytes raw { 0xdc, 0x27, 0x10 };
        raw.resize( raw.size ( ) + 10000, 0xc0 );

        const auto dr = mpv::parse( raw );
        ASSERT_TRUE( dr );
        EXPECT_EQ( dr.value.array_value ( ).size ( ), 10000u );
        EXPECT_LE(
            dr.value.array_value ( ).capacity ( ) * sizeof( mpv::Value ),
            10000u * ( sizeof( std::string ) + sizeof( std::size_t ) )
        );
    }

    TEST( AccessorTests, TestAsVariant )
    {
        EXPECT_EQ( integer( 42 ).as_int ( ).value, 42 );
        EXPECT_EQ( mpv::Value::make_float( 42.0 ).as_float ( ).value, 42.0 );
        EXPECT_TRUE( mpv::Value::make_boolean( true ).as_boolean ( ).value );
        EXPECT_EQ( str( "foo" ).as_string ( ).value, "foo" );
        EXPECT_EQ( mpv::Value::make_binary( { 0x66 } ).as_binary ( ).value, ( bytes { 0x66 } ) );
        EXPECT_EQ(
            mpv::Value::make_extension( 42, { 0x42 } ).as_extension ( ).value,
            ( mpv::Extension { 42, { 0x42 } } )
        );

        const auto wrong = str( "foo" ).as_float ( );
        EXPECT_FALSE( wrong );
        EXPECT_STREQ( wrong.error.attempted, "float" );
    }

    TEST( AccessorTests, TestConversionErrorRecovers )
    {
        auto result = mpv::Value::make_float( 4.2 ).as_int ( );

        ASSERT_FALSE( result );
        EXPECT_EQ( result.error.message ( ), "MsgPack conversion error: cannot use float as int" );

        const auto recovered = std::move( result.error ).recover ( );
        EXPECT_TRUE( recovered.is_float ( ) );
        EXPECT_EQ( recovered.as_float ( ).value, 4.2 );
    }

    TEST( AccessorTests, TestOwnedExtraction )
    {
        auto message = sample_message ( );

        auto map = std::move( message ).as_map ( );
        ASSERT_TRUE( map );
        ASSERT_EQ( map.value.size ( ), 2u );

        auto second = std::move( map.value[ 1 ] );
        map.value.erase( map.value.begin ( ) + 1 );
        EXPECT_EQ( map.value.size ( ), 1u );

        EXPECT_EQ( std::move( second.key ).as_string ( ).value, "world" );

        auto array = std::move( second.value ).as_array ( );
        ASSERT_TRUE( array );

        const auto nil = array.value[ 1 ];
        array.value.erase( array.value.begin ( ) + 1 );

        EXPECT_TRUE( nil.is_nil ( ) );
        EXPECT_EQ( array.value.size ( ), 3u );
    }
}

namespace formatting
{
    TEST( FormatTests, TestRendering )
    {
        EXPECT_EQ(
            mpv::to_string( sample_message ( ) ),
            "{\"hello\": 4342338, \"world\": [true, nil, bin:42ff, ext:2:324a6711]}"
        );

        EXPECT_EQ( mpv::to_string( mpv::Value::make_float( 1.5 ) ), "1.5" );
        EXPECT_EQ( mpv::to_string( integer( -3 ) ), "-3" );
        EXPECT_EQ( mpv::to_string( mpv::Value::make_array( { } ) ), "[]" );
        EXPECT_EQ( mpv::to_string( mpv::Value::make_map( { } ) ), "{}" );
        EXPECT_EQ( mpv::to_string( mpv::Value::make_extension( -1, { } ) ), "ext:-1:" );
    }
}

namespace hashing
{
    TEST( HashTests, TestStructuralEquality )
    {
        const auto ab = mpv::Value::make_map( {
            mpv::MapElement { str( "a" ), integer( 1 ) },
            mpv::MapElement { str( "b" ), integer( 2 ) }
        } );

        const auto ba = mpv::Value::make_map( {
            mpv::MapElement { str( "b" ), integer( 2 ) },
            mpv::MapElement { str( "a" ), integer( 1 ) }
        } );

        EXPECT_EQ( ab, ab );
        EXPECT_NE( ab, ba );
        EXPECT_NE( integer( 1 ), mpv::Value::make_float( 1.0 ) );
        EXPECT_NE( str( "a" ), mpv::Value::make_binary( { 0x61 } ) );
        EXPECT_NE( mpv::Value::make_float( 0.0 ), mpv::Value::make_float( -0.0 ) );
    }

    TEST( HashTests, TestHashFollowsEquality )
    {
        const std::hash< mpv::Value > hasher { };

        EXPECT_EQ( hasher( sample_message ( ) ), hasher( sample_message ( ) ) );

        std::unordered_set< mpv::Value > set { };

        set.insert( sample_message ( ) );
        set.insert( sample_message ( ) );
        set.insert( integer( 1 ) );
        set.insert( mpv::Value::make_float( 1.0 ) );
        set.insert( mpv::Value::make_nil ( ) );

        EXPECT_EQ( set.size ( ), 4u );
        EXPECT_EQ( set.count( sample_message ( ) ), 1u );
    }
}

namespace logging
{
    class LoggingFixture : public testing::Test
    {
    protected:
        std::shared_ptr< spdlog::sinks::ringbuffer_sink_mt > sink { };

        LoggingFixture( )
        {
            sink = std::make_shared< spdlog::sinks::ringbuffer_sink_mt >( 16 );
            sink->set_pattern( "%l %v" );

            auto logger = std::make_shared< spdlog::logger >( "mpv-test", sink );
            logger->set_level( spdlog::level::debug );

            mpv::log::set_logger( logger );
        }

        ~LoggingFixture( ) override
        {
            mpv::log::set_logger( nullptr );
        }
    };

    TEST_F( LoggingFixture, TestDecodeFailureIsLogged )
    {
        EXPECT_FALSE( mpv::parse( bytes { 0x91, 0xc1 } ) );

        const auto lines = sink->last_formatted ( );
        ASSERT_EQ( lines.size ( ), 1u );
        EXPECT_NE( lines[ 0 ].find( "debug decode: UnknownTag at byte 1" ), std::string::npos );
    }

    TEST_F( LoggingFixture, TestDepthLimitWarns )
    {
        mpv::DecodeOptions options { };
        options.max_depth = 1;

        EXPECT_FALSE( mpv::parse( bytes { 0x91, 0x90 }, options ) );

        const auto lines = sink->last_formatted ( );
        ASSERT_EQ( lines.size ( ), 2u );
        EXPECT_EQ( lines[ 0 ].rfind( "warning", 0 ), 0u );
        EXPECT_NE( lines[ 1 ].find( "DepthExceeded at byte 1" ), std::string::npos );
    }

    TEST_F( LoggingFixture, TestLateRegisteredLoggerIsPickedUp )
    {
        mpv::log::set_logger( nullptr );

        // Nothing registered yet, so this goes to the silent stand-in.
        EXPECT_FALSE( mpv::parse( bytes { 0xc1 } ) );

        auto registered = std::make_shared< spdlog::logger >( mpv::log::LoggerName, sink );
        registered->set_level( spdlog::level::debug );
        spdlog::register_logger( registered );

        EXPECT_FALSE( mpv::parse( bytes { 0x91, 0xc1 } ) );

        spdlog::drop( mpv::log::LoggerName );

        const auto lines = sink->last_formatted ( );
        ASSERT_EQ( lines.size ( ), 1u );
        EXPECT_NE( lines[ 0 ].find( "UnknownTag at byte 1" ), std::string::npos );
    }

    TEST_F( LoggingFixture, TestSuccessIsSilent )
    {
        EXPECT_TRUE( mpv::parse( mpv::encode( sample_message ( ) ) ) );
        EXPECT_TRUE( sink->last_formatted ( ).empty ( ) );
    }
}

/**
 * @brief Test `mpv::stream::Stream(Reader|Writer)` behaviour.
 */
namespace streams
{
    TEST( StreamTests, TestWriterIsBigEndian )
    {
        mpv::stream::StreamWriter wr { };

        wr.write_u16( 0x0102 )
          .write_u32( 0xdeadbeef )
          .write_i8( -1 );

        EXPECT_EQ( wr.buffer ( ), ( bytes { 0x01, 0x02, 0xde, 0xad, 0xbe, 0xef, 0xff } ) );
        EXPECT_EQ( wr.position ( ), 7u );
    }

    TEST( StreamTests, TestReaderRefusesOutOfBounds )
    {
        const bytes raw { 0x01, 0x02, 0x03 };

        mpv::stream::StreamReader sr( raw.data ( ), raw.size ( ) );

        EXPECT_EQ( sr.read_u16 ( ), 0x0102 );
        EXPECT_TRUE( sr.can_read( 1 ) );
        EXPECT_FALSE( sr.can_read( 2 ) );

        EXPECT_EQ( sr.read_u16 ( ), 0 ); // refused, cursor does not move
        EXPECT_EQ( sr.position ( ), 2u );

        EXPECT_EQ( sr.read_u8 ( ), 0x03 );
        EXPECT_EQ( sr.read_u8 ( ), 0 );
        EXPECT_LE( sr.position ( ), sr.stream_size ( ) );
    }

    TEST( StreamTests, TestUtf8Validator )
    {
        const mpv::mp_u8 emoji[ ] = { 0xf0, 0x9f, 0x98, 0x80 };
        const mpv::mp_u8 cut[ ] = { 0xf0, 0x9f, 0x98 };
        const mpv::mp_u8 stray[ ] = { 0x80 };

        EXPECT_TRUE( mpv::utf8::valid( emoji, sizeof( emoji ) ) );
        EXPECT_FALSE( mpv::utf8::valid( cut, sizeof( cut ) ) );
        EXPECT_FALSE( mpv::utf8::valid( stray, sizeof( stray ) ) );
        EXPECT_TRUE( mpv::utf8::valid( nullptr, 0 ) );
    }
}
