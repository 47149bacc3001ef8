#pragma once

#include <cstring>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <boost/container_hash/hash.hpp>
#include <spdlog/fmt/fmt.h>

#include "common.hpp"

namespace mpv
{
    enum class Type : mp_u32
    {
        Nil,
        Boolean,
        Int,
        Float,
        String,
        Binary,
        Array,
        Map,
        Extension
    };

    inline const char *type_name( const Type type )
    {
        switch ( type )
        {
        case Type::Nil:
            return "nil";
        case Type::Boolean:
            return "boolean";
        case Type::Int:
            return "int";
        case Type::Float:
            return "float";
        case Type::String:
            return "string";
        case Type::Binary:
            return "binary";
        case Type::Array:
            return "array";
        case Type::Map:
            return "map";
        case Type::Extension:
            return "extension";
        }

        return "unknown";
    }

    using Bytes = std::vector< mp_u8 >;

    /**
     * @brief Application defined payload. Type ids 0 to 127 are free for applications;
     * MessagePack reserves the negative ids for predefined types such as timestamps (-1).
     */
    struct Extension
    {
        mp_i8 type_id { 0 };
        Bytes value { };

        bool operator==( const Extension &other ) const
        {
            return type_id == other.type_id && value == other.value;
        }

        bool operator!=( const Extension &other ) const
        {
            return !( *this == other );
        }
    };

    struct Value;
    struct MapElement;
    struct ConversionError;

    template < typename Ty >
    struct ConversionResult;

    using Array = std::vector< Value >;
    using Map = std::vector< MapElement >;

    /**
     * @brief Any value MessagePack can carry. The payload is a variant whose alternatives follow the order
     * of `Type`. Containers own their elements, so a tree never shares or cycles.
     */
    struct Value
    {
    private:
        using Storage = std::variant<
            std::monostate,
            bool,
            mp_i64,
            double,
            std::string,
            Bytes,
            Array,
            Map,
            Extension
        >;

        Storage storage_;

        template < typename Ty >
        static Value make( Ty &&payload )
        {
            Value v { };
            v.storage_.emplace< std::decay_t< Ty > >( std::forward< Ty >( payload ) );

            return v;
        }

    public:
        Value( ) = default;

        static Value make_nil( );
        static Value make_boolean( bool value );
        static Value make_int( mp_i64 value );
        static Value make_float( double value );
        static Value make_string( std::string value );
        static Value make_binary( Bytes value );
        static Value make_array( Array value );
        static Value make_map( Map value );
        static Value make_extension( Extension value );
        static Value make_extension( mp_i8 type_id, Bytes value );

        Type type( ) const
        {
            return static_cast< Type >( storage_.index ( ) );
        }

        bool is_nil( ) const { return type ( ) == Type::Nil; }
        bool is_boolean( ) const { return type ( ) == Type::Boolean; }
        bool is_int( ) const { return type ( ) == Type::Int; }
        bool is_float( ) const { return type ( ) == Type::Float; }
        bool is_string( ) const { return type ( ) == Type::String; }
        bool is_binary( ) const { return type ( ) == Type::Binary; }
        bool is_array( ) const { return type ( ) == Type::Array; }
        bool is_map( ) const { return type ( ) == Type::Map; }
        bool is_extension( ) const { return type ( ) == Type::Extension; }

        /*
         * Views of the payload for callers that already switched on `type( )`.
         * Asking for the wrong variant throws `std::bad_variant_access`.
         */
        bool boolean_value( ) const { return std::get< bool >( storage_ ); }
        mp_i64 int_value( ) const { return std::get< mp_i64 >( storage_ ); }
        double float_value( ) const { return std::get< double >( storage_ ); }
        const std::string &string_value( ) const { return std::get< std::string >( storage_ ); }
        const Bytes &binary_value( ) const { return std::get< Bytes >( storage_ ); }
        const Extension &extension_value( ) const { return std::get< Extension >( storage_ ); }
        const Array &array_value( ) const;
        const Map &map_value( ) const;

        /*
         * Checked extraction. Each succeeds iff the matching `is_*` is true. The rvalue overloads move
         * the payload out (or, on failure, move the value into the error so it can be recovered).
         */
        ConversionResult< bool > as_boolean( ) const &;
        ConversionResult< bool > as_boolean( ) &&;
        ConversionResult< mp_i64 > as_int( ) const &;
        ConversionResult< mp_i64 > as_int( ) &&;
        ConversionResult< double > as_float( ) const &;
        ConversionResult< double > as_float( ) &&;
        ConversionResult< std::string > as_string( ) const &;
        ConversionResult< std::string > as_string( ) &&;
        ConversionResult< Bytes > as_binary( ) const &;
        ConversionResult< Bytes > as_binary( ) &&;
        ConversionResult< Array > as_array( ) const &;
        ConversionResult< Array > as_array( ) &&;
        ConversionResult< Map > as_map( ) const &;
        ConversionResult< Map > as_map( ) &&;
        ConversionResult< Extension > as_extension( ) const &;
        ConversionResult< Extension > as_extension( ) &&;

        bool operator==( const Value &other ) const;

        bool operator!=( const Value &other ) const
        {
            return !( *this == other );
        }
    };

    /**
     * @brief One key/value pair of a Map. Pairs keep their insertion order and keys are not deduplicated.
     */
    struct MapElement
    {
        Value key { };
        Value value { };

        bool operator==( const MapElement &other ) const
        {
            return key == other.key && value == other.value;
        }

        bool operator!=( const MapElement &other ) const
        {
            return !( *this == other );
        }
    };

    /**
     * @brief A failed `as_*` conversion. Owns the value that could not be converted.
     */
    struct ConversionError
    {
        Value original { };
        const char *attempted { "" };

        /**
         * @brief Give back the value that could not be converted.
         * @return Value
         */
        Value recover( ) &&
        {
            return std::move( original );
        }

        std::string message( ) const
        {
            return fmt::format(
                "MsgPack conversion error: cannot use {} as {}",
                type_name( original.type ( ) ),
                attempted
            );
        }
    };

    template < typename Ty >
    struct ConversionResult
    {
        Ty value { };
        bool ok { false };
        ConversionError error { };

        explicit operator bool( ) const { return ok; }

        static ConversionResult success( Ty payload )
        {
            ConversionResult result { };

            result.value = std::move( payload );
            result.ok = true;

            return result;
        }

        static ConversionResult failure( Value original, const char *attempted )
        {
            ConversionResult result { };

            result.error.original = std::move( original );
            result.error.attempted = attempted;

            return result;
        }
    };

    inline Value Value::make_nil( )
    {
        return Value { };
    }

    inline Value Value::make_boolean( const bool value )
    {
        return make( value );
    }

    inline Value Value::make_int( const mp_i64 value )
    {
        return make( value );
    }

    inline Value Value::make_float( const double value )
    {
        return make( value );
    }

    inline Value Value::make_string( std::string value )
    {
        return make( std::move( value ) );
    }

    inline Value Value::make_binary( Bytes value )
    {
        return make( std::move( value ) );
    }

    inline Value Value::make_array( Array value )
    {
        return make( std::move( value ) );
    }

    inline Value Value::make_map( Map value )
    {
        return make( std::move( value ) );
    }

    inline Value Value::make_extension( Extension value )
    {
        return make( std::move( value ) );
    }

    inline Value Value::make_extension( const mp_i8 type_id, Bytes value )
    {
        return make_extension( Extension { type_id, std::move( value ) } );
    }

    inline const Array &Value::array_value( ) const
    {
        return std::get< Array >( storage_ );
    }

    inline const Map &Value::map_value( ) const
    {
        return std::get< Map >( storage_ );
    }

    namespace detail
    {
        inline mp_u64 float_bits( const double value )
        {
            mp_u64 bits { 0 };
            std::memcpy( &bits, &value, sizeof( bits ) );

            return bits;
        }
    }

    inline bool Value::operator==( const Value &other ) const
    {
        if ( storage_.index ( ) != other.storage_.index ( ) )
            return false;

        // Bit pattern, so NaN payloads compare equal to themselves and 0.0 differs from -0.0.
        if ( is_float ( ) )
            return detail::float_bits( float_value ( ) ) == detail::float_bits( other.float_value ( ) );

        return storage_ == other.storage_;
    }

    inline ConversionResult< bool > Value::as_boolean( ) const &
    {
        if ( !is_boolean ( ) )
            return ConversionResult< bool >::failure( *this, "boolean" );

        return ConversionResult< bool >::success( std::get< bool >( storage_ ) );
    }

    inline ConversionResult< bool > Value::as_boolean( ) &&
    {
        if ( !is_boolean ( ) )
            return ConversionResult< bool >::failure( std::move( *this ), "boolean" );

        return ConversionResult< bool >::success( std::get< bool >( storage_ ) );
    }

    inline ConversionResult< mp_i64 > Value::as_int( ) const &
    {
        if ( !is_int ( ) )
            return ConversionResult< mp_i64 >::failure( *this, "int" );

        return ConversionResult< mp_i64 >::success( std::get< mp_i64 >( storage_ ) );
    }

    inline ConversionResult< mp_i64 > Value::as_int( ) &&
    {
        if ( !is_int ( ) )
            return ConversionResult< mp_i64 >::failure( std::move( *this ), "int" );

        return ConversionResult< mp_i64 >::success( std::get< mp_i64 >( storage_ ) );
    }

    inline ConversionResult< double > Value::as_float( ) const &
    {
        if ( !is_float ( ) )
            return ConversionResult< double >::failure( *this, "float" );

        return ConversionResult< double >::success( std::get< double >( storage_ ) );
    }

    inline ConversionResult< double > Value::as_float( ) &&
    {
        if ( !is_float ( ) )
            return ConversionResult< double >::failure( std::move( *this ), "float" );

        return ConversionResult< double >::success( std::get< double >( storage_ ) );
    }

    inline ConversionResult< std::string > Value::as_string( ) const &
    {
        if ( !is_string ( ) )
            return ConversionResult< std::string >::failure( *this, "string" );

        return ConversionResult< std::string >::success( std::get< std::string >( storage_ ) );
    }

    inline ConversionResult< std::string > Value::as_string( ) &&
    {
        if ( !is_string ( ) )
            return ConversionResult< std::string >::failure( std::move( *this ), "string" );

        return ConversionResult< std::string >::success( std::move( std::get< std::string >( storage_ ) ) );
    }

    inline ConversionResult< Bytes > Value::as_binary( ) const &
    {
        if ( !is_binary ( ) )
            return ConversionResult< Bytes >::failure( *this, "binary" );

        return ConversionResult< Bytes >::success( std::get< Bytes >( storage_ ) );
    }

    inline ConversionResult< Bytes > Value::as_binary( ) &&
    {
        if ( !is_binary ( ) )
            return ConversionResult< Bytes >::failure( std::move( *this ), "binary" );

        return ConversionResult< Bytes >::success( std::move( std::get< Bytes >( storage_ ) ) );
    }

    inline ConversionResult< Array > Value::as_array( ) const &
    {
        if ( !is_array ( ) )
            return ConversionResult< Array >::failure( *this, "array" );

        return ConversionResult< Array >::success( std::get< Array >( storage_ ) );
    }

    inline ConversionResult< Array > Value::as_array( ) &&
    {
        if ( !is_array ( ) )
            return ConversionResult< Array >::failure( std::move( *this ), "array" );

        return ConversionResult< Array >::success( std::move( std::get< Array >( storage_ ) ) );
    }

    inline ConversionResult< Map > Value::as_map( ) const &
    {
        if ( !is_map ( ) )
            return ConversionResult< Map >::failure( *this, "map" );

        return ConversionResult< Map >::success( std::get< Map >( storage_ ) );
    }

    inline ConversionResult< Map > Value::as_map( ) &&
    {
        if ( !is_map ( ) )
            return ConversionResult< Map >::failure( std::move( *this ), "map" );

        return ConversionResult< Map >::success( std::move( std::get< Map >( storage_ ) ) );
    }

    inline ConversionResult< Extension > Value::as_extension( ) const &
    {
        if ( !is_extension ( ) )
            return ConversionResult< Extension >::failure( *this, "extension" );

        return ConversionResult< Extension >::success( std::get< Extension >( storage_ ) );
    }

    inline ConversionResult< Extension > Value::as_extension( ) &&
    {
        if ( !is_extension ( ) )
            return ConversionResult< Extension >::failure( std::move( *this ), "extension" );

        return ConversionResult< Extension >::success( std::move( std::get< Extension >( storage_ ) ) );
    }

    /*
     * Found by `boost::hash` through ADL. Consistent with `operator==`.
     */
    inline std::size_t hash_value( const Extension &extension )
    {
        std::size_t seed = 0;

        boost::hash_combine( seed, extension.type_id );
        boost::hash_range( seed, extension.value.begin ( ), extension.value.end ( ) );

        return seed;
    }

    inline std::size_t hash_value( const Value &value );

    inline std::size_t hash_value( const MapElement &element )
    {
        std::size_t seed = 0;

        boost::hash_combine( seed, hash_value( element.key ) );
        boost::hash_combine( seed, hash_value( element.value ) );

        return seed;
    }

    inline std::size_t hash_value( const Value &value )
    {
        std::size_t seed = 0;

        boost::hash_combine( seed, static_cast< mp_u32 >( value.type ( ) ) );

        switch ( value.type ( ) )
        {
        case Type::Nil:
            break;
        case Type::Boolean:
            boost::hash_combine( seed, value.boolean_value ( ) );
            break;
        case Type::Int:
            boost::hash_combine( seed, value.int_value ( ) );
            break;
        case Type::Float:
            boost::hash_combine( seed, detail::float_bits( value.float_value ( ) ) );
            break;
        case Type::String:
            boost::hash_combine( seed, value.string_value ( ) );
            break;
        case Type::Binary:
            boost::hash_range( seed, value.binary_value ( ).begin ( ), value.binary_value ( ).end ( ) );
            break;
        case Type::Array:
            for ( const auto &element : value.array_value ( ) )
                boost::hash_combine( seed, hash_value( element ) );
            break;
        case Type::Map:
            for ( const auto &element : value.map_value ( ) )
                boost::hash_combine( seed, hash_value( element ) );
            break;
        case Type::Extension:
            boost::hash_combine( seed, hash_value( value.extension_value ( ) ) );
            break;
        }

        return seed;
    }
}

namespace std
{
    template < >
    struct hash< mpv::Value >
    {
        std::size_t operator()( const mpv::Value &value ) const
        {
            return mpv::hash_value( value );
        }
    };
}
