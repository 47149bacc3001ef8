#pragma once

#include <iterator>
#include <ostream>
#include <string>

#include <spdlog/fmt/fmt.h>

#include "value.hpp"

namespace mpv
{
    namespace detail
    {
        inline void format_hex( fmt::memory_buffer &out, const Bytes &bytes )
        {
            for ( const auto byte : bytes )
                fmt::format_to( std::back_inserter( out ), "{:02x}", byte );
        }

        inline void format_value( fmt::memory_buffer &out, const Value &value )
        {
            auto it = std::back_inserter( out );

            switch ( value.type ( ) )
            {
            case Type::Nil:
                fmt::format_to( it, "nil" );
                break;
            case Type::Boolean:
                fmt::format_to( it, "{}", value.boolean_value ( ) );
                break;
            case Type::Int:
                fmt::format_to( it, "{}", value.int_value ( ) );
                break;
            case Type::Float:
                fmt::format_to( it, "{}", value.float_value ( ) );
                break;
            case Type::String:
                fmt::format_to( it, "\"{}\"", value.string_value ( ) );
                break;
            case Type::Binary:
                fmt::format_to( it, "bin:" );
                format_hex( out, value.binary_value ( ) );
                break;
            case Type::Extension:
                fmt::format_to( it, "ext:{}:", value.extension_value ( ).type_id );
                format_hex( out, value.extension_value ( ).value );
                break;
            case Type::Array:
                {
                    fmt::format_to( it, "[" );

                    auto first = true;
                    for ( const auto &element : value.array_value ( ) )
                    {
                        if ( !first )
                            fmt::format_to( it, ", " );

                        first = false;
                        format_value( out, element );
                    }

                    fmt::format_to( it, "]" );
                    break;
                }
            case Type::Map:
                {
                    fmt::format_to( it, "{{" );

                    auto first = true;
                    for ( const auto &element : value.map_value ( ) )
                    {
                        if ( !first )
                            fmt::format_to( it, ", " );

                        first = false;
                        format_value( out, element.key );
                        fmt::format_to( it, ": " );
                        format_value( out, element.value );
                    }

                    fmt::format_to( it, "}}" );
                    break;
                }
            }
        }
    }

    /**
     * @brief Human readable rendering for diagnostics, e.g. `{"id": 7, "tags": ["a", bin:00ff]}`.
     * Not a serialization format; strings are not escaped.
     * @param value Value to render
     * @return std::string
     */
    inline std::string to_string( const Value &value )
    {
        fmt::memory_buffer out;
        detail::format_value( out, value );

        return fmt::to_string( out );
    }

    inline std::ostream &operator<<( std::ostream &os, const Value &value )
    {
        return os << to_string( value );
    }
}
