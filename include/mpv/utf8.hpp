#pragma once

#include "common.hpp"

namespace mpv
{
    namespace utf8
    {
        constexpr mp_u32 Accept = 0;
        constexpr mp_u32 Reject = 1;
        constexpr mp_u32 Continue = 2;

        /**
         * @brief Incremental UTF-8 decoder state. Feed bytes one at a time through `step( )`.
         * Rejects overlong forms, UTF-16 surrogates and code points above U+10FFFF.
         */
        struct Decoder
        {
        private:
            mp_u32 pending_ { 0 }; // continuation bytes still expected
            mp_u8 lower_ { 0x80 }; // bounds for the next continuation byte
            mp_u8 upper_ { 0xbf };

        public:
            /**
             * @brief Consume one byte.
             * @param byte Next byte of the sequence
             * @return `Accept` at a code point boundary, `Continue` mid sequence, `Reject` on an invalid byte
             */
            mp_u32 step( const mp_u8 byte )
            {
                if ( pending_ )
                {
                    if ( byte < lower_ || byte > upper_ )
                        return Reject;

                    lower_ = 0x80;
                    upper_ = 0xbf;

                    return --pending_ ? Continue : Accept;
                }

                if ( byte <= 0x7f )
                    return Accept;

                if ( byte >= 0xc2 && byte <= 0xdf )
                {
                    pending_ = 1;
                }
                else if ( byte >= 0xe0 && byte <= 0xef )
                {
                    pending_ = 2;

                    if ( byte == 0xe0 )
                        lower_ = 0xa0; // overlong
                    else if ( byte == 0xed )
                        upper_ = 0x9f; // surrogates
                }
                else if ( byte >= 0xf0 && byte <= 0xf4 )
                {
                    pending_ = 3;

                    if ( byte == 0xf0 )
                        lower_ = 0x90; // overlong
                    else if ( byte == 0xf4 )
                        upper_ = 0x8f; // above U+10FFFF
                }
                else
                {
                    return Reject;
                }

                return Continue;
            }
        };

        /**
         * @brief Check that `size` bytes at `data` form complete, well-formed UTF-8.
         * @param data Bytes to check
         * @param size Number of bytes
         * @return bool
         */
        inline bool valid( const mp_u8 *data, const mp_size size )
        {
            Decoder decoder { };
            mp_u32 state = Accept;

            for ( mp_size index = 0; index < size; index++ )
            {
                state = decoder.step( data[ index ] );

                if ( state == Reject )
                    return false;
            }

            // A sequence cut short at the end is as invalid as a bad byte.
            return state == Accept;
        }
    }
}
