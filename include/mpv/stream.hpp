#pragma once

#include <cstring>
#include <vector>

#include "common.hpp"

/*
 * Note: `StreamReader` never takes ownership of the buffer it reads from. The caller
 * keeps the buffer alive for as long as the reader is in use.
 *
 * `StreamWriter` owns a growable byte vector. Call `release( )` to move the encoded
 * bytes out once writing is done.
 *
 * Notes:
 *      1) Not thread safe. Use one stream per thread;
 *      2) Reads past the end are refused silently and yield zero. Callers that need
 *         to distinguish truncation must ask `can_read( )` first.
 */

namespace mpv
{
    namespace stream
    {
        struct Stream
        {
            /**
             * @brief Current cursor position.
             * @return mp_size
             */
            mp_size position( ) const
            {
                return position_;
            }

            /**
             * @brief Total size of the stream. Does not take into account the current cursor position.
             * @return mp_size
             */
            mp_size stream_size( ) const
            {
                return stream_size_;
            }

        protected:
            mp_size position_ { 0 };
            mp_size stream_size_ { 0 };
        };

        struct StreamReader : Stream
        {
        private:
            const mp_u8 *buffer_ { nullptr };

        public:
            explicit StreamReader(
                const mp_u8 *buffer = nullptr,
                const mp_size stream_size = 0,
                const mp_size position = 0
            )
            {
                buffer_ = buffer;
                stream_size_ = stream_size;
                position_ = position > stream_size ? stream_size : position;
            }

            /* Disallow copies. */
            StreamReader( const StreamReader &other ) = delete;
            StreamReader &operator=( const StreamReader &other ) = delete;

            /**
             * @brief Address of the byte under the cursor.
             * @return const mp_u8 *
             */
            const mp_u8 *cursor( ) const
            {
                return buffer_ + position_;
            }

            /**
             * @brief Number of unread bytes between the cursor and the end of the buffer.
             * @return mp_size
             */
            mp_size remaining( ) const
            {
                return stream_size_ - position_;
            }

            /**
             * @brief Check whether `count` more bytes can be read without running past the end.
             * @param count Number of bytes the caller is about to read
             * @return bool
             */
            bool can_read( const mp_size count ) const
            {
                return count <= remaining ( );
            }

            /**
             * @brief Reset the stream cursor back to the start
             */
            void reset_cursor( )
            {
                position_ = 0;
            }

            /**
             * @brief Move the cursor forward by `count` bytes, stopping at the end of the buffer.
             * @param count Number of bytes to skip
             */
            void skip( const mp_size count )
            {
                position_ = can_read( count ) ? position_ + count : stream_size_;
            }

        private:
            /**
             * @brief The core of the `StreamReader` interface. Copies `count` bytes from the stream into `dst`.
             * @param count Number of bytes to read from the stream.
             * @param dst Buffer of at least `count` bytes to copy into.
             * @return `false` if the stream does not hold `count` more bytes; nothing is copied in that case
             */
            bool _read_and_advance( const mp_size count, mp_u8 *dst )
            {
                if ( !count )
                {
                    return true;
                }

                if ( !dst || !buffer_ || !can_read( count ) )
                {
                    return false;
                }

                std::memcpy( dst, cursor ( ), count );
                position_ += count;

                return true;
            }

            /**
             * @brief Read a plain old data (POD) value in host byte order and advance the internal cursor.
             * @tparam Ty Plain old data (POD) type to instantiate this parameter with.
             * @return Ty
             */
            template < typename Ty >
            Ty _read_pod( )
            {
                Ty pod { };

                _read_and_advance( sizeof( Ty ), reinterpret_cast< mp_u8* >( &pod ) );

                return pod;
            }

        public:
            /**
             * @brief Read a big-endian unsigned 8 byte value and advance the cursor by 8 bytes.
             * @return mp_u64
             */
            mp_u64 read_u64( )
            {
                return MPV_BSWAP64( _read_pod< mp_u64 > ( ) );
            }

            /**
             * @brief Read a big-endian unsigned 4 byte value and advance the cursor by 4 bytes.
             * @return mp_u32
             */
            mp_u32 read_u32( )
            {
                return MPV_BSWAP32( _read_pod< mp_u32 > ( ) );
            }

            /**
             * @brief Read a big-endian unsigned 2 byte value and advance the cursor by 2 bytes.
             * @return mp_u16
             */
            mp_u16 read_u16( )
            {
                return MPV_BSWAP16( _read_pod< mp_u16 > ( ) );
            }

            mp_u8 read_u8( )
            {
                return _read_pod< mp_u8 > ( );
            }

            mp_i64 read_i64( )
            {
                return static_cast< mp_i64 >( read_u64 ( ) );
            }

            mp_i32 read_i32( )
            {
                return static_cast< mp_i32 >( read_u32 ( ) );
            }

            mp_i16 read_i16( )
            {
                return static_cast< mp_i16 >( read_u16 ( ) );
            }

            mp_i8 read_i8( )
            {
                return static_cast< mp_i8 >( read_u8 ( ) );
            }

            /**
             * @brief Read exactly `count` bytes from the stream and advance the internal cursor by the same amount.
             * @param count Number of bytes to copy.
             * @param dst Buffer of at least `count` bytes.
             * @return `false` if fewer than `count` bytes remain
             */
            bool read( const mp_size count, mp_u8 *dst )
            {
                return _read_and_advance( count, dst );
            }
        };

        struct StreamWriter : Stream
        {
        private:
            std::vector< mp_u8 > buffer_ { };

        public:
            explicit StreamWriter( const mp_size reserve = 0 )
            {
                buffer_.reserve( reserve );
            }

            /* Disallow copies. */
            StreamWriter( const StreamWriter &other ) = delete;
            StreamWriter &operator=( const StreamWriter &other ) = delete;

            /**
             * @brief Bytes written so far.
             * @return const std::vector< mp_u8 > &
             */
            const std::vector< mp_u8 > &buffer( ) const
            {
                return buffer_;
            }

            /**
             * @brief Move the written bytes out and leave the stream empty.
             * @return std::vector< mp_u8 >
             */
            std::vector< mp_u8 > release( )
            {
                std::vector< mp_u8 > out { };
                out.swap( buffer_ );

                clear ( );

                return out;
            }

            /*
             * @brief Drop everything written and reset the cursor
             */
            void clear( )
            {
                buffer_.clear ( );
                position_ = 0;
                stream_size_ = 0;
            }

            /**
             * @brief Write a plain old data (POD) value in host byte order and advance the internal cursor.
             * @tparam Ty Plain old data (POD) type to instantiate this parameter with.
             * @param value Value to write to the stream.
             */
            template < typename Ty >
            void write_pod( Ty value )
            {
                Ty pod { value };

                _write_and_advance(
                    sizeof( Ty ),
                    reinterpret_cast< const mp_u8* >( &pod )
                );
            }

        private:
            /**
             * @brief The core of the `StreamWriter` interface. Appends `count` bytes from `src` to the byte stream.
             * @param count Number of bytes in `src` to write into the stream.
             * @param src Buffer of at least `count` bytes to copy from.
             */
            void _write_and_advance( const mp_size count, const mp_u8 *src )
            {
                if ( !count || !src )
                {
                    return;
                }

                buffer_.insert( buffer_.end ( ), src, src + count );

                position_ += count;
                stream_size_ = buffer_.size ( );
            }

        public:
            /**
             * @brief Write an unsigned 8 byte value in big-endian order and advance the cursor by 8.
             * @param value Unsigned 8 byte value to write to the stream
             * @return StreamWriter&
             */
            StreamWriter &write_u64( const mp_u64 value )
            {
                write_pod< mp_u64 >( MPV_BSWAP64( value ) );
                return *this;
            }

            /**
             * @brief Write an unsigned 4 byte value in big-endian order and advance the cursor by 4.
             * @param value Unsigned 4 byte value to write to the stream
             * @return StreamWriter&
             */
            StreamWriter &write_u32( const mp_u32 value )
            {
                write_pod< mp_u32 >( MPV_BSWAP32( value ) );
                return *this;
            }

            /**
             * @brief Write an unsigned 2 byte value in big-endian order and advance the cursor by 2.
             * @param value Unsigned 2 byte value to write to the stream
             * @return StreamWriter&
             */
            StreamWriter &write_u16( const mp_u16 value )
            {
                write_pod< mp_u16 >( MPV_BSWAP16( value ) );
                return *this;
            }

            StreamWriter &write_u8( const mp_u8 value )
            {
                write_pod< mp_u8 >( value );
                return *this;
            }

            /**
             * @brief Write a signed 8 byte value. The value is cast to its unsigned counterpart before the endianess change.
             * @param value Signed 8 byte value to write to the stream
             * @return StreamWriter&
             */
            StreamWriter &write_i64( const mp_i64 value )
            {
                return write_u64( static_cast< mp_u64 >( value ) );
            }

            StreamWriter &write_i32( const mp_i32 value )
            {
                return write_u32( static_cast< mp_u32 >( value ) );
            }

            StreamWriter &write_i16( const mp_i16 value )
            {
                return write_u16( static_cast< mp_u16 >( value ) );
            }

            StreamWriter &write_i8( const mp_i8 value )
            {
                return write_u8( static_cast< mp_u8 >( value ) );
            }

            /**
             * @brief Write `count` bytes to the stream and advance the internal cursor by the same amount.
             * @param count Size, in bytes, of the data pointed to by `src`.
             * @param src Buffer containing at least `count` bytes.
             * @return StreamWriter&
             */
            StreamWriter &write( const mp_size count, const mp_u8 *src )
            {
                _write_and_advance( count, src );
                return *this;
            }
        };
    }
}
