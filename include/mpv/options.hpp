#pragma once

#include "common.hpp"

/*
 * Compile time defaults. Define before including any mpv header to override.
 */
#ifndef MPV_DEFAULT_MAX_DEPTH
#define MPV_DEFAULT_MAX_DEPTH 256
#endif

#ifndef MPV_DEFAULT_COMPACT_FLOATS
#define MPV_DEFAULT_COMPACT_FLOATS true
#endif

namespace mpv
{
    struct DecodeOptions
    {
        /**
         * @brief Deepest container nesting accepted. A top-level array or map is depth 1;
         * scalars do not count. Decoding deeper input fails with `DecodeError::DepthExceeded`.
         */
        mp_u32 max_depth { MPV_DEFAULT_MAX_DEPTH };

        /**
         * @brief Accept bytes after the top-level value instead of failing with `DecodeError::TrailingData`.
         */
        bool allow_trailing_data { false };
    };

    struct EncodeOptions
    {
        /**
         * @brief Write a Float as float32 when narrowing and widening it again reproduces the exact bit
         * pattern. When `false` every Float is written as float64.
         */
        bool compact_floats { MPV_DEFAULT_COMPACT_FLOATS };
    };
}
