#pragma once

/*
 * mpvalue: MessagePack encoding and decoding of dynamically typed value trees.
 *
 * Usage:
 *  1) Build or receive an `mpv::Value`;
 *  2) `mpv::encode( value )` returns the MessagePack bytes;
 *  3) `mpv::parse( bytes )` returns an `mpv::DecodeResult`. Test it before reading `value`;
 *     on failure `error` says what went wrong and at which byte;
 *  4) Inspect the tree with `is_*( )` and take payloads out with `as_*( )`.
 */

#include "common.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "format.hpp"
#include "log.hpp"
#include "marker.hpp"
#include "options.hpp"
#include "stream.hpp"
#include "utf8.hpp"
#include "value.hpp"
