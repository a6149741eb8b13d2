// vim: expandtab:ts=2:sw=2

#pragma once

#include <cstdint>

typedef uint8_t u8;
typedef uint16_t u16;
typedef uint32_t u32;
typedef uint64_t u64;

typedef int8_t i8;
typedef int16_t i16;
typedef int32_t i32;
typedef int64_t i64;

typedef float f32;
typedef double f64;

/*!
 * @brief Absolute GPU clock cycle count since the engine was created. Never
 *        wraps within the lifetime of an emulation session.
 */
typedef u64 cycles_t;

/*! @brief Sentinel for "no timestamp". */
static constexpr cycles_t NO_CYCLE = UINT64_MAX;
