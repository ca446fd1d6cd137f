// see LICENSE.md for license.
#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <typeinfo>
#include <string>
#include <vector>

#define ZEROCOMPRESS_DEFAULT_MARKER_BASE       0xF1
#define ZEROCOMPRESS_DEFAULT_MIN_RUN_LENGTH    3
#define ZEROCOMPRESS_DEFAULT_MAX_OUTPUT_SIZE   (1 << 26)

#ifndef RESTRICT
#define RESTRICT
#endif

#define ZEROCOMPRESS_INLINE inline __attribute__((always_inline))
#define ZEROCOMPRESS_MEMCPY  __builtin_memcpy

#define ZEROCOMPRESS_LIKELY(x)  __builtin_expect(!!(x), 1)
#define ZEROCOMPRESS_UNLIKELY(x)  __builtin_expect(!!(x), 0)

#ifdef ZEROCOMPRESS_SHOW
#define ZEROCOMPRESS_SHOW_IN(IN, SZ)                                    \
    fprintf(stderr, "%s::%s(%u): in(%p, %u)\n", typeid(*this).name(),   \
            __FUNCTION__, __LINE__, (const void *)(IN), (unsigned)(SZ))
#define ZEROCOMPRESS_SHOW_OUT(OUT, SZ)                                  \
    fprintf(stderr, "%s::%s(%u): out(%p, %u)\n", typeid(*this).name(),  \
            __FUNCTION__, __LINE__, (const void *)(OUT), (unsigned)(SZ))
#define ZEROCOMPRESS_SHOW_STATE(LABEL, STATE)                           \
    fprintf(stderr, "%s(%u/%s): %s\n", __FUNCTION__, __LINE__, #LABEL,  \
            state_render(STATE).c_str())
#else
#define ZEROCOMPRESS_SHOW_IN(IN, SZ)
#define ZEROCOMPRESS_SHOW_OUT(OUT, SZ)
#define ZEROCOMPRESS_SHOW_STATE(LABEL, STATE)
#endif

#define ZEROCOMPRESS_ENUM_RENDER_PROTOTYPE(ENUM_TYPE)                   \
    ZEROCOMPRESS_INLINE std::string ENUM_TYPE##_render(const ENUM_TYPE##_t ENUM_TYPE)
#define ZEROCOMPRESS_ENUM_RENDER_VALUE(ENUM_TYPE, ENUM_VALUE)           \
    case ENUM_TYPE##_##ENUM_VALUE: return #ENUM_TYPE "_" #ENUM_VALUE

#define ZEROCOMPRESS_ENUM_RENDER4(ENUM_TYPE, ENUM_VALUE1, ENUM_VALUE2, ENUM_VALUE3, ENUM_VALUE4) \
    ZEROCOMPRESS_ENUM_RENDER_PROTOTYPE(ENUM_TYPE) {                     \
        switch (ENUM_TYPE) {                                            \
            ZEROCOMPRESS_ENUM_RENDER_VALUE(ENUM_TYPE, ENUM_VALUE1);     \
            ZEROCOMPRESS_ENUM_RENDER_VALUE(ENUM_TYPE, ENUM_VALUE2);     \
            ZEROCOMPRESS_ENUM_RENDER_VALUE(ENUM_TYPE, ENUM_VALUE3);     \
            ZEROCOMPRESS_ENUM_RENDER_VALUE(ENUM_TYPE, ENUM_VALUE4);     \
        default: return #ENUM_TYPE "_???"; } }

namespace zerocompress {
    // wire format version written in front of every compressed payload.
    const uint8_t format_version = 1;

    typedef std::vector<uint8_t> bytes_t;

    typedef enum {
        stage_selector = 0,
        stage_address = 1,
        stage_pattern = 2,
        stage_zero_run = 3,
    } stage_t;
    ZEROCOMPRESS_ENUM_RENDER4(stage, selector, address, pattern, zero_run);
    const size_t stage_count = 4;
    // stages backed by a dictionary.
    const size_t dictionary_stage_count = 3;

    typedef enum {
        state_ok = 0,                    // Everything went alright
        state_error_invalid_input,       // Malformed payload, header, record or options
        state_error_dictionary_miss,     // Index without a dictionary entry
        state_error_version_mismatch     // Unsupported format version, payload returned as is
    } state_t;
    ZEROCOMPRESS_ENUM_RENDER4(state, ok, error_invalid_input, error_dictionary_miss,
                              error_version_mismatch);
}
