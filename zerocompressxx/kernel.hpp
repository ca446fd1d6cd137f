// see LICENSE.md for license.
#pragma once

#include "zerocompressxx/body.hpp"

namespace zerocompress {
    // kernel: one reversible stage of the pipeline.
    class kernel_t {
    public:
        inline kernel_t(const uint_fast64_t output_limit): output_limit(output_limit) {}
        virtual ~kernel_t() {}

        virtual stage_t stage(void) const = 0;
        // width this stage adds to the layout once it fired.
        virtual uint_fast8_t layout_width(void) const = 0;

        virtual state_t encode(const layout_t &layout, const uint8_t *in,
                               const uint_fast64_t szin, bytes_t &out,
                               uint_fast64_t *items) const = 0;
        virtual state_t decode(const layout_t &layout, const uint8_t *in,
                               const uint_fast64_t szin, bytes_t &out) const = 0;
    protected:
        // decoded bodies never grow past this many bytes.
        uint_fast64_t output_limit;

        inline bool exceeds(const bytes_t &out, const uint_fast64_t more) const
        {   return out.size() > output_limit || more > output_limit - out.size(); }
    };
}
