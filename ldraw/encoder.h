#pragma once

#include "placement.h"
#include "../enums.h"
#include "../palette/quantizer.h"
#include "../rasterizer.h"

#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace ldraw {
    //! voxel -> 0xRRGGBB
    using color_source = std::function<uint32_t(const rasterize::voxel &)>;

    //! turns an occupancy set into 1x1 part placements
    //! only 1x1 parts are used, they cover every cell without a packing pass
    class encoder {
        const palette::quantizer &_quantizer;
        block_family _family;
        color_mode _mode;
        color_source _source;

    public:
        //! without a color source every voxel keeps the color it was tagged with
        encoder(const palette::quantizer &quantizer, const block_family family, const color_mode mode = quantized, color_source source = color_source())
            : _quantizer(quantizer)
            , _family(family)
            , _mode(mode)
            , _source(std::move(source))
        {}

        //! voxel (i, j, k) -> (i * 20, -j * layer height, k * 20)
        placement encode(const rasterize::voxel &v) const;
        std::vector<placement> encode(const std::vector<rasterize::voxel> &voxels) const;
    };
};
