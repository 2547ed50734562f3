#include "encoder.h"
#include "../family.h"


namespace ldraw {
    placement encoder::encode(const rasterize::voxel &v) const {
        const family_traits &t = traits(_family);

        placement p;
        // LDraw's y axis points down, the grid layers grow upwards
        p._position = glm::vec3(
            v._pos.x * ldraw_unit_width,
            0.f - v._pos.y * t._layer_height,
            v._pos.z * ldraw_unit_depth
        );
        p._rotation = glm::mat3(1);

        const uint32_t rgb = _source ? _source(v) : v._rgb;
        p._color = _mode == direct
            ? color::from_rgb(rgb)
            : color::from_code(_quantizer.nearest_code(rgb));
        p._part = t._part;
        return p;
    }

    std::vector<placement> encoder::encode(const std::vector<rasterize::voxel> &voxels) const {
        std::vector<placement> res;
        res.reserve(voxels.size());
        for(const rasterize::voxel &v : voxels) {
            res.push_back(encode(v));
        }
        return res;
    }
};
