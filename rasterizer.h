#pragma once

#include "glm_ext/glm_extensions.h"

#include "mesh/polyhedron.h"
#include "buffer.h"
#include "enums.h"

#include <cstdint>
#include <tuple>
#include <vector>

namespace rasterize {
    //! rays start this far below the mesh
    constexpr float ray_margin = 0.5f;
    //! footprints smaller than this are not sampled at all
    constexpr float min_footprint = 0.001f;
    //! fraction of a cell an axis may overshoot before another column is added
    constexpr double grid_tolerance = 1e-4;

    struct voxel {
        glm::ivec3 _pos;    // i, k: footprint column; j: layer
        uint32_t _rgb = 0;  // 0xRRGGBB

        friend bool operator< (const voxel &lhs, const voxel &rhs) {
            return std::make_tuple(lhs._pos.x, lhs._pos.y, lhs._pos.z, lhs._rgb) < std::make_tuple(rhs._pos.x, rhs._pos.y, rhs._pos.z, rhs._rgb);
        }
        friend bool operator== (const voxel &lhs, const voxel &rhs) {
            return lhs._pos == rhs._pos && lhs._rgb == rhs._rgb;
        }
    };

    //! sampling layout derived from the mesh bbox
    struct grid_t {
        int _x_count = 0;
        int _z_count = 0;
        float _unit_size = 0;   // footprint edge length (mesh units)
        float _unit_height = 0; // layer height (mesh units)
        mesh::bbox<float> _box;

        bool empty() const {
            return _x_count <= 0 || _z_count <= 0;
        }
        //! upper bound of sampled cells, used for capacity checks.
        //! floating point so that huge resolutions cannot wrap around
        double estimated_cells() const;
    };

    grid_t make_grid(const mesh::bbox<float> &box, const int resolution, const block_family family);

    struct voxel_arr {
        glm::ivec3 _arr_dim = glm::ivec3(0); // columns in x, layers, columns in z
        float _unit_size = 0;
        float _unit_height = 0;
        std::vector<voxel> _voxels;          // ordered by column (i, k), then layer
    };

    //! generates a solid voxel set from a closed polyhedron
    //! casts one vertical ray per footprint column and fills between
    //! alternating enter/exit hits.
    //! faces are sorted into per column search buffers first,
    //! so a ray only tests faces whose footprint covers it
    class scanline {
        using id_t = mesh::polyhedron<float>::index_t;

        mesh::polyhedron<float> _polyhedron;
        grid_t _grid;
        uint32_t _rgb;
        buffer2d<std::vector<id_t>> _column_buffer;

        void prepare_column_buffer();
        std::vector<int> sample_column(const int i, const int k) const;

    public:
        //! `resolution` is the number of columns along the longer horizontal axis
        //! `rgb` tags every produced voxel
        scanline(const mesh::polyhedron<float> &poly, const int resolution, const block_family family, const uint32_t rgb = 0xFFFFFF);

        const grid_t &grid() const {
            return _grid;
        }

        voxel_arr rasterize() const;
    };
};
