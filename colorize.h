#pragma once

#include "glm_ext/glm_extensions.h"

#include "mesh/polyhedron.h"
#include "rasterizer.h"
#include "buffer.h"

#include <cstdint>
#include <vector>

namespace colorize {
    //! colors a voxel like the mesh face closest to the voxel center.
    //! faces are sorted into per column buckets by their footprint,
    //! the search grows ring by ring around the voxel's column until no
    //! unvisited face can be closer than the best one found.
    //! voxels get `fallback_rgb` if the mesh carries no face colors
    //! or the nearest face has none
    class nearest_face {
        using id_t = mesh::polyhedron<float>::index_t;

        mesh::polyhedron<float> _polyhedron;
        rasterize::grid_t _grid;
        uint32_t _fallback_rgb;
        buffer2d<std::vector<id_t>> _buckets;

        void prepare_buckets();

    public:
        //! `grid` is the layout the voxels were sampled on
        nearest_face(const mesh::polyhedron<float> &poly, const rasterize::grid_t &grid, const uint32_t fallback_rgb);

        //! mesh space center of cell (i, j, k)
        glm::vec3 center(const glm::ivec3 &pos) const;

        //! index of the face closest to p, searched from column (i, k).
        //! the lower index wins on equal distance, -1 without faces
        long nearest(const glm::vec3 &p, const int i, const int k) const;

        uint32_t operator()(const rasterize::voxel &v) const;
    };
};
