#include "colorize.h"
#include "checks.h"
#include "timer.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>


namespace colorize {
    nearest_face::nearest_face(const mesh::polyhedron<float> &poly, const rasterize::grid_t &grid, const uint32_t fallback_rgb)
        : _polyhedron(poly)
        , _grid(grid)
        , _fallback_rgb(fallback_rgb)
    {
        if(!_polyhedron.empty() && !_grid.empty()) {
            prepare_buckets();
        }
    }

    void nearest_face::prepare_buckets() {
        benchmark::timer tmp("nearest_face::prepare_buckets()");

        _buckets = buffer2d<std::vector<id_t>>(_grid._x_count, _grid._z_count);
        const glm::vec3 &bmin = _grid._box._min;
        const float u = _grid._unit_size;

        // unlike the ray buffers vertical faces count here, they can be the closest ones
        for(size_t face_id = 0; face_id < _polyhedron.num_faces(); face_id++) {
            const auto f = _polyhedron.corners(face_id);
            const glm::vec2 lmin = glm::min(glm::min(f[0].xz(), f[1].xz()), f[2].xz());
            const glm::vec2 lmax = glm::max(glm::max(f[0].xz(), f[1].xz()), f[2].xz());

            const glm::ivec2 from = glm::floor((lmin - bmin.xz()) / u);
            const glm::ivec2 to = glm::floor((lmax - bmin.xz()) / u);

            const int x0 = constrain(0, _grid._x_count-1, from.x);
            const int x1 = constrain(0, _grid._x_count-1, to.x);
            const int z0 = constrain(0, _grid._z_count-1, from.y);
            const int z1 = constrain(0, _grid._z_count-1, to.y);
            for(int x = x0; x <= x1; x++)
            for(int z = z0; z <= z1; z++) {
                _buckets[x][z].push_back((id_t)face_id);
            }
        }
    }

    glm::vec3 nearest_face::center(const glm::ivec3 &pos) const {
        const glm::vec3 &bmin = _grid._box._min;
        return glm::vec3(
            bmin.x + (pos.x + 0.5f) * _grid._unit_size,
            bmin.y + (pos.y + 0.5f) * _grid._unit_height,
            bmin.z + (pos.z + 0.5f) * _grid._unit_size
        );
    }

    long nearest_face::nearest(const glm::vec3 &p, const int i, const int k) const {
        if(_grid.empty() || _polyhedron.empty()) {
            return -1;
        }

        float best_dist = std::numeric_limits<float>::infinity();
        long best_id = -1;
        auto visit = [&](const int x, const int z) {
            for(const id_t face_id : _buckets[x][z]) {
                const float d = checks::distance::squared(p, _polyhedron.corners(face_id));
                if(d < best_dist || (d == best_dist && (long)face_id < best_id)) {
                    best_dist = d;
                    best_id = (long)face_id;
                }
            }
        };

        const int max_ring = std::max(_grid._x_count, _grid._z_count);
        for(int r = 0; r <= max_ring; r++) {
            // cells at chebyshev distance r from (i, k)
            for(int x = i - r; x <= i + r; x++)
            for(int z = k - r; z <= k + r; z++) {
                if(std::max(std::abs(x - i), std::abs(z - k)) != r) continue;
                if(x < 0 || z < 0 || x >= _grid._x_count || z >= _grid._z_count) continue;
                visit(x, z);
            }

            // faces outside the visited square are at least (r + 0.5) cells away
            const float reach = (r + 0.5f) * _grid._unit_size;
            if(best_id >= 0 && best_dist <= reach * reach) {
                break;
            }
        }
        return best_id;
    }

    uint32_t nearest_face::operator()(const rasterize::voxel &v) const {
        if(!_polyhedron.colored()) {
            return _fallback_rgb;
        }

        const int i = constrain(0, std::max(0, _grid._x_count-1), v._pos.x);
        const int k = constrain(0, std::max(0, _grid._z_count-1), v._pos.z);
        const long face_id = nearest(center(v._pos), i, k);
        if(face_id < 0 || _polyhedron._face_colors[face_id] == mesh::no_color) {
            return _fallback_rgb;
        }
        return _polyhedron._face_colors[face_id];
    }
};
