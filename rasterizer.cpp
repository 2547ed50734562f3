#include "rasterizer.h"
#include "checks.h"
#include "family.h"
#include "timer.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>


namespace {
    //! number of cells of edge `unit` covering `extent`.
    //! float noise in extent / unit must not add a column
    int cell_count(const float extent, const float unit) {
        const double cells = std::ceil((double)extent / unit - rasterize::grid_tolerance);
        return (int)std::min(std::max(0.0, cells), (double)std::numeric_limits<int>::max());
    }
};

namespace rasterize {
    double grid_t::estimated_cells() const {
        if(empty() || !(_unit_height > 0)) return 0;
        const double layers = std::ceil((double)_box.size().y / _unit_height) + 1;
        return (double)_x_count * (double)_z_count * std::max(1.0, layers);
    }

    grid_t make_grid(const mesh::bbox<float> &box, const int resolution, const block_family family) {
        grid_t grid;
        grid._box = box;

        const glm::vec3 size = box.size();
        // align the grid to the longer horizontal axis so that the footprint cells stay square
        const float max_dim = std::max(size.x, size.z);
        if(max_dim <= min_footprint || resolution <= 0) {
            return grid;
        }

        grid._unit_size = max_dim / resolution;
        grid._unit_height = grid._unit_size * traits(family)._height_ratio;
        grid._x_count = cell_count(size.x, grid._unit_size);
        grid._z_count = cell_count(size.z, grid._unit_size);
        return grid;
    }

    scanline::scanline(const mesh::polyhedron<float> &poly, const int resolution, const block_family family, const uint32_t rgb)
        : _polyhedron(poly)
        , _grid(make_grid(poly.bounding_box(), resolution, family))
        , _rgb(rgb)
    {
        if(!_grid.empty()) {
            prepare_column_buffer();
        }
    }

    void scanline::prepare_column_buffer() {
        benchmark::timer tmp("prepare_column_buffer()");

        _column_buffer = buffer2d<std::vector<id_t>>(_grid._x_count, _grid._z_count);
        const glm::vec3 &bmin = _grid._box._min;
        const float u = _grid._unit_size;

        size_t num_elems = 0;
        for(size_t face_id = 0; face_id < _polyhedron.num_faces(); face_id++) {
            const auto f = _polyhedron.corners(face_id);

            // faces parallel to the rays are never hit
            const glm::vec3 n = glm::cross(f[1] - f[0], f[2] - f[0]);
            if(std::abs(n.y) <= FLT_EPSILON) continue;

            const glm::vec2 lmin = glm::min(glm::min(f[0].xz(), f[1].xz()), f[2].xz());
            const glm::vec2 lmax = glm::max(glm::max(f[0].xz(), f[1].xz()), f[2].xz());

            // column centers are at bmin + (i + 0.5) * u,
            // the range is widened by one cell against rounding
            const glm::ivec2 from = glm::floor((lmin - bmin.xz()) / u - 0.5f);
            const glm::ivec2 to = glm::ceil((lmax - bmin.xz()) / u - 0.5f);

            const int x0 = constrain(0, _grid._x_count-1, from.x);
            const int x1 = constrain(0, _grid._x_count-1, to.x);
            const int z0 = constrain(0, _grid._z_count-1, from.y);
            const int z1 = constrain(0, _grid._z_count-1, to.y);
            for(int x = x0; x <= x1; x++)
            for(int z = z0; z <= z1; z++) {
                _column_buffer[x][z].push_back((id_t)face_id);
                num_elems++;
            }
        }
        std::cout << "search buffer holds " << num_elems << " face references" << std::endl;
    }

    std::vector<int> scanline::sample_column(const int i, const int k) const {
        const glm::vec3 &bmin = _grid._box._min;
        const float u = _grid._unit_size;
        const float h = _grid._unit_height;

        const glm::vec3 origin(bmin.x + (i + 0.5f) * u, bmin.y - ray_margin, bmin.z + (k + 0.5f) * u);
        const glm::vec3 up(0, 1, 0);

        const std::vector<float> hits = checks::raycast::intersections(origin, up, _polyhedron, _column_buffer[i][k]);

        std::vector<int> layers;
        for(const checks::raycast::span_t &s : checks::raycast::solid_spans(hits)) {
            const float y_enter = origin.y + s.first;
            const float y_exit = origin.y + s.second;

            // layer j is solid if its center bmin.y + (j + 0.5) * h lies within [enter, exit]
            const int j_start = (int)std::ceil((y_enter - bmin.y) / h - 0.5f);
            const int j_end = (int)std::floor((y_exit - bmin.y) / h - 0.5f);
            for(int j = std::max(0, j_start); j <= j_end; j++) {
                layers.push_back(j);
            }
        }
        return layers;
    }

    voxel_arr scanline::rasterize() const {
        voxel_arr res;
        res._unit_size = _grid._unit_size;
        res._unit_height = _grid._unit_height;
        if(_grid.empty()) {
            return res;
        }

        benchmark::timer tmp("rasterize()");

        // every column only reads the mesh, so they can run concurrently
        buffer2d<std::vector<int>> columns(_grid._x_count, _grid._z_count);
#pragma omp parallel for
        for(int i = 0; i < _grid._x_count; i++)
        for(int k = 0; k < _grid._z_count; k++) {
            columns[i][k] = sample_column(i, k);
        }

        int num_layers = 0;
        for(int i = 0; i < _grid._x_count; i++)
        for(int k = 0; k < _grid._z_count; k++) {
            for(const int j : columns[i][k]) {
                res._voxels.push_back({ glm::ivec3(i, j, k), _rgb });
                num_layers = std::max(num_layers, j+1);
            }
        }
        res._arr_dim = glm::ivec3(_grid._x_count, num_layers, _grid._z_count);

        std::cout << "created " << res._voxels.size() << " voxels" << std::endl;
        return res;
    }
};
