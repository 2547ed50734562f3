#pragma once

#include "../glm_ext/glm_extensions.h"
#include "bbox.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <type_traits>
#include <vector>


namespace mesh {
    //! triangle made of 3 vertex indices
    //! the winding order is kept, the normals depend on it
    template <typename index_t>
    struct face {
        std::array<index_t, 3> _ids;

        index_t &operator [] (const size_t id) {
            assert(id < 3);
            return _ids[id];
        }
        const index_t &operator [] (const size_t id) const {
            assert(id < 3);
            return _ids[id];
        }

        //! two or more corners share a vertex
        bool collapsed() const {
            return _ids[0] == _ids[1] || _ids[1] == _ids[2] || _ids[0] == _ids[2];
        }

        face() {
            _ids = { 0 };
        }
        face(index_t v1, index_t v2, index_t v3) {
            _ids = { v1, v2, v3 };
        }
    };

    template<typename index_t>
    struct index_buffer {
        std::vector<face<index_t>> _buffer;    // face indices

        face<index_t> &operator [] (const size_t id) {
            assert(id < _buffer.size());
            return _buffer[id];
        }
        const face<index_t> &operator [] (const size_t id) const {
            assert(id < _buffer.size());
            return _buffer[id];
        }

        void add(const face<index_t> &f) {
            _buffer.push_back(f);
        }
        size_t size() const {
            return _buffer.size();
        }
    };

    //! Yet another index based mesh
    //! Each vertex is stored exactly once, faces refer to it by index
    template<typename base_t>
    class polyhedron {
    public:
        using index_t = uint32_t;
        using vec_t = glm::vec<3, base_t>;
        using arr_t = std::vector<vec_t>;

        arr_t _vertices; // floating point vertex representation
        arr_t _normals;  // per vertex, same size as _vertices (or empty)
        std::vector<glm::vec<2, base_t>> _uvs; // per vertex (or empty)
        std::vector<uint32_t> _face_colors;    // per face 0xRRGGBB or no_color (or empty)
        index_buffer<index_t> _indices; // face indices

        //! uniform scale around the origin
        void scale(const base_t factor);

        void translate(const vec_t &offset);

        //! area weighted vertex normals from the current topology
        void compute_normals();

        //! estimates the boundingbox (slow)
        bbox<base_t> bounding_box() const;
        vec_t dim() const;

        size_t num_faces() const {
            return _indices.size();
        }
        bool empty() const {
            return _indices.size() == 0;
        }
        bool colored() const {
            return !empty() && _face_colors.size() == num_faces();
        }

        //! corner positions of a face
        std::array<vec_t, 3> corners(const size_t face_id) const {
            const face<index_t> &f = _indices[face_id];
            return { _vertices[f[0]], _vertices[f[1]], _vertices[f[2]] };
        }
    };
};

#include "polyhedron.tpp"
