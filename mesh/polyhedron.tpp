namespace mesh {
    template<typename base_t>
    void polyhedron<base_t>::scale(const base_t factor) {
        for(size_t i = 0; i < _vertices.size(); i++) {
            _vertices[i] *= factor;
        }
    }

    template<typename base_t>
    void polyhedron<base_t>::translate(const vec_t &offset) {
        for(size_t i = 0; i < _vertices.size(); i++) {
            _vertices[i] += offset;
        }
    }

    template<typename base_t>
    void polyhedron<base_t>::compute_normals() {
        constexpr bool is_flt = std::is_floating_point<base_t>::value;
        static_assert(is_flt, "compute_normals(): type must be floating point");

        _normals.assign(_vertices.size(), vec_t(0));

        // the unnormalized cross product is twice the face area,
        // so summing it weights every face by its area
        for(const face<index_t> &f : _indices._buffer) {
            const vec_t &v1 = _vertices[f[0]];
            const vec_t &v2 = _vertices[f[1]];
            const vec_t &v3 = _vertices[f[2]];
            const vec_t n = glm::cross(v2 - v1, v3 - v1);
            _normals[f[0]] += n;
            _normals[f[1]] += n;
            _normals[f[2]] += n;
        }

        for(vec_t &n : _normals) {
            const base_t len = glm::length(n);
            n = len > base_t(0) ? n / len : vec_t(0);
        }
    }

    template<typename base_t>
    bbox<base_t> polyhedron<base_t>::bounding_box() const {
        bbox<base_t> box;
        for(const face<index_t> &f : _indices._buffer) {
            box.extend(_vertices[f[0]]);
            box.extend(_vertices[f[1]]);
            box.extend(_vertices[f[2]]);
        }
        return box;
    }

    template<typename base_t>
    glm::vec<3, base_t> polyhedron<base_t>::dim() const {
        return bounding_box().size();
    }
};
