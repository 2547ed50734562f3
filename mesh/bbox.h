#pragma once

#include "../glm_ext/glm_extensions.h"

#include <limits>

namespace mesh {
    template<typename base_t>
    struct bbox {
        using vec_t = glm::vec<3, base_t>;

        vec_t _min = vec_t(std::numeric_limits<base_t>::max());
        vec_t _max = vec_t(-std::numeric_limits<base_t>::max());

        //! For iterating over vertex lists
        //! pass a vertex and calculate the bounding box on the fly
        void extend(const vec_t &v) {
            _min = glm::min(_min, v);
            _max = glm::max(_max, v);
        }

        bool empty() const {
            return glm::any(glm::greaterThan(_min, _max));
        }

        vec_t size() const {
            return empty() ? vec_t(0) : _max - _min;
        }

        vec_t center() const {
            return (_min + _max) / base_t(2);
        }

        base_t diagonal() const {
            return glm::length(size());
        }
    };
};
