#pragma once

#define GLM_FORCE_SWIZZLE
#define GLM_ENABLE_EXPERIMENTAL

#include <glm/glm.hpp>
#include <glm/gtx/intersect.hpp>
#include <glm/gtx/component_wise.hpp>

#include <cmath>
#include <tuple>


//! strict weak ordering for glm vectors (std::map keys)
struct compare_glm_vec3 {
    template<typename vec_t>
    bool operator() (const vec_t& lhs, const vec_t& rhs) const {
        return std::make_tuple(lhs.x, lhs.y, lhs.z) < std::make_tuple(rhs.x, rhs.y, rhs.z);
    }
};

template <typename base_t>
base_t constrain(const base_t &min, const base_t &max, const base_t &val) {
    return val < min ? min : val > max ? max : val;
}

//! true if no component is NaN or +/-Inf
template <typename base_t>
bool is_finite(const glm::vec<3, base_t> &v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}
