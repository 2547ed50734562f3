#pragma once

#include "glm_ext/glm_extensions.h"
#include "mesh/polyhedron.h"

#include <array>
#include <cfloat>
#include <cstdint>
#include <utility>
#include <vector>


namespace checks {
    constexpr float precision_bias = 100*FLT_EPSILON;

    namespace raycast {
        using span_t = std::pair<float, float>;

        //! distances (> 0) of all intersections of the ray with the given faces, ascending.
        //! faces are treated double sided.
        //! hits closer to each other than the precision bias are one crossing point:
        //! reported once if the faces there are crossed from the same side
        //! (a ray through an edge shared by two faces), dropped if the
        //! ray only grazes the surface (sides cancel out).
        //! relies on consistently wound faces
        std::vector<float> intersections(
            const glm::vec3 &pos,
            const glm::vec3 &dir,
            const mesh::polyhedron<float> &poly,
            const std::vector<uint32_t> &face_ids
        );

        //! same as above but tests every face of the mesh
        std::vector<float> intersections(
            const glm::vec3 &pos,
            const glm::vec3 &dir,
            const mesh::polyhedron<float> &poly
        );

        //! pairs sorted hits into (enter, exit) spans (parity rule)
        //! an unmatched trailing hit (open geometry) is dropped
        std::vector<span_t> solid_spans(const std::vector<float> &hits);
    };

    namespace distance {
        //! point of the (solid) triangle closest to p
        glm::vec3 closest_point(const glm::vec3 &p, const std::array<glm::vec3, 3> &tri);

        inline float squared(const glm::vec3 &p, const std::array<glm::vec3, 3> &tri) {
            const glm::vec3 d = p - closest_point(p, tri);
            return glm::dot(d, d);
        }
    };
};
