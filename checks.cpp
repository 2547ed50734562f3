#include "checks.h"

#include <algorithm>
#include <cmath>


namespace {
    //! distance along the ray and the side the face is crossed from
    //! (+1: along the face normal, -1: against it)
    struct hit_t {
        float _distance;
        int _sign;
    };

    void collect_hit(
        const glm::vec3 &pos,
        const glm::vec3 &dir,
        const std::array<glm::vec3, 3> &face,
        std::vector<hit_t> &out_hits)
    {
        glm::vec2 bary_pos(0);
        float distance = 0;
        const bool is_inters = glm::intersectRayTriangle(
            pos,
            dir,
            face[0],
            face[1],
            face[2],
            bary_pos,
            distance
        );

        // intersectRayTriangle behaves like a line intersection,
        // so hits behind the origin have to be removed here
        if(is_inters && distance > 0) {
            const float side = glm::dot(glm::cross(face[1] - face[0], face[2] - face[0]), dir);
            out_hits.push_back({ distance, side < 0 ? -1 : 1 });
        }
    }

    //! hits within the precision bias of each other form one crossing point.
    //! the point counts once if the surface is crossed there (net side != 0),
    //! and not at all if the ray only touches it (an edge or vertex on the silhouette)
    std::vector<float> merge_crossings(std::vector<hit_t> &hits) {
        std::sort(hits.begin(), hits.end(), [](const hit_t &a, const hit_t &b) {
            return a._distance < b._distance;
        });

        std::vector<float> res;
        for(size_t first = 0; first < hits.size();) {
            const float d = hits[first]._distance;
            const float bias = checks::precision_bias * std::max(1.f, std::abs(d));

            int net_side = 0;
            size_t last = first;
            for(; last < hits.size() && hits[last]._distance - d < bias; last++) {
                net_side += hits[last]._sign;
            }
            if(net_side != 0) {
                res.push_back(d);
            }
            first = last;
        }
        return res;
    }
};

namespace checks {
    namespace raycast {
        std::vector<float> intersections(
            const glm::vec3 &pos,
            const glm::vec3 &dir,
            const mesh::polyhedron<float> &poly,
            const std::vector<uint32_t> &face_ids)
        {
            std::vector<hit_t> hits;
            for(const uint32_t face_id : face_ids) {
                collect_hit(pos, dir, poly.corners(face_id), hits);
            }
            return merge_crossings(hits);
        }

        std::vector<float> intersections(
            const glm::vec3 &pos,
            const glm::vec3 &dir,
            const mesh::polyhedron<float> &poly)
        {
            std::vector<hit_t> hits;
            for(size_t face_id = 0; face_id < poly.num_faces(); face_id++) {
                collect_hit(pos, dir, poly.corners(face_id), hits);
            }
            return merge_crossings(hits);
        }

        std::vector<span_t> solid_spans(const std::vector<float> &hits) {
            std::vector<span_t> res;
            for(size_t m = 0; m + 1 < hits.size(); m += 2) {
                res.push_back({ hits[m], hits[m+1] });
            }
            return res;
        }
    };

    namespace distance {
        // Voronoi region test, see Ericson: Real-Time Collision Detection, 5.1.5
        glm::vec3 closest_point(const glm::vec3 &p, const std::array<glm::vec3, 3> &tri) {
            const glm::vec3 &a = tri[0];
            const glm::vec3 &b = tri[1];
            const glm::vec3 &c = tri[2];
            const glm::vec3 ab = b - a;
            const glm::vec3 ac = c - a;

            const glm::vec3 ap = p - a;
            const float d1 = glm::dot(ab, ap);
            const float d2 = glm::dot(ac, ap);
            if(d1 <= 0 && d2 <= 0) return a;

            const glm::vec3 bp = p - b;
            const float d3 = glm::dot(ab, bp);
            const float d4 = glm::dot(ac, bp);
            if(d3 >= 0 && d4 <= d3) return b;

            const float vc = d1*d4 - d3*d2;
            if(vc <= 0 && d1 >= 0 && d3 <= 0) {
                return a + ab * (d1 / (d1 - d3));
            }

            const glm::vec3 cp = p - c;
            const float d5 = glm::dot(ab, cp);
            const float d6 = glm::dot(ac, cp);
            if(d6 >= 0 && d5 <= d6) return c;

            const float vb = d5*d2 - d1*d6;
            if(vb <= 0 && d2 >= 0 && d6 <= 0) {
                return a + ac * (d2 / (d2 - d6));
            }

            const float va = d3*d6 - d5*d4;
            if(va <= 0 && (d4 - d3) >= 0 && (d5 - d6) >= 0) {
                return b + (c - b) * ((d4 - d3) / ((d4 - d3) + (d5 - d6)));
            }

            // inside the face
            const float denom = 1.f / (va + vb + vc);
            return a + ab * (vb * denom) + ac * (vc * denom);
        }
    };
};
