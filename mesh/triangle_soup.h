#pragma once

#include "../glm_ext/glm_extensions.h"

#include <cstdint>
#include <vector>

namespace mesh {
    //! marks a vertex or face without color information
    constexpr uint32_t no_color = 0xFFFFFFFF;

    //! rgb channels in [0, 1] -> 0xRRGGBB
    inline uint32_t pack_rgb(const glm::vec3 &rgb) {
        const glm::ivec3 c = glm::ivec3(glm::round(glm::clamp(rgb, 0.f, 1.f) * 255.f));
        return (uint32_t)(c.r << 16 | c.g << 8 | c.b);
    }

    //! channel wise mean of the colored corners, no_color if none is colored
    inline uint32_t face_color(const uint32_t c1, const uint32_t c2, const uint32_t c3) {
        uint32_t sum[3] = { 0, 0, 0 };
        uint32_t n = 0;
        for(const uint32_t c : { c1, c2, c3 }) {
            if(c == no_color) continue;
            sum[0] += (c >> 16) & 0xFF;
            sum[1] += (c >> 8) & 0xFF;
            sum[2] += c & 0xFF;
            n++;
        }
        if(n == 0) return no_color;
        return (sum[0] / n) << 16 | (sum[1] / n) << 8 | (sum[2] / n);
    }

    //! raw triangle data as delivered by the importers
    //! without indices every 3 consecutive positions form a triangle,
    //! with indices every 3 consecutive indices do.
    //! normals, uvs and colors are optional but if present run parallel to _positions
    struct triangle_soup {
        std::vector<glm::vec3> _positions;
        std::vector<glm::vec3> _normals;
        std::vector<glm::vec2> _uvs;
        std::vector<uint32_t> _colors; // 0xRRGGBB or no_color
        std::vector<uint32_t> _indices;

        bool indexed() const {
            return !_indices.empty();
        }

        size_t num_faces() const {
            return indexed() ? _indices.size() / 3 : _positions.size() / 3;
        }

        void add_face(const glm::vec3 &v1, const glm::vec3 &v2, const glm::vec3 &v3) {
            _positions.push_back(v1);
            _positions.push_back(v2);
            _positions.push_back(v3);
        }

        void clear() {
            _positions.clear();
            _normals.clear();
            _uvs.clear();
            _colors.clear();
            _indices.clear();
        }
    };
};
