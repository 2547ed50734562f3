#pragma once

#include "../glm_ext/glm_extensions.h"
#include "../mesh/triangle_soup.h"

#include <cstdint>
#include <istream>
#include <limits>
#include <string>
#include <vector>

namespace stl {
    #pragma pack(push, 1)
    struct face {
        glm::vec3 _norm;
        glm::vec3 _vert_1;
        glm::vec3 _vert_2;
        glm::vec3 _vert_3;
        uint16_t _attribute = 0;

        face() = default;
        face(const glm::vec3 &n, const glm::vec3 &p1, const glm::vec3 &p2, const glm::vec3 &p3) {
            if(glm::length(n) < std::numeric_limits<float>::epsilon()) {
                const glm::vec3 u = p2 - p1;
                const glm::vec3 v = p3 - p1;
                _norm = glm::cross(u, v);
            }
            else {
                _norm = n;
            }
            _vert_1 = p1;
            _vert_2 = p2;
            _vert_3 = p3;
        }
    };
    #pragma pack(pop)

    //! face color stored in the attribute word (VisCAM, SolidView):
    //! bit 15 marks a valid color, red in bits 10-14, green in 5-9, blue in 0-4
    bool attribute_color(const uint16_t attribute, uint32_t &out_rgb);

    //! binary and ascii stl files
    class format {
        // small check to guarantee sanity
        static_assert(sizeof(face) == 4 * sizeof(glm::vec3) + sizeof(uint16_t), "size mismatch: face not compatible with stl format");

        uint8_t _header[80] = { 0 };
        std::vector<face> _faces;

        bool load_binary(std::istream &is);
        bool load_ascii(std::istream &is);

        public:
            format() = default;
            format(const std::string &file);

            //! picks binary or ascii from the file size and the "solid" keyword
            bool load(const std::string &filename);
            const std::vector<face> &faces() const;

            //! non indexed soup, stored normals are kept per vertex.
            //! attribute colors become vertex colors if any face carries one
            static mesh::triangle_soup to_soup(const std::vector<face> &faces);
            //! binary stl
            static bool save(const std::vector<face> &faces, const std::string &filename);
    };
};
