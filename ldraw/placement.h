#pragma once

#include "../glm_ext/glm_extensions.h"

#include <cstdint>
#include <string>

namespace ldraw {
    //! LDraw direct colors carry the rgb value in the low 24 bits of 0x2RRGGBB
    constexpr int64_t direct_color_flag = 0x2000000;

    //! either a palette code or a literal ("direct") rgb color
    struct color {
        bool _direct = false;
        int64_t _value = 0; // palette code, or the full direct value as written

        static color from_code(const int code) {
            return { false, code };
        }
        //! 0xRRGGBB -> 0x2RRGGBB
        static color from_rgb(const uint32_t rgb) {
            return { true, direct_color_flag | (rgb & 0xFFFFFF) };
        }

        int code() const {
            return (int)_value;
        }
        uint32_t rgb() const {
            return (uint32_t)(_value & 0xFFFFFF);
        }
        //! "#rrggbb", only meaningful for direct colors
        std::string hex() const;
        //! document token: decimal code or 0x prefixed upper case hex
        std::string token() const;

        friend bool operator== (const color &lhs, const color &rhs) {
            return lhs._direct == rhs._direct && lhs._value == rhs._value;
        }
        friend bool operator!= (const color &lhs, const color &rhs) {
            return !(lhs == rhs);
        }
    };

    //! one part reference (LDraw line type 1)
    struct placement {
        glm::vec3 _position = glm::vec3(0);     // LDraw units, y points down
        glm::mat3 _rotation = glm::mat3(1);
        color _color;
        std::string _part;
    };
};
