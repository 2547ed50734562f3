#pragma once

#include "enums.h"

#include <array>
#include <string>

//! LDraw footprint of one stud
constexpr float ldraw_unit_width = 20.f;
constexpr float ldraw_unit_depth = 20.f;

struct family_traits {
    float _height_ratio;    // layer height relative to the footprint unit
    float _layer_height;    // layer height in LDraw units
    const char *_part;      // canonical 1x1 part
    const char *_name;
};

// indexed by block_family
constexpr std::array<family_traits, 2> family_table = {{
    { 0.4f,  8.f, "3024.dat", "plate" },
    { 1.2f, 24.f, "3005.dat", "brick" }
}};

constexpr const family_traits &traits(const block_family f) {
    return family_table[f];
}

//! "plate" or "brick" (case sensitive), false for anything else
inline bool family_from_string(const std::string &name, block_family &out) {
    for(size_t i = 0; i < family_table.size(); i++) {
        if(name == family_table[i]._name) {
            out = static_cast<block_family>(i);
            return true;
        }
    }
    return false;
}
