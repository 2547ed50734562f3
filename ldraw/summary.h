#pragma once

#include "placement.h"
#include "parts.h"
#include "../palette/palette.h"

#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace ldraw {
    //! bill of materials of a placement list
    struct report {
        size_t _count = 0;
        std::map<std::string, size_t> _parts;   // resolved part file -> count
        std::map<std::string, size_t> _colors;  // color token -> count
        size_t _unknown_parts = 0;              // references that fell back to the default part
        size_t _no_display_color = 0;           // codes missing from the display table
    };

    //! display color of a record for redisplay:
    //! direct colors carry their own rgb, codes are looked up in `table`
    bool display_rgb(const color &c, const palette::extended_table &table, uint32_t &out_rgb);

    report summarize(
        const std::vector<placement> &records,
        const part_resolver &parts,
        const palette::extended_table &display_colors
    );

    std::ostream &operator<< (std::ostream &os, const report &r);
};
