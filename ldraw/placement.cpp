#include "placement.h"
#include "../palette/palette.h"

#include <cstdio>


namespace ldraw {
    std::string color::hex() const {
        return palette::to_hex(rgb());
    }

    std::string color::token() const {
        if(!_direct) {
            return std::to_string(_value);
        }
        char buf[24] = { 0 };
        std::snprintf(buf, sizeof(buf), "0x%06llX", (unsigned long long)_value);
        return buf;
    }
};
