#pragma once

#include "palette.h"

#include <cstdint>

namespace palette {
    //! maps arbitrary colors onto the closest entry of a curated table
    class quantizer {
        const curated_table &_table;
        int _fallback_code;

    public:
        //! `fallback_code` is returned if the table is empty
        quantizer(const curated_table &table, const int fallback_code = 0)
            : _table(table)
            , _fallback_code(fallback_code)
        {}

        //! euclidean distance in normalized rgb,
        //! on equal distance the entry listed first wins
        int nearest_code(const uint32_t rgb) const;
        //! same as above for "#RRGGBB" strings, the fallback code for invalid strings
        int nearest_code(const std::string &hex) const;
    };
};
