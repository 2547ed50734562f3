#pragma once

#include "../glm_ext/glm_extensions.h"

#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

namespace palette {
    struct color_entry {
        int _code = 0;
        std::string _name;
        std::string _hex;   // as written in the table, e.g. "#C91A09"
        uint32_t _rgb = 0;  // 0xRRGGBB
    };

    //! accepts "#RRGGBB", "RRGGBB" and "0xRRGGBB" (any case)
    bool parse_hex(const std::string &str, uint32_t &out_rgb);
    //! 0xRRGGBB -> "#rrggbb"
    std::string to_hex(const uint32_t rgb);
    //! 0xRRGGBB -> normalized [0, 1] channels
    glm::vec3 to_unit_rgb(const uint32_t rgb);

    //! small ordered list of named colors
    //! the order is part of the contract: it decides ties during quantization
    class curated_table {
        std::vector<color_entry> _entries;

    public:
        struct row_t {
            int code;
            const char *name;
            const char *hex;
        };

        curated_table() = default;
        curated_table(std::initializer_list<row_t> rows);

        const std::vector<color_entry> &entries() const {
            return _entries;
        }
        size_t size() const {
            return _entries.size();
        }
        //! nullptr if the code is not part of the table
        const color_entry *find(const int code) const;
    };

    //! LDraw color code -> display color
    //! covers far more codes than the curated table, carries no names
    //! and is never used for quantization
    class extended_table {
        std::map<int, uint32_t> _codes;

    public:
        extended_table() = default;
        extended_table(std::initializer_list<std::pair<int, const char *>> rows);

        size_t size() const {
            return _codes.size();
        }
        bool contains(const int code) const {
            return _codes.count(code) > 0;
        }
        //! false if the code is unknown
        bool find(const int code, uint32_t &out_rgb) const;
    };

    //! the built in tables, built once on first use
    const curated_table &curated();
    const extended_table &extended();
};
