#include "palette.h"

#include <cctype>
#include <cstdio>
#include <iostream>


namespace palette {
    bool parse_hex(const std::string &str, uint32_t &out_rgb) {
        std::string digits = str;
        if(!digits.empty() && digits[0] == '#') {
            digits = digits.substr(1);
        }
        else if(digits.size() > 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
            digits = digits.substr(2);
        }
        if(digits.size() != 6) {
            return false;
        }

        uint32_t rgb = 0;
        for(const char c : digits) {
            if(!std::isxdigit((unsigned char)c)) return false;
            const int v = std::isdigit((unsigned char)c) ? c - '0' : std::tolower((unsigned char)c) - 'a' + 10;
            rgb = (rgb << 4) | (uint32_t)v;
        }
        out_rgb = rgb;
        return true;
    }

    std::string to_hex(const uint32_t rgb) {
        char buf[8] = { 0 };
        std::snprintf(buf, sizeof(buf), "#%06x", rgb & 0xFFFFFF);
        return buf;
    }

    glm::vec3 to_unit_rgb(const uint32_t rgb) {
        return glm::vec3(
            (rgb >> 16) & 0xFF,
            (rgb >> 8) & 0xFF,
            rgb & 0xFF
        ) / 255.f;
    }

    curated_table::curated_table(std::initializer_list<row_t> rows) {
        for(const row_t &r : rows) {
            color_entry e;
            e._code = r.code;
            e._name = r.name;
            e._hex = r.hex;
            if(!parse_hex(e._hex, e._rgb)) {
                std::cerr << "curated_table: invalid color " << e._hex << " for code " << e._code << std::endl;
                continue;
            }
            _entries.push_back(e);
        }
    }

    const color_entry *curated_table::find(const int code) const {
        for(const color_entry &e : _entries) {
            if(e._code == code) return &e;
        }
        return nullptr;
    }

    extended_table::extended_table(std::initializer_list<std::pair<int, const char *>> rows) {
        for(const auto &r : rows) {
            uint32_t rgb = 0;
            if(!parse_hex(r.second, rgb)) {
                std::cerr << "extended_table: invalid color " << r.second << " for code " << r.first << std::endl;
                continue;
            }
            _codes[r.first] = rgb;
        }
    }

    bool extended_table::find(const int code, uint32_t &out_rgb) const {
        const auto it = _codes.find(code);
        if(it == _codes.end()) return false;
        out_rgb = it->second;
        return true;
    }

    const curated_table &curated() {
        static const curated_table table = {
            {  4, "Red",               "#C91A09" },
            {  0, "Black",             "#05131D" },
            { 15, "White",             "#FFFFFF" },
            {  2, "Green",             "#237841" },
            {  1, "Blue",              "#0055BF" },
            { 14, "Yellow",            "#F2CD37" },
            { 71, "Light Bluish Gray", "#A0A5A9" },
            { 72, "Dark Bluish Gray",  "#6C6E68" },
            { 19, "Tan",               "#E4CD9E" },
            { 28, "Dark Tan",          "#958A73" },
            { 25, "Orange",            "#FE8A18" },
            {  5, "Dark Red",          "#720E0F" },
        };
        return table;
    }

    const extended_table &extended() {
        static const extended_table table = {
            {   0, "#1b2a34" }, {   1, "#1e5aa8" }, {   2, "#00852b" }, {   3, "#069d9f" },
            {   4, "#b40000" }, {   5, "#d3359d" }, {   6, "#543324" }, {   7, "#8a928d" },
            {   8, "#545955" }, {   9, "#97cbd9" }, {  10, "#58ab41" }, {  11, "#00aaa4" },
            {  12, "#f06d61" }, {  13, "#f6a9bb" }, {  14, "#fac80a" }, {  15, "#f4f4f4" },
            {  17, "#add9a8" }, {  18, "#ffd67f" }, {  19, "#d7ba8c" }, {  20, "#afbed6" },
            {  22, "#671f81" }, {  23, "#0e3e9a" }, {  25, "#d67923" }, {  26, "#901f76" },
            {  27, "#a5ca18" }, {  28, "#897d62" }, {  29, "#ff9ecd" }, {  30, "#a06eb9" },
            {  31, "#cda4de" }, {  68, "#fdc383" }, {  69, "#8a12a8" }, {  70, "#5f3109" },
            {  71, "#969696" }, {  72, "#646464" }, {  73, "#7396c8" }, {  74, "#7fc475" },
            {  77, "#fecccf" }, {  78, "#ffc995" }, {  84, "#aa7d55" }, {  85, "#441a91" },
            {  86, "#7b5d41" }, {  89, "#1c58a7" }, {  92, "#bb805a" }, { 100, "#f9b7a5" },
            { 110, "#26469a" }, { 112, "#4861ac" }, { 115, "#b7d425" }, { 118, "#9cd6cc" },
            { 120, "#deea92" }, { 123, "#ee5434" }, { 125, "#f9a777" }, { 128, "#ad6140" },
            { 151, "#c8c8c8" }, { 191, "#fcac00" }, { 212, "#9dc3f7" }, { 213, "#476fb6" },
            { 216, "#872b17" }, { 218, "#8e5597" }, { 219, "#564e9d" }, { 220, "#9195ca" },
            { 226, "#ffec6c" }, { 232, "#77c9d8" }, { 272, "#19325a" }, { 288, "#00451a" },
            { 295, "#ff94c2" }, { 308, "#352100" }, { 313, "#abd9ff" }, { 320, "#720012" },
            { 321, "#469bc3" }, { 322, "#68c3e2" }, { 323, "#d3f2ea" }, { 326, "#e2f99a" },
            { 330, "#77774e" }, { 335, "#88605e" }, { 351, "#f785b1" }, { 353, "#ff6d77" },
            { 366, "#d86d2c" }, { 368, "#edff21" }, { 370, "#755945" }, { 373, "#75657d" },
            { 378, "#708e7c" }, { 379, "#70819a" },
        };
        return table;
    }
};
