#include "summary.h"


namespace ldraw {
    bool display_rgb(const color &c, const palette::extended_table &table, uint32_t &out_rgb) {
        if(c._direct) {
            out_rgb = c.rgb();
            return true;
        }
        return table.find(c.code(), out_rgb);
    }

    report summarize(
        const std::vector<placement> &records,
        const part_resolver &parts,
        const palette::extended_table &display_colors)
    {
        report r;
        r._count = records.size();
        for(const placement &p : records) {
            if(!parts.known(p._part)) {
                r._unknown_parts++;
            }
            r._parts[parts.resolve(p._part)._part]++;
            r._colors[p._color.token()]++;

            uint32_t rgb = 0;
            if(!display_rgb(p._color, display_colors, rgb)) {
                r._no_display_color++;
            }
        }
        return r;
    }

    std::ostream &operator<< (std::ostream &os, const report &r) {
        os << r._count << " parts" << std::endl;
        for(const auto &p : r._parts) {
            os << "  " << p.first << ": " << p.second << std::endl;
        }
        for(const auto &c : r._colors) {
            os << "  color " << c.first << ": " << c.second << std::endl;
        }
        if(r._unknown_parts > 0) {
            os << "  " << r._unknown_parts << " references to unknown parts" << std::endl;
        }
        if(r._no_display_color > 0) {
            os << "  " << r._no_display_color << " colors without display value" << std::endl;
        }
        return os;
    }
};
