#pragma once

#include "placement.h"

#include <string>
#include <vector>

namespace ldraw {
    //! line based LDraw text:
    //!   0 <meta>                              comment / header
    //!   1 <color> x y z a b c d e f g h i <part>   part reference
    //! only type 1 lines are read, everything else is skipped
    class document {
    public:
        //! meta lines written above the records (without the leading "0 ")
        static std::vector<std::string> default_header(const std::string &name, const std::string &author);

        //! header lines, one blank line, one line per record
        static std::string serialize(const std::vector<placement> &records, const std::vector<std::string> &header);
        static std::string serialize_line(const placement &p);

        //! malformed lines are skipped, the rest is returned in document order
        static std::vector<placement> parse(const std::string &text);
        //! false if the line is no (valid) type 1 line
        static bool parse_line(const std::string &line, placement &out);

        static bool load(const std::string &file, std::string &out_text);
        static bool save(const std::string &file, const std::string &text);
    };
};
