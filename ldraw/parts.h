#pragma once

#include "../enums.h"

#include <initializer_list>
#include <map>
#include <string>

namespace ldraw {
    struct part_definition {
        std::string _part;      // file name, e.g. "3024.dat"
        block_family _family = plate;
        int _studs_x = 1;
        int _studs_y = 1;
    };

    //! part key (lower case id and lower case file name) -> definition
    class part_library {
        std::map<std::string, part_definition> _parts;

    public:
        struct row_t {
            const char *id;
            block_family family;
            int studs_x;
            int studs_y;
        };

        part_library() = default;
        part_library(std::initializer_list<row_t> rows);

        //! exact key lookup, nullptr if unknown
        const part_definition *find(const std::string &key) const;
        //! number of distinct parts
        size_t size() const {
            return _parts.size() / 2;
        }
    };

    //! the built in 1xN plates and bricks
    const part_library &parts();

    //! resolves arbitrary part references (paths, upper case, with or
    //! without extension) against a library
    class part_resolver {
        const part_library &_library;
        part_definition _fallback;

    public:
        part_resolver(const part_library &library);

        //! "  Parts\\3005.DAT " -> "3005.dat"
        static std::string normalize_key(const std::string &part);

        //! never fails: unknown parts resolve to the 1x1 fallback
        const part_definition &resolve(const std::string &part) const;
        bool known(const std::string &part) const;
    };
};
