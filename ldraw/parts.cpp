#include "parts.h"

#include <algorithm>
#include <cctype>


namespace {
    const std::string dat_ext = ".dat";

    std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return (char)std::tolower(c); });
        return s;
    }

    bool ends_with(const std::string &s, const std::string &suffix) {
        return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
};

namespace ldraw {
    part_library::part_library(std::initializer_list<row_t> rows) {
        for(const row_t &r : rows) {
            const std::string id = lower(r.id);
            const part_definition def = { id + dat_ext, r.family, r.studs_x, r.studs_y };
            _parts[id] = def;
            _parts[id + dat_ext] = def;
        }
    }

    const part_definition *part_library::find(const std::string &key) const {
        const auto it = _parts.find(key);
        return it == _parts.end() ? nullptr : &it->second;
    }

    const part_library &parts() {
        static const part_library library = {
            { "3024", plate, 1, 1 },
            { "3023", plate, 2, 1 },
            { "3623", plate, 3, 1 },
            { "3710", plate, 4, 1 },
            { "3022", plate, 2, 2 },
            { "3021", plate, 3, 2 },
            { "3020", plate, 4, 2 },
            { "3031", plate, 4, 4 },
            { "3005", brick, 1, 1 },
            { "3004", brick, 2, 1 },
            { "3622", brick, 3, 1 },
            { "3010", brick, 4, 1 },
            { "3003", brick, 2, 2 },
            { "3001", brick, 4, 2 },
        };
        return library;
    }

    part_resolver::part_resolver(const part_library &library)
        : _library(library)
        , _fallback({ "3024.dat", brick, 1, 1 })
    {}

    std::string part_resolver::normalize_key(const std::string &part) {
        const size_t first = part.find_first_not_of(" \t\r\n");
        if(first == std::string::npos) {
            return "";
        }
        const size_t last = part.find_last_not_of(" \t\r\n");
        std::string key = lower(part.substr(first, last - first + 1));
        std::replace(key.begin(), key.end(), '\\', '/');

        const size_t slash = key.rfind('/');
        return slash == std::string::npos ? key : key.substr(slash + 1);
    }

    const part_definition &part_resolver::resolve(const std::string &part) const {
        const std::string base = normalize_key(part);
        if(base.empty()) {
            return _fallback;
        }
        if(const part_definition *def = _library.find(base)) {
            return *def;
        }
        if(ends_with(base, dat_ext)) {
            if(const part_definition *def = _library.find(base.substr(0, base.size() - dat_ext.size()))) {
                return *def;
            }
        }
        return _fallback;
    }

    bool part_resolver::known(const std::string &part) const {
        return &resolve(part) != &_fallback;
    }
};
