#include "quantizer.h"

#include <limits>


namespace palette {
    int quantizer::nearest_code(const uint32_t rgb) const {
        const glm::vec3 target = to_unit_rgb(rgb);

        float min_distance = std::numeric_limits<float>::infinity();
        int closest_code = _fallback_code;
        for(const color_entry &e : _table.entries()) {
            const float distance = glm::distance(target, to_unit_rgb(e._rgb));
            // strictly less: later entries never replace an equally close one
            if(distance < min_distance) {
                min_distance = distance;
                closest_code = e._code;
            }
        }
        return closest_code;
    }

    int quantizer::nearest_code(const std::string &hex) const {
        uint32_t rgb = 0;
        if(!parse_hex(hex, rgb)) {
            return _fallback_code;
        }
        return nearest_code(rgb);
    }
};
