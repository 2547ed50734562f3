#pragma once

#include "mesh/triangle_soup.h"
#include "ldraw/placement.h"
#include "ldraw/parts.h"
#include "palette/quantizer.h"
#include "rasterizer.h"
#include "xml_config.h"
#include "enums.h"

#include <cstdint>
#include <string>
#include <vector>


namespace brickify {
    //! per shape conversion parameters
    struct settings {
        int _resolution = 100;
        block_family _family = plate;
        color_mode _color_mode = quantized;
        uint32_t _rgb = 0xFFFFFF;
        size_t _max_voxels = 8000000;
    };

    struct conversion {
        rasterize::grid_t _grid;
        size_t _num_voxels = 0;
        std::vector<ldraw::placement> _records;
    };

    //! reads .stl, .obj, .gltf or .glb (by extension, any case)
    bool load_mesh(const std::string &file, mesh::triangle_soup &soup, std::string &err);

    //! raw mesh -> placement records
    //! returns false (with a message) if the estimated grid exceeds `max_voxels`,
    //! an empty or degenerate mesh is no error and yields no records
    bool convert(const mesh::triangle_soup &soup, const settings &s, const palette::quantizer &q, conversion &out, std::string &err);

    //! runs every shape of a project and writes one document per shape into the target dir
    class converter {
        cfg::xml_project _project_cfg;
        palette::quantizer _quantizer;
        ldraw::part_resolver _parts;

        settings settings_for(const cfg::shape_settings &shape) const;

    public:
        converter(const cfg::xml_project &cfg);

        //! false if the shape was skipped or the written document does not read back
        bool run_shape(const cfg::shape_settings &shape);
        //! number of shapes converted successfully
        size_t run();
    };
};
