#include "converter.h"
#include "colorize.h"

#include "mesh/normalize.h"
#include "stl/stl_import.h"
#include "obj/obj_import.h"
#ifdef BRICKIFY_WITH_GLTF
#include "gltf/gltf_import.h"
#endif
#include "ldraw/encoder.h"
#include "ldraw/document.h"
#include "ldraw/summary.h"
#include "palette/palette.h"
#include "timer.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <iostream>


namespace brickify {
    bool load_mesh(const std::string &file, mesh::triangle_soup &soup, std::string &err) {
        std::string ext = std::filesystem::path(file).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });

        if(ext == ".stl") {
            stl::format stl;
            if(!stl.load(file)) {
                err = file + ": could not be loaded";
                return false;
            }
            soup = stl::format::to_soup(stl.faces());
            return true;
        }
        if(ext == ".obj") {
            return obj::load(file, soup, err);
        }
        if(ext == ".gltf" || ext == ".glb") {
#ifdef BRICKIFY_WITH_GLTF
            return gltf::load(file, soup, err);
#else
            err = file + ": built without glTF support";
            return false;
#endif
        }
        err = file + ": unsupported file type \"" + ext + "\"";
        return false;
    }

    bool convert(const mesh::triangle_soup &soup, const settings &s, const palette::quantizer &q, conversion &out, std::string &err) {
        out = conversion();

        const mesh::polyhedron<float> poly = mesh::normalize(soup);
        if(poly.empty()) {
            std::cout << "convert(): nothing left to voxelize" << std::endl;
            return true;
        }

        out._grid = rasterize::make_grid(poly.bounding_box(), s._resolution, s._family);
        const double cells = out._grid.estimated_cells();
        printf("grid %d x %d, unit %f, estimated cells %.0f\n", out._grid._x_count, out._grid._z_count, out._grid._unit_size, cells);
        if(cells > (double)s._max_voxels) {
            char msg[128];
            snprintf(msg, sizeof(msg), "estimated %.0f cells exceed the limit of %zu", cells, s._max_voxels);
            err = msg;
            return false;
        }

        rasterize::voxel_arr arr;
        {
            benchmark::timer tmp("voxelize");
            arr = rasterize::scanline(poly, s._resolution, s._family, s._rgb).rasterize();
        }
        out._num_voxels = arr._voxels.size();

        if(poly.colored()) {
            // mesh colors win over the shape color
            const colorize::nearest_face lookup(poly, out._grid, s._rgb);
            const ldraw::encoder enc(q, s._family, s._color_mode, std::cref(lookup));
            out._records = enc.encode(arr._voxels);
        }
        else {
            const ldraw::encoder enc(q, s._family, s._color_mode);
            out._records = enc.encode(arr._voxels);
        }
        return true;
    }

    converter::converter(const cfg::xml_project &cfg)
        : _project_cfg(cfg)
        , _quantizer(palette::curated())
        , _parts(ldraw::parts())
    {}

    settings converter::settings_for(const cfg::shape_settings &shape) const {
        settings s;
        s._resolution = _project_cfg.resolution();
        s._family = _project_cfg.family();
        s._max_voxels = _project_cfg.max_voxels();
        s._color_mode = shape._color_mode;
        s._rgb = shape._color_rgb;
        return s;
    }

    bool converter::run_shape(const cfg::shape_settings &shape) {
        benchmark::timer tmp("run_shape()");

        const std::filesystem::path file = std::filesystem::path(_project_cfg.project_path()) / shape._file_in;
        std::cout << file << std::endl;

        std::string err;
        mesh::triangle_soup soup;
        if(!load_mesh(file.string(), soup, err)) {
            std::cerr << err << std::endl;
            return false;
        }

        conversion res;
        if(!convert(soup, settings_for(shape), _quantizer, res, err)) {
            std::cerr << file.string() << ": " << err << std::endl;
            return false;
        }

        const std::filesystem::path out_file = std::filesystem::path(_project_cfg.target_dir()) / shape._file_out;
        const std::string name = out_file.filename().string();
        const std::string text = ldraw::document::serialize(res._records, ldraw::document::default_header(name, _project_cfg.author()));
        if(!ldraw::document::save(out_file.string(), text)) {
            return false;
        }

        // read the document back as a consumer would
        std::string written;
        if(!ldraw::document::load(out_file.string(), written)) {
            return false;
        }
        const std::vector<ldraw::placement> records = ldraw::document::parse(written);
        if(records.size() != res._records.size()) {
            std::cerr << out_file.string() << ": wrote " << res._records.size() << " records but read " << records.size() << std::endl;
            return false;
        }

        std::cout << out_file.string() << ": " << res._num_voxels << " voxels" << std::endl;
        std::cout << ldraw::summarize(records, _parts, palette::extended());
        return true;
    }

    size_t converter::run() {
        size_t num_ok = 0;
        for(const cfg::shape_settings &shape : _project_cfg.shapes()) {
            if(run_shape(shape)) num_ok++;
        }
        printf("%zu of %zu shapes converted\n", num_ok, _project_cfg.shapes().size());
        return num_ok;
    }
};
