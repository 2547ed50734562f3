#pragma once

#include "../mesh/triangle_soup.h"

#include <cstdint>
#include <map>
#include <string>

namespace obj {
    //! material name -> diffuse color (Kd) as 0xRRGGBB
    using material_colors = std::map<std::string, uint32_t>;

    //! reads the newmtl and Kd records of a .mtl file, everything else is ignored
    material_colors parse_mtl(const std::string &text);

    //! Wavefront obj reader
    //! reads v, vt, vn, f and usemtl records, everything else (groups, lines, ...) is ignored.
    //! polygons are fan triangulated, "i", "i/t", "i//n" and "i/t/n" references
    //! as well as negative (relative) indices are accepted.
    //! a corner is colored by its vertex color ("v x y z r g b", channels in [0, 1])
    //! or else by the diffuse color of the active material.
    //! the mtllib files are looked up next to `path`.
    //! on failure returns false and writes a human readable message to `err`
    bool load(const std::string &path, mesh::triangle_soup &soup, std::string &err);

    //! same as above, reads from a string
    bool parse(const std::string &text, mesh::triangle_soup &soup, std::string &err, const material_colors &materials = material_colors());
};
