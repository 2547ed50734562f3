#pragma once

#include "../mesh/triangle_soup.h"

#include <string>

namespace gltf {
    //! glTF 2.0 reader for .gltf (embedded or external buffers) and binary .glb files.
    //! the triangle primitives of every node in the default scene (or of every mesh
    //! if the file has no scenes) are flattened into one soup, node transforms applied.
    //! a corner is colored by COLOR_0 or else by the base color factor of the
    //! primitive's material. images are not decoded.
    //! on failure returns false and writes a human readable message to `err`
    bool load(const std::string &path, mesh::triangle_soup &soup, std::string &err);
};
