#pragma once

#include "polyhedron.h"
#include "triangle_soup.h"

namespace mesh {
    //! models are rescaled so that the longest bbox side has this length
    constexpr float target_size = 40.f;
    //! squared cross product length below which a face counts as degenerate
    constexpr double degenerate_area_sq = 1e-12;
    //! vertex merge distance relative to the bbox diagonal
    constexpr float merge_tolerance = 1e-4f;

    //! drops faces with NaN/Inf corners or (near) zero area
    //! the result is never indexed
    triangle_soup remove_invalid_faces(const triangle_soup &in);

    //! merges vertices closer than `epsilon` into one and drops faces that collapse.
    //! vertex colors turn into face colors (mean of the corners)
    polyhedron<float> merge_vertices(const triangle_soup &in, const float epsilon);

    //! sanitizes an arbitrary triangle soup into the canonical frame:
    //! the longest side is target_size long, x/z are centered at the origin
    //! and the lowest point rests on y = 0.
    //! an empty result is not an error, it just carries no faces
    polyhedron<float> normalize(const triangle_soup &in);
};
