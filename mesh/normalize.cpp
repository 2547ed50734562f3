#include "normalize.h"
#include "../timer.h"

#include <cmath>
#include <iostream>
#include <map>


namespace {
    //! resolves an index buffer so that every face owns its 3 vertices
    mesh::triangle_soup flatten(const mesh::triangle_soup &in) {
        if(!in.indexed()) {
            return in;
        }

        const size_t num_verts = in._positions.size();
        const bool has_normals = in._normals.size() == num_verts;
        const bool has_uvs = in._uvs.size() == num_verts;
        const bool has_colors = in._colors.size() == num_verts;

        mesh::triangle_soup res;
        for(size_t f = 0; f + 2 < in._indices.size(); f += 3) {
            const uint32_t ids[3] = { in._indices[f+0], in._indices[f+1], in._indices[f+2] };
            if(ids[0] >= num_verts || ids[1] >= num_verts || ids[2] >= num_verts) {
                continue;
            }
            for(const uint32_t id : ids) {
                res._positions.push_back(in._positions[id]);
                if(has_normals) res._normals.push_back(in._normals[id]);
                if(has_uvs) res._uvs.push_back(in._uvs[id]);
                if(has_colors) res._colors.push_back(in._colors[id]);
            }
        }
        return res;
    }
};

namespace mesh {
    triangle_soup remove_invalid_faces(const triangle_soup &in) {
        const triangle_soup flat = flatten(in);
        const size_t num_verts = flat._positions.size() - flat._positions.size() % 3;
        const bool has_normals = flat._normals.size() == flat._positions.size();
        const bool has_uvs = flat._uvs.size() == flat._positions.size();
        const bool has_colors = flat._colors.size() == flat._positions.size();

        triangle_soup res;
        size_t dropped = 0;
        for(size_t i = 0; i < num_verts; i += 3) {
            const glm::vec3 &p1 = flat._positions[i+0];
            const glm::vec3 &p2 = flat._positions[i+1];
            const glm::vec3 &p3 = flat._positions[i+2];

            if(!is_finite(p1) || !is_finite(p2) || !is_finite(p3)) {
                dropped++;
                continue;
            }

            const glm::dvec3 e1 = glm::dvec3(p2) - glm::dvec3(p1);
            const glm::dvec3 e2 = glm::dvec3(p3) - glm::dvec3(p1);
            const glm::dvec3 n = glm::cross(e1, e2);
            if(glm::dot(n, n) < degenerate_area_sq) {
                dropped++;
                continue;
            }

            res.add_face(p1, p2, p3);
            for(size_t j = i; j < i + 3; j++) {
                if(has_normals) res._normals.push_back(flat._normals[j]);
                if(has_uvs) res._uvs.push_back(flat._uvs[j]);
                if(has_colors) res._colors.push_back(flat._colors[j]);
            }
        }

        if(dropped > 0) {
            std::cout << "remove_invalid_faces(): dropped " << dropped << " faces" << std::endl;
        }
        return res;
    }

    polyhedron<float> merge_vertices(const triangle_soup &in, const float epsilon) {
        const bool has_uvs = in._uvs.size() == in._positions.size();
        const bool has_colors = in._colors.size() == in._positions.size();

        // snap every position onto a grid with `epsilon` spacing,
        // positions falling into the same grid cell share one vertex
        auto key = [=](const glm::vec3 &p) {
            const glm::dvec3 d(p);
            return epsilon > 0.f ? glm::round(d / double(epsilon)) : d;
        };

        polyhedron<float> res;
        std::map<glm::dvec3, polyhedron<float>::index_t, compare_glm_vec3> lookup;

        auto vertex_id = [&](const size_t i) {
            const auto ins = lookup.emplace(key(in._positions[i]), (polyhedron<float>::index_t)res._vertices.size());
            if(ins.second) {
                res._vertices.push_back(in._positions[i]);
                if(has_uvs) res._uvs.push_back(in._uvs[i]);
            }
            return ins.first->second;
        };

        for(size_t i = 0; i + 2 < in._positions.size(); i += 3) {
            const face<polyhedron<float>::index_t> f(vertex_id(i), vertex_id(i+1), vertex_id(i+2));
            if(f.collapsed()) continue;
            res._indices.add(f);
            // merged vertices may be shared by differently colored faces
            if(has_colors) res._face_colors.push_back(face_color(in._colors[i], in._colors[i+1], in._colors[i+2]));
        }
        return res;
    }

    polyhedron<float> normalize(const triangle_soup &in) {
        benchmark::timer tmp("normalize()");

        const triangle_soup clean = remove_invalid_faces(in);
        if(clean._positions.empty()) {
            std::cout << "normalize(): no valid faces left" << std::endl;
            return {};
        }

        bbox<float> raw_box;
        for(const glm::vec3 &p : clean._positions) {
            raw_box.extend(p);
        }

        polyhedron<float> res = merge_vertices(clean, merge_tolerance * raw_box.diagonal());
        if(res.empty()) {
            return {};
        }
        res.compute_normals();

        bbox<float> box = res.bounding_box();
        const float max_dim = glm::compMax(box.size());
        if(!(max_dim > 0.f)) {
            return {};
        }
        res.scale(target_size / max_dim);
        box = res.bounding_box();

        // center x/z, put the floor on y = 0
        const glm::vec3 cnt = box.center();
        res.translate(glm::vec3(-cnt.x, -box._min.y, -cnt.z));

        std::cout << "normalize(): " << res.num_faces() << " faces, " << res._vertices.size() << " vertices" << std::endl;
        return res;
    }
};
