#pragma once

#include "mesh/triangle_soup.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>


#define EXPECT_VEC3_NEAR(expected, actual, eps) \
    do { \
        EXPECT_NEAR((expected).x, (actual).x, eps); \
        EXPECT_NEAR((expected).y, (actual).y, eps); \
        EXPECT_NEAR((expected).z, (actual).z, eps); \
    } while(0)

namespace test {
    //! axis aligned box from 12 outward facing triangles
    inline mesh::triangle_soup box_soup(const glm::vec3 &lo, const glm::vec3 &hi) {
        const glm::vec3 c[8] = {
            { lo.x, lo.y, lo.z }, { hi.x, lo.y, lo.z }, { hi.x, hi.y, lo.z }, { lo.x, hi.y, lo.z },
            { lo.x, lo.y, hi.z }, { hi.x, lo.y, hi.z }, { hi.x, hi.y, hi.z }, { lo.x, hi.y, hi.z }
        };
        const int quads[6][4] = {
            { 0, 3, 2, 1 }, // -z
            { 4, 5, 6, 7 }, // +z
            { 0, 1, 5, 4 }, // -y
            { 3, 7, 6, 2 }, // +y
            { 0, 4, 7, 3 }, // -x
            { 1, 2, 6, 5 }  // +x
        };
        mesh::triangle_soup soup;
        for(const auto &q : quads) {
            soup.add_face(c[q[0]], c[q[1]], c[q[2]]);
            soup.add_face(c[q[0]], c[q[2]], c[q[3]]);
        }
        return soup;
    }

    //! prism extruded along z from a convex profile given counter clockwise in x/y,
    //! faces are wound outwards
    inline mesh::triangle_soup prism_soup(const std::vector<glm::vec2> &profile, const float z0, const float z1) {
        mesh::triangle_soup soup;
        const size_t n = profile.size();
        for(size_t i = 0; i < n; i++) {
            const glm::vec2 &a = profile[i];
            const glm::vec2 &b = profile[(i + 1) % n];
            soup.add_face(glm::vec3(a, z0), glm::vec3(b, z0), glm::vec3(b, z1));
            soup.add_face(glm::vec3(a, z0), glm::vec3(b, z1), glm::vec3(a, z1));
        }
        for(size_t i = 1; i + 1 < n; i++) {
            soup.add_face(glm::vec3(profile[0], z1), glm::vec3(profile[i], z1), glm::vec3(profile[i+1], z1));
            soup.add_face(glm::vec3(profile[0], z0), glm::vec3(profile[i+1], z0), glm::vec3(profile[i], z0));
        }
        return soup;
    }

    //! every vertex of the soup gets `rgb`
    inline mesh::triangle_soup painted(mesh::triangle_soup soup, const uint32_t rgb) {
        soup._colors.assign(soup._positions.size(), rgb);
        return soup;
    }

    //! appends all faces of `src` to `dst` (both non indexed),
    //! vertices of an uncolored side get no_color if the other side is colored
    inline void append(mesh::triangle_soup &dst, const mesh::triangle_soup &src) {
        if(!dst._colors.empty() || !src._colors.empty()) {
            dst._colors.resize(dst._positions.size(), mesh::no_color);
            if(src._colors.size() == src._positions.size()) {
                dst._colors.insert(dst._colors.end(), src._colors.begin(), src._colors.end());
            }
            else {
                dst._colors.resize(dst._positions.size() + src._positions.size(), mesh::no_color);
            }
        }
        dst._positions.insert(dst._positions.end(), src._positions.begin(), src._positions.end());
    }

    //! fresh, empty directory below the system temp dir
    inline std::filesystem::path scratch_dir(const std::string &name) {
        const std::filesystem::path dir = std::filesystem::temp_directory_path() / ("brickify_test_" + name);
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
        return dir;
    }

    inline void write_file(const std::filesystem::path &file, const std::string &text) {
        std::ofstream ofs(file, std::ios::out | std::ios::binary | std::ios::trunc);
        ofs << text;
    }
};
