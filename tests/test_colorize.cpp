#include <gtest/gtest.h>

#include "colorize.h"
#include "checks.h"
#include "converter.h"
#include "ldraw/encoder.h"
#include "mesh/normalize.h"
#include "obj/obj_import.h"
#include "palette/palette.h"
#include "test_helpers.h"


namespace {
    constexpr uint32_t red = 0xC91A09;
    constexpr uint32_t blue = 0x0055BF;

    //! red box on the left, blue box on the right, a gap in between
    mesh::triangle_soup two_boxes() {
        mesh::triangle_soup soup = test::painted(test::box_soup(glm::vec3(0), glm::vec3(1)), red);
        test::append(soup, test::painted(test::box_soup(glm::vec3(2, 0, 0), glm::vec3(3, 1, 1)), blue));
        return soup;
    }
};

// =============================================================================
// Closest point
// =============================================================================

TEST(ClosestPoint, Regions) {
    const std::array<glm::vec3, 3> tri = { glm::vec3(0), glm::vec3(2, 0, 0), glm::vec3(0, 0, 2) };
    // above the face
    EXPECT_VEC3_NEAR(glm::vec3(0.5f, 0, 0.5f), checks::distance::closest_point(glm::vec3(0.5f, 3, 0.5f), tri), 1e-6f);
    // beyond a corner
    EXPECT_VEC3_NEAR(glm::vec3(0), checks::distance::closest_point(glm::vec3(-1, 1, -1), tri), 1e-6f);
    // beyond the hypotenuse
    EXPECT_VEC3_NEAR(glm::vec3(1, 0, 1), checks::distance::closest_point(glm::vec3(2, 0, 2), tri), 1e-6f);
    // beyond an edge
    EXPECT_VEC3_NEAR(glm::vec3(1, 0, 0), checks::distance::closest_point(glm::vec3(1, 0, -4), tri), 1e-6f);
    EXPECT_FLOAT_EQ(16.f, checks::distance::squared(glm::vec3(1, 0, -4), tri));
}

// =============================================================================
// Nearest face lookup
// =============================================================================

TEST(NearestFace, VoxelsTakeTheColorOfTheClosestSurface) {
    const mesh::polyhedron<float> p = mesh::normalize(two_boxes());
    ASSERT_TRUE(p.colored());

    const rasterize::scanline s(p, 6, brick);
    const rasterize::voxel_arr arr = s.rasterize();
    ASSERT_FALSE(arr._voxels.empty());

    const colorize::nearest_face lookup(p, s.grid(), 0xFFFFFF);
    size_t left = 0, right = 0;
    for(const rasterize::voxel &v : arr._voxels) {
        if(v._pos.x < 3) {
            EXPECT_EQ(red, lookup(v));
            left++;
        }
        else {
            EXPECT_EQ(blue, lookup(v));
            right++;
        }
    }
    EXPECT_EQ(left, right);
    EXPECT_GT(left, 0u);
}

TEST(NearestFace, CenterAndIndex) {
    const mesh::polyhedron<float> p = mesh::normalize(test::box_soup(glm::vec3(0), glm::vec3(20)));
    const rasterize::grid_t g = rasterize::make_grid(p.bounding_box(), 10, brick);
    const colorize::nearest_face lookup(p, g, 0x123456);

    EXPECT_VEC3_NEAR(glm::vec3(-18, 2.4f, -18), lookup.center(glm::ivec3(0, 0, 0)), 1e-5f);
    EXPECT_VEC3_NEAR(glm::vec3(18, 7.2f, -10), lookup.center(glm::ivec3(9, 1, 2)), 1e-5f);

    // a point just above the top face, far from the search start column
    const long face_id = lookup.nearest(glm::vec3(17, 40.5f, 17), 0, 0);
    ASSERT_GE(face_id, 0);
    for(const glm::vec3 &c : p.corners((size_t)face_id)) {
        EXPECT_FLOAT_EQ(40.f, c.y);
    }
}

TEST(NearestFace, FallbackColor) {
    const mesh::polyhedron<float> plain = mesh::normalize(test::box_soup(glm::vec3(0), glm::vec3(1)));
    const rasterize::grid_t g = rasterize::make_grid(plain.bounding_box(), 4, plate);
    rasterize::voxel v;
    v._pos = glm::ivec3(1, 1, 1);
    v._rgb = 0xABCDEF;
    EXPECT_EQ(0x123456u, colorize::nearest_face(plain, g, 0x123456)(v));

    // faces without color information
    mesh::triangle_soup soup = test::box_soup(glm::vec3(0), glm::vec3(1));
    soup._colors.assign(soup._positions.size(), mesh::no_color);
    EXPECT_EQ(0x123456u, colorize::nearest_face(mesh::normalize(soup), g, 0x123456)(v));

    EXPECT_EQ(-1, colorize::nearest_face(mesh::polyhedron<float>(), rasterize::grid_t(), 0).nearest(glm::vec3(0), 0, 0));
}

// =============================================================================
// Mesh colors through the conversion
// =============================================================================

class MeshColorTest : public ::testing::Test {
protected:
    palette::quantizer _quantizer{ palette::curated() };
    brickify::settings _settings;

    void SetUp() override {
        _settings._resolution = 6;
        _settings._family = brick;
        _settings._rgb = 0xFFFFFF;
    }
};

TEST_F(MeshColorTest, Quantized) {
    brickify::conversion res;
    std::string err;
    ASSERT_TRUE(brickify::convert(two_boxes(), _settings, _quantizer, res, err)) << err;
    ASSERT_FALSE(res._records.empty());

    // columns 0 - 2 belong to the left box, x = i * 20
    for(const ldraw::placement &p : res._records) {
        EXPECT_EQ(p._position.x < 60.f ? 4 : 1, p._color.code());
    }
}

TEST_F(MeshColorTest, Direct) {
    _settings._color_mode = direct;

    brickify::conversion res;
    std::string err;
    ASSERT_TRUE(brickify::convert(two_boxes(), _settings, _quantizer, res, err)) << err;
    ASSERT_FALSE(res._records.empty());
    for(const ldraw::placement &p : res._records) {
        EXPECT_EQ(p._position.x < 60.f ? "0x2C91A09" : "0x20055BF", p._color.token());
    }
}

TEST_F(MeshColorTest, ObjMaterialLibrary) {
    const std::filesystem::path dir = test::scratch_dir("obj_mtl");
    test::write_file(dir / "colors.mtl",
        "newmtl brick red\n"
        "Kd 0.788 0.102 0.035\n"
        "newmtl other\n"
        "Kd 0 0 1\n"
    );
    test::write_file(dir / "cube.obj",
        "mtllib colors.mtl\n"
        "v 0 0 0\nv 20 0 0\nv 20 20 0\nv 0 20 0\n"
        "v 0 0 20\nv 20 0 20\nv 20 20 20\nv 0 20 20\n"
        "usemtl brick red\n"
        "f 1 4 3 2\nf 5 6 7 8\nf 1 2 6 5\nf 4 8 7 3\nf 1 5 8 4\nf 2 3 7 6\n"
    );

    mesh::triangle_soup soup;
    std::string err;
    ASSERT_TRUE(brickify::load_mesh((dir / "cube.obj").string(), soup, err)) << err;
    ASSERT_EQ(soup._positions.size(), soup._colors.size());
    EXPECT_EQ(red, soup._colors[0]);

    brickify::conversion res;
    ASSERT_TRUE(brickify::convert(soup, _settings, _quantizer, res, err)) << err;
    ASSERT_FALSE(res._records.empty());
    for(const ldraw::placement &p : res._records) {
        EXPECT_EQ(4, p._color.code());
    }
}
