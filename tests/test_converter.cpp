#include <gtest/gtest.h>

#include "converter.h"
#include "ldraw/document.h"
#include "stl/stl_import.h"
#include "palette/palette.h"
#include "test_helpers.h"


namespace {
    const char *cube_obj =
        "v 0 0 0\nv 20 0 0\nv 20 20 0\nv 0 20 0\n"
        "v 0 0 20\nv 20 0 20\nv 20 20 20\nv 0 20 20\n"
        "f 1 4 3 2\nf 5 6 7 8\nf 1 2 6 5\nf 4 8 7 3\nf 1 5 8 4\nf 2 3 7 6\n";
};

class ConverterTest : public ::testing::Test {
protected:
    palette::quantizer _quantizer{ palette::curated() };
    brickify::settings _settings;

    void SetUp() override {
        _settings._resolution = 10;
        _settings._family = brick;
        _settings._rgb = 0xC91A09;
    }
};

TEST_F(ConverterTest, CubeToBricks) {
    brickify::conversion res;
    std::string err;
    ASSERT_TRUE(brickify::convert(test::box_soup(glm::vec3(0), glm::vec3(20)), _settings, _quantizer, res, err)) << err;
    EXPECT_EQ(800u, res._num_voxels);
    ASSERT_EQ(800u, res._records.size());
    EXPECT_EQ(10, res._grid._x_count);

    for(const ldraw::placement &p : res._records) {
        EXPECT_EQ("3005.dat", p._part);
        EXPECT_EQ(4, p._color.code());
        EXPECT_LE(p._position.y, 0.f);
        EXPECT_GE(p._position.y, -7 * 24.f);
    }
}

TEST_F(ConverterTest, DirectColorMode) {
    _settings._color_mode = direct;
    _settings._rgb = 0x1A2B3C;

    brickify::conversion res;
    std::string err;
    ASSERT_TRUE(brickify::convert(test::box_soup(glm::vec3(0), glm::vec3(1)), _settings, _quantizer, res, err));
    ASSERT_FALSE(res._records.empty());
    EXPECT_EQ("0x21A2B3C", res._records[0]._color.token());
}

TEST_F(ConverterTest, CapacityGuard) {
    // the cube needs 10 x 10 columns of up to 10 layers
    _settings._max_voxels = 999;

    brickify::conversion res;
    std::string err;
    EXPECT_FALSE(brickify::convert(test::box_soup(glm::vec3(0), glm::vec3(20)), _settings, _quantizer, res, err));
    EXPECT_FALSE(err.empty());
    EXPECT_TRUE(res._records.empty());

    _settings._max_voxels = 1000;
    EXPECT_TRUE(brickify::convert(test::box_soup(glm::vec3(0), glm::vec3(20)), _settings, _quantizer, res, err));
}

TEST_F(ConverterTest, HugeResolutionIsRefused) {
    // 2^23 columns per axis, far beyond any cell limit
    _settings._resolution = 8388608;

    brickify::conversion res;
    std::string err;
    EXPECT_FALSE(brickify::convert(test::box_soup(glm::vec3(0), glm::vec3(20)), _settings, _quantizer, res, err));
    EXPECT_NE(std::string::npos, err.find("exceed"));
    EXPECT_TRUE(res._records.empty());
    EXPECT_EQ(0u, res._num_voxels);
}

TEST_F(ConverterTest, EmptyMeshIsNoError) {
    brickify::conversion res;
    std::string err;
    EXPECT_TRUE(brickify::convert(mesh::triangle_soup(), _settings, _quantizer, res, err));
    EXPECT_TRUE(res._records.empty());
    EXPECT_EQ(0u, res._num_voxels);
}

TEST_F(ConverterTest, LoadMeshByExtension) {
    const std::filesystem::path dir = test::scratch_dir("load_mesh");
    test::write_file(dir / "cube.OBJ", cube_obj);
    test::write_file(dir / "cube.ply", "ply\n");

    mesh::triangle_soup soup;
    std::string err;
    ASSERT_TRUE(brickify::load_mesh((dir / "cube.OBJ").string(), soup, err)) << err;
    EXPECT_EQ(12u, soup.num_faces());

    ASSERT_TRUE(stl::format::save({ stl::face(glm::vec3(0), glm::vec3(0), glm::vec3(1, 0, 0), glm::vec3(0, 0, 1)) }, (dir / "tri.stl").string()));
    ASSERT_TRUE(brickify::load_mesh((dir / "tri.stl").string(), soup, err)) << err;
    EXPECT_EQ(1u, soup.num_faces());

    EXPECT_FALSE(brickify::load_mesh((dir / "cube.ply").string(), soup, err));
    EXPECT_FALSE(brickify::load_mesh((dir / "missing.stl").string(), soup, err));
}

TEST(ConverterProject, WritesOneDocumentPerShape) {
    const std::filesystem::path dir = test::scratch_dir("project");
    test::write_file(dir / "cube.obj", cube_obj);
    test::write_file(dir / "project.xml",
        "<project>\n"
        "  <grid resolution=\"10\" family=\"plate\" max_voxels=\"100000\"/>\n"
        "  <target dir_out=\"out\" author=\"tester\"/>\n"
        "  <shape file_in=\"cube.obj\" file_out=\"cube.ldr\" color=\"#FFFFFF\"/>\n"
        "  <shape file_in=\"missing.obj\"/>\n"
        "</project>\n"
    );

    const cfg::xml_project pro(dir.string());
    ASSERT_TRUE(pro.valid());
    brickify::converter c(pro);
    EXPECT_EQ(1u, c.run());

    std::string text;
    ASSERT_TRUE(ldraw::document::load((dir / "out" / "cube.ldr").string(), text));
    EXPECT_EQ(0u, text.find("0 cube.ldr\n0 Name: cube.ldr\n0 Author: tester\n"));

    const std::vector<ldraw::placement> records = ldraw::document::parse(text);
    ASSERT_EQ(2500u, records.size());
    for(const ldraw::placement &p : records) {
        EXPECT_EQ("3024.dat", p._part);
        EXPECT_EQ(15, p._color.code());
    }
    EXPECT_FALSE(std::filesystem::exists(dir / "out" / "missing.ldr"));
}

TEST(ConverterProject, OversizedShapeIsSkipped) {
    const std::filesystem::path dir = test::scratch_dir("project_limit");
    test::write_file(dir / "cube.obj", cube_obj);
    test::write_file(dir / "project.xml",
        "<project>\n"
        "  <grid resolution=\"200\" family=\"plate\" max_voxels=\"1000\"/>\n"
        "  <target dir_out=\"out\"/>\n"
        "  <shape file_in=\"cube.obj\"/>\n"
        "</project>\n"
    );

    brickify::converter c{ cfg::xml_project(dir.string()) };
    EXPECT_EQ(0u, c.run());
    EXPECT_FALSE(std::filesystem::exists(dir / "out" / "cube.ldr"));
}
