#include <gtest/gtest.h>

#include "ldraw/encoder.h"
#include "ldraw/document.h"
#include "family.h"
#include "test_helpers.h"

#include <cmath>


namespace {
    rasterize::voxel make_voxel(const int i, const int j, const int k, const uint32_t rgb) {
        rasterize::voxel v;
        v._pos = glm::ivec3(i, j, k);
        v._rgb = rgb;
        return v;
    }
};

class EncoderTest : public ::testing::Test {
protected:
    palette::quantizer _quantizer{ palette::curated() };
};

TEST_F(EncoderTest, BrickPositions) {
    const ldraw::encoder enc(_quantizer, brick);
    const ldraw::placement p = enc.encode(make_voxel(2, 3, 4, 0xC91A09));

    EXPECT_VEC3_NEAR(glm::vec3(40, -72, 80), p._position, 0.f);
    EXPECT_EQ(glm::mat3(1), p._rotation);
    EXPECT_EQ("3005.dat", p._part);
    EXPECT_EQ(ldraw::color::from_code(4), p._color);
}

TEST_F(EncoderTest, PlatePositions) {
    const ldraw::encoder enc(_quantizer, plate);
    const ldraw::placement p = enc.encode(make_voxel(1, 5, 0, 0xFFFFFF));

    EXPECT_VEC3_NEAR(glm::vec3(20, -40, 0), p._position, 0.f);
    EXPECT_EQ("3024.dat", p._part);
    EXPECT_EQ(15, p._color.code());
    EXPECT_FALSE(p._color._direct);
}

TEST_F(EncoderTest, GroundLayerHasNoNegativeZero) {
    const ldraw::encoder enc(_quantizer, plate);
    const ldraw::placement p = enc.encode(make_voxel(0, 0, 0, 0));
    EXPECT_FALSE(std::signbit(p._position.y));
    EXPECT_EQ("1 0 0 0 0 1 0 0 0 1 0 0 0 1 3024.dat", ldraw::document::serialize_line(p));
}

TEST_F(EncoderTest, QuantizesToNearestCode) {
    const ldraw::encoder enc(_quantizer, brick);
    EXPECT_EQ(4, enc.encode(make_voxel(0, 0, 0, 0xFE0000))._color.code());
    EXPECT_EQ(1, enc.encode(make_voxel(0, 0, 0, 0x0050C0))._color.code());
}

TEST_F(EncoderTest, DirectColors) {
    const ldraw::encoder enc(_quantizer, brick, direct);
    const ldraw::placement p = enc.encode(make_voxel(0, 0, 0, 0x1A2B3C));

    EXPECT_TRUE(p._color._direct);
    EXPECT_EQ(0x21A2B3C, p._color._value);
    EXPECT_EQ(0x1A2B3Cu, p._color.rgb());
    EXPECT_EQ("#1a2b3c", p._color.hex());
    EXPECT_EQ("0x21A2B3C", p._color.token());
}

TEST_F(EncoderTest, ColorSourceOverridesVoxelColor) {
    const ldraw::color_source source = [](const rasterize::voxel &v) {
        return v._pos.x == 0 ? 0xC91A09u : 0x0055BFu;
    };
    const std::vector<rasterize::voxel> voxels = { make_voxel(0, 0, 0, 0xFFFFFF), make_voxel(1, 0, 0, 0xFFFFFF) };

    const std::vector<ldraw::placement> q = ldraw::encoder(_quantizer, brick, quantized, source).encode(voxels);
    ASSERT_EQ(2u, q.size());
    EXPECT_EQ(4, q[0]._color.code());
    EXPECT_EQ(1, q[1]._color.code());

    const std::vector<ldraw::placement> d = ldraw::encoder(_quantizer, brick, direct, source).encode(voxels);
    ASSERT_EQ(2u, d.size());
    EXPECT_EQ("0x2C91A09", d[0]._color.token());
    EXPECT_EQ("0x20055BF", d[1]._color.token());
}

TEST_F(EncoderTest, KeepsVoxelOrder) {
    const std::vector<rasterize::voxel> voxels = {
        make_voxel(0, 0, 0, 0),
        make_voxel(0, 1, 0, 0),
        make_voxel(1, 0, 3, 0)
    };
    const std::vector<ldraw::placement> records = ldraw::encoder(_quantizer, brick).encode(voxels);
    ASSERT_EQ(3u, records.size());
    EXPECT_FLOAT_EQ(-24.f, records[1]._position.y);
    EXPECT_FLOAT_EQ(20.f, records[2]._position.x);
    EXPECT_FLOAT_EQ(60.f, records[2]._position.z);

    EXPECT_TRUE(ldraw::encoder(_quantizer, plate).encode(std::vector<rasterize::voxel>()).empty());
}

TEST(FamilyTraits, Table) {
    EXPECT_FLOAT_EQ(0.4f, traits(plate)._height_ratio);
    EXPECT_FLOAT_EQ(8.f, traits(plate)._layer_height);
    EXPECT_FLOAT_EQ(1.2f, traits(brick)._height_ratio);
    EXPECT_FLOAT_EQ(24.f, traits(brick)._layer_height);

    block_family f = plate;
    EXPECT_TRUE(family_from_string("brick", f));
    EXPECT_EQ(brick, f);
    EXPECT_FALSE(family_from_string("tile", f));
    EXPECT_EQ(brick, f);
}
