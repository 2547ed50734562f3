#include <gtest/gtest.h>

#include "ldraw/parts.h"
#include "ldraw/summary.h"
#include "palette/palette.h"

#include <sstream>


class PartResolverTest : public ::testing::Test {
protected:
    ldraw::part_resolver _resolver{ ldraw::parts() };
};

TEST_F(PartResolverTest, LibraryContents) {
    EXPECT_EQ(14u, ldraw::parts().size());

    const ldraw::part_definition *p = ldraw::parts().find("3020.dat");
    ASSERT_NE(nullptr, p);
    EXPECT_EQ(plate, p->_family);
    EXPECT_EQ(4, p->_studs_x);
    EXPECT_EQ(2, p->_studs_y);

    p = ldraw::parts().find("3001");
    ASSERT_NE(nullptr, p);
    EXPECT_EQ("3001.dat", p->_part);
    EXPECT_EQ(brick, p->_family);
}

TEST_F(PartResolverTest, NormalizeKey) {
    EXPECT_EQ("3005.dat", ldraw::part_resolver::normalize_key("  Parts\\3005.DAT "));
    EXPECT_EQ("3024.dat", ldraw::part_resolver::normalize_key("ldraw/parts/3024.dat"));
    EXPECT_EQ("3023", ldraw::part_resolver::normalize_key("3023"));
    EXPECT_EQ("", ldraw::part_resolver::normalize_key("   "));
}

TEST_F(PartResolverTest, ResolvesVariants) {
    for(const std::string key : { "3005.dat", "3005", "3005.DAT", "parts\\3005.dat", " 3005 " }) {
        const ldraw::part_definition &def = _resolver.resolve(key);
        EXPECT_EQ("3005.dat", def._part) << key;
        EXPECT_EQ(brick, def._family) << key;
        EXPECT_TRUE(_resolver.known(key)) << key;
    }
    EXPECT_EQ(3, _resolver.resolve("3623.dat")._studs_x);
    EXPECT_EQ(1, _resolver.resolve("3623.dat")._studs_y);
}

TEST_F(PartResolverTest, UnknownPartsFallBack) {
    for(const std::string key : { "", "9999.dat", "s/3005s01.dat", "3005x.dat" }) {
        const ldraw::part_definition &def = _resolver.resolve(key);
        EXPECT_EQ("3024.dat", def._part) << key;
        EXPECT_EQ(brick, def._family) << key;
        EXPECT_EQ(1, def._studs_x) << key;
        EXPECT_EQ(1, def._studs_y) << key;
        EXPECT_FALSE(_resolver.known(key)) << key;
    }
}

// =============================================================================
// Summary
// =============================================================================

TEST_F(PartResolverTest, DisplayColors) {
    uint32_t rgb = 0;
    EXPECT_TRUE(ldraw::display_rgb(ldraw::color::from_rgb(0x123456), palette::extended(), rgb));
    EXPECT_EQ(0x123456u, rgb);
    EXPECT_TRUE(ldraw::display_rgb(ldraw::color::from_code(15), palette::extended(), rgb));
    EXPECT_EQ(0xF4F4F4u, rgb);
    EXPECT_FALSE(ldraw::display_rgb(ldraw::color::from_code(9999), palette::extended(), rgb));
}

TEST_F(PartResolverTest, Summarize) {
    std::vector<ldraw::placement> records(4);
    records[0]._part = "3005.dat";
    records[0]._color = ldraw::color::from_code(4);
    records[1]._part = "PARTS\\3005.DAT";
    records[1]._color = ldraw::color::from_code(4);
    records[2]._part = "unknown.dat";
    records[2]._color = ldraw::color::from_code(9999);
    records[3]._part = "3024";
    records[3]._color = ldraw::color::from_rgb(0x1A2B3C);

    const ldraw::report r = ldraw::summarize(records, _resolver, palette::extended());
    EXPECT_EQ(4u, r._count);
    EXPECT_EQ(2u, r._parts.at("3005.dat"));
    // the unknown part is counted as the fallback part
    EXPECT_EQ(2u, r._parts.at("3024.dat"));
    EXPECT_EQ(2u, r._colors.at("4"));
    EXPECT_EQ(1u, r._colors.at("0x21A2B3C"));
    EXPECT_EQ(1u, r._unknown_parts);
    EXPECT_EQ(1u, r._no_display_color);

    std::ostringstream oss;
    oss << r;
    EXPECT_NE(std::string::npos, oss.str().find("4 parts"));
    EXPECT_NE(std::string::npos, oss.str().find("3005.dat: 2"));
}
