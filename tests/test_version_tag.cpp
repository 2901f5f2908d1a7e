#include <gtest/gtest.h>
#include "core/version_tag.hpp"

TEST(VersionTagTest, ParsePlain) {
    VersionTag v;
    ASSERT_TRUE(VersionTag::parse("1.2.3", v));
    EXPECT_EQ(v.major, 1);
    EXPECT_EQ(v.minor, 2);
    EXPECT_EQ(v.patch, 3);
}

TEST(VersionTagTest, ParseLeadingVAndWhitespace) {
    VersionTag v;
    ASSERT_TRUE(VersionTag::parse("  v10.0.7\n", v));
    EXPECT_EQ(v, (VersionTag{10, 0, 7}));
    ASSERT_TRUE(VersionTag::parse("V2.0.0", v));
    EXPECT_EQ(v, (VersionTag{2, 0, 0}));
}

TEST(VersionTagTest, ParseRejectsMalformed) {
    VersionTag v{9, 9, 9};
    EXPECT_FALSE(VersionTag::parse("", v));
    EXPECT_FALSE(VersionTag::parse("1.2", v));
    EXPECT_FALSE(VersionTag::parse("1.2.3.4", v));
    EXPECT_FALSE(VersionTag::parse("1.-2.3", v));
    EXPECT_FALSE(VersionTag::parse("1.2.x", v));
    EXPECT_FALSE(VersionTag::parse("1..3", v));
    EXPECT_FALSE(VersionTag::parse("1.2.3-beta", v));
    EXPECT_FALSE(VersionTag::parse("vv1.2.3", v));
    EXPECT_FALSE(VersionTag::parse("1.2.9999999999", v));
    // Untouched on failure
    EXPECT_EQ(v, (VersionTag{9, 9, 9}));
}

TEST(VersionTagTest, OrderingIsComponentWise) {
    EXPECT_LT((VersionTag{1, 2, 3}), (VersionTag{1, 2, 4}));
    EXPECT_LT((VersionTag{1, 2, 9}), (VersionTag{1, 10, 0}));
    EXPECT_LT((VersionTag{1, 99, 99}), (VersionTag{2, 0, 0}));
    EXPECT_GT((VersionTag{0, 10, 0}), (VersionTag{0, 9, 0}));
    EXPECT_EQ((VersionTag{1, 0, 0}), (VersionTag{1, 0, 0}));
    EXPECT_NE((VersionTag{1, 0, 0}), (VersionTag{1, 0, 1}));
}

TEST(VersionTagTest, Formatting) {
    VersionTag v{1, 20, 3};
    EXPECT_EQ(v.str(), "1.20.3");
    EXPECT_EQ(v.dir_name(), "v1_20_3");
}

TEST(VersionTagTest, FromDirName) {
    VersionTag v;
    ASSERT_TRUE(VersionTag::from_dir_name("v1_20_3", v));
    EXPECT_EQ(v, (VersionTag{1, 20, 3}));

    EXPECT_FALSE(VersionTag::from_dir_name("1_20_3", v));
    EXPECT_FALSE(VersionTag::from_dir_name("v1.20.3", v));
    EXPECT_FALSE(VersionTag::from_dir_name("v1_20_3.tmp", v));
    EXPECT_FALSE(VersionTag::from_dir_name("V1_20_3", v));
    EXPECT_FALSE(VersionTag::from_dir_name("v", v));
}
