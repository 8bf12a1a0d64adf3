#include "sync/KeyMapper.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace bk::sync;

TEST(KeyMapperTest, test_BackslashPathUnderPrefix) {
    EXPECT_EQ(mapKey("sub\\b.jpg", "backup/"), "backup/sub/b.jpg");
}

TEST(KeyMapperTest, test_EmptyPrefixLeavesPathUnchanged) {
    EXPECT_EQ(mapKey("a.txt", ""), "a.txt");
    EXPECT_EQ(mapKey("x/y/z.bin", ""), "x/y/z.bin");
    EXPECT_EQ(mapKey("x\\y\\z.bin", ""), "x/y/z.bin");
}

TEST(KeyMapperTest, test_PrefixSlashesAreTrimmed) {
    EXPECT_EQ(mapKey("f.txt", "/a/b/"), "a/b/f.txt");
    EXPECT_EQ(mapKey("f.txt", "///a///"), "a/f.txt");
    EXPECT_EQ(mapKey("f.txt", "a"), "a/f.txt");
    EXPECT_EQ(mapKey("f.txt", "a/b"), "a/b/f.txt");
}

TEST(KeyMapperTest, test_SlashOnlyPrefixActsAsEmpty) {
    EXPECT_EQ(mapKey("f.txt", "/"), "f.txt");
    EXPECT_EQ(mapKey("d\\f.txt", "///"), "d/f.txt");
}

TEST(KeyMapperTest, test_NoEscapingIsApplied) {
    EXPECT_EQ(mapKey("my file+%.txt", "p q"), "p q/my file+%.txt");
}

TEST(KeyMapperTest, test_OutputNeverContainsBackslash) {
    for (const auto* rel : {"a\\b\\c", "\\lead", "trail\\", "mixed/and\\both"})
        EXPECT_EQ(mapKey(rel, "pre").find('\\'), std::string::npos) << rel;
}

TEST(KeyMapperTest, test_HelperFunctions) {
    EXPECT_EQ(normalizeSeparators("a\\b/c\\"), "a/b/c/");
    EXPECT_EQ(trimSlashes("//x/y//"), "x/y");
    EXPECT_EQ(trimSlashes("////"), "");
    EXPECT_EQ(trimSlashes(""), "");
}

TEST(KeyMapperTest, test_JoinHasSingleSlashForLeadingSeparators) {
    EXPECT_EQ(mapKey("\\lead\\f.txt", "pre"), "pre/lead/f.txt");
    EXPECT_EQ(mapKey("/lead/f.txt", "backup/"), "backup/lead/f.txt");
    EXPECT_EQ(mapKey("//x", "/a/"), "a/x");
}

TEST(KeyMapperTest, test_KeyPropertiesHoldForAwkwardInputs) {
    const std::vector<std::string> paths{"a.txt", "sub\\b.jpg", "\\lead", "trail\\", "/abs/x", "//double",
                                         "mixed/and\\both", "", "/"};
    const std::vector<std::string> prefixes{"pre", "backup/", "/a/b/", "///", "x//"};

    for (const auto& p : paths) {
        const auto plain = mapKey(p, "");
        EXPECT_EQ(plain, normalizeSeparators(p)) << p;
        EXPECT_EQ(mapKey(plain, ""), plain) << p;

        for (const auto& x : prefixes) {
            const auto key = mapKey(p, x);
            const auto trimmed = trimSlashes(x);
            if (!trimmed.empty()) {
                EXPECT_FALSE(key.starts_with("/")) << key;
                ASSERT_TRUE(key.starts_with(trimmed + "/")) << key;
                EXPECT_NE(key.find("//", trimmed.size()), trimmed.size()) << "doubled slash at join: " << key;
            }
            EXPECT_EQ(mapKey(key, ""), key) << key;
        }
    }
}
