#include "guestdrop/upload/filename.hpp"

#include <gtest/gtest.h>

using guestdrop::upload::MediaCategory;
using guestdrop::upload::classify_extension;
using guestdrop::upload::extension_of;
using guestdrop::upload::sanitize;
using guestdrop::upload::sanitize_filename;

TEST(SanitizeTest, CollapsesWhitespaceAndHyphens) {
    EXPECT_EQ(sanitize("Anna Maria"), "Anna_Maria");
    EXPECT_EQ(sanitize("  Anna   -  Maria  "), "Anna_Maria");
    EXPECT_EQ(sanitize("a-b-c"), "a_b_c");
}

TEST(SanitizeTest, DropsPathAndPunctuation) {
    EXPECT_EQ(sanitize("../../etc/passwd"), "etcpasswd");
    EXPECT_EQ(sanitize("O'Brien!"), "OBrien");
    EXPECT_EQ(sanitize("a - . - b"), "a_b");
    EXPECT_EQ(sanitize("..."), "");
    EXPECT_EQ(sanitize("   "), "");
}

TEST(SanitizeTest, KeepsNonAsciiLetters) {
    EXPECT_EQ(sanitize("J\xC3\xBCrgen"), "J\xC3\xBCrgen");
    EXPECT_EQ(sanitize("\xE6\x9D\xB1\xE4\xBA\xAC"), "\xE6\x9D\xB1\xE4\xBA\xAC");
    EXPECT_EQ(sanitize("party \xF0\x9F\x8E\x89"), "party_\xF0\x9F\x8E\x89");
}

TEST(SanitizeTest, DropsMalformedUtf8) {
    EXPECT_EQ(sanitize("\xFF\xFE"), "");
    EXPECT_EQ(sanitize("Ann\xC3"), "Ann");
    EXPECT_EQ(sanitize("a\xC0\xAF" "b"), "ab");
    EXPECT_EQ(sanitize("x\xED\xA0\x80y"), "xy");
    EXPECT_EQ(sanitize("\x80J\xC3\xBCrgen\xBF"), "J\xC3\xBCrgen");
    EXPECT_EQ(sanitize_filename("\xFF\xFE.jpg"), "");
}

TEST(SanitizeFilenameTest, PreservesExtension) {
    EXPECT_EQ(sanitize_filename("My Trip.JPG"), "My_Trip.jpg");
    EXPECT_EQ(sanitize_filename("clip.final.mp4"), "clipfinal.mp4");
}

TEST(SanitizeFilenameTest, DiscardsDirectories) {
    EXPECT_EQ(sanitize_filename("../../evil.png"), "evil.png");
    EXPECT_EQ(sanitize_filename("C:\\Users\\me\\IMG 1.heic"), "IMG_1.heic");
}

TEST(SanitizeFilenameTest, RejectsUnusableNames) {
    EXPECT_EQ(sanitize_filename("noextension"), "");
    EXPECT_EQ(sanitize_filename(".jpg"), "");
    EXPECT_EQ(sanitize_filename("photo."), "");
    EXPECT_EQ(sanitize_filename("!!!.jpg"), "");
    EXPECT_EQ(sanitize_filename(""), "");
}

TEST(ClassifyExtensionTest, AllowList) {
    EXPECT_EQ(classify_extension("a.jpg"), MediaCategory::Image);
    EXPECT_EQ(classify_extension("a.JPEG"), MediaCategory::Image);
    EXPECT_EQ(classify_extension("a.heic"), MediaCategory::Image);
    EXPECT_EQ(classify_extension("a.mov"), MediaCategory::Video);
    EXPECT_EQ(classify_extension("a.MP4"), MediaCategory::Video);
    EXPECT_EQ(classify_extension("a.exe"), MediaCategory::Unsupported);
    EXPECT_EQ(classify_extension("a.pdf"), MediaCategory::Unsupported);
    EXPECT_EQ(classify_extension("noext"), MediaCategory::Unsupported);
}

TEST(ClassifyExtensionTest, ExtensionOf) {
    EXPECT_EQ(extension_of("dir.d/photo.PNG"), "png");
    EXPECT_EQ(extension_of("dir.d/photo"), "");
    EXPECT_EQ(extension_of("photo."), "");
}
