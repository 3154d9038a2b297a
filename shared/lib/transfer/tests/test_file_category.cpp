/**
 * @file test_file_category.cpp
 * @brief Unit tests for extension-based file categories
 */

#include <gtest/gtest.h>
#include <flashare/transfer/file_category.h>

using namespace flashare::transfer;

TEST(FileCategoryTest, Images) {
    EXPECT_EQ(categorize("photo.jpg"), FileCategory::IMAGE);
    EXPECT_EQ(categorize("photo.JPEG"), FileCategory::IMAGE);
    EXPECT_EQ(categorize("icon.svg"), FileCategory::IMAGE);
    EXPECT_EQ(categorize("IMG_0001.HEIC"), FileCategory::IMAGE);
}

TEST(FileCategoryTest, VideoAudioDocument) {
    EXPECT_EQ(categorize("clip.mkv"), FileCategory::VIDEO);
    EXPECT_EQ(categorize("clip.m4v"), FileCategory::VIDEO);
    EXPECT_EQ(categorize("song.flac"), FileCategory::AUDIO);
    EXPECT_EQ(categorize("memo.m4a"), FileCategory::AUDIO);
    EXPECT_EQ(categorize("report.pdf"), FileCategory::DOCUMENT);
    EXPECT_EQ(categorize("README.md"), FileCategory::DOCUMENT);
    EXPECT_EQ(categorize("data.csv"), FileCategory::DOCUMENT);
}

TEST(FileCategoryTest, UnknownFallsBackToFile) {
    EXPECT_EQ(categorize("archive.zip"), FileCategory::FILE);
    EXPECT_EQ(categorize("Makefile"), FileCategory::FILE);
    EXPECT_EQ(categorize("trailing."), FileCategory::FILE);
    EXPECT_EQ(categorize(""), FileCategory::FILE);
}

TEST(FileCategoryTest, OnlyLastExtensionCounts) {
    EXPECT_EQ(categorize("backup.pdf.zip"), FileCategory::FILE);
    EXPECT_EQ(categorize("backup.zip.pdf"), FileCategory::DOCUMENT);
}

TEST(FileCategoryTest, HiddenFileWithoutExtension) {
    EXPECT_EQ(fileExtension(".bashrc"), "");
    EXPECT_EQ(categorize(".bashrc"), FileCategory::FILE);
}

TEST(FileCategoryTest, FileExtensionLowercased) {
    EXPECT_EQ(fileExtension("A.TXT"), "txt");
    EXPECT_EQ(fileExtension("noext"), "");
}

TEST(FileCategoryTest, CategoryNames) {
    EXPECT_EQ(categoryToString(FileCategory::IMAGE), "image");
    EXPECT_EQ(categoryToString(FileCategory::VIDEO), "video");
    EXPECT_EQ(categoryToString(FileCategory::AUDIO), "audio");
    EXPECT_EQ(categoryToString(FileCategory::DOCUMENT), "document");
    EXPECT_EQ(categoryToString(FileCategory::FILE), "file");
}
