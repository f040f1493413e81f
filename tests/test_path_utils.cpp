#include "fetcher/detail/path_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using fetcher::detail::fileNameFromUrl;
using fetcher::detail::numberedPath;

TEST(PathUtilsTest, FileNameIsLastPathSegment) {
    EXPECT_EQ(fileNameFromUrl("http://example.com/files/archive.tar.gz"), "archive.tar.gz");
    EXPECT_EQ(fileNameFromUrl("https://example.com/a/b/c.iso"), "c.iso");
}

TEST(PathUtilsTest, FileNameDropsQueryAndFragment) {
    EXPECT_EQ(fileNameFromUrl("http://example.com/get/data.csv?token=abc/def"), "data.csv");
    EXPECT_EQ(fileNameFromUrl("http://example.com/doc.pdf#page=2"), "doc.pdf");
}

TEST(PathUtilsTest, DirectoryUrlsFallBackToIndex) {
    EXPECT_EQ(fileNameFromUrl("http://example.com"), "index.html");
    EXPECT_EQ(fileNameFromUrl("http://example.com/"), "index.html");
    EXPECT_EQ(fileNameFromUrl("http://example.com/dir/"), "index.html");
    EXPECT_EQ(fileNameFromUrl("http://example.com/?q=1"), "index.html");
}

TEST(PathUtilsTest, NumberedPathKeepsExtension) {
    const std::filesystem::path dir{"downloads"};
    EXPECT_EQ(numberedPath((dir / "a.zip").string(), 1), (dir / "a (1).zip").string());
    EXPECT_EQ(numberedPath((dir / "a.zip").string(), 12), (dir / "a (12).zip").string());
}

TEST(PathUtilsTest, NumberedPathWithoutExtension) {
    const std::filesystem::path dir{"downloads"};
    EXPECT_EQ(numberedPath((dir / "README").string(), 2), (dir / "README (2)").string());
}

TEST(PathUtilsTest, NumberedPathOnlyNumbersTheLastExtension) {
    EXPECT_EQ(numberedPath("x.tar.gz", 1), "x.tar (1).gz");
}
