//
// Created by Giuseppe Francione on 20/01/26.
//

#include "../libwebpress/include/folder_scanner.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace webpress;

namespace {

std::vector<std::string> names(const std::vector<fs::path>& paths) {
    std::vector<std::string> out;
    for (const auto& p : paths) out.push_back(p.filename().string());
    return out;
}

} // namespace

TEST(FolderScanner, CollectsSupportedFilesInNaturalOrder) {
    const test::TempDir tmp;
    const auto folder = tmp.make_folder("comic");
    for (const char* n : {"p10.jpg", "p2.PNG", "p1.webp", "notes.txt", "cover.gif", ".DS_Store", "._p3.jpg"}) {
        test::write_file(folder / n, 4);
    }
    fs::create_directories(folder / "sub.png");
    test::write_file(folder / "nested_dir_file.bmp", 4);

    const FolderBatch batch = scan_folder(folder, false);
    EXPECT_EQ(names(batch.all_images),
              (std::vector<std::string>{"nested_dir_file.bmp", "p1.webp", "p2.PNG", "p10.jpg"}));
    EXPECT_EQ(batch.convertible_images, batch.all_images);
    EXPECT_TRUE(batch.skipped_webp.empty());
}

TEST(FolderScanner, NotRecursive) {
    const test::TempDir tmp;
    const auto folder = tmp.make_folder("top");
    fs::create_directories(folder / "inner");
    test::write_file(folder / "inner" / "deep.png", 4);

    EXPECT_TRUE(scan_folder(folder, false).all_images.empty());
}

TEST(FolderScanner, SkipModePartitionsWebp) {
    const test::TempDir tmp;
    const auto folder = tmp.make_folder("mixed");
    test::write_file(folder / "a.webp", 4);
    test::write_file(folder / "b.jpg", 4);
    test::write_file(folder / "c.WEBP", 4);

    const FolderBatch batch = scan_folder(folder, true);
    EXPECT_EQ(names(batch.convertible_images), std::vector<std::string>{"b.jpg"});
    EXPECT_EQ(names(batch.skipped_webp), (std::vector<std::string>{"a.webp", "c.WEBP"}));
    EXPECT_EQ(batch.all_images.size(), 3u);
}

TEST(FolderScanner, OnlyWebpWithSkip) {
    const test::TempDir tmp;
    const auto folder = tmp.make_folder("done");
    test::write_file(folder / "1.webp", 4);
    test::write_file(folder / "2.webp", 4);

    const FolderBatch batch = scan_folder(folder, true);
    EXPECT_TRUE(batch.convertible_images.empty());
    EXPECT_EQ(batch.skipped_webp.size(), 2u);
}

TEST(FolderScanner, MissingFoldersAreReportedNotFatal) {
    const test::TempDir tmp;
    const auto good = tmp.make_folder("good");
    test::write_file(good / "x.png", 4);
    test::write_file(tmp.path() / "plain_file.png", 4);

    const ScanResult result = scan_folders({tmp.path() / "nope", good, tmp.path() / "plain_file.png"}, false);
    ASSERT_EQ(result.batches.size(), 1u);
    EXPECT_EQ(result.batches[0].folder, good);
    EXPECT_EQ(result.missing_folders.size(), 2u);
    EXPECT_EQ(result.total_files(), 1u);
    EXPECT_EQ(result.total_convertible(), 1u);
}

TEST(FolderScanner, RelativeSpellingsAreNormalized) {
    const test::TempDir tmp;
    const auto good = tmp.make_folder("good");
    fs::create_directories(good / "inner");
    test::write_file(good / "x.png", 4);

    const ScanResult result = scan_folders({good / ".", good / "inner" / "..", good.string() + "/"}, false);
    ASSERT_EQ(result.batches.size(), 3u);
    for (const auto& batch : result.batches) {
        EXPECT_EQ(batch.folder, good);
        EXPECT_EQ(batch.folder.filename(), "good");
        EXPECT_EQ(batch.all_images.size(), 1u);
    }
}

TEST(FolderScanner, DotIsTheCurrentDirectory) {
    const test::TempDir tmp;
    const auto here = tmp.make_folder("here");
    test::write_file(here / "x.jpg", 4);

    const fs::path previous = fs::current_path();
    fs::current_path(here);
    const ScanResult result = scan_folders({"."}, false);
    fs::current_path(previous);

    ASSERT_EQ(result.batches.size(), 1u);
    EXPECT_EQ(result.batches[0].folder.filename(), "here");
    EXPECT_EQ(result.batches[0].all_images.size(), 1u);
}

TEST(FolderScanner, OutputNamesNeverCollide) {
    const test::TempDir tmp;
    const auto folder = tmp.make_folder("mixed");
    for (const char* n : {"a.jpg", "a.png", "a.webp", "a_png.webp", "b.tif"}) {
        test::write_file(folder / n, 4);
    }

    const FolderBatch batch = scan_folder(folder, false);
    ASSERT_EQ(names(batch.convertible_images),
              (std::vector<std::string>{"a.jpg", "a.png", "a.webp", "a_png.webp", "b.tif"}));
    EXPECT_EQ(names(assign_output_names(batch)),
              (std::vector<std::string>{"a_jpg.webp", "a_png_2.webp", "a.webp", "a_png.webp", "b.webp"}));
}

TEST(FolderScanner, OutputNamesAvoidSkippedWebp) {
    const test::TempDir tmp;
    const auto folder = tmp.make_folder("skip");
    test::write_file(folder / "cover.WEBP", 4);
    test::write_file(folder / "cover.png", 4);
    test::write_file(folder / "p1.jpg", 4);

    const FolderBatch batch = scan_folder(folder, true);
    EXPECT_EQ(names(assign_output_names(batch)), (std::vector<std::string>{"cover_png.webp", "p1.webp"}));
}
