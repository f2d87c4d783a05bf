//
// Created by Giuseppe Francione on 21/01/26.
//

#include "../libwebpress/include/file_utils.hpp"
#include "../libwebpress/include/run_coordinator.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace webpress;

namespace {

class RunCoordinatorTest : public ::testing::Test {
protected:
    test::TempDir tmp;
    EventBus bus;
    test::EventRecorder events{bus};
    CancellationToken token;
    test::FakeEncoder encoder;

    RunSummary run(RunConfig cfg) {
        RunCoordinator coordinator(std::move(cfg), encoder, bus, token);
        return coordinator.run();
    }

    fs::path folder_with(const std::string& name, const std::vector<std::pair<std::string, std::size_t>>& files) {
        const auto folder = tmp.make_folder(name);
        for (const auto& [file, size] : files) {
            test::write_file(folder / file, size);
        }
        return folder;
    }

    void expect_monotonic_progress() const {
        EXPECT_TRUE(std::ranges::is_sorted(events.progress));
        for (const int p : events.progress) {
            EXPECT_GE(p, 0);
            EXPECT_LE(p, 100);
        }
    }

    void expect_single_terminal(const bool cancelled) const {
        ASSERT_EQ(events.summaries.size(), 1u);
        ASSERT_EQ(events.finished.size(), 1u);
        EXPECT_EQ(events.finished[0], cancelled);
        EXPECT_EQ(events.summaries[0].cancelled, cancelled);
    }
};

} // namespace

TEST_F(RunCoordinatorTest, ThreeImagesIntoZip) {
    const auto folder = folder_with("F", {{"a.png", 100}, {"b.jpg", 200}, {"c.bmp", 300}});

    RunConfig cfg;
    cfg.folders = {folder};
    cfg.quality = 75;
    const RunSummary s = run(cfg);

    expect_single_terminal(false);
    ASSERT_EQ(s.folders.size(), 1u);
    const FolderSummary& f = s.folders[0];
    EXPECT_EQ(f.converted, 3u);
    EXPECT_EQ(f.bytes_original, 600u);
    EXPECT_EQ(f.bytes_converted, 30u);
    EXPECT_TRUE(f.errors.empty());
    ASSERT_TRUE(f.archive_path.has_value());
    EXPECT_EQ(*f.archive_path, tmp.path() / "F.zip");
    ASSERT_TRUE(f.archive_size.has_value());
    EXPECT_GT(*f.archive_size, 0u);
    EXPECT_EQ(test::zip_entry_names(*f.archive_path), (std::vector<std::string>{"a.webp", "b.webp", "c.webp"}));

    EXPECT_EQ(s.totals.converted, 3u);
    EXPECT_EQ(s.totals.bytes_saved, 570u);
    EXPECT_EQ(s.totals.archives, 1u);
    EXPECT_EQ(s.total_images, 3u);
    EXPECT_EQ(s.processed_images, 3u);
    EXPECT_EQ(s.expected_conversions, 3u);

    ASSERT_EQ(encoder.requests.size(), 3u);
    EXPECT_EQ(encoder.requests[0].quality, 75);
    EXPECT_EQ(encoder.requests[0].source_format, ImageFormat::Png);
    EXPECT_EQ(encoder.requests[0].target, temp_dir_for(folder) / "a.webp");
    EXPECT_EQ(encoder.availability_checks, 1);

    expect_monotonic_progress();
    ASSERT_FALSE(events.progress.empty());
    EXPECT_EQ(events.progress.back(), 100);
    EXPECT_FALSE(fs::exists(temp_dir_for(folder)));
}

TEST_F(RunCoordinatorTest, FailuresAreRecordedAndRunContinues) {
    const auto first = folder_with("one", {{"1.jpg", 50}, {"2.jpg", 50}, {"3.jpg", 50}, {"4.jpg", 50}});
    const auto second = folder_with("two", {{"x.png", 10}});
    encoder.failing = {"2.jpg"};
    encoder.throwing = {"4.jpg"};

    RunConfig cfg;
    cfg.folders = {first, second};
    const RunSummary s = run(cfg);

    expect_single_terminal(false);
    ASSERT_EQ(s.folders.size(), 2u);
    EXPECT_EQ(s.folders[0].converted, 2u);
    ASSERT_EQ(s.folders[0].errors.size(), 2u);
    EXPECT_EQ(s.folders[0].errors[0].rfind("2.jpg", 0), 0u);
    EXPECT_EQ(s.folders[0].errors[1].rfind("4.jpg", 0), 0u);
    EXPECT_EQ(s.folders[0].bytes_original, 100u);
    EXPECT_EQ(s.folders[1].converted, 1u);
    EXPECT_EQ(s.totals.errors, 2u);
    EXPECT_EQ(events.image_errors.size(), 2u);
    EXPECT_EQ(s.processed_images, 5u);
    EXPECT_EQ(events.progress.back(), 100);
    expect_monotonic_progress();

    // failed images are left out of the archive
    EXPECT_EQ(test::zip_entry_names(tmp.path() / "one.zip"), (std::vector<std::string>{"1.webp", "3.webp"}));
}

TEST_F(RunCoordinatorTest, EncoderAbsentYieldsEmptySummary) {
    folder_with("F", {{"a.png", 100}});
    encoder.available = false;

    RunConfig cfg;
    cfg.folders = {tmp.path() / "F"};
    const RunSummary s = run(cfg);

    expect_single_terminal(false);
    EXPECT_EQ(s.totals.converted, 0u);
    EXPECT_EQ(s.processed_images, 0u);
    EXPECT_TRUE(s.folders.empty());
    EXPECT_TRUE(encoder.requests.empty());
    EXPECT_FALSE(events.statuses.empty());
    EXPECT_FALSE(fs::exists(tmp.path() / "F.zip"));
}

TEST_F(RunCoordinatorTest, CancelBeforeSecondFolder) {
    const auto a = folder_with("a", {{"1.png", 10}});
    const auto b = folder_with("b", {{"1.png", 10}});
    const auto c = folder_with("c", {{"1.png", 10}});
    bus.subscribe<FolderCompleteEvent>([this](const FolderCompleteEvent&) { token.request(); });

    RunConfig cfg;
    cfg.folders = {a, b, c};
    const RunSummary s = run(cfg);

    expect_single_terminal(true);
    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_EQ(s.folders[0].folder, a);
    EXPECT_EQ(events.folders_started.size(), 1u);
    EXPECT_EQ(encoder.requests.size(), 1u);
    EXPECT_TRUE(fs::exists(tmp.path() / "a.zip"));
    EXPECT_FALSE(fs::exists(tmp.path() / "b.zip"));
    EXPECT_FALSE(fs::exists(temp_dir_for(b)));
    expect_monotonic_progress();
}

TEST_F(RunCoordinatorTest, CancelBeforeFirstFolder) {
    const auto a = folder_with("a", {{"1.png", 10}});
    token.request();

    RunConfig cfg;
    cfg.folders = {a};
    const RunSummary s = run(cfg);

    expect_single_terminal(true);
    EXPECT_TRUE(s.folders.empty());
    EXPECT_TRUE(encoder.requests.empty());
    EXPECT_EQ(s.total_images, 1u);
    EXPECT_EQ(s.processed_images, 0u);
}

TEST_F(RunCoordinatorTest, CancelMidFolderDiscardsOutputs) {
    const auto a = folder_with("a", {{"1.png", 10}, {"2.png", 10}, {"3.png", 10}, {"4.png", 10}});
    encoder.on_encode = [this](const EncodeRequest&) {
        if (encoder.requests.size() == 2) token.request();
    };

    RunConfig cfg;
    cfg.folders = {a};
    const RunSummary s = run(cfg);

    expect_single_terminal(true);
    EXPECT_EQ(encoder.requests.size(), 2u);
    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_EQ(s.folders[0].converted, 2u);
    EXPECT_FALSE(s.folders[0].archive_path.has_value());
    EXPECT_FALSE(fs::exists(tmp.path() / "a.zip"));
    EXPECT_FALSE(fs::exists(temp_dir_for(a)));
    EXPECT_EQ(s.processed_images, 2u);
    for (const char* n : {"1.png", "2.png", "3.png", "4.png"}) {
        EXPECT_TRUE(fs::exists(a / n));
    }
}

TEST_F(RunCoordinatorTest, CancelAfterLastImageSkipsStrategy) {
    const auto a = folder_with("a", {{"1.png", 10}, {"2.png", 10}});
    encoder.on_encode = [this](const EncodeRequest&) {
        if (encoder.requests.size() == 2) token.request();
    };

    RunConfig cfg;
    cfg.folders = {a};
    cfg.replace_originals = true;
    const RunSummary s = run(cfg);

    expect_single_terminal(true);
    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_EQ(s.folders[0].converted, 2u);
    // no replacement happened
    EXPECT_TRUE(fs::exists(a / "1.png"));
    EXPECT_FALSE(fs::exists(a / "1.webp"));
    EXPECT_FALSE(fs::exists(temp_dir_for(a)));
}

TEST_F(RunCoordinatorTest, ReplaceModeNeverArchives) {
    const auto a = folder_with("a", {{"1.png", 100}, {"2.jpg", 100}});
    encoder.failing = {"2.jpg"};

    RunConfig cfg;
    cfg.folders = {a};
    cfg.replace_originals = true;
    cfg.archive_format = ArchiveFormat::Cbz;
    const RunSummary s = run(cfg);

    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_FALSE(s.folders[0].archive_path.has_value());
    EXPECT_FALSE(s.folders[0].archive_size.has_value());
    EXPECT_EQ(s.totals.archives, 0u);
    EXPECT_FALSE(fs::exists(tmp.path() / "a.cbz"));
    EXPECT_FALSE(fs::exists(a / "1.png"));
    EXPECT_TRUE(fs::exists(a / "1.webp"));
    EXPECT_TRUE(fs::exists(a / "2.jpg"));
    EXPECT_FALSE(fs::exists(temp_dir_for(a)));
}

TEST_F(RunCoordinatorTest, ArchiveModeKeepsSources) {
    const auto a = folder_with("a", {{"1.png", 100}, {"2.tif", 100}, {"3.webp", 100}});

    RunConfig cfg;
    cfg.folders = {a};
    cfg.archive_format = ArchiveFormat::Cbz;
    const RunSummary s = run(cfg);

    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_EQ(s.folders[0].converted, 3u);
    EXPECT_EQ(*s.folders[0].archive_path, tmp.path() / "a.cbz");
    for (const char* n : {"1.png", "2.tif", "3.webp"}) {
        EXPECT_TRUE(fs::exists(a / n)) << n;
    }
}

TEST_F(RunCoordinatorTest, SkipOnlyFolderIsSoftNote) {
    const auto done = folder_with("done", {{"1.webp", 10}, {"2.webp", 10}});
    const auto todo = folder_with("todo", {{"1.jpg", 10}, {"0.webp", 10}});

    RunConfig cfg;
    cfg.folders = {done, todo};
    cfg.skip_existing_webp = true;
    const RunSummary s = run(cfg);

    expect_single_terminal(false);
    ASSERT_EQ(s.folders.size(), 2u);
    EXPECT_EQ(s.folders[0].converted, 0u);
    EXPECT_EQ(s.folders[0].skipped_existing, 2u);
    EXPECT_TRUE(s.folders[0].errors.empty());
    EXPECT_FALSE(s.folders[0].archive_path.has_value());
    EXPECT_FALSE(fs::exists(tmp.path() / "done.zip"));
    EXPECT_TRUE(std::ranges::any_of(events.statuses, [](const std::string& m) {
        return m.find("nothing to convert") != std::string::npos;
    }));

    EXPECT_EQ(s.folders[1].converted, 1u);
    EXPECT_EQ(s.folders[1].skipped_existing, 1u);
    EXPECT_EQ(test::zip_entry_names(tmp.path() / "todo.zip"), (std::vector<std::string>{"0.webp", "1.webp"}));
    EXPECT_EQ(s.totals.skipped_existing, 3u);
    EXPECT_EQ(s.total_images, 4u);
    EXPECT_EQ(s.expected_conversions, 1u);
    EXPECT_EQ(encoder.requests.size(), 1u);
    EXPECT_EQ(events.progress.back(), 100);
    expect_monotonic_progress();
}

TEST_F(RunCoordinatorTest, NothingToConvertAnywhere) {
    const auto done = folder_with("done", {{"1.webp", 10}});

    RunConfig cfg;
    cfg.folders = {done};
    cfg.skip_existing_webp = true;
    const RunSummary s = run(cfg);

    expect_single_terminal(false);
    EXPECT_TRUE(s.folders.empty());
    EXPECT_EQ(s.totals.converted, 0u);
    EXPECT_EQ(s.expected_conversions, 0u);
    EXPECT_EQ(s.total_images, 1u);
    EXPECT_FALSE(fs::exists(tmp.path() / "done.zip"));
    ASSERT_FALSE(events.progress.empty());
    EXPECT_EQ(events.progress.back(), 100);
}

TEST_F(RunCoordinatorTest, MissingFolderIsReportedAndSkipped) {
    const auto a = folder_with("a", {{"1.png", 10}});

    RunConfig cfg;
    cfg.folders = {tmp.path() / "missing", a};
    const RunSummary s = run(cfg);

    expect_single_terminal(false);
    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_EQ(s.folders[0].folder, a);
    EXPECT_TRUE(std::ranges::any_of(events.statuses, [](const std::string& m) {
        return m.find("missing") != std::string::npos;
    }));
}

TEST_F(RunCoordinatorTest, StaleTempOutputIsNotTrusted) {
    const auto a = folder_with("a", {{"1.png", 10}});
    fs::create_directories(temp_dir_for(a));
    test::write_file(temp_dir_for(a) / "leftover.webp", 10);

    RunConfig cfg;
    cfg.folders = {a};
    run(cfg);

    EXPECT_EQ(test::zip_entry_names(tmp.path() / "a.zip"), std::vector<std::string>{"1.webp"});
}

TEST_F(RunCoordinatorTest, QualityIsClamped) {
    const auto a = folder_with("a", {{"1.jpg", 10}});

    RunConfig cfg;
    cfg.folders = {a};
    cfg.quality = 4;
    run(cfg);

    ASSERT_EQ(encoder.requests.size(), 1u);
    EXPECT_EQ(encoder.requests[0].quality, kMinQuality);
}

TEST_F(RunCoordinatorTest, UnremovableArchiveIsFolderScoped) {
    const auto a = folder_with("a", {{"1.png", 10}});
    const auto b = folder_with("b", {{"1.png", 10}});
    fs::create_directories(tmp.path() / "a.zip");
    test::write_file(tmp.path() / "a.zip" / "keep", 1);

    RunConfig cfg;
    cfg.folders = {a, b};
    const RunSummary s = run(cfg);

    ASSERT_EQ(s.folders.size(), 2u);
    EXPECT_EQ(s.folders[0].errors.size(), 1u);
    EXPECT_FALSE(s.folders[0].archive_path.has_value());
    EXPECT_TRUE(s.folders[1].errors.empty());
    EXPECT_TRUE(s.folders[1].archive_path.has_value());
    EXPECT_EQ(s.totals.archives, 1u);
    EXPECT_FALSE(fs::exists(temp_dir_for(a)));
}

TEST_F(RunCoordinatorTest, SharedStemsKeepEveryImageInReplaceMode) {
    const auto a = tmp.make_folder("a");
    std::ofstream(a / "a.png", std::ios::binary) << "PNGDATA";
    std::ofstream(a / "a.jpg", std::ios::binary) << "JPGDATA";
    encoder.tag_with_source = true;

    RunConfig cfg;
    cfg.folders = {a};
    cfg.replace_originals = true;
    const RunSummary s = run(cfg);

    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_EQ(s.folders[0].converted, 2u);
    EXPECT_TRUE(s.folders[0].errors.empty());
    EXPECT_FALSE(fs::exists(a / "a.png"));
    EXPECT_FALSE(fs::exists(a / "a.jpg"));
    EXPECT_EQ(test::read_file(a / "a.webp"), "webp-of-a.jpg");
    EXPECT_EQ(test::read_file(a / "a_png.webp"), "webp-of-a.png");
}

TEST_F(RunCoordinatorTest, SharedStemsKeepEveryImageInArchive) {
    const auto a = folder_with("a", {{"a.png", 10}, {"a.jpg", 10}, {"a.webp", 10}});
    encoder.tag_with_source = true;

    RunConfig cfg;
    cfg.folders = {a};
    const RunSummary s = run(cfg);

    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_EQ(s.folders[0].converted, 3u);
    EXPECT_TRUE(s.folders[0].errors.empty());
    EXPECT_EQ(test::zip_entry_names(tmp.path() / "a.zip"),
              (std::vector<std::string>{"a.webp", "a_jpg.webp", "a_png.webp"}));
    ASSERT_EQ(encoder.requests.size(), 3u);
    EXPECT_EQ(encoder.requests[2].source.filename(), "a.webp");
    EXPECT_EQ(encoder.requests[2].target, temp_dir_for(a) / "a.webp");
}

TEST_F(RunCoordinatorTest, SkippedWebpIsNeverOverwritten) {
    const auto a = tmp.make_folder("a");
    std::ofstream(a / "a.webp", std::ios::binary) << "ORIGINAL";
    std::ofstream(a / "a.png", std::ios::binary) << "PNGDATA";
    encoder.tag_with_source = true;

    RunConfig cfg;
    cfg.folders = {a};
    cfg.replace_originals = true;
    cfg.skip_existing_webp = true;
    const RunSummary s = run(cfg);

    ASSERT_EQ(s.folders.size(), 1u);
    EXPECT_EQ(s.folders[0].converted, 1u);
    EXPECT_EQ(test::read_file(a / "a.webp"), "ORIGINAL");
    EXPECT_EQ(test::read_file(a / "a_png.webp"), "webp-of-a.png");
    EXPECT_FALSE(fs::exists(a / "a.png"));
}

TEST_F(RunCoordinatorTest, UnpreparableTempDirIsFolderScoped) {
    const auto a = folder_with("a", {{"1.png", 10}, {"2.png", 10}});
    const auto b = folder_with("b", {{"1.png", 10}});
    // a regular file where the scratch directory should go
    test::write_file(temp_dir_for(a), 1);

    RunConfig cfg;
    cfg.folders = {a, b};
    const RunSummary s = run(cfg);

    expect_single_terminal(false);
    ASSERT_EQ(s.folders.size(), 2u);
    EXPECT_EQ(s.folders[0].converted, 0u);
    EXPECT_EQ(s.folders[0].errors.size(), 1u);
    EXPECT_FALSE(s.folders[0].archive_path.has_value());
    EXPECT_EQ(s.folders[1].converted, 1u);
    EXPECT_TRUE(s.folders[1].errors.empty());
    EXPECT_TRUE(fs::exists(tmp.path() / "b.zip"));
    EXPECT_FALSE(fs::exists(tmp.path() / "a.zip"));
    EXPECT_TRUE(fs::is_regular_file(temp_dir_for(a)));
    EXPECT_TRUE(fs::exists(a / "1.png"));
    EXPECT_EQ(s.processed_images, s.total_images);
    EXPECT_EQ(s.total_images, 3u);
    ASSERT_FALSE(events.progress.empty());
    EXPECT_EQ(events.progress.back(), 100);
    expect_monotonic_progress();
}
