//
// Created by Giuseppe Francione on 20/01/26.
//

#include "../libwebpress/include/cwebp_encoder.hpp"
#include "../libwebpress/include/encoder.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <fstream>
#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace webpress;

namespace {

EncodeRequest make_request(const ImageFormat fmt, const int quality) {
    EncodeRequest r;
    r.source = "/in/page.png";
    r.target = "/tmp/out/page.webp";
    r.quality = quality;
    r.source_format = fmt;
    return r;
}

} // namespace

TEST(CwebpArguments, PngAtFullQualityIsLossless) {
    const auto args = CwebpEncoder::build_arguments(make_request(ImageFormat::Png, 100));
    ASSERT_EQ(args.size(), 4u);
    EXPECT_EQ(args[0], "-lossless");
    EXPECT_EQ(args[2], "-o");
    EXPECT_EQ(std::count(args.begin(), args.end(), "-q"), 0);
}

TEST(CwebpArguments, NumericQualityOtherwise) {
    const auto jpeg = CwebpEncoder::build_arguments(make_request(ImageFormat::Jpeg, 100));
    ASSERT_GE(jpeg.size(), 2u);
    EXPECT_EQ(jpeg[0], "-q");
    EXPECT_EQ(jpeg[1], "100");

    const auto png = CwebpEncoder::build_arguments(make_request(ImageFormat::Png, 75));
    EXPECT_EQ(png[0], "-q");
    EXPECT_EQ(png[1], "75");
}

TEST(CwebpArguments, QualityIsClamped) {
    EXPECT_EQ(CwebpEncoder::build_arguments(make_request(ImageFormat::Jpeg, 3))[1], "10");
    EXPECT_EQ(CwebpEncoder::build_arguments(make_request(ImageFormat::Jpeg, 250))[1], "100");
    EXPECT_TRUE(CwebpEncoder::wants_lossless(make_request(ImageFormat::Png, 250)));
    EXPECT_EQ(clamp_quality(55), 55);
}

TEST(CwebpEncoder, MissingExecutableIsUnavailable) {
    CwebpEncoder encoder("webpress-no-such-encoder-binary");
    EXPECT_FALSE(encoder.is_available());
    EXPECT_FALSE(encoder.resolved_path().has_value());
}

TEST(InvokeEncoder, SuccessFillsSizes) {
    const test::TempDir tmp;
    test::write_file(tmp.path() / "a.jpg", 300);

    test::FakeEncoder fake;
    fake.output_size = 120;
    EncodeRequest req;
    req.source = tmp.path() / "a.jpg";
    req.target = tmp.path() / "a.webp";

    const auto outcome = invoke_encoder(fake, req);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.original_size, 300u);
    EXPECT_EQ(outcome.converted_size, 120u);
    EXPECT_FALSE(outcome.error_message.has_value());
}

TEST(InvokeEncoder, FailureIsScopedToFile) {
    const test::TempDir tmp;
    test::write_file(tmp.path() / "bad.png", 10);

    test::FakeEncoder fake;
    fake.failing = {"bad.png"};
    EncodeRequest req;
    req.source = tmp.path() / "bad.png";
    req.target = tmp.path() / "bad.webp";

    const auto outcome = invoke_encoder(fake, req);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.converted_size, 0u);
    ASSERT_TRUE(outcome.error_message.has_value());
    EXPECT_EQ(outcome.error_message->rfind("bad.png", 0), 0u);
}

TEST(InvokeEncoder, ExceptionsBecomeOutcomes) {
    const test::TempDir tmp;
    test::write_file(tmp.path() / "boom.bmp", 10);

    test::FakeEncoder fake;
    fake.throwing = {"boom.bmp"};
    EncodeRequest req;
    req.source = tmp.path() / "boom.bmp";
    req.target = tmp.path() / "boom.webp";

    const auto outcome = invoke_encoder(fake, req);
    EXPECT_FALSE(outcome.success);
    ASSERT_TRUE(outcome.error_message.has_value());
    EXPECT_NE(outcome.error_message->find("boom.bmp"), std::string::npos);
    EXPECT_NE(outcome.error_message->find("encoder crashed"), std::string::npos);
}

TEST(InvokeEncoder, NonStandardThrowBecomesOutcome) {
    const test::TempDir tmp;
    test::write_file(tmp.path() / "odd.png", 10);

    test::FakeEncoder fake;
    fake.on_encode = [](const EncodeRequest&) { throw 42; };
    EncodeRequest req;
    req.source = tmp.path() / "odd.png";
    req.target = tmp.path() / "odd.webp";

    const auto outcome = invoke_encoder(fake, req);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.original_size, 10u);
    EXPECT_EQ(outcome.error_message, std::optional<std::string>("odd.png: conversion failed"));
}

#ifndef _WIN32

TEST(CwebpEncoder, RunsExternalProcess) {
    const test::TempDir tmp;
    const fs::path script = test::write_fake_cwebp(tmp.path());
    test::write_file(tmp.path() / "in.png", 64);

    CwebpEncoder encoder(script.string());
    ASSERT_TRUE(encoder.is_available());

    EncodeRequest req;
    req.source = tmp.path() / "in.png";
    req.target = tmp.path() / "in.webp";
    req.quality = 100;
    req.source_format = ImageFormat::Png;

    const auto outcome = invoke_encoder(encoder, req);
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.original_size, 64u);
    EXPECT_EQ(outcome.converted_size, 12u); // "RIFFfakeWEBP"

    const std::string args = test::read_file(tmp.path() / "args.log");
    EXPECT_NE(args.find("-lossless"), std::string::npos);
    EXPECT_EQ(args.find("-q"), std::string::npos);
}

TEST(CwebpEncoder, NonZeroExitIsFailure) {
    const test::TempDir tmp;
    const fs::path script = test::write_fake_cwebp(tmp.path(), 3);
    test::write_file(tmp.path() / "in.jpg", 64);

    CwebpEncoder encoder(script.string());
    ASSERT_TRUE(encoder.is_available());

    EncodeRequest req;
    req.source = tmp.path() / "in.jpg";
    req.target = tmp.path() / "in.webp";
    req.quality = 70;
    req.source_format = ImageFormat::Jpeg;

    const auto outcome = invoke_encoder(encoder, req);
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.converted_size, 0u);
    ASSERT_TRUE(outcome.error_message.has_value());
    EXPECT_EQ(outcome.error_message->rfind("in.jpg", 0), 0u);
    EXPECT_NE(outcome.error_message->find("Saving file failed"), std::string::npos);

    const std::string args = test::read_file(tmp.path() / "args.log");
    EXPECT_NE(args.find("-q 70"), std::string::npos);
}

#endif
