#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/Config.hpp"
#include "core/Errors.hpp"

using namespace core;

namespace {

// getopt wants mutable argv
AppConfig parse(std::vector<std::string> args) {
    args.insert(args.begin(), "dancemirror");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return parseCommandLine(static_cast<int>(args.size()), argv.data());
}

} // namespace

TEST(ConfigTest, Defaults) {
    AppConfig config = parse({"--input", "dance.mp4"});

    ASSERT_TRUE(config.source.has_value());
    EXPECT_EQ(std::get<std::string>(*config.source), "dance.mp4");
    EXPECT_EQ(config.compositor.offsetX, DEFAULT_OFFSET_X);
    EXPECT_EQ(config.compositor.originalStyle.pointRadius, DEFAULT_POINT_RADIUS);
    EXPECT_EQ(config.compositor.mirroredStyle.lineThickness, DEFAULT_LINE_THICKNESS);
    EXPECT_EQ(config.compositor.mirroredBlend, BlendMode::Additive);
    EXPECT_EQ(config.driver.workers, 1);
    EXPECT_TRUE(config.display);
    EXPECT_TRUE(config.outputPath.empty());
    EXPECT_EQ(config.mjpegPort, 0);
    EXPECT_EQ(config.logLevel, LogLevel::INFO);
    EXPECT_FALSE(config.showHelp);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, ParsesAllOptions) {
    AppConfig config = parse({"-w", "1", "-x", "-200", "-r", "5", "-t", "4", "-m", "pose.engine",
                              "-j", "3", "--in-flight", "9", "-o", "out.mp4", "--mjpeg-port", "8080",
                              "--no-display", "--blend", "overwrite", "--log-level", "debug"});

    ASSERT_TRUE(config.source.has_value());
    EXPECT_EQ(std::get<int>(*config.source), 1);
    EXPECT_EQ(config.compositor.offsetX, -200);
    EXPECT_EQ(config.compositor.originalStyle.pointRadius, 5);
    EXPECT_EQ(config.compositor.mirroredStyle.pointRadius, 5);
    EXPECT_EQ(config.compositor.originalStyle.lineThickness, 4);
    EXPECT_EQ(config.compositor.mirroredStyle.lineThickness, 4);
    EXPECT_EQ(config.modelPath, "pose.engine");
    EXPECT_EQ(config.driver.workers, 3);
    EXPECT_EQ(config.driver.maxInFlight, 9);
    EXPECT_EQ(config.outputPath, "out.mp4");
    EXPECT_EQ(config.mjpegPort, 8080);
    EXPECT_FALSE(config.display);
    EXPECT_EQ(config.compositor.mirroredBlend, BlendMode::Overwrite);
    EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
    EXPECT_NO_THROW(config.validate());
}

TEST(ConfigTest, LongOptionsWithEquals) {
    AppConfig config = parse({"--webcam=0", "--offset=75", "--blend=add"});

    EXPECT_EQ(std::get<int>(*config.source), 0);
    EXPECT_EQ(config.compositor.offsetX, 75);
    EXPECT_EQ(config.compositor.mirroredBlend, BlendMode::Additive);
}

TEST(ConfigTest, ParserCanRunRepeatedly) {
    AppConfig first = parse({"-x", "10", "-i", "a.mp4"});
    AppConfig second = parse({"-x", "20", "-i", "b.mp4"});

    EXPECT_EQ(first.compositor.offsetX, 10);
    EXPECT_EQ(second.compositor.offsetX, 20);
    EXPECT_EQ(std::get<std::string>(*second.source), "b.mp4");
}

TEST(ConfigTest, HelpFlag) {
    EXPECT_TRUE(parse({"--help"}).showHelp);
    EXPECT_TRUE(parse({"-h"}).showHelp);

    std::string text = usage("dancemirror");
    EXPECT_NE(text.find("--webcam"), std::string::npos);
    EXPECT_NE(text.find("--offset"), std::string::npos);
}

TEST(ConfigTest, InputAndWebcamAreExclusive) {
    EXPECT_THROW(parse({"--input", "a.mp4", "--webcam", "0"}), InvalidConfiguration);
}

TEST(ConfigTest, MalformedValuesThrow) {
    EXPECT_THROW(parse({"-i", "a.mp4", "--offset", "abc"}), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "--radius", "3px"}), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "--workers", "99999999999"}), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "--blend", "multiply"}), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "--log-level", "verbose"}), InvalidConfiguration);
}

TEST(ConfigTest, UnknownOptionAndMissingValueThrow) {
    EXPECT_THROW(parse({"-i", "a.mp4", "--bogus"}), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "--offset"}), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "stray"}), InvalidConfiguration);
}

TEST(ConfigTest, ValidateRequiresSource) {
    AppConfig config = parse({});
    EXPECT_THROW(config.validate(), InvalidConfiguration);
}

TEST(ConfigTest, ValidateRejectsOutOfRangeValues) {
    EXPECT_THROW(parse({"-w", "-1"}).validate(), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "-x", "9000"}).validate(), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "-r", "0"}).validate(), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "-t", "65"}).validate(), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "-j", "0"}).validate(), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "-j", "2", "--in-flight", "1"}).validate(), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "--mjpeg-port", "70000"}).validate(), InvalidConfiguration);
    EXPECT_THROW(parse({"-i", "a.mp4", "-m", ""}).validate(), InvalidConfiguration);
}

TEST(ConfigTest, HeadlessNeedsAnotherSink) {
    EXPECT_THROW(parse({"-i", "a.mp4", "--no-display"}).validate(), InvalidConfiguration);
    EXPECT_NO_THROW(parse({"-i", "a.mp4", "--no-display", "-o", "out.mp4"}).validate());
    EXPECT_NO_THROW(parse({"-i", "a.mp4", "--no-display", "--mjpeg-port", "8090"}).validate());
}
