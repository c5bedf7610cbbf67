#include <gtest/gtest.h>

#include <thread>

#include "core/SequenceBuffer.hpp"

using namespace core;

namespace {

Frame tagged(uint64_t index) {
    return Frame(cv::Mat(2, 2, CV_8UC3, cv::Scalar::all(static_cast<double>(index))), index);
}

} // namespace

TEST(SequenceBufferTest, ReleasesInIndexOrder) {
    SequenceBuffer buffer;

    EXPECT_TRUE(buffer.insert(tagged(2)));
    EXPECT_TRUE(buffer.insert(tagged(1)));
    EXPECT_FALSE(buffer.tryPopNext().has_value());

    EXPECT_TRUE(buffer.insert(tagged(0)));
    for (uint64_t i = 0; i < 3; ++i) {
        auto frame = buffer.tryPopNext();
        ASSERT_TRUE(frame.has_value());
        EXPECT_EQ(frame->index, i);
        EXPECT_EQ(static_cast<uint64_t>(frame->image.at<cv::Vec3b>(0, 0)[0]), i);
    }
    EXPECT_EQ(buffer.nextIndex(), 3u);
    EXPECT_EQ(buffer.pending(), 0u);
}

TEST(SequenceBufferTest, RejectsStaleAndDuplicateIndices) {
    SequenceBuffer buffer;
    EXPECT_TRUE(buffer.insert(tagged(0)));
    EXPECT_TRUE(buffer.insert(tagged(1)));
    EXPECT_FALSE(buffer.insert(tagged(1)));

    ASSERT_TRUE(buffer.tryPopNext().has_value());
    EXPECT_FALSE(buffer.insert(tagged(0)));
    EXPECT_EQ(buffer.pending(), 1u);
}

TEST(SequenceBufferTest, WaitTimesOutWithoutNextFrame) {
    SequenceBuffer buffer;
    buffer.insert(tagged(5));
    EXPECT_FALSE(buffer.waitPopNext(std::chrono::milliseconds(5)).has_value());
}

TEST(SequenceBufferTest, WaitWakesOnInsertFromOtherThread) {
    SequenceBuffer buffer;

    std::thread worker([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        buffer.insert(tagged(0));
    });

    auto frame = buffer.waitPopNext(std::chrono::seconds(5));
    worker.join();

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->index, 0u);
}

TEST(SequenceBufferTest, ResetDropsPendingAndRestartsAtZero) {
    SequenceBuffer buffer;
    buffer.insert(tagged(0));
    buffer.insert(tagged(1));
    buffer.insert(tagged(3));
    ASSERT_TRUE(buffer.tryPopNext().has_value());
    ASSERT_TRUE(buffer.tryPopNext().has_value());

    buffer.reset();

    EXPECT_EQ(buffer.nextIndex(), 0u);
    EXPECT_EQ(buffer.pending(), 0u);
    EXPECT_TRUE(buffer.insert(tagged(0)));
    auto frame = buffer.tryPopNext();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->index, 0u);
}
