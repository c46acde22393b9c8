#include <gtest/gtest.h>

#include "ImageWrapper.hpp"
#include "Errors.hpp"
#include "ShmFrameManager.hpp"
#include "fakes/FakeConnection.hpp"
#include "fakes/FakeShmTransport.hpp"

using namespace XBridge;
using XBridge::Testing::FakeConnection;
using XBridge::Testing::FakeShmTransport;

TEST(PixelFormatTest, FromDepthAndByteOrder) {
    EXPECT_EQ(pixelFormatFor(24, 32, LSBFirst), "BGRX");
    EXPECT_EQ(pixelFormatFor(24, 32, MSBFirst), "XRGB");
    EXPECT_EQ(pixelFormatFor(24, 24, LSBFirst), "BGR");
    EXPECT_EQ(pixelFormatFor(32, 32, LSBFirst), "BGRA");
    EXPECT_EQ(pixelFormatFor(32, 32, MSBFirst), "ARGB");
    EXPECT_EQ(pixelFormatFor(30, 32, LSBFirst), "r210");
    EXPECT_EQ(pixelFormatFor(30, 32, MSBFirst), "R210");
    EXPECT_EQ(pixelFormatFor(16, 16, LSBFirst), "BGR565");
    EXPECT_EQ(pixelFormatFor(8, 8, LSBFirst), "RLE8");
    EXPECT_EQ(pixelFormatFor(12, 16, LSBFirst), "");
}

class ImageWrapperTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport.addWindow(kWindow, 8, 4);
        OpenResult result = frames.openSegment(kWindow, 8, 4, 24);
        ASSERT_TRUE(result.ok());
        segment = result.segment;
    }

    static constexpr Window kWindow = 0x200004;

    FakeConnection connection;
    DisplayContext context{connection};
    FakeShmTransport transport;
    ShmFrameManager frames{context, transport};
    std::shared_ptr<ShmSegment> segment;
};

TEST_F(ImageWrapperTest, DescribesRegion) {
    auto image = frames.capture(segment, kWindow, 2, 1, 4, 2);
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->depth(), 24);
    EXPECT_EQ(image->bitsPerPixel(), 32);
    EXPECT_EQ(image->bytesPerPixel(), 4u);
    EXPECT_EQ(image->stride(), 32u);
    EXPECT_EQ(image->size(), 64u);
    EXPECT_EQ(image->pixelFormat(), "BGRX");
    EXPECT_TRUE(image->holdsSegment());
    EXPECT_EQ(image->backing(), segment);
}

TEST_F(ImageWrapperTest, PixelsPointIntoSegment) {
    auto whole = frames.capture(segment, kWindow, 0, 0, 8, 4);
    auto region = frames.capture(segment, kWindow, 2, 1, 4, 2);
    EXPECT_EQ(region->pixels(), whole->pixels() + 1 * 32 + 2 * 4);
}

TEST_F(ImageWrapperTest, RestrideCopiesAndReleasesSegment) {
    auto image = frames.capture(segment, kWindow, 0, 0, 8, 4);
    const std::uint8_t value = image->pixels()[0];

    EXPECT_FALSE(image->restride(16));
    EXPECT_TRUE(image->restride(48));
    EXPECT_EQ(image->stride(), 48u);
    EXPECT_EQ(image->size(), 48u * 4);
    EXPECT_TRUE(image->isFrozen());
    EXPECT_FALSE(image->holdsSegment());
    EXPECT_EQ(segment->refCount(), 0);
    EXPECT_EQ(image->pixels()[0], value);
    EXPECT_EQ(image->pixels()[3 * 48 + 31], value);
}

TEST_F(ImageWrapperTest, FrozenPixelsSurviveNextFetch) {
    auto image = frames.capture(segment, kWindow, 0, 0, 8, 4);
    image->freeze();
    EXPECT_EQ(segment->refCount(), 0);

    frames.discard(*segment);
    auto next = frames.capture(segment, kWindow, 0, 0, 8, 4);
    EXPECT_EQ(next->pixels()[0], 2);
    EXPECT_EQ(image->pixels()[0], 1);
}

TEST_F(ImageWrapperTest, FrozenImageOutlivesClose) {
    auto image = frames.capture(segment, kWindow, 0, 0, 8, 4);
    image->freeze();
    frames.close(*segment);
    EXPECT_EQ(segment->state(), SegmentState::Closed);
    EXPECT_EQ(image->pixels()[0], 1);
    EXPECT_NO_THROW(image->release());
}

TEST_F(ImageWrapperTest, ReleasedWrapperRejectsAccess) {
    auto image = frames.capture(segment, kWindow, 0, 0, 8, 4);
    image->release();
    EXPECT_TRUE(image->isReleased());
    EXPECT_THROW(image->pixels(), UsageError);
    EXPECT_THROW(image->freeze(), UsageError);
    EXPECT_THROW(image->restride(64), UsageError);
    EXPECT_THROW(image->release(), UsageError);
}
