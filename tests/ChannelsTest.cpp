#include "TestUtils.hpp"
#include "stego/Channels.hpp"

#include <gtest/gtest.h>

using namespace pngstego;
using namespace pngstego::stego;

TEST(ChannelsTest, DerivationPerMethod) {
  EXPECT_EQ(deriveChannelConfig(EncodingMethod::OneBitPerChannel),
            (ChannelConfig{1, true}));
  EXPECT_EQ(deriveChannelConfig(EncodingMethod::TwoBitsPerChannel),
            (ChannelConfig{2, true}));
  EXPECT_EQ(deriveChannelConfig(EncodingMethod::OneBitColorOnly),
            (ChannelConfig{1, false}));
  test::expectStegoError(
      [] { (void)deriveChannelConfig(static_cast<EncodingMethod>(42)); },
      ErrorKind::UnsupportedEncodingMethod);
}

TEST(ChannelsTest, MethodNames) {
  for (auto method :
       {EncodingMethod::OneBitPerChannel, EncodingMethod::TwoBitsPerChannel,
        EncodingMethod::OneBitColorOnly}) {
    EXPECT_EQ(methodFromString(methodToString(method)), method);
  }
  EXPECT_EQ(methodToString(EncodingMethod::TwoBitsPerChannel), "two-bits");
  EXPECT_FALSE(methodFromString("three-bits").has_value());
}

TEST(ChannelsTest, CarrierOffsets) {
  const SampleLayout rgba8{4, 1, 3};
  EXPECT_EQ(carrierByteOffsets(rgba8, {1, true}),
            (std::vector<int>{0, 1, 2, 3}));
  EXPECT_EQ(carrierByteOffsets(rgba8, {1, false}),
            (std::vector<int>{0, 1, 2}));

  const SampleLayout rgb16{3, 2, std::nullopt};
  EXPECT_EQ(carrierByteOffsets(rgb16, {1, false}),
            (std::vector<int>{1, 3, 5}));

  const SampleLayout grayAlpha16{2, 2, 1};
  EXPECT_EQ(carrierByteOffsets(grayAlpha16, {1, false}),
            (std::vector<int>{1}));
}

TEST(ChannelsTest, GatherAndScatterLowBytes) {
  // One row of two RGB 16-bit pixels
  cv::Mat pixels(1, 2, CV_8UC(6));
  uchar *data = pixels.ptr<uchar>();
  for (int i = 0; i < 12; ++i) {
    data[i] = static_cast<uchar>(0x10 * i);
  }
  const std::vector<int> offsets = {1, 3, 5};

  cv::Mat carrier = gatherChannels(pixels, offsets);
  ASSERT_EQ(carrier.channels(), 3);
  ASSERT_EQ(carrier.cols, 2);
  const uchar *gathered = carrier.ptr<uchar>();
  EXPECT_EQ(gathered[0], 0x10);
  EXPECT_EQ(gathered[1], 0x30);
  EXPECT_EQ(gathered[3], 0x70);

  carrier.setTo(cv::Scalar::all(0xFF));
  scatterChannels(carrier, pixels, offsets);
  for (int i = 0; i < 12; ++i) {
    if (i % 2 == 1) {
      EXPECT_EQ(data[i], 0xFF) << i;
    } else {
      EXPECT_EQ(data[i], static_cast<uchar>(0x10 * i)) << i;
    }
  }
}

TEST(ChannelsTest, EmptyPixels) {
  EXPECT_TRUE(gatherChannels(cv::Mat(), {0}).empty());
}
