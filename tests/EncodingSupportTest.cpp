#include "TestUtils.hpp"
#include "stego/PngSupport.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace pngstego;
using namespace pngstego::png;
using namespace pngstego::stego;

namespace {

class EncodingSupportTest : public ::testing::Test {
protected:
  PngEncodingSupport support;

  std::vector<uint8_t> rgbPng(uint32_t width, uint32_t height,
                              size_t idat_size = 1000,
                              const std::vector<ChunkRecord> &extra = {}) {
    return test::buildPng(test::makeHeader(width, height, 8, COLOR_RGB),
                          test::makeScanlines(width, height, 3), idat_size,
                          extra);
  }
};

std::vector<size_t> idatLengths(const PngFile &file) {
  std::vector<size_t> lengths;
  for (const auto &chunk : file.chunks) {
    if (chunk.type == IDAT) {
      lengths.push_back(chunk.data.size());
    }
  }
  return lengths;
}

// Format whose parser fails with a plain standard exception
class FailingSupport : public FileEncodingSupport {
public:
  std::string_view formatName() const noexcept override { return "failing"; }

  bool supports(EncodingMethod) const noexcept override { return true; }

  std::unique_ptr<CarrierContainer>
  parseContainer(std::span<const uint8_t>,
                 const ChannelConfig &) const override {
    throw std::length_error("carrier too long");
  }
};

} // namespace

TEST_F(EncodingSupportTest, EmbedThenExtract) {
  const auto file = rgbPng(4, 3);
  const auto payload = test::bytesOf("Hi!");

  auto embedded =
      embedPayload(support, file, payload, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(embedded.has_value()) << embedded.error().message;

  auto extracted = extractPayload(support, *embedded, payload.size() * 8,
                                  EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(extracted.has_value()) << extracted.error().message;
  EXPECT_EQ(*extracted, payload);
}

TEST_F(EncodingSupportTest, OnlyLowBitsOfSamplesChange) {
  const auto file = rgbPng(4, 3);
  const std::vector<uint8_t> payload = {0xFF, 0x00, 0xFF, 0x00};

  auto embedded =
      embedPayload(support, file, payload, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(embedded.has_value());

  const auto before = readPng(file);
  const auto after = readPng(*embedded);
  ASSERT_EQ(after.chunks.size(), before.chunks.size());
  EXPECT_EQ(after.header, before.header);

  const auto old_data = test::imageData(before);
  const auto new_data = test::imageData(after);
  ASSERT_EQ(old_data.size(), new_data.size());

  const size_t stride = 1 + 4 * 3;
  for (size_t i = 0; i < old_data.size(); ++i) {
    if (i % stride == 0) {
      EXPECT_EQ(old_data[i], new_data[i]) << "filter byte " << i;
    } else {
      EXPECT_EQ(old_data[i] & 0xFE, new_data[i] & 0xFE) << "sample " << i;
    }
  }
}

TEST_F(EncodingSupportTest, CapacityPerMethod) {
  const auto rgb = rgbPng(4, 3);
  EXPECT_EQ(payloadCapacity(support, rgb, EncodingMethod::OneBitPerChannel),
            36u);
  EXPECT_EQ(payloadCapacity(support, rgb, EncodingMethod::TwoBitsPerChannel),
            72u);
  EXPECT_EQ(payloadCapacity(support, rgb, EncodingMethod::OneBitColorOnly),
            36u);

  const auto rgba = test::buildPng(test::makeHeader(4, 3, 8, COLOR_RGBA),
                                   test::makeScanlines(4, 3, 4));
  EXPECT_EQ(payloadCapacity(support, rgba, EncodingMethod::OneBitPerChannel),
            48u);
  EXPECT_EQ(payloadCapacity(support, rgba, EncodingMethod::OneBitColorOnly),
            36u);
}

TEST_F(EncodingSupportTest, CapacityBoundary) {
  // 8x1 RGB holds exactly 3 bytes with one bit per channel
  const auto file = rgbPng(8, 1);
  const auto fits = test::bytesOf("abc");
  const auto too_big = test::bytesOf("abcd");

  auto ok = embedPayload(support, file, fits, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(ok.has_value());
  auto back = extractPayload(support, *ok, 24, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(*back, fits);

  auto fail =
      embedPayload(support, file, too_big, EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(fail.has_value());
  EXPECT_EQ(fail.error().kind, ErrorKind::PayloadTooLarge);

  auto over = extractPayload(support, file, 25, EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(over.has_value());
  EXPECT_EQ(over.error().kind, ErrorKind::InsufficientCapacity);
}

TEST_F(EncodingSupportTest, SplitImageDataKeepsChunkLengths) {
  const auto file = rgbPng(5, 4, 7);
  const auto payload = test::bytesOf("split!");

  auto embedded =
      embedPayload(support, file, payload, EncodingMethod::TwoBitsPerChannel);
  ASSERT_TRUE(embedded.has_value()) << embedded.error().message;

  const auto before = readPng(file);
  const auto after = readPng(*embedded);
  EXPECT_GT(idatLengths(before).size(), 1u);
  EXPECT_EQ(idatLengths(after), idatLengths(before));

  auto extracted = extractPayload(support, *embedded, payload.size() * 8,
                                  EncodingMethod::TwoBitsPerChannel);
  ASSERT_TRUE(extracted.has_value());
  EXPECT_EQ(*extracted, payload);
}

TEST_F(EncodingSupportTest, AncillaryChunksPassThrough) {
  const std::vector<ChunkRecord> extra = {
      test::makeChunk(tEXt, "Author: nobody"),
      test::makeChunk(ChunkType("vpAg"), "private data")};
  const auto file = rgbPng(4, 4, 1000, extra);

  auto embedded = embedPayload(support, file, test::bytesOf("x"),
                               EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(embedded.has_value());

  const auto after = readPng(*embedded);
  EXPECT_EQ(after.chunks[1], extra[0]);
  EXPECT_EQ(after.chunks[2], extra[1]);
}

TEST_F(EncodingSupportTest, EmptyPayloadLeavesFileUnchanged) {
  const auto file = rgbPng(3, 3);
  auto embedded =
      embedPayload(support, file, {}, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(embedded.has_value());
  EXPECT_EQ(*embedded, file);
}

TEST_F(EncodingSupportTest, ColorOnlyLeavesAlphaUntouched) {
  const auto file = test::buildPng(test::makeHeader(3, 2, 8, COLOR_RGBA),
                                   test::makeScanlines(3, 2, 4));
  const std::vector<uint8_t> payload = {0xFF, 0xFF};

  auto embedded =
      embedPayload(support, file, payload, EncodingMethod::OneBitColorOnly);
  ASSERT_TRUE(embedded.has_value());

  const auto old_data = test::imageData(readPng(file));
  const auto new_data = test::imageData(readPng(*embedded));
  const size_t stride = 1 + 3 * 4;
  for (size_t row = 0; row < 2; ++row) {
    for (size_t px = 0; px < 3; ++px) {
      const size_t alpha = row * stride + 1 + px * 4 + 3;
      EXPECT_EQ(old_data[alpha], new_data[alpha]);
    }
  }

  auto extracted =
      extractPayload(support, *embedded, 16, EncodingMethod::OneBitColorOnly);
  ASSERT_TRUE(extracted.has_value());
  EXPECT_EQ(*extracted, payload);
}

TEST_F(EncodingSupportTest, SixteenBitUsesLowOrderBytes) {
  const auto file = test::buildPng(test::makeHeader(2, 2, 16, COLOR_RGB),
                                   test::makeScanlines(2, 2, 6));
  EXPECT_EQ(payloadCapacity(support, file, EncodingMethod::OneBitPerChannel),
            12u);

  const std::vector<uint8_t> payload = {0x5A};
  auto embedded =
      embedPayload(support, file, payload, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(embedded.has_value());

  const auto old_data = test::imageData(readPng(file));
  const auto new_data = test::imageData(readPng(*embedded));
  const size_t stride = 1 + 2 * 6;
  for (size_t i = 0; i < old_data.size(); ++i) {
    const size_t column = i % stride;
    if (column == 0 || column % 2 == 1) {
      // Filter byte or high-order sample byte
      EXPECT_EQ(old_data[i], new_data[i]) << i;
    }
  }

  auto extracted =
      extractPayload(support, *embedded, 8, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(extracted.has_value());
  EXPECT_EQ(*extracted, payload);
}

TEST_F(EncodingSupportTest, PartialTrailingByteIsZeroPadded) {
  const auto file = rgbPng(4, 3);
  const std::vector<uint8_t> payload = {0xFF, 0xFF};
  auto embedded =
      embedPayload(support, file, payload, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(embedded.has_value());

  auto extracted =
      extractPayload(support, *embedded, 12, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(extracted.has_value());
  EXPECT_EQ(*extracted, (std::vector<uint8_t>{0xFF, 0xF0}));
}

TEST_F(EncodingSupportTest, ShortImageDataLimitsCapacity) {
  // Header claims 3 rows; data holds two complete scan-lines and a fragment
  auto data = test::makeScanlines(4, 2, 3);
  data.push_back(0);
  data.push_back(42);
  const auto file = test::buildPng(test::makeHeader(4, 3, 8, COLOR_RGB), data);
  EXPECT_EQ(payloadCapacity(support, file, EncodingMethod::OneBitPerChannel),
            24u);
}

TEST_F(EncodingSupportTest, UnsupportedLayouts) {
  const auto payload = test::bytesOf("x");

  const auto interlaced = test::buildPng(
      test::makeHeader(4, 4, 8, COLOR_RGB, 1), test::makeScanlines(4, 4, 3));
  auto r1 = embedPayload(support, interlaced, payload,
                         EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(r1.has_value());
  EXPECT_EQ(r1.error().kind, ErrorKind::UnsupportedEncodingMethod);

  const auto packed = test::buildPng(test::makeHeader(8, 2, 4, COLOR_GRAY),
                                     test::makeScanlines(4, 2, 1));
  auto r2 =
      embedPayload(support, packed, payload, EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(r2.has_value());
  EXPECT_EQ(r2.error().kind, ErrorKind::UnsupportedEncodingMethod);

  const auto file = rgbPng(4, 4);
  auto r3 = embedPayload(support, file, payload,
                         static_cast<EncodingMethod>(99));
  ASSERT_FALSE(r3.has_value());
  EXPECT_EQ(r3.error().kind, ErrorKind::UnsupportedEncodingMethod);

  const auto bad_color = test::buildPng(test::makeHeader(4, 4, 8, 5),
                                        test::makeScanlines(4, 4, 3));
  auto r4 = payloadCapacity(support, bad_color,
                            EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(r4.has_value());
  EXPECT_EQ(r4.error().kind, ErrorKind::MalformedHeader);
}

TEST_F(EncodingSupportTest, StructuralErrorsAreReturned) {
  auto garbage = embedPayload(support, test::bytesOf("not a png at all"),
                              test::bytesOf("x"),
                              EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(garbage.has_value());
  EXPECT_EQ(garbage.error().kind, ErrorKind::InvalidSignature);

  auto file = rgbPng(4, 4);
  // Last byte of the first IDAT payload (signature 8 + IHDR 25 + IDAT header 8)
  file[8 + 25 + 8 + 5] ^= 0x01;
  auto corrupted =
      extractPayload(support, file, 8, EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(corrupted.has_value());
  EXPECT_EQ(corrupted.error().kind, ErrorKind::ChecksumMismatch);
}

TEST_F(EncodingSupportTest, LegacyChecksumScope) {
  const auto header = test::makeHeader(4, 2, 8, COLOR_RGB);
  const auto file =
      test::buildPng(header, test::makeScanlines(4, 2, 3), 1000, {},
                     ChecksumScope::TypeOnly);

  auto strict =
      embedPayload(support, file, {}, EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(strict.has_value());
  EXPECT_EQ(strict.error().kind, ErrorKind::ChecksumMismatch);

  ReadOptions options;
  options.checksumScope = ChecksumScope::TypeOnly;
  PngEncodingSupport legacy(options);

  const auto payload = test::bytesOf("ok");
  auto embedded =
      embedPayload(legacy, file, payload, EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(embedded.has_value()) << embedded.error().message;
  EXPECT_NO_THROW((void)readPng(*embedded, options));

  auto extracted = extractPayload(legacy, *embedded, 16,
                                  EncodingMethod::OneBitPerChannel);
  ASSERT_TRUE(extracted.has_value());
  EXPECT_EQ(*extracted, payload);
}

TEST(EncodingSupportErrors, StandardExceptionsBecomeErrors) {
  const FailingSupport failing;
  const auto file = test::bytesOf("anything");

  auto embedded = embedPayload(failing, file, test::bytesOf("x"),
                               EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(embedded.has_value());
  EXPECT_EQ(embedded.error().kind, ErrorKind::InternalError);
  EXPECT_NE(embedded.error().message.find("carrier too long"),
            std::string::npos);

  auto extracted =
      extractPayload(failing, file, 8, EncodingMethod::OneBitPerChannel);
  ASSERT_FALSE(extracted.has_value());
  EXPECT_EQ(extracted.error().kind, ErrorKind::InternalError);

  auto capacity =
      payloadCapacity(failing, file, EncodingMethod::TwoBitsPerChannel);
  ASSERT_FALSE(capacity.has_value());
  EXPECT_EQ(capacity.error().kind, ErrorKind::InternalError);
}
