#pragma once

#include "ChunkType.hpp"
#include "Header.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace pngstego::png {

/// PNG file signature.
inline constexpr std::array<uint8_t, 8> PNG_SIGNATURE = {
    0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};

/**
 * @brief Bytes covered by a chunk CRC.
 *
 * TypeAndData is what the PNG specification mandates. TypeOnly reproduces
 * files written by tools that checksummed the type code alone.
 */
enum class ChecksumScope { TypeAndData, TypeOnly };

/**
 * @struct ChunkRecord
 * @brief One chunk; the length field is data.size().
 */
struct ChunkRecord {
  ChunkType type;
  std::vector<uint8_t> data;

  bool operator==(const ChunkRecord &) const = default;
};

/**
 * @brief Bounds-checked big-endian reader over a byte buffer.
 */
class ByteReader {
public:
  explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

  size_t offset() const { return offset_; }
  size_t remaining() const { return data_.size() - offset_; }
  bool atEnd() const { return offset_ == data_.size(); }

  /**
   * @brief Reads a big-endian 32-bit value.
   * @param what Field name used in the error message.
   * @throws StegoException (TruncatedStream) when fewer than 4 bytes remain.
   */
  uint32_t readU32(const char *what);

  /**
   * @brief Returns the next @p count bytes and advances past them.
   * @throws StegoException (TruncatedStream) when fewer bytes remain.
   */
  std::span<const uint8_t> readBytes(size_t count, const char *what);

private:
  void require(size_t count, const char *what) const;

  std::span<const uint8_t> data_;
  size_t offset_ = 0;
};

/**
 * @brief Appending big-endian writer.
 */
class ByteWriter {
public:
  void writeU32(uint32_t value);
  void writeBytes(std::span<const uint8_t> bytes);

  std::vector<uint8_t> take() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
};

/**
 * @brief CRC of a chunk under the given scope.
 */
uint32_t chunkCrc(const ChunkType &type, std::span<const uint8_t> data,
                  ChecksumScope scope = ChecksumScope::TypeAndData);

/**
 * @brief Consumes and checks the 8-byte PNG signature.
 * @throws StegoException (InvalidSignature) on any mismatch or short input.
 */
void readSignature(ByteReader &reader);

/**
 * @brief Reads one length/type/data/CRC record.
 * @throws StegoException TruncatedStream or ChecksumMismatch.
 */
ChunkRecord readNextChunk(ByteReader &reader,
                          ChecksumScope scope = ChecksumScope::TypeAndData);

/**
 * @brief Appends one record with its computed CRC.
 */
void writeChunk(ByteWriter &writer, const ChunkRecord &record,
                ChecksumScope scope = ChecksumScope::TypeAndData);

/**
 * @struct PngFile
 * @brief A parsed PNG: decoded header plus every chunk in file order.
 */
struct PngFile {
  HeaderFields header;
  std::vector<ChunkRecord> chunks;
};

/**
 * @brief Options for readPng.
 */
struct ReadOptions {
  ChecksumScope checksumScope = ChecksumScope::TypeAndData;
  bool strictChunkTypes = false; ///< Reject unknown critical / reserved chunks
};

/**
 * @brief Parses a whole PNG container.
 *
 * Reads the signature and then chunks up to and including IEND. The first
 * chunk must be IHDR. Bytes after IEND are ignored.
 */
PngFile readPng(std::span<const uint8_t> bytes, const ReadOptions &options = {});

/**
 * @brief Serializes a container: signature followed by every chunk.
 */
std::vector<uint8_t>
writePng(const PngFile &file,
         ChecksumScope scope = ChecksumScope::TypeAndData);

} // namespace pngstego::png
