#include "ChunkStream.hpp"
#include "CRC.hpp"
#include "stego/StegoError.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>

namespace pngstego::png {

namespace {
// Largest chunk length the PNG specification allows
constexpr uint32_t MAX_CHUNK_LENGTH =
    static_cast<uint32_t>(std::numeric_limits<int32_t>::max());

[[noreturn]] void fail(ErrorKind kind, const std::string &message) {
  Logger::getInstance()->error(message);
  throw StegoException(kind, message);
}
} // namespace

void ByteReader::require(size_t count, const char *what) const {
  if (count > remaining()) {
    fail(ErrorKind::TruncatedStream,
         fmt::format("Truncated stream reading {} at offset {}: need {} "
                     "bytes, {} available",
                     what, offset_, count, remaining()));
  }
}

uint32_t ByteReader::readU32(const char *what) {
  require(4, what);
  const uint8_t *p = data_.data() + offset_;
  offset_ += 4;
  return (static_cast<uint32_t>(p[0]) << 24) |
         (static_cast<uint32_t>(p[1]) << 16) |
         (static_cast<uint32_t>(p[2]) << 8) | static_cast<uint32_t>(p[3]);
}

std::span<const uint8_t> ByteReader::readBytes(size_t count,
                                               const char *what) {
  require(count, what);
  auto bytes = data_.subspan(offset_, count);
  offset_ += count;
  return bytes;
}

void ByteWriter::writeU32(uint32_t value) {
  buffer_.push_back(static_cast<uint8_t>(value >> 24));
  buffer_.push_back(static_cast<uint8_t>(value >> 16));
  buffer_.push_back(static_cast<uint8_t>(value >> 8));
  buffer_.push_back(static_cast<uint8_t>(value));
}

void ByteWriter::writeBytes(std::span<const uint8_t> bytes) {
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

uint32_t chunkCrc(const ChunkType &type, std::span<const uint8_t> data,
                  ChecksumScope scope) {
  uint32_t crc = crc_inline::quick_crc32(type.bytes);
  if (scope == ChecksumScope::TypeAndData) {
    crc = crc_inline::quick_crc32(data, crc);
  }
  return crc;
}

void readSignature(ByteReader &reader) {
  if (reader.remaining() < PNG_SIGNATURE.size()) {
    fail(ErrorKind::InvalidSignature,
         fmt::format("Input too short for PNG signature: {} bytes",
                     reader.remaining()));
  }
  auto magic = reader.readBytes(PNG_SIGNATURE.size(), "signature");
  if (!std::equal(magic.begin(), magic.end(), PNG_SIGNATURE.begin())) {
    fail(ErrorKind::InvalidSignature,
         fmt::format("Invalid PNG signature: {:02X}", fmt::join(magic, " ")));
  }
}

ChunkRecord readNextChunk(ByteReader &reader, ChecksumScope scope) {
  const size_t start = reader.offset();

  const uint32_t length = reader.readU32("chunk length");
  if (length > MAX_CHUNK_LENGTH) {
    fail(ErrorKind::TruncatedStream,
         fmt::format("Chunk length {} at offset {} exceeds the PNG limit",
                     length, start));
  }

  ChunkRecord record;
  auto type = reader.readBytes(4, "chunk type");
  std::copy(type.begin(), type.end(), record.type.bytes.begin());

  auto data = reader.readBytes(length, "chunk data");
  record.data.assign(data.begin(), data.end());

  const uint32_t stored = reader.readU32("chunk CRC");
  const uint32_t computed = chunkCrc(record.type, record.data, scope);
  if (stored != computed) {
    fail(ErrorKind::ChecksumMismatch,
         fmt::format("CRC mismatch in {} chunk at offset {}: stored "
                     "0x{:08X}, computed 0x{:08X}",
                     record.type.toString(), start, stored, computed));
  }

  Logger::getInstance()->debug("Read {} chunk at offset {}, {} bytes",
                               record.type.toString(), start, length);
  return record;
}

void writeChunk(ByteWriter &writer, const ChunkRecord &record,
                ChecksumScope scope) {
  writer.writeU32(static_cast<uint32_t>(record.data.size()));
  writer.writeBytes(record.type.bytes);
  writer.writeBytes(record.data);
  writer.writeU32(chunkCrc(record.type, record.data, scope));
}

PngFile readPng(std::span<const uint8_t> bytes, const ReadOptions &options) {
  auto logger = Logger::getInstance();
  ByteReader reader(bytes);
  readSignature(reader);

  PngFile file;
  while (true) {
    if (reader.atEnd()) {
      fail(ErrorKind::TruncatedStream,
           fmt::format("Stream ended at offset {} before IEND",
                       reader.offset()));
    }

    const size_t offset = reader.offset();
    ChunkRecord chunk = readNextChunk(reader, options.checksumScope);

    if (file.chunks.empty()) {
      if (chunk.type != IHDR) {
        fail(ErrorKind::MalformedHeader,
             fmt::format("First chunk is {}, expected IHDR",
                         chunk.type.toString()));
      }
      file.header = parseHeader(chunk.data);
    }

    if (reservedSet(chunk.type) ||
        (isCritical(chunk.type) && !isKnown(chunk.type))) {
      auto message = fmt::format(
          "{} chunk at offset {} is {}", chunk.type.toString(), offset,
          reservedSet(chunk.type) ? "invalid (reserved bit set)"
                                  : "an unknown critical chunk");
      if (options.strictChunkTypes) {
        fail(ErrorKind::InvalidChunkType, message);
      }
      logger->warn(message);
    }

    const bool is_end = chunk.type == IEND;
    file.chunks.push_back(std::move(chunk));
    if (is_end) {
      break;
    }
  }

  if (!reader.atEnd()) {
    logger->warn("Ignoring {} bytes after IEND", reader.remaining());
  }
  logger->info("Parsed PNG: {} chunks, {}x{}", file.chunks.size(),
               file.header.width, file.header.height);
  return file;
}

std::vector<uint8_t> writePng(const PngFile &file, ChecksumScope scope) {
  ByteWriter writer;
  writer.writeBytes(PNG_SIGNATURE);
  for (const auto &chunk : file.chunks) {
    writeChunk(writer, chunk, scope);
  }
  return writer.take();
}

} // namespace pngstego::png
