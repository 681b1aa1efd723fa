#include "CommandLine.hpp"
#include "config/StegoConfig.hpp"
#include "png/ChunkStream.hpp"
#include "stego/PngSupport.hpp"
#include "utils/Logger.hpp"

#include <charconv>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>

namespace pngstego::cli {

namespace {

void print_usage(std::ostream &err) {
  err << "Usage:\n"
         "  pngstego embed <in.png> <payload-file> <out.png> [--method M] "
         "[--config F]\n"
         "  pngstego extract <in.png> <bit-count> <out-file> [--method M] "
         "[--config F]\n"
         "  pngstego info <in.png> [--config F]\n"
         "Methods: one-bit, two-bits, color-only\n";
}

std::vector<uint8_t> read_all(const std::string &path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("Cannot read file: " + path);
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(ifs)),
                             std::istreambuf_iterator<char>());
  return bytes;
}

void write_all(const std::string &path, const std::vector<uint8_t> &bytes) {
  std::ofstream ofs(path, std::ios::binary);
  if (!ofs) {
    throw std::runtime_error("Cannot write file: " + path);
  }
  ofs.write(reinterpret_cast<const char *>(bytes.data()),
            static_cast<std::streamsize>(bytes.size()));
  if (!ofs) {
    throw std::runtime_error("Write failed: " + path);
  }
}

// Positional arguments and --key value options
struct Arguments {
  std::vector<std::string> positional;
  std::map<std::string, std::string> options;
};

bool parse_arguments(const std::vector<std::string> &argv, Arguments &args,
                     std::ostream &err) {
  for (size_t i = 0; i < argv.size(); ++i) {
    const std::string &a = argv[i];
    if (a.rfind("--", 0) == 0) {
      if (i + 1 >= argv.size()) {
        err << "Missing value for " << a << "\n";
        return false;
      }
      args.options[a.substr(2)] = argv[++i];
    } else {
      args.positional.push_back(a);
    }
  }
  return true;
}

int report(const StegoError &error, std::ostream &err) {
  err << "error: " << errorToString(error.kind) << ": " << error.message
      << "\n";
  return EXIT_CORE_ERROR;
}

int run_embed(const Arguments &args, const StegoConfig &config,
              std::ostream &out, std::ostream &err) {
  const auto file = read_all(args.positional[1]);
  const auto payload = read_all(args.positional[2]);

  stego::PngEncodingSupport support(config.readOptions());
  auto result = stego::embedPayload(support, file, payload, config.method);
  if (!result) {
    return report(result.error(), err);
  }
  write_all(args.positional[3], *result);
  out << fmt::format("Embedded {} bytes ({} bits) into {} using {}\n",
                     payload.size(), payload.size() * 8, args.positional[3],
                     stego::methodToString(config.method));
  return EXIT_OK;
}

int run_extract(const Arguments &args, const StegoConfig &config,
                std::ostream &out, std::ostream &err) {
  const std::string &count_text = args.positional[2];
  size_t bit_count = 0;
  auto [ptr, ec] = std::from_chars(
      count_text.data(), count_text.data() + count_text.size(), bit_count);
  if (ec != std::errc() || ptr != count_text.data() + count_text.size()) {
    err << "Invalid bit count: " << count_text << "\n";
    return EXIT_USAGE;
  }

  const auto file = read_all(args.positional[1]);
  stego::PngEncodingSupport support(config.readOptions());
  auto result = stego::extractPayload(support, file, bit_count, config.method);
  if (!result) {
    return report(result.error(), err);
  }
  write_all(args.positional[3], *result);
  out << fmt::format("Extracted {} bits to {} using {}\n", bit_count,
                     args.positional[3], stego::methodToString(config.method));
  return EXIT_OK;
}

int run_info(const Arguments &args, const StegoConfig &config,
             std::ostream &out, std::ostream &err) {
  const auto bytes = read_all(args.positional[1]);

  png::PngFile file;
  try {
    file = png::readPng(bytes, config.readOptions());
  } catch (const StegoException &e) {
    return report(e.toError(), err);
  }

  const auto &h = file.header;
  out << fmt::format("{}x{}, bit depth {}, colour type {}, compression {}, "
                     "filter {}, interlace {}\n",
                     h.width, h.height, h.bit_depth, h.color_type,
                     h.compression_method, h.filter_method,
                     h.interlace_method);

  for (const auto &chunk : file.chunks) {
    auto description = png::describe(chunk.type);
    out << fmt::format("  {:<8} {:>10}  {}{}{}{}  {}\n",
                       chunk.type.toString(), chunk.data.size(),
                       png::isCritical(chunk.type) ? 'C' : 'a',
                       png::isPrivate(chunk.type) ? 'p' : 'P',
                       png::reservedSet(chunk.type) ? 'r' : 'R',
                       png::safeToCopy(chunk.type) ? 's' : 'u',
                       description ? *description : "(unknown)");
  }

  stego::PngEncodingSupport support(config.readOptions());
  for (auto method : {stego::EncodingMethod::OneBitPerChannel,
                      stego::EncodingMethod::TwoBitsPerChannel,
                      stego::EncodingMethod::OneBitColorOnly}) {
    auto capacity = stego::payloadCapacity(support, bytes, method);
    if (capacity) {
      out << fmt::format("capacity {:<10} {} bits ({} bytes)\n",
                         stego::methodToString(method), *capacity,
                         *capacity / 8);
    } else {
      out << fmt::format("capacity {:<10} unavailable: {}\n",
                         stego::methodToString(method),
                         capacity.error().message);
    }
  }
  return EXIT_OK;
}

} // namespace

int runCommandLine(const std::vector<std::string> &argv, std::ostream &out,
                   std::ostream &err) {
  Arguments args;
  if (!parse_arguments(argv, args, err) || args.positional.empty()) {
    print_usage(err);
    return EXIT_USAGE;
  }

  const std::string &command = args.positional[0];
  const size_t expected = command == "info" ? 2 : 4;
  if ((command != "embed" && command != "extract" && command != "info") ||
      args.positional.size() != expected) {
    print_usage(err);
    return EXIT_USAGE;
  }

  try {
    StegoConfig config;
    if (auto it = args.options.find("config"); it != args.options.end()) {
      config = StegoConfig::load(it->second);
    }
    if (auto it = args.options.find("method"); it != args.options.end()) {
      auto method = stego::methodFromString(it->second);
      if (!method) {
        err << "Unknown method: " << it->second << "\n";
        return EXIT_USAGE;
      }
      config.method = *method;
    }
    applyLogging(config);
    Logger::getInstance()->info("pngstego {} {}", command, args.positional[1]);

    if (command == "embed") {
      return run_embed(args, config, out, err);
    }
    if (command == "extract") {
      return run_extract(args, config, out, err);
    }
    return run_info(args, config, out, err);
  } catch (const StegoException &e) {
    return report(e.toError(), err);
  } catch (const std::runtime_error &e) {
    err << "error: " << e.what() << "\n";
    return EXIT_CORE_ERROR;
  }
}

} // namespace pngstego::cli
