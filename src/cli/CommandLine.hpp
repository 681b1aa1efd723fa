#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace pngstego::cli {

constexpr int EXIT_OK = 0;
constexpr int EXIT_CORE_ERROR = 1; ///< Error raised by the core or file I/O
constexpr int EXIT_USAGE = 2;      ///< Bad command line

/**
 * @brief Runs one pngstego command.
 *
 * Commands:
 *   embed <in.png> <payload-file> <out.png> [--method M] [--config F]
 *   extract <in.png> <bit-count> <out-file> [--method M] [--config F]
 *   info <in.png> [--config F]
 *
 * --method overrides the method read from --config.
 *
 * @param args Arguments without the program name.
 * @param out Receives the command's report.
 * @param err Receives usage text and `error: <kind>: <message>` lines.
 * @return EXIT_OK, EXIT_CORE_ERROR or EXIT_USAGE.
 */
int runCommandLine(const std::vector<std::string> &args, std::ostream &out,
                   std::ostream &err);

} // namespace pngstego::cli
