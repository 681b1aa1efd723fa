#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace pngstego {

/**
 * @brief Process-wide logger shared by the container and pixel layers.
 *
 * Created on first use with a file sink. If the sink cannot be opened the
 * logger silently discards messages.
 */
class Logger {
public:
  /**
   * @brief Returns the shared logger instance.
   */
  static std::shared_ptr<spdlog::logger> getInstance();

  /**
   * @brief Selects the log file used when the logger is first created.
   * @param path Log file path; its directory is created if missing.
   * @note Has no effect once getInstance() has been called.
   */
  static void setLogFile(const std::string &path);

  /**
   * @brief Changes the level of the shared logger.
   */
  static void setLevel(spdlog::level::level_enum level);
};

} // namespace pngstego
