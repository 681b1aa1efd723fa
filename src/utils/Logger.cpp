#include "Logger.hpp"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace pngstego {

namespace {
std::mutex config_mutex;
std::string log_file = "logs/pngstego.log";
} // namespace

std::shared_ptr<spdlog::logger> Logger::getInstance() {
  static std::once_flag flag;
  static std::shared_ptr<spdlog::logger> instance;

  std::call_once(flag, []() {
    std::string path;
    {
      std::lock_guard<std::mutex> lock(config_mutex);
      path = log_file;
    }
    try {
      const auto parent = std::filesystem::path(path).parent_path();
      if (!parent.empty()) {
        std::filesystem::create_directories(parent);
      }
      instance = spdlog::basic_logger_mt("pngstego", path);
      instance->set_level(spdlog::level::info);
      instance->flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex &ex) {
      std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
      instance = spdlog::null_logger_mt("null_pngstego_logger");
    } catch (const std::filesystem::filesystem_error &ex) {
      std::cerr << "Logger initialization failed: " << ex.what() << std::endl;
      instance = spdlog::null_logger_mt("null_pngstego_logger");
    }
  });

  return instance;
}

void Logger::setLogFile(const std::string &path) {
  std::lock_guard<std::mutex> lock(config_mutex);
  log_file = path;
}

void Logger::setLevel(spdlog::level::level_enum level) {
  getInstance()->set_level(level);
}

} // namespace pngstego
