#include "common/Logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <stdexcept>

namespace ddns::common {

bool Logger::_bInitialized = false;

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  // spdlog maps unknown names to "off"; only accept that when asked for explicitly
  auto level = spdlog::level::from_str(sLevel);
  if (level == spdlog::level::off && sLevel != "off") {
    throw std::runtime_error("Unknown log level: '" + sLevel + "'");
  }
  return level;
}

void Logger::init(const std::string& sLevel) {
  auto level = parseLevel(sLevel);

  if (_bInitialized) {
    // Re-initialization: just update level
    spdlog::set_level(level);
    return;
  }

  auto spLogger = spdlog::stdout_color_mt("ddns");
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spLogger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->info("Logger initialized at level '{}'", sLevel);
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace ddns::common
