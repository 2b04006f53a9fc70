#include "common/Logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <vector>

namespace gitbridge::common {

bool Logger::_bInitialized = false;

void Logger::init(const std::string& sLevel, const std::string& sLogFile) {
  if (_bInitialized) {
    // Re-initialization: just update level
    spdlog::set_level(spdlog::level::from_str(sLevel));
    return;
  }

  std::vector<spdlog::sink_ptr> vSinks;
  vSinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!sLogFile.empty()) {
    vSinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(sLogFile, false));
  }

  auto spLogger = std::make_shared<spdlog::logger>("gitbridge", vSinks.begin(), vSinks.end());
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");

  auto level = spdlog::level::from_str(sLevel);
  spLogger->set_level(level);
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

}  // namespace gitbridge::common
