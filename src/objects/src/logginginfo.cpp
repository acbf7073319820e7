#include "logginginfo.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include "log-config.hpp"
#include "parseloglevel.hpp"
#include "tnc_exception.hpp"
#include "tnc_log.hpp"
#include "tnc_string.hpp"

namespace tnc {

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir) : _dataDir(dataDir) {
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir,
                         const schema::LogConfig &logConfig)
    : _dataDir(dataDir),
      _maxFileSizeLogFileInBytes(logConfig.maxFileSize),
      _maxNbLogFiles(logConfig.maxNbFiles),
      _logLevelConsolePos(LogPosFromLogStr(logConfig.consoleLevel)),
      _logLevelFilePos(LogPosFromLogStr(logConfig.fileLevel)) {
  if (_maxFileSizeLogFileInBytes <= 0 || _maxNbLogFiles <= 0) {
    throw exception("Invalid log file rotation settings: max file size {}, max nb files {}",
                    _maxFileSizeLogFileInBytes, _maxNbLogFiles);
  }
  if (withLoggersCreation == WithLoggersCreation::kYes) {
    createLoggers();
  }
}

LoggingInfo::LoggingInfo(LoggingInfo &&rhs) noexcept
    : _dataDir(std::move(rhs._dataDir)),
      _maxFileSizeLogFileInBytes(rhs._maxFileSizeLogFileInBytes),
      _maxNbLogFiles(rhs._maxNbLogFiles),
      _logLevelConsolePos(rhs._logLevelConsolePos),
      _logLevelFilePos(rhs._logLevelFilePos),
      _destroyDefaultLogger(std::exchange(rhs._destroyDefaultLogger, false)) {}

LoggingInfo &LoggingInfo::operator=(LoggingInfo &&rhs) noexcept {
  if (&rhs != this) {
    swap(rhs);
  }
  return *this;
}

LoggingInfo::~LoggingInfo() {
  if (_destroyDefaultLogger) {
    // flushes pending async messages and gives back a synchronous default logger
    log::shutdown();
    log::set_default_logger(log::stderr_color_mt(""));
  }
}

void LoggingInfo::createLoggers() {
  std::vector<log::sink_ptr> sinks;

  if (_logLevelConsolePos != 0) {
    auto &consoleSink = sinks.emplace_back(std::make_shared<log::sinks::stderr_color_sink_mt>());
    consoleSink->set_level(LevelFromPos(_logLevelConsolePos));
  }

  if (_logLevelFilePos != 0) {
    log::filename_t logFileName = log::filename_t(_dataDir) + log::filename_t("/log/log.txt");
    auto &rotatingSink = sinks.emplace_back(std::make_shared<log::sinks::rotating_file_sink_mt>(
        std::move(logFileName), static_cast<std::size_t>(_maxFileSizeLogFileInBytes),
        static_cast<std::size_t>(_maxNbLogFiles)));

    rotatingSink->set_level(LevelFromPos(_logLevelFilePos));
  }

  if (!sinks.empty()) {
    constexpr int nbThreads = 1;  // keeps the order of messages
    log::init_thread_pool(8192, nbThreads);
    auto logger = std::make_shared<log::async_logger>("", sinks.begin(), sinks.end(), log::thread_pool(),
                                                      log::async_overflow_policy::block);

    // each sink filters its own level, the logger level should let through the most verbose of them
    logger->set_level(LevelFromPos(std::max(_logLevelConsolePos, _logLevelFilePos)));

    log::set_default_logger(logger);
    _destroyDefaultLogger = true;
  }
}

void LoggingInfo::swap(LoggingInfo &rhs) noexcept {
  using std::swap;

  _dataDir.swap(rhs._dataDir);
  swap(_maxFileSizeLogFileInBytes, rhs._maxFileSizeLogFileInBytes);
  swap(_maxNbLogFiles, rhs._maxNbLogFiles);
  swap(_logLevelConsolePos, rhs._logLevelConsolePos);
  swap(_logLevelFilePos, rhs._logLevelFilePos);
  swap(_destroyDefaultLogger, rhs._destroyDefaultLogger);
}

}  // namespace tnc
