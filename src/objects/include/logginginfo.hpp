#pragma once

#include <cstdint>
#include <string_view>

#include "log-config.hpp"
#include "nonce-config.hpp"
#include "tnc_log.hpp"
#include "tnc_string.hpp"

namespace tnc {

/// @brief Encapsulates loggers lifetime and set-up.
class LoggingInfo {
 public:
  static constexpr int64_t kDefaultFileSizeInBytes = 5L * 1024 * 1024;
  static constexpr int32_t kDefaultNbMaxFiles = 10;

  enum class WithLoggersCreation : int8_t { kNo, kYes };

  /// Creates a default logging info, with level 'info' on standard error.
  explicit LoggingInfo(WithLoggersCreation withLoggersCreation = WithLoggersCreation::kNo,
                       std::string_view dataDir = ".");

  /// Creates a logging info from the log part of the configuration.
  /// Log file, if enabled, is written in '<dataDir>/log/log.txt'.
  LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir, const schema::LogConfig &logConfig);

  /// Creates a logging info from the 'log' part of a loaded nonce configuration.
  LoggingInfo(WithLoggersCreation withLoggersCreation, std::string_view dataDir,
              const schema::NonceConfig &nonceConfig)
      : LoggingInfo(withLoggersCreation, dataDir, nonceConfig.log) {}

  LoggingInfo(const LoggingInfo &) = delete;
  LoggingInfo(LoggingInfo &&rhs) noexcept;
  LoggingInfo &operator=(const LoggingInfo &) = delete;
  LoggingInfo &operator=(LoggingInfo &&rhs) noexcept;

  ~LoggingInfo();

  int64_t maxFileSizeLogFileInBytes() const { return _maxFileSizeLogFileInBytes; }

  int32_t maxNbLogFiles() const { return _maxNbLogFiles; }

  log::level::level_enum logConsole() const { return LevelFromPos(_logLevelConsolePos); }
  log::level::level_enum logFile() const { return LevelFromPos(_logLevelFilePos); }

  void swap(LoggingInfo &rhs) noexcept;

 private:
  void createLoggers();

  string _dataDir;
  int64_t _maxFileSizeLogFileInBytes = kDefaultFileSizeInBytes;
  int32_t _maxNbLogFiles = kDefaultNbMaxFiles;
  int8_t _logLevelConsolePos = PosFromLevel(log::level::info);
  int8_t _logLevelFilePos = PosFromLevel(log::level::off);
  bool _destroyDefaultLogger = false;
};

}  // namespace tnc
