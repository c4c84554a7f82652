#ifndef PSRISK_LOGGING_HPP
#define PSRISK_LOGGING_HPP

#include <map>
#include <ostream>
#include <string>

#include "psrisk/config.hpp"

namespace psrisk {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError,
};

class Logger {
public:
    explicit Logger(std::string name);

    void log(LogLevel level, const std::string& message,
             const std::map<std::string, std::string>& extra = {}) const;

    void debug(const std::string& message,
               const std::map<std::string, std::string>& extra = {}) const;
    void info(const std::string& message,
              const std::map<std::string, std::string>& extra = {}) const;
    void warn(const std::string& message,
              const std::map<std::string, std::string>& extra = {}) const;
    void error(const std::string& message,
               const std::map<std::string, std::string>& extra = {}) const;

    const std::string& name() const { return name_; }
    Logger child(const std::string& suffix) const;

private:
    std::string name_;
};

void configure_logging(const LoggingConfig& config);
// Redirects output to stream when no log file is configured; nullptr restores stdout.
void set_log_stream(std::ostream* stream);
Logger get_logger(const std::string& name);

}  // namespace psrisk

#endif  // PSRISK_LOGGING_HPP
