#include "psrisk/logging.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>

#include "psrisk/common.hpp"
#include "psrisk/json.hpp"

namespace psrisk {

namespace {

// Appends to a log file and shifts it to path.1 .. path.N once max_bytes is reached.
class RotatingFile {
public:
    RotatingFile(std::filesystem::path path, std::uintmax_t max_bytes, int backups)
        : path_(std::move(path)), max_bytes_(max_bytes), backups_(backups) {
        open();
    }

    bool is_open() const { return stream_ && stream_->is_open(); }

    void write(const std::string& line) {
        if (max_bytes_ > 0 && backups_ > 0 && written_ + line.size() > max_bytes_ && written_ > 0) {
            rotate();
        }
        *stream_ << line;
        stream_->flush();
        written_ += line.size();
    }

private:
    void open() {
        stream_ = std::make_unique<std::ofstream>(path_, std::ios::app);
        std::error_code ec;
        const auto size = std::filesystem::file_size(path_, ec);
        written_ = ec ? 0 : size;
    }

    std::filesystem::path numbered(int index) const {
        auto output = path_;
        output += "." + std::to_string(index);
        return output;
    }

    void rotate() {
        stream_.reset();
        std::error_code ec;
        std::filesystem::remove(numbered(backups_), ec);
        for (int index = backups_ - 1; index >= 1; --index) {
            if (std::filesystem::exists(numbered(index), ec)) {
                std::filesystem::rename(numbered(index), numbered(index + 1), ec);
            }
        }
        std::filesystem::rename(path_, numbered(1), ec);
        open();
    }

    std::filesystem::path path_;
    std::uintmax_t max_bytes_ = 0;
    int backups_ = 0;
    std::uintmax_t written_ = 0;
    std::unique_ptr<std::ofstream> stream_;
};

struct LoggingState {
    LogLevel level = LogLevel::kInfo;
    bool json = true;
    std::unique_ptr<RotatingFile> file;
    std::ostream* stream = nullptr;
    std::mutex mutex;
};

LoggingState& state() {
    static LoggingState instance;
    return instance;
}

struct LevelName {
    LogLevel level;
    const char* name;
};

const LevelName kLevels[] = {
    {LogLevel::kDebug, "DEBUG"},
    {LogLevel::kInfo, "INFO"},
    {LogLevel::kWarn, "WARN"},
    {LogLevel::kError, "ERROR"},
};

const LevelName kLevelAliases[] = {
    {LogLevel::kDebug, "debug"},
    {LogLevel::kInfo, "info"},
    {LogLevel::kWarn, "warn"},
    {LogLevel::kWarn, "warning"},
    {LogLevel::kError, "error"},
};

LogLevel parse_level(const std::string& text) {
    const auto lowered = to_lower(trim(text));
    for (const auto& entry : kLevelAliases) {
        if (lowered == entry.name) {
            return entry.level;
        }
    }
    return LogLevel::kInfo;
}

const char* level_name(LogLevel level) {
    for (const auto& entry : kLevels) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "INFO";
}

std::string format_line(bool json, LogLevel level, const std::string& logger, const std::string& event,
                        const std::map<std::string, std::string>& extra) {
    const auto timestamp = iso_timestamp();
    if (json) {
        JsonWriter line;
        line.begin_object()
            .key("ts").value(timestamp)
            .key("level").value(level_name(level))
            .key("name").value(logger)
            .key("message").value(event);
        for (const auto& [key, value] : extra) {
            line.key(key).value(value);
        }
        line.end_object();
        return line.str() + "\n";
    }
    std::ostringstream line;
    line << timestamp << ' ' << level_name(level) << ' ' << logger << ' ' << event;
    if (!extra.empty()) {
        line << " |";
        for (const auto& [key, value] : extra) {
            line << ' ' << key << '=' << value;
        }
    }
    line << '\n';
    return line.str();
}

}  // namespace

Logger::Logger(std::string name) : name_(std::move(name)) {}

Logger Logger::child(const std::string& suffix) const {
    return Logger(name_ + "." + suffix);
}

void Logger::log(LogLevel level, const std::string& message,
                 const std::map<std::string, std::string>& extra) const {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    if (static_cast<int>(level) < static_cast<int>(log_state.level)) {
        return;
    }
    const auto line = format_line(log_state.json, level, name_, message, extra);
    if (log_state.file) {
        log_state.file->write(line);
        return;
    }
    std::ostream& output = log_state.stream != nullptr ? *log_state.stream : std::cout;
    output << line;
    output.flush();
}

void Logger::debug(const std::string& message, const std::map<std::string, std::string>& extra) const {
    log(LogLevel::kDebug, message, extra);
}

void Logger::info(const std::string& message, const std::map<std::string, std::string>& extra) const {
    log(LogLevel::kInfo, message, extra);
}

void Logger::warn(const std::string& message, const std::map<std::string, std::string>& extra) const {
    log(LogLevel::kWarn, message, extra);
}

void Logger::error(const std::string& message, const std::map<std::string, std::string>& extra) const {
    log(LogLevel::kError, message, extra);
}

void configure_logging(const LoggingConfig& config) {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    log_state.level = parse_level(config.level);
    log_state.json = config.json;
    log_state.file.reset();
    if (config.log_file.has_value()) {
        auto file = std::make_unique<RotatingFile>(*config.log_file,
                                                   static_cast<std::uintmax_t>(std::max(config.max_bytes, 0)),
                                                   config.backup_count);
        if (file->is_open()) {
            log_state.file = std::move(file);
        }
    }
}

void set_log_stream(std::ostream* stream) {
    auto& log_state = state();
    std::lock_guard<std::mutex> guard(log_state.mutex);
    log_state.stream = stream;
}

Logger get_logger(const std::string& name) {
    return Logger(name);
}

}  // namespace psrisk
