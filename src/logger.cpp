#include "logger.h"
#include <algorithm>
#include <cctype>

namespace rtcdrop {

LogLevel log_level_from_string(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "INFO";
    }
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() : min_level_(LogLevel::INFO), colors_enabled_(true), timestamps_enabled_(true) {
    // Check if we're outputting to a terminal
    is_terminal_ = isatty(fileno(stdout));

    // On Windows, enable ANSI color codes
#ifdef _WIN32
    if (is_terminal_) {
        HANDLE hOut = GetStdHandle(STD_OUTPUT_HANDLE);
        DWORD dwMode = 0;
        GetConsoleMode(hOut, &dwMode);
        dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
        SetConsoleMode(hOut, dwMode);
    }
#endif
}

bool Logger::set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (log_file_.is_open()) {
        log_file_.close();
    }
    if (path.empty()) {
        return true;
    }

    log_file_.open(path, std::ios::out | std::ios::app);
    return log_file_.is_open();
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::ostringstream prefix;

    // Add timestamp if enabled
    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        prefix << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S");
        prefix << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    std::string plain_tail = "[" + get_level_string(level) + "]";
    if (!module.empty()) {
        plain_tail += " [" + module + "]";
    }
    plain_tail += " " + message;

    std::ostringstream oss;
    oss << prefix.str();

    // Add colored log level and module tag
    if (colors_enabled_ && is_terminal_) {
        oss << get_color_code(level) << "[" << get_level_string(level) << "]" << get_reset_code();
        if (!module.empty()) {
            oss << " " << get_module_color(module) << "[" << module << "]" << get_reset_code();
        }
        oss << " " << message;
    } else {
        oss << plain_tail;
    }
    oss << std::endl;

    // Output to appropriate stream
    if (level >= LogLevel::ERROR) {
        std::cerr << oss.str();
        std::cerr.flush();
    } else {
        std::cout << oss.str();
        std::cout.flush();
    }

    // Files never get color codes
    if (log_file_.is_open()) {
        log_file_ << prefix.str() << plain_tail << std::endl;
    }
}

std::string Logger::get_level_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string Logger::get_color_code(LogLevel level) {
    if (!colors_enabled_ || !is_terminal_) return "";

    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

std::string Logger::get_module_color(const std::string& module) {
    if (!colors_enabled_ || !is_terminal_) return "";

    // Map module hash to a small palette of readable colors
    static const char* colors[] = {
        "\033[35m",  // Magenta
        "\033[36m",  // Cyan
        "\033[94m",  // Bright Blue
        "\033[95m",  // Bright Magenta
        "\033[96m",  // Bright Cyan
        "\033[93m",  // Bright Yellow
        "\033[92m",  // Bright Green
        "\033[34m",  // Blue
        "\033[38;5;208m", // Orange
        "\033[38;5;141m"  // Purple
    };

    size_t color_count = sizeof(colors) / sizeof(colors[0]);
    return colors[hash_string(module) % color_count];
}

std::string Logger::get_reset_code() {
    if (!colors_enabled_ || !is_terminal_) return "";
    return "\033[0m";
}

} // namespace rtcdrop
