#include "logger.hh"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>

DvidLogLevel Logger::current_level_ = DvidLogLevel_Info;
std::mutex Logger::log_mutex_{};

void
Logger::set_log_level(DvidLogLevel level)
{
    current_level_ = level;
}

DvidLogLevel
Logger::get_log_level()
{
    return current_level_;
}

const char*
Logger::prefix_(DvidLogLevel level)
{
    switch (level) {
        case DvidLogLevel_Debug:
            return "[DEBUG] ";
        case DvidLogLevel_Info:
            return "[INFO] ";
        case DvidLogLevel_Warning:
            return "[WARNING] ";
        default:
            return "[ERROR] ";
    }
}

std::string
Logger::filename_(const char* file)
{
    std::filesystem::path filepath(file);
    return filepath.filename().string();
}

std::string
Logger::get_timestamp_()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
              1000;

    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
       << std::setw(3) << ms.count();

    return ss.str();
}

void
Logger::emit_(DvidLogLevel level, const std::string& message)
{
    auto stream = level < DvidLogLevel_Warning ? &std::cout : &std::cerr;
    *stream << message << std::endl;
}
