#pragma once

#include "dvid.types.h"

#include <mutex>
#include <sstream>
#include <string>

class Logger
{
  public:
    static void set_log_level(DvidLogLevel level);
    static DvidLogLevel get_log_level();

    template<typename... Args>
    static std::string log(DvidLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        std::ostringstream ss;
        ss << get_timestamp_() << " " << prefix_(level) << filename_(file)
           << ":" << line << " " << func << ": ";

        format_arg_(ss, std::forward<Args>(args)...);

        std::string message = ss.str();
        if (level >= current_level_) {
            std::scoped_lock lock(log_mutex_);
            emit_(level, message);
        }

        return message;
    }

  private:
    static DvidLogLevel current_level_;
    static std::mutex log_mutex_;

    static void format_arg_(std::ostream&) {} // base case
    template<typename T, typename... Args>
    static void format_arg_(std::ostream& ss, T&& arg, Args&&... args)
    {
        ss << std::forward<T>(arg);
        format_arg_(ss, std::forward<Args>(args)...);
    }

    static const char* prefix_(DvidLogLevel level);
    static std::string filename_(const char* file);
    static std::string get_timestamp_();
    static void emit_(DvidLogLevel level, const std::string& message);
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(DvidLogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(DvidLogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(DvidLogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(DvidLogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
