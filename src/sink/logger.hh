#pragma once

#include "shardsink.types.h"

#include <filesystem>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

class Logger
{
  public:
    static void set_log_level(ShardSinkLogLevel level);
    static ShardSinkLogLevel get_log_level();

    template<typename... Args>
    static std::string log(ShardSinkLogLevel level,
                           const char* file,
                           int line,
                           const char* func,
                           Args&&... args)
    {
        namespace fs = std::filesystem;

        std::scoped_lock lock(log_mutex_);

        std::string prefix;
        auto stream = &std::cout;

        switch (level) {
            case ShardSinkLogLevel_Debug:
                prefix = "[DEBUG] ";
                break;
            case ShardSinkLogLevel_Info:
                prefix = "[INFO] ";
                break;
            case ShardSinkLogLevel_Warning:
                prefix = "[WARNING] ";
                break;
            default:
                prefix = "[ERROR] ";
                stream = &std::cerr;
                break;
        }

        fs::path filepath(file);
        std::string filename = filepath.filename().string();

        std::ostringstream ss;
        ss << get_timestamp_() << " " << prefix << filename << ":" << line
           << " " << func << ": ";

        format_arg_(ss, std::forward<Args>(args)...);

        std::string message = ss.str();
        if (level >= current_level_) {
            *stream << message << std::endl;
        }

        return message;
    }

  private:
    static ShardSinkLogLevel current_level_;
    static std::mutex log_mutex_;

    static void format_arg_(std::ostream&) {} // base case
    template<typename T, typename... Args>
    static void format_arg_(std::ostream& ss, T&& arg, Args&&... args)
    {
        ss << std::forward<T>(arg);
        format_arg_(ss, std::forward<Args>(args)...);
    }

    static std::string get_timestamp_();
};

#define LOG_DEBUG(...)                                                         \
    Logger::log(                                                               \
      ShardSinkLogLevel_Debug, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(...)                                                          \
    Logger::log(ShardSinkLogLevel_Info, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARNING(...)                                                       \
    Logger::log(                                                               \
      ShardSinkLogLevel_Warning, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
    Logger::log(                                                               \
      ShardSinkLogLevel_Error, __FILE__, __LINE__, __func__, __VA_ARGS__)
