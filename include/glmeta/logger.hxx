#pragma once

#include <string_view>

namespace glmeta
{
    class I_logger
    {
    public:
        virtual ~I_logger() = default;

        enum class log_level
        {
            error,
            warning,
            notification,
            debug,
        };

        virtual void log(std::string_view message, log_level level) const = 0;

        static auto level_string(log_level level) -> std::string_view
        {
            switch (level) {
            case log_level::error:
                return "ERROR";
            case log_level::warning:
                return "WARNING";
            case log_level::notification:
                return "NOTIFICATION";
            case log_level::debug:
                return "DEBUG";
            default:
                return "MISC";
            }
        }
    };

    /// Logging is optional throughout glmeta; a null logger discards messages.
    inline void log_message(I_logger const* logger, std::string_view message, I_logger::log_level level)
    {
        if (nullptr != logger) {
            logger->log(message, level);
        }
    }
}
