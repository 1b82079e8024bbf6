#ifndef CHUNKSTREAM_MYLOGGER_HPP
#define CHUNKSTREAM_MYLOGGER_HPP

#include <iostream>
#include <ostream>
#include <string>

namespace chunkstream
{

    class MyLogger
    {
    public:
        enum class Level
        {
            Debug = 0,
            Info,
            Warning,
            Error,
            Off
        };

        static void setLevel(Level level) { level_ = level; }

        // Destination of debug/info/warning lines; errors always go to std::cerr.
        static void setOutput(std::ostream &out) { out_ = &out; }
        static Level level() { return level_; }

        // Unknown names leave `out` untouched and return false.
        static bool parseLevel(const std::string &name, Level &out)
        {
            if (name == "debug")
                out = Level::Debug;
            else if (name == "info")
                out = Level::Info;
            else if (name == "warning")
                out = Level::Warning;
            else if (name == "error")
                out = Level::Error;
            else if (name == "off")
                out = Level::Off;
            else
                return false;
            return true;
        }
        static bool setLevel(const std::string &name) { return parseLevel(name, level_); }

        static void debug(const std::string &msg)
        {
            if (enabled(Level::Debug))
                (*out_) << "\033[1;94m[DEBUG] " << msg << "\033[0m" << std::endl; // Light blue
        }
        static void info(const std::string &msg)
        {
            if (enabled(Level::Info))
                (*out_) << "\033[1;32m[INFO] " << msg << "\033[0m" << std::endl; // Light green
        }
        static void warning(const std::string &msg)
        {
            if (enabled(Level::Warning))
                (*out_) << "\033[1;33m[WARNING] " << msg << "\033[0m" << std::endl; // Yellow
        }
        static void error(const std::string &msg)
        {
            if (enabled(Level::Error))
                std::cerr << "\033[1;35m[ERROR] " << msg << "\033[0m" << std::endl; // Magenta
        }

    private:
        static bool enabled(Level level) { return level >= level_ && level_ != Level::Off; }

        static inline Level level_ = Level::Info;
        static inline std::ostream *out_ = &std::cout;
    };

} // namespace chunkstream

#endif // CHUNKSTREAM_MYLOGGER_HPP
