#pragma once

#include <string>

namespace logging {

enum class Level {
    DEBUG,
    INFO,
    WARN,
    ERROR
};

// Lines below this level are dropped. Defaults to INFO.
void set_level(Level level);

// Writes "YYYY-mm-dd HH:MM:SS [LEVEL] [tag] text". INFO and below go to
// stdout, WARN and ERROR to stderr. Safe to call from any thread.
void write(Level level, const std::string& tag, const std::string& text);

inline void debug(const std::string& tag, const std::string& text) { write(Level::DEBUG, tag, text); }
inline void info(const std::string& tag, const std::string& text) { write(Level::INFO, tag, text); }
inline void warn(const std::string& tag, const std::string& text) { write(Level::WARN, tag, text); }
inline void error(const std::string& tag, const std::string& text) { write(Level::ERROR, tag, text); }

} // namespace logging
