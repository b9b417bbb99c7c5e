#ifndef AGENTDESK_COMMON_HPP
#define AGENTDESK_COMMON_HPP

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

namespace detail
{

// Whole line is built first so concurrent callers never interleave output.
template<typename... Args>
void write_line(std::ostream &stream, const char *level, const Args &...args)
{
    std::ostringstream line;
    line << '[' << level << "] ";
    (line << ... << args);
    line << '\n';
    stream << line.str() << std::flush;
}

} // namespace detail

[[nodiscard]] inline auto debug_enabled() -> bool
{
    static const bool enabled = std::getenv("AGENTDESK_DEBUG") != nullptr;
    return enabled;
}

template<typename... Args>
void log_debug(const Args &...args)
{
    if (!debug_enabled()) { return; }
    detail::write_line(std::cout, "DEBUG", args...);
}

template<typename... Args>
void log_info(const Args &...args)
{
    detail::write_line(std::cout, "INFO", args...);
}

template<typename... Args>
void log_warn(const Args &...args)
{
    detail::write_line(std::cerr, "WARN", args...);
}

template<typename... Args>
void log_error(const Args &...args)
{
    detail::write_line(std::cerr, "ERROR", args...);
}

#endif // AGENTDESK_COMMON_HPP
