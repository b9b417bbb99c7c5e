#include "Config.hpp"
#include "Common.hpp"

#include <charconv>
#include <cstdlib>
#include <limits>

auto LaunchCommand::to_string() const -> std::string
{
    auto ret = program;
    for (const auto &arg : args) {
        ret += ' ';
        ret += arg;
    }
    return ret;
}

auto parse_port(std::string_view text) -> std::optional<std::uint16_t>
{
    unsigned int value = 0;
    const auto *const end = text.data() + text.size();

    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) { return std::nullopt; }
    if (value == 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }

    return static_cast<std::uint16_t>(value);
}

auto Config::from_environment() -> Config
{
    Config config;

    if (const char *value = std::getenv(PORT_VARIABLE); value != nullptr) {
        if (const auto port = parse_port(value); port) {
            config.endpoint.port = *port;
        } else {
            log_warn(
              "[Config] ignoring invalid ", PORT_VARIABLE, "=\"", value,
              "\", using port ", config.endpoint.port
            );
        }
    }

    log_debug(
      "[Config] endpoint ", config.endpoint.to_string(), ", launch command \"",
      config.command.to_string(), "\""
    );
    return config;
}
