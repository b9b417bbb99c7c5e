#ifndef AGENTDESK_CONFIG_HPP
#define AGENTDESK_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct Endpoint
{
    std::string   host;
    std::uint16_t port = 0;

    [[nodiscard]] auto to_string() const -> std::string
    {
        return host + ":" + std::to_string(port);
    }
};

struct LaunchCommand
{
    std::string              program;
    std::vector<std::string> args;

    [[nodiscard]] auto to_string() const -> std::string;
};

// Parses a TCP port, rejecting anything outside 1..65535.
[[nodiscard]] auto parse_port(std::string_view text)
  -> std::optional<std::uint16_t>;

struct Config
{
    constexpr static auto DEFAULT_HOST    = "127.0.0.1";
    constexpr static auto DEFAULT_PORT    = std::uint16_t{ 3000 };
    constexpr static auto DEFAULT_PROGRAM = "elizaos";
    constexpr static auto START_DIRECTIVE = "start";

    // The launched server reads the same variable to pick its port.
    constexpr static auto PORT_VARIABLE = "SERVER_PORT";

    Endpoint      endpoint{ DEFAULT_HOST, DEFAULT_PORT };
    LaunchCommand command{ DEFAULT_PROGRAM, { START_DIRECTIVE } };

    [[nodiscard]] static auto from_environment() -> Config;
};

#endif // AGENTDESK_CONFIG_HPP
