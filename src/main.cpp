#include "Application.hpp"
#include "Config.hpp"
#include "Supervisor.hpp"

#include <csignal>

namespace
{
void signal_handler(int /*signal*/) { App::request_close(); }
} // namespace

auto main() -> int
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    const auto config = Config::from_environment();
    Supervisor supervisor{ config.endpoint, config.command };

    auto app = App::spawn(supervisor, config.endpoint);
    if (!app) return 1;
    app->run();
    app.reset();

    supervisor.shutdown();
}
