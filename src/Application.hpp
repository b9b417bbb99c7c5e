#ifndef AGENTDESK_APPLICATION_HPP
#define AGENTDESK_APPLICATION_HPP

#include <memory>

#include <GLFW/glfw3.h>

#include "Config.hpp"
#include "Supervisor.hpp"

class [[nodiscard]] App final
{
public:
    // Creates the window, then makes sure the local server is up before
    // the first frame is drawn.
    [[nodiscard]] static auto spawn(Supervisor& supervisor, const Endpoint& endpoint)
        -> std::unique_ptr<App>;

    void run();

    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    App(App&&) = delete;
    App& operator=(App&&) = delete;

    // Asks the main loop to close the window. Safe from a signal handler.
    static void request_close();

private:
    App(GLFWwindow* window, Supervisor& supervisor, const Endpoint& endpoint);

    static void on_window_close(GLFWwindow* window);

    void on_setup();
    void refresh_reachability();

    void render_server_address();
    void render_connection_status();

private:
    constexpr static auto WINDOW_WIDTH = 640;
    constexpr static auto WINDOW_HEIGHT = 240;
    constexpr static const char* WINDOW_TITLE = "agentdesk";
    constexpr static const char* GLSL_VERSION = "#version 330";

    constexpr static auto PROBE_INTERVAL_SECONDS = 1.0;

private:
    GLFWwindow* window = nullptr;
    Supervisor& supervisor;
    Endpoint endpoint;

    bool reachable = false;
    double last_probe_time = 0.0;
};

#endif // AGENTDESK_APPLICATION_HPP
