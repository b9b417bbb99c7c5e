#include "Application.hpp"
#include "Common.hpp"
#include "LivenessProbe.hpp"

#include <atomic>

#include <backends/imgui_impl_glfw.h>
#include <backends/imgui_impl_opengl3.h>
#include <imgui.h>

namespace
{

std::atomic<bool> close_requested{ false };

void glfw_error_callback(int error, const char *description)
{
    log_error("GLFW Error (", error, "): ", description);
}
} // namespace

auto App::spawn(Supervisor &supervisor, const Endpoint &endpoint)
  -> std::unique_ptr<App>
{
    glfwSetErrorCallback(glfw_error_callback);

    if (glfwInit() == 0) {
        log_error("Glfw failed initialize");
        return nullptr;
    }

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    GLFWwindow *window = glfwCreateWindow(
      WINDOW_WIDTH, WINDOW_HEIGHT, WINDOW_TITLE, nullptr, nullptr
    );
    if (window == nullptr) {
        log_error("Glfw failed to create window");
        glfwTerminate();
        return nullptr;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO &io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui::StyleColorsDark();

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init(GLSL_VERSION);

    auto app = std::unique_ptr<App>(new App{ window, supervisor, endpoint });
    glfwSetWindowUserPointer(window, app.get());
    glfwSetWindowCloseCallback(window, on_window_close);

    app->on_setup();
    return app;
}

App::App(GLFWwindow *window, Supervisor &supervisor, const Endpoint &endpoint)
  : window{ window }
  , supervisor{ supervisor }
  , endpoint{ endpoint }
{}

App::~App()
{
    // Application exit. A no-op if the window close already stopped it.
    supervisor.shutdown();

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
}

void App::request_close()
{
    close_requested.store(true, std::memory_order_relaxed);
}

void App::on_window_close(GLFWwindow *window)
{
    auto *app = static_cast<App *>(glfwGetWindowUserPointer(window));
    if (app == nullptr) { return; }

    log_info("Window closing, stopping local server");
    app->supervisor.shutdown();
}

void App::on_setup()
{
    supervisor.ensure_started();
    refresh_reachability();
}

void App::refresh_reachability()
{
    reachable       = probe(endpoint);
    last_probe_time = glfwGetTime();
}

void App::run()
{
    ImVec4 clear_color = ImVec4(0.45, 0.55, 0.60, 1.00);

    while (glfwWindowShouldClose(window) == 0) {
        glfwPollEvents();

        if (close_requested.load(std::memory_order_relaxed)) {
            glfwSetWindowShouldClose(window, GLFW_TRUE);
            continue;
        }

        if (glfwGetWindowAttrib(window, GLFW_ICONIFIED) != 0) {
            glfwWaitEventsTimeout(PROBE_INTERVAL_SECONDS);
            continue;
        }

        if (glfwGetTime() - last_probe_time >= PROBE_INTERVAL_SECONDS) {
            refresh_reachability();
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

        // Main window
        {
            ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0);
            ImGui::SetNextWindowPos(ImVec2(0.0, 0.0));
            ImGui::SetNextWindowSize(ImGui::GetIO().DisplaySize);
            ImGui::Begin(
              WINDOW_TITLE,
              nullptr,
              ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoResize
            );

            render_server_address();
            ImGui::SameLine();
            render_connection_status();

            ImGui::End();
            ImGui::PopStyleVar(1);
        }

        ImGui::Render();
        int display_w = 0;
        int display_h = 0;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(
          clear_color.x * clear_color.w,
          clear_color.y * clear_color.w,
          clear_color.z * clear_color.w,
          clear_color.w
        );
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        glfwSwapBuffers(window);
    }
}

void App::render_server_address()
{
    const auto address = "http://" + endpoint.to_string();
    // NOLINTNEXTLINE
    ImGui::Text("Agent server: %s", address.c_str());
}

void App::render_connection_status()
{
    const char *text      = reachable ? "Reachable" : "Unreachable";
    ImVec2      text_pos  = ImGui::GetCursorScreenPos();
    ImVec2      text_size = ImGui::CalcTextSize(text);

    ImU32 bg_color = reachable ? IM_COL32(0, 255, 0, 150)
                               : IM_COL32(255, 0, 0, 150);
    ImGui::GetWindowDrawList()->AddRectFilled(
      text_pos,
      ImVec2(text_pos.x + text_size.x, text_pos.y + text_size.y),
      bg_color
    );

    ImGui::TextUnformatted(text);
}
