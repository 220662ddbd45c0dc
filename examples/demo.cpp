#include <atomic>
#include <chrono>
#include <filesystem>
#include <GLFW/glfw3.h>
#include <implot.h>
#include <log.h>
#include <stop_token>
#include <string>
#include <thread>
#include <unified_ring/unified_ring.hpp>
#include <vector>

#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

namespace ur = unified_ring;

// ---------------------------------------------------------------------------
// Demo state
// ---------------------------------------------------------------------------

struct angle_trace {
    static constexpr int capacity = 600;

    std::vector<float> start;
    std::vector<float> end;

    void push(const ur::ring_angles a) {
        if (static_cast<int>(start.size()) == capacity) {
            start.erase(start.begin());
            end.erase(end.begin());
        }
        start.push_back(a.start);
        end.push_back(a.end);
    }
};

struct demo_state {
    ur::progress_ring ring;
    ur::progress_ring relaxed_ring{ur::ring_config::relaxed()};
    angle_trace       trace;
    int               slider        = 0;
    bool              indeterminate = true;
    bool              rtl           = false;
    bool              visible       = true;
    float             alpha         = 1.0f;
    std::string       status;
    std::atomic<bool> worker_busy{false};
    std::jthread      worker; // last: joins before the members it touches go away
};

// ---------------------------------------------------------------------------
// Simulated download, reported from a worker thread
// ---------------------------------------------------------------------------

static void start_download(demo_state &s) {
    if (s.worker_busy.exchange(true)) return;
    s.worker = std::jthread([&s](const std::stop_token &stop) {
        using namespace std::chrono_literals;
        s.ring.set_indeterminate(true);
        std::this_thread::sleep_for(1500ms); // "connecting"
        for (int pct = 0; pct <= 100 && !stop.stop_requested(); pct += 4) {
            s.ring.set_progress(pct);
            std::this_thread::sleep_for(120ms);
        }
        s.ring.set_indeterminate(true);
        s.worker_busy = false;
    });
    Log::info("Demo", "download started");
}

// ---------------------------------------------------------------------------
// Sections
// ---------------------------------------------------------------------------

static void section_controls(demo_state &s) {
    if (ImGui::Checkbox("Indeterminate", &s.indeterminate)) s.ring.set_indeterminate(s.indeterminate);

    ImGui::SliderInt("Progress", &s.slider, s.ring.min(), s.ring.max());
    if (ImGui::IsItemDeactivatedAfterEdit()) {
        s.ring.set_progress(s.slider);
        s.indeterminate = false;
    }

    if (ImGui::Button("-10")) s.ring.increment_progress_by(-10);
    ImGui::SameLine();
    if (ImGui::Button("+10")) s.ring.increment_progress_by(10);
    ImGui::SameLine();
    ImGui::BeginDisabled(s.worker_busy);
    if (ImGui::Button("Simulate download")) start_download(s);
    ImGui::EndDisabled();

    if (ImGui::Checkbox("Right-to-left", &s.rtl)) {
        s.ring.set_layout_rtl(s.rtl);
        s.relaxed_ring.set_layout_rtl(s.rtl);
    }
    ImGui::SameLine();
    if (ImGui::Checkbox("Visible", &s.visible)) s.ring.set_visible(s.visible);
    if (ImGui::SliderFloat("Alpha", &s.alpha, 0.0f, 1.0f)) s.ring.set_alpha(s.alpha);
}

static void section_rings(demo_state &s) {
    s.ring.render("##ring", 96.0f);
    ImGui::SameLine();
    s.relaxed_ring.render("##relaxed_ring");

    const auto [start, end] = s.ring.animator().angles();
    ImGui::Text("start %.3f  end %.3f  progress %d%s", start, end, s.ring.progress(),
                s.ring.is_indeterminate() ? " (indeterminate)" : "");
    if (s.ring.pending_updates() > 0) ImGui::Text("%zu queued update(s)", s.ring.pending_updates());
}

static void section_trace(demo_state &s) {
    s.trace.push(s.ring.animator().angles());
    if (ImPlot::BeginPlot("Ring angles", {-1, 200})) {
        ImPlot::SetupAxes("frame", "revolutions");
        ImPlot::SetupAxesLimits(0, angle_trace::capacity, 0.0, 2.0);
        const int n = static_cast<int>(s.trace.start.size());
        ImPlot::PlotLine("start", s.trace.start.data(), n);
        ImPlot::PlotLine("end", s.trace.end.data(), n);
        ImPlot::EndPlot();
    }
}

static void section_persistence(demo_state &s) {
    static constexpr auto state_file = "ring.state";

    if (ImGui::Button("Save state")) {
        if (auto r = ur::save_saved_state_file(state_file, s.ring.save_state()); r) {
            s.status = "saved";
        } else {
            s.status = r.error().message();
        }
    }
    ImGui::SameLine();
    if (ImGui::Button("Load state")) {
        if (auto state = ur::load_saved_state_file(state_file)) {
            s.ring.restore_state(*state);
            s.indeterminate = state->indeterminate;
            s.slider        = state->progress;
            s.status        = "loaded";
        } else {
            s.status = state.error().message();
        }
    }
    if (!s.status.empty()) {
        ImGui::SameLine();
        const ur::style_color dim{ImGuiCol_Text, ImGui::GetStyle().Colors[ImGuiCol_TextDisabled]};
        ImGui::TextUnformatted(s.status.c_str());
    }
}

int main() {
    Log::setTimestamps(true);
    Log::autoDetectColors();

    glfwSetErrorCallback([](int, const char *msg) { Log::error("GLFW", msg); });
    if (!glfwInit()) return 1;

    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

    auto *window = glfwCreateWindow(900, 700, "unified_ring demo", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return 1;
    }
    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImPlot::CreateContext();

    auto &io        = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;

    ImGui_ImplGlfw_InitForOpenGL(window, true);
    ImGui_ImplOpenGL3_Init("#version 330");

    {
        demo_state state;
        state.ring.set_mirror_for_rtl(true);
        state.relaxed_ring.set_mirror_for_rtl(true);
        state.ring.attach();
        state.relaxed_ring.attach();

        if (std::filesystem::exists("ring.cfg")) {
            if (auto cfg = ur::load_config_file("ring.cfg")) state.ring.animator().set_duration(cfg->duration_ms);
        }

        Log::info("Demo", "unified_ring demo started");

        while (!glfwWindowShouldClose(window)) {
            glfwPollEvents();

            ImGui_ImplOpenGL3_NewFrame();
            ImGui_ImplGlfw_NewFrame();
            ImGui::NewFrame();

            if (const ur::window w{"Progress ring"}) {
                section_controls(state);
                ImGui::Separator();
                section_rings(state);
                section_trace(state);
                section_persistence(state);
            }

            ImGui::Render();
            int fb_w = 0;
            int fb_h = 0;
            glfwGetFramebufferSize(window, &fb_w, &fb_h);
            glViewport(0, 0, fb_w, fb_h);
            glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
            glfwSwapBuffers(window);
        }

        state.ring.detach();
        state.relaxed_ring.detach();
        state.worker.request_stop();
    }

    ImGui_ImplOpenGL3_Shutdown();
    ImGui_ImplGlfw_Shutdown();
    ImPlot::DestroyContext();
    ImGui::DestroyContext();
    glfwDestroyWindow(window);
    glfwTerminate();
}
