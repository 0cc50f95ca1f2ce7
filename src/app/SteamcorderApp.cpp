/**
 * @file SteamcorderApp.cpp
 * @brief Implementation of the SteamcorderApp class.
 */
#include "app/SteamcorderApp.hpp"

#include "ui/UiRenderer.hpp"

#include "imgui.h"
#include "imgui_impl_opengl3.h"
#include "imgui_impl_sdl2.h"

#include <SDL2/SDL.h>
#include <SDL2/SDL_opengl.h>

#include <cstdio>
#include <iostream>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "application/LogChannel.hpp"
#include "application/WatchSession.hpp"
#include "infrastructure/InotifyEventSource.hpp"
#include "infrastructure/PathUtils.hpp"
#include "infrastructure/WebhookUploader.hpp"

namespace steamcorder::app {

namespace {

constexpr const char* kWindowTitle = "Steamcorder v0.6.1";

std::string FindFontPath(const std::vector<const char*>& candidates) {
    for (const char* path : candidates) {
        if (std::filesystem::exists(path)) {
            return path;
        }
    }
    return {};
}

bool LoadFonts(ImGuiIO& io) {
    const float baseFontSize = 16.0f;

    const std::vector<const char*> baseCandidates = {
        "/usr/share/fonts/truetype/noto/NotoSans-Regular.ttf",
        "/usr/share/fonts/TTF/NotoSans-Regular.ttf",
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
    };
    const std::vector<const char*> emojiCandidates = {
        "/usr/share/fonts/google-noto-emoji-fonts/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/truetype/noto/NotoEmoji-Regular.ttf",
        "/usr/share/fonts/TTF/NotoEmoji-Regular.ttf",
    };

    std::string basePath = FindFontPath(baseCandidates);
    ImFont* baseFont = nullptr;
    if (!basePath.empty()) {
        baseFont = io.Fonts->AddFontFromFileTTF(basePath.c_str(), baseFontSize);
    }
    if (!baseFont) {
        baseFont = io.Fonts->AddFontDefault();
    }
    io.FontDefault = baseFont;

    std::string emojiPath = FindFontPath(emojiCandidates);
    if (emojiPath.empty()) {
        std::cerr << "[SteamcorderApp] WARNING: No Emoji font found in system paths. Icons will be disabled." << std::endl;
        return false;
    }

    ImFontConfig config;
    config.MergeMode = true;
    config.PixelSnapH = true;

    static const ImWchar emojiRanges[] = {
        0x2000, 0x3000,   // Punctuation, arrows, media control symbols
        0x1F300, 0x1FAFF, // Emoji ranges
        0
    };

    ImFontGlyphRangesBuilder builder;
    builder.AddRanges(io.Fonts->GetGlyphRangesDefault());
    builder.AddRanges(emojiRanges);
    static ImVector<ImWchar> ranges; // Static to persist until atlas build
    ranges.clear();
    builder.BuildRanges(&ranges);

    return io.Fonts->AddFontFromFileTTF(emojiPath.c_str(), baseFontSize, &config, ranges.Data) != nullptr;
}

} // namespace

bool SteamcorderApp::Init() {
    // Composition root
    auto log = std::make_shared<application::LogChannel>();
    auto uploader = std::make_shared<infrastructure::WebhookUploader>();
    auto session = std::make_unique<application::WatchSession>(
        []() { return std::make_unique<infrastructure::InotifyEventSource>(); },
        uploader,
        log);
    m_state.InjectSession(log, std::move(session));

    m_state.settingsPath = infrastructure::PathUtils::GetSettingsPath();
    m_state.LoadSettings();
    std::cout << "[SteamcorderApp] Settings: " << m_state.settingsPath << std::endl;

    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::fprintf(stderr, "SDL_Init failed: %s\n", SDL_GetError());
        return false;
    }
    m_sdlInitialized = true;

    const char* glsl_version = "#version 130";
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_FLAGS, 0);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_PROFILE_MASK, SDL_GL_CONTEXT_PROFILE_CORE);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MAJOR_VERSION, 3);
    SDL_GL_SetAttribute(SDL_GL_CONTEXT_MINOR_VERSION, 0);

    SDL_WindowFlags window_flags = (SDL_WindowFlags)(SDL_WINDOW_OPENGL | SDL_WINDOW_RESIZABLE | SDL_WINDOW_ALLOW_HIGHDPI);
    m_window = SDL_CreateWindow(kWindowTitle, SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED, 640, 480, window_flags);
    if (!m_window) {
        std::fprintf(stderr, "SDL_CreateWindow failed: %s\n", SDL_GetError());
        return false;
    }

    m_glContext = SDL_GL_CreateContext(m_window);
    if (!m_glContext) {
        std::fprintf(stderr, "SDL_GL_CreateContext failed: %s\n", SDL_GetError());
        return false;
    }
    SDL_GL_MakeCurrent(m_window, m_glContext);
    SDL_GL_SetSwapInterval(1);

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    ImGuiIO& io = ImGui::GetIO();
    io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
    io.IniFilename = nullptr;
    m_state.ui.emojiEnabled = LoadFonts(io);
    ImGui::StyleColorsDark();

    if (!ImGui_ImplSDL2_InitForOpenGL(m_window, m_glContext)) {
        std::fprintf(stderr, "ImGui_ImplSDL2_InitForOpenGL failed.\n");
        return false;
    }
    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        std::fprintf(stderr, "ImGui_ImplOpenGL3_Init failed.\n");
        return false;
    }
    m_imguiInitialized = true;

    m_state.ResumeIfActive();
    return true;
}

void SteamcorderApp::Shutdown() {
    // Join the worker before tearing down the window so the last log lines reach the console.
    if (m_state.session) {
        m_state.session->Stop();
    }

    if (m_imguiInitialized) {
        ImGui_ImplOpenGL3_Shutdown();
        ImGui_ImplSDL2_Shutdown();
        ImGui::DestroyContext();
        m_imguiInitialized = false;
    }

    if (m_glContext) {
        SDL_GL_DeleteContext(m_glContext);
        m_glContext = nullptr;
    }
    if (m_window) {
        SDL_DestroyWindow(m_window);
        m_window = nullptr;
    }
    if (m_sdlInitialized) {
        SDL_Quit();
        m_sdlInitialized = false;
    }
}

int SteamcorderApp::Run() {
    if (!Init()) {
        Shutdown();
        return -1;
    }

    bool done = false;
    while (!done) {
        SDL_Event event;
        while (SDL_PollEvent(&event)) {
            ImGui_ImplSDL2_ProcessEvent(&event);
            if (event.type == SDL_QUIT) done = true;
        }

        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplSDL2_NewFrame();
        ImGui::NewFrame();

        ui::DrawUI(m_state);
        if (m_state.ui.requestExit) {
            done = true;
        }

        ImGui::Render();
        ImGuiIO& io = ImGui::GetIO();
        glViewport(0, 0, static_cast<int>(io.DisplaySize.x), static_cast<int>(io.DisplaySize.y));
        glClearColor(0.10f, 0.10f, 0.10f, 1.00f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        SDL_GL_SwapWindow(m_window);
    }

    Shutdown();
    return 0;
}

} // namespace steamcorder::app
