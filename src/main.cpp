// SPDX-License-Identifier: AGPL-3.0-or-later
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "imgui.h"

#include "molxr/app/overlay.hpp"
#include "molxr/app/viewer_controller.hpp"
#include "molxr/config/viewer_config.hpp"
#include "molxr/error.hpp"
#include "molxr/net/structure_fetcher.hpp"

namespace
{
    struct Options
    {
        std::string structure; // local .pdb path or a four-character id
        std::string configPath;
        int cycles{0};
        int frames{60};
    };

    void PrintUsage()
    {
        std::fprintf(stderr, "Usage: molxr_viewer <file.pdb | PDBID> [--cycle N] [--frames N] [--config path]\n");
    }

    int ParseCount(const std::string &flag, const std::string &value)
    {
        std::size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != value.size() || n < 0)
            throw std::invalid_argument(flag + " expects a non-negative integer, got '" + value + "'");
        return n;
    }

    Options ParseArgs(int argc, char *argv[])
    {
        Options opts;
        opts.configPath = molxr::config::default_config_path();
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            auto next = [&]() -> std::string
            {
                if (i + 1 >= argc)
                    throw std::invalid_argument(arg + " expects a value");
                return argv[++i];
            };

            if (arg == "--cycle")
                opts.cycles = ParseCount(arg, next());
            else if (arg == "--frames")
                opts.frames = ParseCount(arg, next());
            else if (arg == "--config")
                opts.configPath = next();
            else if (!arg.empty() && arg.front() == '-')
                throw std::invalid_argument("Unknown option " + arg);
            else if (opts.structure.empty())
                opts.structure = arg;
            else
                throw std::invalid_argument("Unexpected argument " + arg);
        }
        if (opts.structure.empty())
            throw std::invalid_argument("No structure given");
        return opts;
    }

    std::string ReadFile(const std::string &path)
    {
        std::ifstream f(path, std::ios::binary);
        if (!f)
            throw molxr::Error("Cannot open " + path);
        std::ostringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }

    // One simulated frame: advance the controller and draw the overlay without a backend
    void RunFrame(molxr::app::ViewerController &viewer, float dt)
    {
        ImGuiIO &io = ImGui::GetIO();
        io.DeltaTime = dt;
        viewer.update(dt);
        ImGui::NewFrame();
        molxr::app::RenderOverlay(viewer);
        ImGui::Render();
    }
}

int main(int argc, char *argv[])
{
    Options opts;
    try
    {
        opts = ParseArgs(argc, argv);
    }
    catch (const std::exception &e)
    {
        spdlog::error("[Viewer] {}", e.what());
        PrintUsage();
        return 1;
    }

    molxr::config::ViewerConfig cfg;
    try
    {
        cfg = molxr::config::load_config(opts.configPath);
        molxr::config::apply_environment(cfg);
    }
    catch (const molxr::ConfigError &e)
    {
        spdlog::error("[Viewer] {}", e.what());
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(cfg.logLevel));
    spdlog::info("[Viewer] Sync relay {}:{}", cfg.syncHost, cfg.syncPort);

    molxr::app::ViewerController viewer(cfg);
    viewer.setBroadcastHook([](const std::string &msg)
                            { spdlog::info("[Viewer] Broadcast {}", msg); });

    if (std::filesystem::exists(opts.structure))
    {
        try
        {
            if (!viewer.loadStructureText(ReadFile(opts.structure), opts.structure))
                return 1;
        }
        catch (const molxr::Error &e)
        {
            spdlog::error("[Viewer] {}", e.what());
            return 1;
        }
    }
    else
    {
        viewer.requestLoad(opts.structure, true);
        viewer.finishPendingLoads();
        if (!viewer.molecule())
            return 1;
    }

    ImGui::CreateContext();
    ImGuiIO &io = ImGui::GetIO();
    io.DisplaySize = ImVec2(1280.0f, 720.0f);
    unsigned char *pixels = nullptr;
    int width = 0, height = 0;
    io.Fonts->GetTexDataAsRGBA32(&pixels, &width, &height);

    const float dt = 1.0f / 60.0f;
    for (int c = 0; c < opts.cycles; ++c)
    {
        viewer.cycleRepresentation();
        // Let each transition run to completion before the next
        const int transitionFrames = static_cast<int>(cfg.transitionSeconds / dt) + 2;
        for (int f = 0; f < transitionFrames; ++f)
            RunFrame(viewer, dt);
    }
    for (int f = 0; f < opts.frames; ++f)
        RunFrame(viewer, dt);

    ImGui::DestroyContext();

    const auto *mol = viewer.molecule();
    std::printf("Structure: %s\n", mol->sourceId.c_str());
    std::printf("Atoms: %zu\n", mol->atoms.size());
    std::printf("Representation: %s\n", std::string(molxr::repr::to_string(mol->activeKind)).c_str());
    std::printf("Scene groups: %zu\n", viewer.scene().groups.size());
    std::size_t renderables = 0, triangles = 0;
    for (const auto &g : viewer.scene().groups)
    {
        renderables += g->renderables.size() + g->points.points.size();
        for (const auto &r : g->renderables)
            triangles += r.mesh ? r.mesh->triangleCount() : 0;
    }
    std::printf("Renderables: %zu\n", renderables);
    std::printf("Triangles: %zu\n", triangles);
    return 0;
}
