// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/math/Ray.hpp"
#include "engine/scene/Scene.hpp"
#include "molxr/config/viewer_config.hpp"
#include "molxr/net/structure_fetcher.hpp"
#include "molxr/repr/molecule.hpp"
#include "molxr/repr/transition.hpp"
#include "molxr/ui/context_menu.hpp"
#include "molxr/ui/long_press.hpp"
#include "molxr/ui/panel_manager.hpp"
#include "molxr/ui/radial_menu.hpp"

namespace molxr::app
{
    // Where a loaded structure is centered, and the radius it is shrunk to fit
    const Engine::Math::Vec3 kMoleculeAnchor{0.0f, 1.2f, 0.0f};
    constexpr float kMoleculeFitRadius = 0.6f;
    const Engine::Math::Vec3 kWristMenuAnchor{0.0f, 1.4f, 0.0f};
    constexpr float kContextSpawnDistance = 1.0f;

    // Everything the viewer mutates, owned in one place
    struct ViewerState
    {
        explicit ViewerState(const config::ViewerConfig &cfg);

        Engine::Scene::SceneData scene;
        std::optional<repr::Molecule> molecule;
        repr::TransitionAnimator transition;
        ui::RadialMenu wristMenu;
        ui::PanelManager panels;
        std::unique_ptr<ui::ContextMenu> contextMenu;
        ui::LongPressTracker longPress;

        Engine::Math::Vec3 viewerPosition{0.0f, 1.6f, 3.0f};
        Engine::Math::Vec3 viewerForward{0.0f, 0.0f, -1.0f};
        Engine::Math::Ray controllerRay;
        bool wristMenuWanted{true};
        double clock{0.0};
    };

    std::vector<ui::MenuItem> default_wrist_menu_items();

    // Orchestrates loading, representation changes and input routing.
    // All calls are expected on the frame thread; only fetches run elsewhere.
    class ViewerController
    {
    public:
        using BroadcastHook = std::function<void(const std::string &)>;
        using RepresentationHook = std::function<void(repr::RepresentationKind, int)>;

        explicit ViewerController(config::ViewerConfig cfg = config::default_config(),
                                  std::shared_ptr<net::StructureFetcher> fetcher = nullptr);

        // --- loading ---

        // Parses and installs a structure. Failures are logged and leave the current molecule in place.
        // Supersedes any fetch still pending.
        bool loadStructureText(std::string_view text, const std::string &sourceId);

        // Starts a background fetch. The newest request wins; older results are dropped.
        void requestLoad(const std::string &structureId, bool broadcast = true);

        // Applies a relay message; loads triggered this way are not re-broadcast
        bool handleSyncMessage(std::string_view text);

        bool loading() const { return !m_pending.empty(); }

        // Blocks until every outstanding fetch has completed. Returns the number installed.
        std::size_t finishPendingLoads();

        // --- representation ---

        void cycleRepresentation();
        void setBroadcastHook(BroadcastHook hook) { m_broadcast = std::move(hook); }
        void setRepresentationHook(RepresentationHook hook) { m_onRepresentation = std::move(hook); }

        // --- frame ---

        void update(float dt);

        // --- input ---

        // Desktop pointer in normalized device coordinates
        void pointerMove(float ndcX, float ndcY);
        void pointerClick();

        void setViewerPose(const Engine::Math::Vec3 &position, const Engine::Math::Vec3 &forward);
        void setControllerRay(const Engine::Math::Ray &ray);
        void leftStick(float x, float y);
        void leftGrip();
        void rightTriggerPressed();
        void rightTriggerReleased();

        // Hides every panel and restores the wrist menu if the user wants it
        void closePanels();

        // --- accessors ---

        ViewerState &state() { return m_state; }
        const ViewerState &state() const { return m_state; }
        const repr::Molecule *molecule() const { return m_state.molecule ? &*m_state.molecule : nullptr; }
        const Engine::Scene::SceneData &scene() const { return m_state.scene; }
        ui::RadialMenu &wristMenu() { return m_state.wristMenu; }
        ui::PanelManager &panels() { return m_state.panels; }
        const ui::ContextMenu *contextMenu() const { return m_state.contextMenu.get(); }
        const config::ViewerConfig &config() const { return m_config; }

        // Spawn point for the context menu along `ray`: nearest atom hit, else 1 m ahead
        Engine::Math::Vec3 contextSpawnPoint(const Engine::Math::Ray &ray) const;

    private:
        struct PendingLoad
        {
            std::uint64_t generation;
            std::string structureId;
            std::future<std::string> result;
        };

        void bindMenuActions();
        void togglePanel(ui::PanelId id);
        void syncWristMenu();
        void routePointer(const Engine::Math::Ray &ray);
        void selectHovered();
        void openContextMenu();
        void closeContextMenu();
        void completeLoad(PendingLoad &load);
        bool installStructure(std::string_view text, const std::string &sourceId);
        void notifyRepresentation();

        config::ViewerConfig m_config;
        ViewerState m_state;
        std::shared_ptr<net::StructureFetcher> m_fetcher;
        std::vector<PendingLoad> m_pending;
        std::uint64_t m_generation{0};
        BroadcastHook m_broadcast;
        RepresentationHook m_onRepresentation;
    };

} // namespace molxr::app
