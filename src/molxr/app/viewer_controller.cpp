// SPDX-License-Identifier: AGPL-3.0-or-later
#include "molxr/app/viewer_controller.hpp"

#include "engine/render/RenderPrimitives.hpp"
#include "engine/scene/SceneBuilder.hpp"
#include "molxr/chem/element_style.hpp"
#include "molxr/chem/pdb_parser.hpp"
#include "molxr/error.hpp"
#include "molxr/net/sync_message.hpp"
#include "molxr/repr/builders.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace molxr::app
{
    using Engine::Math::Ray;
    using Engine::Math::Vec3;

    std::vector<ui::MenuItem> default_wrist_menu_items()
    {
        return {
            {"Help", nullptr},
            {"Settings", nullptr},
            {"Load", nullptr},
            {"Visuals", nullptr},
            {"Enter ID", nullptr},
        };
    }

    ViewerState::ViewerState(const config::ViewerConfig &cfg)
        : scene(Engine::SceneBuilder::CreateViewerScene()),
          transition(cfg.transitionSeconds),
          wristMenu(default_wrist_menu_items()),
          panels(cfg.quickLoadIds, cfg.panelDistance),
          longPress(cfg.longPressSeconds)
    {
    }

    namespace
    {
        std::vector<std::string> visuals_lines(const repr::Molecule *molecule)
        {
            std::vector<std::string> lines{"Visual Styles", ""};
            for (std::size_t i = 0; i < repr::kRepresentationCycle.size(); ++i)
                lines.push_back(std::to_string(i + 1) + "  " + std::string(repr::to_string(repr::kRepresentationCycle[i])));
            lines.emplace_back("");
            if (molecule)
                lines.push_back("Current: " + std::string(repr::to_string(molecule->activeKind)));
            lines.emplace_back("Select Visuals on the menu to cycle");
            return lines;
        }
    }

    ViewerController::ViewerController(config::ViewerConfig cfg, std::shared_ptr<net::StructureFetcher> fetcher)
        : m_config(std::move(cfg)),
          m_state(m_config),
          m_fetcher(std::move(fetcher))
    {
        if (!m_fetcher)
            m_fetcher = std::make_shared<net::CurlStructureFetcher>(m_config.fetchBaseUrl, m_config.fetchTimeoutSeconds);

        m_state.wristMenu.transform().position = kWristMenuAnchor;
        m_state.wristMenu.faceTowards(m_state.viewerPosition);
        m_state.scene.add(m_state.wristMenu.group());
        m_state.panels.visualsPanel().setLines(visuals_lines(nullptr));

        bindMenuActions();
    }

    void ViewerController::bindMenuActions()
    {
        auto &menu = m_state.wristMenu;
        menu.setAction("Help", ui::make_command([this]
                                                { togglePanel(ui::PanelId::Help); }));
        menu.setAction("Settings", ui::make_command([this]
                                                    { togglePanel(ui::PanelId::Settings); }));
        menu.setAction("Load", ui::make_command([this]
                                                { togglePanel(ui::PanelId::QuickLoad); }));
        menu.setAction("Visuals", ui::make_command([this]
                                                   { cycleRepresentation(); }));
        menu.setAction("Enter ID", ui::make_command([this]
                                                    { togglePanel(ui::PanelId::StructureInput); }));

        m_state.panels.quickLoadPanel().setOnSelect([this](const std::string &id)
                                                    {
            requestLoad(id, true);
            closePanels(); });
        m_state.panels.structureInputPanel().setOnLoad([this](const std::string &id)
                                                       {
            requestLoad(id, true);
            syncWristMenu(); });
    }

    // ---------------------------------------------------------------------
    // Loading

    bool ViewerController::loadStructureText(std::string_view text, const std::string &sourceId)
    {
        // Counts as the newest request: fetches still in flight become stale
        ++m_generation;
        return installStructure(text, sourceId);
    }

    bool ViewerController::installStructure(std::string_view text, const std::string &sourceId)
    {
        try
        {
            auto report = chem::parse_pdb_report(text);
            if (!report.malformedLines.empty())
            {
                spdlog::warn("[Loader] {}: {} atom record(s) with malformed coordinates (first on line {})",
                             sourceId, report.malformedLines.size(), report.malformedLines.front());
            }
            if (report.atoms.empty())
                throw Error("No ATOM/HETATM records in " + sourceId);

            const auto kind = repr::select_representation(report.atoms.size());

            auto atoms = std::move(report.atoms);
            chem::scale_atoms(atoms);
            chem::recenter(atoms);
            const float radius = chem::bounding_radius(atoms);
            const float scale = radius > 0.0f ? std::min(1.0f, kMoleculeFitRadius / radius) : 1.0f;

            auto group = repr::build_representation(kind, atoms);
            group->transform.position = kMoleculeAnchor;
            group->setUniformScale(scale);

            // Retire the previous molecule along with any half-finished transition
            m_state.transition.finish(m_state.scene);
            if (m_state.molecule && m_state.molecule->currentGroup)
            {
                m_state.scene.remove(m_state.molecule->currentGroup.get());
                m_state.molecule->currentGroup->releaseResources();
            }
            closeContextMenu();

            m_state.scene.add(group);

            repr::Molecule molecule;
            molecule.atoms = std::move(atoms);
            molecule.sourceId = sourceId;
            molecule.activeKind = kind;
            molecule.activeRepresentationIndex = repr::cycle_index_of(kind);
            molecule.uniformScale = scale;
            molecule.currentGroup = std::move(group);
            m_state.molecule = std::move(molecule);

            spdlog::info("[Loader] {}: {} atoms as {} (scale {:.3f})", sourceId, m_state.molecule->atoms.size(),
                         repr::to_string(kind), scale);
            notifyRepresentation();
            return true;
        }
        catch (const Error &e)
        {
            spdlog::error("[Loader] {}", e.what());
            return false;
        }
    }

    void ViewerController::requestLoad(const std::string &structureId, bool broadcast)
    {
        auto id = net::normalize_structure_id(structureId);
        if (!id)
        {
            spdlog::error("[Loader] '{}' is not a valid structure id", structureId);
            return;
        }

        if (broadcast && m_broadcast)
            m_broadcast(net::encode_load_message(*id));

        const std::uint64_t generation = ++m_generation;
        auto fetcher = m_fetcher;
        auto future = std::async(std::launch::async, [fetcher, id = *id]
                                 { return fetcher->fetch(id); });
        m_pending.push_back(PendingLoad{generation, *id, std::move(future)});
        spdlog::info("[Loader] Fetching {}", *id);
    }

    bool ViewerController::handleSyncMessage(std::string_view text)
    {
        auto msg = net::decode_message(text);
        if (!msg)
        {
            spdlog::debug("[Viewer] Ignoring sync message: {}", text);
            return false;
        }
        requestLoad(msg->pdbId, false);
        return true;
    }

    void ViewerController::completeLoad(PendingLoad &load)
    {
        if (load.generation != m_generation)
        {
            spdlog::debug("[Loader] Discarding stale result for {}", load.structureId);
            return;
        }
        std::string text;
        try
        {
            text = load.result.get();
        }
        catch (const Error &e)
        {
            spdlog::error("[Loader] {}", e.what());
            return;
        }
        catch (const std::exception &e)
        {
            spdlog::error("[Loader] Fetching {} failed: {}", load.structureId, e.what());
            return;
        }
        installStructure(text, load.structureId);
    }

    std::size_t ViewerController::finishPendingLoads()
    {
        std::size_t installed = 0;
        auto pending = std::move(m_pending);
        m_pending.clear();
        for (auto &load : pending)
        {
            const repr::Molecule *before = molecule();
            const auto *beforeGroup = before ? before->currentGroup.get() : nullptr;
            load.result.wait();
            completeLoad(load);
            const repr::Molecule *after = molecule();
            if (after && after->currentGroup.get() != beforeGroup)
                ++installed;
        }
        return installed;
    }

    // ---------------------------------------------------------------------
    // Representation

    void ViewerController::cycleRepresentation()
    {
        if (!m_state.molecule)
        {
            spdlog::warn("[Viewer] No structure loaded; nothing to cycle");
            return;
        }
        auto &mol = *m_state.molecule;
        const int index = repr::next_representation_index(mol.activeRepresentationIndex);
        const auto kind = repr::representation_at(index);

        auto group = repr::build_representation(kind, mol.atoms);
        group->transform.position = kMoleculeAnchor;
        m_state.transition.begin(m_state.scene, mol.currentGroup, group, mol.uniformScale);

        mol.currentGroup = std::move(group);
        mol.activeRepresentationIndex = index;
        mol.activeKind = kind;
        spdlog::info("[Viewer] Representation -> {}", repr::to_string(kind));
        notifyRepresentation();
    }

    void ViewerController::notifyRepresentation()
    {
        m_state.panels.visualsPanel().setLines(visuals_lines(molecule()));
        if (m_onRepresentation && m_state.molecule)
            m_onRepresentation(m_state.molecule->activeKind, m_state.molecule->activeRepresentationIndex);
    }

    // ---------------------------------------------------------------------
    // Frame

    void ViewerController::update(float dt)
    {
        m_state.clock += dt;

        for (auto it = m_pending.begin(); it != m_pending.end();)
        {
            if (it->result.wait_for(std::chrono::seconds(0)) == std::future_status::ready)
            {
                PendingLoad load = std::move(*it);
                it = m_pending.erase(it);
                completeLoad(load);
            }
            else
            {
                ++it;
            }
        }

        m_state.transition.step(m_state.scene, dt);
        m_state.panels.update(m_state.viewerPosition, m_state.viewerForward);
        m_state.wristMenu.faceTowards(m_state.viewerPosition);

        if (m_state.longPress.update(m_state.clock))
            openContextMenu();
    }

    // ---------------------------------------------------------------------
    // Input

    void ViewerController::pointerMove(float ndcX, float ndcY)
    {
        routePointer(Engine::Render::ScreenPointToRay(m_state.scene.cameraTransform, m_state.scene.camera, ndcX, ndcY));
    }

    void ViewerController::pointerClick()
    {
        selectHovered();
    }

    void ViewerController::setViewerPose(const Vec3 &position, const Vec3 &forward)
    {
        m_state.viewerPosition = position;
        if (Engine::Math::lengthSquared(forward) > 0.0f)
            m_state.viewerForward = Engine::Math::normalize(forward);
        m_state.scene.cameraTransform.position = position;
        m_state.scene.cameraTransform.rotationEulerRad = Engine::Math::eulerAligningZTo(-m_state.viewerForward);
    }

    void ViewerController::setControllerRay(const Ray &ray)
    {
        m_state.controllerRay = ray;
        routePointer(ray);
    }

    void ViewerController::leftStick(float x, float y)
    {
        if (m_state.contextMenu)
        {
            m_state.contextMenu->hoverFromStick(x, y, m_config.stickDeadZone);
            return;
        }
        if (m_state.wristMenu.visible())
            m_state.wristMenu.hoverFromStick(x, y, m_config.stickDeadZone);
    }

    void ViewerController::leftGrip()
    {
        m_state.wristMenuWanted = !m_state.wristMenuWanted;
        if (m_state.wristMenuWanted)
            m_state.panels.hideAll();
        syncWristMenu();
    }

    void ViewerController::rightTriggerPressed()
    {
        m_state.longPress.press(m_state.clock);
    }

    void ViewerController::rightTriggerReleased()
    {
        switch (m_state.longPress.release(m_state.clock))
        {
        case ui::ReleaseResult::Tap:
            selectHovered();
            break;
        case ui::ReleaseResult::CloseMenu:
            if (m_state.contextMenu)
                m_state.contextMenu->release();
            closeContextMenu();
            break;
        default:
            break;
        }
    }

    void ViewerController::closePanels()
    {
        m_state.panels.hideAll();
        syncWristMenu();
    }

    void ViewerController::togglePanel(ui::PanelId id)
    {
        m_state.panels.toggle(id);
        syncWristMenu();
    }

    void ViewerController::syncWristMenu()
    {
        m_state.wristMenu.setVisible(m_state.wristMenuWanted && !m_state.panels.anyVisible());
    }

    void ViewerController::routePointer(const Ray &ray)
    {
        if (m_state.contextMenu)
            m_state.contextMenu->handlePointer(ray);
        else if (m_state.panels.anyVisible())
            m_state.panels.handlePointer(ray);
        else
            m_state.wristMenu.handlePointer(ray);
    }

    void ViewerController::selectHovered()
    {
        if (m_state.panels.anyVisible())
        {
            m_state.panels.select();
            syncWristMenu();
            return;
        }
        if (m_state.wristMenu.visible())
            m_state.wristMenu.select();
    }

    Vec3 ViewerController::contextSpawnPoint(const Ray &ray) const
    {
        std::optional<float> nearest;
        if (const auto *mol = molecule(); mol && mol->currentGroup)
        {
            const auto model = mol->currentGroup->transform.localMatrix();
            const float scale = mol->currentGroup->uniformScale();
            const bool elementRadii = mol->activeKind == repr::RepresentationKind::SpaceFill ||
                                      mol->activeKind == repr::RepresentationKind::TransparentSurface;
            for (const auto &atom : mol->atoms)
            {
                const float r = (elementRadii ? chem::element_radius(atom.element) : repr::kAtomSphereRadius) * scale;
                auto t = Engine::Math::intersectSphere(ray, Engine::Math::transformPoint(model, atom.position), r);
                if (t && (!nearest || *t < *nearest))
                    nearest = t;
            }
        }
        if (nearest)
            return Engine::Math::pointAt(ray, *nearest);
        return ray.origin + Engine::Math::normalize(ray.direction) * kContextSpawnDistance;
    }

    void ViewerController::openContextMenu()
    {
        closeContextMenu();
        std::vector<ui::MenuItem> items{
            {"Next Style", ui::make_command([this]
                                            { cycleRepresentation(); })},
            {"Styles", ui::make_command([this]
                                        { togglePanel(ui::PanelId::Visuals); })},
            {"Help", ui::make_command([this]
                                      { togglePanel(ui::PanelId::Help); })},
            {"Close", ui::make_command([] {})},
        };
        const Vec3 at = contextSpawnPoint(m_state.controllerRay);
        m_state.contextMenu = std::make_unique<ui::ContextMenu>(std::move(items), at, m_state.viewerPosition);
        m_state.scene.add(m_state.contextMenu->group());
        spdlog::debug("[Viewer] Context menu at ({:.2f}, {:.2f}, {:.2f})", at.x, at.y, at.z);
    }

    void ViewerController::closeContextMenu()
    {
        if (!m_state.contextMenu)
            return;
        m_state.scene.remove(m_state.contextMenu->group().get());
        m_state.contextMenu.reset();
    }

} // namespace molxr::app
