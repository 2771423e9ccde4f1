// SPDX-License-Identifier: AGPL-3.0-or-later
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "molxr/app/viewer_controller.hpp"
#include "molxr/error.hpp"
#include "molxr/net/sync_message.hpp"
#include "pdb_fixtures.hpp"

using namespace molxr;
using Engine::Math::Ray;
using Engine::Math::Vec3;
using molxr::testing::ChainText;

namespace
{
    // Serves canned structure text by id; unknown ids fail like a 404
    class FakeFetcher : public net::StructureFetcher
    {
    public:
        explicit FakeFetcher(std::map<std::string, std::string> files) : m_files(std::move(files)) {}

        std::string fetch(const std::string &structureId) override
        {
            auto it = m_files.find(structureId);
            if (it == m_files.end())
                throw FetchFailed(structureId, "HTTP 404");
            return it->second;
        }

    private:
        const std::map<std::string, std::string> m_files;
    };

    class ViewerControllerTest : public ::testing::Test
    {
    protected:
        ViewerControllerTest()
            : viewer(config::default_config(),
                     std::make_shared<FakeFetcher>(std::map<std::string, std::string>{
                         {"1CRN", ChainText(3)},
                         {"4HHB", ChainText(12)},
                         {"5PTI", ChainText(7)},
                     }))
        {
            viewer.setBroadcastHook([this](const std::string &msg)
                                    { broadcasts.push_back(msg); });
        }

        // Runs frames until the transition has settled
        void Settle()
        {
            for (int i = 0; i < 40; ++i)
                viewer.update(1.0f / 60.0f);
        }

        app::ViewerController viewer;
        std::vector<std::string> broadcasts;
    };
}

TEST_F(ViewerControllerTest, StartsWithWristMenuAndNoMolecule)
{
    EXPECT_EQ(viewer.molecule(), nullptr);
    EXPECT_TRUE(viewer.wristMenu().visible());
    EXPECT_EQ(viewer.wristMenu().itemCount(), 5u);
    EXPECT_EQ(viewer.wristMenu().item(2).label, "Load");
    EXPECT_TRUE(viewer.scene().contains(viewer.wristMenu().group().get()));
    EXPECT_FALSE(viewer.loading());
}

TEST_F(ViewerControllerTest, LoadInstallsCenteredScaledMolecule)
{
    // Two atoms 15 angstroms apart: radius 0.75 scene units, shrunk to 0.6
    ASSERT_TRUE(viewer.loadStructureText(ChainText(2, 15.0f), "pair.pdb"));
    const auto *mol = viewer.molecule();
    ASSERT_NE(mol, nullptr);
    EXPECT_EQ(mol->sourceId, "pair.pdb");
    EXPECT_EQ(mol->atoms.size(), 2u);
    EXPECT_EQ(mol->activeKind, repr::RepresentationKind::BallAndStick);
    EXPECT_EQ(mol->activeRepresentationIndex, 0);
    EXPECT_NEAR(mol->atoms[0].position.x, -0.75f, 1e-5f);
    EXPECT_NEAR(mol->uniformScale, 0.8f, 1e-5f);

    ASSERT_TRUE(mol->currentGroup);
    EXPECT_TRUE(viewer.scene().contains(mol->currentGroup.get()));
    EXPECT_FLOAT_EQ(mol->currentGroup->transform.position.y, app::kMoleculeAnchor.y);
    EXPECT_NEAR(mol->currentGroup->uniformScale(), 0.8f, 1e-5f);
}

TEST_F(ViewerControllerTest, SmallMoleculeIsNotEnlarged)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(3), "small"));
    EXPECT_FLOAT_EQ(viewer.molecule()->uniformScale, 1.0f);
}

TEST_F(ViewerControllerTest, NewLoadReplacesPreviousGroup)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(3), "first"));
    const auto first = viewer.molecule()->currentGroup;
    ASSERT_TRUE(viewer.loadStructureText(ChainText(4), "second"));
    EXPECT_FALSE(viewer.scene().contains(first.get()));
    EXPECT_TRUE(first->isReleased());
    EXPECT_EQ(viewer.molecule()->sourceId, "second");
    EXPECT_EQ(viewer.scene().groups.size(), 2u);
}

TEST_F(ViewerControllerTest, FailedLoadKeepsCurrentMolecule)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(3), "keep"));
    EXPECT_FALSE(viewer.loadStructureText("HEADER    NOTHING HERE\nEND\n", "empty"));
    EXPECT_FALSE(viewer.loadStructureText(ChainText(repr::kMaxAtoms + 1, 0.1f), "huge"));
    EXPECT_EQ(viewer.molecule()->sourceId, "keep");
    EXPECT_TRUE(viewer.scene().contains(viewer.molecule()->currentGroup.get()));
}

TEST_F(ViewerControllerTest, CyclingFiveTimesReturnsToStart)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(6), "cycle"));
    std::vector<repr::RepresentationKind> seen;
    viewer.setRepresentationHook([&seen](repr::RepresentationKind kind, int)
                                 { seen.push_back(kind); });

    for (int i = 0; i < 5; ++i)
    {
        viewer.cycleRepresentation();
        Settle();
    }
    EXPECT_EQ(viewer.molecule()->activeKind, repr::RepresentationKind::BallAndStick);
    EXPECT_EQ(viewer.molecule()->activeRepresentationIndex, 0);
    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen[0], repr::RepresentationKind::SpaceFill);
    EXPECT_EQ(seen[3], repr::RepresentationKind::Ribbon);

    // Wrist menu plus the one settled molecule group
    EXPECT_EQ(viewer.scene().groups.size(), 2u);
    EXPECT_FLOAT_EQ(viewer.molecule()->currentGroup->uniformScale(), viewer.molecule()->uniformScale);
}

TEST_F(ViewerControllerTest, CycleDuringTransitionKeepsTwoMoleculeGroups)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(6), "cycle"));
    const auto original = viewer.molecule()->currentGroup;

    viewer.cycleRepresentation();
    viewer.update(0.1f);
    EXPECT_EQ(viewer.scene().groups.size(), 3u);

    viewer.cycleRepresentation();
    EXPECT_EQ(viewer.scene().groups.size(), 3u);
    EXPECT_FALSE(viewer.scene().contains(original.get()));
    EXPECT_TRUE(original->isReleased());
    EXPECT_EQ(viewer.molecule()->activeKind, repr::RepresentationKind::Wireframe);

    Settle();
    EXPECT_EQ(viewer.scene().groups.size(), 2u);
}

TEST_F(ViewerControllerTest, VisualsPanelShowsCurrentStyle)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(3), "style"));
    viewer.cycleRepresentation();
    const auto &lines = viewer.panels().visualsPanel().lines();
    EXPECT_NE(std::find(lines.begin(), lines.end(), "Current: Space Fill"), lines.end());
}

TEST_F(ViewerControllerTest, CycleWithoutMoleculeDoesNothing)
{
    viewer.cycleRepresentation();
    EXPECT_EQ(viewer.molecule(), nullptr);
    EXPECT_EQ(viewer.scene().groups.size(), 1u);
}

TEST_F(ViewerControllerTest, WristLoadOpensQuickLoadAndChoosingLoads)
{
    viewer.wristMenu().setHover(2);
    viewer.pointerClick();
    EXPECT_EQ(viewer.panels().visibleId(), ui::PanelId::QuickLoad);
    EXPECT_FALSE(viewer.wristMenu().visible());

    viewer.panels().quickLoadPanel().choose(0);
    EXPECT_FALSE(viewer.panels().anyVisible());
    EXPECT_TRUE(viewer.wristMenu().visible());
    ASSERT_EQ(broadcasts.size(), 1u);
    EXPECT_EQ(broadcasts[0], net::encode_load_message("1CRN"));

    EXPECT_EQ(viewer.finishPendingLoads(), 1u);
    ASSERT_NE(viewer.molecule(), nullptr);
    EXPECT_EQ(viewer.molecule()->sourceId, "1CRN");
    EXPECT_EQ(viewer.molecule()->atoms.size(), 3u);
}

TEST_F(ViewerControllerTest, GripTogglesWristMenu)
{
    viewer.leftGrip();
    EXPECT_FALSE(viewer.wristMenu().visible());
    EXPECT_FALSE(viewer.state().wristMenuWanted);

    viewer.leftGrip();
    EXPECT_TRUE(viewer.wristMenu().visible());

    // Bringing the wrist menu back hides any open panel
    viewer.wristMenu().setHover(0);
    viewer.pointerClick();
    ASSERT_TRUE(viewer.panels().anyVisible());
    viewer.leftGrip();
    viewer.leftGrip();
    EXPECT_FALSE(viewer.panels().anyVisible());
    EXPECT_TRUE(viewer.wristMenu().visible());
}

TEST_F(ViewerControllerTest, TriggerTapSelectsStickHover)
{
    viewer.leftStick(0.0f, 1.0f);
    EXPECT_EQ(viewer.wristMenu().hovered(), 0);

    viewer.rightTriggerPressed();
    viewer.update(0.1f);
    viewer.rightTriggerReleased();
    EXPECT_EQ(viewer.panels().visibleId(), ui::PanelId::Help);
    EXPECT_FALSE(viewer.wristMenu().visible());
    EXPECT_EQ(viewer.contextMenu(), nullptr);

    viewer.closePanels();
    EXPECT_TRUE(viewer.wristMenu().visible());
}

TEST_F(ViewerControllerTest, SyncMessageLoadsWithoutBroadcast)
{
    EXPECT_TRUE(viewer.handleSyncMessage(R"({"type":"load","pdbId":"4hhb"})"));
    EXPECT_FALSE(viewer.handleSyncMessage(R"({"type":"chat"})"));
    EXPECT_TRUE(broadcasts.empty());
    EXPECT_EQ(viewer.finishPendingLoads(), 1u);
    EXPECT_EQ(viewer.molecule()->sourceId, "4HHB");
    EXPECT_EQ(viewer.molecule()->atoms.size(), 12u);
}

TEST_F(ViewerControllerTest, LatestRequestWins)
{
    viewer.requestLoad("1CRN");
    viewer.requestLoad("5PTI");
    EXPECT_TRUE(viewer.loading());
    EXPECT_EQ(viewer.finishPendingLoads(), 1u);
    EXPECT_FALSE(viewer.loading());
    EXPECT_EQ(viewer.molecule()->sourceId, "5PTI");
    EXPECT_EQ(broadcasts.size(), 2u);
}

TEST_F(ViewerControllerTest, TextLoadSupersedesPendingFetch)
{
    viewer.requestLoad("1CRN", false);
    ASSERT_TRUE(viewer.loadStructureText(ChainText(5), "local"));
    EXPECT_EQ(viewer.finishPendingLoads(), 0u);
    ASSERT_NE(viewer.molecule(), nullptr);
    EXPECT_EQ(viewer.molecule()->sourceId, "local");
    EXPECT_EQ(viewer.molecule()->atoms.size(), 5u);
}

TEST_F(ViewerControllerTest, FetchAfterTextLoadStillInstalls)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(5), "local"));
    viewer.requestLoad("4HHB", false);
    EXPECT_EQ(viewer.finishPendingLoads(), 1u);
    EXPECT_EQ(viewer.molecule()->sourceId, "4HHB");
}

TEST_F(ViewerControllerTest, FetchFailureKeepsCurrentMolecule)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(3), "local"));
    viewer.requestLoad("9XYZ");
    EXPECT_EQ(viewer.finishPendingLoads(), 0u);
    EXPECT_EQ(viewer.molecule()->sourceId, "local");
}

TEST_F(ViewerControllerTest, InvalidIdIsNotRequested)
{
    viewer.requestLoad("no!");
    EXPECT_FALSE(viewer.loading());
    EXPECT_TRUE(broadcasts.empty());
}

TEST_F(ViewerControllerTest, UpdatePicksUpFinishedFetch)
{
    viewer.requestLoad("1CRN", false);
    for (int i = 0; i < 2000 && viewer.loading(); ++i)
    {
        viewer.update(1.0f / 60.0f);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    ASSERT_NE(viewer.molecule(), nullptr);
    EXPECT_EQ(viewer.molecule()->sourceId, "1CRN");
}

TEST_F(ViewerControllerTest, LongPressOpensContextMenuOnAtom)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(1), "single"));
    viewer.setControllerRay(Ray{{0.0f, 1.2f, 3.0f}, {0.0f, 0.0f, -1.0f}});

    viewer.rightTriggerPressed();
    viewer.update(0.3f);
    EXPECT_EQ(viewer.contextMenu(), nullptr);
    viewer.update(0.2f);
    ASSERT_NE(viewer.contextMenu(), nullptr);
    EXPECT_TRUE(viewer.scene().contains(viewer.contextMenu()->group().get()));

    const auto &at = viewer.contextMenu()->transform().position;
    EXPECT_NEAR(at.x, 0.0f, 1e-5f);
    EXPECT_NEAR(at.y, 1.2f, 1e-5f);
    EXPECT_NEAR(at.z, repr::kAtomSphereRadius, 1e-5f);
    EXPECT_EQ(viewer.contextMenu()->item(0).label, "Next Style");

    // Stick drives the context menu while it is open
    viewer.leftStick(0.0f, 1.0f);
    EXPECT_EQ(viewer.contextMenu()->hovered(), 0);
    EXPECT_EQ(viewer.wristMenu().hovered(), -1);

    const auto group = viewer.contextMenu()->group();
    viewer.rightTriggerReleased();
    EXPECT_EQ(viewer.contextMenu(), nullptr);
    EXPECT_FALSE(viewer.scene().contains(group.get()));
    EXPECT_EQ(viewer.molecule()->activeKind, repr::RepresentationKind::SpaceFill);
}

TEST_F(ViewerControllerTest, ReleasingWithoutHoverJustClosesContextMenu)
{
    ASSERT_TRUE(viewer.loadStructureText(ChainText(1), "single"));
    viewer.rightTriggerPressed();
    viewer.update(0.5f);
    ASSERT_NE(viewer.contextMenu(), nullptr);
    viewer.rightTriggerReleased();
    EXPECT_EQ(viewer.contextMenu(), nullptr);
    EXPECT_EQ(viewer.molecule()->activeKind, repr::RepresentationKind::BallAndStick);
    EXPECT_FALSE(viewer.panels().anyVisible());
}

TEST_F(ViewerControllerTest, SpawnPointFallsBackToFixedDistance)
{
    const Ray ray{{0.0f, 1.6f, 3.0f}, {0.0f, 0.0f, -2.0f}};
    const Vec3 p = viewer.contextSpawnPoint(ray);
    EXPECT_NEAR(p.x, 0.0f, 1e-5f);
    EXPECT_NEAR(p.y, 1.6f, 1e-5f);
    EXPECT_NEAR(p.z, 3.0f - app::kContextSpawnDistance, 1e-5f);

    // A molecule the ray misses changes nothing
    ASSERT_TRUE(viewer.loadStructureText(ChainText(1), "single"));
    const Vec3 q = viewer.contextSpawnPoint(Ray{{2.0f, 1.6f, 3.0f}, {0.0f, 0.0f, -1.0f}});
    EXPECT_NEAR(q.z, 2.0f, 1e-5f);
}
