// SPDX-License-Identifier: AGPL-3.0-or-later
#pragma once

#include "molxr/app/viewer_controller.hpp"

namespace molxr::app
{

    // Immediate-mode mirror of the spatial UI: status, wrist menu and the visible panel.
    // Must be called between ImGui::NewFrame() and ImGui::Render().
    void RenderOverlay(ViewerController &viewer);

    void RenderStatusWindow(const ViewerController &viewer);
    void RenderWristMenu(ViewerController &viewer);
    void RenderVisiblePanel(ViewerController &viewer);

} // namespace molxr::app
