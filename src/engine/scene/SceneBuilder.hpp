#pragma once

#include "Scene.hpp"

namespace Engine::SceneBuilder
{

    // Standing-height viewer three metres back from the molecule pedestal
    inline Engine::Scene::SceneData CreateViewerScene(float aspect = 16.0f / 9.0f)
    {
        Engine::Scene::SceneData scene;

        scene.cameraTransform.position = {0.0f, 1.6f, 3.0f};
        scene.cameraTransform.rotationEulerRad = {0.0f, 0.0f, 0.0f};
        scene.camera.fovYRadians = 70.0f * 3.1415926535f / 180.0f;
        scene.camera.aspect = aspect;
        scene.camera.nearPlane = 0.1f;
        scene.camera.farPlane = 100.0f;

        return scene;
    }

} // namespace Engine::SceneBuilder
