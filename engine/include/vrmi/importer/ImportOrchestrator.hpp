#pragma once

#include "vrmi/assets/TextureFactory.hpp"
#include "vrmi/assets/TextureImportParamFactory.hpp"
#include "vrmi/assets/VrmReader.hpp"
#include "vrmi/importer/AwaitCaller.hpp"
#include "vrmi/importer/ImportSettings.hpp"
#include "vrmi/importer/ImportStateMachine.hpp"
#include "vrmi/runtime/RuntimeDevice.hpp"
#include "vrmi/scene/ModelAsset.hpp"
#include "vrmi/scene/RendererBuilder.hpp"
#include "vrmi/scene/SceneGraphBuilder.hpp"

#include <array>
#include <functional>
#include <memory>
#include <string_view>

namespace vrmi::importer {

// VRM features whose import is left to the host
enum class ExtensionPoint {
    Meta,
    FirstPerson,
    Expression,
    LookAt,
    SpringBone,
    Constraint,
    Count
};

std::string_view toString(ExtensionPoint point);

struct ExtensionContext {
    const scene::Model& model;
    const scene::VrmExtension& vrm;
    scene::ModelAsset& asset;
    runtime::RuntimeDevice& device;
};

using ExtensionHook = std::function<void(ExtensionContext&)>;

struct ImportOptions {
    // Host textures matched by key before anything is decoded
    assets::ExternalTextureMap externalTextures;
    // Existing transform the imported hierarchy is grafted under
    TransformHandle hostRoot;
};

inline constexpr std::string_view kControllerMarkerName = "VRM10Controller";

/**
 * @brief Imports a VrmDocument into a RuntimeDevice, one slice at a time
 *
 * Phases run in a fixed order: materials, meshes (one yield per mesh group),
 * hierarchy, renderers (one yield per renderer), post-processing. step()
 * runs until the next yield point. Any exception moves the import to Failed
 * and propagates; a failed import cannot be resumed.
 *
 * The device must outlive the orchestrator. Textures still owned by the
 * texture factory are destroyed with the orchestrator, so call
 * textureFactory().transferOwnership() first to keep them.
 */
class ImportOrchestrator {
public:
    // Throws NotImplementedError when the document has no VRMC_vrm block
    ImportOrchestrator(runtime::RuntimeDevice& device, assets::VrmDocument document,
                       ImportSettings settings = {}, ImportOptions options = {});
    ~ImportOrchestrator();

    ImportOrchestrator(const ImportOrchestrator&) = delete;
    ImportOrchestrator& operator=(const ImportOrchestrator&) = delete;

    // Returns true once the import is complete
    bool step();

    // Steps and yields to caller until complete. Returns false when the
    // caller stopped the import first.
    bool runToCompletion(AwaitCaller& caller);

    [[nodiscard]] ImportState state() const { return m_state.getCurrentState(); }
    [[nodiscard]] bool isComplete() const { return state() == ImportState::PostProcessed; }
    [[nodiscard]] uint32_t stepCount() const { return m_stepCount; }

    void setExtensionHook(ExtensionPoint point, ExtensionHook hook);

    [[nodiscard]] const scene::Model& model() const { return m_document.model; }
    [[nodiscard]] const scene::ModelAsset& modelAsset() const { return m_asset; }
    assets::TextureFactory& textureFactory() { return m_textureFactory; }

    // Hands the output to the caller. Only valid once, after completion.
    scene::ModelAsset takeModelAsset();

private:
    bool runNextUnit();
    bool itemDone();
    bool finishIteration(ImportState next);
    void advance(ImportState next);

    void loadMaterials();
    void buildMesh(uint32_t meshGroup);
    void buildHierarchy();
    void attachRenderer(uint32_t node, TransformHandle transform);
    void postProcess();

    runtime::RuntimeDevice& m_device;
    assets::VrmDocument m_document;
    ImportSettings m_settings;
    ImportOptions m_options;

    std::unique_ptr<assets::TextureImportParamFactory> m_textureParams;
    assets::TextureFactory m_textureFactory;
    scene::SceneGraphBuilder m_sceneGraph;
    scene::RendererBuilder m_rendererBuilder;

    ImportStateMachine m_state;
    scene::ModelAsset m_asset;
    bool m_assetTaken = false;

    size_t m_cursor = 0;
    uint32_t m_itemsSinceYield = 0;
    uint32_t m_stepCount = 0;

    std::array<ExtensionHook, static_cast<size_t>(ExtensionPoint::Count)> m_hooks;
};

} // namespace vrmi::importer
