#include "vrmi/importer/ImportOrchestrator.hpp"

#include "vrmi/core/errors.hpp"
#include "vrmi/core/logger.hpp"
#include "vrmi/core/profiler.hpp"
#include "vrmi/scene/HumanoidBinder.hpp"
#include "vrmi/scene/MaterialImporter.hpp"

#include <cpptrace/cpptrace.hpp>
#include <fmt/format.h>

namespace vrmi::importer {

std::string_view toString(ExtensionPoint point) {
    switch (point) {
    case ExtensionPoint::Meta:        return "meta";
    case ExtensionPoint::FirstPerson: return "firstPerson";
    case ExtensionPoint::Expression:  return "expression";
    case ExtensionPoint::LookAt:      return "lookAt";
    case ExtensionPoint::SpringBone:  return "springBone";
    case ExtensionPoint::Constraint:  return "constraint";
    default:                          return "unknown";
    }
}

namespace {

assets::TextureFactory::Settings textureSettings(const ImportSettings& settings) {
    assets::TextureFactory::Settings out;
    out.blankSize = settings.textureBlankSize;
    out.verboseCache = settings.verboseCache;
    return out;
}

} // namespace

ImportOrchestrator::ImportOrchestrator(runtime::RuntimeDevice& device, assets::VrmDocument document,
                                       ImportSettings settings, ImportOptions options)
    : m_device(device),
      m_document(std::move(document)),
      m_settings(std::move(settings)),
      m_options(std::move(options)),
      m_textureFactory(device, std::move(m_options.externalTextures), textureSettings(m_settings)),
      m_sceneGraph(device),
      m_rendererBuilder(device) {
    if (m_settings.yieldEvery == 0) {
        m_settings.yieldEvery = 1;
    }

    if (!m_document.model.vrm) {
        core::Logger::Import.error("'{}' has no VRMC_vrm extension", m_document.model.name);
        throw core::NotImplementedError("VRMC_vrm is not found");
    }

    if (m_document.gltf) {
        m_textureParams =
            std::make_unique<assets::TextureImportParamFactory>(*m_document.gltf, m_document.baseDir);
    }

    scene::HumanoidBinder::assign(m_document.model, *m_document.model.vrm);
}

ImportOrchestrator::~ImportOrchestrator() = default;

void ImportOrchestrator::setExtensionHook(ExtensionPoint point, ExtensionHook hook) {
    if (point == ExtensionPoint::Count) {
        throw cpptrace::invalid_argument("setExtensionHook: invalid extension point");
    }
    m_hooks[static_cast<size_t>(point)] = std::move(hook);
}

bool ImportOrchestrator::step() {
    if (state() == ImportState::Failed) {
        throw cpptrace::logic_error("step: the import has failed and cannot be resumed");
    }
    if (isComplete()) {
        return true;
    }

    VRMI_PROFILE_FUNCTION();
    VRMI_LOG_SCOPE("Import/" + m_document.model.name);

    try {
        while (!runNextUnit()) {
        }
    } catch (...) {
        const ImportState failedIn = state();
        m_state.tryTransition(ImportState::Failed);
        core::Logger::Import.error("Import failed after {}", ImportStateMachine::stateToString(failedIn));
        throw;
    }

    ++m_stepCount;
    return isComplete();
}

bool ImportOrchestrator::runToCompletion(AwaitCaller& caller) {
    while (true) {
        const bool done = step();
        const bool resume = caller.nextFrame();
        if (done) {
            return true;
        }
        if (!resume) {
            core::Logger::Import.info("Import of '{}' stopped by the host in {}", m_document.model.name,
                                      ImportStateMachine::stateToString(state()));
            return false;
        }
    }
}

scene::ModelAsset ImportOrchestrator::takeModelAsset() {
    if (!isComplete()) {
        throw cpptrace::logic_error("takeModelAsset: the import is not complete");
    }
    if (m_assetTaken) {
        throw cpptrace::logic_error("takeModelAsset: the model asset was already taken");
    }
    m_assetTaken = true;
    return std::move(m_asset);
}

bool ImportOrchestrator::runNextUnit() {
    const auto& model = m_document.model;

    switch (state()) {
    case ImportState::Created:
        loadMaterials();
        advance(ImportState::MaterialsLoaded);
        return true;

    case ImportState::MaterialsLoaded:
        if (m_cursor >= model.meshGroups.size()) {
            return finishIteration(ImportState::MeshesBuilt);
        }
        buildMesh(static_cast<uint32_t>(m_cursor++));
        return itemDone();

    case ImportState::MeshesBuilt:
        buildHierarchy();
        advance(ImportState::HierarchyBuilt);
        return true;

    case ImportState::HierarchyBuilt: {
        const auto& nodes = m_asset.map.nodes();
        while (m_cursor < nodes.size() && !model.nodes[nodes[m_cursor].first].meshGroup) {
            ++m_cursor;
        }
        if (m_cursor >= nodes.size()) {
            return finishIteration(ImportState::RenderersAttached);
        }
        const auto [node, transform] = nodes[m_cursor++];
        attachRenderer(node, transform);
        return itemDone();
    }

    case ImportState::RenderersAttached:
        postProcess();
        advance(ImportState::PostProcessed);
        return true;

    case ImportState::PostProcessed:
    case ImportState::Failed:
        return true;
    }
    return true;
}

bool ImportOrchestrator::itemDone() {
    if (++m_itemsSinceYield >= m_settings.yieldEvery) {
        m_itemsSinceYield = 0;
        return true;
    }
    return false;
}

bool ImportOrchestrator::finishIteration(ImportState next) {
    advance(next);
    m_cursor = 0;
    // A partial batch still gets its yield
    const bool pending = m_itemsSinceYield > 0;
    m_itemsSinceYield = 0;
    return pending;
}

void ImportOrchestrator::advance(ImportState next) {
    const ImportState current = state();
    if (!m_state.tryTransition(next)) {
        throw cpptrace::logic_error(fmt::format("invalid import transition {} -> {}",
                                                ImportStateMachine::stateToString(current),
                                                ImportStateMachine::stateToString(next)));
    }
    core::Logger::Import.info("{} -> {}", ImportStateMachine::stateToString(current),
                              ImportStateMachine::stateToString(next));
}

void ImportOrchestrator::loadMaterials() {
    VRMI_PROFILE_SCOPE("Import materials");
    scene::MaterialImporter importer(m_device, m_textureFactory, m_textureParams.get());
    m_asset.materials = importer.importAll(m_document.model);
}

void ImportOrchestrator::buildMesh(uint32_t meshGroup) {
    const auto& group = m_document.model.meshGroup(meshGroup);
    const MeshHandle mesh = m_rendererBuilder.createMesh(group);
    m_asset.map.addMesh(meshGroup, mesh);
}

void ImportOrchestrator::buildHierarchy() {
    VRMI_PROFILE_SCOPE("Import hierarchy");
    const auto& model = m_document.model;

    m_sceneGraph.buildHierarchy(model, model.root, m_asset.map);
    if (m_options.hostRoot.isValid()) {
        m_sceneGraph.substituteRoot(model.root, m_options.hostRoot, m_asset.map);
    }
    m_asset.root = m_asset.map.transformOf(model.root);
}

void ImportOrchestrator::attachRenderer(uint32_t node, TransformHandle transform) {
    const RendererHandle renderer =
        m_rendererBuilder.createRenderer(m_document.model, node, transform, m_asset.map, m_asset.materials);
    m_asset.map.addRenderer(node, renderer);
}

void ImportOrchestrator::postProcess() {
    VRMI_PROFILE_SCOPE("Import post-process");
    const auto& model = m_document.model;

    m_asset.name = m_settings.rootName;
    m_device.setName(m_asset.root, m_settings.rootName);

    const auto bindings = scene::HumanoidBinder::buildBindings(model, m_asset.map);
    m_asset.avatar = m_device.createHumanoidAvatar(m_asset.root, bindings, m_settings.rootName);
    m_device.addAnimator(m_asset.root, m_asset.avatar);
    m_device.addControllerMarker(m_asset.root, kControllerMarkerName);

    ExtensionContext context{model, *model.vrm, m_asset, m_device};
    for (size_t i = 0; i < m_hooks.size(); ++i) {
        const auto point = static_cast<ExtensionPoint>(i);
        if (m_hooks[i]) {
            m_hooks[i](context);
        } else {
            core::Logger::Import.debug("{} import is not implemented", toString(point));
        }
    }
}

} // namespace vrmi::importer
