#pragma once

#include <string_view>

namespace vrmi::importer {

enum class ImportState {
    Created,
    MaterialsLoaded,
    MeshesBuilt,
    HierarchyBuilt,
    RenderersAttached,
    PostProcessed,
    Failed
};

class ImportStateMachine {
public:
    ImportStateMachine() = default;

    ImportState getCurrentState() const { return m_currentState; }

    bool isTerminal() const {
        return m_currentState == ImportState::PostProcessed || m_currentState == ImportState::Failed;
    }

    // Phases advance strictly one at a time; Failed is reachable from any
    // non-terminal state. Nothing leaves PostProcessed or Failed.
    bool tryTransition(ImportState newState) {
        if (isTerminal()) {
            return false;
        }

        if (newState == ImportState::Failed) {
            m_currentState = newState;
            return true;
        }

        bool valid = false;
        switch (m_currentState) {
        case ImportState::Created:
            valid = (newState == ImportState::MaterialsLoaded);
            break;
        case ImportState::MaterialsLoaded:
            valid = (newState == ImportState::MeshesBuilt);
            break;
        case ImportState::MeshesBuilt:
            valid = (newState == ImportState::HierarchyBuilt);
            break;
        case ImportState::HierarchyBuilt:
            valid = (newState == ImportState::RenderersAttached);
            break;
        case ImportState::RenderersAttached:
            valid = (newState == ImportState::PostProcessed);
            break;
        case ImportState::PostProcessed:
        case ImportState::Failed:
            break;
        }

        if (valid) {
            m_currentState = newState;
        }
        return valid;
    }

    static constexpr std::string_view stateToString(ImportState state) {
        switch (state) {
        case ImportState::Created:           return "Created";
        case ImportState::MaterialsLoaded:   return "MaterialsLoaded";
        case ImportState::MeshesBuilt:       return "MeshesBuilt";
        case ImportState::HierarchyBuilt:    return "HierarchyBuilt";
        case ImportState::RenderersAttached: return "RenderersAttached";
        case ImportState::PostProcessed:     return "PostProcessed";
        case ImportState::Failed:            return "Failed";
        default:                             return "Unknown";
        }
    }

private:
    ImportState m_currentState = ImportState::Created;
};

} // namespace vrmi::importer
