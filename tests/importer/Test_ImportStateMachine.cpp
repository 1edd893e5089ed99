#include <doctest/doctest.h>
#include "vrmi/importer/ImportStateMachine.hpp"

using namespace vrmi::importer;

TEST_CASE("ImportStateMachine Transitions") {
    ImportStateMachine fsm;

    SUBCASE("Initial State is Created") {
        CHECK(fsm.getCurrentState() == ImportState::Created);
        CHECK_FALSE(fsm.isTerminal());
    }

    SUBCASE("Valid Happy Path") {
        CHECK(fsm.tryTransition(ImportState::MaterialsLoaded));
        CHECK(fsm.tryTransition(ImportState::MeshesBuilt));
        CHECK(fsm.tryTransition(ImportState::HierarchyBuilt));
        CHECK(fsm.tryTransition(ImportState::RenderersAttached));
        CHECK(fsm.tryTransition(ImportState::PostProcessed));
        CHECK(fsm.getCurrentState() == ImportState::PostProcessed);
        CHECK(fsm.isTerminal());
    }

    SUBCASE("Phases cannot be skipped or repeated") {
        CHECK_FALSE(fsm.tryTransition(ImportState::MeshesBuilt));
        CHECK(fsm.getCurrentState() == ImportState::Created);

        fsm.tryTransition(ImportState::MaterialsLoaded);
        CHECK_FALSE(fsm.tryTransition(ImportState::MaterialsLoaded));
        CHECK_FALSE(fsm.tryTransition(ImportState::Created));
    }

    SUBCASE("Failure is terminal") {
        fsm.tryTransition(ImportState::MaterialsLoaded);
        CHECK(fsm.tryTransition(ImportState::Failed));
        CHECK(fsm.isTerminal());
        CHECK_FALSE(fsm.tryTransition(ImportState::MeshesBuilt));
        CHECK_FALSE(fsm.tryTransition(ImportState::Failed));
    }

    SUBCASE("Completed imports cannot fail") {
        for (auto state : {ImportState::MaterialsLoaded, ImportState::MeshesBuilt, ImportState::HierarchyBuilt,
                           ImportState::RenderersAttached, ImportState::PostProcessed}) {
            REQUIRE(fsm.tryTransition(state));
        }
        CHECK_FALSE(fsm.tryTransition(ImportState::Failed));
    }

    SUBCASE("Names") {
        CHECK(ImportStateMachine::stateToString(ImportState::HierarchyBuilt) == "HierarchyBuilt");
    }
}
