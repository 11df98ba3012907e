//===== test_state_manager.cpp =====
#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include "market_ingest/core/state_manager.hpp"

using namespace market_ingest;

class StateManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        StateManager::reset_instance();
    }

    void TearDown() override {
        StateManager::reset_instance();
    }

    ComponentInfo make_info(const std::string& id,
                            ComponentState state = ComponentState::INITIALIZED) {
        return ComponentInfo{ComponentType::FETCH_ORCHESTRATOR, state, id, "",
                             std::chrono::system_clock::now(), {}};
    }
};

TEST_F(StateManagerTest, RegisterComponentSuccess) {
    auto result = StateManager::instance().register_component(make_info("fetch"));
    EXPECT_TRUE(result.is_ok());
    EXPECT_EQ(StateManager::instance().get_all_components().size(), 1u);
}

TEST_F(StateManagerTest, RegisterDuplicateComponent) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("fetch")).is_ok());
    auto result = StateManager::instance().register_component(make_info("fetch"));
    EXPECT_TRUE(result.is_error());
}

TEST_F(StateManagerTest, StateTransitions) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("fetch")).is_ok());

    EXPECT_TRUE(
        StateManager::instance().update_state("fetch", ComponentState::RUNNING).is_ok());
    EXPECT_TRUE(StateManager::instance()
                    .update_state("fetch", ComponentState::ERR_STATE, "store unreachable")
                    .is_ok());

    auto state = StateManager::instance().get_state("fetch");
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, ComponentState::ERR_STATE);
    EXPECT_EQ(state.value().error_message, "store unreachable");
    EXPECT_FALSE(StateManager::instance().is_healthy());

    // A failed job run recovers on the next one
    EXPECT_TRUE(
        StateManager::instance().update_state("fetch", ComponentState::RUNNING).is_ok());
    EXPECT_TRUE(StateManager::instance().get_state("fetch").value().error_message.empty());
}

TEST_F(StateManagerTest, InvalidTransitionRejected) {
    ASSERT_TRUE(StateManager::instance()
                    .register_component(make_info("fetch", ComponentState::RUNNING))
                    .is_ok());
    auto result = StateManager::instance().update_state("fetch", ComponentState::INITIALIZED);
    EXPECT_TRUE(result.is_error());
}

TEST_F(StateManagerTest, MetricsAndUnregister) {
    ASSERT_TRUE(StateManager::instance().register_component(make_info("fetch")).is_ok());
    ASSERT_TRUE(StateManager::instance().update_metrics("fetch", {{"failures", 2.0}}).is_ok());
    EXPECT_DOUBLE_EQ(StateManager::instance().get_state("fetch").value().metrics.at("failures"),
                     2.0);

    EXPECT_TRUE(StateManager::instance().unregister_component("fetch").is_ok());
    EXPECT_TRUE(StateManager::instance().get_state("fetch").is_error());
    EXPECT_TRUE(StateManager::instance().unregister_component("fetch").is_error());
}

TEST_F(StateManagerTest, ComponentIdsAreUnique) {
    auto first = StateManager::make_component_id("MemoryStore");
    auto second = StateManager::make_component_id("MemoryStore");
    EXPECT_NE(first, second);
    EXPECT_EQ(first.rfind("MemoryStore", 0), 0u);
}
