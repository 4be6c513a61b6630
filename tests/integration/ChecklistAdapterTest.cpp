#include "integration/ChecklistAdapter.h"
#include <gtest/gtest.h>

namespace GAIA {
namespace Test {

class ChecklistAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        agentOutput_ = json::parse(R"({
            "checklist": [
                {
                    "id": "TC001",
                    "name": "Login with valid credentials",
                    "priority": "MUST",
                    "category": "auth",
                    "steps": ["open login page", {"description": "submit", "action": "click", "selector": "#go", "params": []}],
                    "precondition": "account exists",
                    "expected_result": "dashboard is shown"
                },
                {
                    "id": "TC002",
                    "name": "Footer links"
                },
                {
                    "name": "No id"
                }
            ]
        })");
    }

    json agentOutput_;
};

TEST_F(ChecklistAdapterTest, ConvertsEveryChecklistEntry) {
    auto items = ChecklistAdapter::toTestItems(agentOutput_);
    ASSERT_EQ(items.size(), 3u);

    EXPECT_EQ(items[0].id, "TC001");
    EXPECT_EQ(items[0].priority, "MUST");
    EXPECT_EQ(items[0].payload["name"], "Login with valid credentials");
    EXPECT_EQ(items[0].payload["category"], "auth");
    EXPECT_EQ(items[0].payload["steps"].size(), 2u);
    EXPECT_EQ(items[0].payload["precondition"], "account exists");
    EXPECT_EQ(items[0].payload["expected_result"], "dashboard is shown");
    EXPECT_EQ(items[0].newElements, 0);
    EXPECT_FALSE(items[0].targetUrl.has_value());
    EXPECT_FALSE(items[0].noDomChange);
}

TEST_F(ChecklistAdapterTest, MissingFieldsGetDefaults) {
    auto items = ChecklistAdapter::toTestItems(agentOutput_);
    ASSERT_EQ(items.size(), 3u);

    EXPECT_EQ(items[1].priority, "MAY");
    EXPECT_EQ(items[1].payload["category"], "");
    EXPECT_TRUE(items[1].payload["steps"].is_array());
    EXPECT_TRUE(items[1].payload["steps"].empty());

    EXPECT_TRUE(items[2].id.empty());
}

TEST_F(ChecklistAdapterTest, MalformedAgentOutputYieldsNothing) {
    EXPECT_TRUE(ChecklistAdapter::toTestItems(json::array()).empty());
    EXPECT_TRUE(ChecklistAdapter::toTestItems(json::object()).empty());
    EXPECT_TRUE(ChecklistAdapter::toTestItems(json{{"checklist", "none"}}).empty());
}

TEST_F(ChecklistAdapterTest, ScenarioNormalizesSteps) {
    auto items = ChecklistAdapter::toTestItems(agentOutput_);
    json scenario = ChecklistAdapter::toScenario(items[0]);

    EXPECT_EQ(scenario["id"], "TC001");
    EXPECT_EQ(scenario["priority"], "MUST");
    EXPECT_EQ(scenario["scenario"], "Login with valid credentials");
    ASSERT_EQ(scenario["steps"].size(), 2u);

    const json &plain = scenario["steps"][0];
    EXPECT_EQ(plain["description"], "open login page");
    EXPECT_EQ(plain["action"], "click");
    EXPECT_EQ(plain["selector"], "");
    EXPECT_TRUE(plain["params"].is_array());

    EXPECT_EQ(scenario["steps"][1]["selector"], "#go");
    EXPECT_FALSE(scenario.contains("target_url"));
}

TEST_F(ChecklistAdapterTest, ScenarioAssertionUsesExpectedResult) {
    auto items = ChecklistAdapter::toTestItems(agentOutput_);
    json assertion = ChecklistAdapter::toScenario(items[0])["assertion"];

    EXPECT_EQ(assertion["description"], "dashboard is shown");
    EXPECT_EQ(assertion["selector"], "body");
    EXPECT_EQ(assertion["condition"], "is_visible");
    EXPECT_TRUE(assertion["params"].empty());
}

TEST_F(ChecklistAdapterTest, ScenarioCarriesTargetUrl) {
    TestItem item("TC009", "SHOULD");
    item.targetUrl = "https://shop.test/cart";
    item.payload["name"] = "Cart";

    json scenario = ChecklistAdapter::toScenario(item);
    EXPECT_EQ(scenario["target_url"], "https://shop.test/cart");
    EXPECT_TRUE(scenario["steps"].empty());
}

}  // namespace Test
}  // namespace GAIA
