#include <gtest/gtest.h>
#include "fake_executor.hpp"
#include "tools/snapshot_tools.hpp"

using nlohmann::json;

class SnapshotToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        executor_ = std::make_shared<FakeExecutor>();
        tools_ = std::make_unique<SnapshotTools>(executor_);
    }

    std::shared_ptr<FakeExecutor> executor_;
    std::unique_ptr<SnapshotTools> tools_;
};

// Test snapshot listing with the current marker
TEST_F(SnapshotToolsTest, ListMarksCurrentSnapshot) {
    executor_->respond("snapshot-list", FakeExecutor::ok(
        "{aaaa}   \"Clean install\" 2024-01-15 10:30:00\n"
        "{bbbb} * \"Before upgrade\" 2024-02-01 09:00:00\n"));

    ToolResult result = tools_->listSnapshots({{"vmId", "Ubuntu VM"}});
    ASSERT_FALSE(result.isError);
    const std::string text = result.firstText();
    EXPECT_NE(text.find("## Snapshots for VM 'Ubuntu VM'"), std::string::npos);
    EXPECT_NE(text.find("Found 2 snapshot(s)"), std::string::npos);
    EXPECT_NE(text.find("### 2. Before upgrade ⭐ (Current)"), std::string::npos);
    EXPECT_EQ(text.find("Clean install ⭐"), std::string::npos);

    const auto calls = executor_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], (std::vector<std::string>{"snapshot-list", "UbuntuVM"}));
}

// Test a VM without snapshots
TEST_F(SnapshotToolsTest, ListWithoutSnapshots) {
    ToolResult result = tools_->listSnapshots({{"vmId", "vm"}});
    ASSERT_FALSE(result.isError);
    EXPECT_NE(result.firstText().find("No snapshots found"), std::string::npos);
}

// Test a failing snapshot-list
TEST_F(SnapshotToolsTest, ListFailureIsError) {
    executor_->respond("snapshot-list", FakeExecutor::fail("Failed to get VM config"));
    ToolResult result = tools_->listSnapshots({{"vmId", "vm"}});
    EXPECT_TRUE(result.isError);
    EXPECT_NE(result.firstText().find("Failed to get VM config"), std::string::npos);
}

// Test that the snapshot name is passed as one argument
TEST_F(SnapshotToolsTest, TakeSnapshotPassesNameAsSingleArgument) {
    ToolResult result = tools_->takeSnapshot(
        {{"vmId", "vm;1"}, {"name", "before; rm -rf"}, {"description", "pre upgrade"}});
    ASSERT_FALSE(result.isError);
    EXPECT_NE(result.firstText().find("**Description**: pre upgrade"), std::string::npos);

    const auto calls = executor_->callsFor("snapshot");
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], (std::vector<std::string>{
        "snapshot", "vm1", "--name", "before; rm -rf", "--description", "pre upgrade"}));
}

// Test that takeSnapshot needs a name
TEST_F(SnapshotToolsTest, TakeSnapshotRequiresName) {
    ToolResult result = tools_->takeSnapshot({{"vmId", "vm"}});
    EXPECT_TRUE(result.isError);
    EXPECT_NE(result.firstText().find("name is required"), std::string::npos);
    EXPECT_TRUE(executor_->calls().empty());
}

// Test that a snapshot UUID is used as given
TEST_F(SnapshotToolsTest, RestoreKeepsUuidVerbatim) {
    const std::string uuid = "{12345678-1234-5678-9abc-def012345678}";
    ToolResult result = tools_->restoreSnapshot({{"vmId", "vm"}, {"snapshotId", uuid}});
    ASSERT_FALSE(result.isError);
    EXPECT_NE(result.firstText().find("restored to snapshot"), std::string::npos);

    const auto calls = executor_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], (std::vector<std::string>{"snapshot-switch", "vm", "--id", uuid}));
}

// Test that a non-UUID snapshot id is sanitized
TEST_F(SnapshotToolsTest, RestoreSanitizesNonUuid) {
    tools_->restoreSnapshot({{"vmId", "vm"}, {"snapshotId", "snap$(id)"}});
    const auto calls = executor_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].back(), "snapid");
}

// Test the hint for a snapshot that does not exist
TEST_F(SnapshotToolsTest, RestoreReportsMissingSnapshot) {
    executor_->respond("snapshot-switch", FakeExecutor::fail("The snapshot {dead} was not found"));
    ToolResult result = tools_->restoreSnapshot({{"vmId", "vm"}, {"snapshotId", "{dead}"}});
    EXPECT_TRUE(result.isError);
    EXPECT_NE(result.firstText().find("Snapshot not found"), std::string::npos);
    EXPECT_NE(result.firstText().find("listSnapshots"), std::string::npos);
}

// Test a restore failure with no known cause
TEST_F(SnapshotToolsTest, RestoreOtherFailure) {
    executor_->respond("snapshot-switch", FakeExecutor::fail("VM is locked"));
    ToolResult result = tools_->restoreSnapshot({{"vmId", "vm"}, {"snapshotId", "s1"}});
    EXPECT_TRUE(result.isError);
    EXPECT_NE(result.firstText().find("Error restoring snapshot"), std::string::npos);
}
