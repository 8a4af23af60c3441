#include <gtest/gtest.h>
#include "fake_executor.hpp"
#include "tools/guest_tools.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

const char* kRunningList =
    "UUID                                     STATUS       IP_ADDR         NAME\n"
    "{11111111-1111-1111-1111-111111111111} running      10.211.55.3     web01\n"
    "{22222222-2222-2222-2222-222222222222} stopped      -               idle\n";

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

} // namespace

class GuestToolsTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir_ = fs::temp_directory_path() /
                   ("prlbridge_guest_test_" + std::to_string(getpid()) + "_" +
                    ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(tempDir_);
        executor_ = std::make_shared<FakeExecutor>();
        config_.screenshotDir = (tempDir_ / "shots").string();
        tools_ = std::make_unique<GuestTools>(executor_, config_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(tempDir_, ec);
    }

    fs::path writeFile(const std::string& name, const std::string& content) {
        const fs::path path = tempDir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path tempDir_;
    ServerConfig config_;
    std::shared_ptr<FakeExecutor> executor_;
    std::unique_ptr<GuestTools> tools_;
};

// Test a hostname change that the guest confirms
TEST_F(GuestToolsTest, SetHostnameVerified) {
    executor_->respond("list", FakeExecutor::ok(kRunningList));
    executor_->respondWhenContains("Hostname Verification",
                                   FakeExecutor::ok("=== Hostname Verification ===\nCurrent hostname: api-server\n"));

    ToolResult result = tools_->setHostname({{"vmId", "web01"}, {"hostname", "api-server"}});
    ASSERT_FALSE(result.isError);
    const std::string text = result.firstText();
    EXPECT_TRUE(contains(text, "✅ **Success**"));
    EXPECT_TRUE(contains(text, "**Current hostname**: api-server"));
    EXPECT_TRUE(contains(text, "6/6 methods completed"));

    // list, exec check, four configuration steps, verification
    const auto execs = executor_->callsFor("exec");
    ASSERT_EQ(execs.size(), 6u);
    EXPECT_EQ(execs[0][2], "echo \"test\"");
    EXPECT_EQ(execs[1][2], "hostnamectl set-hostname 'api-server'");
}

// Test partial success when the guest reports a different hostname
TEST_F(GuestToolsTest, SetHostnamePartialWhenVerificationDiffers) {
    executor_->respond("list", FakeExecutor::ok(kRunningList));
    executor_->respondWhenContains("sudo hostname 'api'", FakeExecutor::fail("hostname: not permitted"));
    executor_->respondWhenContains("Hostname Verification", FakeExecutor::ok("Current hostname: web01\n"));

    ToolResult result = tools_->setHostname({{"vmId", "web01"}, {"hostname", "api"}});
    EXPECT_FALSE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "⚠️ **Partial Success**"));
    EXPECT_TRUE(contains(result.firstText(), "Runtime Hostname Configuration"));
    EXPECT_TRUE(contains(result.firstText(), "Manual Recovery"));
}

// Test failure when both hostname update methods fail
TEST_F(GuestToolsTest, SetHostnameFailsWhenCoreMethodsFail) {
    executor_->respond("list", FakeExecutor::ok(kRunningList));
    executor_->respondWhenContains("hostnamectl set-hostname", FakeExecutor::fail("denied"));
    executor_->respondWhenContains("sudo tee /etc/hostname", FakeExecutor::fail("read-only"));
    executor_->respondWhenContains("Hostname Verification", FakeExecutor::ok("Current hostname: web01\n"));

    ToolResult result = tools_->setHostname({{"vmId", "web01"}, {"hostname", "api"}});
    EXPECT_TRUE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "❌ **Failed**"));
}

// Test that a stopped VM is refused before any exec
TEST_F(GuestToolsTest, SetHostnameRequiresRunningVm) {
    executor_->respond("list", FakeExecutor::ok(kRunningList));

    ToolResult result = tools_->setHostname({{"vmId", "idle"}, {"hostname", "api"}});
    EXPECT_TRUE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "Hostname Configuration Failed"));
    EXPECT_TRUE(contains(result.firstText(), "VM is not running"));
    EXPECT_TRUE(executor_->callsFor("exec").empty());
}

// Test hostname validation
TEST_F(GuestToolsTest, SetHostnameRejectsInvalidHostname) {
    ToolResult result = tools_->setHostname({{"vmId", "web01"}, {"hostname", "bad_host;reboot"}});
    EXPECT_TRUE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "hostname must follow RFC 1123"));
    EXPECT_TRUE(executor_->calls().empty());
}

// Test user creation and key installation with an explicit key
TEST_F(GuestToolsTest, ManageSshAuthInstallsKey) {
    const fs::path key = writeFile("id_test.pub", "ssh-ed25519 AAAAC3Nz user@host\n");
    executor_->respondWhenContains("authorized_keys", FakeExecutor::ok("10.211.55.7\n"));

    ToolResult result = tools_->manageSshAuth({{"vmId", "web01"}, {"username", "dev"},
                                               {"publicKeyPath", key.string()},
                                               {"enablePasswordlessSudo", true}});
    ASSERT_FALSE(result.isError) << result.firstText();
    EXPECT_TRUE(contains(result.firstText(), "ssh dev@10.211.55.7"));
    EXPECT_TRUE(contains(result.firstText(), "Passwordless sudo enabled for dev"));

    const auto execs = executor_->callsFor("exec");
    ASSERT_EQ(execs.size(), 1u);
    ASSERT_EQ(execs[0].size(), 3u);
    const std::string& script = execs[0][2];
    EXPECT_TRUE(contains(script, "echo 'ssh-ed25519 AAAAC3Nz user@host' | sudo tee -a /home/dev/.ssh/authorized_keys"));
    EXPECT_TRUE(contains(script, "NOPASSWD:ALL"));
    EXPECT_FALSE(contains(script, "#"));
}

// Test the connection hint when no guest IP is known
TEST_F(GuestToolsTest, ManageSshAuthFallsBackToPlaceholderIp) {
    const fs::path key = writeFile("id_test.pub", "ssh-rsa AAAAB3 me\n");

    ToolResult result = tools_->manageSshAuth({{"vmId", "web01"}, {"username", "dev"},
                                               {"publicKeyPath", key.string()}});
    ASSERT_FALSE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "ssh dev@VM_IP_ADDRESS"));
    EXPECT_FALSE(contains(executor_->calls()[0][2], "NOPASSWD"));
}

// Test a public key path that does not exist
TEST_F(GuestToolsTest, ManageSshAuthMissingKeyFile) {
    ToolResult result = tools_->manageSshAuth({{"vmId", "web01"}, {"username", "dev"},
                                               {"publicKeyPath", (tempDir_ / "absent.pub").string()}});
    EXPECT_TRUE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "Cannot read public key file"));
    EXPECT_TRUE(executor_->calls().empty());
}

// Test an empty public key file
TEST_F(GuestToolsTest, ManageSshAuthEmptyKeyFile) {
    const fs::path key = writeFile("empty.pub", "\n");
    ToolResult result = tools_->manageSshAuth({{"vmId", "web01"}, {"username", "dev"},
                                               {"publicKeyPath", key.string()}});
    EXPECT_TRUE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "is empty"));
}

// Test that no default key in ~/.ssh is reported as an error
TEST_F(GuestToolsTest, ManageSshAuthWithoutDefaultKey) {
    const char* previous = std::getenv("HOME");
    const std::string savedHome = previous ? previous : "";
    setenv("HOME", tempDir_.string().c_str(), 1);

    ToolResult result = tools_->manageSshAuth({{"vmId", "web01"}, {"username", "dev"}});

    if (previous) {
        setenv("HOME", savedHome.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
    EXPECT_TRUE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "No SSH public key found"));
}

// Test discovery of the default public key
TEST_F(GuestToolsTest, ManageSshAuthFindsDefaultKey) {
    fs::create_directories(tempDir_ / ".ssh");
    writeFile(".ssh/id_ed25519.pub", "ssh-ed25519 KEY home\n");
    const char* previous = std::getenv("HOME");
    const std::string savedHome = previous ? previous : "";
    setenv("HOME", tempDir_.string().c_str(), 1);

    const fs::path found = GuestTools::findDefaultPublicKey();

    if (previous) {
        setenv("HOME", savedHome.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
    EXPECT_EQ(found, tempDir_ / ".ssh" / "id_ed25519.pub");
}

// Test username validation
TEST_F(GuestToolsTest, ManageSshAuthRejectsBadUsername) {
    ToolResult result = tools_->manageSshAuth({{"vmId", "web01"}, {"username", "root; rm -rf /"}});
    EXPECT_TRUE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "username must match"));
}

// Test the terminal session instructions
TEST_F(GuestToolsTest, TerminalSessionInstructions) {
    ToolResult withUser = tools_->createTerminalSession({{"vmId", "web 01"}, {"user", "dev"}});
    ASSERT_FALSE(withUser.isError);
    EXPECT_TRUE(contains(withUser.firstText(), "prlctl enter web01 --user dev"));
    EXPECT_TRUE(contains(withUser.firstText(), "ssh dev@<vm-ip-address>"));

    ToolResult withoutUser = tools_->createTerminalSession({{"vmId", "web01"}});
    EXPECT_TRUE(contains(withoutUser.firstText(), "connect as the default user"));
    EXPECT_TRUE(executor_->calls().empty());
}

// Test a screenshot written to a caller-supplied path
TEST_F(GuestToolsTest, ScreenshotToExplicitPath) {
    const fs::path target = writeFile("shot.png", "png");
    ToolResult result = tools_->takeScreenshot({{"vmId", "web01"}, {"outputPath", target.string()}});
    ASSERT_FALSE(result.isError) << result.firstText();
    EXPECT_TRUE(contains(result.firstText(), "**Saved to**: " + target.string()));

    const auto calls = executor_->calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], (std::vector<std::string>{"capture", "web01", "--file", target.string()}));
}

// Test that a missing output file fails the screenshot
TEST_F(GuestToolsTest, ScreenshotFailsWhenFileMissing) {
    ToolResult result = tools_->takeScreenshot({{"vmId", "web01"},
                                                {"outputPath", (tempDir_ / "none.png").string()}});
    EXPECT_TRUE(result.isError);
    EXPECT_TRUE(contains(result.firstText(), "Screenshot file was not created successfully"));
}

// Test the default screenshot location
TEST_F(GuestToolsTest, ScreenshotDefaultPathUsesConfiguredDirectory) {
    tools_->takeScreenshot({{"vmId", "web;01"}});

    const auto calls = executor_->callsFor("capture");
    ASSERT_EQ(calls.size(), 1u);
    const fs::path target = calls[0][3];
    EXPECT_EQ(target.parent_path(), tempDir_ / "shots");
    EXPECT_EQ(target.filename().string().rfind("parallels-web01-", 0), 0u);
    EXPECT_EQ(target.extension(), ".png");
    EXPECT_TRUE(fs::is_directory(tempDir_ / "shots"));
}

// Test IPv4 extraction from free-form text
TEST(GuestToolsStaticTest, ExtractIpv4) {
    EXPECT_EQ(GuestTools::extractIpv4("addr 192.168.1.20\n"), "192.168.1.20");
    EXPECT_EQ(GuestTools::extractIpv4("no address"), "");
}
