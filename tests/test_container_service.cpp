#include <gtest/gtest.h>
#include <services/container_service.hpp>
#include "fakes.hpp"

TEST(ContainerParse, ListSkipsHeaderAndTakesLastColumnAsName) {
    std::string out =
        "VMID       Status     Lock         Name\n"
        "100        running                 web\n"
        "101        stopped    backup       db-primary\n"
        "\n";
    auto list = ContainerService::parse_list(out);
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].ctid, 100);
    EXPECT_EQ(list[0].status, "running");
    EXPECT_EQ(list[0].name, "web");
    EXPECT_EQ(list[1].ctid, 101);
    EXPECT_EQ(list[1].status, "stopped");
    EXPECT_EQ(list[1].name, "db-primary");
}

TEST(ContainerParse, ListIgnoresGarbageRows) {
    auto list = ContainerService::parse_list("VMID Status Name\nnot-a-number running x\n102\n");
    EXPECT_TRUE(list.empty());
}

TEST(ContainerParse, Status) {
    EXPECT_EQ(ContainerService::parse_status("status: running\n"), "running");
    EXPECT_EQ(ContainerService::parse_status("status: stopped\n"), "stopped");
    EXPECT_EQ(ContainerService::parse_status("weird\n"), "unknown");
}

TEST(ContainerParse, ExecCommandQuotesPayload) {
    EXPECT_EQ(ContainerService::exec_command(105, "echo it's"),
              "pct exec 105 -- bash -c 'echo it'\\''s'");
}

class ContainerServiceTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    SecurityGate gate{permissive_security()};
    SessionManager session{fake_factory(host), gate};
    ContainerService containers{session, gate};
};

TEST_F(ContainerServiceTest, ExecRunsThroughPct) {
    host->on_exec = [](const std::string&) { return reply_ok("hi\n"); };
    auto r = containers.exec(101, "echo hi", std::nullopt);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.stdout_data, "hi\n");
    ASSERT_EQ(host->commands.size(), 1u);
    EXPECT_EQ(host->commands[0], "pct exec 101 -- bash -c 'echo hi'");
}

TEST_F(ContainerServiceTest, ExecOnMissingContainer) {
    host->on_exec = [](const std::string&) {
        return reply_err("Configuration file 'nodes/pve/lxc/999.conf' does not exist", 255);
    };
    auto r = containers.exec(999, "true", std::nullopt);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::RemoteIo);
    EXPECT_NE(r.error.find("Container 999 not found"), std::string::npos);
}

TEST_F(ContainerServiceTest, ExecNonZeroExitIsNotAnError) {
    host->on_exec = [](const std::string&) { return reply_err("grep: no match", 1); };
    auto r = containers.exec(101, "grep x /etc/hosts", std::nullopt);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(*r.value.exit_code, 1);
}

TEST_F(ContainerServiceTest, ContainerIdBounds) {
    EXPECT_EQ(containers.exec(99, "true", std::nullopt).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(containers.status(0).kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(host->commands.empty());
}

TEST_F(ContainerServiceTest, ListAndStatus) {
    host->on_exec = [](const std::string& cmd) {
        if (cmd == "pct list") return reply_ok("VMID Status Lock Name\n100 running  web\n");
        if (cmd == "pct status 100") return reply_ok("status: running\n");
        return reply_err("unexpected", 2);
    };
    auto list = containers.list();
    ASSERT_TRUE(list.is_ok());
    ASSERT_EQ(list.value.size(), 1u);
    EXPECT_EQ(list.value[0].name, "web");

    auto st = containers.status(100);
    ASSERT_TRUE(st.is_ok());
    EXPECT_EQ(st.value, "running");
}

TEST_F(ContainerServiceTest, StartFailureCarriesStderr) {
    host->on_exec = [](const std::string&) { return reply_err("CT 100 already running", 255); };
    auto r = containers.start(100);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::RemoteIo);
    EXPECT_NE(r.error.find("already running"), std::string::npos);
}

TEST_F(ContainerServiceTest, FileExistsMapsExitCodes) {
    int code = 0;
    host->on_exec = [&code](const std::string&) { return reply_ok("", code); };
    EXPECT_TRUE(containers.file_exists(100, "/etc/hosts").value);
    code = 1;
    auto missing = containers.file_exists(100, "/nope");
    ASSERT_TRUE(missing.is_ok());
    EXPECT_FALSE(missing.value);
    code = 255;
    EXPECT_TRUE(containers.file_exists(100, "/x").is_err());
}

TEST_F(ContainerServiceTest, PullStagesThroughHostTemp) {
    host->on_exec = [this](const std::string& cmd) {
        // pct pull <ctid> '<src>' '<tmp>'
        auto last_quote = cmd.rfind('\'');
        auto open = cmd.rfind('\'', last_quote - 1);
        std::string tmp = cmd.substr(open + 1, last_quote - open - 1);
        host->files[tmp] = FakeFile{"container bytes", 0600};
        return reply_ok("");
    };
    auto r = containers.pull_file(100, "/etc/motd", 1024);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, "container bytes");
    EXPECT_TRUE(host->files.empty());
    EXPECT_EQ(host->commands[0].rfind("pct pull 100 '/etc/motd' '/tmp/rexec-", 0), 0u);
}

TEST_F(ContainerServiceTest, PushCleansUpOnFailure) {
    host->on_exec = [](const std::string&) { return reply_err("push failed", 2); };
    auto r = containers.push_file(100, "/root/f", "data", 0640);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::RemoteIo);
    EXPECT_TRUE(host->files.empty());
}

TEST_F(ContainerServiceTest, WrappedCommandLengthReportedAgainstCallerInput) {
    SecurityConfig tight = permissive_security();
    tight.max_command_length = 40;
    SecurityGate small_gate{tight};
    ContainerService bounded{session, small_gate};

    std::string command(30, 'x');
    auto r = bounded.exec(101, command, std::nullopt);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
    EXPECT_NE(r.error.find("30 characters"), std::string::npos) << r.error;
    EXPECT_NE(r.error.find("container 101"), std::string::npos) << r.error;
    EXPECT_TRUE(host->commands.empty());

    EXPECT_TRUE(bounded.exec(101, "true", std::nullopt).is_ok());
}
