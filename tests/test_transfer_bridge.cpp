#include <gtest/gtest.h>
#include <services/container_service.hpp>
#include <transfer/transfer_bridge.hpp>
#include "fakes.hpp"

using namespace std::chrono_literals;

class TransferBridgeTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeHost> host = std::make_shared<FakeHost>();
    SecurityGate gate{permissive_security()};
    SessionManager session{fake_factory(host), gate};
    FakeIntermediary blob;
    ManualClock clock;
    TransferConfig transfer_cfg;
    TransferBridge bridge{session, blob, gate, transfer_cfg, "rexec", nullptr, clock.fn()};

    std::string key_of_last_grant() const { return blob.granted.back(); }
};

TEST_F(TransferBridgeTest, UploadScenario) {
    auto ticket = bridge.request_upload("/data/a.txt", 644);
    ASSERT_TRUE(ticket.is_ok()) << ticket.error;
    EXPECT_FALSE(ticket.value.transfer_id.empty());
    EXPECT_EQ(ticket.value.expires_in, 3600);
    EXPECT_NE(ticket.value.upload_command.find("<YOUR_FILE_PATH>"), std::string::npos);
    EXPECT_FALSE(ticket.value.upload_target.empty());

    // Nothing pushed yet
    auto early = bridge.confirm_upload(ticket.value.transfer_id);
    ASSERT_TRUE(early.is_err());
    EXPECT_EQ(early.kind, ErrorKind::Intermediary);
    EXPECT_EQ(host->files.count("/data/a.txt"), 0u);

    std::string key = key_of_last_grant();
    blob.put(key, "hello world");

    auto done = bridge.confirm_upload(ticket.value.transfer_id);
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_TRUE(done.value.success);
    EXPECT_EQ(done.value.remote_path, "/data/a.txt");
    EXPECT_EQ(done.value.bytes_transferred, 11u);

    ASSERT_EQ(host->files.count("/data/a.txt"), 1u);
    EXPECT_EQ(host->files["/data/a.txt"].data, "hello world");
    EXPECT_EQ(host->files["/data/a.txt"].mode, 0644u);
    EXPECT_EQ(blob.objects.count(key), 0u);
    EXPECT_TRUE(bridge.active_transfers().empty());
}

TEST_F(TransferBridgeTest, DefaultModeWhenPermissionsOmitted) {
    auto ticket = bridge.request_upload("/data/b.bin");
    ASSERT_TRUE(ticket.is_ok());
    blob.put(key_of_last_grant(), "x");
    ASSERT_TRUE(bridge.confirm_upload(ticket.value.transfer_id).is_ok());
    EXPECT_EQ(host->files["/data/b.bin"].mode, 0644u);
}

TEST_F(TransferBridgeTest, SecondConfirmIsNotFound) {
    auto ticket = bridge.request_upload("/data/a.txt", 600);
    blob.put(key_of_last_grant(), "data");
    ASSERT_TRUE(bridge.confirm_upload(ticket.value.transfer_id).is_ok());

    auto again = bridge.confirm_upload(ticket.value.transfer_id);
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.kind, ErrorKind::TransferNotFound);
}

TEST_F(TransferBridgeTest, UnknownIdIsNotFound) {
    EXPECT_EQ(bridge.confirm_upload("no-such-id").kind, ErrorKind::TransferNotFound);
    EXPECT_EQ(bridge.confirm_download("no-such-id").kind, ErrorKind::TransferNotFound);
}

TEST_F(TransferBridgeTest, ExpiredBeforeConfirmEvenWithObjectPresent) {
    auto ticket = bridge.request_upload("/data/a.txt");
    std::string key = key_of_last_grant();
    blob.put(key, "late");

    clock.advance(3601s);
    auto r = bridge.confirm_upload(ticket.value.transfer_id);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::TransferNotFound);
    EXPECT_EQ(host->files.count("/data/a.txt"), 0u);
    EXPECT_EQ(blob.objects.count(key), 0u);
}

TEST_F(TransferBridgeTest, SweepEvictsExpiredRecordsOnAnyCall) {
    auto first = bridge.request_upload("/data/one");
    std::string key = key_of_last_grant();
    blob.put(key, "1");
    clock.advance(4000s);

    auto second = bridge.request_upload("/data/two");
    ASSERT_TRUE(second.is_ok());
    auto live = bridge.active_transfers();
    ASSERT_EQ(live.size(), 1u);
    EXPECT_EQ(live[0].remote_path, "/data/two");
    EXPECT_EQ(blob.objects.count(key), 0u);
}

TEST_F(TransferBridgeTest, SweepCleanupFailureDoesNotBlockCaller) {
    (void)bridge.request_upload("/data/one");
    blob.fail_remove = true;
    clock.advance(4000s);
    EXPECT_TRUE(bridge.request_upload("/data/two").is_ok());
}

TEST_F(TransferBridgeTest, TraversalRejectedWithAndWithoutOverwrite) {
    for (bool overwrite : {false, true}) {
        auto up = bridge.request_upload("/data/../etc/passwd", 644, overwrite);
        ASSERT_TRUE(up.is_err());
        EXPECT_EQ(up.kind, ErrorKind::PathValidation);
    }
    EXPECT_EQ(bridge.request_download("../secret").kind, ErrorKind::PathValidation);
    EXPECT_TRUE(blob.granted.empty());
    EXPECT_TRUE(bridge.active_transfers().empty());
}

TEST_F(TransferBridgeTest, ExistingFileNeedsOverwrite) {
    host->files["/data/a.txt"] = FakeFile{"old", 0600};

    auto refused = bridge.request_upload("/data/a.txt");
    ASSERT_TRUE(refused.is_err());
    EXPECT_EQ(refused.kind, ErrorKind::RemoteFileExists);
    EXPECT_TRUE(bridge.active_transfers().empty());

    auto ticket = bridge.request_upload("/data/a.txt", 640, true);
    ASSERT_TRUE(ticket.is_ok());
    blob.put(key_of_last_grant(), "new");
    ASSERT_TRUE(bridge.confirm_upload(ticket.value.transfer_id).is_ok());
    EXPECT_EQ(host->files["/data/a.txt"].data, "new");
    EXPECT_EQ(host->files["/data/a.txt"].mode, 0640u);
}

TEST_F(TransferBridgeTest, BadPermissionsRejected) {
    auto r = bridge.request_upload("/data/a.txt", 659);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

TEST_F(TransferBridgeTest, RiskGate) {
    SecurityGate locked{SecurityConfig{}};
    TransferBridge guarded{session, blob, locked, transfer_cfg, "rexec", nullptr, clock.fn()};
    EXPECT_EQ(guarded.request_upload("/data/a.txt").kind, ErrorKind::PermissionDenied);
    EXPECT_EQ(guarded.request_download("/data/a.txt").kind, ErrorKind::PermissionDenied);
}

TEST_F(TransferBridgeTest, FailedWriteMarksFailedAndLeavesNoFile) {
    auto ticket = bridge.request_upload("/data/a.txt");
    std::string key = key_of_last_grant();
    blob.put(key, "payload");
    host->fail_rename = true;

    auto r = bridge.confirm_upload(ticket.value.transfer_id);
    ASSERT_TRUE(r.is_err());
    EXPECT_TRUE(host->files.empty());
    EXPECT_EQ(blob.objects.count(key), 0u);
    EXPECT_EQ(bridge.confirm_upload(ticket.value.transfer_id).kind, ErrorKind::TransferNotFound);
}

TEST_F(TransferBridgeTest, OversizedObjectRejected) {
    SecurityConfig small = permissive_security();
    small.max_file_size = 4;
    SecurityGate tight{small};
    TransferBridge bounded{session, blob, tight, transfer_cfg, "rexec", nullptr, clock.fn()};

    auto ticket = bounded.request_upload("/data/a.txt");
    blob.put(key_of_last_grant(), "too many bytes");
    auto r = bounded.confirm_upload(ticket.value.transfer_id);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::SizeLimitExceeded);
    EXPECT_TRUE(host->files.empty());
}

TEST_F(TransferBridgeTest, ObjectDeleteFailureAfterConfirmIsLoggedOnly) {
    auto ticket = bridge.request_upload("/data/a.txt");
    blob.put(key_of_last_grant(), "ok");
    blob.fail_remove = true;
    auto r = bridge.confirm_upload(ticket.value.transfer_id);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(host->files["/data/a.txt"].data, "ok");
}

TEST_F(TransferBridgeTest, DownloadRoundTrip) {
    host->files["/var/log/app.log"] = FakeFile{"line1\nline2\n", 0644};

    auto ticket = bridge.request_download("/var/log/app.log");
    ASSERT_TRUE(ticket.is_ok()) << ticket.error;
    EXPECT_EQ(ticket.value.size, 12u);
    EXPECT_EQ(ticket.value.expires_in, 3600);
    EXPECT_FALSE(ticket.value.download_url.empty());
    EXPECT_NE(ticket.value.download_command.find("<YOUR_FILE_PATH>"), std::string::npos);
    ASSERT_EQ(blob.objects.size(), 1u);
    EXPECT_EQ(blob.objects.begin()->second, "line1\nline2\n");

    auto done = bridge.confirm_download(ticket.value.transfer_id);
    ASSERT_TRUE(done.is_ok());
    EXPECT_TRUE(done.value.success);
    EXPECT_EQ(done.value.remote_path, "/var/log/app.log");
    EXPECT_TRUE(blob.objects.empty());

    EXPECT_EQ(bridge.confirm_download(ticket.value.transfer_id).kind, ErrorKind::TransferNotFound);
}

TEST_F(TransferBridgeTest, DownloadConfirmSurvivesDeleteFailure) {
    host->files["/f"] = FakeFile{"x", 0644};
    auto ticket = bridge.request_download("/f");
    blob.fail_remove = true;
    EXPECT_TRUE(bridge.confirm_download(ticket.value.transfer_id).is_ok());
    EXPECT_TRUE(bridge.active_transfers().empty());
}

TEST_F(TransferBridgeTest, DownloadChecks) {
    EXPECT_EQ(bridge.request_download("/missing").kind, ErrorKind::RemoteIo);

    host->directories.insert("/var");
    EXPECT_EQ(bridge.request_download("/var").kind, ErrorKind::InvalidArgument);

    host->files["/big"] = FakeFile{std::string(DEFAULT_MAX_FILE_SIZE + 1, 'x'), 0644};
    EXPECT_EQ(bridge.request_download("/big").kind, ErrorKind::SizeLimitExceeded);
    EXPECT_TRUE(blob.objects.empty());
}

TEST_F(TransferBridgeTest, ConfirmOfWrongKindIsRejected) {
    host->files["/f"] = FakeFile{"x", 0644};
    auto down = bridge.request_download("/f");
    auto r = bridge.confirm_upload(down.value.transfer_id);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(bridge.confirm_download(down.value.transfer_id).is_ok());
}

TEST_F(TransferBridgeTest, CtidWithoutContainerSupport) {
    auto r = bridge.request_upload("/root/a", std::nullopt, false, 101);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::InvalidArgument);
}

TEST_F(TransferBridgeTest, UploadIntoContainerGoesThroughHostTemp) {
    ContainerService containers{session, gate};
    TransferBridge routed{session, blob, gate, transfer_cfg, "rexec", &containers, clock.fn()};
    host->on_exec = [](const std::string& cmd) {
        if (cmd.rfind("pct exec 101 -- test -e", 0) == 0) return reply_ok("", 1);
        return reply_ok("");
    };

    auto ticket = routed.request_upload("/root/app.conf", 600, false, 101);
    ASSERT_TRUE(ticket.is_ok()) << ticket.error;
    blob.put(key_of_last_grant(), "cfg");
    auto done = routed.confirm_upload(ticket.value.transfer_id);
    ASSERT_TRUE(done.is_ok()) << done.error;

    bool pushed = false;
    for (const auto& c : host->commands) {
        if (c.rfind("pct push 101 '/tmp/rexec-", 0) == 0 &&
            c.find("'/root/app.conf' --perms 0600") != std::string::npos) {
            pushed = true;
        }
    }
    EXPECT_TRUE(pushed);
    // Host staging file removed
    for (const auto& [path, file] : host->files) EXPECT_EQ(path.rfind("/tmp/rexec-", 0), std::string::npos);
}

TEST_F(TransferBridgeTest, ConcurrentConfirmsOnlyOneWins) {
    auto ticket = bridge.request_upload("/data/a.txt");
    blob.put(key_of_last_grant(), "once");

    std::vector<Result<UploadReceipt>> results(4);
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; i++) {
        threads.emplace_back([&, i] { results[i] = bridge.confirm_upload(ticket.value.transfer_id); });
    }
    for (auto& t : threads) t.join();

    int wins = 0;
    for (const auto& r : results) {
        if (r.is_ok()) wins++;
        else EXPECT_EQ(r.kind, ErrorKind::TransferNotFound);
    }
    EXPECT_EQ(wins, 1);
}
