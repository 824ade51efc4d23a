#include <gtest/gtest.h>
#include <security/security_gate.hpp>
#include "fakes.hpp"

class SecurityGateTest : public ::testing::Test {
protected:
    SecurityGate gate{permissive_security()};
};

TEST_F(SecurityGateTest, RiskNotAcceptedIsPermissionDenied) {
    SecurityGate locked{SecurityConfig{}};
    auto r = locked.check_risk_accepted();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::PermissionDenied);
    EXPECT_NE(r.error.find("I_ACCEPT_RISKS"), std::string::npos);
    EXPECT_TRUE(gate.check_risk_accepted().is_ok());
}

TEST_F(SecurityGateTest, NormalizesPaths) {
    EXPECT_EQ(gate.validate_path("/data//a.txt").value, "/data/a.txt");
    EXPECT_EQ(gate.validate_path("/data/./a.txt").value, "/data/a.txt");
    EXPECT_EQ(gate.validate_path("/data/dir/").value, "/data/dir");
    EXPECT_EQ(gate.validate_path("rel/file").value, "rel/file");
    EXPECT_EQ(gate.validate_path("/").value, "/");
    EXPECT_EQ(gate.validate_path("./").value, ".");
}

TEST_F(SecurityGateTest, RejectsTraversalSegments) {
    for (const char* p : {"../etc/passwd", "/data/../etc/shadow", "/data/..", "a/../../b", ".."}) {
        auto r = gate.validate_path(p);
        ASSERT_TRUE(r.is_err()) << p;
        EXPECT_EQ(r.kind, ErrorKind::PathValidation) << p;
    }
}

TEST_F(SecurityGateTest, DotsInsideNamesAreFine) {
    EXPECT_TRUE(gate.validate_path("/data/..hidden").is_ok());
    EXPECT_TRUE(gate.validate_path("/data/file..bak").is_ok());
}

TEST_F(SecurityGateTest, RejectsEmptyNulAndOverlong) {
    EXPECT_EQ(gate.validate_path("").kind, ErrorKind::PathValidation);
    EXPECT_EQ(gate.validate_path("   ").kind, ErrorKind::PathValidation);
    EXPECT_EQ(gate.validate_path(std::string("/a\0b", 4)).kind, ErrorKind::PathValidation);
    EXPECT_EQ(gate.validate_path("/" + std::string(5000, 'x')).kind, ErrorKind::PathValidation);
}

TEST_F(SecurityGateTest, PermissionsReadAsOctalDigits) {
    EXPECT_EQ(SecurityGate::validate_permissions(644).value, 0644u);
    EXPECT_EQ(SecurityGate::validate_permissions(755).value, 0755u);
    EXPECT_EQ(SecurityGate::validate_permissions(600).value, 0600u);
    EXPECT_EQ(SecurityGate::validate_permissions(0).value, 0u);
    EXPECT_EQ(SecurityGate::validate_permissions(7).value, 07u);
}

TEST_F(SecurityGateTest, PermissionsRejectNonOctal) {
    EXPECT_EQ(SecurityGate::validate_permissions(648).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(SecurityGate::validate_permissions(800).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(SecurityGate::validate_permissions(-1).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(SecurityGate::validate_permissions(1000).kind, ErrorKind::InvalidArgument);
}

TEST_F(SecurityGateTest, Commands) {
    EXPECT_TRUE(gate.validate_command("uptime").is_ok());
    EXPECT_EQ(gate.validate_command("  ").kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(gate.validate_command(std::string(10001, 'x')).kind, ErrorKind::InvalidArgument);
}

TEST_F(SecurityGateTest, Timeouts) {
    EXPECT_EQ(gate.validate_timeout(std::nullopt).value, 30);
    EXPECT_EQ(gate.validate_timeout(300).value, 300);
    EXPECT_EQ(gate.validate_timeout(0).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(gate.validate_timeout(301).kind, ErrorKind::InvalidArgument);
}

TEST_F(SecurityGateTest, FileSizeLimit) {
    EXPECT_TRUE(gate.check_file_size(DEFAULT_MAX_FILE_SIZE).is_ok());
    EXPECT_EQ(gate.check_file_size(DEFAULT_MAX_FILE_SIZE + 1).kind, ErrorKind::SizeLimitExceeded);
}

TEST_F(SecurityGateTest, ContainerIds) {
    EXPECT_TRUE(SecurityGate::validate_container_id(100).is_ok());
    EXPECT_TRUE(SecurityGate::validate_container_id(999999999).is_ok());
    EXPECT_EQ(SecurityGate::validate_container_id(99).kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(SecurityGate::validate_container_id(1000000000).kind, ErrorKind::InvalidArgument);
}
