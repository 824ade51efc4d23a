#include <gtest/gtest.h>
#include <algorithm>
#include <capability/capability_registry.hpp>
#include <capability/provider_table.hpp>

namespace {

ProviderDescriptor provider(const std::string& name, std::set<std::string> contributes,
                            std::set<std::string> suppresses = {}, bool on = true) {
    ProviderDescriptor p;
    p.name = name;
    p.enabled = [on] { return on; };
    p.contributes = std::move(contributes);
    p.suppresses = std::move(suppresses);
    return p;
}

} // namespace

TEST(CapabilityRegistry, CoreOnly) {
    auto r = CapabilityRegistry::compose({"a", "b"}, {});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(r.value.owner("a"), "core");
    EXPECT_EQ(r.value.owner("zzz"), "");
}

TEST(CapabilityRegistry, DisabledProviderContributesNothing) {
    auto r = CapabilityRegistry::compose({"a"}, {provider("p", {"x"}, {"a"}, false)});
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.contains("a"));
    EXPECT_FALSE(r.value.contains("x"));
}

TEST(CapabilityRegistry, SuppressionAppliesToEveryOwner) {
    auto r = CapabilityRegistry::compose(
        {"upload", "exec"},
        {provider("extra", {"extra_upload", "extra_tool"}),
         provider("blob", {"blob_upload"}, {"upload", "extra_upload"})});
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.names(),
              (std::vector<std::string>{"blob_upload", "exec", "extra_tool"}));
    EXPECT_EQ(r.value.owner("blob_upload"), "blob");
    EXPECT_EQ(r.value.owner("extra_tool"), "extra");
}

TEST(CapabilityRegistry, ResultIndependentOfProviderOrder) {
    std::vector<ProviderDescriptor> table = {
        provider("a", {"t1", "t2"}, {"core2"}),
        provider("b", {"t3"}, {"t2"}),
        provider("c", {"t4"}),
    };
    std::sort(table.begin(), table.end(),
              [](const ProviderDescriptor& x, const ProviderDescriptor& y) { return x.name < y.name; });

    std::vector<std::string> first;
    do {
        auto r = CapabilityRegistry::compose({"core1", "core2"}, table);
        ASSERT_TRUE(r.is_ok());
        if (first.empty()) first = r.value.names();
        EXPECT_EQ(r.value.names(), first);
    } while (std::next_permutation(table.begin(), table.end(),
             [](const ProviderDescriptor& x, const ProviderDescriptor& y) { return x.name < y.name; }));
    EXPECT_EQ(first, (std::vector<std::string>{"core1", "t1", "t3", "t4"}));
}

TEST(CapabilityRegistry, DuplicateClaimAborts) {
    auto r = CapabilityRegistry::compose({"exec"}, {provider("p", {"exec"})});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Configuration);
    EXPECT_NE(r.error.find("'exec'"), std::string::npos);

    auto between = CapabilityRegistry::compose({}, {provider("p", {"t"}), provider("q", {"t"})});
    ASSERT_TRUE(between.is_err());
    EXPECT_NE(between.error.find("p, q"), std::string::npos);
}

TEST(CapabilityRegistry, SuppressedDuplicateIsNotAConflict) {
    auto r = CapabilityRegistry::compose(
        {}, {provider("p", {"t"}), provider("q", {"t"}), provider("r", {"u"}, {"t"})});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.names(), (std::vector<std::string>{"u"}));
}

TEST(CapabilityRegistry, DuplicateProviderName) {
    auto r = CapabilityRegistry::compose({}, {provider("p", {"a"}), provider("p", {"b"})});
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.kind, ErrorKind::Configuration);
}

TEST(ProviderTable, NothingEnabled) {
    auto r = CapabilityRegistry::compose(core_tool_names(), build_provider_table(ProviderFlags{}));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 3u);
    EXPECT_TRUE(r.value.contains(tools::SSH_UPLOAD_FILE));
}

TEST(ProviderTable, ContainersOnly) {
    ProviderFlags flags;
    flags.containers = true;
    auto r = CapabilityRegistry::compose(core_tool_names(), build_provider_table(flags));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 10u);
    EXPECT_EQ(r.value.owner(tools::CONTAINER_UPLOAD), CONTAINERS_PROVIDER);
}

TEST(ProviderTable, BlobTransferReplacesDirectTransfers) {
    ProviderFlags flags;
    flags.containers = true;
    flags.blob_transfer = true;
    auto r = CapabilityRegistry::compose(core_tool_names(), build_provider_table(flags));
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.value.contains(tools::SSH_UPLOAD_FILE));
    EXPECT_FALSE(r.value.contains(tools::SSH_DOWNLOAD_FILE));
    EXPECT_FALSE(r.value.contains(tools::CONTAINER_UPLOAD));
    EXPECT_FALSE(r.value.contains(tools::CONTAINER_DOWNLOAD));
    EXPECT_TRUE(r.value.contains(tools::SSH_EXEC_COMMAND));
    EXPECT_TRUE(r.value.contains(tools::CONTAINER_EXEC));
    EXPECT_EQ(r.value.owner(tools::TRANSFER_CONFIRM_UPLOAD), BLOB_TRANSFER_PROVIDER);
    EXPECT_EQ(r.value.size(), 1u + 5u + 4u);
}
