#include "test_support.hpp"
#include "backup/local_provider.hpp"
#include "backup/provider_factory.hpp"
#include "common/file_hash.hpp"
#include "common/settings.hpp"
#include <cstdlib>

using namespace testing_support;
namespace fs = std::filesystem;

class LocalTransferProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        archive_ = temp_ / "Photos.zip";
        writeFile(archive_, "zip bytes");
    }

    TempDir temp_;
    fs::path archive_;
    LocalTransferProvider provider_;
};

TEST_F(LocalTransferProviderTest, UploadCopiesWithoutClobbering) {
    const std::string folder = (temp_ / "mirror").string();

    auto first = provider_.upload(archive_.string(), folder);
    auto second = provider_.upload(archive_.string(), folder);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, (fs::path(folder) / "Photos.zip").string());
    EXPECT_EQ(*second, (fs::path(folder) / "Photos_1.zip").string());
    EXPECT_EQ(readFile(*second), "zip bytes");
    EXPECT_TRUE(provider_.getFreeSpace().has_value());
}

TEST_F(LocalTransferProviderTest, RoundTripThroughTheMirror) {
    auto remoteId = provider_.upload(archive_.string(), (temp_ / "mirror").string());
    ASSERT_TRUE(remoteId.has_value());

    auto hash = provider_.getRemoteHash(*remoteId);
    ASSERT_TRUE(hash.has_value());
    EXPECT_EQ(hash->algorithm, "sha256");
    EXPECT_EQ(hash->value, calculateFileDigest(archive_.string(), "sha256"));

    const fs::path copy = temp_ / "back" / "Photos.zip";
    ASSERT_TRUE(provider_.download(*remoteId, copy.string()));
    EXPECT_EQ(readFile(copy), "zip bytes");

    EXPECT_TRUE(provider_.deleteRemote(*remoteId));
    EXPECT_FALSE(provider_.deleteRemote(*remoteId));
    EXPECT_FALSE(provider_.download(*remoteId, copy.string()));
    EXPECT_FALSE(provider_.getLastError().empty());
}

TEST(ProviderTagTest, TagsRoundTrip) {
    EXPECT_EQ(providerTag(ProviderKind::GoogleDrive), "gdrive");
    EXPECT_EQ(parseProviderTag("OneDrive"), ProviderKind::OneDrive);
    EXPECT_EQ(parseProviderTag(""), ProviderKind::Local);
    EXPECT_FALSE(parseProviderTag("dropbox").has_value());
    EXPECT_FALSE(isCloudProvider(ProviderKind::Local));
    EXPECT_TRUE(isCloudProvider(ProviderKind::GoogleDrive));
}

TEST(ProviderFactoryTest, BuildsTheProviderForEachKind) {
    unsetenv("ZIPVAULT_GDRIVE_TOKEN");
    unsetenv("ZIPVAULT_ONEDRIVE_TOKEN");
    Settings settings;

    for (ProviderKind kind : {ProviderKind::Local, ProviderKind::GoogleDrive, ProviderKind::OneDrive}) {
        auto provider = createTransferProvider(kind, settings);
        ASSERT_NE(provider, nullptr);
        EXPECT_EQ(provider->getKind(), kind);
    }

    // Without a token the cloud providers refuse before any request is made.
    auto drive = createTransferProvider(ProviderKind::GoogleDrive, settings);
    EXPECT_FALSE(drive->authenticate());
    EXPECT_FALSE(drive->isAuthenticated());
    EXPECT_NE(drive->getLastError().find("token"), std::string::npos);
    EXPECT_FALSE(drive->upload("/nonexistent", "Backups").has_value());
}

TEST(ProviderFactoryTest, EnvironmentTokenWinsOverSettings) {
    Settings settings;
    settings.set(settings_keys::kOneDriveToken, "from-settings");

    unsetenv("ZIPVAULT_ONEDRIVE_TOKEN");
    EXPECT_EQ(resolveAccessToken(ProviderKind::OneDrive, settings), "from-settings");

    setenv("ZIPVAULT_ONEDRIVE_TOKEN", "from-env", 1);
    EXPECT_EQ(resolveAccessToken(ProviderKind::OneDrive, settings), "from-env");
    unsetenv("ZIPVAULT_ONEDRIVE_TOKEN");

    EXPECT_EQ(resolveAccessToken(ProviderKind::Local, settings), "");
}
