#include "test_support.hpp"
#include "backup/station_checker.hpp"
#include "backup/zip_archiver.hpp"

using namespace testing_support;
namespace fs = std::filesystem;

TEST(PackingCheckTest, ArchivesAndCleansUp) {
    TempDir temp;
    ZipArchiver archiver;

    EXPECT_TRUE(station_checker::checkPacking(archiver, temp.str()));
    EXPECT_FALSE(fs::exists(temp / "packing_test_file.txt"));
    EXPECT_FALSE(fs::exists(temp / "packing_test_file.txt.zip"));
}

class ShippingCheckTest : public OrchestrationTest {};

TEST_F(ShippingCheckTest, NothingToCheckWithoutCloudDestinations) {
    addDestination("nas", ProviderKind::Local, (temp_ / "nas").string());
    EXPECT_TRUE(station_checker::checkShipping(*context_, (temp_ / "scratch").string()));
    EXPECT_EQ(cloud_->uploads, 0);
}

TEST_F(ShippingCheckTest, UploadsAndDeletesOnEveryCloudDestination) {
    addDestination("drive", ProviderKind::GoogleDrive, "Backups");
    addDestination("onedrive", ProviderKind::OneDrive, "Archive/Vault");

    EXPECT_TRUE(station_checker::checkShipping(*context_, (temp_ / "scratch").string()));
    EXPECT_EQ(cloud_->uploads, 2);
    EXPECT_EQ(cloud_->deleted.size(), 2u);
    EXPECT_TRUE(cloud_->files.empty());
    EXPECT_FALSE(fs::exists(temp_ / "scratch" / "shipping_test_file.txt"));
}

TEST_F(ShippingCheckTest, FailedRemoteDeleteIsTolerated) {
    cloud_->failDelete = true;
    addDestination("drive", ProviderKind::GoogleDrive, "Backups");
    EXPECT_TRUE(station_checker::checkShipping(*context_, (temp_ / "scratch").string()));
}

TEST_F(ShippingCheckTest, FailedUploadFailsTheCheck) {
    cloud_->failUpload = true;
    addDestination("drive", ProviderKind::GoogleDrive, "Backups");
    EXPECT_FALSE(station_checker::checkShipping(*context_, (temp_ / "scratch").string()));
    EXPECT_FALSE(fs::exists(temp_ / "scratch" / "shipping_test_file.txt"));
}
