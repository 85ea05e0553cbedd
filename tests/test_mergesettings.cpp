/**
 * @file test_mergesettings.cpp
 * @brief Unit tests for persisted merge defaults
 */

#include <gtest/gtest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "MergeSettings.h"

class MergeSettingsTest : public ::testing::Test {
protected:
    QTemporaryDir dir;
    QString iniPath;

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        iniPath = dir.filePath(QStringLiteral("mediamerge.ini"));
    }
};

TEST_F(MergeSettingsTest, MissingFileGivesBuiltInDefaults) {
    const MergeOptions options = MergeSettings(iniPath).load();
    EXPECT_FALSE(options.dryRun);
    EXPECT_FALSE(options.resolveSourceDuplicates);
    EXPECT_TRUE(options.filenamePass);
    EXPECT_EQ(options.preferredSuffix, QStringLiteral("-edited"));
    EXPECT_EQ(options.workers, 0);
    EXPECT_EQ(options.collisionCeiling, 9999);
    EXPECT_EQ(options.removalMode, PlatformUtils::RemovalMode::MoveToTrash);
}

TEST_F(MergeSettingsTest, SavedValuesReload) {
    MergeOptions saved;
    saved.preferredSuffix = QStringLiteral("_final");
    saved.workers = 3;
    saved.collisionCeiling = 500;
    saved.filenamePass = false;
    saved.removalMode = PlatformUtils::RemovalMode::DeletePermanently;
    const MergeSettings settings(iniPath);
    settings.save(saved);

    const MergeOptions loaded = settings.load();
    EXPECT_EQ(loaded.preferredSuffix, QStringLiteral("_final"));
    EXPECT_EQ(loaded.workers, 3);
    EXPECT_EQ(loaded.collisionCeiling, 500);
    EXPECT_FALSE(loaded.filenamePass);
    EXPECT_EQ(loaded.removalMode, PlatformUtils::RemovalMode::DeletePermanently);
}

/**
 * @test InvalidNumbersFallBack
 * @brief Negative worker counts and non-positive ceilings are ignored.
 */
TEST_F(MergeSettingsTest, InvalidNumbersFallBack) {
    {
        QSettings raw(iniPath, QSettings::IniFormat);
        raw.setValue(QStringLiteral("merge/workers"), -4);
        raw.setValue(QStringLiteral("merge/collisionCeiling"), 0);
        raw.setValue(QStringLiteral("merge/removalMode"), QStringLiteral("shred"));
        raw.sync();
    }

    const MergeOptions options = MergeSettings(iniPath).load();
    EXPECT_EQ(options.workers, 0);
    EXPECT_EQ(options.collisionCeiling, 9999);
    EXPECT_EQ(options.removalMode, PlatformUtils::RemovalMode::MoveToTrash);
}
