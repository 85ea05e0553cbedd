/**
 * @file test_organize.cpp
 * @brief Tests of the dated folder layout and the file moves behind it
 *
 * Covers moving files between folders, empty folder cleanup and the
 * organize run: dated names, numbering, sidecar removal, dry runs and the
 * cache following relocated files.
 */

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "FileOperationUtils.h"
#include "FingerprintCache.h"
#include "MergeEngine.h"
#include "TestUtils.h"

class FileOperationUtilsTest : public ::testing::Test {
protected:
    QTemporaryDir dir;

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
    }
};

TEST_F(FileOperationUtilsTest, MoveCreatesFoldersAndKeepsTime) {
    const QString source = TestUtils::writeOpaqueFile(dir.filePath(QStringLiteral("inbox/a.jpg")), 32);
    const QDateTime modified(QDate(2018, 6, 1), QTime(9, 0, 0));
    ASSERT_TRUE(TestUtils::setModificationTime(source, modified));
    const QString target = dir.filePath(QStringLiteral("2018/06/2018-06-01_001.jpg"));

    QString error;
    ASSERT_TRUE(FileOperationUtils::moveFile(source, target, &error)) << error.toStdString();
    EXPECT_FALSE(QFile::exists(source));
    EXPECT_EQ(QFileInfo(target).size(), 32);
    EXPECT_EQ(TestUtils::modificationMillis(target), modified.toMSecsSinceEpoch());
}

TEST_F(FileOperationUtilsTest, MoveRefusesExistingTarget) {
    const QString source = TestUtils::writeOpaqueFile(dir.filePath(QStringLiteral("a.jpg")), 10, 'a');
    const QString target = TestUtils::writeOpaqueFile(dir.filePath(QStringLiteral("b.jpg")), 20, 'b');

    QString error;
    EXPECT_FALSE(FileOperationUtils::moveFile(source, target, &error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_TRUE(QFile::exists(source));
    EXPECT_EQ(QFileInfo(target).size(), 20);
}

/**
 * @test RemovesNestedEmptyFoldersOnly
 * @brief A chain of empty folders goes, folders holding anything stay.
 */
TEST_F(FileOperationUtilsTest, RemovesNestedEmptyFoldersOnly) {
    ASSERT_TRUE(QDir().mkpath(dir.filePath(QStringLiteral("a/b/c"))));
    TestUtils::writeOpaqueFile(dir.filePath(QStringLiteral("kept/photo.jpg")), 8);
    TestUtils::writeOpaqueFile(dir.filePath(QStringLiteral("private/.hidden")), 8);

    const QStringList removed = FileOperationUtils::removeEmptyFolders(dir.path(), false);
    EXPECT_EQ(removed.size(), 3);
    EXPECT_FALSE(QFileInfo::exists(dir.filePath(QStringLiteral("a"))));
    EXPECT_TRUE(QFileInfo::exists(dir.filePath(QStringLiteral("kept"))));
    EXPECT_TRUE(QFileInfo::exists(dir.filePath(QStringLiteral("private"))));
    EXPECT_TRUE(QFileInfo::exists(dir.path()));
}

TEST_F(FileOperationUtilsTest, DryRunListsWithoutRemoving) {
    ASSERT_TRUE(QDir().mkpath(dir.filePath(QStringLiteral("empty"))));

    const QStringList removed = FileOperationUtils::removeEmptyFolders(dir.path(), true);
    EXPECT_EQ(removed.size(), 1);
    EXPECT_TRUE(QFileInfo::exists(dir.filePath(QStringLiteral("empty"))));
}

class OrganizeTest : public ::testing::Test {
protected:
    QTemporaryDir dir;
    MergeOptions options;

    QString path(const QString &relative) const { return dir.filePath(relative); }

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        options.workers = 2;
        options.removalMode = PlatformUtils::RemovalMode::DeletePermanently;
    }
};

TEST_F(OrganizeTest, PhotoIsFiledByCaptureDate) {
    const QString photo = TestUtils::writeExifJpeg(path(QStringLiteral("inbox/IMG_0001.jpg")));
    ASSERT_FALSE(photo.isEmpty());

    MergeEngine engine(options);
    const MergeReport report = engine.organize(dir.path());
    ASSERT_TRUE(report.ok) << report.error.toStdString();
    EXPECT_EQ(report.organized, 1);
    EXPECT_FALSE(QFile::exists(photo));
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("2023/01/2023-01-15_001.jpg"))));
    EXPECT_EQ(report.emptyFoldersRemoved, 1);
    EXPECT_FALSE(QFileInfo::exists(path(QStringLiteral("inbox"))));
}

TEST_F(OrganizeTest, SameDayFilesAreNumbered) {
    TestUtils::writeOpaqueFile(path(QStringLiteral("VID_20190704_a.mp4")), 10, 'a');
    TestUtils::writeOpaqueFile(path(QStringLiteral("party/VID_20190704_b.mp4")), 11, 'b');

    MergeEngine engine(options);
    const MergeReport report = engine.organize(dir.path());
    ASSERT_TRUE(report.ok);
    EXPECT_EQ(report.organized, 2);
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("2019/07/2019-07-04_001.mp4"))));
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("2019/07/2019-07-04_002.mp4"))));
}

/**
 * @test ExistingDatedNameIsNotOverwritten
 * @brief A file already filed under its day keeps _001; the newcomer takes _002.
 */
TEST_F(OrganizeTest, ExistingDatedNameIsNotOverwritten) {
    const QString filed = TestUtils::writeOpaqueFile(path(QStringLiteral("2019/07/2019-07-04_001.mp4")), 10, 'a');
    TestUtils::writeOpaqueFile(path(QStringLiteral("VID_20190704.mp4")), 12, 'b');

    MergeEngine engine(options);
    const MergeReport report = engine.organize(dir.path());
    ASSERT_TRUE(report.ok);
    EXPECT_EQ(report.alreadyOrganized, 1);
    EXPECT_EQ(report.organized, 1);
    EXPECT_EQ(QFileInfo(filed).size(), 10);
    EXPECT_EQ(QFileInfo(path(QStringLiteral("2019/07/2019-07-04_002.mp4"))).size(), 12);
}

TEST_F(OrganizeTest, SecondRunMovesNothing) {
    TestUtils::writeOpaqueFile(path(QStringLiteral("a/VID_20200101.mp4")), 10, 'a');
    TestUtils::writeOpaqueFile(path(QStringLiteral("b/VID_20200101.mp4")), 11, 'b');

    MergeEngine engine(options);
    ASSERT_EQ(engine.organize(dir.path()).organized, 2);

    const MergeReport second = engine.organize(dir.path());
    ASSERT_TRUE(second.ok);
    EXPECT_EQ(second.organized, 0);
    EXPECT_EQ(second.alreadyOrganized, 2);
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("2020/01/2020-01-01_001.mp4"))));
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("2020/01/2020-01-01_002.mp4"))));
}

TEST_F(OrganizeTest, FallsBackToModificationTime) {
    const QString scan = TestUtils::writeOpaqueFile(path(QStringLiteral("scan.png")), 16);
    ASSERT_TRUE(TestUtils::setModificationTime(scan, QDateTime(QDate(2015, 3, 2), QTime(8, 0, 0))));

    MergeEngine engine(options);
    const MergeReport report = engine.organize(dir.path());
    ASSERT_TRUE(report.ok);
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("2015/03/2015-03-02_001.png"))));
}

/**
 * @test SidecarsGoAndUnknownFilesStay
 * @brief JSON sidecars are removed, files of unknown kind are left where they are.
 */
TEST_F(OrganizeTest, SidecarsGoAndUnknownFilesStay) {
    const QString sidecar = TestUtils::writeFile(path(QStringLiteral("takeout/clip.mp4.JSON")), "{}");
    TestUtils::writeOpaqueFile(path(QStringLiteral("takeout/clip_20200101.mp4")), 10);
    const QString notes = TestUtils::writeFile(path(QStringLiteral("notes/readme.txt")), "notes");

    MergeEngine engine(options);
    const MergeReport report = engine.organize(dir.path());
    ASSERT_TRUE(report.ok);
    EXPECT_EQ(report.sidecarsRemoved, 1);
    EXPECT_FALSE(QFile::exists(sidecar));
    EXPECT_TRUE(QFile::exists(notes));
    EXPECT_TRUE(QFile::exists(path(QStringLiteral("2020/01/2020-01-01_001.mp4"))));
    EXPECT_FALSE(QFileInfo::exists(path(QStringLiteral("takeout"))));
    EXPECT_EQ(report.errors, 0);
}

TEST_F(OrganizeTest, DryRunChangesNothing) {
    const QString video = TestUtils::writeOpaqueFile(path(QStringLiteral("in/VID_20200101.mp4")), 10);
    const QString sidecar = TestUtils::writeFile(path(QStringLiteral("in/VID_20200101.mp4.json")), "{}");
    options.dryRun = true;

    MergeEngine engine(options);
    const MergeReport report = engine.organize(dir.path());
    ASSERT_TRUE(report.ok);
    EXPECT_EQ(report.organized, 1);
    ASSERT_EQ(report.relocations.size(), 1);
    EXPECT_EQ(report.relocations.at(0).targetPath, QDir::cleanPath(path(QStringLiteral("2020/01/2020-01-01_001.mp4"))));
    EXPECT_EQ(report.sidecarsRemoved, 1);
    EXPECT_TRUE(QFile::exists(video));
    EXPECT_TRUE(QFile::exists(sidecar));
    EXPECT_FALSE(QFileInfo::exists(path(QStringLiteral("2020"))));
}

/**
 * @test CacheFollowsRelocatedFiles
 * @brief Cached fingerprints move with their files and stay reusable.
 */
TEST_F(OrganizeTest, CacheFollowsRelocatedFiles) {
    TestUtils::writeOpaqueFile(path(QStringLiteral("VID_20190704.mp4")), 10);
    MergeEngine engine(options);
    ASSERT_TRUE(engine.deduplicate(dir.path()).cacheSaved);

    const MergeReport report = engine.organize(dir.path());
    ASSERT_TRUE(report.ok);
    EXPECT_TRUE(report.cacheSaved);

    FingerprintCache cache(dir.path());
    ASSERT_TRUE(cache.load());
    EXPECT_FALSE(cache.entries().contains(QStringLiteral("VID_20190704.mp4")));
    ASSERT_TRUE(cache.entries().contains(QStringLiteral("2019/07/2019-07-04_001.mp4")));
    EXPECT_EQ(cache.entries().value(QStringLiteral("2019/07/2019-07-04_001.mp4")).fingerprint,
              QStringLiteral("10-video-2019-07-04"));

    const MergeReport rerun = engine.deduplicate(dir.path());
    EXPECT_EQ(rerun.reusedFromCache, 1);
    EXPECT_EQ(rerun.rehashed, 0);
}

TEST_F(OrganizeTest, MissingRootFails) {
    MergeEngine engine(options);
    const MergeReport report = engine.organize(path(QStringLiteral("missing")));
    EXPECT_FALSE(report.ok);
    EXPECT_FALSE(report.error.isEmpty());
}
