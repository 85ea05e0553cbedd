/**
 * @file test_directorywalker.cpp
 * @brief Unit tests for the stack-based directory walker
 */

#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "DirectoryWalker.h"
#include "FingerprintCache.h"
#include "TestUtils.h"

class DirectoryWalkerTest : public ::testing::Test {
protected:
    QTemporaryDir dir;

    QString path(const QString &relative) const { return QDir::cleanPath(dir.filePath(relative)); }

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        TestUtils::writeOpaqueFile(path(QStringLiteral("b.jpg")), 4);
        TestUtils::writeOpaqueFile(path(QStringLiteral("a.jpg")), 4);
        TestUtils::writeOpaqueFile(path(QStringLiteral("2020/x.jpg")), 4);
        TestUtils::writeOpaqueFile(path(QStringLiteral("2020/deep/y.jpg")), 4);
        TestUtils::writeOpaqueFile(path(QStringLiteral("2021/z.jpg")), 4);
    }
};

/**
 * @test YieldsFilesBeforeSubfoldersInNameOrder
 * @brief Walk order is stable: a folder's files first, then its subfolders by name.
 */
TEST_F(DirectoryWalkerTest, YieldsFilesBeforeSubfoldersInNameOrder) {
    QStringList files;
    QString error;
    ASSERT_TRUE(DirectoryWalker::collectFiles(dir.path(), {}, &files, &error));

    const QStringList expected = {
        path(QStringLiteral("a.jpg")),
        path(QStringLiteral("b.jpg")),
        path(QStringLiteral("2020/x.jpg")),
        path(QStringLiteral("2020/deep/y.jpg")),
        path(QStringLiteral("2021/z.jpg")),
    };
    EXPECT_EQ(files, expected);
}

TEST_F(DirectoryWalkerTest, ResetRestartsTheWalk) {
    DirectoryWalker walker(dir.path());
    ASSERT_TRUE(walker.isValid());
    QStringList first;
    while (walker.hasNext()) {
        first.append(walker.next());
    }
    EXPECT_TRUE(walker.next().isEmpty());

    walker.reset();
    QStringList second;
    while (walker.hasNext()) {
        second.append(walker.next());
    }
    EXPECT_EQ(first.size(), 5);
    EXPECT_EQ(first, second);
}

TEST_F(DirectoryWalkerTest, SkipsSymlinksHiddenFilesAndExcludedNames) {
    ASSERT_TRUE(QFile::link(path(QStringLiteral("a.jpg")), path(QStringLiteral("link.jpg"))));
    TestUtils::writeOpaqueFile(path(QStringLiteral(".hidden.jpg")), 4);
    TestUtils::writeFile(path(QLatin1String(FingerprintCache::snapshotFileName)), QByteArrayLiteral("{}"));
    TestUtils::writeOpaqueFile(path(QStringLiteral("skip-me.jpg")), 4);

    QStringList files;
    ASSERT_TRUE(DirectoryWalker::collectFiles(dir.path(), {QStringLiteral("skip-me.jpg")}, &files, nullptr));
    EXPECT_EQ(files.size(), 5);
    EXPECT_FALSE(files.contains(path(QStringLiteral("link.jpg"))));
    EXPECT_FALSE(files.contains(path(QStringLiteral("skip-me.jpg"))));
}

TEST_F(DirectoryWalkerTest, UnreadableRootFails) {
    QStringList files;
    QString error;
    EXPECT_FALSE(DirectoryWalker::collectFiles(path(QStringLiteral("missing")), {}, &files, &error));
    EXPECT_FALSE(error.isEmpty());
}
