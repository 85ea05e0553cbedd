/**
 * @file test_mediafingerprint.cpp
 * @brief Unit tests for media classification and fingerprinting
 *
 * Covers image fingerprints built from capture metadata, the no-exif
 * sentinel, video fingerprints built from filename dates, and the
 * unfingerprintable outcomes.
 */

#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "ImageMetadataUtils.h"
#include "MediaFingerprint.h"
#include "MediaTypeUtils.h"
#include "TestUtils.h"

class MediaFingerprintTest : public ::testing::Test {
protected:
    QTemporaryDir dir;

    QString path(const QString &name) const { return dir.filePath(name); }

    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
    }
};

TEST(MediaTypeUtilsTest, ClassifiesByLowercaseExtension) {
    EXPECT_EQ(MediaTypeUtils::classify(QStringLiteral("a/IMG_0001.JPG")), MediaKind::Image);
    EXPECT_EQ(MediaTypeUtils::classify(QStringLiteral("shot.heic")), MediaKind::Image);
    EXPECT_EQ(MediaTypeUtils::classify(QStringLiteral("raw.NEF")), MediaKind::Image);
    EXPECT_EQ(MediaTypeUtils::classify(QStringLiteral("clip.MOV")), MediaKind::Video);
    EXPECT_EQ(MediaTypeUtils::classify(QStringLiteral("clip.m4v")), MediaKind::Video);
    EXPECT_EQ(MediaTypeUtils::classify(QStringLiteral("notes.txt")), MediaKind::Unrecognized);
    EXPECT_EQ(MediaTypeUtils::classify(QStringLiteral("no_extension")), MediaKind::Unrecognized);
    EXPECT_EQ(MediaTypeUtils::kindName(MediaKind::Video), QStringLiteral("video"));
}

TEST(MediaTypeUtilsTest, GifAndVideosUseFilenameDates) {
    EXPECT_TRUE(MediaTypeUtils::usesFilenameDate(QStringLiteral("anim.gif")));
    EXPECT_TRUE(MediaTypeUtils::usesFilenameDate(QStringLiteral("clip.mp4")));
    EXPECT_FALSE(MediaTypeUtils::usesFilenameDate(QStringLiteral("photo.jpg")));
}

/**
 * @test IdenticalImagesShareFingerprint
 * @brief Two copies of one photo under different names are the same content.
 */
TEST_F(MediaFingerprintTest, IdenticalImagesShareFingerprint) {
    const QString original = TestUtils::writeExifJpeg(path(QStringLiteral("IMG_0001.jpg")));
    ASSERT_FALSE(original.isEmpty());
    const QString copy = path(QStringLiteral("holiday.jpg"));
    ASSERT_TRUE(QFile::copy(original, copy));

    const FingerprintResult first = MediaFingerprint::compute(original);
    const FingerprintResult second = MediaFingerprint::compute(copy);
    ASSERT_TRUE(first.isValid());
    ASSERT_TRUE(second.isValid());
    EXPECT_EQ(first.kind, MediaKind::Image);
    EXPECT_EQ(first.fingerprint, second.fingerprint);
    EXPECT_TRUE(first.fingerprint.startsWith(QString::number(QFileInfo(original).size()) + QLatin1Char('-')));
    EXPECT_FALSE(first.fingerprint.endsWith(QLatin1String(MediaFingerprint::noExifSentinel)));
}

TEST_F(MediaFingerprintTest, DifferentCaptureMetadataChangesFingerprint) {
    TestUtils::ExifFields edited;
    edited.dateTimeOriginal = "2023:01:15 10:30:01";
    const QString first = TestUtils::writeExifJpeg(path(QStringLiteral("a.jpg")));
    const QString second = TestUtils::writeExifJpeg(path(QStringLiteral("b.jpg")), edited);
    ASSERT_FALSE(first.isEmpty());
    ASSERT_FALSE(second.isEmpty());

    EXPECT_NE(MediaFingerprint::compute(first).fingerprint, MediaFingerprint::compute(second).fingerprint);
}

TEST_F(MediaFingerprintTest, ReadsCaptureFieldsInFixedOrder) {
    const QString image = TestUtils::writeExifJpeg(path(QStringLiteral("a.jpg")));
    ASSERT_FALSE(image.isEmpty());

    const ImageMetadataUtils::CaptureMetadataResult metadata = ImageMetadataUtils::readCaptureMetadata(image);
    ASSERT_TRUE(metadata.valid);
    const QString text = ImageMetadataUtils::normalizedMetadata(metadata);
    EXPECT_TRUE(text.startsWith(QStringLiteral("Make=Canon\nModel=EOS 80D\nDateTimeOriginal=2023:01:15 10:30:00\n")));
}

/**
 * @test UnparsableImageUsesSentinel
 * @brief Metadata failures fold into the no-exif sentinel instead of an error.
 */
TEST_F(MediaFingerprintTest, UnparsableImageUsesSentinel) {
    const QString image = TestUtils::writeOpaqueFile(path(QStringLiteral("broken.jpg")), 128);
    ASSERT_FALSE(image.isEmpty());

    const FingerprintResult result = MediaFingerprint::compute(image);
    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.fingerprint, QStringLiteral("128-no-exif"));
}

TEST_F(MediaFingerprintTest, ZeroByteImageFingerprints) {
    const QString image = TestUtils::writeFile(path(QStringLiteral("empty.png")), QByteArray());
    ASSERT_FALSE(image.isEmpty());

    const FingerprintResult result = MediaFingerprint::compute(image);
    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.fingerprint, QStringLiteral("0-no-exif"));
}

TEST_F(MediaFingerprintTest, DifferentSizesNeverCollide) {
    const QString small = TestUtils::writeOpaqueFile(path(QStringLiteral("small.jpg")), 100);
    const QString large = TestUtils::writeOpaqueFile(path(QStringLiteral("large.jpg")), 101);

    EXPECT_NE(MediaFingerprint::compute(small).fingerprint, MediaFingerprint::compute(large).fingerprint);
}

TEST_F(MediaFingerprintTest, VideoUsesFilenameDate) {
    const QString video = TestUtils::writeOpaqueFile(path(QStringLiteral("VID_20230115_103000.mp4")), 64);

    const FingerprintResult result = MediaFingerprint::compute(video);
    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.kind, MediaKind::Video);
    EXPECT_EQ(result.fingerprint, QStringLiteral("64-video-2023-01-15"));
}

/**
 * @test OrganizedVideoNameFingerprints
 * @brief A video already renamed to "YYYY-MM-DD_NNN" keeps its identity.
 */
TEST_F(MediaFingerprintTest, OrganizedVideoNameFingerprints) {
    const QString video = TestUtils::writeOpaqueFile(path(QStringLiteral("2023-01-15_001.mp4")), 64);

    const FingerprintResult result = MediaFingerprint::compute(video);
    ASSERT_TRUE(result.isValid());
    EXPECT_EQ(result.fingerprint, QStringLiteral("64-video-2023-01-15"));
    EXPECT_EQ(result.fingerprint,
              MediaFingerprint::compute(TestUtils::writeOpaqueFile(path(QStringLiteral("VID_20230115.mp4")), 64)).fingerprint);
}

/**
 * @test VideoWithoutDateIsUnfingerprintable
 * @brief Dateless videos are excluded from deduplication.
 */
TEST_F(MediaFingerprintTest, VideoWithoutDateIsUnfingerprintable) {
    const QString video = TestUtils::writeOpaqueFile(path(QStringLiteral("clip.mp4")), 64);

    const FingerprintResult result = MediaFingerprint::compute(video);
    EXPECT_FALSE(result.isValid());
    EXPECT_EQ(result.kind, MediaKind::Video);
    EXPECT_FALSE(result.reason.isEmpty());
}

/**
 * @test VideosWithSameDateAndSizeCollide
 * @brief Videos are identified by size and filename date only.
 */
TEST_F(MediaFingerprintTest, VideosWithSameDateAndSizeCollide) {
    const QString first = TestUtils::writeOpaqueFile(path(QStringLiteral("20230115_a.mp4")), 64, 'a');
    const QString second = TestUtils::writeOpaqueFile(path(QStringLiteral("20230115_b.mp4")), 64, 'b');

    EXPECT_EQ(MediaFingerprint::compute(first).fingerprint, MediaFingerprint::compute(second).fingerprint);
}

TEST_F(MediaFingerprintTest, UnsupportedAndMissingFilesAreUnfingerprintable) {
    const QString text = TestUtils::writeOpaqueFile(path(QStringLiteral("notes.txt")), 10);

    EXPECT_FALSE(MediaFingerprint::compute(text).isValid());
    EXPECT_FALSE(MediaFingerprint::compute(path(QStringLiteral("missing.jpg"))).isValid());
    EXPECT_FALSE(MediaFingerprint::compute(dir.path()).isValid());
}
