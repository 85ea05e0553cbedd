/**
 * @file test_main.cpp
 * @brief Entry point of the MediaMerge unit tests
 *
 * Creates the QCoreApplication required by QSettings, translations and the
 * worker signals before running every registered test.
 */

#include <gtest/gtest.h>

#include <QCoreApplication>

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("MediaMergeTests"));
    QCoreApplication::setApplicationName(QStringLiteral("mediamerge_tests"));
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
