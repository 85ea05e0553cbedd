
/************************************************************************\

    MediaMerge - Photo and video collection merger
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/


#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "Logging.h"
#include "MergeEngine.h"
#include "MergeSettings.h"

namespace {

constexpr char mergeCommand[] = "merge";
constexpr char dedupCommand[] = "dedup";
constexpr char organizeCommand[] = "organize";
constexpr char clearCacheCommand[] = "clear-cache";

struct ExitCodes {
    static constexpr int success = 0;
    static constexpr int failure = 1;
    static constexpr int usage = 2;
};

QString actionLabel(const MergeAction &action)
{
    switch (action.kind) {
    case MergeAction::Kind::Copy:
        return QStringLiteral("copy");
    case MergeAction::Kind::CopyRenamed:
        return QStringLiteral("rename");
    case MergeAction::Kind::Failed:
        return QStringLiteral("error");
    case MergeAction::Kind::Skip:
        break;
    }
    return action.reason == MergeAction::SkipReason::Duplicate
        ? QStringLiteral("duplicate")
        : QStringLiteral("skip");
}

void printReport(QTextStream &out, const MergeReport &report, bool dryRun, bool listActions)
{
    if (listActions) {
        for (const MergeAction &action : report.actions) {
            if (action.kind == MergeAction::Kind::Skip) {
                continue;
            }
            out << actionLabel(action) << ": " << action.sourcePath;
            if (action.isCopy()) {
                out << " -> " << action.destinationPath();
            } else if (!action.error.isEmpty()) {
                out << " (" << action.error << ")";
            }
            out << '\n';
        }
        for (const RelocatedFile &relocation : report.relocations) {
            out << "move: " << relocation.sourcePath << " -> " << relocation.targetPath << '\n';
        }
        for (const QString &path : report.removedPaths) {
            out << "remove: " << path << '\n';
        }
    }

    if (dryRun) {
        out << QCoreApplication::translate("main", "Dry run, nothing was changed.") << '\n';
    }
    if (report.sourceFiles > 0) {
        out << QCoreApplication::translate("main", "Source files: %1").arg(report.sourceFiles) << '\n';
    }
    out << QCoreApplication::translate("main", "Target files: %1").arg(report.targetFiles) << '\n';
    if (report.fingerprinted > 0 || report.unfingerprintable > 0) {
        out << QCoreApplication::translate("main", "Fingerprinted: %1 (%2 from cache, %3 hashed), %4 unfingerprintable")
                   .arg(report.fingerprinted)
                   .arg(report.reusedFromCache)
                   .arg(report.rehashed)
                   .arg(report.unfingerprintable)
            << '\n';
    }
    if (report.organized > 0 || report.alreadyOrganized > 0 || report.sidecarsRemoved > 0
        || report.emptyFoldersRemoved > 0) {
        out << QCoreApplication::translate("main", "Moved: %1, already in place: %2, sidecars removed: %3, empty folders removed: %4")
                   .arg(report.organized)
                   .arg(report.alreadyOrganized)
                   .arg(report.sidecarsRemoved)
                   .arg(report.emptyFoldersRemoved)
            << '\n';
    }
    if (!report.actions.isEmpty()) {
        out << QCoreApplication::translate("main", "Copied: %1, renamed: %2, duplicates skipped: %3, unfingerprintable skipped: %4")
                   .arg(report.copied)
                   .arg(report.renamed)
                   .arg(report.skippedDuplicates)
                   .arg(report.skippedUnfingerprintable)
            << '\n';
    }
    if (report.duplicateGroups > 0 || report.duplicatesRemoved > 0) {
        out << QCoreApplication::translate("main", "Duplicate groups: %1, removed: %2")
                   .arg(report.duplicateGroups)
                   .arg(report.duplicatesRemoved)
            << '\n';
    }
    out << QCoreApplication::translate("main", "Errors: %1").arg(report.errors) << '\n';
    out.flush();
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("mediamerge"));
    QCoreApplication::setOrganizationName(QStringLiteral("MediaMerge"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate("main", "Merges photo and video collections without duplicating content."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
                                 QCoreApplication::translate("main", "merge <source> <target> | dedup <folder> | organize <folder> | clear-cache <target>"));

    const QCommandLineOption dryRunOption(QStringList{QStringLiteral("n"), QStringLiteral("dry-run")},
                                          QCoreApplication::translate("main", "Plan only, change nothing on disk."));
    const QCommandLineOption verboseOption(QStringList{QStringLiteral("v"), QStringLiteral("verbose")},
                                           QCoreApplication::translate("main", "Print debug logs and every planned action."));
    const QCommandLineOption suffixOption(QStringLiteral("suffix"),
                                          QCoreApplication::translate("main", "Preferred suffix for edited copies."),
                                          QStringLiteral("suffix"));
    const QCommandLineOption jobsOption(QStringList{QStringLiteral("j"), QStringLiteral("jobs")},
                                        QCoreApplication::translate("main", "Maximum fingerprinting workers."),
                                        QStringLiteral("count"));
    const QCommandLineOption resolveOption(QStringLiteral("resolve-source-duplicates"),
                                           QCoreApplication::translate("main", "Remove duplicates inside the source before merging."));
    const QCommandLineOption deleteOption(QStringLiteral("delete"),
                                          QCoreApplication::translate("main", "Delete duplicates permanently instead of moving them to the trash."));
    const QCommandLineOption contentOnlyOption(QStringLiteral("content-only"),
                                               QCoreApplication::translate("main", "Skip the file name pass when resolving duplicates."));
    parser.addOptions({dryRunOption, verboseOption, suffixOption, jobsOption, resolveOption, deleteOption, contentOnlyOption});
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList arguments = parser.positionalArguments();
    const QString command = arguments.value(0);
    const int expectedArguments = command == QLatin1String(mergeCommand) ? 3 : 2;
    if (command.isEmpty()
        || (command != QLatin1String(mergeCommand) && command != QLatin1String(dedupCommand)
            && command != QLatin1String(organizeCommand) && command != QLatin1String(clearCacheCommand))
        || arguments.size() != expectedArguments) {
        err << parser.helpText();
        err.flush();
        return ExitCodes::usage;
    }

    const bool verbose = parser.isSet(verboseOption);
    Logging::enableVerbose(verbose);

    if (command == QLatin1String(clearCacheCommand)) {
        QString error;
        if (!MergeEngine::clearCache(arguments.at(1), &error)) {
            err << error << '\n';
            err.flush();
            return ExitCodes::failure;
        }
        out << QCoreApplication::translate("main", "Cache cleared.") << '\n';
        out.flush();
        return ExitCodes::success;
    }

    MergeOptions options = MergeSettings().load();
    options.dryRun = parser.isSet(dryRunOption);
    options.resolveSourceDuplicates = parser.isSet(resolveOption);
    if (parser.isSet(contentOnlyOption)) {
        options.filenamePass = false;
    }
    if (parser.isSet(deleteOption)) {
        options.removalMode = PlatformUtils::RemovalMode::DeletePermanently;
    }
    if (parser.isSet(suffixOption)) {
        options.preferredSuffix = parser.value(suffixOption);
    }
    if (parser.isSet(jobsOption)) {
        bool ok = false;
        const int jobs = parser.value(jobsOption).toInt(&ok);
        if (!ok || jobs < 1) {
            err << QCoreApplication::translate("main", "Invalid job count: %1").arg(parser.value(jobsOption)) << '\n';
            err.flush();
            return ExitCodes::usage;
        }
        options.workers = jobs;
    }

    MergeEngine engine(options);
    if (verbose) {
        QObject::connect(&engine, &MergeEngine::stageChanged, [&out](const QString &stage) {
            out << stage << "...\n";
            out.flush();
        });
    }

    MergeReport report;
    if (command == QLatin1String(mergeCommand)) {
        report = engine.merge(arguments.at(1), arguments.at(2));
    } else if (command == QLatin1String(organizeCommand)) {
        report = engine.organize(arguments.at(1));
    } else {
        report = engine.deduplicate(arguments.at(1));
    }
    if (!report.ok) {
        err << report.error << '\n';
        err.flush();
        return ExitCodes::failure;
    }

    for (const QString &failure : report.failures) {
        err << failure << '\n';
    }
    for (const QString &warning : report.warnings) {
        err << warning << '\n';
    }
    err.flush();
    printReport(out, report, options.dryRun, verbose || options.dryRun);
    return report.errors > 0 ? ExitCodes::failure : ExitCodes::success;
}
