/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTextStream>
#include <QThread>
#include <QTimer>
#include <QUrl>

#include "flamerank-config.h"
#include "parsers/speedscope/speedscopeparser.h"
#include "settings.h"
#include "util.h"

#include <KLocalizedString>
#include <ThreadWeaver/ThreadWeaver>

#include <functional>

int main(int argc, char** argv)
{
    KLocalizedString::setApplicationDomain("flamerank");
    QCoreApplication::setOrganizationName(QStringLiteral("KDAB"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("kdab.com"));
    QCoreApplication::setApplicationName(QStringLiteral("flamerank"));
    QCoreApplication::setApplicationVersion(QStringLiteral(FLAMERANK_VERSION_STRING));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Rank the hotspots of Speedscope profiles."));
    parser.addHelpOption();
    parser.addVersionOption();

    const auto format = QCommandLineOption(
        QStringLiteral("format"), QCoreApplication::translate("main", "Output format, either 'table' or 'json'."),
        QStringLiteral("format"));
    parser.addOption(format);

    const auto top = QCommandLineOption(
        QStringLiteral("top"),
        QCoreApplication::translate("main", "Only show the first N hotspots. 0 shows all of them."),
        QStringLiteral("N"));
    parser.addOption(top);

    const auto maxFileSize = QCommandLineOption(
        QStringLiteral("max-file-size"),
        QCoreApplication::translate("main", "Reject input files larger than this many bytes. 0 disables the limit."),
        QStringLiteral("bytes"));
    parser.addOption(maxFileSize);

    const auto exportTo = QCommandLineOption(
        QStringLiteral("exportTo"),
        QCoreApplication::translate("main",
                                    "Path to a .json file to which the analysis should be exported. A single input "
                                    "file has to be given too."),
        QStringLiteral("path"));
    parser.addOption(exportTo);

    const auto saveSettings = QCommandLineOption(
        QStringLiteral("save-settings"),
        QCoreApplication::translate("main", "Remember the given output and input options as new defaults."));
    parser.addOption(saveSettings);

    const auto verbose = QCommandLineOption(
        QStringLiteral("verbose"), QCoreApplication::translate("main", "Print debug output of the parser."));
    parser.addOption(verbose);

    parser.addPositionalArgument(QStringLiteral("files"),
                                 QCoreApplication::translate("main", "Speedscope JSON files to analyze."),
                                 QStringLiteral("files..."));

    parser.process(app);

    if (parser.isSet(verbose)) {
        QLoggingCategory::setFilterRules(QStringLiteral("flamerank.*.debug=true"));
    }

    ThreadWeaver::Queue::instance()->setMaximumNumberOfThreads(QThread::idealThreadCount());

    QTextStream err(stderr);

    auto* settings = Settings::instance();
    settings->loadFromFile();

    if (parser.isSet(format)) {
        bool ok = false;
        settings->setOutputFormat(Settings::outputFormatFromString(parser.value(format), &ok));
        if (!ok) {
            err << QCoreApplication::translate("main", "Error: unknown output format '%1'.").arg(parser.value(format))
                << "\n\n"
                << parser.helpText();
            return 1;
        }
    }

    auto applyNumber = [&](const QCommandLineOption& option, const std::function<void(qint64)>& setter) {
        if (!parser.isSet(option)) {
            return true;
        }
        bool ok = false;
        const auto value = parser.value(option).toLongLong(&ok);
        if (!ok || value < 0) {
            err << QCoreApplication::translate("main", "Error: expected a non-negative number for --%1, got '%2'.")
                       .arg(option.names().constFirst(), parser.value(option))
                << "\n\n"
                << parser.helpText();
            return false;
        }
        setter(value);
        return true;
    };
    if (!applyNumber(top, [settings](qint64 value) { settings->setTopCount(static_cast<int>(value)); })
        || !applyNumber(maxFileSize, [settings](qint64 value) { settings->setMaxFileSize(value); })) {
        return 1;
    }

    if (parser.isSet(saveSettings)) {
        settings->saveToFile();
    }

    auto files = parser.positionalArguments();
    if (files.isEmpty()) {
        err << QCoreApplication::translate("main", "Error: expected at least one input file.") << "\n\n"
            << parser.helpText();
        return 1;
    }
    if (files.size() != 1 && parser.isSet(exportTo)) {
        err << QCoreApplication::translate("main", "Error: expected a single input file to export, instead of %1.",
                                           nullptr, files.size())
                   .arg(files.size())
            << "\n\n"
            << parser.helpText();
        return 1;
    }

    const bool printFileNames = files.size() > 1;
    int exitCode = 0;
    QString currentFile;
    bool documentWasRejected = false;

    SpeedscopeParser speedscopeParser;
    std::function<void()> parseNext = [&]() {
        if (files.isEmpty()) {
            QCoreApplication::exit(exitCode);
            return;
        }
        currentFile = files.takeFirst();
        documentWasRejected = false;
        speedscopeParser.startParseFile(currentFile);
    };

    QObject::connect(&speedscopeParser, &SpeedscopeParser::documentRejected, &app,
                     [&](Speedscope::ErrorKind kind, const QString& errorMessage) {
                         err << QCoreApplication::translate("main", "Error: %1 is not a valid profile (%2): %3")
                                    .arg(currentFile, Speedscope::errorKindName(kind), errorMessage)
                             << Qt::endl;
                         documentWasRejected = true;
                     });

    QObject::connect(&speedscopeParser, &SpeedscopeParser::parsingFailed, &app, [&](const QString& errorMessage) {
        // rejected documents got reported already
        if (!documentWasRejected) {
            err << QCoreApplication::translate("main", "Error: failed to analyze %1: %2").arg(currentFile, errorMessage)
                << Qt::endl;
        }
        exitCode = 1;
        parseNext();
    });

    QObject::connect(&speedscopeParser, &SpeedscopeParser::parsingFinished, &app, [&]() {
        if (parser.isSet(exportTo)) {
            auto destination =
                QUrl::fromUserInput(parser.value(exportTo), QDir::currentPath(), QUrl::AssumeLocalFile);
            speedscopeParser.exportResults(destination);
            return;
        }

        QTextStream out(stdout);
        const auto summary = speedscopeParser.summary();
        switch (settings->outputFormat()) {
        case Settings::OutputFormat::Json: {
            auto json = Util::summaryToJson(summary, settings->topCount());
            json.insert(QStringLiteral("profileName"), speedscopeParser.profileName());
            out << QJsonDocument(json).toJson();
            break;
        }
        case Settings::OutputFormat::Table:
            if (printFileNames) {
                out << currentFile << ":\n";
            }
            out << Util::formatHotspotTable(summary, settings->topCount());
            break;
        }
        out.flush();
        parseNext();
    });

    QObject::connect(&speedscopeParser, &SpeedscopeParser::exportFailed, &app, [&](const QString& errorMessage) {
        err << errorMessage << Qt::endl;
        QCoreApplication::exit(1);
    });
    QObject::connect(&speedscopeParser, &SpeedscopeParser::exportFinished, &app, [&](const QUrl& url) {
        QTextStream out(stdout);
        out << QCoreApplication::translate("main", "Input file %1 exported to %2")
                   .arg(currentFile, url.toDisplayString(QUrl::PrettyDecoded | QUrl::PreferLocalFile))
            << Qt::endl;
        QCoreApplication::exit(0);
    });

    // failures can be reported synchronously, so only start once the event loop runs
    QTimer::singleShot(0, &app, parseNext);

    return QCoreApplication::exec();
}
