/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "speedscopeparser.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QUrl>

#include <ThreadWeaver/ThreadWeaver>

#include <flamerank-config.h>
#include <settings.h>
#include <util.h>

#include "speedscope.h"

#include <algorithm>

#if KF5Archive_FOUND
#include <KArchive/KCompressionDevice>
#endif

Q_LOGGING_CATEGORY(LOG_PARSER, "flamerank.parser", QtWarningMsg)

namespace {
// reads at most maxSize + 1 bytes, enough to detect an oversized input
QByteArray readLimited(QIODevice* device, qint64 maxSize)
{
    if (maxSize <= 0) {
        return device->readAll();
    }

    const qint64 chunkSize = 1024 * 100;

    QByteArray ret;
    while (!device->atEnd() && ret.size() <= maxSize) {
        const auto chunk = device->read(std::min(chunkSize, maxSize + 1 - ret.size()));
        if (chunk.isEmpty()) {
            break;
        }
        ret.append(chunk);
    }
    return ret;
}

bool readInput(const QString& path, qint64 maxSize, QByteArray* data, QString* errorMessage)
{
#if KF5Archive_FOUND
    KCompressionDevice compressedFile(path);

    if (compressedFile.compressionType() != KCompressionDevice::None) {
        if (!compressedFile.open(QIODevice::ReadOnly)) {
            *errorMessage = SpeedscopeParser::tr("Failed to decompress file %1: %2")
                                .arg(path, compressedFile.errorString());
            return false;
        }
        qCDebug(LOG_PARSER) << "decompressing" << path << "compression type" << compressedFile.compressionType();
        *data = readLimited(&compressedFile, maxSize);
        return true;
    }
#endif

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *errorMessage = SpeedscopeParser::tr("Failed to open file %1: %2").arg(path, file.errorString());
        return false;
    }
    *data = readLimited(&file, maxSize);
    return true;
}
}

QJsonDocument Speedscope::decodeDocument(const QByteArray& data, qint64 maxSize)
{
    if (maxSize > 0 && data.size() > maxSize) {
        throw ParseError(ErrorKind::InputTooLarge,
                         SpeedscopeParser::tr("Profile exceeds the maximum size of %1 bytes").arg(maxSize));
    }

    QJsonParseError error;
    auto document = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError) {
        throw ParseError(ErrorKind::InvalidJson,
                         SpeedscopeParser::tr("Profile is not valid JSON: %1 at offset %2")
                             .arg(error.errorString(), QString::number(error.offset)));
    }
    return document;
}

SpeedscopeParser::SpeedscopeParser(QObject* parent)
    : QObject(parent)
    , m_isParsing(false)
    , m_stopRequested(false)
{
    qRegisterMetaType<Data::Summary>();
    qRegisterMetaType<Speedscope::ErrorKind>();

    // set data via signal/slot connection to ensure we don't introduce a data race
    connect(this, &SpeedscopeParser::summaryDataAvailable, this, [this](const Data::Summary& data) {
        m_summary = data;
        m_generatedAt = QDateTime::currentDateTimeUtc();
    });
    connect(this, &SpeedscopeParser::parsingStarted, this, [this]() {
        m_isParsing = true;
        m_stopRequested = false;
    });

    auto parsingStopped = [this] { m_isParsing = false; };

    connect(this, &SpeedscopeParser::parsingFailed, this, parsingStopped);
    connect(this, &SpeedscopeParser::parsingFinished, this, parsingStopped);
}

SpeedscopeParser::~SpeedscopeParser() = default;

void SpeedscopeParser::startParseFile(const QString& path)
{
    Q_ASSERT(!m_isParsing);

    QFileInfo info(path);
    if (!info.exists()) {
        emit parsingFailed(tr("File '%1' does not exist.").arg(path));
        return;
    }
    if (!info.isFile()) {
        emit parsingFailed(tr("'%1' is not a file.").arg(path));
        return;
    }
    if (!info.isReadable()) {
        emit parsingFailed(tr("File '%1' is not readable.").arg(path));
        return;
    }

    m_profileName = info.fileName();
    startParse(path, {});
}

void SpeedscopeParser::startParseData(const QByteArray& data, const QString& profileName)
{
    Q_ASSERT(!m_isParsing);

    m_profileName = profileName;
    startParse({}, data);
}

void SpeedscopeParser::startParse(const QString& path, const QByteArray& data)
{
    // reset the data to ensure a failed parse doesn't leave stale results behind
    m_summary = {};
    m_generatedAt = {};

    const auto maxFileSize = Settings::instance()->maxFileSize();

    emit parsingStarted();
    using namespace ThreadWeaver;
    stream() << make_job([path, data, maxFileSize, this]() {
        auto input = data;
        if (!path.isEmpty()) {
            QString errorMessage;
            if (!readInput(path, maxFileSize, &input, &errorMessage)) {
                emit parsingFailed(errorMessage);
                return;
            }
        }

        if (m_stopRequested) {
            emit parsingFailed(tr("Parsing stopped."));
            return;
        }

        try {
            const auto document = Speedscope::decodeDocument(input, maxFileSize);
            QJsonValue root;
            if (document.isObject()) {
                root = document.object();
            } else if (document.isArray()) {
                root = document.array();
            }
            const auto summary = Speedscope::parseProfile(root);

            // the parse itself can't be interrupted, so drop its result instead
            if (m_stopRequested) {
                emit parsingFailed(tr("Parsing stopped."));
                return;
            }

            emit summaryDataAvailable(summary);
            emit parsingFinished();
        } catch (const Speedscope::ParseError& error) {
            emit documentRejected(error.kind(), error.message());
            emit parsingFailed(error.message());
        } catch (const std::exception& error) {
            qCWarning(LOG_PARSER) << "unexpected failure while parsing" << path << error.what();
            emit parsingFailed(tr("Failed to analyze profile: %1").arg(QString::fromLocal8Bit(error.what())));
        }
    });
}

void SpeedscopeParser::stop()
{
    m_stopRequested = true;
}

void SpeedscopeParser::exportResults(const QUrl& url)
{
    if (m_summary.profileCount == 0) {
        emit exportFailed(tr("File export failed: no profile was analyzed."));
        return;
    }

    if (!url.isLocalFile()) {
        emit exportFailed(tr("File export failed: %1 is not a local file.").arg(url.toDisplayString()));
        return;
    }

    const auto analysis = Util::analysisToJson(m_profileName, m_generatedAt, m_summary);

    using namespace ThreadWeaver;
    stream() << make_job([this, url, analysis]() {
        QSaveFile file(url.toLocalFile());
        if (!file.open(QIODevice::WriteOnly)) {
            emit exportFailed(tr("File export failed: %1").arg(file.errorString()));
            return;
        }

        if (file.write(QJsonDocument(analysis).toJson()) == -1 || !file.commit()) {
            emit exportFailed(tr("File export failed: %1").arg(file.errorString()));
            return;
        }

        emit exportFinished(url);
    });
}
