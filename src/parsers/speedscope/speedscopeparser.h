/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <atomic>
#include <QDateTime>
#include <QObject>

#include <models/data.h>

#include "parseerror.h"

class QUrl;
class QJsonDocument;

namespace Speedscope {
/**
 * Decode the raw bytes of a Speedscope file.
 *
 * @p maxSize limits the size of @p data, 0 disables the check.
 *
 * @throws ParseError with kind InputTooLarge or InvalidJson
 */
QJsonDocument decodeDocument(const QByteArray& data, qint64 maxSize = 0);
}

/**
 * Loads, parses and ranks Speedscope profiles in the background.
 *
 * Results are delivered through summaryDataAvailable() followed by
 * parsingFinished(), failures through parsingFailed().
 */
class SpeedscopeParser : public QObject
{
    Q_OBJECT
public:
    explicit SpeedscopeParser(QObject* parent = nullptr);
    ~SpeedscopeParser();

    void startParseFile(const QString& path);

    // @p profileName is used for the export only
    void startParseData(const QByteArray& data, const QString& profileName);

    void stop();

    // only local files are supported
    void exportResults(const QUrl& url);

    Data::Summary summary() const
    {
        return m_summary;
    }

    QString profileName() const
    {
        return m_profileName;
    }

    bool isParsing() const
    {
        return m_isParsing;
    }

signals:
    void parsingStarted();
    void summaryDataAvailable(const Data::Summary& data);
    void parsingFinished();
    void parsingFailed(const QString& errorMessage);
    // emitted in addition to parsingFailed() when the input was at fault
    void documentRejected(Speedscope::ErrorKind kind, const QString& errorMessage);
    void exportFailed(const QString& errorMessage);
    void exportFinished(const QUrl& url);

private:
    void startParse(const QString& path, const QByteArray& data);

    Data::Summary m_summary;
    QString m_profileName;
    QDateTime m_generatedAt;
    std::atomic<bool> m_isParsing;
    std::atomic<bool> m_stopRequested;
};
