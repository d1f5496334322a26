/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016-2022 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "util.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <models/data.h>

#include <algorithm>

namespace {
int numHotspots(const Data::Summary& summary, int topCount)
{
    const auto size = summary.hotspots.size();
    return topCount > 0 ? std::min(topCount, size) : size;
}
}

QString Util::formatString(const QString& input, bool replaceEmptyString)
{
    return input.isEmpty() && replaceEmptyString ? QCoreApplication::translate("Util", "??") : input;
}

QString Util::formatPercent(double percent, bool addPercentSign)
{
    auto ret = QString::number(percent, 'f', 2);
    if (addPercentSign) {
        ret.append(QLatin1Char('%'));
    }
    return ret;
}

QString Util::formatMilliseconds(double milliseconds)
{
    auto ret = QString::number(milliseconds, 'f', 3);
    while (ret.endsWith(QLatin1Char('0'))) {
        ret.chop(1);
    }
    if (ret.endsWith(QLatin1Char('.'))) {
        ret.chop(1);
    }
    return ret;
}

QString Util::formatHotspotTable(const Data::Summary& summary, int topCount)
{
    const QStringList headers = {
        QCoreApplication::translate("Util", "Rank"),     QCoreApplication::translate("Util", "Inclusive"),
        QCoreApplication::translate("Util", "Exclusive"), QCoreApplication::translate("Util", "Total ms"),
        QCoreApplication::translate("Util", "Self ms"),  QCoreApplication::translate("Util", "Samples"),
        QCoreApplication::translate("Util", "Symbol"),
    };

    QVector<QStringList> rows;
    rows.append(headers);
    for (int i = 0, c = numHotspots(summary, topCount); i < c; ++i) {
        const auto& hotspot = summary.hotspots[i];
        rows.append(QStringList {QString::number(hotspot.rank), formatPercent(hotspot.inclusivePct),
                     formatPercent(hotspot.exclusivePct), formatMilliseconds(hotspot.totalTimeMs),
                     formatMilliseconds(hotspot.selfTimeMs), QString::number(hotspot.sampleCount),
                     formatString(hotspot.name) + QLatin1String(" (") + formatString(hotspot.file)
                         + QLatin1Char(')')});
    }

    // all but the last column are right aligned
    const int numColumns = headers.size();
    QVector<int> widths(numColumns, 0);
    for (const auto& row : rows) {
        for (int column = 0; column < numColumns - 1; ++column) {
            widths[column] = std::max(widths[column], row[column].size());
        }
    }

    QString ret;
    for (const auto& row : rows) {
        for (int column = 0; column < numColumns - 1; ++column) {
            ret += row[column].rightJustified(widths[column]) + QLatin1String("  ");
        }
        ret += row.last() + QLatin1Char('\n');
    }

    ret += QCoreApplication::translate("Util", "%1 of %2 hotspots, %3 total samples in %4 profiles\n")
               .arg(QString::number(numHotspots(summary, topCount)), QString::number(summary.hotspots.size()),
                    QString::number(summary.totalSamples), QString::number(summary.profileCount));
    return ret;
}

QJsonObject Util::hotspotToJson(const Data::Hotspot& hotspot)
{
    return {
        {QStringLiteral("name"), hotspot.name},
        {QStringLiteral("file"), hotspot.file},
        {QStringLiteral("selfTimeMs"), hotspot.selfTimeMs},
        {QStringLiteral("totalTimeMs"), hotspot.totalTimeMs},
        {QStringLiteral("sampleCount"), static_cast<double>(hotspot.sampleCount)},
        {QStringLiteral("inclusivePct"), hotspot.inclusivePct},
        {QStringLiteral("exclusivePct"), hotspot.exclusivePct},
        {QStringLiteral("rank"), hotspot.rank},
    };
}

QJsonObject Util::summaryToJson(const Data::Summary& summary, int topCount)
{
    QJsonArray hotspots;
    for (int i = 0, c = numHotspots(summary, topCount); i < c; ++i) {
        hotspots.append(hotspotToJson(summary.hotspots[i]));
    }

    return {
        {QStringLiteral("summary"),
         QJsonObject {
             {QStringLiteral("totalSamples"), static_cast<double>(summary.totalSamples)},
             {QStringLiteral("profileCount"), summary.profileCount},
         }},
        {QStringLiteral("hotspots"), hotspots},
    };
}

QJsonObject Util::analysisToJson(const QString& profileName, const QDateTime& generatedAt,
                                 const Data::Summary& summary)
{
    auto ret = summaryToJson(summary);
    ret.insert(QStringLiteral("profileName"), profileName);
    ret.insert(QStringLiteral("generatedAt"), generatedAt.toUTC().toString(Qt::ISODateWithMs));
    return ret;
}
