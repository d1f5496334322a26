/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016-2022 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QtGlobal>

class QString;
class QDateTime;
class QJsonObject;

namespace Data {
struct Hotspot;
struct Summary;
}

namespace Util {
QString formatString(const QString& input, bool replaceEmptyString = true);

// resulting format: 12.34%
QString formatPercent(double percent, bool addPercentSign = true);

// at most three decimals, trailing zeros are dropped
QString formatMilliseconds(double milliseconds);

/**
 * Render the hotspots of @p summary as a plain-text table.
 *
 * Only the first @p topCount hotspots are included, 0 means all of them.
 */
QString formatHotspotTable(const Data::Summary& summary, int topCount = 0);

QJsonObject hotspotToJson(const Data::Hotspot& hotspot);

/**
 * @return {summary: {totalSamples, profileCount}, hotspots: [...]}, limited to @p topCount hotspots
 */
QJsonObject summaryToJson(const Data::Summary& summary, int topCount = 0);

/**
 * The document written by the export, i.e. summaryToJson() extended by
 * the profile name and the time of the analysis.
 */
QJsonObject analysisToJson(const QString& profileName, const QDateTime& generatedAt, const Data::Summary& summary);
}
