/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "hotspotranker.h"

#include <QCoreApplication>

#include <parsers/speedscope/parseerror.h>

#include <algorithm>
#include <cmath>

namespace Data {
double roundToDecimals(double value, int decimals)
{
    const auto factor = std::pow(10., decimals);
    return std::round(value * factor) / factor;
}

QVector<Hotspot> rankHotspots(FrameMetricsTable* metrics, const QVector<Frame>& frames, double grandTotal)
{
    Q_ASSERT(metrics->size() == frames.size());

    if (!std::isfinite(grandTotal) || !(grandTotal > 0)) {
        throw Speedscope::ParseError(
            Speedscope::ErrorKind::NoMeasurableActivity,
            QCoreApplication::translate("Speedscope", "Profile contains no measurable samples or durations"));
    }

    struct Entry
    {
        Hotspot hotspot;
        double score;
    };
    QVector<Entry> entries;

    for (int frameIndex = 0, c = metrics->size(); frameIndex < c; ++frameIndex) {
        auto& frameMetrics = (*metrics)[frameIndex];
        if (!frameMetrics.isObserved()) {
            continue;
        }

        const auto& frame = frames[frameIndex];

        Hotspot hotspot;
        hotspot.name = frame.name;
        hotspot.file = frame.file;
        hotspot.selfTimeMs = roundToDecimals(frameMetrics.selfTime, 3);
        hotspot.totalTimeMs = roundToDecimals(frameMetrics.totalTime, 3);
        hotspot.sampleCount = frameMetrics.sampleCount;
        hotspot.inclusivePct = roundToDecimals(frameMetrics.totalTime / grandTotal * 100., 2);
        hotspot.exclusivePct = roundToDecimals(frameMetrics.selfTime / grandTotal * 100., 2);

        // score the presented values, so that the order matches what a consumer sees
        frameMetrics.hotspotScore =
            hotspot.inclusivePct * InclusiveScoreWeight + hotspot.exclusivePct * ExclusiveScoreWeight;

        entries.append({hotspot, frameMetrics.hotspotScore});
    }

    // stable, so equal scores keep the frame table order
    std::stable_sort(entries.begin(), entries.end(),
                     [](const Entry& lhs, const Entry& rhs) { return lhs.score > rhs.score; });

    QVector<Hotspot> hotspots;
    hotspots.reserve(entries.size());
    int rank = 0;
    for (auto& entry : entries) {
        entry.hotspot.rank = ++rank;
        hotspots.append(entry.hotspot);
    }
    return hotspots;
}
}
