/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "speedscope.h"

#include <QCoreApplication>
#include <QDebug>
#include <QJsonValue>

#include <models/hotspotranker.h>

#include <cmath>

Q_LOGGING_CATEGORY(LOG_SPEEDSCOPE, "flamerank.speedscope", QtWarningMsg)

namespace {
// 2^53, beyond this the totals can't be counted exactly in a double anymore
constexpr double MaxObservedTotal = 9007199254740992.;

void checkObservedTotal(double totalObserved, const Speedscope::ProfileEntry& profile)
{
    if (std::isfinite(totalObserved) && totalObserved <= MaxObservedTotal) {
        return;
    }

    switch (profile.type) {
    case Speedscope::ProfileEntry::Type::Sampled:
        throw Speedscope::ParseError(
            Speedscope::ErrorKind::InvalidWeight,
            QCoreApplication::translate("Speedscope", "Weights of sampled profile %1 exceed the supported total")
                .arg(profile.index));
    case Speedscope::ProfileEntry::Type::Evented:
        throw Speedscope::ParseError(
            Speedscope::ErrorKind::InvalidTimestamp,
            QCoreApplication::translate("Speedscope", "Durations of evented profile %1 exceed the supported total")
                .arg(profile.index));
    }
}

Data::Summary parseDocument(const QJsonValue& root)
{
    const auto document = Speedscope::readDocument(root);

    Data::FrameMetricsTable metrics(document.frames.size());
    double totalObserved = 0;

    for (const auto& profile : document.profiles) {
        switch (profile.type) {
        case Speedscope::ProfileEntry::Type::Sampled:
            totalObserved += Speedscope::aggregateSampled(profile, &metrics);
            break;
        case Speedscope::ProfileEntry::Type::Evented:
            totalObserved += Speedscope::reconstructEvented(profile, &metrics);
            break;
        }
        checkObservedTotal(totalObserved, profile);
    }

    Data::Summary summary;
    summary.hotspots = Data::rankHotspots(&metrics, document.frames, totalObserved);
    summary.totalSamples = qRound64(totalObserved);
    summary.profileCount = document.profiles.size();

    qCDebug(LOG_SPEEDSCOPE) << "observed" << totalObserved << "across" << summary.profileCount << "profiles,"
                            << summary.hotspots.size() << "of" << document.frames.size() << "frames are hotspots";
    return summary;
}
}

namespace Speedscope {
Data::Summary parseProfile(const QJsonValue& document)
{
    try {
        return parseDocument(document);
    } catch (const ParseError& error) {
        qCWarning(LOG_SPEEDSCOPE) << "rejected profile:" << error.kind() << error.message();
        throw;
    }
}
}
