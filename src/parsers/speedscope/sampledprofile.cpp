/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "speedscope.h"

#include <QCoreApplication>
#include <QDebug>
#include <QVarLengthArray>

namespace Speedscope {
double aggregateSampled(const ProfileEntry& profile, Data::FrameMetricsTable* metrics)
{
    Q_ASSERT(profile.type == ProfileEntry::Type::Sampled);

    const bool hasWeights = !profile.weights.isEmpty();
    const int frameCount = metrics->size();

    double observed = 0;
    int numSkipped = 0;
    QVarLengthArray<int, 64> stack;

    for (int sampleIndex = 0, c = profile.samples.size(); sampleIndex < c; ++sampleIndex) {
        const auto sample = profile.samples.at(sampleIndex).toArray();
        if (sample.isEmpty()) {
            // also covers samples that aren't arrays at all
            ++numSkipped;
            continue;
        }

        double weight = 1;
        if (hasWeights) {
            bool ok = false;
            weight = toFiniteNumber(profile.weights.at(sampleIndex), &ok);
            if (!ok) {
                throw ParseError(ErrorKind::InvalidWeight,
                                 QCoreApplication::translate("Speedscope",
                                                             "Invalid weight at sampled profile %1, index %2")
                                     .arg(profile.index)
                                     .arg(sampleIndex));
            }
        }

        if (weight <= 0) {
            ++numSkipped;
            continue;
        }

        stack.clear();
        for (const auto& frame : sample) {
            bool ok = false;
            stack.append(toFrameIndex(frame, frameCount, &ok));
            if (!ok) {
                throw ParseError(ErrorKind::InvalidFrameReference,
                                 QCoreApplication::translate("Speedscope",
                                                             "Invalid frame reference in sampled profile %1, sample %2")
                                     .arg(profile.index)
                                     .arg(sampleIndex));
            }
        }

        observed += weight;
        metrics->addStack(stack, weight);
    }

    qCDebug(LOG_SPEEDSCOPE) << "sampled profile" << profile.index << "observed" << observed << "skipped"
                            << numSkipped << "of" << profile.samples.size() << "samples";

    return observed;
}
}
