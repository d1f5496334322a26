/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2017-2022 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "data.h"

#include <QDebug>

using namespace Data;

QDebug Data::operator<<(QDebug stream, const Frame& frame)
{
    QDebugStateSaver saver(stream);
    stream.noquote().nospace() << "Frame{"
                               << "name=" << frame.name << ", "
                               << "file=" << frame.file << "}";
    return stream;
}

QDebug Data::operator<<(QDebug stream, const FrameMetrics& metrics)
{
    QDebugStateSaver saver(stream);
    stream.noquote().nospace() << "FrameMetrics{"
                               << "selfTime=" << metrics.selfTime << ", "
                               << "totalTime=" << metrics.totalTime << ", "
                               << "sampleCount=" << metrics.sampleCount << ", "
                               << "hotspotScore=" << metrics.hotspotScore << "}";
    return stream;
}

QDebug Data::operator<<(QDebug stream, const Hotspot& hotspot)
{
    QDebugStateSaver saver(stream);
    stream.noquote().nospace() << "Hotspot{"
                               << "rank=" << hotspot.rank << ", "
                               << "name=" << hotspot.name << ", "
                               << "file=" << hotspot.file << ", "
                               << "selfTimeMs=" << hotspot.selfTimeMs << ", "
                               << "totalTimeMs=" << hotspot.totalTimeMs << ", "
                               << "sampleCount=" << hotspot.sampleCount << ", "
                               << "inclusivePct=" << hotspot.inclusivePct << ", "
                               << "exclusivePct=" << hotspot.exclusivePct << "}";
    return stream;
}

QDebug Data::operator<<(QDebug stream, const Summary& summary)
{
    QDebugStateSaver saver(stream);
    stream.noquote().nospace() << "Summary{"
                               << "totalSamples=" << summary.totalSamples << ", "
                               << "profileCount=" << summary.profileCount << ", "
                               << "hotspots=" << summary.hotspots.size() << "}";
    return stream;
}
