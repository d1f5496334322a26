/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QMetaType>
#include <QString>
#include <QTypeInfo>
#include <QVector>

#include <tuple>

class QDebug;

namespace Data {
struct Frame
{
    Frame(const QString& name = {}, const QString& file = {})
        : name(name)
        , file(file)
    {
    }

    // function name
    QString name;
    // source file the function lives in
    QString file;
};

QDebug operator<<(QDebug stream, const Frame& frame);

inline bool operator==(const Frame& lhs, const Frame& rhs)
{
    return std::tie(lhs.name, lhs.file) == std::tie(rhs.name, rhs.file);
}

inline bool operator!=(const Frame& lhs, const Frame& rhs)
{
    return !(lhs == rhs);
}

struct FrameMetrics
{
    // time spent while the frame was the innermost one
    double selfTime = 0;
    // time spent while the frame was anywhere on the stack
    double totalTime = 0;
    // number of stack memberships, not number of samples
    quint64 sampleCount = 0;
    double hotspotScore = 0;

    bool isObserved() const
    {
        return selfTime != 0 || totalTime != 0;
    }
};

QDebug operator<<(QDebug stream, const FrameMetrics& metrics);

/**
 * Dense per-frame accumulator, one slot for every entry in the frame table.
 *
 * Indices must be validated against size() before they are used to address
 * the table, see Speedscope::toFrameIndex().
 */
class FrameMetricsTable
{
public:
    explicit FrameMetricsTable(int frameCount = 0)
        : m_metrics(frameCount)
    {
    }

    int size() const
    {
        return m_metrics.size();
    }

    const FrameMetrics& operator[](int frameIndex) const
    {
        Q_ASSERT(frameIndex >= 0 && frameIndex < m_metrics.size());
        return m_metrics[frameIndex];
    }

    FrameMetrics& operator[](int frameIndex)
    {
        Q_ASSERT(frameIndex >= 0 && frameIndex < m_metrics.size());
        return m_metrics[frameIndex];
    }

    // attribute @p time to every frame in @p stack, the last one is the leaf
    template<typename Stack>
    void addStack(const Stack& stack, double time)
    {
        for (const int frameIndex : stack) {
            auto& metrics = (*this)[frameIndex];
            metrics.totalTime += time;
            ++metrics.sampleCount;
        }
        (*this)[stack.last()].selfTime += time;
    }

private:
    QVector<FrameMetrics> m_metrics;
};

struct Hotspot
{
    QString name;
    QString file;
    double selfTimeMs = 0;
    double totalTimeMs = 0;
    quint64 sampleCount = 0;
    double inclusivePct = 0;
    double exclusivePct = 0;
    int rank = 0;
};

QDebug operator<<(QDebug stream, const Hotspot& hotspot);

inline bool operator==(const Hotspot& lhs, const Hotspot& rhs)
{
    return std::tie(lhs.name, lhs.file, lhs.selfTimeMs, lhs.totalTimeMs, lhs.sampleCount, lhs.inclusivePct,
                    lhs.exclusivePct, lhs.rank)
        == std::tie(rhs.name, rhs.file, rhs.selfTimeMs, rhs.totalTimeMs, rhs.sampleCount, rhs.inclusivePct,
                    rhs.exclusivePct, rhs.rank);
}

inline bool operator!=(const Hotspot& lhs, const Hotspot& rhs)
{
    return !(lhs == rhs);
}

struct Summary
{
    QVector<Hotspot> hotspots;
    // grand total of observed time, rounded to an integer
    qint64 totalSamples = 0;
    int profileCount = 0;
};

QDebug operator<<(QDebug stream, const Summary& summary);

inline bool operator==(const Summary& lhs, const Summary& rhs)
{
    return std::tie(lhs.hotspots, lhs.totalSamples, lhs.profileCount)
        == std::tie(rhs.hotspots, rhs.totalSamples, rhs.profileCount);
}

inline bool operator!=(const Summary& lhs, const Summary& rhs)
{
    return !(lhs == rhs);
}
}

Q_DECLARE_METATYPE(Data::Frame)
Q_DECLARE_TYPEINFO(Data::Frame, Q_MOVABLE_TYPE);

Q_DECLARE_TYPEINFO(Data::FrameMetrics, Q_MOVABLE_TYPE);

Q_DECLARE_METATYPE(Data::Hotspot)
Q_DECLARE_TYPEINFO(Data::Hotspot, Q_MOVABLE_TYPE);

Q_DECLARE_METATYPE(Data::Summary)
Q_DECLARE_TYPEINFO(Data::Summary, Q_MOVABLE_TYPE);
