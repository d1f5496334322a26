/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "speedscope.h"

#include <QCoreApplication>
#include <QDebug>
#include <QJsonObject>

namespace {
QString tr(const char* text)
{
    return QCoreApplication::translate("Speedscope", text);
}

struct Event
{
    QString type;
    int frame = -1;
    double at = 0;
};

QJsonObject eventObject(const Speedscope::ProfileEntry& profile, int eventIndex)
{
    const auto value = profile.events.at(eventIndex);
    if (!value.isObject()) {
        throw Speedscope::ParseError(Speedscope::ErrorKind::MalformedEventStream,
                                     tr("Invalid event entry at profile %1, index %2").arg(profile.index).arg(eventIndex));
    }
    return value.toObject();
}

double eventTimestamp(const QJsonObject& event, const Speedscope::ProfileEntry& profile, int eventIndex)
{
    bool ok = false;
    const auto at = Speedscope::toFiniteNumber(event.value(QLatin1String("at")), &ok);
    if (!ok) {
        throw Speedscope::ParseError(
            Speedscope::ErrorKind::InvalidTimestamp,
            tr("Invalid event timestamp at profile %1, index %2").arg(profile.index).arg(eventIndex));
    }
    return at;
}

Event readEvent(const Speedscope::ProfileEntry& profile, int eventIndex, int frameCount)
{
    const auto object = eventObject(profile, eventIndex);

    Event event;
    const auto type = object.value(QLatin1String("type"));
    if (type.isString()) {
        event.type = type.toString();
    }

    bool ok = false;
    event.frame = Speedscope::toFrameIndex(object.value(QLatin1String("frame")), frameCount, &ok);
    if (!ok) {
        throw Speedscope::ParseError(
            Speedscope::ErrorKind::InvalidFrameReference,
            tr("Invalid event frame at profile %1, index %2").arg(profile.index).arg(eventIndex));
    }

    event.at = eventTimestamp(object, profile, eventIndex);
    return event;
}
}

namespace Speedscope {
double reconstructEvented(const ProfileEntry& profile, Data::FrameMetricsTable* metrics)
{
    Q_ASSERT(profile.type == ProfileEntry::Type::Evented);

    const int frameCount = metrics->size();
    const int numEvents = profile.events.size();
    if (numEvents < 2) {
        throw ParseError(ErrorKind::MalformedEventStream,
                         tr("Evented profile %1 must include at least two events").arg(profile.index));
    }

    double observed = 0;
    QVector<int> stack;

    for (int i = 0; i < numEvents; ++i) {
        const auto event = readEvent(profile, i, frameCount);

        double delta = 0;
        if (i + 1 < numEvents) {
            const auto nextAt = eventTimestamp(eventObject(profile, i + 1), profile, i + 1);
            delta = nextAt - event.at;
            if (delta < 0) {
                throw ParseError(ErrorKind::NonMonotonicTimestamps,
                                 tr("Event timestamps must be non-decreasing in profile %1").arg(profile.index));
            }
        }

        if (event.type == QLatin1String("O")) {
            stack.push_back(event.frame);
        } else if (event.type == QLatin1String("C")) {
            if (stack.isEmpty() || stack.last() != event.frame) {
                const auto expected = stack.isEmpty() ? QStringLiteral("none") : QString::number(stack.last());
                throw ParseError(ErrorKind::UnbalancedStack,
                                 tr("Unbalanced event stack in profile %1 at event %2 (expected %3, got %4)")
                                     .arg(QString::number(profile.index), QString::number(i), expected,
                                          QString::number(event.frame)));
            }
            stack.pop_back();
        } else {
            throw ParseError(ErrorKind::InvalidEventType,
                             tr("Invalid event type at profile %1, index %2: %3")
                                 .arg(QString::number(profile.index), QString::number(i), event.type));
        }

        // the gap until the next event belongs to the stack as this event left it
        if (delta > 0 && !stack.isEmpty()) {
            observed += delta;
            metrics->addStack(stack, delta);
        }
    }

    if (!stack.isEmpty()) {
        throw ParseError(ErrorKind::UnclosedFrames,
                         tr("Unclosed frames in evented profile %1").arg(profile.index));
    }

    qCDebug(LOG_SPEEDSCOPE) << "evented profile" << profile.index << "observed" << observed << "from" << numEvents
                            << "events";

    return observed;
}
}
