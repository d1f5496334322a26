/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016-2022 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QTest>

#include <models/data.h>
#include <parsers/speedscope/parseerror.h>

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <stdexcept>

#define VERIFY_OR_THROW(statement)                                                                                     \
    do {                                                                                                               \
        if (!QTest::qVerify(static_cast<bool>(statement), #statement, "", __FILE__, __LINE__))                         \
            throw std::logic_error("verify failed: " #statement);                                                      \
    } while (false)

#define COMPARE_OR_THROW(actual, expected)                                                                             \
    do {                                                                                                               \
        if (!QTest::qCompare(actual, expected, #actual, #expected, __FILE__, __LINE__))                                \
            throw std::logic_error("compare failed: " #actual #expected);                                              \
    } while (false)

// frames given as "name:file", or just "name" to leave out the file
inline QJsonArray buildFrames(const QStringList& frames)
{
    QJsonArray ret;
    for (const auto& frame : frames) {
        const auto separator = frame.indexOf(QLatin1Char(':'));
        QJsonObject object;
        object.insert(QStringLiteral("name"), separator == -1 ? frame : frame.left(separator));
        if (separator != -1) {
            object.insert(QStringLiteral("file"), frame.mid(separator + 1));
        }
        ret.append(object);
    }
    return ret;
}

inline QJsonObject buildDocument(const QJsonArray& frames, const QJsonArray& profiles)
{
    return {
        {QStringLiteral("shared"), QJsonObject {{QStringLiteral("frames"), frames}}},
        {QStringLiteral("profiles"), profiles},
    };
}

inline QJsonArray toJsonArray(std::initializer_list<double> values)
{
    QJsonArray ret;
    for (const auto value : values) {
        ret.append(value);
    }
    return ret;
}

inline QJsonObject sampledProfile(const QVector<QVector<int>>& samples, const QJsonArray& weights = {})
{
    QJsonArray jsonSamples;
    for (const auto& sample : samples) {
        QJsonArray stack;
        for (const auto frame : sample) {
            stack.append(frame);
        }
        jsonSamples.append(stack);
    }

    QJsonObject ret = {
        {QStringLiteral("type"), QStringLiteral("sampled")},
        {QStringLiteral("samples"), jsonSamples},
    };
    if (!weights.isEmpty()) {
        ret.insert(QStringLiteral("weights"), weights);
    }
    return ret;
}

struct TestEvent
{
    char type;
    int frame;
    double at;
};

inline QJsonObject eventedProfile(const QVector<TestEvent>& events)
{
    QJsonArray jsonEvents;
    for (const auto& event : events) {
        jsonEvents.append(QJsonObject {
            {QStringLiteral("type"), QString(QLatin1Char(event.type))},
            {QStringLiteral("frame"), event.frame},
            {QStringLiteral("at"), event.at},
        });
    }
    return {
        {QStringLiteral("type"), QStringLiteral("evented")},
        {QStringLiteral("events"), jsonEvents},
    };
}

inline Data::Hotspot findHotspot(const Data::Summary& summary, const QString& name)
{
    auto it = std::find_if(summary.hotspots.begin(), summary.hotspots.end(),
                           [&name](const Data::Hotspot& hotspot) { return hotspot.name == name; });
    VERIFY_OR_THROW(it != summary.hotspots.end());
    return *it;
}

// one "rank:name=s:<self>,i:<total>" line per hotspot, in ranked order
inline QStringList printHotspots(const Data::Summary& summary)
{
    QStringList list;
    list.reserve(summary.hotspots.size());
    for (const auto& hotspot : summary.hotspots) {
        list.push_back(QString::number(hotspot.rank) + QLatin1Char(':') + hotspot.name + QLatin1String("=s:")
                       + QString::number(hotspot.selfTimeMs) + QLatin1String(",i:")
                       + QString::number(hotspot.totalTimeMs));
    }
    return list;
}

// runs @p function and returns the kind of ParseError it raised, fails when none was raised
inline Speedscope::ErrorKind parseErrorKind(const std::function<void()>& function, QString* message = nullptr)
{
    try {
        function();
    } catch (const Speedscope::ParseError& error) {
        if (message) {
            *message = error.message();
        }
        return error.kind();
    }
    VERIFY_OR_THROW(!"expected a Speedscope::ParseError");
    Q_UNREACHABLE();
}
