/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "speedscopedocument.h"

#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QLocale>
#include <QStringList>

#include "parseerror.h"

#include <cmath>

namespace {
QString tr(const char* text)
{
    return QCoreApplication::translate("Speedscope", text);
}

QString scalarToString(const QJsonValue& value, const QString& fallback)
{
    switch (value.type()) {
    case QJsonValue::String:
        return value.toString();
    case QJsonValue::Double:
        return QString::number(value.toDouble(), 'g', QLocale::FloatingPointShortest);
    case QJsonValue::Bool:
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Array: {
        // joined like a list of names, null entries and objects stay empty
        QStringList parts;
        const auto array = value.toArray();
        for (const auto& element : array) {
            parts.append(scalarToString(element, {}));
        }
        return parts.join(QLatin1Char(','));
    }
    case QJsonValue::Null:
    case QJsonValue::Undefined:
    case QJsonValue::Object:
        break;
    }
    return fallback;
}

Data::Frame readFrame(const QJsonValue& value, int index)
{
    if (!value.isObject()) {
        throw Speedscope::ParseError(Speedscope::ErrorKind::MalformedDocument,
                                     tr("Invalid frame entry at index %1").arg(index));
    }

    const auto frame = value.toObject();
    return {scalarToString(frame.value(QLatin1String("name")), QStringLiteral("frame_%1").arg(index)),
            scalarToString(frame.value(QLatin1String("file")), QStringLiteral("unknown"))};
}

Speedscope::ProfileEntry readProfileEntry(const QJsonValue& value, int index)
{
    using Speedscope::ErrorKind;
    using Speedscope::ParseError;

    if (!value.isObject()) {
        throw ParseError(ErrorKind::MalformedDocument, tr("Invalid profile at index %1").arg(index));
    }

    const auto profile = value.toObject();
    const auto type = scalarToString(profile.value(QLatin1String("type")), {});

    Speedscope::ProfileEntry entry;
    entry.index = index;

    if (type == QLatin1String("sampled")) {
        const auto samples = profile.value(QLatin1String("samples"));
        if (!samples.isArray()) {
            throw ParseError(ErrorKind::MalformedDocument,
                             tr("Sampled profile %1 is missing samples array").arg(index));
        }
        entry.type = Speedscope::ProfileEntry::Type::Sampled;
        entry.samples = samples.toArray();
        // anything but an array means: every sample weighs 1
        entry.weights = profile.value(QLatin1String("weights")).toArray();
        return entry;
    }

    if (type == QLatin1String("evented")) {
        const auto events = profile.value(QLatin1String("events"));
        if (!events.isArray() || events.toArray().size() < 2) {
            throw ParseError(ErrorKind::MalformedEventStream,
                             tr("Evented profile %1 must include at least two events").arg(index));
        }
        entry.type = Speedscope::ProfileEntry::Type::Evented;
        entry.events = events.toArray();
        return entry;
    }

    throw ParseError(ErrorKind::UnsupportedProfileType,
                     tr("Unsupported profile type at index %1: %2").arg(QString::number(index), type));
}
}

namespace Speedscope {
Document readDocument(const QJsonValue& root)
{
    if (!root.isObject()) {
        throw ParseError(ErrorKind::MalformedDocument, tr("Profile must be a JSON object"));
    }
    const auto rootObject = root.toObject();

    const auto shared = rootObject.value(QLatin1String("shared"));
    if (!shared.isObject()) {
        throw ParseError(ErrorKind::MalformedDocument, tr("Profile is missing shared frames"));
    }

    const auto frames = shared.toObject().value(QLatin1String("frames"));
    if (!frames.isArray() || frames.toArray().isEmpty()) {
        throw ParseError(ErrorKind::MalformedDocument, tr("Profile shared.frames must be a non-empty array"));
    }

    const auto profiles = rootObject.value(QLatin1String("profiles"));
    if (!profiles.isArray() || profiles.toArray().isEmpty()) {
        throw ParseError(ErrorKind::MalformedDocument, tr("Profile must include at least one profile entry"));
    }

    Document document;

    const auto frameArray = frames.toArray();
    document.frames.reserve(frameArray.size());
    for (int i = 0, c = frameArray.size(); i < c; ++i) {
        document.frames.append(readFrame(frameArray.at(i), i));
    }

    const auto profileArray = profiles.toArray();
    document.profiles.reserve(profileArray.size());
    for (int i = 0, c = profileArray.size(); i < c; ++i) {
        document.profiles.append(readProfileEntry(profileArray.at(i), i));
    }

    return document;
}

double toFiniteNumber(const QJsonValue& value, bool* ok)
{
    const auto number = value.toDouble();
    *ok = value.isDouble() && std::isfinite(number);
    return *ok ? number : 0;
}

int toFrameIndex(const QJsonValue& value, int frameCount, bool* ok)
{
    const auto number = toFiniteNumber(value, ok);
    if (!*ok || std::trunc(number) != number || number < 0 || number >= frameCount) {
        *ok = false;
        return -1;
    }
    return static_cast<int>(number);
}
}
