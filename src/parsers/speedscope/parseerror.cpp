/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "parseerror.h"

#include <QDebug>

namespace Speedscope {
QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::MalformedDocument:
        return QStringLiteral("MalformedDocument");
    case ErrorKind::InvalidFrameReference:
        return QStringLiteral("InvalidFrameReference");
    case ErrorKind::InvalidWeight:
        return QStringLiteral("InvalidWeight");
    case ErrorKind::InvalidTimestamp:
        return QStringLiteral("InvalidTimestamp");
    case ErrorKind::UnsupportedProfileType:
        return QStringLiteral("UnsupportedProfileType");
    case ErrorKind::MalformedEventStream:
        return QStringLiteral("MalformedEventStream");
    case ErrorKind::NonMonotonicTimestamps:
        return QStringLiteral("NonMonotonicTimestamps");
    case ErrorKind::UnbalancedStack:
        return QStringLiteral("UnbalancedStack");
    case ErrorKind::InvalidEventType:
        return QStringLiteral("InvalidEventType");
    case ErrorKind::UnclosedFrames:
        return QStringLiteral("UnclosedFrames");
    case ErrorKind::NoMeasurableActivity:
        return QStringLiteral("NoMeasurableActivity");
    case ErrorKind::InvalidJson:
        return QStringLiteral("InvalidJson");
    case ErrorKind::InputTooLarge:
        return QStringLiteral("InputTooLarge");
    }
    Q_UNREACHABLE();
}

QDebug operator<<(QDebug stream, ErrorKind kind)
{
    QDebugStateSaver saver(stream);
    stream.noquote() << errorKindName(kind);
    return stream;
}

ParseError::ParseError(ErrorKind kind, const QString& message)
    : std::runtime_error(message.toStdString())
    , m_kind(kind)
    , m_message(message)
{
}

bool isParseError(const std::exception& error)
{
    return dynamic_cast<const ParseError*>(&error) != nullptr;
}
}
