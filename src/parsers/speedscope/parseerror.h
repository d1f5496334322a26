/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QMetaType>
#include <QString>

#include <stdexcept>

class QDebug;

namespace Speedscope {
enum class ErrorKind
{
    MalformedDocument,
    InvalidFrameReference,
    InvalidWeight,
    InvalidTimestamp,
    UnsupportedProfileType,
    MalformedEventStream,
    NonMonotonicTimestamps,
    UnbalancedStack,
    InvalidEventType,
    UnclosedFrames,
    NoMeasurableActivity,
    // only raised when loading raw bytes, never by parseProfile()
    InvalidJson,
    InputTooLarge,
};

QString errorKindName(ErrorKind kind);

QDebug operator<<(QDebug stream, ErrorKind kind);

/**
 * A document that can not be turned into hotspots.
 *
 * All of these are caused by the input, i.e. they are client faults. The
 * message names the offending profile, sample or event index where there is one.
 */
class ParseError : public std::runtime_error
{
public:
    ParseError(ErrorKind kind, const QString& message);

    ErrorKind kind() const
    {
        return m_kind;
    }

    QString message() const
    {
        return m_message;
    }

private:
    ErrorKind m_kind;
    QString m_message;
};

/**
 * @return true when @p error was raised because the input was malformed,
 *         false for any other (internal) failure
 */
bool isParseError(const std::exception& error);
}

Q_DECLARE_METATYPE(Speedscope::ErrorKind)
