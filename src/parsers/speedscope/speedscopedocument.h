/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QJsonArray>
#include <QVector>

#include <models/data.h>

class QJsonValue;

namespace Speedscope {
/**
 * One entry of the document's "profiles" array.
 *
 * The per-sample and per-event payload is kept untyped, it gets decoded while
 * aggregating so that a malformed sample can be skipped while a malformed
 * event aborts the whole parse.
 */
struct ProfileEntry
{
    enum class Type
    {
        Sampled,
        Evented,
    };

    Type type = Type::Sampled;
    // position in the document's "profiles" array, used for diagnostics
    int index = 0;

    // Type::Sampled
    QJsonArray samples;
    // empty when every sample has the implicit weight 1
    QJsonArray weights;

    // Type::Evented, guaranteed to hold at least two entries
    QJsonArray events;
};

struct Document
{
    QVector<Data::Frame> frames;
    QVector<ProfileEntry> profiles;
};

/**
 * Type-check @p root and extract the shared frame table and the profile entries.
 *
 * @throws ParseError for any structural problem of the document
 */
Document readDocument(const QJsonValue& root);

/**
 * @return the integral value of @p value when it lies in [0, frameCount),
 *         otherwise sets @p ok to false
 */
int toFrameIndex(const QJsonValue& value, int frameCount, bool* ok);

/**
 * @return the numeric value of @p value when it is a finite number,
 *         otherwise sets @p ok to false
 */
double toFiniteNumber(const QJsonValue& value, bool* ok);
}

Q_DECLARE_TYPEINFO(Speedscope::ProfileEntry, Q_MOVABLE_TYPE);
