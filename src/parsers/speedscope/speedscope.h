/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QLoggingCategory>

#include <models/data.h>

#include "parseerror.h"
#include "speedscopedocument.h"

class QJsonValue;

Q_DECLARE_LOGGING_CATEGORY(LOG_SPEEDSCOPE)

namespace Speedscope {
/**
 * Turn a decoded Speedscope document into ranked hotspots.
 *
 * All intermediate state lives for the duration of the call only, concurrent
 * calls don't share anything.
 *
 * @throws ParseError when the document is malformed or contains no measurable time
 */
Data::Summary parseProfile(const QJsonValue& document);

/**
 * Accumulate the stack samples of a sampled @p profile into @p metrics.
 *
 * Samples without a stack are skipped, as are samples with a weight <= 0.
 *
 * @return the total weight of all counted samples
 */
double aggregateSampled(const ProfileEntry& profile, Data::FrameMetricsTable* metrics);

/**
 * Replay the open/close events of an evented @p profile into @p metrics.
 *
 * The time between two consecutive events is attributed to the stack as it
 * was after applying the first of the two, i.e. a push or pop only affects
 * the following interval.
 *
 * @return the total time during which at least one frame was open
 */
double reconstructEvented(const ProfileEntry& profile, Data::FrameMetricsTable* metrics);
}
