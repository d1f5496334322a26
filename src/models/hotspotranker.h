/*
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2024 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include "data.h"

namespace Data {
// weights of the composite hotspot score
constexpr double InclusiveScoreWeight = 0.6;
constexpr double ExclusiveScoreWeight = 0.4;

double roundToDecimals(double value, int decimals);

/**
 * Normalize @p metrics against @p grandTotal and rank all observed frames.
 *
 * Frames that never showed up are dropped. The remaining ones are sorted
 * by their composite score in descending order, equal scores keep the order
 * of the frame table. Ranks are dense and start at 1.
 *
 * The computed score is stored back into @p metrics.
 *
 * @throws Speedscope::ParseError with kind NoMeasurableActivity when @p grandTotal <= 0
 */
QVector<Hotspot> rankHotspots(FrameMetricsTable* metrics, const QVector<Frame>& frames, double grandTotal);
}
