/*
    SPDX-FileCopyrightText: Erik Johansson <erik@ejohansson.se>
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include <QThread>

#include <KConfigGroup>
#include <KSharedConfig>

#include "settings.h"

#include <algorithm>

Settings::~Settings() = default;

Settings* Settings::instance()
{
    static Settings settings;
    Q_ASSERT(QThread::currentThread() == settings.thread());
    return &settings;
}

Settings::OutputFormat Settings::outputFormatFromString(const QString& format, bool* ok)
{
    const auto lower = format.trimmed().toLower();
    if (ok) {
        *ok = true;
    }
    if (lower == QLatin1String("json")) {
        return OutputFormat::Json;
    } else if (lower != QLatin1String("table") && ok) {
        *ok = false;
    }
    return OutputFormat::Table;
}

QString Settings::outputFormatToString(Settings::OutputFormat format)
{
    switch (format) {
    case OutputFormat::Json:
        return QStringLiteral("json");
    case OutputFormat::Table:
        break;
    }
    return QStringLiteral("table");
}

void Settings::setOutputFormat(Settings::OutputFormat format)
{
    if (m_outputFormat != format) {
        m_outputFormat = format;
        emit outputFormatChanged(m_outputFormat);
    }
}

void Settings::setTopCount(int count)
{
    count = std::max(0, count);
    if (m_topCount != count) {
        m_topCount = count;
        emit topCountChanged(m_topCount);
    }
}

void Settings::setMaxFileSize(qint64 size)
{
    size = std::max<qint64>(0, size);
    if (m_maxFileSize != size) {
        m_maxFileSize = size;
        emit maxFileSizeChanged(m_maxFileSize);
    }
}

void Settings::loadFromFile()
{
    auto sharedConfig = KSharedConfig::openConfig();

    const auto output = sharedConfig->group(QStringLiteral("Output"));
    setOutputFormat(outputFormatFromString(output.readEntry("format", QStringLiteral("table"))));
    setTopCount(output.readEntry("topCount", 0));

    const auto input = sharedConfig->group(QStringLiteral("Input"));
    setMaxFileSize(input.readEntry("maxFileSize", DefaultMaxFileSize));
}

void Settings::saveToFile()
{
    auto sharedConfig = KSharedConfig::openConfig();

    auto output = sharedConfig->group(QStringLiteral("Output"));
    output.writeEntry("format", outputFormatToString(m_outputFormat));
    output.writeEntry("topCount", m_topCount);

    sharedConfig->group(QStringLiteral("Input")).writeEntry("maxFileSize", m_maxFileSize);
    sharedConfig->sync();
}
