/*
    SPDX-FileCopyrightText: Erik Johansson <erik@ejohansson.se>
    SPDX-FileCopyrightText: Milian Wolff <milian.wolff@kdab.com>
    SPDX-FileCopyrightText: 2016-2022 Klarälvdalens Datakonsult AB, a KDAB Group company, info@kdab.com

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#pragma once

#include <QObject>

class Settings : public QObject
{
    Q_OBJECT
    Q_DISABLE_COPY(Settings)

public:
    enum class OutputFormat : int
    {
        Table,
        Json,
    };
    Q_ENUM(OutputFormat);

    // 10 MiB
    static constexpr qint64 DefaultMaxFileSize = 10 * 1024 * 1024;

    static Settings* instance();

    OutputFormat outputFormat() const
    {
        return m_outputFormat;
    }

    // 0 means all hotspots
    int topCount() const
    {
        return m_topCount;
    }

    // 0 disables the limit
    qint64 maxFileSize() const
    {
        return m_maxFileSize;
    }

    void loadFromFile();
    // only called on request, command line overrides are not persisted otherwise
    void saveToFile();

    static OutputFormat outputFormatFromString(const QString& format, bool* ok = nullptr);
    static QString outputFormatToString(OutputFormat format);

public slots:
    void setOutputFormat(OutputFormat format);
    void setTopCount(int count);
    void setMaxFileSize(qint64 size);

signals:
    void outputFormatChanged(OutputFormat format);
    void topCountChanged(int count);
    void maxFileSizeChanged(qint64 size);

private:
    Settings() = default;
    ~Settings();

    OutputFormat m_outputFormat = OutputFormat::Table;
    int m_topCount = 0;
    qint64 m_maxFileSize = DefaultMaxFileSize;
};
