/*
 * Config.cpp
 * Copyright (C) 2026 Chris Burdess
 *
 * This file is part of Reminder, a multi-account GitHub notification client.
 *
 * Reminder is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Reminder is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Reminder.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Config.h"
#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QStandardPaths>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include <algorithm>
#include <cstdio>

static const char DEFAULT_API_BASE_URL[] = "https://api.github.com";
static const char DEFAULT_DATE_FORMAT[] = "yyyy-MM-dd HH:mm";

QString reminderConfigDir() {
    QString path = QStandardPaths::writableLocation(QStandardPaths::HomeLocation) + QStringLiteral("/.reminder");
    QDir().mkpath(path);
    return path;
}

QString reminderConfigPath() {
    return reminderConfigDir() + QStringLiteral("/config.xml");
}

// Out-of-range or garbled values fall back to the default, then clamp.
static int intAttr(const QXmlStreamAttributes &a, const char *name, int defaultVal) {
    bool ok = false;
    int v = a.value(QLatin1String(name)).toInt(&ok);
    return ok ? v : defaultVal;
}

static void applyDefaults(Config &c) {
    c.refreshIntervalSeconds = std::max(c.refreshIntervalSeconds, 30);
    c.staleAfterSeconds = std::max(c.staleAfterSeconds, 30);
    c.pollIntervalMs = std::clamp(c.pollIntervalMs, 100, 5000);
    c.timeoutSeconds = std::clamp(c.timeoutSeconds, 5, 300);
    while (c.apiBaseUrl.endsWith(QLatin1Char('/'))) {
        c.apiBaseUrl.chop(1);
    }
    if (c.apiBaseUrl.isEmpty()) {
        c.apiBaseUrl = QLatin1String(DEFAULT_API_BASE_URL);
    }
    if (c.dateFormat.isEmpty()) {
        c.dateFormat = QLatin1String(DEFAULT_DATE_FORMAT);
    }
}

Config loadConfig() {
    return loadConfig(reminderConfigPath());
}

Config loadConfig(const QString &path) {
    Config c;
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        applyDefaults(c);
        return c;
    }
    QXmlStreamReader r(&f);
    while (!r.atEnd()) {
        r.readNext();
        if (!r.isStartElement()) {
            continue;
        }
        const QXmlStreamAttributes a = r.attributes();
        if (r.name() == QLatin1String("refresh")) {
            c.refreshIntervalSeconds = intAttr(a, "interval-seconds", c.refreshIntervalSeconds);
            c.staleAfterSeconds = intAttr(a, "stale-after-seconds", c.staleAfterSeconds);
            c.pollIntervalMs = intAttr(a, "poll-interval-ms", c.pollIntervalMs);
        } else if (r.name() == QLatin1String("network")) {
            c.apiBaseUrl = a.value(QLatin1String("api-base-url")).toString().trimmed();
            c.timeoutSeconds = intAttr(a, "timeout-seconds", c.timeoutSeconds);
        } else if (r.name() == QLatin1String("viewing")) {
            c.dateFormat = a.value(QLatin1String("date-format")).toString();
            c.showDoneAction = (a.value(QLatin1String("show-done-action")) == QLatin1String("1"));
        }
    }
    if (r.hasError()) {
        fprintf(stderr, "[config] %s: %s; using defaults for the rest\n",
                        qPrintable(path), qPrintable(r.errorString()));
    }
    f.close();
    applyDefaults(c);
    return c;
}

bool saveConfig(const Config &c) {
    return saveConfig(c, reminderConfigPath());
}

bool saveConfig(const Config &c, const QString &path) {
    QSaveFile f(path);
    if (!f.open(QIODevice::WriteOnly)) {
        fprintf(stderr, "[config] cannot write %s: %s\n", qPrintable(path), qPrintable(f.errorString()));
        return false;
    }
    QXmlStreamWriter w(&f);
    w.setAutoFormatting(true);
    w.writeStartDocument(QStringLiteral("1.0"), true);
    w.writeStartElement(QStringLiteral("reminder"));
    w.writeStartElement(QStringLiteral("refresh"));
    w.writeAttribute(QStringLiteral("interval-seconds"), QString::number(c.refreshIntervalSeconds));
    w.writeAttribute(QStringLiteral("stale-after-seconds"), QString::number(c.staleAfterSeconds));
    w.writeAttribute(QStringLiteral("poll-interval-ms"), QString::number(c.pollIntervalMs));
    w.writeEndElement();
    w.writeStartElement(QStringLiteral("network"));
    w.writeAttribute(QStringLiteral("api-base-url"),
                     c.apiBaseUrl.isEmpty() ? QString::fromLatin1(DEFAULT_API_BASE_URL) : c.apiBaseUrl);
    w.writeAttribute(QStringLiteral("timeout-seconds"), QString::number(c.timeoutSeconds));
    w.writeEndElement();
    w.writeStartElement(QStringLiteral("viewing"));
    w.writeAttribute(QStringLiteral("date-format"),
                     c.dateFormat.isEmpty() ? QString::fromLatin1(DEFAULT_DATE_FORMAT) : c.dateFormat);
    w.writeAttribute(QStringLiteral("show-done-action"), c.showDoneAction ? QStringLiteral("1") : QStringLiteral("0"));
    w.writeEndElement();
    w.writeEndElement();
    w.writeEndDocument();
    if (!f.commit()) {
        fprintf(stderr, "[config] cannot commit %s: %s\n", qPrintable(path), qPrintable(f.errorString()));
        return false;
    }
    return true;
}
