/*
 * Config.h
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

#ifndef CONFIG_H
#define CONFIG_H

#include <QString>

// Config under ~/.reminder/config.xml. One element per area, values as attributes.
struct Config {
    // Auto-refresh
    int refreshIntervalSeconds = 180;   // min 30
    int staleAfterSeconds = 180;        // min 30
    int pollIntervalMs = 500;           // UI tick, 100..5000
    // Network
    QString apiBaseUrl;                 // empty = https://api.github.com
    int timeoutSeconds = 30;            // per-request transfer timeout, 5..300
    // Viewing
    QString dateFormat;                 // Qt date format string for row timestamps
    bool showDoneAction = false;        // expose "Done" next to "Mark read"
};

QString reminderConfigDir();
QString reminderConfigPath();

Config loadConfig();
Config loadConfig(const QString &path);
bool saveConfig(const Config &c);
bool saveConfig(const Config &c, const QString &path);

#endif // CONFIG_H
