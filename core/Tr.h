/*
 * Tr.h
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

#ifndef TR_H
#define TR_H

#include <QCoreApplication>

// Every UI string lives in the "Reminder" context of i18n/reminder_en.ts,
// keyed by area then purpose: accounts.add, card.fetching, section.mentions.empty.
inline QString TR(const char *key) {
    return QCoreApplication::translate("Reminder", key);
}

#endif // TR_H
