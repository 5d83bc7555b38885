/*
 * IconUtils.h
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

#ifndef ICONUTILS_H
#define ICONUTILS_H

#include <QColor>
#include <QIcon>
#include <QString>

// Stylesheet for the circle label beside account n in the accounts list:
// one of a fixed set of colours (wrapping around), white initial.
QString accountCircleStyleSheet(int colourIndex);

// Render a bundled SVG (":/icons/...") with currentColor replaced by color,
// at size and at 2*size for HiDPI. Null icon if the resource is missing.
QIcon iconFromSvgResource(const QString &path, const QColor &color, int size = 16);

#endif // ICONUTILS_H
