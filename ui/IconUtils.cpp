/*
 * IconUtils.cpp
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

#include "IconUtils.h"

#include <QFile>
#include <QImage>
#include <QPainter>
#include <QPixmap>
#include <QRectF>
#include <QSvgRenderer>

static const char *const CIRCLE_COLOURS[] = {
    "#6699CC", "#996633", "#339966", "#993366", "#666699", "#CC9933", "#33CC99", "#CC6699"
};
static const int CIRCLE_COLOUR_COUNT = int(sizeof(CIRCLE_COLOURS) / sizeof(CIRCLE_COLOURS[0]));

QString accountCircleStyleSheet(int colourIndex) {
    const QString hex = QLatin1String(CIRCLE_COLOURS[colourIndex % CIRCLE_COLOUR_COUNT]);
    return QStringLiteral("QLabel { border-radius: 14px; background-color: %1; color: #fff; font-weight: bold;"
                          " min-width: 28px; max-width: 28px; min-height: 28px; max-height: 28px; }").arg(hex);
}

static QPixmap renderSvg(QSvgRenderer &renderer, int edge, qreal devicePixelRatio) {
    QImage img(edge, edge, QImage::Format_ARGB32);
    img.fill(Qt::transparent);
    QPainter p(&img);
    renderer.render(&p, QRectF(0, 0, edge, edge));
    p.end();
    QPixmap px = QPixmap::fromImage(img);
    px.setDevicePixelRatio(devicePixelRatio);
    return px;
}

QIcon iconFromSvgResource(const QString &path, const QColor &color, int size) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        return QIcon();
    }
    QByteArray svg = f.readAll();
    svg.replace("currentColor", color.name(QColor::HexRgb).toLatin1());
    QSvgRenderer renderer(svg);
    if (!renderer.isValid()) {
        return QIcon();
    }
    QIcon icon;
    icon.addPixmap(renderSvg(renderer, size, 1.0));
    icon.addPixmap(renderSvg(renderer, qMin(size * 2, 128), 2.0));
    return icon;
}
