/*
 * NotificationSection.h
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

#ifndef NOTIFICATIONSECTION_H
#define NOTIFICATIONSECTION_H

#include "Sections.h"

#include <QList>
#include <QString>
#include <QWidget>

class QLabel;
class QToolButton;
class QTreeWidget;
class QTreeWidgetItem;
class AccountState;

// Per-row presentation options, taken from the <viewing> config element.
struct RowOptions {
    QString dateFormat;
    bool showDoneAction = false;
};

/**
 * One collapsible bucket of an account card: a header button showing the
 * counts, then either a notification table or a placeholder label.
 * The widget lives as long as its card, so its collapse state survives
 * every re-render.
 */
class NotificationSection : public QWidget {
    Q_OBJECT
public:
    enum Column { ColRepository, ColSubject, ColReason, ColUpdated, ColActions, ColumnCount };

    explicit NotificationSection(SectionKind kind, QWidget *parent = nullptr);

    SectionKind kind() const { return m_kind; }
    bool isExpanded() const;
    void setExpanded(bool expanded);

    void render(const QList<const NotificationItem *> &items, const SearchFilter &filter,
                const AccountState &state, const RowOptions &options);

    QTreeWidget *table() const { return m_table; }
    QToolButton *header() const { return m_header; }

signals:
    void expandedChanged(bool expanded);
    void threadActivated(const QString &threadId, const QString &url);
    void markReadRequested(const QString &threadId);
    void markDoneRequested(const QString &threadId);

private:
    void addRow(const NotificationItem &item, const AccountState &state, const RowOptions &options);

    SectionKind m_kind;
    QToolButton *m_header = nullptr;
    QLabel *m_placeholder = nullptr;
    QTreeWidget *m_table = nullptr;
};

QString sectionTitle(SectionKind kind);
QString sectionEmptyText(SectionKind kind);

#endif // NOTIFICATIONSECTION_H
