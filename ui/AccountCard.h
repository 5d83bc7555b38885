/*
 * AccountCard.h
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

#ifndef ACCOUNTCARD_H
#define ACCOUNTCARD_H

#include "NotificationSection.h"
#include "Sections.h"

#include <QFrame>
#include <QList>

class QLabel;
class QLineEdit;
class QListWidget;
class QPushButton;
class QWidget;
class AccountState;

/**
 * Dashboard card for one tracked account: header with show/hide toggle and
 * search box, sync status, the three notification sections and the recent
 * reviews list.
 *
 * The card does not own its AccountState; DashboardController deletes the
 * card before it drops the state. Expanded/search state is view-only and
 * lives here, not in the account.
 */
class AccountCard : public QFrame {
    Q_OBJECT
public:
    AccountCard(AccountState *state, const RowOptions &options, QWidget *parent = nullptr);

    bool isExpanded() const { return m_expanded; }
    void setExpanded(bool expanded);
    QString searchText() const;
    void setSearchText(const QString &text);

    /** Re-render only if the account changed since the last render. */
    void renderIfChanged();
    void render();

    /** Sections whose contents are currently on screen (card and section expanded, snapshot loaded). */
    QList<SectionKind> presentedSections() const;

    NotificationSection *section(SectionKind kind) const;
    QListWidget *recentReviewsList() const { return m_reviewsList; }

private:
    void scheduleRender();
    void renderStatus();
    void renderRecentReviews();
    void openThread(const QString &threadId, const QString &url);

    AccountState *m_state;
    RowOptions m_options;
    bool m_expanded = true;
    bool m_renderPending = false;
    quint64 m_renderedRevision = 0;
    bool m_everRendered = false;

    QLabel *m_titleLabel = nullptr;
    QPushButton *m_toggleBtn = nullptr;
    QLineEdit *m_searchEdit = nullptr;
    QLabel *m_syncLabel = nullptr;
    QLabel *m_errorLabel = nullptr;
    QLabel *m_fetchingLabel = nullptr;
    QLabel *m_noDataLabel = nullptr;
    QWidget *m_body = nullptr;
    QList<NotificationSection *> m_sections;
    QLabel *m_reviewsTitle = nullptr;
    QListWidget *m_reviewsList = nullptr;
};

#endif // ACCOUNTCARD_H
