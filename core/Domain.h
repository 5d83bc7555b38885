/*
 * Domain.h
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

#ifndef DOMAIN_H
#define DOMAIN_H

#include <QDateTime>
#include <QList>
#include <QString>

// Credentials for one tracked GitHub account. Replaced wholesale on edit.
struct GitHubAccount {
    QString login;
    QString token;
};

struct NotificationItem {
    QString threadId;     // unique within one snapshot
    QString repo;         // owner/name
    QString title;
    QString url;          // human-facing page; empty when GitHub gives no subject URL
    QString reason;       // review_requested, mention, team_mention, subscribed, ...
    QDateTime updatedAt;
    QDateTime lastReadAt; // invalid when the thread was never read
    bool unread = false;
};

struct ReviewRequest {
    quint64 id = 0;
    QString repo;
    QString title;        // "#<number> <title>"
    QString url;
    QDateTime updatedAt;
    QString requestedBy;  // empty if the search result carried no user
};

enum MentionKind { MentionIssue, MentionPullRequest };

struct MentionThread {
    quint64 id = 0;
    QString repo;
    QString title;
    QString url;
    QDateTime updatedAt;
    MentionKind kind = MentionIssue;
};

struct ReviewSummary {
    quint64 id = 0;
    QString repo;
    QString title;
    QString url;
    QDateTime updatedAt;
    QString state;        // open / closed
};

/**
 * One complete result of a full inbox fetch. Accepted snapshots replace the
 * previous one atomically; only optimistic edits mutate a snapshot afterwards.
 */
struct InboxSnapshot {
    QList<NotificationItem> notifications;
    QList<ReviewRequest> reviewRequests;
    QList<MentionThread> mentions;
    QList<ReviewSummary> recentReviews;
    QDateTime fetchedAt;

    /** Returns the notification with the given thread id, or nullptr. */
    NotificationItem *findNotification(const QString &threadId);
    const NotificationItem *findNotification(const QString &threadId) const;
};

#endif // DOMAIN_H
