/*
 * AccountState.h
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

#ifndef ACCOUNTSTATE_H
#define ACCOUNTSTATE_H

#include "BackgroundJob.h"
#include "Domain.h"
#include "FetchGateway.h"
#include "Sections.h"

#include <QDateTime>
#include <QList>
#include <QSet>
#include <QString>

#include <chrono>
#include <memory>
#include <optional>

enum NotificationAction { ActionMarkRead, ActionMarkDone };

/**
 * Runtime state of one tracked account: last accepted snapshot, pending
 * background jobs, threads with a remote action in flight, and the buckets
 * flagged for emphasis.
 *
 * Owned and driven exclusively by the GUI thread. Workers never see this
 * object; they only hand results back through their job's QFuture, which
 * pollFetch() and pollActions() pick up on each controller tick.
 *
 * Fetch slot: Idle -> Fetching -> Idle (with snapshot or with error).
 * There is no cancelled state; startRefresh() while fetching drops the old
 * handle and the old worker's result is never looked at.
 */
class AccountState {
public:
    AccountState(const GitHubAccount &profile, std::shared_ptr<const FetchGateway> gateway);

    const GitHubAccount &profile() const { return m_profile; }
    const std::optional<InboxSnapshot> &inbox() const { return m_inbox; }
    /** Empty when the last operation succeeded. */
    const QString &lastError() const { return m_lastError; }

    bool hasPendingFetch() const { return m_pendingFetch.has_value(); }
    int pendingActionCount() const { return int(m_pendingActions.size()); }
    bool isInflight(const QString &threadId) const { return m_inflight.contains(threadId); }

    bool isHighlighted(SectionKind kind) const { return m_highlights.contains(kind); }
    const QSet<SectionKind> &highlights() const { return m_highlights; }

    /** Increases on every observable change; views compare it to skip rebuilds. */
    quint64 revision() const { return m_revision; }

    void startRefresh();
    /** Applies a finished fetch, if any. Returns true if state changed. */
    bool pollFetch();
    /** Applies every finished action job. Returns true if state changed. */
    bool pollActions();

    /** Returns false (and spawns nothing) while the thread already has an action in flight. */
    bool requestMarkRead(const QString &threadId);
    bool requestMarkDone(const QString &threadId);

    /** Local-only edit when the user opens a thread; the next refresh overwrites it. */
    void markSeenLocally(const QString &threadId);

    /** The controller presented this bucket's contents to the user. */
    void acknowledgeSection(SectionKind kind);

    bool needsRefresh(std::chrono::seconds threshold) const;
    bool needsRefresh(std::chrono::seconds threshold, const QDateTime &now) const;

private:
    struct PendingAction {
        QString threadId;
        NotificationAction action = ActionMarkRead;
        BackgroundJob<ActionOutcome> job;
    };

    bool requestAction(const QString &threadId, NotificationAction action);
    void applyFetch(const FetchOutcome &outcome);
    void applyActionSuccess(const QString &threadId, NotificationAction action);
    void touch() { ++m_revision; }

    GitHubAccount m_profile;
    std::shared_ptr<const FetchGateway> m_gateway;
    std::optional<InboxSnapshot> m_inbox;
    QString m_lastError;
    std::optional<BackgroundJob<FetchOutcome>> m_pendingFetch;
    QList<PendingAction> m_pendingActions;
    QSet<QString> m_inflight;
    QSet<SectionKind> m_highlights;
    quint64 m_revision = 0;
};

#endif // ACCOUNTSTATE_H
