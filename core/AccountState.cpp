/*
 * AccountState.cpp
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

#include "AccountState.h"

#include <cstdio>
#include <utility>

AccountState::AccountState(const GitHubAccount &profile, std::shared_ptr<const FetchGateway> gateway)
    : m_profile(profile)
    , m_gateway(std::move(gateway))
{
}

void AccountState::startRefresh()
{
    m_lastError.clear();
    std::shared_ptr<const FetchGateway> gateway = m_gateway;
    GitHubAccount profile = m_profile;
    // Assigning drops the previous handle; a still-running fetch is abandoned.
    m_pendingFetch = BackgroundJob<FetchOutcome>::spawn([gateway, profile]() {
        return gateway->fetchInbox(profile);
    });
    touch();
}

bool AccountState::pollFetch()
{
    if (!m_pendingFetch) {
        return false;
    }
    std::optional<FetchOutcome> outcome = m_pendingFetch->tryTake();
    if (!outcome) {
        return false;
    }
    m_pendingFetch.reset();
    applyFetch(*outcome);
    touch();
    return true;
}

void AccountState::applyFetch(const FetchOutcome &outcome)
{
    if (!outcome.ok()) {
        // Keep the stale snapshot on screen; only the error line changes.
        m_lastError = outcome.error.message();
        fprintf(stderr, "[fetch] %s: %s\n", qPrintable(m_profile.login), qPrintable(m_lastError));
        return;
    }

    // With no previous snapshot every bucket compares against zero counts.
    const SectionStats previous = m_inbox ? sectionStats(*m_inbox) : SectionStats();
    const SectionStats next = sectionStats(outcome.inbox);
    for (SectionKind kind : AllSections) {
        if (next.counts(kind).bumpedSince(previous.counts(kind))) {
            m_highlights.insert(kind);
        }
    }

    m_inbox = outcome.inbox;
    m_lastError.clear();
}

bool AccountState::pollActions()
{
    QList<std::pair<PendingAction, ActionOutcome>> finished;
    for (auto it = m_pendingActions.begin(); it != m_pendingActions.end();) {
        std::optional<ActionOutcome> outcome = it->job.tryTake();
        if (!outcome) {
            ++it;
            continue;
        }
        finished.append({ *it, *outcome });
        it = m_pendingActions.erase(it);
    }
    if (finished.isEmpty()) {
        return false;
    }

    for (const auto &entry : finished) {
        const PendingAction &action = entry.first;
        const ActionOutcome &outcome = entry.second;
        if (outcome.ok()) {
            applyActionSuccess(action.threadId, action.action);
        } else {
            m_lastError = outcome.error.message();
            fprintf(stderr, "[action] %s thread %s: %s\n", qPrintable(m_profile.login),
                            qPrintable(action.threadId), qPrintable(m_lastError));
        }
        m_inflight.remove(action.threadId);
    }
    touch();
    return true;
}

void AccountState::applyActionSuccess(const QString &threadId, NotificationAction action)
{
    if (!m_inbox) {
        return;
    }
    // The snapshot may have been replaced since the job started; a missing
    // thread simply means there is nothing left to edit.
    NotificationItem *item = m_inbox->findNotification(threadId);
    if (!item) {
        return;
    }
    item->unread = false;
    if (action == ActionMarkDone) {
        item->lastReadAt = QDateTime::currentDateTimeUtc();
    } else {
        // Reading up to updatedAt clears "needs revisit" until new activity lands.
        item->lastReadAt = item->updatedAt;
    }
}

bool AccountState::requestMarkRead(const QString &threadId)
{
    return requestAction(threadId, ActionMarkRead);
}

bool AccountState::requestMarkDone(const QString &threadId)
{
    return requestAction(threadId, ActionMarkDone);
}

bool AccountState::requestAction(const QString &threadId, NotificationAction action)
{
    if (m_inflight.contains(threadId)) {
        return false;
    }
    std::shared_ptr<const FetchGateway> gateway = m_gateway;
    GitHubAccount profile = m_profile;
    PendingAction pending;
    pending.threadId = threadId;
    pending.action = action;
    pending.job = BackgroundJob<ActionOutcome>::spawn([gateway, profile, threadId, action]() {
        ActionOutcome outcome;
        outcome.error = action == ActionMarkDone
            ? gateway->markNotificationDone(profile, threadId)
            : gateway->markNotificationRead(profile, threadId);
        return outcome;
    });
    m_pendingActions.append(pending);
    m_inflight.insert(threadId);
    touch();
    return true;
}

void AccountState::markSeenLocally(const QString &threadId)
{
    if (!m_inbox) {
        return;
    }
    NotificationItem *item = m_inbox->findNotification(threadId);
    if (!item) {
        return;
    }
    if (!item->unread && item->lastReadAt == item->updatedAt) {
        return;
    }
    item->unread = false;
    item->lastReadAt = item->updatedAt;
    touch();
}

void AccountState::acknowledgeSection(SectionKind kind)
{
    if (m_highlights.remove(kind)) {
        touch();
    }
}

bool AccountState::needsRefresh(std::chrono::seconds threshold) const
{
    return needsRefresh(threshold, QDateTime::currentDateTimeUtc());
}

bool AccountState::needsRefresh(std::chrono::seconds threshold, const QDateTime &now) const
{
    if (!m_inbox || !m_inbox->fetchedAt.isValid()) {
        return true;
    }
    const std::chrono::milliseconds age(m_inbox->fetchedAt.msecsTo(now));
    return age >= threshold;
}
