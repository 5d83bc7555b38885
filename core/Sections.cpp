/*
 * Sections.cpp
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

#include "Sections.h"

static const char ReviewRequestReason[] = "review_requested";

SectionKind sectionForReason(const QString &reason) {
    if (reason == QLatin1String(ReviewRequestReason)) {
        return SectionReviewRequests;
    }
    if (reason == QLatin1String("mention") || reason == QLatin1String("team_mention")) {
        return SectionMentions;
    }
    return SectionNotifications;
}

const char *sectionKey(SectionKind kind) {
    switch (kind) {
    case SectionReviewRequests:
        return "review-requests";
    case SectionMentions:
        return "mentions";
    case SectionNotifications:
        break;
    }
    return "notifications";
}

NotificationVisualState notificationState(const NotificationItem &item) {
    NotificationVisualState state;
    state.needsRevisit = item.lastReadAt.isValid() && item.updatedAt > item.lastReadAt;
    state.seen = !item.unread && !state.needsRevisit;
    return state;
}

SectionCounts summarizeCounts(const QList<const NotificationItem *> &items) {
    SectionCounts counts;
    for (const NotificationItem *item : items) {
        if (item->unread) {
            ++counts.unseen;
        }
        if (notificationState(*item).needsRevisit) {
            ++counts.updated;
        }
    }
    return counts;
}

const SectionCounts &SectionStats::counts(SectionKind kind) const
{
    switch (kind) {
    case SectionReviewRequests:
        return reviewRequests;
    case SectionMentions:
        return mentions;
    case SectionNotifications:
        break;
    }
    return notifications;
}

QList<const NotificationItem *> itemsInSection(const InboxSnapshot &inbox, SectionKind kind) {
    QList<const NotificationItem *> items;
    for (const NotificationItem &item : inbox.notifications) {
        if (sectionForReason(item.reason) == kind) {
            items.append(&item);
        }
    }
    return items;
}

SectionStats sectionStats(const InboxSnapshot &inbox) {
    SectionStats stats;
    stats.reviewRequests = summarizeCounts(itemsInSection(inbox, SectionReviewRequests));
    stats.mentions = summarizeCounts(itemsInSection(inbox, SectionMentions));
    stats.notifications = summarizeCounts(itemsInSection(inbox, SectionNotifications));
    return stats;
}

SearchFilter::SearchFilter(const QString &raw)
    : m_needle(raw.trimmed().toLower())
{
}

bool SearchFilter::matchesAny(const QStringList &fields) const
{
    if (m_needle.isEmpty()) {
        return true;
    }
    for (const QString &field : fields) {
        if (field.toLower().contains(m_needle)) {
            return true;
        }
    }
    return false;
}

bool SearchFilter::matches(const NotificationItem &item) const
{
    return matchesAny({ item.repo, item.title, item.reason });
}
