/*
 * Sections.h
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

#ifndef SECTIONS_H
#define SECTIONS_H

#include "Domain.h"

#include <QList>
#include <QString>
#include <QStringList>

/*
 * Notification buckets. Every item lands in exactly one bucket, derived from
 * its reason code on each render; reason codes we do not know fall into
 * SectionNotifications.
 */
enum SectionKind {
    SectionReviewRequests,
    SectionMentions,
    SectionNotifications
};

static const SectionKind AllSections[] = {
    SectionReviewRequests,
    SectionMentions,
    SectionNotifications
};

SectionKind sectionForReason(const QString &reason);

/** Stable identifier used for widget object names and logging. */
const char *sectionKey(SectionKind kind);

// GitHub may clear "unread" while a thread keeps changing after last_read_at,
// so a read thread with newer activity is flagged rather than shown as seen.
struct NotificationVisualState {
    bool seen = false;
    bool needsRevisit = false;
};

NotificationVisualState notificationState(const NotificationItem &item);

struct SectionCounts {
    int unseen = 0;
    int updated = 0;

    bool bumpedSince(const SectionCounts &previous) const {
        return unseen > previous.unseen || updated > previous.updated;
    }
};

SectionCounts summarizeCounts(const QList<const NotificationItem *> &items);

struct SectionStats {
    SectionCounts reviewRequests;
    SectionCounts mentions;
    SectionCounts notifications;

    const SectionCounts &counts(SectionKind kind) const;
};

/** Notifications of one bucket, in snapshot order. */
QList<const NotificationItem *> itemsInSection(const InboxSnapshot &inbox, SectionKind kind);

SectionStats sectionStats(const InboxSnapshot &inbox);

/** Case-insensitive substring filter; a blank query matches everything. */
class SearchFilter {
public:
    explicit SearchFilter(const QString &raw);

    bool isEmpty() const { return m_needle.isEmpty(); }
    bool matchesAny(const QStringList &fields) const;
    bool matches(const NotificationItem &item) const;

private:
    QString m_needle;
};

#endif // SECTIONS_H
