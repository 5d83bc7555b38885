/*
 * RefreshScheduler.h
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

#ifndef REFRESHSCHEDULER_H
#define REFRESHSCHEDULER_H

#include <QList>

#include <chrono>
#include <optional>

class AccountState;

/**
 * Single timer shared by all accounts. Constructed once in main() and
 * handed to the dashboard controller.
 */
class RefreshScheduler {
public:
    using Clock = std::chrono::steady_clock;

    explicit RefreshScheduler(std::chrono::milliseconds interval);

    std::chrono::milliseconds interval() const { return m_interval; }

    /** True if never fired, or at least interval() has passed since the last firing. */
    bool shouldTrigger() const { return shouldTrigger(Clock::now()); }
    bool shouldTrigger(Clock::time_point now) const;

    void markTriggered() { markTriggered(Clock::now()); }
    void markTriggered(Clock::time_point now) { m_lastRun = now; }

private:
    std::chrono::milliseconds m_interval;
    std::optional<Clock::time_point> m_lastRun;
};

/**
 * One auto-refresh pass. When the scheduler is due, refreshes every account
 * that has no fetch in flight and whose snapshot is missing or older than
 * staleAfter. The scheduler is re-armed only if something was refreshed, so
 * an idle pass neither resets the window nor fires on every tick.
 * Returns true if any account was refreshed.
 */
bool autoRefreshAccounts(RefreshScheduler &scheduler, const QList<AccountState *> &accounts,
                         std::chrono::seconds staleAfter);

#endif // REFRESHSCHEDULER_H
