/*
 * RefreshScheduler.cpp
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

#include "RefreshScheduler.h"
#include "AccountState.h"

#include <cstdio>

RefreshScheduler::RefreshScheduler(std::chrono::milliseconds interval)
    : m_interval(interval)
{
}

bool RefreshScheduler::shouldTrigger(Clock::time_point now) const
{
    if (!m_lastRun) {
        return true;
    }
    return now - *m_lastRun >= m_interval;
}

bool autoRefreshAccounts(RefreshScheduler &scheduler, const QList<AccountState *> &accounts,
                         std::chrono::seconds staleAfter) {
    if (!scheduler.shouldTrigger()) {
        return false;
    }
    int refreshed = 0;
    for (AccountState *account : accounts) {
        if (account->hasPendingFetch()) {
            continue;
        }
        if (account->needsRefresh(staleAfter)) {
            account->startRefresh();
            ++refreshed;
        }
    }
    if (refreshed == 0) {
        return false;
    }
    fprintf(stderr, "[refresh] auto-refreshing %d account(s)\n", refreshed);
    scheduler.markTriggered();
    return true;
}
