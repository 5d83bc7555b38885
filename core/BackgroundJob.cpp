/*
 * BackgroundJob.cpp
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

#include "BackgroundJob.h"

#include <cstdio>

QThreadPool *backgroundJobPool() {
    static QThreadPool *pool = [] {
        auto *p = new QThreadPool();
        // Workers mostly sit in blocking network calls; never make one wait for another.
        p->setMaxThreadCount(256);
        p->setExpiryTimeout(60000);
        return p;
    }();
    return pool;
}

void drainBackgroundJobs(int msecs) {
    QThreadPool *pool = backgroundJobPool();
    const int active = pool->activeThreadCount();
    if (active > 0) {
        fprintf(stderr, "[jobs] waiting for %d background job(s)\n", active);
    }
    if (!pool->waitForDone(msecs)) {
        fprintf(stderr, "[jobs] background jobs still running after %d ms; exiting anyway\n", msecs);
    }
}
