/*
 * BackgroundJob.h
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

#ifndef BACKGROUNDJOB_H
#define BACKGROUNDJOB_H

#include <QFuture>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrentRun>

#include <optional>
#include <utility>

/**
 * Pool that runs every background job. Its thread cap is high enough that
 * jobs never queue behind each other in practice (accounts x concurrent
 * actions), so each job effectively gets its own worker thread.
 */
QThreadPool *backgroundJobPool();

/** Waits up to msecs for running workers; call before QApplication goes away. */
void drainBackgroundJobs(int msecs);

/**
 * One-shot asynchronous unit of work with a single-slot completion channel.
 *
 * The spawner owns the handle. Dropping it abandons the job: the worker runs
 * to completion and its result is discarded, nothing is signalled.
 *
 * T must provide a static T::disconnected() factory; tryTake() returns it
 * when the worker finished without delivering a value (it threw).
 */
template <typename T>
class BackgroundJob {
public:
    BackgroundJob() = default;
    explicit BackgroundJob(QFuture<T> future)
        : m_future(std::move(future))
    {}

    template <typename Work>
    static BackgroundJob spawn(Work work) {
        return BackgroundJob(QtConcurrent::run(backgroundJobPool(), std::move(work)));
    }

    /** True once the result has been handed out (or the job was never started). */
    bool isConsumed() const { return m_taken || !m_future.isValid(); }

    bool isFinished() const { return !isConsumed() && m_future.isFinished(); }

    /**
     * Non-blocking. Empty while the worker runs; the delivered result exactly
     * once when it is done; empty again afterwards.
     */
    std::optional<T> tryTake() {
        if (isConsumed() || !m_future.isFinished()) {
            return std::nullopt;
        }
        m_taken = true;
        if (m_future.resultCount() > 0) {
            return m_future.takeResult();
        }
        return T::disconnected();
    }

private:
    QFuture<T> m_future;
    bool m_taken = false;
};

#endif // BACKGROUNDJOB_H
