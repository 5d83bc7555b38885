/*
 * FetchGateway.h
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

#ifndef FETCHGATEWAY_H
#define FETCHGATEWAY_H

#include "Domain.h"

#include <QString>

/**
 * Error from one gateway call. Kind None means success; every other kind
 * carries a human-readable message() that ends up in the account's
 * lastError.
 */
struct FetchError {
    enum Kind {
        None,
        Http,                  // transport failure, HTTP error status or unparsable body
        MissingToken,          // empty token; detected before any network call
        BackgroundWorkerGone   // worker ended without delivering a result
    };

    Kind kind = None;
    QString detail;

    bool isError() const { return kind != None; }
    QString message() const;

    static FetchError http(const QString &detail);
    static FetchError missingToken();
    static FetchError workerGone();
};

/** Result of a full inbox fetch: a snapshot when error.kind is None. */
struct FetchOutcome {
    InboxSnapshot inbox;
    FetchError error;

    bool ok() const { return !error.isError(); }

    static FetchOutcome failure(const FetchError &error);
    /** Synthesized by BackgroundJob when the worker never delivered. */
    static FetchOutcome disconnected() { return failure(FetchError::workerGone()); }
};

/** Result of a mark-read / mark-done call. */
struct ActionOutcome {
    FetchError error;

    bool ok() const { return !error.isError(); }

    static ActionOutcome disconnected() { return { FetchError::workerGone() }; }
};

/**
 * Blocking network round-trips against GitHub. Implementations hold no
 * mutable state and are called concurrently from background job workers.
 */
class FetchGateway {
public:
    virtual ~FetchGateway() = default;

    virtual FetchOutcome fetchInbox(const GitHubAccount &profile) const = 0;
    virtual FetchError markNotificationRead(const GitHubAccount &profile, const QString &threadId) const = 0;
    virtual FetchError markNotificationDone(const GitHubAccount &profile, const QString &threadId) const = 0;
};

#endif // FETCHGATEWAY_H
