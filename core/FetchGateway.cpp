/*
 * FetchGateway.cpp
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

#include "FetchGateway.h"

QString FetchError::message() const
{
    switch (kind) {
    case None:
        return QString();
    case Http:
        return QStringLiteral("GitHub API request failed: %1").arg(detail);
    case MissingToken:
        return QStringLiteral("Account token is missing");
    case BackgroundWorkerGone:
        return QStringLiteral("Background worker disconnected before returning a result");
    }
    return detail;
}

FetchError FetchError::http(const QString &detail)
{
    return { Http, detail };
}

FetchError FetchError::missingToken()
{
    return { MissingToken, QString() };
}

FetchError FetchError::workerGone()
{
    return { BackgroundWorkerGone, QString() };
}

FetchOutcome FetchOutcome::failure(const FetchError &error)
{
    FetchOutcome outcome;
    outcome.error = error;
    return outcome;
}
