/*
 * GitHubClient.h
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

#ifndef GITHUBCLIENT_H
#define GITHUBCLIENT_H

#include "FetchGateway.h"

#include <QByteArray>
#include <QJsonDocument>
#include <QList>
#include <QString>
#include <QUrl>

/**
 * FetchGateway over the GitHub REST API.
 *
 * Every call creates its own QNetworkAccessManager and spins a local event
 * loop until the reply finishes, so it blocks the calling thread and must
 * only be used from background job workers.
 */
class GitHubClient : public FetchGateway {
public:
    explicit GitHubClient(const QString &apiBaseUrl = defaultApiBaseUrl(), int timeoutSeconds = 30);

    static QString defaultApiBaseUrl() { return QStringLiteral("https://api.github.com"); }
    static QByteArray userAgent() { return QByteArrayLiteral("reminder-qt/0.1"); }

    QString apiBaseUrl() const { return m_apiBase; }

    FetchOutcome fetchInbox(const GitHubAccount &profile) const override;
    FetchError markNotificationRead(const GitHubAccount &profile, const QString &threadId) const override;
    FetchError markNotificationDone(const GitHubAccount &profile, const QString &threadId) const override;

private:
    QUrl endpoint(const QString &path) const;
    QUrl searchUrl(const QString &query, bool newestFirst) const;
    /** Runs one request to completion. Fills body on success. */
    FetchError execute(const GitHubAccount &profile, const QByteArray &verb, const QUrl &url, QByteArray *body) const;
    FetchError getJson(const GitHubAccount &profile, const QUrl &url, QJsonDocument *doc) const;

    QString m_apiBase;
    int m_timeoutMs;
};

// JSON decoding of GitHub responses. Each returns false and sets error when
// the document does not have the expected shape.
bool parseNotifications(const QJsonDocument &doc, QList<NotificationItem> *items, QString *error);
bool parseReviewRequests(const QJsonDocument &doc, QList<ReviewRequest> *items, QString *error);
bool parseMentions(const QJsonDocument &doc, QList<MentionThread> *items, QString *error);
bool parseRecentReviews(const QJsonDocument &doc, QList<ReviewSummary> *items, QString *error);

/** Subject API URL -> browser URL (".../repos/o/r/pulls/1" -> "https://github.com/o/r/pull/1"). */
QString htmlUrlFromApiUrl(const QString &apiUrl);
/** "https://api.github.com/repos/o/r" -> "o/r". */
QString repoNameFromApiUrl(const QString &repositoryUrl);
MentionKind classifyThread(const QString &htmlUrl);

#endif // GITHUBCLIENT_H
