/*
 * GitHubClient.cpp
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

#include "GitHubClient.h"

#include <QEventLoop>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrlQuery>

#include <cstdio>

static QDateTime parseTimestamp(const QJsonValue &v) {
    if (!v.isString()) {
        return QDateTime();
    }
    QDateTime dt = QDateTime::fromString(v.toString(), Qt::ISODate);
    return dt.isValid() ? dt.toUTC() : QDateTime();
}

GitHubClient::GitHubClient(const QString &apiBaseUrl, int timeoutSeconds)
    : m_apiBase(apiBaseUrl)
    , m_timeoutMs(timeoutSeconds * 1000)
{
    while (m_apiBase.endsWith(QLatin1Char('/'))) {
        m_apiBase.chop(1);
    }
}

QUrl GitHubClient::endpoint(const QString &path) const
{
    return QUrl(m_apiBase + path);
}

QUrl GitHubClient::searchUrl(const QString &query, bool newestFirst) const
{
    QUrl url = endpoint(QStringLiteral("/search/issues"));
    QUrlQuery q;
    q.addQueryItem(QStringLiteral("q"), query);
    if (newestFirst) {
        q.addQueryItem(QStringLiteral("sort"), QStringLiteral("updated"));
        q.addQueryItem(QStringLiteral("order"), QStringLiteral("desc"));
    }
    url.setQuery(q);
    return url;
}

FetchError GitHubClient::execute(const GitHubAccount &profile, const QByteArray &verb, const QUrl &url, QByteArray *body) const
{
    QNetworkAccessManager nam;
    QNetworkRequest req{url};
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                     QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setHeader(QNetworkRequest::UserAgentHeader, userAgent());
    req.setRawHeader("Accept", "application/vnd.github+json");
    req.setRawHeader("X-GitHub-Api-Version", "2022-11-28");
    req.setRawHeader("Authorization", "Bearer " + profile.token.toUtf8());
    req.setTransferTimeout(m_timeoutMs);

    QNetworkReply *reply = nam.sendCustomRequest(req, verb);
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    loop.exec();

    const QByteArray payload = reply->readAll();
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    FetchError error;
    if (reply->error() != QNetworkReply::NoError) {
        // GitHub explains most failures in a {"message": ...} body.
        QString detail = QJsonDocument::fromJson(payload).object().value(QLatin1String("message")).toString();
        if (detail.isEmpty()) {
            detail = reply->errorString();
        }
        error = FetchError::http(status > 0
            ? QStringLiteral("HTTP %1 for %2: %3").arg(status).arg(url.path(), detail)
            : detail);
        fprintf(stderr, "[fetch] %s %s failed: %s\n", verb.constData(),
                        qPrintable(url.path()), qPrintable(detail));
    } else if (body) {
        *body = payload;
    }
    reply->deleteLater();
    return error;
}

FetchError GitHubClient::getJson(const GitHubAccount &profile, const QUrl &url, QJsonDocument *doc) const
{
    QByteArray body;
    FetchError error = execute(profile, QByteArrayLiteral("GET"), url, &body);
    if (error.isError()) {
        return error;
    }
    QJsonParseError parseError;
    *doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return FetchError::http(QStringLiteral("invalid JSON from %1: %2")
                                    .arg(url.path(), parseError.errorString()));
    }
    return error;
}

FetchOutcome GitHubClient::fetchInbox(const GitHubAccount &profile) const
{
    if (profile.token.isEmpty()) {
        return FetchOutcome::failure(FetchError::missingToken());
    }

    FetchOutcome outcome;
    QJsonDocument doc;
    QString parseError;

    QUrl notificationsUrl = endpoint(QStringLiteral("/notifications"));
    notificationsUrl.setQuery(QStringLiteral("all=true"));
    FetchError error = getJson(profile, notificationsUrl, &doc);
    if (error.isError()) {
        return FetchOutcome::failure(error);
    }
    if (!parseNotifications(doc, &outcome.inbox.notifications, &parseError)) {
        return FetchOutcome::failure(FetchError::http(parseError));
    }

    error = getJson(profile, searchUrl(QStringLiteral("is:pr state:open review-requested:%1").arg(profile.login), false), &doc);
    if (error.isError()) {
        return FetchOutcome::failure(error);
    }
    if (!parseReviewRequests(doc, &outcome.inbox.reviewRequests, &parseError)) {
        return FetchOutcome::failure(FetchError::http(parseError));
    }

    error = getJson(profile, searchUrl(QStringLiteral("mentions:%1 is:open").arg(profile.login), true), &doc);
    if (error.isError()) {
        return FetchOutcome::failure(error);
    }
    if (!parseMentions(doc, &outcome.inbox.mentions, &parseError)) {
        return FetchOutcome::failure(FetchError::http(parseError));
    }

    error = getJson(profile, searchUrl(QStringLiteral("is:pr reviewed-by:%1").arg(profile.login), true), &doc);
    if (error.isError()) {
        return FetchOutcome::failure(error);
    }
    if (!parseRecentReviews(doc, &outcome.inbox.recentReviews, &parseError)) {
        return FetchOutcome::failure(FetchError::http(parseError));
    }

    outcome.inbox.fetchedAt = QDateTime::currentDateTimeUtc();
    fprintf(stderr, "[fetch] %s: %lld notifications, %lld review requests, %lld mentions, %lld reviews\n",
                    qPrintable(profile.login),
                    static_cast<long long>(outcome.inbox.notifications.size()),
                    static_cast<long long>(outcome.inbox.reviewRequests.size()),
                    static_cast<long long>(outcome.inbox.mentions.size()),
                    static_cast<long long>(outcome.inbox.recentReviews.size()));
    return outcome;
}

FetchError GitHubClient::markNotificationRead(const GitHubAccount &profile, const QString &threadId) const
{
    if (profile.token.isEmpty()) {
        return FetchError::missingToken();
    }
    return execute(profile, QByteArrayLiteral("PATCH"),
                   endpoint(QStringLiteral("/notifications/threads/") + threadId), nullptr);
}

FetchError GitHubClient::markNotificationDone(const GitHubAccount &profile, const QString &threadId) const
{
    if (profile.token.isEmpty()) {
        return FetchError::missingToken();
    }
    return execute(profile, QByteArrayLiteral("DELETE"),
                   endpoint(QStringLiteral("/notifications/threads/") + threadId), nullptr);
}

// --- JSON decoding ---

bool parseNotifications(const QJsonDocument &doc, QList<NotificationItem> *items, QString *error) {
    items->clear();
    if (!doc.isArray()) {
        *error = QStringLiteral("notifications response is not an array");
        return false;
    }
    const QJsonArray arr = doc.array();
    for (const QJsonValue &v : arr) {
        const QJsonObject o = v.toObject();
        const QJsonObject subject = o.value(QLatin1String("subject")).toObject();
        NotificationItem item;
        item.threadId = o.value(QLatin1String("id")).toString();
        if (item.threadId.isEmpty()) {
            *error = QStringLiteral("notification without an id");
            return false;
        }
        item.repo = o.value(QLatin1String("repository")).toObject().value(QLatin1String("full_name")).toString();
        item.title = subject.value(QLatin1String("title")).toString();
        const QString subjectUrl = subject.value(QLatin1String("url")).toString();
        if (!subjectUrl.isEmpty()) {
            item.url = htmlUrlFromApiUrl(subjectUrl);
        }
        item.reason = o.value(QLatin1String("reason")).toString();
        item.updatedAt = parseTimestamp(o.value(QLatin1String("updated_at")));
        item.lastReadAt = parseTimestamp(o.value(QLatin1String("last_read_at")));
        item.unread = o.value(QLatin1String("unread")).toBool();
        items->append(item);
    }
    return true;
}

namespace {

struct SearchItem {
    quint64 id = 0;
    QString htmlUrl;
    QString repositoryUrl;
    QString title;
    qint64 number = 0;
    QDateTime updatedAt;
    QString userLogin;
    QString state;

    QString numberedTitle() const { return QStringLiteral("#%1 %2").arg(number).arg(title); }
};

bool parseSearchItems(const QJsonDocument &doc, QList<SearchItem> *items, QString *error) {
    if (!doc.isObject() || !doc.object().value(QLatin1String("items")).isArray()) {
        *error = QStringLiteral("search response has no items array");
        return false;
    }
    const QJsonArray arr = doc.object().value(QLatin1String("items")).toArray();
    for (const QJsonValue &v : arr) {
        const QJsonObject o = v.toObject();
        SearchItem item;
        item.id = static_cast<quint64>(o.value(QLatin1String("id")).toDouble());
        item.htmlUrl = o.value(QLatin1String("html_url")).toString();
        item.repositoryUrl = o.value(QLatin1String("repository_url")).toString();
        item.title = o.value(QLatin1String("title")).toString();
        item.number = static_cast<qint64>(o.value(QLatin1String("number")).toDouble());
        item.updatedAt = parseTimestamp(o.value(QLatin1String("updated_at")));
        item.userLogin = o.value(QLatin1String("user")).toObject().value(QLatin1String("login")).toString();
        item.state = o.value(QLatin1String("state")).toString();
        items->append(item);
    }
    return true;
}

} // namespace

bool parseReviewRequests(const QJsonDocument &doc, QList<ReviewRequest> *items, QString *error) {
    items->clear();
    QList<SearchItem> found;
    if (!parseSearchItems(doc, &found, error)) {
        return false;
    }
    for (const SearchItem &s : found) {
        items->append({ s.id, repoNameFromApiUrl(s.repositoryUrl), s.numberedTitle(),
                        s.htmlUrl, s.updatedAt, s.userLogin });
    }
    return true;
}

bool parseMentions(const QJsonDocument &doc, QList<MentionThread> *items, QString *error) {
    items->clear();
    QList<SearchItem> found;
    if (!parseSearchItems(doc, &found, error)) {
        return false;
    }
    for (const SearchItem &s : found) {
        items->append({ s.id, repoNameFromApiUrl(s.repositoryUrl), s.numberedTitle(),
                        s.htmlUrl, s.updatedAt, classifyThread(s.htmlUrl) });
    }
    return true;
}

bool parseRecentReviews(const QJsonDocument &doc, QList<ReviewSummary> *items, QString *error) {
    items->clear();
    QList<SearchItem> found;
    if (!parseSearchItems(doc, &found, error)) {
        return false;
    }
    for (const SearchItem &s : found) {
        items->append({ s.id, repoNameFromApiUrl(s.repositoryUrl), s.numberedTitle(),
                        s.htmlUrl, s.updatedAt, s.state });
    }
    return true;
}

QString htmlUrlFromApiUrl(const QString &apiUrl) {
    QString html = apiUrl;
    if (html.contains(QLatin1String("://api.github.com/repos/"))) {
        html.replace(QLatin1String("://api.github.com/repos/"), QLatin1String("://github.com/"));
    } else {
        // GitHub Enterprise serves the API under /api/v3 on the web host.
        html.replace(QLatin1String("/api/v3/repos/"), QLatin1String("/"));
    }
    // The API names pull requests /pulls/<n>; the web page is /pull/<n>.
    html.replace(QLatin1String("/pulls/"), QLatin1String("/pull/"));
    return html;
}

QString repoNameFromApiUrl(const QString &repositoryUrl) {
    const int idx = repositoryUrl.indexOf(QLatin1String("/repos/"));
    if (idx < 0) {
        return repositoryUrl;
    }
    return repositoryUrl.mid(idx + int(qstrlen("/repos/")));
}

MentionKind classifyThread(const QString &htmlUrl) {
    return htmlUrl.contains(QLatin1String("/pull/")) ? MentionPullRequest : MentionIssue;
}
