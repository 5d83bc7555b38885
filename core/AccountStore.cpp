/*
 * AccountStore.cpp
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

#include "AccountStore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QStandardPaths>
#include <QXmlStreamReader>
#include <QXmlStreamWriter>

#include <algorithm>
#include <cstdio>

static const char REGISTRY_FILE[] = "accounts.xml";

AccountStore::AccountStore(const QString &registryPath)
    : m_registryPath(registryPath)
{
}

std::unique_ptr<AccountStore> AccountStore::initialize(QString *error)
{
    const QString home = QStandardPaths::writableLocation(QStandardPaths::HomeLocation);
    if (home.isEmpty() || !QFileInfo(home).isDir()) {
        if (error) {
            *error = QStringLiteral("Home directory is not available; cannot store tokens under ~/.reminder");
        }
        return nullptr;
    }
    return initialize(home + QStringLiteral("/.reminder"), error);
}

std::unique_ptr<AccountStore> AccountStore::initialize(const QString &dir, QString *error)
{
    if (!QDir().mkpath(dir)) {
        if (error) {
            *error = QStringLiteral("Cannot create %1 for stored accounts").arg(dir);
        }
        return nullptr;
    }
    const QString path = QDir(dir).filePath(QLatin1String(REGISTRY_FILE));
    fprintf(stderr, "[store] registry at %s\n", qPrintable(path));
    return std::unique_ptr<AccountStore>(new AccountStore(path));
}

bool AccountStore::hydrate(QList<GitHubAccount> *profiles, QString *error) const
{
    QList<GitHubAccount> accounts;
    if (!readRegistry(&accounts, error)) {
        return false;
    }
    fprintf(stderr, "[store] loaded %d stored account(s)\n", int(accounts.size()));
    *profiles = accounts;
    return true;
}

bool AccountStore::persistProfile(const GitHubAccount &profile, QString *error) const
{
    QList<GitHubAccount> accounts;
    if (!readRegistry(&accounts, error)) {
        return false;
    }
    auto it = std::find_if(accounts.begin(), accounts.end(), [&profile](const GitHubAccount &a) {
        return a.login == profile.login;
    });
    if (it != accounts.end()) {
        it->token = profile.token;
    } else {
        accounts.append(profile);
        std::sort(accounts.begin(), accounts.end(), [](const GitHubAccount &a, const GitHubAccount &b) {
            return a.login < b.login;
        });
    }
    return writeRegistry(accounts, error);
}

bool AccountStore::forget(const QString &login, QString *error) const
{
    QList<GitHubAccount> accounts;
    if (!readRegistry(&accounts, error)) {
        return false;
    }
    accounts.erase(std::remove_if(accounts.begin(), accounts.end(), [&login](const GitHubAccount &a) {
        return a.login == login;
    }), accounts.end());
    return writeRegistry(accounts, error);
}

bool AccountStore::readRegistry(QList<GitHubAccount> *accounts, QString *error) const
{
    accounts->clear();
    QFile f(m_registryPath);
    if (!f.exists()) {
        return true;
    }
    if (!f.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("I/O error while reading stored accounts: %1").arg(f.errorString());
        }
        return false;
    }
    QXmlStreamReader r(&f);
    while (!r.atEnd()) {
        r.readNext();
        if (r.isStartElement() && r.name() == QLatin1String("account")) {
            const QXmlStreamAttributes a = r.attributes();
            GitHubAccount account;
            account.login = a.value(QLatin1String("login")).toString();
            account.token = a.value(QLatin1String("token")).toString();
            if (!account.login.isEmpty()) {
                accounts->append(account);
            }
        }
    }
    if (r.hasError()) {
        if (error) {
            *error = QStringLiteral("Stored accounts file is malformed: %1").arg(r.errorString());
        }
        accounts->clear();
        return false;
    }
    return true;
}

bool AccountStore::writeRegistry(const QList<GitHubAccount> &accounts, QString *error) const
{
    QSaveFile f(m_registryPath);
    if (!f.open(QIODevice::WriteOnly)) {
        if (error) {
            *error = QStringLiteral("I/O error while writing stored accounts: %1").arg(f.errorString());
        }
        return false;
    }
    // The temporary file is renamed over the registry, so restrict it before any token is written.
    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);
    QXmlStreamWriter w(&f);
    w.setAutoFormatting(true);
    w.writeStartDocument(QStringLiteral("1.0"), true);
    w.writeStartElement(QStringLiteral("accounts"));
    for (const GitHubAccount &a : accounts) {
        w.writeStartElement(QStringLiteral("account"));
        w.writeAttribute(QStringLiteral("login"), a.login);
        w.writeAttribute(QStringLiteral("token"), a.token);
        w.writeEndElement();
    }
    w.writeEndElement();
    w.writeEndDocument();
    if (!f.commit()) {
        if (error) {
            *error = QStringLiteral("I/O error while writing stored accounts: %1").arg(f.errorString());
        }
        return false;
    }
    fprintf(stderr, "[store] wrote %d account(s)\n", int(accounts.size()));
    return true;
}
