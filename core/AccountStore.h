/*
 * AccountStore.h
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

#ifndef ACCOUNTSTORE_H
#define ACCOUNTSTORE_H

#include "Domain.h"

#include <QList>
#include <QString>

#include <memory>

/**
 * Durable login/token registry under ~/.reminder/accounts.xml.
 * Entries are kept sorted by login; writing a login that already exists
 * replaces its token. The file is rewritten atomically and is readable by
 * the owner only.
 *
 * Every call reads the file afresh, so the store holds no state besides its
 * path and may be shared freely on the GUI thread.
 */
class AccountStore {
public:
    /** Store in ~/.reminder. Null with *error set if the home directory is unusable. */
    static std::unique_ptr<AccountStore> initialize(QString *error);
    static std::unique_ptr<AccountStore> initialize(const QString &dir, QString *error);

    QString registryPath() const { return m_registryPath; }

    bool hydrate(QList<GitHubAccount> *profiles, QString *error) const;
    bool persistProfile(const GitHubAccount &profile, QString *error) const;
    bool forget(const QString &login, QString *error) const;

private:
    explicit AccountStore(const QString &registryPath);

    bool readRegistry(QList<GitHubAccount> *accounts, QString *error) const;
    bool writeRegistry(const QList<GitHubAccount> &accounts, QString *error) const;

    QString m_registryPath;
};

#endif // ACCOUNTSTORE_H
