/*
 * tst_accountstore.cpp
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

#include <QtTest>

#include "AccountStore.h"

#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

class AccountStoreTest : public QObject {
    Q_OBJECT

private slots:
    void missingRegistryHydratesEmpty();
    void persistedProfilesAreSortedByLogin();
    void persistingKnownLoginReplacesToken();
    void forgetRemovesOnlyThatLogin();
    void registryIsOwnerOnly();
    void malformedRegistryIsReported();
    void createsMissingDirectory();

private:
    static GitHubAccount account(const QString &login, const QString &token) {
        GitHubAccount a;
        a.login = login;
        a.token = token;
        return a;
    }
};

void AccountStoreTest::missingRegistryHydratesEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    QVERIFY2(store, qPrintable(error));
    QVERIFY(!QFile::exists(store->registryPath()));

    QList<GitHubAccount> profiles;
    profiles.append(account(QStringLiteral("stale"), QStringLiteral("t")));
    QVERIFY(store->hydrate(&profiles, &error));
    QVERIFY(profiles.isEmpty());
}

void AccountStoreTest::persistedProfilesAreSortedByLogin()
{
    QTemporaryDir dir;
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    QVERIFY(store);

    QVERIFY(store->persistProfile(account(QStringLiteral("zed"), QStringLiteral("z-token")), &error));
    QVERIFY(store->persistProfile(account(QStringLiteral("alice"), QStringLiteral("a-token")), &error));
    QVERIFY(store->persistProfile(account(QStringLiteral("mona"), QStringLiteral("m-token")), &error));

    // A second store on the same directory sees what the first wrote.
    std::unique_ptr<AccountStore> reopened = AccountStore::initialize(dir.path(), &error);
    QList<GitHubAccount> profiles;
    QVERIFY(reopened->hydrate(&profiles, &error));
    QCOMPARE(profiles.size(), 3);
    QCOMPARE(profiles[0].login, QStringLiteral("alice"));
    QCOMPARE(profiles[1].login, QStringLiteral("mona"));
    QCOMPARE(profiles[2].login, QStringLiteral("zed"));
    QCOMPARE(profiles[0].token, QStringLiteral("a-token"));
}

void AccountStoreTest::persistingKnownLoginReplacesToken()
{
    QTemporaryDir dir;
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    QVERIFY(store->persistProfile(account(QStringLiteral("octocat"), QStringLiteral("old")), &error));
    QVERIFY(store->persistProfile(account(QStringLiteral("octocat"), QStringLiteral("new")), &error));

    QList<GitHubAccount> profiles;
    QVERIFY(store->hydrate(&profiles, &error));
    QCOMPARE(profiles.size(), 1);
    QCOMPARE(profiles[0].token, QStringLiteral("new"));
}

void AccountStoreTest::forgetRemovesOnlyThatLogin()
{
    QTemporaryDir dir;
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    QVERIFY(store->persistProfile(account(QStringLiteral("alice"), QStringLiteral("a")), &error));
    QVERIFY(store->persistProfile(account(QStringLiteral("bob"), QStringLiteral("b")), &error));

    QVERIFY(store->forget(QStringLiteral("alice"), &error));
    // Forgetting an unknown login is not an error.
    QVERIFY(store->forget(QStringLiteral("nobody"), &error));

    QList<GitHubAccount> profiles;
    QVERIFY(store->hydrate(&profiles, &error));
    QCOMPARE(profiles.size(), 1);
    QCOMPARE(profiles[0].login, QStringLiteral("bob"));
}

void AccountStoreTest::registryIsOwnerOnly()
{
    QTemporaryDir dir;
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    QVERIFY(store->persistProfile(account(QStringLiteral("octocat"), QStringLiteral("secret")), &error));

    const QFileDevice::Permissions perms = QFileInfo(store->registryPath()).permissions();
    QVERIFY(perms.testFlag(QFileDevice::ReadOwner));
    QVERIFY(perms.testFlag(QFileDevice::WriteOwner));
    QVERIFY(!perms.testFlag(QFileDevice::ReadGroup));
    QVERIFY(!perms.testFlag(QFileDevice::ReadOther));
    QVERIFY(!perms.testFlag(QFileDevice::WriteOther));
}

void AccountStoreTest::malformedRegistryIsReported()
{
    QTemporaryDir dir;
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    QFile f(store->registryPath());
    QVERIFY(f.open(QIODevice::WriteOnly));
    f.write("<accounts><account login=\"a\" token=\"t\"></accounts");
    f.close();

    QList<GitHubAccount> profiles;
    error.clear();
    QVERIFY(!store->hydrate(&profiles, &error));
    QVERIFY(profiles.isEmpty());
    QVERIFY(error.startsWith(QStringLiteral("Stored accounts file is malformed")));

    // Writing must not clobber a registry it could not read.
    QVERIFY(!store->persistProfile(account(QStringLiteral("b"), QStringLiteral("u")), &error));
    QVERIFY(f.open(QIODevice::ReadOnly));
    QVERIFY(f.readAll().startsWith("<accounts><account login=\"a\""));
}

void AccountStoreTest::createsMissingDirectory()
{
    QTemporaryDir dir;
    const QString nested = dir.filePath(QStringLiteral("a/b/.reminder"));
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(nested, &error);
    QVERIFY2(store, qPrintable(error));
    QVERIFY(QFileInfo(nested).isDir());
    QCOMPARE(QFileInfo(store->registryPath()).fileName(), QStringLiteral("accounts.xml"));
}

QTEST_GUILESS_MAIN(AccountStoreTest)

#include "tst_accountstore.moc"
