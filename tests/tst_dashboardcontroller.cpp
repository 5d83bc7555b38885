/*
 * tst_dashboardcontroller.cpp
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

#include "AccountCard.h"
#include "AccountState.h"
#include "AccountStore.h"
#include "AccountsPanel.h"
#include "BackgroundJob.h"
#include "DashboardController.h"
#include "FakeGateway.h"
#include "NotificationSection.h"
#include "RefreshScheduler.h"

#include <QFile>
#include <QHBoxLayout>
#include <QLineEdit>
#include <QListWidget>
#include <QMainWindow>
#include <QPushButton>
#include <QStackedWidget>
#include <QTemporaryDir>
#include <QToolButton>
#include <QTreeWidget>

#include <chrono>
#include <memory>

static NotificationItem notification(const QString &threadId, const QString &reason) {
    NotificationItem item;
    item.threadId = threadId;
    item.repo = QStringLiteral("acme/repo");
    item.title = QStringLiteral("Title %1").arg(threadId);
    item.reason = reason;
    item.unread = true;
    item.updatedAt = QDateTime(QDate(2024, 5, 1), QTime(10, 0), Qt::UTC);
    return item;
}

static InboxSnapshot sampleInbox() {
    InboxSnapshot inbox;
    inbox.notifications.append(notification(QStringLiteral("1"), QStringLiteral("review_requested")));
    inbox.notifications.append(notification(QStringLiteral("2"), QStringLiteral("mention")));
    inbox.notifications.append(notification(QStringLiteral("3"), QStringLiteral("subscribed")));
    return inbox;
}

static QPushButton *rowButton(AccountCard *card, SectionKind kind, int row, const char *name) {
    if (!card) {
        return nullptr;
    }
    QTreeWidget *table = card->section(kind)->table();
    QTreeWidgetItem *item = table->topLevelItem(row);
    if (!item) {
        return nullptr;
    }
    QWidget *actions = table->itemWidget(item, NotificationSection::ColActions);
    return actions ? actions->findChild<QPushButton *>(QLatin1String(name)) : nullptr;
}

class DashboardControllerTest : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void blankFieldsAreRejected();
    void accountWithoutStoreIsSessionOnly();
    void storedAccountsAreRestored();
    void persistFailureKeepsAccountOut();
    void readdingLoginReplacesInPlace();
    void removeForgetsStoredAccount();
    void refreshStartsFetch();
    void tickAppliesFinishedFetch();
    void autoRefreshRunsWhenDue();
    void formSubmitsAndClears();
    void accountListButtonsActOnTheirAccount();
    void highlightsClearOnlyWhenPresented();
    void markReadDisablesRowWhileInFlight();
    void doneActionFollowsConfig();
    void searchHidesRowsAndReviewsAreListed();

private:
    Config testConfig() const {
        Config c;
        c.pollIntervalMs = 20;
        c.dateFormat = QStringLiteral("yyyy-MM-dd HH:mm");
        return c;
    }
    std::unique_ptr<DashboardController> makeController(const Config &config, AccountStore *store = nullptr) {
        return std::unique_ptr<DashboardController>(
            new DashboardController(config, m_gateway, m_scheduler.get(), store));
    }
    // Builds the same widget tree main() does and hands it to ctrl.
    QMainWindow *buildWindow(DashboardController *ctrl) {
        auto *window = new QMainWindow();
        ctrl->win = window;
        auto *central = new QWidget(window);
        auto *layout = new QHBoxLayout(central);
        layout->addWidget(buildAccountsPanel(ctrl, central));
        layout->addWidget(buildDashboardPane(ctrl, central), 1);
        window->setCentralWidget(central);
        window->resize(1000, 700);
        return window;
    }

    std::shared_ptr<FakeGateway> m_gateway;
    std::unique_ptr<RefreshScheduler> m_scheduler;
};

void DashboardControllerTest::init()
{
    m_gateway = std::make_shared<FakeGateway>();
    m_scheduler.reset(new RefreshScheduler(std::chrono::minutes(3)));
}

void DashboardControllerTest::cleanup()
{
    m_gateway->releaseAll();
    drainBackgroundJobs(5000);
}

void DashboardControllerTest::blankFieldsAreRejected()
{
    auto ctrl = makeController(testConfig());
    QVERIFY(!ctrl->addAccount(QStringLiteral("   "), QStringLiteral("token")));
    QVERIFY(!ctrl->formError().isEmpty());
    QVERIFY(!ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("\t")));
    QCOMPARE(ctrl->accountCount(), 0);
    QCOMPARE(m_gateway->fetchCalls(), 0);
}

void DashboardControllerTest::accountWithoutStoreIsSessionOnly()
{
    auto ctrl = makeController(testConfig());
    QVERIFY(!ctrl->isPersistent());
    QVERIFY(ctrl->addAccount(QStringLiteral("  octocat "), QStringLiteral(" ghp_abc  ")));
    QCOMPARE(ctrl->accountCount(), 1);
    AccountState *state = ctrl->accountAt(0);
    QCOMPARE(state->profile().login, QStringLiteral("octocat"));
    QCOMPARE(state->profile().token, QStringLiteral("ghp_abc"));
    QVERIFY(state->hasPendingFetch());
    // Accepted, but the form tells the user the account will not survive a restart.
    QVERIFY(!ctrl->formError().isEmpty());
    QVERIFY(!m_scheduler->shouldTrigger());
}

void DashboardControllerTest::storedAccountsAreRestored()
{
    QTemporaryDir dir;
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    QVERIFY2(store, qPrintable(error));
    {
        auto first = makeController(testConfig(), store.get());
        QVERIFY(first->addAccount(QStringLiteral("zed"), QStringLiteral("z")));
        QVERIFY(first->addAccount(QStringLiteral("alice"), QStringLiteral("a")));
        QVERIFY(first->formError().isEmpty());
    }
    drainBackgroundJobs(5000);

    m_scheduler.reset(new RefreshScheduler(std::chrono::minutes(3)));
    auto second = makeController(testConfig(), store.get());
    second->restoreAccounts();
    QCOMPARE(second->accountCount(), 2);
    QCOMPARE(second->accountAt(0)->profile().login, QStringLiteral("alice"));
    QCOMPARE(second->accountAt(1)->profile().login, QStringLiteral("zed"));
    QVERIFY(second->accountAt(0)->hasPendingFetch());
    QVERIFY(second->accountAt(1)->hasPendingFetch());
    QVERIFY(second->storageWarning().isEmpty());
    QVERIFY(!m_scheduler->shouldTrigger());
}

void DashboardControllerTest::persistFailureKeepsAccountOut()
{
    QTemporaryDir dir;
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    QFile garbage(store->registryPath());
    QVERIFY(garbage.open(QIODevice::WriteOnly));
    garbage.write("<accounts><account");
    garbage.close();

    auto ctrl = makeController(testConfig(), store.get());
    ctrl->restoreAccounts();
    QVERIFY(!ctrl->storageWarning().isEmpty());
    QVERIFY(!ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));
    QVERIFY(!ctrl->formError().isEmpty());
    QCOMPARE(ctrl->accountCount(), 0);
}

void DashboardControllerTest::readdingLoginReplacesInPlace()
{
    auto ctrl = makeController(testConfig());
    QVERIFY(ctrl->addAccount(QStringLiteral("alice"), QStringLiteral("old")));
    QVERIFY(ctrl->addAccount(QStringLiteral("bob"), QStringLiteral("b")));
    QVERIFY(ctrl->addAccount(QStringLiteral("alice"), QStringLiteral("new")));
    QCOMPARE(ctrl->accountCount(), 2);
    QCOMPARE(ctrl->indexOfLogin(QStringLiteral("alice")), 0);
    QCOMPARE(ctrl->accountAt(0)->profile().token, QStringLiteral("new"));
    QCOMPARE(ctrl->indexOfLogin(QStringLiteral("bob")), 1);
}

void DashboardControllerTest::removeForgetsStoredAccount()
{
    QTemporaryDir dir;
    QString error;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(dir.path(), &error);
    auto ctrl = makeController(testConfig(), store.get());
    QVERIFY(ctrl->addAccount(QStringLiteral("alice"), QStringLiteral("a")));
    QVERIFY(ctrl->addAccount(QStringLiteral("bob"), QStringLiteral("b")));

    ctrl->removeAccountAt(0);
    QCOMPARE(ctrl->accountCount(), 1);
    QCOMPARE(ctrl->accountAt(0)->profile().login, QStringLiteral("bob"));
    QVERIFY(ctrl->globalError().isEmpty());

    QList<GitHubAccount> stored;
    QVERIFY(store->hydrate(&stored, &error));
    QCOMPARE(stored.size(), 1);
    QCOMPARE(stored[0].login, QStringLiteral("bob"));

    // Out of range is a no-op.
    ctrl->removeAccountAt(5);
    QCOMPARE(ctrl->accountCount(), 1);
}

void DashboardControllerTest::refreshStartsFetch()
{
    auto ctrl = makeController(testConfig());
    QVERIFY(ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));
    QTRY_COMPARE(m_gateway->fetchCalls(), 1);
    QTRY_VERIFY(ctrl->pollJobs() || ctrl->accountAt(0)->inbox().has_value());

    ctrl->refreshAccountAt(0);
    QVERIFY(ctrl->accountAt(0)->hasPendingFetch());
    QTRY_COMPARE(m_gateway->fetchCalls(), 2);
    ctrl->refreshAccountAt(-1);
}

void DashboardControllerTest::tickAppliesFinishedFetch()
{
    m_gateway->setInbox(sampleInbox());
    auto ctrl = makeController(testConfig());
    QVERIFY(ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));
    ctrl->start();
    QTRY_VERIFY(ctrl->accountAt(0)->inbox().has_value());
    QCOMPARE(ctrl->accountAt(0)->inbox()->notifications.size(), 3);
    QVERIFY(!ctrl->accountAt(0)->hasPendingFetch());
    // No window: nothing was presented, so nothing was acknowledged.
    QVERIFY(ctrl->accountAt(0)->isHighlighted(SectionReviewRequests));
}

void DashboardControllerTest::autoRefreshRunsWhenDue()
{
    Config config = testConfig();
    config.staleAfterSeconds = 0;
    m_scheduler.reset(new RefreshScheduler(std::chrono::milliseconds(0)));
    auto ctrl = makeController(config);
    QVERIFY(ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));

    // Its first fetch is still pending until polled, so the pass skips it.
    QVERIFY(!ctrl->maybeAutoRefresh());
    QCOMPARE(ctrl->accountCount(), 1);

    QTRY_VERIFY(ctrl->pollJobs());
    QVERIFY(ctrl->maybeAutoRefresh());
    QVERIFY(ctrl->accountAt(0)->hasPendingFetch());
    QTRY_COMPARE(m_gateway->fetchCalls(), 2);
}

void DashboardControllerTest::formSubmitsAndClears()
{
    auto ctrl = makeController(testConfig());
    std::unique_ptr<QMainWindow> window(buildWindow(ctrl.get()));
    ctrl->start();
    QVERIFY(!ctrl->addAccountBtn->isEnabled());

    ctrl->loginEdit->setText(QStringLiteral("octocat"));
    QVERIFY(!ctrl->addAccountBtn->isEnabled());
    ctrl->tokenEdit->setText(QStringLiteral("ghp_x"));
    QVERIFY(ctrl->addAccountBtn->isEnabled());

    ctrl->addAccountBtn->click();
    QCOMPARE(ctrl->accountCount(), 1);
    QVERIFY(ctrl->loginEdit->text().isEmpty());
    QVERIFY(ctrl->tokenEdit->text().isEmpty());
    QVERIFY(!ctrl->addAccountBtn->isEnabled());
    QCOMPARE(ctrl->dashboardStack->currentIndex(), 1);
    QVERIFY(ctrl->cardAt(0));
}

void DashboardControllerTest::accountListButtonsActOnTheirAccount()
{
    auto ctrl = makeController(testConfig());
    std::unique_ptr<QMainWindow> window(buildWindow(ctrl.get()));
    ctrl->start();
    QVERIFY(ctrl->addAccount(QStringLiteral("alice"), QStringLiteral("a")));
    QVERIFY(ctrl->addAccount(QStringLiteral("bob"), QStringLiteral("b")));
    QTRY_COMPARE(m_gateway->fetchCalls(), 2);
    QTRY_VERIFY(!ctrl->accountAt(0)->hasPendingFetch() && !ctrl->accountAt(1)->hasPendingFetch());
    QCoreApplication::sendPostedEvents(nullptr, QEvent::DeferredDelete);

    QList<QToolButton *> refreshButtons = window->findChildren<QToolButton *>(QStringLiteral("refresh"));
    QCOMPARE(refreshButtons.size(), 2);
    refreshButtons[1]->click();
    QVERIFY(!ctrl->accountAt(0)->hasPendingFetch());
    QVERIFY(ctrl->accountAt(1)->hasPendingFetch());

    QList<QToolButton *> removeButtons = window->findChildren<QToolButton *>(QStringLiteral("remove"));
    QCOMPARE(removeButtons.size(), 2);
    removeButtons[0]->click();
    QCOMPARE(ctrl->accountCount(), 1);
    QCOMPARE(ctrl->accountAt(0)->profile().login, QStringLiteral("bob"));
    // Old rows go away on the next event loop pass.
    QTRY_COMPARE(window->findChildren<QToolButton *>(QStringLiteral("remove")).size(), 1);

    ctrl->removeAccountAt(0);
    QCOMPARE(ctrl->dashboardStack->currentIndex(), 0);
}

void DashboardControllerTest::highlightsClearOnlyWhenPresented()
{
    m_gateway->setInbox(sampleInbox());
    auto ctrl = makeController(testConfig());
    std::unique_ptr<QMainWindow> window(buildWindow(ctrl.get()));
    QVERIFY(ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));
    ctrl->start();
    AccountState *state = ctrl->accountAt(0);
    QTRY_VERIFY(state->inbox().has_value());
    ctrl->render();

    // Hidden window: every bucket that gained items stays highlighted.
    QVERIFY(state->isHighlighted(SectionReviewRequests));
    QVERIFY(state->isHighlighted(SectionMentions));
    QVERIFY(state->isHighlighted(SectionNotifications));

    ctrl->cardAt(0)->section(SectionMentions)->setExpanded(false);
    window->show();
    ctrl->render();
    QVERIFY(!state->isHighlighted(SectionReviewRequests));
    QVERIFY(!state->isHighlighted(SectionNotifications));
    QVERIFY(state->isHighlighted(SectionMentions));

    ctrl->cardAt(0)->section(SectionMentions)->setExpanded(true);
    QTRY_VERIFY(!state->isHighlighted(SectionMentions));
}

void DashboardControllerTest::markReadDisablesRowWhileInFlight()
{
    m_gateway->setInbox(sampleInbox());
    auto ctrl = makeController(testConfig());
    std::unique_ptr<QMainWindow> window(buildWindow(ctrl.get()));
    QVERIFY(ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));
    ctrl->start();
    AccountState *state = ctrl->accountAt(0);
    QTRY_VERIFY(state->inbox().has_value());
    QTRY_VERIFY(rowButton(ctrl->cardAt(0), SectionReviewRequests, 0, "markRead"));

    QPushButton *markRead = rowButton(ctrl->cardAt(0), SectionReviewRequests, 0, "markRead");
    QVERIFY(markRead->isEnabled());
    m_gateway->holdActions();
    markRead->click();
    QVERIFY(state->isInflight(QStringLiteral("1")));
    QTRY_VERIFY(!rowButton(ctrl->cardAt(0), SectionReviewRequests, 0, "markRead")->isEnabled());

    m_gateway->releaseActions();
    QTRY_VERIFY(!state->isInflight(QStringLiteral("1")));
    QCOMPARE(m_gateway->actionLog(), QStringList { QStringLiteral("read:octocat:1") });
    const NotificationItem *item = state->inbox()->findNotification(QStringLiteral("1"));
    QVERIFY(!item->unread);
    QCOMPARE(item->lastReadAt, item->updatedAt);
    // Read rows stay disabled once the job is gone.
    QTRY_VERIFY(!rowButton(ctrl->cardAt(0), SectionReviewRequests, 0, "markRead")->isEnabled());
}

void DashboardControllerTest::doneActionFollowsConfig()
{
    m_gateway->setInbox(sampleInbox());
    Config config = testConfig();
    {
        auto ctrl = makeController(config);
        std::unique_ptr<QMainWindow> window(buildWindow(ctrl.get()));
        QVERIFY(ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));
        ctrl->start();
        QTRY_VERIFY(rowButton(ctrl->cardAt(0), SectionNotifications, 0, "markRead"));
        QVERIFY(!rowButton(ctrl->cardAt(0), SectionNotifications, 0, "markDone"));
    }

    config.showDoneAction = true;
    auto ctrl = makeController(config);
    std::unique_ptr<QMainWindow> window(buildWindow(ctrl.get()));
    QVERIFY(ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));
    ctrl->start();
    QTRY_VERIFY(rowButton(ctrl->cardAt(0), SectionNotifications, 0, "markDone"));

    rowButton(ctrl->cardAt(0), SectionNotifications, 0, "markDone")->click();
    QTRY_VERIFY(ctrl->accountAt(0)->pendingActionCount() == 0 && !m_gateway->actionLog().isEmpty());
    QCOMPARE(m_gateway->actionLog().constFirst(), QStringLiteral("done:octocat:3"));
}

void DashboardControllerTest::searchHidesRowsAndReviewsAreListed()
{
    InboxSnapshot inbox = sampleInbox();
    ReviewSummary review;
    review.id = 77;
    review.repo = QStringLiteral("acme/repo");
    review.title = QStringLiteral("#12 Bump deps");
    review.url = QStringLiteral("https://github.com/acme/repo/pull/12");
    review.updatedAt = QDateTime(QDate(2024, 6, 3), QTime(7, 15), Qt::UTC);
    review.state = QStringLiteral("closed");
    inbox.recentReviews.append(review);
    m_gateway->setInbox(inbox);

    auto ctrl = makeController(testConfig());
    std::unique_ptr<QMainWindow> window(buildWindow(ctrl.get()));
    QVERIFY(ctrl->addAccount(QStringLiteral("octocat"), QStringLiteral("t")));
    ctrl->start();
    QTRY_VERIFY(rowButton(ctrl->cardAt(0), SectionNotifications, 0, "markRead"));

    AccountCard *card = ctrl->cardAt(0);
    QCOMPARE(card->recentReviewsList()->count(), 1);
    QCOMPARE(card->recentReviewsList()->item(0)->data(Qt::UserRole).toString(), review.url);

    // "Title 2" only lives in Mentions; the other sections fall back to their placeholder.
    card->setSearchText(QStringLiteral("title 2"));
    QCOMPARE(card->searchText(), QStringLiteral("title 2"));
    QCOMPARE(card->section(SectionMentions)->table()->topLevelItemCount(), 1);
    QCOMPARE(card->section(SectionReviewRequests)->table()->topLevelItemCount(), 0);
    QCOMPARE(card->section(SectionNotifications)->table()->topLevelItemCount(), 0);

    card->setSearchText(QString());
    QCOMPARE(card->section(SectionNotifications)->table()->topLevelItemCount(), 1);
}

QTEST_MAIN(DashboardControllerTest)

#include "tst_dashboardcontroller.moc"
