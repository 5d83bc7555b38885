/*
 * DashboardController.h
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

#ifndef DASHBOARDCONTROLLER_H
#define DASHBOARDCONTROLLER_H

#include "AccountCard.h"
#include "Config.h"
#include "Sections.h"

#include <QObject>
#include <QList>
#include <QPointer>
#include <QString>

#include <memory>
#include <vector>

class QMainWindow;
class QLabel;
class QLineEdit;
class QPushButton;
class QStackedWidget;
class QTimer;
class QVBoxLayout;
class QWidget;

class AccountState;
class AccountStore;
class FetchGateway;
class RefreshScheduler;

/**
 * Owns every tracked account and drives them from the GUI thread: a timer
 * tick polls background jobs, runs the auto-refresh pass and re-renders the
 * cards whose account changed.
 *
 * The credential store and scheduler are created in main() and outlive the
 * controller. The store may be null, in which case accounts live in memory
 * only.
 *
 * Widget pointers are non-owning (Qt parent hierarchy owns the widgets) and
 * all optional; without them the controller still manages accounts, which
 * is how the tests drive it.
 */
class DashboardController : public QObject {
    Q_OBJECT
public:
    DashboardController(const Config &config, std::shared_ptr<const FetchGateway> gateway,
                        RefreshScheduler *scheduler, AccountStore *store, QObject *parent = nullptr);
    ~DashboardController() override;

    // --- Widget refs (set once during setup, not owned) ---
    QMainWindow *win = nullptr;
    QLabel *storageWarningLabel = nullptr;
    QLineEdit *loginEdit = nullptr;
    QLineEdit *tokenEdit = nullptr;
    QPushButton *addAccountBtn = nullptr;
    QLabel *formErrorLabel = nullptr;
    QVBoxLayout *accountListLayout = nullptr;
    QLabel *noAccountsLabel = nullptr;
    QLabel *globalErrorLabel = nullptr;
    QStackedWidget *dashboardStack = nullptr;   // 0 = "add an account" placeholder, 1 = cards
    QWidget *cardsContainer = nullptr;
    QVBoxLayout *cardsLayout = nullptr;

    /** Wire the account form and start the tick timer. Call once, after the widget refs are set. */
    void start();

    /** Load stored accounts and start their first fetch. */
    void restoreAccounts();
    void setStorageWarning(const QString &warning);

    /** Validate, persist and track a new account. Returns false (with formError set) on rejection. */
    bool addAccount(const QString &login, const QString &token);
    /** addAccount() with the contents of the form fields; clears them on success. */
    void submitAccountForm();
    void removeAccountAt(int index);
    void refreshAccountAt(int index);

    /** Apply finished jobs of every account. Returns true if anything changed. */
    bool pollJobs();
    /** One auto-refresh pass against the configured staleness threshold. */
    bool maybeAutoRefresh();
    /** Bring every widget up to date and acknowledge highlights the user can see. */
    void render();

    int accountCount() const { return int(m_accounts.size()); }
    AccountState *accountAt(int index) const;
    AccountCard *cardAt(int index) const;
    int indexOfLogin(const QString &login) const;
    QList<AccountState *> accounts() const;

    bool isPersistent() const { return m_store != nullptr; }
    const QString &storageWarning() const { return m_storageWarning; }
    const QString &formError() const { return m_formError; }
    const QString &globalError() const { return m_globalError; }

    void tick();

private:
    struct TrackedAccount {
        std::unique_ptr<AccountState> state;
        QPointer<AccountCard> card;   // null without a cards layout
    };

    void trackAccount(std::unique_ptr<AccountState> state, int index);
    AccountCard *createCard(AccountState *state);
    void destroyCard(TrackedAccount &tracked);
    bool windowPresentsContent() const;
    void acknowledgePresentedSections();
    void rebuildAccountList();
    void updateAddButton();
    void setFormError(const QString &error);
    void setGlobalError(const QString &error);

    Config m_config;
    std::shared_ptr<const FetchGateway> m_gateway;
    RefreshScheduler *m_scheduler;
    AccountStore *m_store;
    std::vector<TrackedAccount> m_accounts;
    QString m_storageWarning;
    QString m_formError;
    QString m_globalError;
    QTimer *m_timer = nullptr;
};

#endif // DASHBOARDCONTROLLER_H
