/*
 * DashboardController.cpp
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

#include "DashboardController.h"
#include "AccountCard.h"
#include "AccountState.h"
#include "AccountStore.h"
#include "FetchGateway.h"
#include "IconUtils.h"
#include "RefreshScheduler.h"
#include "Tr.h"

#include <QFont>
#include <QHBoxLayout>
#include <QLabel>
#include <QLayoutItem>
#include <QLineEdit>
#include <QMainWindow>
#include <QPushButton>
#include <QStackedWidget>
#include <QTimer>
#include <QToolButton>
#include <QVBoxLayout>

#include <chrono>
#include <cstdio>
#include <utility>

DashboardController::DashboardController(const Config &config, std::shared_ptr<const FetchGateway> gateway,
                                         RefreshScheduler *scheduler, AccountStore *store, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_gateway(std::move(gateway))
    , m_scheduler(scheduler)
    , m_store(store)
{
}

DashboardController::~DashboardController()
{
    // Cards point at account states; they must go first. Cards already
    // taken down with the window are null here.
    for (TrackedAccount &tracked : m_accounts) {
        destroyCard(tracked);
    }
}

void DashboardController::start()
{
    if (!m_timer) {
        m_timer = new QTimer(this);
        QObject::connect(m_timer, &QTimer::timeout, this, &DashboardController::tick);
    }
    m_timer->start(m_config.pollIntervalMs);
    if (loginEdit && tokenEdit && addAccountBtn) {
        QObject::connect(loginEdit, &QLineEdit::textChanged, this, [this]() { updateAddButton(); });
        QObject::connect(tokenEdit, &QLineEdit::textChanged, this, [this]() { updateAddButton(); });
        QObject::connect(addAccountBtn, &QPushButton::clicked, this, &DashboardController::submitAccountForm);
        QObject::connect(tokenEdit, &QLineEdit::returnPressed, this, &DashboardController::submitAccountForm);
    }
    rebuildAccountList();
    updateAddButton();
    render();
}

void DashboardController::tick()
{
    pollJobs();
    maybeAutoRefresh();
    render();
}

AccountState *DashboardController::accountAt(int index) const
{
    if (index < 0 || index >= accountCount()) {
        return nullptr;
    }
    return m_accounts[size_t(index)].state.get();
}

AccountCard *DashboardController::cardAt(int index) const
{
    if (index < 0 || index >= accountCount()) {
        return nullptr;
    }
    return m_accounts[size_t(index)].card;
}

int DashboardController::indexOfLogin(const QString &login) const
{
    for (int i = 0; i < accountCount(); ++i) {
        if (m_accounts[size_t(i)].state->profile().login == login) {
            return i;
        }
    }
    return -1;
}

QList<AccountState *> DashboardController::accounts() const
{
    QList<AccountState *> list;
    for (const TrackedAccount &tracked : m_accounts) {
        list.append(tracked.state.get());
    }
    return list;
}

void DashboardController::setStorageWarning(const QString &warning)
{
    m_storageWarning = warning;
    if (!warning.isEmpty()) {
        fprintf(stderr, "[store] %s\n", qPrintable(warning));
    }
    if (storageWarningLabel) {
        storageWarningLabel->setText(warning);
        storageWarningLabel->setVisible(!warning.isEmpty());
    }
}

void DashboardController::setFormError(const QString &error)
{
    m_formError = error;
    if (formErrorLabel) {
        formErrorLabel->setText(error);
        formErrorLabel->setVisible(!error.isEmpty());
    }
}

void DashboardController::setGlobalError(const QString &error)
{
    m_globalError = error;
    if (globalErrorLabel) {
        globalErrorLabel->setText(error);
        globalErrorLabel->setVisible(!error.isEmpty());
    }
}

void DashboardController::restoreAccounts()
{
    if (m_store) {
        QList<GitHubAccount> profiles;
        QString error;
        if (!m_store->hydrate(&profiles, &error)) {
            setStorageWarning(TR("accounts.warning.restore_failed").arg(error));
        }
        for (const GitHubAccount &profile : profiles) {
            auto state = std::make_unique<AccountState>(profile, m_gateway);
            state->startRefresh();
            trackAccount(std::move(state), -1);
        }
    }
    // Startup counts as a batch refresh, even with nothing to fetch.
    m_scheduler->markTriggered();
    rebuildAccountList();
    render();
}

bool DashboardController::addAccount(const QString &rawLogin, const QString &rawToken)
{
    const QString login = rawLogin.trimmed();
    const QString token = rawToken.trimmed();
    if (login.isEmpty() || token.isEmpty()) {
        setFormError(TR("accounts.error.required"));
        return false;
    }

    GitHubAccount profile;
    profile.login = login;
    profile.token = token;

    QString notice;
    if (m_store) {
        QString error;
        if (!m_store->persistProfile(profile, &error)) {
            setFormError(TR("accounts.error.persist").arg(error));
            return false;
        }
    } else {
        notice = TR("accounts.warning.session_only");
    }

    auto state = std::make_unique<AccountState>(profile, m_gateway);
    state->startRefresh();
    m_scheduler->markTriggered();

    const int existing = indexOfLogin(login);
    if (existing >= 0) {
        // Same login again: new token, fresh state in the same slot.
        destroyCard(m_accounts[size_t(existing)]);
        m_accounts.erase(m_accounts.begin() + existing);
        fprintf(stderr, "[store] replaced account %s\n", qPrintable(login));
    } else {
        fprintf(stderr, "[store] added account %s\n", qPrintable(login));
    }
    trackAccount(std::move(state), existing);

    setFormError(notice);
    rebuildAccountList();
    render();
    return true;
}

void DashboardController::submitAccountForm()
{
    if (!loginEdit || !tokenEdit) {
        return;
    }
    if (addAccount(loginEdit->text(), tokenEdit->text())) {
        loginEdit->clear();
        tokenEdit->clear();
    }
}

void DashboardController::removeAccountAt(int index)
{
    if (index < 0 || index >= accountCount()) {
        return;
    }
    const QString login = m_accounts[size_t(index)].state->profile().login;
    if (m_store) {
        QString error;
        if (!m_store->forget(login, &error)) {
            setGlobalError(TR("accounts.error.forget").arg(login, error));
        } else {
            setGlobalError(QString());
        }
    }
    destroyCard(m_accounts[size_t(index)]);
    m_accounts.erase(m_accounts.begin() + index);
    fprintf(stderr, "[store] removed account %s\n", qPrintable(login));
    rebuildAccountList();
    render();
}

void DashboardController::refreshAccountAt(int index)
{
    AccountState *state = accountAt(index);
    if (!state) {
        return;
    }
    state->startRefresh();
    m_scheduler->markTriggered();
    render();
}

bool DashboardController::pollJobs()
{
    bool changed = false;
    for (TrackedAccount &tracked : m_accounts) {
        // Both polls must run; no short-circuit.
        const bool fetched = tracked.state->pollFetch();
        const bool acted = tracked.state->pollActions();
        changed = changed || fetched || acted;
    }
    return changed;
}

bool DashboardController::maybeAutoRefresh()
{
    return autoRefreshAccounts(*m_scheduler, accounts(), std::chrono::seconds(m_config.staleAfterSeconds));
}

void DashboardController::trackAccount(std::unique_ptr<AccountState> state, int index)
{
    TrackedAccount tracked;
    tracked.card = createCard(state.get());
    tracked.state = std::move(state);
    if (index < 0 || index >= accountCount()) {
        m_accounts.push_back(std::move(tracked));
        index = accountCount() - 1;
    } else {
        m_accounts.insert(m_accounts.begin() + index, std::move(tracked));
    }
    if (cardsLayout && m_accounts[size_t(index)].card) {
        // Cards sit above the trailing stretch, in account order.
        cardsLayout->insertWidget(index, m_accounts[size_t(index)].card);
    }
}

AccountCard *DashboardController::createCard(AccountState *state)
{
    if (!cardsLayout) {
        return nullptr;
    }
    RowOptions options;
    options.dateFormat = m_config.dateFormat;
    options.showDoneAction = m_config.showDoneAction;
    return new AccountCard(state, options, cardsContainer);
}

void DashboardController::destroyCard(TrackedAccount &tracked)
{
    delete tracked.card.data();
}

bool DashboardController::windowPresentsContent() const
{
    return win && win->isVisible() && !win->isMinimized();
}

void DashboardController::render()
{
    if (dashboardStack) {
        dashboardStack->setCurrentIndex(m_accounts.empty() ? 0 : 1);
    }
    for (TrackedAccount &tracked : m_accounts) {
        if (tracked.card) {
            tracked.card->renderIfChanged();
        }
    }
    acknowledgePresentedSections();
}

void DashboardController::acknowledgePresentedSections()
{
    if (!windowPresentsContent()) {
        return;
    }
    for (TrackedAccount &tracked : m_accounts) {
        if (!tracked.card) {
            continue;
        }
        for (SectionKind kind : tracked.card->presentedSections()) {
            // The highlighted heading went out with the render above.
            if (tracked.state->isHighlighted(kind)) {
                fprintf(stderr, "[refresh] %s: %s acknowledged\n", qPrintable(tracked.state->profile().login), sectionKey(kind));
                tracked.state->acknowledgeSection(kind);
            }
        }
    }
}

void DashboardController::updateAddButton()
{
    if (!addAccountBtn || !loginEdit || !tokenEdit) {
        return;
    }
    addAccountBtn->setEnabled(!loginEdit->text().trimmed().isEmpty() && !tokenEdit->text().trimmed().isEmpty());
}

void DashboardController::rebuildAccountList()
{
    if (!accountListLayout) {
        return;
    }
    // Rows are rebuilt from scratch; the clicked button may still be on the stack.
    while (QLayoutItem *item = accountListLayout->takeAt(0)) {
        if (QWidget *w = item->widget()) {
            w->hide();
            w->deleteLater();
        }
        delete item;
    }
    if (noAccountsLabel) {
        noAccountsLabel->setVisible(m_accounts.empty());
    }
    QWidget *parent = accountListLayout->parentWidget();
    const QColor iconColour = parent ? parent->palette().color(QPalette::ButtonText) : QColor(Qt::black);
    for (int i = 0; i < accountCount(); ++i) {
        const QString login = m_accounts[size_t(i)].state->profile().login;
        auto *row = new QWidget(parent);
        row->setObjectName(QStringLiteral("accountRow"));
        auto *rowLayout = new QHBoxLayout(row);
        rowLayout->setContentsMargins(0, 2, 0, 2);
        auto *circle = new QLabel(login.left(1).toUpper(), row);
        circle->setAlignment(Qt::AlignCenter);
        circle->setStyleSheet(accountCircleStyleSheet(i));
        rowLayout->addWidget(circle);
        auto *name = new QLabel(login, row);
        rowLayout->addWidget(name, 1);
        auto *refreshBtn = new QToolButton(row);
        refreshBtn->setObjectName(QStringLiteral("refresh"));
        refreshBtn->setIcon(iconFromSvgResource(QStringLiteral(":/icons/refresh.svg"), iconColour));
        refreshBtn->setToolTip(TR("accounts.refresh"));
        refreshBtn->setAutoRaise(true);
        rowLayout->addWidget(refreshBtn);
        auto *removeBtn = new QToolButton(row);
        removeBtn->setObjectName(QStringLiteral("remove"));
        removeBtn->setIcon(iconFromSvgResource(QStringLiteral(":/icons/remove.svg"), iconColour));
        removeBtn->setToolTip(TR("accounts.remove"));
        removeBtn->setAutoRaise(true);
        rowLayout->addWidget(removeBtn);
        // Look the account up by login at click time; indexes shift on removal.
        QObject::connect(refreshBtn, &QToolButton::clicked, this, [this, login]() {
            refreshAccountAt(indexOfLogin(login));
        });
        QObject::connect(removeBtn, &QToolButton::clicked, this, [this, login]() {
            removeAccountAt(indexOfLogin(login));
        });
        accountListLayout->addWidget(row);
    }
}
