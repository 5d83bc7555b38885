/*
 * AccountsPanel.cpp
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

#include "AccountsPanel.h"
#include "DashboardController.h"
#include "Tr.h"

#include <QFont>
#include <QFrame>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QScrollArea>
#include <QStackedWidget>
#include <QVBoxLayout>
#include <QWidget>

QWidget *buildAccountsPanel(DashboardController *ctrl, QWidget *parent) {
    auto *panel = new QWidget(parent);
    panel->setObjectName(QStringLiteral("accountsPanel"));
    panel->setMinimumWidth(240);
    panel->setMaximumWidth(320);
    auto *layout = new QVBoxLayout(panel);
    layout->setContentsMargins(12, 12, 12, 12);
    layout->setSpacing(6);

    auto *heading = new QLabel(TR("accounts.heading"), panel);
    QFont headingFont = heading->font();
    headingFont.setPointSizeF(headingFont.pointSizeF() * 1.3);
    headingFont.setBold(true);
    heading->setFont(headingFont);
    layout->addWidget(heading);

    auto *warning = new QLabel(panel);
    warning->setWordWrap(true);
    warning->setStyleSheet(QStringLiteral("QLabel { color: #cc7700; }"));
    warning->hide();
    layout->addWidget(warning);
    ctrl->storageWarningLabel = warning;

    auto *separator = new QFrame(panel);
    separator->setFrameShape(QFrame::HLine);
    separator->setFrameShadow(QFrame::Sunken);
    layout->addWidget(separator);

    layout->addWidget(new QLabel(TR("accounts.login"), panel));
    auto *loginEdit = new QLineEdit(panel);
    loginEdit->setObjectName(QStringLiteral("login"));
    layout->addWidget(loginEdit);
    ctrl->loginEdit = loginEdit;

    layout->addWidget(new QLabel(TR("accounts.token"), panel));
    auto *tokenEdit = new QLineEdit(panel);
    tokenEdit->setObjectName(QStringLiteral("token"));
    tokenEdit->setEchoMode(QLineEdit::Password);
    tokenEdit->setPlaceholderText(TR("accounts.placeholder.token"));
    layout->addWidget(tokenEdit);
    ctrl->tokenEdit = tokenEdit;

    auto *addBtn = new QPushButton(TR("accounts.add"), panel);
    addBtn->setObjectName(QStringLiteral("addAccount"));
    addBtn->setEnabled(false);
    layout->addWidget(addBtn);
    ctrl->addAccountBtn = addBtn;

    auto *formError = new QLabel(panel);
    formError->setWordWrap(true);
    formError->setStyleSheet(QStringLiteral("QLabel { color: #c0392b; }"));
    formError->hide();
    layout->addWidget(formError);
    ctrl->formErrorLabel = formError;

    auto *separator2 = new QFrame(panel);
    separator2->setFrameShape(QFrame::HLine);
    separator2->setFrameShadow(QFrame::Sunken);
    layout->addWidget(separator2);

    layout->addWidget(new QLabel(TR("accounts.tracked"), panel));
    auto *noAccounts = new QLabel(TR("accounts.none"), panel);
    noAccounts->setForegroundRole(QPalette::PlaceholderText);
    layout->addWidget(noAccounts);
    ctrl->noAccountsLabel = noAccounts;

    auto *list = new QWidget(panel);
    auto *listLayout = new QVBoxLayout(list);
    listLayout->setContentsMargins(0, 0, 0, 0);
    listLayout->setSpacing(2);
    layout->addWidget(list);
    ctrl->accountListLayout = listLayout;

    layout->addStretch();
    return panel;
}

QWidget *buildDashboardPane(DashboardController *ctrl, QWidget *parent) {
    auto *pane = new QWidget(parent);
    auto *layout = new QVBoxLayout(pane);
    layout->setContentsMargins(12, 12, 12, 12);

    auto *globalError = new QLabel(pane);
    globalError->setWordWrap(true);
    globalError->setStyleSheet(QStringLiteral("QLabel { color: #c0392b; }"));
    globalError->hide();
    layout->addWidget(globalError);
    ctrl->globalErrorLabel = globalError;

    auto *stack = new QStackedWidget(pane);
    auto *placeholder = new QLabel(TR("dashboard.placeholder"), stack);
    placeholder->setAlignment(Qt::AlignCenter);
    placeholder->setWordWrap(true);
    stack->addWidget(placeholder);

    auto *scroll = new QScrollArea(stack);
    scroll->setWidgetResizable(true);
    scroll->setFrameShape(QFrame::NoFrame);
    auto *cards = new QWidget(scroll);
    auto *cardsLayout = new QVBoxLayout(cards);
    cardsLayout->setContentsMargins(0, 0, 0, 0);
    cardsLayout->setSpacing(12);
    cardsLayout->addStretch();
    scroll->setWidget(cards);
    stack->addWidget(scroll);
    layout->addWidget(stack, 1);

    ctrl->dashboardStack = stack;
    ctrl->cardsContainer = cards;
    ctrl->cardsLayout = cardsLayout;
    return pane;
}
