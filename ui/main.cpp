/*
 * main.cpp
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

// Reminder UI – Qt 6: GitHub notifications across several accounts.

#include "AccountStore.h"
#include "AccountsPanel.h"
#include "BackgroundJob.h"
#include "Config.h"
#include "DashboardController.h"
#include "GitHubClient.h"
#include "RefreshScheduler.h"
#include "Tr.h"

#include <QApplication>
#include <QFile>
#include <QFrame>
#include <QHBoxLayout>
#include <QLocale>
#include <QMainWindow>
#include <QTranslator>
#include <QWidget>

#include <chrono>
#include <cstdio>
#include <memory>

// Grace period for running network workers at exit; a request stalls at most one transfer timeout.
static const int SHUTDOWN_GRACE_MS = 2000;

int main(int argc, char *argv[]) {
    QApplication app(argc, argv);
    Q_INIT_RESOURCE(reminder);
    QApplication::setApplicationName(QStringLiteral("Reminder"));
    QApplication::setOrganizationName(QStringLiteral("Reminder"));

    QTranslator translator;
    if (translator.load(QLocale(), QStringLiteral("reminder"), QStringLiteral("_"), QStringLiteral(":/i18n"))
        || translator.load(QStringLiteral(":/i18n/reminder_en"))) {
        app.installTranslator(&translator);
    } else {
        fprintf(stderr, "[i18n] no translation catalogue found; showing message keys\n");
    }

    // First launch writes the defaults so they can be edited by hand.
    if (!QFile::exists(reminderConfigPath())) {
        saveConfig(Config());
    }
    const Config config = loadConfig();
    fprintf(stderr, "[config] api %s, refresh every %ds, stale after %ds\n",
                    qPrintable(config.apiBaseUrl), config.refreshIntervalSeconds, config.staleAfterSeconds);

    QString storeError;
    std::unique_ptr<AccountStore> store = AccountStore::initialize(&storeError);

    auto gateway = std::make_shared<GitHubClient>(config.apiBaseUrl, config.timeoutSeconds);
    RefreshScheduler scheduler(std::chrono::seconds(config.refreshIntervalSeconds));

    QMainWindow win;
    win.setWindowTitle(TR("app.title"));
    win.resize(1200, 800);

    auto *central = new QWidget(&win);
    auto *mainLayout = new QHBoxLayout(central);
    mainLayout->setContentsMargins(0, 0, 0, 0);
    mainLayout->setSpacing(0);

    int exitCode = 0;
    {
        DashboardController ctrl(config, gateway, &scheduler, store.get());
        ctrl.win = &win;
        mainLayout->addWidget(buildAccountsPanel(&ctrl, central));
        auto *divider = new QFrame(central);
        divider->setFrameShape(QFrame::VLine);
        divider->setFrameShadow(QFrame::Sunken);
        mainLayout->addWidget(divider);
        mainLayout->addWidget(buildDashboardPane(&ctrl, central), 1);
        win.setCentralWidget(central);

        if (!store) {
            ctrl.setStorageWarning(TR("accounts.warning.storage_unavailable").arg(storeError));
        }
        ctrl.restoreAccounts();
        ctrl.start();

        win.show();
        exitCode = app.exec();
    }

    drainBackgroundJobs(SHUTDOWN_GRACE_MS);
    return exitCode;
}
