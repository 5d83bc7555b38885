/*
 * AccountsPanel.h
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

#ifndef ACCOUNTSPANEL_H
#define ACCOUNTSPANEL_H

class QWidget;
class DashboardController;

/**
 * Build the left-hand accounts panel: storage warning, the add-account form
 * (username, personal access token, Add button, form error) and the list of
 * tracked accounts with their Refresh/Remove buttons.
 *
 * Sets the corresponding widget refs on ctrl; the form and list are wired
 * by DashboardController::start().
 */
QWidget *buildAccountsPanel(DashboardController *ctrl, QWidget *parent);

/**
 * Build the dashboard pane: global error line over a stack of the
 * "add an account" placeholder and the scrollable column of account cards.
 */
QWidget *buildDashboardPane(DashboardController *ctrl, QWidget *parent);

#endif // ACCOUNTSPANEL_H
