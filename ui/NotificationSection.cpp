/*
 * NotificationSection.cpp
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

#include "NotificationSection.h"
#include "AccountState.h"
#include "IconUtils.h"
#include "Tr.h"

#include <QFont>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QLabel>
#include <QPalette>
#include <QProgressBar>
#include <QPushButton>
#include <QToolButton>
#include <QTreeWidget>
#include <QTreeWidgetItem>
#include <QVBoxLayout>

// Warning colour for highlighted headers and rows that need a revisit.
static const QColor WARN_COLOUR(0xCC, 0x77, 0x00);

static const int ThreadIdRole = Qt::UserRole;
static const int UrlRole = Qt::UserRole + 1;

QString sectionTitle(SectionKind kind) {
    switch (kind) {
    case SectionReviewRequests:
        return TR("section.review_requests");
    case SectionMentions:
        return TR("section.mentions");
    case SectionNotifications:
        break;
    }
    return TR("section.notifications");
}

QString sectionEmptyText(SectionKind kind) {
    switch (kind) {
    case SectionReviewRequests:
        return TR("section.review_requests.empty");
    case SectionMentions:
        return TR("section.mentions.empty");
    case SectionNotifications:
        break;
    }
    return TR("section.notifications.empty");
}

NotificationSection::NotificationSection(SectionKind kind, QWidget *parent)
    : QWidget(parent)
    , m_kind(kind)
{
    setObjectName(QLatin1String(sectionKey(kind)));
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(4);

    m_header = new QToolButton(this);
    m_header->setCheckable(true);
    m_header->setChecked(true);
    m_header->setArrowType(Qt::DownArrow);
    m_header->setToolButtonStyle(Qt::ToolButtonTextBesideIcon);
    m_header->setAutoRaise(true);
    layout->addWidget(m_header);

    m_placeholder = new QLabel(this);
    m_placeholder->setForegroundRole(QPalette::PlaceholderText);
    m_placeholder->setContentsMargins(20, 0, 0, 0);
    layout->addWidget(m_placeholder);

    m_table = new QTreeWidget(this);
    m_table->setColumnCount(ColumnCount);
    m_table->setHeaderLabels({ TR("table.repository"), TR("table.subject"), TR("table.reason"),
                               TR("table.updated"), TR("table.actions") });
    m_table->setRootIsDecorated(false);
    m_table->setAlternatingRowColors(true);
    m_table->setSelectionMode(QAbstractItemView::SingleSelection);
    m_table->setUniformRowHeights(true);
    m_table->setSizeAdjustPolicy(QAbstractScrollArea::AdjustToContents);
    m_table->setVerticalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    m_table->header()->setStretchLastSection(false);
    m_table->header()->setSectionResizeMode(ColSubject, QHeaderView::Stretch);
    m_table->setColumnWidth(ColRepository, 160);
    m_table->setColumnWidth(ColReason, 120);
    m_table->setColumnWidth(ColUpdated, 130);
    m_table->setColumnWidth(ColActions, 170);
    layout->addWidget(m_table);

    QObject::connect(m_header, &QToolButton::toggled, this, [this](bool on) {
        m_header->setArrowType(on ? Qt::DownArrow : Qt::RightArrow);
        if (!on) {
            m_placeholder->hide();
            m_table->hide();
        }
        emit expandedChanged(on);
    });
    QObject::connect(m_table, &QTreeWidget::itemActivated, this, [this](QTreeWidgetItem *item, int) {
        if (!item) {
            return;
        }
        emit threadActivated(item->data(ColSubject, ThreadIdRole).toString(),
                             item->data(ColSubject, UrlRole).toString());
    });
}

bool NotificationSection::isExpanded() const
{
    return m_header->isChecked();
}

void NotificationSection::setExpanded(bool expanded)
{
    m_header->setChecked(expanded);
}

void NotificationSection::render(const QList<const NotificationItem *> &items, const SearchFilter &filter,
                                 const AccountState &state, const RowOptions &options)
{
    const SectionCounts counts = summarizeCounts(items);
    m_header->setText(TR("section.heading").arg(sectionTitle(m_kind)).arg(counts.unseen).arg(counts.updated));
    const bool highlighted = state.isHighlighted(m_kind);
    QFont headerFont = m_header->font();
    headerFont.setBold(true);
    m_header->setFont(headerFont);
    m_header->setStyleSheet(highlighted
        ? QStringLiteral("QToolButton { color: %1; }").arg(WARN_COLOUR.name())
        : QString());

    m_table->clear();
    if (!isExpanded()) {
        m_placeholder->hide();
        m_table->hide();
        return;
    }
    if (items.isEmpty()) {
        m_placeholder->setText(sectionEmptyText(m_kind));
        m_placeholder->show();
        m_table->hide();
        return;
    }
    for (const NotificationItem *item : items) {
        if (filter.matches(*item)) {
            addRow(*item, state, options);
        }
    }
    if (m_table->topLevelItemCount() == 0) {
        m_placeholder->setText(TR("section.no_matches"));
        m_placeholder->show();
        m_table->hide();
        return;
    }
    m_placeholder->hide();
    m_table->show();
}

void NotificationSection::addRow(const NotificationItem &item, const AccountState &state, const RowOptions &options)
{
    const NotificationVisualState visual = notificationState(item);
    auto *row = new QTreeWidgetItem(m_table);
    row->setText(ColRepository, item.repo);
    row->setText(ColSubject, visual.needsRevisit
        ? TR("row.subject_updated").arg(item.title)
        : item.title);
    row->setText(ColReason, item.reason);
    row->setText(ColUpdated, item.updatedAt.toUTC().toString(options.dateFormat));
    row->setData(ColSubject, ThreadIdRole, item.threadId);
    row->setData(ColSubject, UrlRole, item.url);
    if (!item.url.isEmpty()) {
        row->setToolTip(ColSubject, item.url);
    }

    QFont font = m_table->font();
    font.setBold(item.unread);
    const QColor dimmed = m_table->palette().color(QPalette::PlaceholderText);
    for (int col = 0; col < ColActions; ++col) {
        row->setFont(col, font);
        if (visual.needsRevisit) {
            row->setForeground(col, WARN_COLOUR);
        } else if (visual.seen) {
            row->setForeground(col, dimmed);
        }
    }

    auto *actions = new QWidget(m_table);
    auto *actionsLayout = new QHBoxLayout(actions);
    actionsLayout->setContentsMargins(2, 0, 2, 0);
    actionsLayout->setSpacing(4);

    const bool busy = state.isInflight(item.threadId);
    const QString threadId = item.threadId;
    auto *markReadBtn = new QPushButton(TR("row.mark_read"), actions);
    markReadBtn->setObjectName(QStringLiteral("markRead"));
    markReadBtn->setIcon(iconFromSvgResource(QStringLiteral(":/icons/check.svg"), palette().color(QPalette::ButtonText)));
    markReadBtn->setEnabled(!busy && !visual.seen);
    actionsLayout->addWidget(markReadBtn);
    QObject::connect(markReadBtn, &QPushButton::clicked, this, [this, threadId]() {
        emit markReadRequested(threadId);
    });

    if (options.showDoneAction) {
        auto *doneBtn = new QPushButton(TR("row.mark_done"), actions);
        doneBtn->setObjectName(QStringLiteral("markDone"));
        doneBtn->setIcon(iconFromSvgResource(QStringLiteral(":/icons/archive.svg"), palette().color(QPalette::ButtonText)));
        doneBtn->setEnabled(!busy);
        actionsLayout->addWidget(doneBtn);
        QObject::connect(doneBtn, &QPushButton::clicked, this, [this, threadId]() {
            emit markDoneRequested(threadId);
        });
    }

    if (busy) {
        auto *spinner = new QProgressBar(actions);
        spinner->setObjectName(QStringLiteral("busy"));
        spinner->setRange(0, 0);
        spinner->setTextVisible(false);
        spinner->setFixedSize(32, 10);
        actionsLayout->addWidget(spinner);
    }
    actionsLayout->addStretch();
    m_table->setItemWidget(row, ColActions, actions);
}
