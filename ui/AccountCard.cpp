/*
 * AccountCard.cpp
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

#include "AccountCard.h"
#include "AccountState.h"
#include "Tr.h"

#include <QDesktopServices>
#include <QFont>
#include <QFrame>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QListWidget>
#include <QListWidgetItem>
#include <QMetaObject>
#include <QPushButton>
#include <QUrl>
#include <QVBoxLayout>

AccountCard::AccountCard(AccountState *state, const RowOptions &options, QWidget *parent)
    : QFrame(parent)
    , m_state(state)
    , m_options(options)
{
    setObjectName(QStringLiteral("accountCard"));
    setFrameShape(QFrame::StyledPanel);
    auto *layout = new QVBoxLayout(this);
    layout->setContentsMargins(12, 10, 12, 10);
    layout->setSpacing(6);

    auto *headerRow = new QHBoxLayout();
    m_titleLabel = new QLabel(TR("card.title").arg(state->profile().login), this);
    QFont titleFont = m_titleLabel->font();
    titleFont.setPointSizeF(titleFont.pointSizeF() * 1.3);
    titleFont.setBold(true);
    m_titleLabel->setFont(titleFont);
    headerRow->addWidget(m_titleLabel);
    m_toggleBtn = new QPushButton(TR("card.hide"), this);
    m_toggleBtn->setFlat(true);
    headerRow->addWidget(m_toggleBtn);
    headerRow->addStretch();
    m_searchEdit = new QLineEdit(this);
    m_searchEdit->setPlaceholderText(TR("card.search"));
    m_searchEdit->setClearButtonEnabled(true);
    m_searchEdit->setFixedWidth(180);
    headerRow->addWidget(m_searchEdit);
    layout->addLayout(headerRow);

    m_syncLabel = new QLabel(this);
    layout->addWidget(m_syncLabel);
    m_errorLabel = new QLabel(this);
    m_errorLabel->setWordWrap(true);
    m_errorLabel->setStyleSheet(QStringLiteral("QLabel { color: #c0392b; }"));
    m_errorLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    layout->addWidget(m_errorLabel);
    m_fetchingLabel = new QLabel(TR("card.fetching"), this);
    layout->addWidget(m_fetchingLabel);
    m_noDataLabel = new QLabel(TR("card.no_data"), this);
    m_noDataLabel->setForegroundRole(QPalette::PlaceholderText);
    layout->addWidget(m_noDataLabel);

    m_body = new QWidget(this);
    auto *bodyLayout = new QVBoxLayout(m_body);
    bodyLayout->setContentsMargins(0, 0, 0, 0);
    for (SectionKind kind : AllSections) {
        auto *line = new QFrame(m_body);
        line->setFrameShape(QFrame::HLine);
        line->setFrameShadow(QFrame::Sunken);
        bodyLayout->addWidget(line);
        auto *section = new NotificationSection(kind, m_body);
        bodyLayout->addWidget(section);
        m_sections.append(section);
        QObject::connect(section, &NotificationSection::expandedChanged, this, [this](bool) {
            scheduleRender();
        });
        QObject::connect(section, &NotificationSection::threadActivated, this, &AccountCard::openThread);
        QObject::connect(section, &NotificationSection::markReadRequested, this, [this](const QString &threadId) {
            m_state->requestMarkRead(threadId);
            scheduleRender();
        });
        QObject::connect(section, &NotificationSection::markDoneRequested, this, [this](const QString &threadId) {
            m_state->requestMarkDone(threadId);
            scheduleRender();
        });
    }
    auto *line = new QFrame(m_body);
    line->setFrameShape(QFrame::HLine);
    line->setFrameShadow(QFrame::Sunken);
    bodyLayout->addWidget(line);
    m_reviewsTitle = new QLabel(TR("card.recent_reviews"), m_body);
    QFont reviewsFont = m_reviewsTitle->font();
    reviewsFont.setBold(true);
    m_reviewsTitle->setFont(reviewsFont);
    bodyLayout->addWidget(m_reviewsTitle);
    m_reviewsList = new QListWidget(m_body);
    m_reviewsList->setSizeAdjustPolicy(QAbstractScrollArea::AdjustToContents);
    m_reviewsList->setSelectionMode(QAbstractItemView::NoSelection);
    bodyLayout->addWidget(m_reviewsList);
    layout->addWidget(m_body);

    QObject::connect(m_toggleBtn, &QPushButton::clicked, this, [this]() {
        setExpanded(!m_expanded);
    });
    QObject::connect(m_searchEdit, &QLineEdit::textChanged, this, [this](const QString &) {
        scheduleRender();
    });
    QObject::connect(m_reviewsList, &QListWidget::itemActivated, this, [](QListWidgetItem *item) {
        const QString url = item ? item->data(Qt::UserRole).toString() : QString();
        if (!url.isEmpty()) {
            QDesktopServices::openUrl(QUrl(url));
        }
    });

    render();
}

void AccountCard::setExpanded(bool expanded)
{
    if (m_expanded == expanded) {
        return;
    }
    m_expanded = expanded;
    render();
}

QString AccountCard::searchText() const
{
    return m_searchEdit->text();
}

void AccountCard::setSearchText(const QString &text)
{
    m_searchEdit->setText(text);
    render();
}

NotificationSection *AccountCard::section(SectionKind kind) const
{
    for (NotificationSection *s : m_sections) {
        if (s->kind() == kind) {
            return s;
        }
    }
    return nullptr;
}

// Row buttons and tree items must not be destroyed inside their own signal handlers.
void AccountCard::scheduleRender()
{
    if (m_renderPending) {
        return;
    }
    m_renderPending = true;
    QMetaObject::invokeMethod(this, [this]() {
        m_renderPending = false;
        render();
    }, Qt::QueuedConnection);
}

void AccountCard::renderIfChanged()
{
    if (m_everRendered && m_state->revision() == m_renderedRevision) {
        return;
    }
    render();
}

void AccountCard::render()
{
    m_renderedRevision = m_state->revision();
    m_everRendered = true;
    m_toggleBtn->setText(m_expanded ? TR("card.hide") : TR("card.show"));
    renderStatus();

    const std::optional<InboxSnapshot> &inbox = m_state->inbox();
    m_noDataLabel->setVisible(!m_expanded && !inbox);
    if (!m_expanded || !inbox) {
        m_body->hide();
        return;
    }

    const SearchFilter filter(m_searchEdit->text());
    for (NotificationSection *section : m_sections) {
        section->render(itemsInSection(*inbox, section->kind()), filter, *m_state, m_options);
    }
    renderRecentReviews();
    m_body->show();
}

void AccountCard::renderStatus()
{
    const std::optional<InboxSnapshot> &inbox = m_state->inbox();
    if (inbox) {
        m_syncLabel->setText(TR("card.last_synced")
            .arg(inbox->fetchedAt.toUTC().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))));
    } else {
        m_syncLabel->setText(TR("card.never_synced"));
    }
    const QString &error = m_state->lastError();
    m_errorLabel->setText(error);
    m_errorLabel->setVisible(!error.isEmpty());
    m_fetchingLabel->setVisible(error.isEmpty() && m_state->hasPendingFetch());
}

void AccountCard::renderRecentReviews()
{
    m_reviewsList->clear();
    const QList<ReviewSummary> &reviews = m_state->inbox()->recentReviews;
    if (reviews.isEmpty()) {
        auto *empty = new QListWidgetItem(TR("card.recent_reviews.empty"), m_reviewsList);
        empty->setForeground(palette().color(QPalette::PlaceholderText));
        return;
    }
    for (const ReviewSummary &review : reviews) {
        auto *item = new QListWidgetItem(TR("card.recent_reviews.row")
            .arg(review.repo, review.title, review.state,
                 review.updatedAt.toUTC().toString(m_options.dateFormat)), m_reviewsList);
        item->setData(Qt::UserRole, review.url);
        item->setToolTip(review.url);
    }
}

void AccountCard::openThread(const QString &threadId, const QString &url)
{
    if (!url.isEmpty()) {
        QDesktopServices::openUrl(QUrl(url));
    }
    m_state->markSeenLocally(threadId);
    scheduleRender();
}

QList<SectionKind> AccountCard::presentedSections() const
{
    QList<SectionKind> presented;
    if (!m_expanded || !m_state->inbox()) {
        return presented;
    }
    for (NotificationSection *section : m_sections) {
        if (section->isExpanded()) {
            presented.append(section->kind());
        }
    }
    return presented;
}
