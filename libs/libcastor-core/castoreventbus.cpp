/* Class CastorEventBus
*
* This file is part of the Castor project.
*
* Copyright (C) Mark Kendall 2013
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301,
* USA.
*/

// Qt
#include <QReadWriteLock>

// Castor
#include "castorlogging.h"
#include "castoreventbus.h"

CastorEventHandler::~CastorEventHandler()
{
}

/*! \class CastorEventBus
 *  \brief A synchronous topic based publish/subscribe bus.
 *
 * Handlers are called directly from the publishing thread, in subscription order. The handler
 * list is copied before dispatch, so handlers may subscribe or unsubscribe (including themselves)
 * from within HandleEvent.
 *
 * \note Handlers must remain valid until every thread that may publish has finished.
*/
CastorEventBus::CastorEventBus()
  : m_handlersLock(new QReadWriteLock())
{
}

CastorEventBus::~CastorEventBus()
{
    delete m_handlersLock;
}

///\brief Register Handler for Topic. A handler is only registered once per topic.
void CastorEventBus::Subscribe(const QString &Topic, CastorEventHandler *Handler)
{
    if (!Handler || Topic.isEmpty())
        return;

    QWriteLocker locker(m_handlersLock);
    QList<CastorEventHandler*> &handlers = m_handlers[Topic];
    if (!handlers.contains(Handler))
        handlers.append(Handler);
}

void CastorEventBus::Unsubscribe(const QString &Topic, CastorEventHandler *Handler)
{
    QWriteLocker locker(m_handlersLock);

    QMap<QString,QList<CastorEventHandler*> >::iterator it = m_handlers.find(Topic);
    if (it == m_handlers.end())
        return;

    it.value().removeAll(Handler);
    if (it.value().isEmpty())
        m_handlers.erase(it);
}

///\brief Remove Handler from every topic.
void CastorEventBus::Unsubscribe(CastorEventHandler *Handler)
{
    QWriteLocker locker(m_handlersLock);

    QMap<QString,QList<CastorEventHandler*> >::iterator it = m_handlers.begin();
    while (it != m_handlers.end())
    {
        it.value().removeAll(Handler);
        if (it.value().isEmpty())
            it = m_handlers.erase(it);
        else
            ++it;
    }
}

/*! \brief Deliver Topic to every subscribed handler.
 *
 * Returns the valid results of each handler, in subscription order.
*/
QVariantList CastorEventBus::Publish(const QString &Topic, const QVariantList &Arguments)
{
    QList<CastorEventHandler*> handlers;
    {
        QReadLocker locker(m_handlersLock);
        handlers = m_handlers.value(Topic);
    }

    QVariantList results;

    if (handlers.isEmpty())
    {
        LOG(VB_GENERAL, LOG_DEBUG, QString("No handlers for '%1'").arg(Topic));
        return results;
    }

    foreach (CastorEventHandler *handler, handlers)
    {
        QVariant result = handler->HandleEvent(Topic, Arguments);
        if (result.isValid())
            results.append(result);
    }

    return results;
}

int CastorEventBus::HandlerCount(const QString &Topic)
{
    QReadLocker locker(m_handlersLock);
    return m_handlers.value(Topic).size();
}

QStringList CastorEventBus::GetTopics(void)
{
    QReadLocker locker(m_handlersLock);
    return m_handlers.keys();
}
