/* Class CastorSSDPScheduler
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
#include <QTimerEvent>

// Castor
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castorsettings.h"
#include "castoreventbus.h"
#include "upnp/castorssdpscheduler.h"

/*! \class CastorSSDPScheduler
 *  \brief Periodically re-announces the device and checks for network changes.
 *
 * Every tick publishes CASTOR_TOPIC_SSDP_NOTIFY. If the network interfaces have changed since
 * the last tick, or CASTOR_SSDP_UPDATE_TICKS ticks have passed, CASTOR_TOPIC_SSDP_UPDATE_IP
 * is published first.
*/
CastorSSDPScheduler::CastorSSDPScheduler(CastorSettings *Settings, CastorEventBus *Bus)
  : QObject(),
    m_settings(Settings),
    m_bus(Bus),
    m_timer(0),
    m_counter(0)
{
}

CastorSSDPScheduler::~CastorSSDPScheduler()
{
    StopTimer();
}

void CastorSSDPScheduler::StartTimer(int Interval)
{
    StopTimer();
    m_timer = startTimer(Interval);
}

void CastorSSDPScheduler::StopTimer(void)
{
    if (m_timer)
        killTimer(m_timer);
    m_timer = 0;
}

void CastorSSDPScheduler::Tick(void)
{
    m_counter++;

    if (m_settings->IsIPChanged() || m_counter >= CASTOR_SSDP_UPDATE_TICKS)
    {
        m_counter = 0;
        LOG(VB_UPNP, LOG_DEBUG, "Updating SSDP interfaces");
        m_bus->Publish(CASTOR_TOPIC_SSDP_UPDATE_IP);
    }

    m_bus->Publish(CASTOR_TOPIC_SSDP_NOTIFY);
}

int CastorSSDPScheduler::GetCounter(void) const
{
    return m_counter;
}

void CastorSSDPScheduler::timerEvent(QTimerEvent *Event)
{
    if (Event && Event->timerId() == m_timer)
        Tick();
}

/*! \class CastorSSDPSchedulerThread
 *  \brief Runs a CastorSSDPScheduler in its own event loop.
*/
CastorSSDPSchedulerThread::CastorSSDPSchedulerThread(CastorSettings *Settings, CastorEventBus *Bus)
  : CastorQThread("SSDPScheduler"),
    m_settings(Settings),
    m_bus(Bus),
    m_scheduler(NULL)
{
}

CastorSSDPSchedulerThread::~CastorSSDPSchedulerThread()
{
}

void CastorSSDPSchedulerThread::Start(void)
{
    LOG(VB_UPNP, LOG_INFO, "SSDP scheduler starting");
    m_scheduler = new CastorSSDPScheduler(m_settings, m_bus);
    m_scheduler->StartTimer();
}

void CastorSSDPSchedulerThread::Finish(void)
{
    delete m_scheduler;
    m_scheduler = NULL;
    LOG(VB_UPNP, LOG_INFO, "SSDP scheduler stopped");
}
