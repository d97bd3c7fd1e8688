/* Class CastorSSDPService
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
#include <QMutex>

// Castor
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castorsettings.h"
#include "upnp/castorupnp.h"
#include "upnp/castorssdpservice.h"

/*! \class CastorSSDPService
 *  \brief Advertises the local media renderer over SSDP.
 *
 * CastorSSDPService builds the six advertisements for the device from the current settings
 * (USN, HTTP port and server signature) and drives a CastorSSDP engine with them.
 *
 * It listens for CASTOR_TOPIC_SSDP_NOTIFY, which sends an alive notification for every
 * advertisement, and CASTOR_TOPIC_SSDP_UPDATE_IP, which restarts the engine on the current
 * set of interfaces without sending byebye notifications.
 *
 * UpdateIP and Stop are serialised so that a restart never races with shutdown.
*/
CastorSSDPService::CastorSSDPService(CastorSettings *Settings, CastorEventBus *Bus, CastorSSDPSocketSet *Sockets)
  : QObject(),
    CastorEventHandler(),
    m_settings(Settings),
    m_bus(Bus),
    m_ssdp(new CastorSSDP(Sockets)),
    m_restartLock(new QMutex())
{
}

CastorSSDPService::~CastorSSDPService()
{
    Stop();

    delete m_ssdp;
    delete m_restartLock;
}

///\brief Register the advertisements and start the engine. BindError is fatal.
CastorSSDPSocketSet::Error CastorSSDPService::Start(void)
{
    CastorSSDPSocketSet::Error error;
    {
        QMutexLocker locker(m_restartLock);
        Register();
        error = m_ssdp->Start(m_settings->GetIP());
    }

    if (error != CastorSSDPSocketSet::NoError)
        return error;

    m_bus->Subscribe(CASTOR_TOPIC_SSDP_NOTIFY, this);
    m_bus->Subscribe(CASTOR_TOPIC_SSDP_UPDATE_IP, this);
    return error;
}

///\brief Stop the engine, sending a byebye for each advertisement.
void CastorSSDPService::Stop(void)
{
    m_bus->Unsubscribe(this);

    QMutexLocker locker(m_restartLock);
    m_ssdp->Stop(true);
}

/*! \brief Restart the engine with freshly built advertisements.
 *
 * The engine is stopped without byebye notifications. Failing to rebind the SSDP port
 * emits Failed.
*/
CastorSSDPSocketSet::Error CastorSSDPService::UpdateIP(void)
{
    CastorSSDPSocketSet::Error error;
    {
        QMutexLocker locker(m_restartLock);

        LOG(VB_UPNP, LOG_INFO, "Restarting SSDP");
        m_ssdp->Stop(false);
        Register();
        error = m_ssdp->Start(m_settings->GetIP());
    }

    if (error == CastorSSDPSocketSet::BindError)
        emit Failed("Failed to restart SSDP");
    return error;
}

void CastorSSDPService::Notify(void)
{
    QStringList usns = m_ssdp->GetUSNs();
    foreach (const QString &usn, usns)
        m_ssdp->DoNotify(usn);
}

CastorSSDP* CastorSSDPService::GetSSDP(void)
{
    return m_ssdp;
}

QVariant CastorSSDPService::HandleEvent(const QString &Topic, const QVariantList &Arguments)
{
    (void)Arguments;

    if (Topic == CASTOR_TOPIC_SSDP_NOTIFY)
        Notify();
    else if (Topic == CASTOR_TOPIC_SSDP_UPDATE_IP)
        UpdateIP();

    return QVariant();
}

void CastorSSDPService::Register(void)
{
    QString uuid     = m_settings->GetUSN();
    QString location = QString("http://{}:%1/description.xml").arg(m_settings->GetPort());
    QString server   = m_settings->GetServerInfo();

    QStringList usns = CastorUPNP::DeviceUSNs(uuid);
    foreach (const QString &usn, usns)
        m_ssdp->Register(usn, CastorUPNP::TypeFromUSN(usn), location, server, CASTOR_SSDP_CACHE_CONTROL);
}
