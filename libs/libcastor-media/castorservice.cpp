/* Class CastorService
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
#include <QCoreApplication>

// Castor
#include "castorlocaldefs.h"
#include "castorexitcodes.h"
#include "castorlogging.h"
#include "castorsettings.h"
#include "castoreventbus.h"
#include "http/castorhttpserver.h"
#include "upnp/castorssdpservice.h"
#include "upnp/castorssdpscheduler.h"
#include "castorplugincoordinator.h"
#include "castorservice.h"

/*! \class CastorService
 *  \brief Runs the media renderer.
 *
 * CastorService owns the SSDP service and its scheduler, the renderer and protocol
 * coordinators and the HTTP server. Start brings them up in that order (with the HTTP server
 * after the protocol) and returns an exit code if any of them fails. Stop tears them down in
 * reverse order, announcing the departure of the device over SSDP.
 *
 * If the HTTP server cannot use the configured port, the device identity is regenerated so
 * that control points do not confuse the new location with the old one.
 *
 * A fatal error after startup (SSDP cannot be restarted or a new renderer/protocol fails to
 * start) stops the service and exits the application.
*/
CastorService::CastorService(CastorSettings *Settings, CastorEventBus *Bus,
                             CastorRenderer *Renderer, CastorProtocol *Protocol,
                             CastorSSDPSocketSet *Sockets)
  : QObject(),
    m_settings(Settings),
    m_bus(Bus),
    m_ssdp(new CastorSSDPService(Settings, Bus, Sockets)),
    m_scheduler(new CastorSSDPSchedulerThread(Settings, Bus)),
    m_rendererPlugin(new CastorRendererPlugin(Bus, Renderer)),
    m_protocolPlugin(new CastorProtocolPlugin(Bus, Protocol)),
    m_http(new CastorHTTPServer()),
    m_running(false)
{
    connect(m_ssdp,           SIGNAL(Failed(QString)), this, SLOT(SSDPFailed(QString)),   Qt::QueuedConnection);
    connect(m_rendererPlugin, SIGNAL(Failed(QString)), this, SLOT(PluginFailed(QString)), Qt::QueuedConnection);
    connect(m_protocolPlugin, SIGNAL(Failed(QString)), this, SLOT(PluginFailed(QString)), Qt::QueuedConnection);
    connect(m_protocolPlugin, SIGNAL(ProtocolChanged(CastorProtocol*)), this, SLOT(ProtocolChanged(CastorProtocol*)), Qt::DirectConnection);
}

CastorService::~CastorService()
{
    Stop();

    delete m_scheduler;
    delete m_http;
    delete m_protocolPlugin;
    delete m_rendererPlugin;
    delete m_ssdp;
}

///\brief Start all components. Returns GENERIC_EXIT_OK or the exit code for the failure.
int CastorService::Start(void)
{
    if (m_running)
        return GENERIC_EXIT_OK;

    LOG(VB_GENERAL, LOG_INFO, "Starting service");

    if (m_ssdp->Start() == CastorSSDPSocketSet::BindError)
    {
        LOG(VB_GENERAL, LOG_CRIT, "Failed to start SSDP");
        Stop();
        return GENERIC_EXIT_SOCKET_ERROR;
    }

    if (!m_rendererPlugin->Start())
    {
        LOG(VB_GENERAL, LOG_CRIT, "Failed to start renderer");
        Stop();
        return GENERIC_EXIT_PLUGIN_ERROR;
    }

    if (!m_protocolPlugin->Start())
    {
        LOG(VB_GENERAL, LOG_CRIT, "Failed to start protocol");
        Stop();
        return GENERIC_EXIT_PLUGIN_ERROR;
    }

    CastorProtocol *protocol = m_protocolPlugin->GetProtocol();
    m_http->SetHandler(protocol ? protocol->GetHandler() : NULL);

    if (!m_http->Open(m_settings->GetPort()))
    {
        LOG(VB_GENERAL, LOG_CRIT, "Failed to start web server");
        Stop();
        return GENERIC_EXIT_PORT_ERROR;
    }

    (void)CheckPort();
    m_scheduler->start();

    m_running = true;
    LOG(VB_GENERAL, LOG_INFO, QString("'%1' running on port %2").arg(GetFriendlyName()).arg(GetPort()));
    return GENERIC_EXIT_OK;
}

///\brief Stop all components. Safe to call on a partially started service.
void CastorService::Stop(void)
{
    if (m_scheduler->isRunning())
    {
        m_scheduler->quit();
        m_scheduler->wait();
    }

    m_http->Close();
    m_http->SetHandler(NULL);
    m_protocolPlugin->Stop();
    m_rendererPlugin->Stop();
    m_ssdp->Stop();

    if (m_running)
        LOG(VB_GENERAL, LOG_INFO, "Service stopped");
    m_running = false;
}

bool CastorService::IsRunning(void)
{
    return m_running;
}

/*! \brief Reconcile the stored port with the port the HTTP server actually bound.
 *
 * If they differ, the new port is stored, the device gets a new uuid and a temporary name and
 * SSDP is restarted so that LOCATION is correct.
 * Returns true if the port changed.
*/
bool CastorService::CheckPort(void)
{
    int bound = m_http->GetPort();
    int last  = m_settings->GetPort();

    if (bound == last)
        return false;

    LOG(VB_GENERAL, LOG_INFO, QString("Web server port changed from %1 to %2").arg(last).arg(bound));
    m_settings->SetSetting(CASTOR_SETTING_PORT, bound);

    (void)m_settings->GetUSN(true);
    m_settings->SetTemporaryFriendlyName(QString("Castor(%1)").arg(qrand() % 10000, 4, 10, QChar('0')));
    LOG(VB_GENERAL, LOG_INFO, QString("New device name: '%1'").arg(m_settings->GetFriendlyName()));
    m_http->ReloadHandler();

    m_bus->Publish(CASTOR_TOPIC_SSDP_UPDATE_IP);
    return true;
}

int CastorService::GetPort(void)
{
    return m_http->GetPort();
}

QString CastorService::GetFriendlyName(void)
{
    return m_settings->GetFriendlyName();
}

QString CastorService::GetServerInfo(void)
{
    return m_settings->GetServerInfo();
}

CastorSSDPService* CastorService::GetSSDPService(void)
{
    return m_ssdp;
}

CastorRendererPlugin* CastorService::GetRendererPlugin(void)
{
    return m_rendererPlugin;
}

CastorProtocolPlugin* CastorService::GetProtocolPlugin(void)
{
    return m_protocolPlugin;
}

CastorHTTPServer* CastorService::GetHTTPServer(void)
{
    return m_http;
}

void CastorService::SSDPFailed(const QString &Reason)
{
    Exit(GENERIC_EXIT_SOCKET_ERROR, Reason);
}

void CastorService::PluginFailed(const QString &Reason)
{
    Exit(GENERIC_EXIT_PLUGIN_ERROR, Reason);
}

void CastorService::ProtocolChanged(CastorProtocol *Protocol)
{
    m_http->SetHandler(Protocol ? Protocol->GetHandler() : NULL);
}

void CastorService::Exit(int ExitCode, const QString &Reason)
{
    LOG(VB_GENERAL, LOG_CRIT, QString("Fatal error: %1").arg(Reason));
    Stop();
    emit Fatal(ExitCode);

    if (QCoreApplication::instance())
        QCoreApplication::exit(ExitCode);
}
