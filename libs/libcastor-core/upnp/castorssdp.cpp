/* Class CastorSSDP
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
#include <QDateTime>
#include <QMutex>

// Castor
#include "castorlogging.h"
#include "castorqthread.h"
#include "castornetwork.h"
#include "castorssdpmessage.h"
#include "castorssdp.h"

#define SSDP_RECEIVE_TIMEOUT 1000

CastorSSDPResponse::CastorSSDPResponse()
  : m_port(0),
    m_due(0)
{
}

CastorSSDPResponse::CastorSSDPResponse(const QByteArray &Datagram, const QString &USN,
                                       const QHostAddress &Host, quint16 Port, qint64 Due)
  : m_datagram(Datagram),
    m_usn(USN),
    m_host(Host),
    m_port(Port),
    m_due(Due)
{
}

/*! \class CastorSSDPListener
 *  \brief The SSDP receive thread.
 *
 * There is no Qt event loop in this thread. It runs the receive loop until the parent is
 * stopped, sends any byebye notifications and then closes the sockets.
*/
class CastorSSDPListener : public CastorQThread
{
  public:
    explicit CastorSSDPListener(CastorSSDP *Parent)
      : CastorQThread("SSDP"),
        m_parent(Parent)
    {
    }

    void Start(void)
    {
        LOG(VB_UPNP, LOG_INFO, "SSDP thread starting");
    }

    void Finish(void)
    {
        LOG(VB_UPNP, LOG_INFO, "SSDP thread stopping");
    }

  protected:
    void run(void)
    {
        Initialise();
        m_parent->Run();
        m_parent->Shutdown();

        // the sockets belong to this thread now
        m_parent->m_sockets->Close();
        Deinitialise();
    }

  private:
    CastorSSDP *m_parent;
};

/*! \class CastorSSDP
 *  \brief Answers SSDP discovery requests and sends alive/byebye notifications.
 *
 * CastorSSDP owns the registry of local advertisements and the SSDP sockets. Start opens the
 * sockets and creates a dedicated receive thread, Stop closes them again.
 *
 * Discovery replies are delayed by a random period of up to MX seconds. Replies are queued and
 * sent from the receive loop once they are due.
*/
CastorSSDP::CastorSSDP(CastorSSDPSocketSet *Sockets)
  : m_sockets(Sockets ? Sockets : new CastorSSDPSocketSet()),
    m_listener(NULL),
    m_running(0),
    m_sendingByebye(1),
    m_pendingLock(new QMutex())
{
}

CastorSSDP::~CastorSSDP()
{
    Stop(false);

    delete m_sockets;
    delete m_pendingLock;
}

/*! \brief Open the SSDP sockets and start the receive thread.
 *
 * Returns BindError if port 1900 cannot be bound, in which case nothing is started.
*/
CastorSSDPSocketSet::Error CastorSSDP::Start(const CastorInterfaceList &Interfaces)
{
    if (m_running.loadAcquire())
        return CastorSSDPSocketSet::NoError;

    LOG(VB_GENERAL, LOG_INFO, "Starting SSDP");

    CastorSSDPSocketSet::Error error = m_sockets->Open(Interfaces);
    if (error == CastorSSDPSocketSet::BindError)
    {
        LOG(VB_GENERAL, LOG_CRIT, "SSDP failed to start");
        return error;
    }

    m_sendingByebye.storeRelease(1);
    m_running.storeRelease(1);

    m_listener = new CastorSSDPListener(this);
    m_sockets->MoveToThread(m_listener);
    m_listener->start();
    return CastorSSDPSocketSet::NoError;
}

/*! \brief Stop the receive thread and close the sockets.
 *
 * If Byebye is true, a byebye notification is sent for each registered USN. The registry
 * and any queued replies are cleared. Stop blocks until the receive thread has exited.
*/
void CastorSSDP::Stop(bool Byebye)
{
    if (!m_running.loadAcquire())
        return;

    // the receive loop may exit as soon as m_running is cleared
    m_sendingByebye.storeRelease(Byebye ? 1 : 0);
    if (!m_running.testAndSetOrdered(1, 0))
        return;

    LOG(VB_GENERAL, LOG_INFO, QString("Stopping SSDP (%1)").arg(Byebye ? "byebye" : "no byebye"));
    m_sockets->Interrupt();

    if (m_listener)
    {
        m_listener->wait();
        delete m_listener;
        m_listener = NULL;
    }

    m_sockets->Close();
}

bool CastorSSDP::IsRunning(void)
{
    return m_running.loadAcquire();
}

///\brief Add or replace the advertisement for USN.
void CastorSSDP::Register(const QString &USN, const QString &Type, const QString &Location,
                          const QString &Server, const QString &CacheControl)
{
    LOG(VB_UPNP, LOG_INFO, QString("Registering %1 (%2)").arg(Type).arg(Location));
    m_registry.Register(CastorUPNPDescription(USN, Type, Location, Server, CacheControl));
}

void CastorSSDP::Unregister(const QString &USN)
{
    if (m_registry.Unregister(USN))
        LOG(VB_UPNP, LOG_INFO, QString("Unregistered %1").arg(USN));
}

bool CastorSSDP::IsRegistered(const QString &USN)
{
    return m_registry.Contains(USN);
}

QStringList CastorSSDP::GetUSNs(void)
{
    return m_registry.GetUSNs();
}

CastorDeviceRegistry* CastorSSDP::GetRegistry(void)
{
    return &m_registry;
}

///\brief Send an ssdp:alive notification for USN, twice, from each interface.
void CastorSSDP::DoNotify(const QString &USN)
{
    CastorUPNPDescription description;
    if (!m_registry.Get(USN, description))
    {
        LOG(VB_UPNP, LOG_DEBUG, QString("Not notifying unknown USN '%1'").arg(USN));
        return;
    }

    LOG(VB_UPNP, LOG_DEBUG, QString("Sending alive notification for %1").arg(USN));

    CastorInterfaceList interfaces = m_sockets->GetInterfaces();
    foreach (const CastorInterface &interface, interfaces)
    {
        QByteArray notify = CastorSSDPMessage::Notify(description, interface.first, true);
        for (int i = 0; i < 2; ++i)
            if (!m_sockets->SendMulticast(notify, interface.first))
                LOG(VB_UPNP, LOG_WARNING, QString("Failed to send alive notification for %1 on %2").arg(USN).arg(interface.first));
    }
}

///\brief Send an ssdp:byebye notification for USN from each interface, if byebyes are enabled.
void CastorSSDP::DoByebye(const QString &USN)
{
    if (!m_sendingByebye.loadAcquire())
        return;

    CastorUPNPDescription description;
    if (!m_registry.Get(USN, description))
    {
        LOG(VB_UPNP, LOG_WARNING, QString("Cannot send byebye for unknown USN '%1'").arg(USN));
        return;
    }

    LOG(VB_UPNP, LOG_INFO, QString("Sending byebye notification for %1").arg(USN));

    CastorInterfaceList interfaces = m_sockets->GetInterfaces();
    foreach (const CastorInterface &interface, interfaces)
        if (!m_sockets->SendMulticast(CastorSSDPMessage::Notify(description, interface.first, false), interface.first))
            LOG(VB_UPNP, LOG_WARNING, QString("Failed to send byebye notification for %1 on %2").arg(USN).arg(interface.first));
}

///\brief Process an incoming datagram. Anything other than a valid M-SEARCH is ignored.
void CastorSSDP::DatagramReceived(const QByteArray &Datagram, const QHostAddress &Host, quint16 Port)
{
    if (Datagram.isEmpty())
        return;

    QString method;
    QString target;
    QMap<QString,QString> headers;
    if (!CastorSSDPMessage::Parse(Datagram, method, target, headers))
        return;

    if (method == "NOTIFY" && target == "*")
        return;

    LOG(VB_UPNP, LOG_DEBUG, QString("SSDP command %1 %2 from %3:%4").arg(method).arg(target).arg(Host.toString()).arg(Port));

    if (method == "M-SEARCH" && target == "*")
    {
        DiscoveryRequest(headers, Host, Port);
        return;
    }

    LOG(VB_UPNP, LOG_WARNING, QString("Unknown SSDP command %1 %2 from %3:%4").arg(method).arg(target).arg(Host.toString()).arg(Port));
}

/*! \brief Queue replies to a discovery request.
 *
 * ST defaults to ssdp:all and MX to 3 seconds. MX is limited to 5 seconds and a request with
 * a non numeric MX is ignored. Each reply is delayed by a random period between 0 and MX.
*/
void CastorSSDP::DiscoveryRequest(const QMap<QString,QString> &Headers, const QHostAddress &Host, quint16 Port)
{
    QString searchtarget = Headers.value("st", "ssdp:all");

    int mx = CASTOR_SSDP_DEFAULT_MX;
    if (Headers.contains("mx"))
    {
        bool ok = false;
        mx = Headers.value("mx").toInt(&ok);
        if (!ok)
        {
            LOG(VB_UPNP, LOG_DEBUG, QString("Ignoring search with invalid MX '%1'").arg(Headers.value("mx")));
            return;
        }
        mx = qBound(0, mx, CASTOR_SSDP_MAXIMUM_MX);
    }

    LOG(VB_UPNP, LOG_INFO, QString("Discovery request from %1:%2 for %3").arg(Host.toString()).arg(Port).arg(searchtarget));

    QList<CastorSSDPResponse> responses = BuildResponses(searchtarget, Host, Port);
    if (responses.isEmpty())
        return;

    qint64 now = QDateTime::currentMSecsSinceEpoch();

    QMutexLocker locker(m_pendingLock);
    QList<CastorSSDPResponse>::iterator it = responses.begin();
    for ( ; it != responses.end(); ++it)
    {
        int delay = mx > 0 ? qrand() % (mx * 1000 + 1) : 0;
        (*it).m_due = now + delay;
        LOG(VB_UPNP, LOG_DEBUG, QString("Discovery response for %1 delayed by %2ms").arg((*it).m_usn).arg(delay));
        m_pending.append(*it);
    }
}

/*! \brief Build the replies to a search for SearchTarget from Host.
 *
 * Each matching record is answered from the first interface on the same subnet as Host.
 * Records with no such interface are not answered.
*/
QList<CastorSSDPResponse> CastorSSDP::BuildResponses(const QString &SearchTarget, const QHostAddress &Host, quint16 Port)
{
    QList<CastorSSDPResponse> result;

    CastorInterfaceList interfaces = m_sockets->GetInterfaces();
    QList<CastorUPNPDescription> descriptions = m_registry.Find(SearchTarget);

    foreach (const CastorUPNPDescription &description, descriptions)
    {
        foreach (const CastorInterface &interface, interfaces)
        {
            if (CastorNetwork::SameSubnet(interface.first, interface.second, Host))
            {
                result.append(CastorSSDPResponse(CastorSSDPMessage::SearchResponse(description, interface.first),
                                                 description.GetUSN(), Host, Port, 0));
                break;
            }
        }
    }

    return result;
}

/*! \brief Send queued replies that are due, or all queued replies if Force is true.
 *
 * Returns the number of milliseconds until the next reply is due or -1 if none are queued.
*/
int CastorSSDP::SendPendingResponses(bool Force)
{
    QList<CastorSSDPResponse> due;
    qint64 next = -1;
    qint64 now  = QDateTime::currentMSecsSinceEpoch();

    {
        QMutexLocker locker(m_pendingLock);
        QList<CastorSSDPResponse>::iterator it = m_pending.begin();
        while (it != m_pending.end())
        {
            if (Force || (*it).m_due <= now)
            {
                due.append(*it);
                it = m_pending.erase(it);
                continue;
            }

            if (next < 0 || (*it).m_due < next)
                next = (*it).m_due;
            ++it;
        }
    }

    foreach (const CastorSSDPResponse &response, due)
    {
        LOG(VB_UPNP, LOG_DEBUG, QString("Sending discovery response for %1 to %2:%3")
            .arg(response.m_usn).arg(response.m_host.toString()).arg(response.m_port));
        (void)m_sockets->SendResponse(response.m_datagram, response.m_host, response.m_port);
    }

    return next < 0 ? -1 : (int)qMax((qint64)0, next - now);
}

int CastorSSDP::PendingResponseCount(void)
{
    QMutexLocker locker(m_pendingLock);
    return m_pending.size();
}

///\brief The receive loop. Waits at most one second, or until the next queued reply is due.
void CastorSSDP::Run(void)
{
    while (m_running.loadAcquire())
    {
        int next    = SendPendingResponses();
        int timeout = (next < 0 || next > SSDP_RECEIVE_TIMEOUT) ? SSDP_RECEIVE_TIMEOUT : next;

        QByteArray   datagram;
        QHostAddress host;
        quint16      port = 0;
        if (m_sockets->Receive(datagram, host, port, timeout) < 0)
            continue;

        if (!m_running.loadAcquire())
            break;

        DatagramReceived(datagram, host, port);
    }
}

///\brief Send byebyes (if enabled) for every USN and clear the registry and reply queue.
void CastorSSDP::Shutdown(void)
{
    {
        QMutexLocker locker(m_pendingLock);
        m_pending.clear();
    }

    QStringList usns = m_registry.GetUSNs();
    foreach (const QString &usn, usns)
        DoByebye(usn);

    foreach (const QString &usn, usns)
        Unregister(usn);
}
