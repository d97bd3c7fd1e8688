/* Class CastorSSDPSocketSet
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
#include <QThread>
#include <QUdpSocket>
#include <QNetworkInterface>

// Castor
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castorssdpsocketset.h"

#define SSDP_MULTICAST_TTL  4

static QNetworkInterface InterfaceForAddress(const QString &Address)
{
    QHostAddress address(Address);
    QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    foreach (const QNetworkInterface &interface, interfaces)
    {
        QList<QNetworkAddressEntry> entries = interface.addressEntries();
        foreach (const QNetworkAddressEntry &entry, entries)
            if (entry.ip() == address)
                return interface;
    }

    return QNetworkInterface();
}

/*! \class CastorSSDPSocketSet
 *  \brief The sockets used for SSDP.
 *
 * A single receive socket is bound to port 1900 on all interfaces and joined to the SSDP
 * multicast group on each local interface. Search responses are sent from the receive socket.
 * Each joined interface also has its own send socket, used for multicast notifications so that
 * they leave via that interface.
 *
 * The sockets are created by Open in the calling thread and should then be moved to the thread
 * that calls Receive, which never runs an event loop, and closed by that thread. Sends are
 * serialised by a mutex and may come from any thread.
 *
 * All methods are virtual so that an alternative (e.g. in memory) implementation can be provided.
*/
CastorSSDPSocketSet::CastorSSDPSocketSet()
  : m_receiveSocket(NULL),
    m_lock(new QMutex(QMutex::Recursive))
{
}

CastorSSDPSocketSet::~CastorSSDPSocketSet()
{
    CastorSSDPSocketSet::Close();
    delete m_lock;
}

/*! \brief Open the receive socket and join the multicast group on each interface.
 *
 * Returns BindError if the receive socket cannot be bound. Interfaces that cannot join the
 * group are logged and skipped.
*/
CastorSSDPSocketSet::Error CastorSSDPSocketSet::Open(const CastorInterfaceList &Interfaces)
{
    Close();

    QMutexLocker locker(m_lock);

    QUdpSocket *socket = new QUdpSocket();
    if (!socket->bind(QHostAddress::AnyIPv4, CASTOR_SSDP_PORT, QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint))
    {
        LOG(VB_GENERAL, LOG_CRIT, QString("Failed to bind SSDP socket to port %1 (%2)")
            .arg(CASTOR_SSDP_PORT).arg(socket->errorString()));
        delete socket;
        return BindError;
    }

    socket->setSocketOption(QAbstractSocket::MulticastLoopbackOption, 0);
    m_receiveSocket = socket;

    foreach (const CastorInterface &interface, Interfaces)
        if (JoinGroup(interface.first) == NoError)
            m_interfaces.append(interface);

    if (m_interfaces.isEmpty())
        LOG(VB_GENERAL, LOG_WARNING, "SSDP has no usable interfaces");

    LOG(VB_UPNP, LOG_INFO, QString("SSDP listening on port %1 (%2)").arg(CASTOR_SSDP_PORT).arg(CastorNetwork::ToString(m_interfaces)));
    return NoError;
}

///\brief Join the SSDP group on Interface and create its send socket.
CastorSSDPSocketSet::Error CastorSSDPSocketSet::JoinGroup(const QString &Interface)
{
    QMutexLocker locker(m_lock);

    if (!m_receiveSocket || m_sendSockets.contains(Interface))
        return MulticastJoinError;

    QNetworkInterface network = InterfaceForAddress(Interface);
    if (!network.isValid())
    {
        LOG(VB_GENERAL, LOG_ERR, QString("No local interface has address %1 - skipping").arg(Interface));
        return MulticastJoinError;
    }

    QHostAddress group(CASTOR_SSDP_GROUP);

    LOG(VB_UPNP, LOG_INFO, QString("Adding membership on %1 (%2)").arg(Interface).arg(network.name()));
    if (!m_receiveSocket->joinMulticastGroup(group, network))
    {
        LOG(VB_GENERAL, LOG_ERR, QString("Failed to join SSDP group on %1 (%2) - skipping")
            .arg(Interface).arg(m_receiveSocket->errorString()));
        return MulticastJoinError;
    }

    QUdpSocket *socket = new QUdpSocket();
    if (!socket->bind(QHostAddress(Interface), 0))
    {
        LOG(VB_GENERAL, LOG_ERR, QString("Failed to bind send socket for %1 (%2)").arg(Interface).arg(socket->errorString()));
        (void)m_receiveSocket->leaveMulticastGroup(group, network);
        delete socket;
        return MulticastJoinError;
    }

    socket->setMulticastInterface(network);
    socket->setSocketOption(QAbstractSocket::MulticastTtlOption, SSDP_MULTICAST_TTL);
    socket->setSocketOption(QAbstractSocket::MulticastLoopbackOption, 0);

    m_sendSockets.insert(Interface, socket);
    return NoError;
}

///\brief Leave the multicast group on every interface and close all sockets.
void CastorSSDPSocketSet::Close(void)
{
    QMutexLocker locker(m_lock);

    QHostAddress group(CASTOR_SSDP_GROUP);

    QMap<QString,QUdpSocket*>::const_iterator it = m_sendSockets.constBegin();
    for ( ; it != m_sendSockets.constEnd(); ++it)
    {
        if (m_receiveSocket)
        {
            LOG(VB_UPNP, LOG_INFO, QString("Dropping membership on %1").arg(it.key()));
            if (!m_receiveSocket->leaveMulticastGroup(group, InterfaceForAddress(it.key())))
                LOG(VB_UPNP, LOG_DEBUG, QString("Failed to drop membership on %1 (%2)").arg(it.key()).arg(m_receiveSocket->errorString()));
        }

        it.value()->close();
        delete it.value();
    }

    m_sendSockets.clear();
    m_interfaces.clear();

    if (m_receiveSocket)
    {
        m_receiveSocket->close();
        delete m_receiveSocket;
        m_receiveSocket = NULL;
    }
}

bool CastorSSDPSocketSet::IsOpen(void)
{
    QMutexLocker locker(m_lock);
    return m_receiveSocket != NULL;
}

/*! \brief Give the sockets to Thread.
 *
 * Must be called from the thread that called Open, before Thread starts receiving.
*/
void CastorSSDPSocketSet::MoveToThread(QThread *Thread)
{
    QMutexLocker locker(m_lock);

    if (m_receiveSocket)
        m_receiveSocket->moveToThread(Thread);

    foreach (QUdpSocket *socket, m_sendSockets)
        socket->moveToThread(Thread);
}

///\brief Return the interfaces that successfully joined the multicast group.
CastorInterfaceList CastorSSDPSocketSet::GetInterfaces(void)
{
    QMutexLocker locker(m_lock);
    return m_interfaces;
}

/*! \brief Wait up to TimeoutMS for a datagram.
 *
 * Returns the size of the datagram received (which may be zero) or -1 on timeout or error.
 * Only the thread that owns the sockets may call Receive.
*/
qint64 CastorSSDPSocketSet::Receive(QByteArray &Datagram, QHostAddress &Host, quint16 &Port, int TimeoutMS)
{
    QUdpSocket *socket = NULL;
    {
        QMutexLocker locker(m_lock);
        socket = m_receiveSocket;
    }

    if (!socket)
        return -1;

    if (!socket->hasPendingDatagrams() && !socket->waitForReadyRead(TimeoutMS))
        return -1;

    QMutexLocker locker(m_lock);

    qint64 size = socket->pendingDatagramSize();
    if (size < 0)
        return -1;

    Datagram.resize((int)size);
    qint64 read = socket->readDatagram(Datagram.data(), size, &Host, &Port);
    if (read < 0)
    {
        LOG(VB_UPNP, LOG_WARNING, QString("Failed to read datagram (%1)").arg(socket->errorString()));
        Datagram.clear();
        return -1;
    }

    Datagram.resize((int)read);
    return read;
}

///\brief Send a unicast reply from the receive socket.
bool CastorSSDPSocketSet::SendResponse(const QByteArray &Datagram, const QHostAddress &Host, quint16 Port)
{
    QMutexLocker locker(m_lock);

    if (!m_receiveSocket)
    {
        LOG(VB_UPNP, LOG_WARNING, QString("Cannot send response to %1:%2 - socket closed").arg(Host.toString()).arg(Port));
        return false;
    }

    if (m_receiveSocket->writeDatagram(Datagram, Host, Port) != Datagram.size())
    {
        LOG(VB_UPNP, LOG_WARNING, QString("Failed to send response to %1:%2 (%3)")
            .arg(Host.toString()).arg(Port).arg(m_receiveSocket->errorString()));
        return false;
    }

    return true;
}

///\brief Send Datagram to the SSDP group via Interface.
bool CastorSSDPSocketSet::SendMulticast(const QByteArray &Datagram, const QString &Interface)
{
    QMutexLocker locker(m_lock);

    QUdpSocket *socket = m_sendSockets.value(Interface, NULL);
    if (!socket)
    {
        LOG(VB_UPNP, LOG_WARNING, QString("No send socket for %1").arg(Interface));
        return false;
    }

    if (socket->writeDatagram(Datagram, QHostAddress(CASTOR_SSDP_GROUP), CASTOR_SSDP_PORT) != Datagram.size())
    {
        LOG(VB_UPNP, LOG_WARNING, QString("Failed to send multicast from %1 (%2)").arg(Interface).arg(socket->errorString()));
        return false;
    }

    return true;
}

///\brief Wake a thread blocked in Receive by sending it an empty datagram.
void CastorSSDPSocketSet::Interrupt(void)
{
    QUdpSocket socket;
    if (socket.writeDatagram(QByteArray(), QHostAddress::LocalHost, CASTOR_SSDP_PORT) < 0)
        LOG(VB_UPNP, LOG_DEBUG, QString("Failed to send wakeup datagram (%1)").arg(socket.errorString()));
}
