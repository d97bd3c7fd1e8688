/* Class CastorNetwork
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
#include <QtAlgorithms>
#include <QNetworkInterface>

// Castor
#include "castorlogging.h"
#include "castornetwork.h"

/*! \class CastorNetwork
 *  \brief Enumerates the local IPv4 interfaces used for SSDP.
 *
 * Only interfaces that are up, running and multicast capable are considered. Loopback
 * interfaces are always ignored.
*/

/*! \brief Return the current set of (address, netmask) pairs.
 *
 * Interfaces whose name is listed in Blocked are skipped. Each entry of Additional must be in
 * the form 'address/netmask' and is merged into the result. The list is sorted and contains no
 * duplicates, so that two snapshots can be compared directly.
*/
CastorInterfaceList CastorNetwork::GetInterfaces(const QStringList &Blocked, const QStringList &Additional)
{
    CastorInterfaceList result;

    QList<QNetworkInterface> interfaces = QNetworkInterface::allInterfaces();
    foreach (const QNetworkInterface &interface, interfaces)
    {
        QNetworkInterface::InterfaceFlags flags = interface.flags();

        if (!(flags & QNetworkInterface::IsUp) || !(flags & QNetworkInterface::IsRunning) ||
            !(flags & QNetworkInterface::CanMulticast) || (flags & QNetworkInterface::IsLoopBack))
        {
            continue;
        }

        if (Blocked.contains(interface.name()))
        {
            LOG(VB_NETWORK, LOG_DEBUG, QString("Ignoring blocked interface '%1'").arg(interface.name()));
            continue;
        }

        QList<QNetworkAddressEntry> entries = interface.addressEntries();
        foreach (const QNetworkAddressEntry &entry, entries)
        {
            if (entry.ip().protocol() != QAbstractSocket::IPv4Protocol || entry.netmask().isNull())
                continue;

            CastorInterface address(entry.ip().toString(), entry.netmask().toString());
            if (!result.contains(address))
                result.append(address);
        }
    }

    foreach (const QString &additional, Additional)
    {
        CastorInterface address;
        if (!ParseInterface(additional, address))
        {
            LOG(VB_GENERAL, LOG_WARNING, QString("Invalid additional interface '%1' - expected address/netmask").arg(additional));
            continue;
        }

        if (!result.contains(address))
            result.append(address);
    }

    qSort(result);
    return result;
}

///\brief Parse an 'address/netmask' pair.
bool CastorNetwork::ParseInterface(const QString &Interface, CastorInterface &Result)
{
    QStringList parts = Interface.trimmed().split('/');
    if (parts.size() != 2)
        return false;

    QHostAddress address(parts[0].trimmed());
    QHostAddress netmask(parts[1].trimmed());

    if (address.protocol() != QAbstractSocket::IPv4Protocol || netmask.protocol() != QAbstractSocket::IPv4Protocol)
        return false;

    Result = CastorInterface(address.toString(), netmask.toString());
    return true;
}

/*! \brief Return true if Remote is on the same subnet as the local interface.
 *
 * Both addresses are masked with the local netmask before comparison.
*/
bool CastorNetwork::SameSubnet(const QString &Local, const QString &Netmask, const QHostAddress &Remote)
{
    QHostAddress local(Local);
    QHostAddress netmask(Netmask);

    bool ok = false;
    quint32 remote = Remote.toIPv4Address(&ok);

    if (!ok || local.protocol() != QAbstractSocket::IPv4Protocol || netmask.protocol() != QAbstractSocket::IPv4Protocol)
        return false;

    quint32 mask = netmask.toIPv4Address();
    return (local.toIPv4Address() & mask) == (remote & mask);
}

QString CastorNetwork::ToString(const CastorInterfaceList &Interfaces)
{
    QStringList result;
    foreach (const CastorInterface &interface, Interfaces)
        result << QString("%1/%2").arg(interface.first).arg(interface.second);
    return result.join(", ");
}
