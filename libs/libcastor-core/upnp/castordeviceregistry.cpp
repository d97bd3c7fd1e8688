/* Class CastorDeviceRegistry
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
#include "castorlogging.h"
#include "castordeviceregistry.h"

/*! \class CastorDeviceRegistry
 *  \brief The set of local advertisements, keyed by USN.
 *
 * The registry is written by the thread that (re)starts SSDP and read by the SSDP receive
 * thread. All access is serialised.
*/
CastorDeviceRegistry::CastorDeviceRegistry()
  : m_lock(new QMutex())
{
}

CastorDeviceRegistry::~CastorDeviceRegistry()
{
    delete m_lock;
}

///\brief Add Description, replacing any existing record with the same USN.
void CastorDeviceRegistry::Register(const CastorUPNPDescription &Description)
{
    QMutexLocker locker(m_lock);
    m_devices.insert(Description.GetUSN(), Description);
}

bool CastorDeviceRegistry::Unregister(const QString &USN)
{
    QMutexLocker locker(m_lock);
    if (m_devices.remove(USN) > 0)
        return true;

    LOG(VB_UPNP, LOG_DEBUG, QString("Cannot unregister unknown USN '%1'").arg(USN));
    return false;
}

bool CastorDeviceRegistry::Contains(const QString &USN)
{
    QMutexLocker locker(m_lock);
    return m_devices.contains(USN);
}

bool CastorDeviceRegistry::Get(const QString &USN, CastorUPNPDescription &Description)
{
    QMutexLocker locker(m_lock);
    QMap<QString,CastorUPNPDescription>::const_iterator it = m_devices.constFind(USN);
    if (it == m_devices.constEnd())
        return false;
    Description = it.value();
    return true;
}

///\brief Return every record whose type matches SearchTarget, or every record for 'ssdp:all'.
QList<CastorUPNPDescription> CastorDeviceRegistry::Find(const QString &SearchTarget)
{
    QList<CastorUPNPDescription> result;
    bool all = SearchTarget == "ssdp:all";

    QMutexLocker locker(m_lock);
    QMap<QString,CastorUPNPDescription>::const_iterator it = m_devices.constBegin();
    for ( ; it != m_devices.constEnd(); ++it)
        if (all || it.value().GetType() == SearchTarget)
            result.append(it.value());
    return result;
}

QStringList CastorDeviceRegistry::GetUSNs(void)
{
    QMutexLocker locker(m_lock);
    return m_devices.keys();
}

int CastorDeviceRegistry::Count(void)
{
    QMutexLocker locker(m_lock);
    return m_devices.size();
}

void CastorDeviceRegistry::Clear(void)
{
    QMutexLocker locker(m_lock);
    m_devices.clear();
}
