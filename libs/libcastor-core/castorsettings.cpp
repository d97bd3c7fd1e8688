/* Class CastorSettings
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
#include <QHostInfo>
#include <QSysInfo>
#include <QMutex>
#include <QUuid>

// Std
#if !defined(Q_OS_WIN)
#include <sys/utsname.h>
#endif

// Castor
#include "castorversion.h"
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castorsettings.h"

/*! \class CastorSettings
 *  \brief In memory setting store and device identity.
 *
 * Settings are stored as strings and guarded by a recursive QReadWriteLock. Reading a setting
 * that does not exist stores the default value. Nothing is persisted to disk.
 *
 * CastorSettings also owns the last network interface snapshot used by IsIPChanged and
 * derives the device identity (USN, friendly name and server signature).
*/
CastorSettings::CastorSettings()
  : m_settingsLock(new QReadWriteLock(QReadWriteLock::Recursive)),
    m_ipLock(new QMutex())
{
}

CastorSettings::~CastorSettings()
{
    delete m_settingsLock;
    delete m_ipLock;
}

QString CastorSettings::GetSetting(const QString &Name, const QString &DefaultValue)
{
    {
        QReadLocker locker(m_settingsLock);
        if (m_settings.contains(Name))
            return m_settings.value(Name);
    }

    SetSetting(Name, DefaultValue);
    return DefaultValue;
}

bool CastorSettings::GetSetting(const QString &Name, const bool &DefaultValue)
{
    QString value = GetSetting(Name, DefaultValue ? QString("1") : QString("0"));
    return value.trimmed() == "1";
}

int CastorSettings::GetSetting(const QString &Name, const int &DefaultValue)
{
    QString value = GetSetting(Name, QString::number(DefaultValue));
    return value.toInt();
}

void CastorSettings::SetSetting(const QString &Name, const QString &Value)
{
    QWriteLocker locker(m_settingsLock);
    m_settings[Name] = Value;
}

void CastorSettings::SetSetting(const QString &Name, const bool &Value)
{
    SetSetting(Name, Value ? QString("1") : QString("0"));
}

void CastorSettings::SetSetting(const QString &Name, const int &Value)
{
    SetSetting(Name, QString::number(Value));
}

///\brief Enumerate the current interfaces, honouring the blocked and additional interface settings.
CastorInterfaceList CastorSettings::ReadInterfaces(void)
{
    QStringList blocked    = GetSetting(CASTOR_SETTING_BLOCKED, QString("")).split(",", QString::SkipEmptyParts);
    QStringList additional = GetSetting(CASTOR_SETTING_ADDITIONAL, QString("")).split(",", QString::SkipEmptyParts);
    return CastorNetwork::GetInterfaces(blocked, additional);
}

/*! \brief Return the current interface snapshot.
 *
 * The snapshot is remembered for the next call to IsIPChanged.
*/
CastorInterfaceList CastorSettings::GetIP(void)
{
    CastorInterfaceList interfaces = ReadInterfaces();

    QMutexLocker locker(m_ipLock);
    m_lastIP = interfaces;
    LOG(VB_NETWORK, LOG_DEBUG, "Interfaces: " + CastorNetwork::ToString(interfaces));
    return interfaces;
}

///\brief Return true if the interface snapshot differs from the last one taken.
bool CastorSettings::IsIPChanged(void)
{
    CastorInterfaceList last;
    {
        QMutexLocker locker(m_ipLock);
        last = m_lastIP;
    }

    bool changed = last != GetIP();
    if (changed)
        LOG(VB_NETWORK, LOG_INFO, "Network interfaces changed");
    return changed;
}

int CastorSettings::GetPort(void)
{
    return GetSetting(CASTOR_SETTING_PORT, (int)0);
}

/*! \brief Return the device uuid.
 *
 * A new uuid is created and stored if none exists or if Refresh is true.
*/
QString CastorSettings::GetUSN(bool Refresh /*=false*/)
{
    QWriteLocker locker(m_settingsLock);

    if (!Refresh)
    {
        QString usn = m_settings.value(CASTOR_SETTING_USN);
        if (!usn.isEmpty())
            return usn;
    }

    QString usn = CreateUUID();
    m_settings[CASTOR_SETTING_USN] = usn;
    LOG(VB_UPNP, LOG_INFO, QString("Device uuid: %1").arg(usn));
    return usn;
}

///\brief Return the SSDP SERVER signature.
QString CastorSettings::GetServerInfo(void)
{
    return QString("%1/%2 UPnP/1.0 Castor/%3").arg(GetSystem()).arg(GetSystemVersion()).arg(CASTOR_SOURCE_VERSION);
}

QString CastorSettings::GetFriendlyName(void)
{
    {
        QReadLocker locker(m_settingsLock);
        if (!m_temporaryFriendlyName.isEmpty())
            return m_temporaryFriendlyName;
    }

    return GetSetting(CASTOR_SETTING_NAME, QString("Castor (%1)").arg(QHostInfo::localHostName()));
}

///\brief Override the friendly name until the next restart.
void CastorSettings::SetTemporaryFriendlyName(const QString &Name)
{
    QWriteLocker locker(m_settingsLock);
    m_temporaryFriendlyName = Name;
}

QString CastorSettings::GetSystem(void)
{
#if defined(Q_OS_WIN)
    return QString("Windows");
#else
    struct utsname name;
    if (uname(&name) == 0)
        return QString(name.sysname);
    LOG(VB_GENERAL, LOG_WARNING, "Failed to retrieve system name" + ENO);
    return QString("Unknown");
#endif
}

QString CastorSettings::GetSystemVersion(void)
{
#if defined(Q_OS_WIN)
    return QSysInfo::kernelVersion();
#else
    struct utsname name;
    if (uname(&name) == 0)
        return QString(name.release);
    LOG(VB_GENERAL, LOG_WARNING, "Failed to retrieve system release" + ENO);
    return QString("Unknown");
#endif
}

///\brief Create a new uuid without the enclosing braces.
QString CastorSettings::CreateUUID(void)
{
    QString uuid = QUuid::createUuid().toString();
    if (uuid.startsWith('{'))
        uuid = uuid.mid(1);
    if (uuid.endsWith('}'))
        uuid.chop(1);
    return uuid;
}
