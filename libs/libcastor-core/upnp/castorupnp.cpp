/* Class CastorUPNP
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

// Castor
#include "castorupnp.h"

/*! \class CastorUPNPDescription
 *  \brief A single SSDP advertisement.
 *
 * The location is a URL template where '{}' is replaced by the address of the interface
 * the advertisement is sent from.
*/
CastorUPNPDescription::CastorUPNPDescription()
{
}

CastorUPNPDescription::CastorUPNPDescription(const QString &USN, const QString &Type, const QString &Location,
                                             const QString &Server, const QString &CacheControl)
  : m_usn(USN),
    m_type(Type),
    m_location(Location),
    m_server(Server),
    m_cacheControl(CacheControl)
{
}

QString CastorUPNPDescription::GetUSN(void) const
{
    return m_usn;
}

QString CastorUPNPDescription::GetType(void) const
{
    return m_type;
}

QString CastorUPNPDescription::GetLocation(void) const
{
    return m_location;
}

///\brief Return the location with the host placeholder replaced by Host.
QString CastorUPNPDescription::GetLocation(const QString &Host) const
{
    QString location(m_location);
    return location.replace("{}", Host);
}

QString CastorUPNPDescription::GetServer(void) const
{
    return m_server;
}

QString CastorUPNPDescription::GetCacheControl(void) const
{
    return m_cacheControl;
}

bool CastorUPNPDescription::IsValid(void) const
{
    return !m_usn.isEmpty() && !m_type.isEmpty();
}

bool CastorUPNPDescription::operator == (const CastorUPNPDescription &Other) const
{
    return m_usn == Other.m_usn && m_type == Other.m_type && m_location == Other.m_location &&
           m_server == Other.m_server && m_cacheControl == Other.m_cacheControl;
}

QString CastorUPNP::UUIDFromUSN(const QString &USN)
{
    QString result;
    QString usn = USN.trimmed();

    if (usn.startsWith("uuid:"))
    {
        usn = usn.mid(5);
        int index = usn.indexOf("::");
        result = index > -1 ? usn.left(index) : usn;
    }

    return result;
}

/*! \brief Return the search target advertised for USN.
 *
 * This is the part following '::' or the complete USN for the bare 'uuid:' record.
*/
QString CastorUPNP::TypeFromUSN(const QString &USN)
{
    int index = USN.indexOf("::");
    if (index > -1)
        return USN.mid(index + 2);
    return USN;
}

///\brief Return the six USNs advertised by a media renderer with the given uuid.
QStringList CastorUPNP::DeviceUSNs(const QString &UUID)
{
    QString root = "uuid:" + UUID;

    QStringList result;
    result << root + "::upnp:rootdevice"
           << root
           << root + "::" + CASTOR_ROOT_UPNP_DEVICE
           << root + "::urn:schemas-upnp-org:service:RenderingControl:1"
           << root + "::urn:schemas-upnp-org:service:ConnectionManager:1"
           << root + "::urn:schemas-upnp-org:service:AVTransport:1";
    return result;
}
