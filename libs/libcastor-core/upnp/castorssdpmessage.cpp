/* Class CastorSSDPMessage
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
#include <QTextCodec>
#include <QStringList>

// Castor
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castorcoreutils.h"
#include "castorssdpmessage.h"

/*! \class CastorSSDPMessage
 *  \brief Parsing and construction of SSDP datagrams.
*/

/*! \brief Split an SSDP datagram into its request line and headers.
 *
 * Only the header block (the text before the first empty line) is considered. Header names
 * are converted to lower case and values are trimmed. Returns false, and the datagram should be
 * dropped, if it is not valid UTF-8, is empty, has an incomplete request line or contains a header
 * line without a colon.
*/
bool CastorSSDPMessage::Parse(const QByteArray &Datagram, QString &Method, QString &Target, QMap<QString,QString> &Headers)
{
    Method = QString();
    Target = QString();
    Headers.clear();

    QTextCodec *codec = QTextCodec::codecForName("UTF-8");
    if (!codec)
        return false;

    QTextCodec::ConverterState state;
    QString data = codec->toUnicode(Datagram.constData(), Datagram.size(), &state);
    if (state.invalidChars > 0)
    {
        LOG(VB_UPNP, LOG_DEBUG, "Dropping undecodable datagram");
        return false;
    }

    QString header = data.section("\r\n\r\n", 0, 0);
    if (header.isEmpty())
        return false;

    QStringList lines = header.split("\r\n");
    QStringList request = lines.takeFirst().split(' ', QString::SkipEmptyParts);
    if (request.size() < 2)
    {
        LOG(VB_UPNP, LOG_DEBUG, QString("Malformed request line '%1'").arg(request.join(" ")));
        return false;
    }

    foreach (const QString &line, lines)
    {
        if (line.isEmpty())
            continue;

        int index = line.indexOf(':');
        if (index < 0)
        {
            LOG(VB_UPNP, LOG_DEBUG, QString("Malformed header line '%1'").arg(line));
            Headers.clear();
            return false;
        }

        Headers.insert(line.left(index).trimmed().toLower(), line.mid(index + 1).trimmed());
    }

    Method = request[0];
    Target = request[1];
    return true;
}

///\brief Build the unicast reply to a discovery request, as sent from the interface with address Host.
QByteArray CastorSSDPMessage::SearchResponse(const CastorUPNPDescription &Description, const QString &Host)
{
    QStringList response;
    response << "HTTP/1.1 200 OK"
             << "CACHE-CONTROL: " + Description.GetCacheControl()
             << "LOCATION: " + Description.GetLocation(Host)
             << "SERVER: " + Description.GetServer()
             << "ST: " + Description.GetType()
             << "USN: " + Description.GetUSN()
             << "EXT: "
             << "DATE: " + CastorCoreUtils::DateTimeToRFC1123(QDateTime::currentDateTimeUtc())
             << "" << "";
    return response.join("\r\n").toUtf8();
}

///\brief Build an ssdp:alive or ssdp:byebye notification. The record type is sent as NT.
QByteArray CastorSSDPMessage::Notify(const CastorUPNPDescription &Description, const QString &Host, bool Alive)
{
    QStringList notify;
    notify << "NOTIFY * HTTP/1.1"
           << QString("HOST: %1:%2").arg(CASTOR_SSDP_GROUP).arg(CASTOR_SSDP_PORT)
           << QString("NTS: %1").arg(Alive ? "ssdp:alive" : "ssdp:byebye")
           << "CACHE-CONTROL: " + Description.GetCacheControl()
           << "LOCATION: " + Description.GetLocation(Host)
           << "SERVER: " + Description.GetServer()
           << "NT: " + Description.GetType()
           << "USN: " + Description.GetUSN()
           << "" << "";
    return notify.join("\r\n").toUtf8();
}
