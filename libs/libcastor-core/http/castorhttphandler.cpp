/* Class CastorHTTPHandler
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
#include "castorlogging.h"
#include "http/castorhttphandler.h"

/*! \class CastorHTTPHandler
 *  \brief Base class for the object that answers HTTP connections.
 *
 * The active protocol supplies the handler. CastorHTTPServer passes each new connection to it
 * and the handler takes ownership of the socket.
 *
 * Reload is called when the device identity or port has changed.
 *
 * Handlers are reference counted. The creator holds the first reference and releases it with
 * DownRef. CastorHTTPServer holds its own reference while the handler is installed and while a
 * connection is being processed, so a handler may outlive the protocol that created it.
*/
CastorHTTPHandler::CastorHTTPHandler(const QString &Name)
  : CastorReferenceCounter(),
    m_name(Name)
{
}

CastorHTTPHandler::~CastorHTTPHandler()
{
}

QString CastorHTTPHandler::Name(void)
{
    return m_name;
}

void CastorHTTPHandler::Reload(void)
{
    LOG(VB_NETWORK, LOG_INFO, QString("Reloading HTTP handler '%1'").arg(m_name));
}
