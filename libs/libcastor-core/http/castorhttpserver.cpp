/* Class CastorHTTPServer
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
#include <QTcpSocket>

// Castor
#include "castorlogging.h"
#include "http/castorhttphandler.h"
#include "http/castorhttpserver.h"

/*! \class CastorHTTPServer
 *  \brief Listens for HTTP connections on behalf of the active protocol.
 *
 * Open tries the requested port first. If that fails and the port was not 0, it falls back
 * once to a port chosen by the operating system. Callers should check GetPort to find out
 * which port was actually bound.
 *
 * Connections are handed to the current CastorHTTPHandler. With no handler they are closed.
 * The server holds a reference to the installed handler and takes another for each connection.
 * The handler is called without the server lock held, so it may replace itself.
*/
CastorHTTPServer::CastorHTTPServer()
  : QTcpServer(),
    m_handlerLock(new QMutex()),
    m_handler(NULL)
{
}

CastorHTTPServer::~CastorHTTPServer()
{
    Close();
    SetHandler(NULL);
    delete m_handlerLock;
}

bool CastorHTTPServer::Open(int Port)
{
    if (isListening())
        return true;

    if (!listen(QHostAddress::AnyIPv4, Port))
    {
        if (Port > 0)
        {
            LOG(VB_GENERAL, LOG_WARNING, QString("Failed to listen on port %1 (%2) - trying any port")
                .arg(Port).arg(errorString()));
            (void)listen(QHostAddress::AnyIPv4, 0);
        }
    }

    if (!isListening())
    {
        LOG(VB_GENERAL, LOG_ERR, QString("Failed to open web server port (%1)").arg(errorString()));
        return false;
    }

    LOG(VB_GENERAL, LOG_INFO, QString("Web server listening on port %1").arg(serverPort()));
    return true;
}

void CastorHTTPServer::Close(void)
{
    if (!isListening())
        return;

    close();
    LOG(VB_GENERAL, LOG_INFO, "Web server closed");
}

int CastorHTTPServer::GetPort(void)
{
    return isListening() ? serverPort() : 0;
}

///\brief Install Handler, or remove the current handler if Handler is NULL.
void CastorHTTPServer::SetHandler(CastorHTTPHandler *Handler)
{
    if (Handler)
        Handler->UpRef();

    CastorHTTPHandler *old = NULL;
    {
        QMutexLocker locker(m_handlerLock);
        old = m_handler;
        m_handler = Handler;
    }

    if (old)
        old->DownRef();
}

///\brief Return the current handler. The pointer is only valid until the handler is replaced.
CastorHTTPHandler* CastorHTTPServer::GetHandler(void)
{
    QMutexLocker locker(m_handlerLock);
    return m_handler;
}

///\brief Reload the current handler, if any.
void CastorHTTPServer::ReloadHandler(void)
{
    CastorHTTPHandler *handler = TakeHandler();
    if (!handler)
        return;

    handler->Reload();
    handler->DownRef();
}

///\brief Return the current handler with an extra reference, or NULL.
CastorHTTPHandler* CastorHTTPServer::TakeHandler(void)
{
    QMutexLocker locker(m_handlerLock);
    if (m_handler)
        m_handler->UpRef();
    return m_handler;
}

void CastorHTTPServer::incomingConnection(qintptr SocketDescriptor)
{
    QTcpSocket *socket = new QTcpSocket();
    if (!socket->setSocketDescriptor(SocketDescriptor))
    {
        LOG(VB_NETWORK, LOG_ERR, QString("Failed to accept connection (%1)").arg(socket->errorString()));
        delete socket;
        return;
    }

    CastorHTTPHandler *handler = TakeHandler();
    if (handler)
    {
        handler->ProcessConnection(socket);
        handler->DownRef();
        return;
    }

    LOG(VB_NETWORK, LOG_WARNING, "No HTTP handler - closing connection");
    socket->close();
    socket->deleteLater();
}
