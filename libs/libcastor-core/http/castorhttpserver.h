#ifndef CASTORHTTPSERVER_H
#define CASTORHTTPSERVER_H

// Qt
#include <QTcpServer>

// Castor
#include "castorcoreexport.h"

class QMutex;
class CastorHTTPHandler;

class CASTOR_CORE_PUBLIC CastorHTTPServer : public QTcpServer
{
    Q_OBJECT

  public:
    CastorHTTPServer();
    virtual ~CastorHTTPServer();

    bool               Open               (int Port);
    void               Close              (void);
    int                GetPort            (void);
    void               SetHandler         (CastorHTTPHandler *Handler);
    CastorHTTPHandler* GetHandler         (void);
    void               ReloadHandler      (void);

  protected:
    void               incomingConnection (qintptr SocketDescriptor);

  private:
    CastorHTTPHandler* TakeHandler        (void);

  private:
    QMutex            *m_handlerLock;
    CastorHTTPHandler *m_handler;
};

#endif // CASTORHTTPSERVER_H
