#ifndef CASTORSSDPSOCKETSET_H
#define CASTORSSDPSOCKETSET_H

// Qt
#include <QMap>
#include <QByteArray>
#include <QHostAddress>

// Castor
#include "castorcoreexport.h"
#include "castornetwork.h"

class QMutex;
class QThread;
class QUdpSocket;

class CASTOR_CORE_PUBLIC CastorSSDPSocketSet
{
  public:
    enum Error
    {
        NoError = 0,
        BindError,
        MulticastJoinError
    };

  public:
    CastorSSDPSocketSet();
    virtual ~CastorSSDPSocketSet();

    virtual Error               Open          (const CastorInterfaceList &Interfaces);
    virtual void                Close         (void);
    virtual bool                IsOpen        (void);
    virtual void                MoveToThread  (QThread *Thread);
    virtual CastorInterfaceList GetInterfaces (void);
    virtual qint64              Receive       (QByteArray &Datagram, QHostAddress &Host, quint16 &Port, int TimeoutMS);
    virtual bool                SendResponse  (const QByteArray &Datagram, const QHostAddress &Host, quint16 Port);
    virtual bool                SendMulticast (const QByteArray &Datagram, const QString &Interface);
    virtual void                Interrupt     (void);

  protected:
    Error                       JoinGroup     (const QString &Interface);

  private:
    QUdpSocket                 *m_receiveSocket;
    QMap<QString,QUdpSocket*>   m_sendSockets;
    CastorInterfaceList         m_interfaces;
    QMutex                     *m_lock;
};

#endif // CASTORSSDPSOCKETSET_H
