#ifndef CASTORSSDP_H
#define CASTORSSDP_H

// Qt
#include <QMap>
#include <QList>
#include <QAtomicInt>
#include <QHostAddress>

// Castor
#include "castorcoreexport.h"
#include "castorlocaldefs.h"
#include "upnp/castorupnp.h"
#include "upnp/castordeviceregistry.h"
#include "upnp/castorssdpsocketset.h"

class QMutex;
class CastorSSDPListener;

class CASTOR_CORE_PUBLIC CastorSSDPResponse
{
  public:
    CastorSSDPResponse();
    CastorSSDPResponse(const QByteArray &Datagram, const QString &USN, const QHostAddress &Host, quint16 Port, qint64 Due);

    QByteArray   m_datagram;
    QString      m_usn;
    QHostAddress m_host;
    quint16      m_port;
    qint64       m_due;
};

class CASTOR_CORE_PUBLIC CastorSSDP
{
    friend class CastorSSDPListener;

  public:
    explicit CastorSSDP(CastorSSDPSocketSet *Sockets = NULL);
    ~CastorSSDP();

    CastorSSDPSocketSet::Error Start          (const CastorInterfaceList &Interfaces);
    void                 Stop                 (bool Byebye = true);
    bool                 IsRunning            (void);

    void                 Register             (const QString &USN, const QString &Type, const QString &Location,
                                               const QString &Server, const QString &CacheControl = CASTOR_SSDP_CACHE_CONTROL);
    void                 Unregister           (const QString &USN);
    bool                 IsRegistered         (const QString &USN);
    QStringList          GetUSNs              (void);
    CastorDeviceRegistry* GetRegistry         (void);

    void                 DoNotify             (const QString &USN);
    void                 DoByebye             (const QString &USN);

    void                 DatagramReceived     (const QByteArray &Datagram, const QHostAddress &Host, quint16 Port);
    void                 DiscoveryRequest     (const QMap<QString,QString> &Headers, const QHostAddress &Host, quint16 Port);
    QList<CastorSSDPResponse> BuildResponses  (const QString &SearchTarget, const QHostAddress &Host, quint16 Port);
    int                  SendPendingResponses (bool Force = false);
    int                  PendingResponseCount (void);

  protected:
    void                 Run                  (void);
    void                 Shutdown             (void);

  private:
    CastorDeviceRegistry       m_registry;
    CastorSSDPSocketSet       *m_sockets;
    CastorSSDPListener        *m_listener;
    QAtomicInt                 m_running;
    QAtomicInt                 m_sendingByebye;
    QMutex                    *m_pendingLock;
    QList<CastorSSDPResponse>  m_pending;
};

#endif // CASTORSSDP_H
