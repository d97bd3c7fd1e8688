#ifndef CASTORSERVICE_H
#define CASTORSERVICE_H

// Qt
#include <QObject>

// Castor
#include "castormediaexport.h"
#include "upnp/castorssdpsocketset.h"

class CastorSettings;
class CastorEventBus;
class CastorRenderer;
class CastorProtocol;
class CastorHTTPServer;
class CastorSSDPService;
class CastorSSDPSchedulerThread;
class CastorRendererPlugin;
class CastorProtocolPlugin;

class CASTOR_MEDIA_PUBLIC CastorService : public QObject
{
    Q_OBJECT

  public:
    CastorService(CastorSettings *Settings, CastorEventBus *Bus,
                  CastorRenderer *Renderer, CastorProtocol *Protocol,
                  CastorSSDPSocketSet *Sockets = NULL);
    virtual ~CastorService();

    int                   Start              (void);
    void                  Stop               (void);
    bool                  IsRunning          (void);
    bool                  CheckPort          (void);
    int                   GetPort            (void);
    QString               GetFriendlyName    (void);
    QString               GetServerInfo      (void);
    CastorSSDPService*    GetSSDPService     (void);
    CastorRendererPlugin* GetRendererPlugin  (void);
    CastorProtocolPlugin* GetProtocolPlugin  (void);
    CastorHTTPServer*     GetHTTPServer      (void);

  signals:
    void                  Fatal              (int ExitCode);

  protected slots:
    void                  SSDPFailed         (const QString &Reason);
    void                  PluginFailed       (const QString &Reason);
    void                  ProtocolChanged    (CastorProtocol *Protocol);

  private:
    void                  Exit               (int ExitCode, const QString &Reason);

  private:
    CastorSettings            *m_settings;
    CastorEventBus            *m_bus;
    CastorSSDPService         *m_ssdp;
    CastorSSDPSchedulerThread *m_scheduler;
    CastorRendererPlugin      *m_rendererPlugin;
    CastorProtocolPlugin      *m_protocolPlugin;
    CastorHTTPServer          *m_http;
    bool                       m_running;
};

#endif // CASTORSERVICE_H
