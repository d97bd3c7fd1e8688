#ifndef CASTORPLUGINCOORDINATOR_H
#define CASTORPLUGINCOORDINATOR_H

// Qt
#include <QObject>
#include <QStringList>

// Castor
#include "castormediaexport.h"
#include "castoreventbus.h"
#include "castorrenderer.h"
#include "castorprotocol.h"

class QMutex;

class CASTOR_MEDIA_PUBLIC CastorPluginCoordinator : public QObject, public CastorEventHandler
{
    Q_OBJECT

  public:
    CastorPluginCoordinator(const QString &Name, CastorEventBus *Bus);
    virtual ~CastorPluginCoordinator();

    bool            IsRunning          (void);
    QStringList     GetTopics          (void);

  signals:
    void            Failed             (const QString &Reason);

  protected:
    void            SubscribeTopics    (const QStringList &Topics);
    void            UnsubscribeTopics  (void);

  protected:
    QString         m_name;
    CastorEventBus *m_bus;
    QMutex         *m_lock;
    bool            m_running;
    QStringList     m_topics;
};

class CASTOR_MEDIA_PUBLIC CastorRendererPlugin : public CastorPluginCoordinator
{
    Q_OBJECT

  public:
    CastorRendererPlugin(CastorEventBus *Bus, CastorRenderer *Renderer);
    virtual ~CastorRendererPlugin();

    bool            Start              (void);
    void            Stop               (void);
    bool            Reload             (void);
    bool            SetRenderer        (CastorRenderer *Renderer);
    CastorRenderer* GetRenderer        (void);
    CastorRenderer::Capabilities GetCapabilities (void);
    QVariant        HandleEvent        (const QString &Topic, const QVariantList &Arguments);

  private:
    CastorRenderer *m_renderer;
    CastorRenderer::Capabilities m_capabilities;
};

class CASTOR_MEDIA_PUBLIC CastorProtocolPlugin : public CastorPluginCoordinator
{
    Q_OBJECT

  public:
    CastorProtocolPlugin(CastorEventBus *Bus, CastorProtocol *Protocol);
    virtual ~CastorProtocolPlugin();

    bool            Start              (void);
    void            Stop               (void);
    bool            Reload             (void);
    bool            SetProtocol        (CastorProtocol *Protocol);
    CastorProtocol* GetProtocol        (void);
    CastorProtocol::Capabilities GetCapabilities (void);
    QVariant        HandleEvent        (const QString &Topic, const QVariantList &Arguments);

  signals:
    void            ProtocolChanged    (CastorProtocol *Protocol);

  private:
    CastorProtocol *m_protocol;
    CastorProtocol::Capabilities m_capabilities;
};

#endif // CASTORPLUGINCOORDINATOR_H
