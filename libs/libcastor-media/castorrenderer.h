#ifndef CASTORRENDERER_H
#define CASTORRENDERER_H

// Qt
#include <QFlags>
#include <QMetaType>
#include <QVariant>
#include <QStringList>

// Castor
#include "castormediaexport.h"

class CastorEventBus;

class CASTOR_MEDIA_PUBLIC CastorRenderer
{
  public:
    enum Capability
    {
        NoCapabilities   = (0 << 0),
        SetMediaStop     = (1 << 0),
        SetMediaPause    = (1 << 1),
        SetMediaResume   = (1 << 2),
        SetMediaVolume   = (1 << 3),
        SetMediaMute     = (1 << 4),
        SetMediaURL      = (1 << 5),
        SetMediaTitle    = (1 << 6),
        SetMediaPosition = (1 << 7),
        SetMediaSubFile  = (1 << 8),
        SetMediaSubShow  = (1 << 9),
        SetMediaText     = (1 << 10),
        SetMediaSpeed    = (1 << 11)
    };

    Q_DECLARE_FLAGS(Capabilities, Capability)

    static QString      CapabilityToTopic (Capability Cap);
    static Capability   TopicToCapability (const QString &Topic);
    static QStringList  CapabilityTopics  (Capabilities Caps);

  public:
    CastorRenderer(const QString &Name, CastorEventBus *Bus);
    virtual ~CastorRenderer();

    QString             GetName           (void);
    bool                IsRunning         (void);
    virtual bool        Start             (void);
    virtual void        Stop              (void);
    virtual bool        Reload            (void);
    virtual Capabilities GetCapabilities  (void) = 0;
    QVariant            Invoke            (Capability Cap, const QVariantList &Arguments);

  protected:
    virtual void        MediaStop         (void);
    virtual void        MediaPause        (void);
    virtual void        MediaResume       (void);
    virtual void        MediaVolume       (int Volume);
    virtual void        MediaMute         (bool Mute);
    virtual void        MediaURL          (const QString &URL, const QString &Title);
    virtual void        MediaTitle        (const QString &Title);
    virtual void        MediaPosition     (const QString &Position);
    virtual void        MediaSubFile      (const QString &File);
    virtual void        MediaSubShow      (bool Show);
    virtual void        MediaText         (const QString &Text, int Duration);
    virtual void        MediaSpeed        (double Speed);

    void                PublishState      (int Cap, const QVariantList &Arguments = QVariantList());
    void                StatePosition     (const QString &Position);
    void                StateDuration     (const QString &Duration);
    void                StatePause        (void);
    void                StatePlay         (void);
    void                StateStop         (void);
    void                StateEOF          (void);
    void                StateTransport    (const QString &State);
    void                StateTransportError (void);
    void                StateMute         (bool Mute);
    void                StateVolume       (int Volume);
    void                StateSpeed        (const QString &Speed);
    void                StateSubtitle     (bool Show);
    void                StateURL          (const QString &URL);

  protected:
    QString             m_name;
    CastorEventBus     *m_bus;
    bool                m_running;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(CastorRenderer::Capabilities)
Q_DECLARE_METATYPE(CastorRenderer*)

class CASTOR_MEDIA_PUBLIC CastorRendererFactory
{
  public:
    CastorRendererFactory();
    virtual ~CastorRendererFactory();

    static CastorRendererFactory* GetCastorRendererFactory (void);
    static CastorRendererFactory* GetFactory               (const QString &Name);
    CastorRendererFactory*        NextFactory              (void) const;
    virtual QString               Name                     (void) = 0;
    virtual CastorRenderer*       Create                   (CastorEventBus *Bus) = 0;

  protected:
    static CastorRendererFactory* gCastorRendererFactory;
    CastorRendererFactory*        nextCastorRendererFactory;
};

#endif // CASTORRENDERER_H
