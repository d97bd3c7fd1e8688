#ifndef CASTORPROTOCOL_H
#define CASTORPROTOCOL_H

// Qt
#include <QMap>
#include <QFlags>
#include <QMetaType>
#include <QVariant>
#include <QStringList>

// Castor
#include "castormediaexport.h"

class QMutex;
class CastorEventBus;
class CastorHTTPHandler;

#define CASTOR_STATE_TRANSPORT        QString("TransportState")
#define CASTOR_STATE_TRANSPORT_STATUS QString("TransportStatus")
#define CASTOR_STATE_POSITION         QString("RelativeTimePosition")
#define CASTOR_STATE_DURATION         QString("CurrentMediaDuration")
#define CASTOR_STATE_MUTE             QString("Mute")
#define CASTOR_STATE_VOLUME           QString("Volume")
#define CASTOR_STATE_SPEED            QString("TransportPlaySpeed")
#define CASTOR_STATE_SUBTITLE         QString("DisplaySubtitle")
#define CASTOR_STATE_URL              QString("AVTransportURI")

class CASTOR_MEDIA_PUBLIC CastorProtocol
{
  public:
    enum Capability
    {
        NoCapabilities          = (0 << 0),
        SetStatePosition        = (1 << 0),
        SetStateDuration        = (1 << 1),
        SetStatePause           = (1 << 2),
        SetStatePlay            = (1 << 3),
        SetStateStop            = (1 << 4),
        SetStateEOF             = (1 << 5),
        SetStateTransport       = (1 << 6),
        SetStateTransportError  = (1 << 7),
        SetStateMute            = (1 << 8),
        SetStateVolume          = (1 << 9),
        SetStateSpeed           = (1 << 10),
        SetStateDisplaySubtitle = (1 << 11),
        SetStateURL             = (1 << 12)
    };

    Q_DECLARE_FLAGS(Capabilities, Capability)

    static QString      CapabilityToTopic (Capability Cap);
    static Capability   TopicToCapability (const QString &Topic);
    static QStringList  CapabilityTopics  (Capabilities Caps);

  public:
    CastorProtocol(const QString &Name, CastorEventBus *Bus);
    virtual ~CastorProtocol();

    QString             GetName           (void);
    bool                IsRunning         (void);
    virtual bool        Start             (void);
    virtual void        Stop              (void);
    virtual bool        Reload            (void);
    virtual Capabilities GetCapabilities  (void) = 0;
    virtual CastorHTTPHandler* GetHandler (void) = 0;
    QVariant            Invoke            (Capability Cap, const QVariantList &Arguments);

    void                SetState          (const QString &Name, const QVariant &Value);
    QVariant            GetState          (const QString &Name);

    virtual void        StatePosition     (const QString &Position);
    virtual void        StateDuration     (const QString &Duration);
    virtual void        StatePause        (void);
    virtual void        StatePlay         (void);
    virtual void        StateStop         (void);
    virtual void        StateEOF          (void);
    virtual void        StateTransport    (const QString &State);
    virtual void        StateTransportError (void);
    virtual void        StateMute         (bool Mute);
    virtual void        StateVolume       (int Volume);
    virtual void        StateSpeed        (const QString &Speed);
    virtual void        StateDisplaySubtitle (bool Show);
    virtual void        StateURL          (const QString &URL);

  protected:
    virtual void        StateChanged      (const QString &Name, const QVariant &Value);
    void                ResetState        (void);

  protected:
    QString             m_name;
    CastorEventBus     *m_bus;
    bool                m_running;

  private:
    QMap<QString,QVariant> m_state;
    QMutex             *m_stateLock;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(CastorProtocol::Capabilities)
Q_DECLARE_METATYPE(CastorProtocol*)

class CASTOR_MEDIA_PUBLIC CastorProtocolFactory
{
  public:
    CastorProtocolFactory();
    virtual ~CastorProtocolFactory();

    static CastorProtocolFactory* GetCastorProtocolFactory (void);
    static CastorProtocolFactory* GetFactory               (const QString &Name);
    CastorProtocolFactory*        NextFactory              (void) const;
    virtual QString               Name                     (void) = 0;
    virtual CastorProtocol*       Create                   (CastorEventBus *Bus) = 0;

  protected:
    static CastorProtocolFactory* gCastorProtocolFactory;
    CastorProtocolFactory*        nextCastorProtocolFactory;
};

#endif // CASTORPROTOCOL_H
