#ifndef CASTORSSDPSERVICE_H
#define CASTORSSDPSERVICE_H

// Qt
#include <QObject>

// Castor
#include "castorcoreexport.h"
#include "castoreventbus.h"
#include "upnp/castorssdp.h"

class QMutex;
class CastorSettings;

class CASTOR_CORE_PUBLIC CastorSSDPService : public QObject, public CastorEventHandler
{
    Q_OBJECT

  public:
    CastorSSDPService(CastorSettings *Settings, CastorEventBus *Bus, CastorSSDPSocketSet *Sockets = NULL);
    virtual ~CastorSSDPService();

    CastorSSDPSocketSet::Error Start       (void);
    void                       Stop        (void);
    CastorSSDPSocketSet::Error UpdateIP    (void);
    void                       Notify      (void);
    CastorSSDP*                GetSSDP     (void);
    QVariant                   HandleEvent (const QString &Topic, const QVariantList &Arguments);

  signals:
    void                       Failed      (const QString &Reason);

  private:
    void                       Register    (void);

  private:
    CastorSettings            *m_settings;
    CastorEventBus            *m_bus;
    CastorSSDP                *m_ssdp;
    QMutex                    *m_restartLock;
};

#endif // CASTORSSDPSERVICE_H
