#ifndef CASTORDEVICEREGISTRY_H
#define CASTORDEVICEREGISTRY_H

// Qt
#include <QMap>
#include <QList>
#include <QStringList>

// Castor
#include "castorcoreexport.h"
#include "upnp/castorupnp.h"

class QMutex;

class CASTOR_CORE_PUBLIC CastorDeviceRegistry
{
  public:
    CastorDeviceRegistry();
    ~CastorDeviceRegistry();

    void                         Register     (const CastorUPNPDescription &Description);
    bool                         Unregister   (const QString &USN);
    bool                         Contains     (const QString &USN);
    bool                         Get          (const QString &USN, CastorUPNPDescription &Description);
    QList<CastorUPNPDescription> Find         (const QString &SearchTarget);
    QStringList                  GetUSNs      (void);
    int                          Count        (void);
    void                         Clear        (void);

  private:
    QMap<QString,CastorUPNPDescription> m_devices;
    QMutex                             *m_lock;
};

#endif // CASTORDEVICEREGISTRY_H
