#ifndef CASTORUPNP_H
#define CASTORUPNP_H

// Qt
#include <QString>
#include <QStringList>

// Castor
#include "castorcoreexport.h"

#define CASTOR_ROOT_UPNP_DEVICE QString("urn:schemas-upnp-org:device:MediaRenderer:1")

class CASTOR_CORE_PUBLIC CastorUPNPDescription
{
  public:
    CastorUPNPDescription ();
    CastorUPNPDescription (const QString &USN, const QString &Type, const QString &Location,
                           const QString &Server, const QString &CacheControl);
    QString GetUSN          (void) const;
    QString GetType         (void) const;
    QString GetLocation     (void) const;
    QString GetLocation     (const QString &Host) const;
    QString GetServer       (void) const;
    QString GetCacheControl (void) const;
    bool    IsValid         (void) const;

    bool operator == (const CastorUPNPDescription &Other) const;

  private:
    QString m_usn;
    QString m_type;
    QString m_location;
    QString m_server;
    QString m_cacheControl;
};

class CASTOR_CORE_PUBLIC CastorUPNP
{
  public:
    static  QString     UUIDFromUSN (const QString &USN);
    static  QString     TypeFromUSN (const QString &USN);
    static  QStringList DeviceUSNs  (const QString &UUID);
};

#endif // CASTORUPNP_H
