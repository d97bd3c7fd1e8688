#ifndef CASTORSSDPMESSAGE_H
#define CASTORSSDPMESSAGE_H

// Qt
#include <QMap>
#include <QByteArray>

// Castor
#include "castorcoreexport.h"
#include "upnp/castorupnp.h"

class CASTOR_CORE_PUBLIC CastorSSDPMessage
{
  public:
    static bool       Parse          (const QByteArray &Datagram, QString &Method, QString &Target, QMap<QString,QString> &Headers);
    static QByteArray SearchResponse (const CastorUPNPDescription &Description, const QString &Host);
    static QByteArray Notify         (const CastorUPNPDescription &Description, const QString &Host, bool Alive);
};

#endif // CASTORSSDPMESSAGE_H
