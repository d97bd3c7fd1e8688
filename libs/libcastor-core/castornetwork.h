#ifndef CASTORNETWORK_H
#define CASTORNETWORK_H

// Qt
#include <QPair>
#include <QList>
#include <QStringList>
#include <QHostAddress>

// Castor
#include "castorcoreexport.h"

/// An IPv4 interface address and its netmask, both in dotted quad notation.
typedef QPair<QString,QString>  CastorInterface;
typedef QList<CastorInterface>  CastorInterfaceList;

class CASTOR_CORE_PUBLIC CastorNetwork
{
  public:
    static CastorInterfaceList GetInterfaces  (const QStringList &Blocked, const QStringList &Additional = QStringList());
    static bool                ParseInterface (const QString &Interface, CastorInterface &Result);
    static bool                SameSubnet     (const QString &Local, const QString &Netmask, const QHostAddress &Remote);
    static QString             ToString       (const CastorInterfaceList &Interfaces);
};

#endif // CASTORNETWORK_H
