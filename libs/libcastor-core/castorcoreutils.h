#ifndef CASTORCOREUTILS_H
#define CASTORCOREUTILS_H

// Qt
#include <QDateTime>

// Castor
#include "castorcoreexport.h"

class CASTOR_CORE_PUBLIC CastorCoreUtils
{
  public:
    static QString     DateTimeToRFC1123     (const QDateTime &DateTime);
    static void        QtMessage             (QtMsgType Type, const QMessageLogContext &Context, const QString &Message);
};

#endif // CASTORCOREUTILS_H
