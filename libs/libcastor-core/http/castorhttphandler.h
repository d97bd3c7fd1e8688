#ifndef CASTORHTTPHANDLER_H
#define CASTORHTTPHANDLER_H

// Qt
#include <QString>

// Castor
#include "castorcoreexport.h"
#include "castorreferencecounted.h"

class QTcpSocket;

class CASTOR_CORE_PUBLIC CastorHTTPHandler : public CastorReferenceCounter
{
  public:
    explicit CastorHTTPHandler(const QString &Name);

    QString      Name              (void);
    virtual void Reload            (void);
    virtual void ProcessConnection (QTcpSocket *Socket) = 0;

  protected:
    virtual ~CastorHTTPHandler();

    QString      m_name;
};

#endif // CASTORHTTPHANDLER_H
