#ifndef CASTOREVENTBUS_H
#define CASTOREVENTBUS_H

// Qt
#include <QMap>
#include <QList>
#include <QVariant>
#include <QStringList>

// Castor
#include "castorcoreexport.h"

class QReadWriteLock;

class CASTOR_CORE_PUBLIC CastorEventHandler
{
  public:
    virtual ~CastorEventHandler();
    virtual QVariant HandleEvent (const QString &Topic, const QVariantList &Arguments) = 0;
};

class CASTOR_CORE_PUBLIC CastorEventBus
{
  public:
    CastorEventBus();
    ~CastorEventBus();

    void         Subscribe    (const QString &Topic, CastorEventHandler *Handler);
    void         Unsubscribe  (const QString &Topic, CastorEventHandler *Handler);
    void         Unsubscribe  (CastorEventHandler *Handler);
    QVariantList Publish      (const QString &Topic, const QVariantList &Arguments = QVariantList());
    int          HandlerCount (const QString &Topic);
    QStringList  GetTopics    (void);

  private:
    QMap<QString,QList<CastorEventHandler*> > m_handlers;
    QReadWriteLock                           *m_handlersLock;
};

#endif // CASTOREVENTBUS_H
