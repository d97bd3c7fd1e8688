#ifndef CASTORQTHREAD_H
#define CASTORQTHREAD_H

// Qt
#include <QThread>

// Castor
#include "castorcoreexport.h"

class CASTOR_CORE_PUBLIC CastorQThread : public QThread
{
    Q_OBJECT

  public:
    static void     SetMainThread    (void);
    static bool     IsMainThread     (void);

  public:
    explicit CastorQThread(const QString &Name);
    virtual ~CastorQThread();

  signals:
    void            Started          (void);
    void            Finished         (void);

  public:
    virtual void    Start            (void) = 0;
    virtual void    Finish           (void) = 0;

  protected:
    virtual void    run              (void);
    void            Initialise       (void);
    void            Deinitialise     (void);
};

#endif // CASTORQTHREAD_H
