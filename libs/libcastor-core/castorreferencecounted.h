#ifndef CASTORREFERENCECOUNTED_H
#define CASTORREFERENCECOUNTED_H

// Qt
#include <QAtomicInt>

// Castor
#include "castorcoreexport.h"

class CASTOR_CORE_PUBLIC CastorReferenceCounter
{
  public:
    CastorReferenceCounter(void);
    virtual ~CastorReferenceCounter(void);

    void UpRef    (void);
    bool DownRef  (void);
    bool IsShared (void);

  private:
    QAtomicInt   m_refCount;
};

#endif // CASTORREFERENCECOUNTED_H
