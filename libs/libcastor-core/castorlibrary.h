#ifndef CASTORLIBRARY_H
#define CASTORLIBRARY_H

// Qt
#include <QLibrary>

// Castor
#include "castorcoreexport.h"

class CASTOR_CORE_PUBLIC CastorLibrary : public QLibrary
{
  public:
    explicit CastorLibrary(const QString &FileName);
    virtual ~CastorLibrary();

  private:
    void Load (void);
};

#endif // CASTORLIBRARY_H
