#ifndef CASTORCOMMANDLINE_H
#define CASTORCOMMANDLINE_H

// Qt
#include <QObject>
#include <QVariant>

// Castor
#include "castorcoreexport.h"

class CastorCommandLinePriv;

class CASTOR_CORE_PUBLIC CastorCommandLine
{
    Q_GADGET
    Q_FLAGS(Options)

  public:
    enum Option
    {
        None     = (0 << 0),
        Help     = (1 << 0),
        Version  = (1 << 1),
        LogLevel = (1 << 2),
        LogType  = (1 << 3),
        LogFile  = (1 << 4)
    };

    Q_DECLARE_FLAGS(Options, Option)

  public:
    explicit CastorCommandLine(CastorCommandLine::Options Flags);
    ~CastorCommandLine();

    int       Evaluate  (int argc, const char * const * argv, bool &Exit);
    void      Add       (const QString &Keys, const QVariant &Default, const QString &HelpText, bool ExitImmediately = false);
    QVariant  GetValue  (const QString &Key);

  private:
    CastorCommandLinePriv *m_priv;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(CastorCommandLine::Options)

#endif // CASTORCOMMANDLINE_H
