#ifndef CASTORLOGGING_H_
#define CASTORLOGGING_H_

// Qt
#include <QString>

// Std
#include <stdint.h>
#include <errno.h>

// Castor
#include "castorcoreexport.h"
#include "castorloggingdefs.h"

#define VERBOSE_LEVEL_NONE (gVerboseMask == 0)
#define VERBOSE_LEVEL_CHECK(_MASK_, _LEVEL_) \
    (((gVerboseMask & (_MASK_)) == (_MASK_)) && gLogLevel >= (_LEVEL_))

#define LOG(_MASK_, _LEVEL_, _STRING_)                                  \
    do {                                                                \
        if (VERBOSE_LEVEL_CHECK((_MASK_), (_LEVEL_)) && ((_LEVEL_)>=0)) \
        {                                                               \
            PrintLogLine(_MASK_, (LogLevel)_LEVEL_,                     \
                         __FILE__, __LINE__, __FUNCTION__,              \
                         QString(_STRING_));                            \
        }                                                               \
    } while (false)

CASTOR_CORE_PUBLIC void     PrintLogLine         (uint64_t Mask, LogLevel Level,
                                                  const char *File, int Line,
                                                  const char *Function,
                                                  const QString &Message);

extern CASTOR_CORE_PUBLIC LogLevel gLogLevel;
extern CASTOR_CORE_PUBLIC uint64_t gVerboseMask;
extern CASTOR_CORE_PUBLIC QString  gVerboseString;

CASTOR_CORE_PUBLIC void     StartLogging         (const QString &Logfile, LogLevel Level = LOG_INFO);
CASTOR_CORE_PUBLIC void     StopLogging          (void);
CASTOR_CORE_PUBLIC LogLevel GetLogLevel          (const QString &Level);
CASTOR_CORE_PUBLIC QString  GetLogLevelName      (LogLevel Level);
CASTOR_CORE_PUBLIC int      ParseVerboseArgument (const QString &Argument);
CASTOR_CORE_PUBLIC QString  LogErrorToString     (int Errnum);
CASTOR_CORE_PUBLIC void     RegisterLoggingThread   (const QString &Name);
CASTOR_CORE_PUBLIC void     DeregisterLoggingThread (void);

/// This can be appended to the LOG args with
/// "+".  Please do not use "<<".  It uses
/// a thread safe version of strerror to produce the
/// string representation of errno and puts it on the
/// next line in the verbose output.
#define ENO (QString("\n\t\t\teno: ") + LogErrorToString(errno))

#endif

// vim:ts=4:sw=4:ai:et:si:sts=4
