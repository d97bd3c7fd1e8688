/* Castor logging
*
* This file is part of the Castor project.
*
* Based on the MythTV logging implementation.
*
* This program is free software; you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation; either version 2 of the License, or
* (at your option) any later version.
*
* This program is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with this program; if not, write to the Free Software
* Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA  02110-1301,
* USA.
*/

// Std
#include <stdlib.h>
#include <string.h>
#include <stdio.h>
#include <time.h>
#include <iostream>

// Qt
#include <QtGlobal>
#include <QAtomicInt>
#include <QCoreApplication>
#include <QDateTime>
#include <QTime>
#include <QThread>
#include <QMutex>
#include <QList>
#include <QHash>
#include <QMap>
#include <QFile>
#include <QRegExp>
#include <QStringList>
#include <QWaitCondition>
#include <QQueue>

// Castor
#include "castorlocaldefs.h"
#include "castorexitcodes.h"
#include "castorlogging.h"
#include "castorloggingimp.h"

#if defined(Q_OS_LINUX)
#include <sys/syscall.h>
#include <unistd.h>
#endif

class LoggingThread;

using namespace std;

QMutex                   gLoggerListLock;
QList<LoggerBase *>      gLoggerList;
QMutex                   gLogQueueLock;
QQueue<LogItem *>        gLogQueue;
QMutex                   gLogThreadLock;
QHash<quint64, QString>  gLogThreadHash;
LoggingThread           *gLogThread = NULL;
bool                     gLogThreadFinished = false;

typedef enum {
    kMessage       = 0x01,
    kRegistering   = 0x02,
    kDeregistering = 0x04,
    kFlush         = 0x08,
    kStandardIO    = 0x10,
} LoggingType;

QString GetThreadName(LogItem *Item);

class LogItem
{
  public:
    LogItem(const char *File, const char *Function,
            int Line, LogLevel Level, int Type)
      : threadId((quint64)(QThread::currentThreadId())),
        line(Line),
        type(Type),
        level(Level),
        file(File),
        function(Function),
        time(QDateTime::currentDateTime()),
        tid(0)
    {
#if defined(Q_OS_LINUX)
        tid = (qint64)syscall(SYS_gettid);
#endif
        refCount.ref();
    }

    static void Delete(LogItem *Item)
    {
        if (Item && !Item->refCount.deref())
            delete Item;
    }

    QAtomicInt          refCount;
    quint64             threadId;
    int                 line;
    int                 type;
    LogLevel            level;
    const char         *file;
    const char         *function;
    QDateTime           time;
    qint64              tid;
    QString             threadName;
    QByteArray          message;
};

class LoggingThread : public QThread
{
  public:
    LoggingThread()
      : QThread(),
        m_aborted(false)
    {
        setObjectName("Logger");
    }

   ~LoggingThread()
    {
        Stop();
        wait();
    }

    void run(void)
    {
        gLogThreadFinished = false;

        QMutexLocker lock(&gLogQueueLock);

        while (!m_aborted || !gLogQueue.isEmpty())
        {
            if (gLogQueue.isEmpty())
            {
                m_waitEmpty.wakeAll();
                m_waitNotEmpty.wait(lock.mutex(), 100);
                continue;
            }

            LogItem *item = gLogQueue.dequeue();
            lock.unlock();

            HandleItem(item);
            LogItem::Delete(item);

            lock.relock();
        }

        gLogThreadFinished = true;
    }

    void Stop(void)
    {
        QMutexLocker lock(&gLogQueueLock);
        if (m_aborted)
            return;

        Flush(1000);
        m_aborted = true;
        m_waitNotEmpty.wakeAll();
    }

    // NB gLogQueueLock must be held
    bool Flush(int TimeoutMS = 200000)
    {
        QTime timer;
        timer.start();
        while (!m_aborted && !gLogQueue.isEmpty() && timer.elapsed() < TimeoutMS)
        {
            m_waitNotEmpty.wakeAll();
            int left = TimeoutMS - timer.elapsed();
            if (left > 0)
                m_waitEmpty.wait(&gLogQueueLock, left);
        }
        return gLogQueue.isEmpty();
    }

    void HandleItem(LogItem *Item)
    {
        if (Item->type & kRegistering)
        {
            QMutexLocker locker(&gLogThreadLock);
            gLogThreadHash[Item->threadId] = Item->threadName;
        }
        else if (Item->type & kDeregistering)
        {
            QMutexLocker locker(&gLogThreadLock);
            gLogThreadHash.remove(Item->threadId);
        }

        if (!Item->message.isEmpty())
        {
            QMutexLocker locker(&gLoggerListLock);

            QList<LoggerBase *>::iterator it;
            for (it = gLoggerList.begin(); it != gLoggerList.end(); ++it)
                (*it)->Logmsg(Item);
        }
    }

  private:
    QWaitCondition m_waitNotEmpty;
    QWaitCondition m_waitEmpty;
    bool           m_aborted;
};

LogLevel gLogLevel = (LogLevel)LOG_INFO;

typedef struct {
    uint64_t mask;
    QString  name;
    bool     additive;
    QString  helpText;
} VerboseDef;

typedef QMap<QString, VerboseDef> VerboseMap;

typedef struct {
    int         value;
    QString     name;
    char        shortname;
} LoglevelDef;

typedef QMap<int, LoglevelDef> LoglevelMap;

VerboseMap     gVerboseMap;
QMutex         gVerboseMapLock;
LoglevelMap    gLoglevelMap;
QMutex         gLoglevelMapLock;

bool           gVerboseInitialised    = false;
const uint64_t gVerboseDefaultInt     = VB_GENERAL;
const char    *gVerboseDefaultStr     = " general";
uint64_t       gVerboseMask           = gVerboseDefaultInt;
QString        gVerboseString         = QString(gVerboseDefaultStr);

void AddVerbose(uint64_t Mask, QString Name, bool Additive, const QString &Helptext);
void AddLogLevel(int Value, QString Name, char Shortname);
void InitVerbose(void);
void VerboseHelp(void);

LoggerBase::LoggerBase(const QString &FileName)
  : m_fileName(FileName)
{
    QMutexLocker locker(&gLoggerListLock);
    gLoggerList.append(this);
}

LoggerBase::~LoggerBase()
{
}

/*! \class FileLogger
 *  \brief Writes log lines to the console or to a file.
 *
 * An empty file name logs to the console. An existing log file is moved to '<name>.old'.
*/
FileLogger::FileLogger(const QString &Filename)
  : LoggerBase(Filename),
    m_opened(false),
    m_file(NULL)
{
    if (m_fileName.isEmpty())
    {
        m_opened = true;
        LOG(VB_GENERAL, LOG_INFO, "Logging to the console");
        return;
    }

    if (QFile::exists(m_fileName))
    {
        QString old = m_fileName + ".old";

        LOG(VB_GENERAL, LOG_INFO, QString("Moving '%1' to '%2'")
            .arg(m_fileName).arg(old));

        QFile::remove(old);
        QFile::rename(m_fileName, old);
    }

    m_file   = new QFile(m_fileName);
    m_opened = m_file->open(QIODevice::WriteOnly | QIODevice::Truncate |
                            QIODevice::Text | QIODevice::Unbuffered);

    if (m_opened)
        LOG(VB_GENERAL, LOG_INFO, QString("Logging to '%1'").arg(m_fileName));
    else
        LOG(VB_GENERAL, LOG_ERR, QString("Failed to open '%1' for logging").arg(m_fileName));
}

FileLogger::~FileLogger()
{
    if (m_file)
    {
        m_file->flush();
        m_file->close();
    }

    delete m_file;
    m_file = NULL;
}

bool FileLogger::Logmsg(LogItem *Item)
{
    if (!m_opened)
        return false;

    if (Item->type & kStandardIO)
    {
        if (!m_file)
            cout << Item->message.constData() << endl;
        return true;
    }

    char shortname = '-';
    {
        QMutexLocker locker(&gLoglevelMapLock);
        LoglevelMap::iterator it = gLoglevelMap.find(Item->level);
        if (it != gLoglevelMap.end())
            shortname = (*it).shortname;
    }

    QString fileline = QString("%1 (%2:%3)").arg(Item->function).arg(Item->file).arg(Item->line);
    QByteArray line = QString("%1 %2 [%3/%4] %5 %6 - ")
                        .arg(Item->time.toString("yyyy-MM-dd HH:mm:ss.zzz"))
                        .arg(shortname)
                        .arg(QCoreApplication::applicationPid(), 6)
                        .arg(Item->tid, 6)
                        .arg(GetThreadName(Item), -11)
                        .arg(fileline.left(49), -50).toLocal8Bit();
    line.append(Item->message);

    if (m_file)
    {
        line.append('\n');
        if (m_file->write(line) < 0)
        {
            m_opened = false;
            cerr << "Closed log output due to errors" << endl;
            return false;
        }
    }
    else
    {
        cerr << line.constData() << endl;
    }

    return true;
}

QString GetThreadName(LogItem *Item)
{
    static const QString unknown("QRunnable");

    if (!Item)
        return unknown;

    if (!Item->threadName.isEmpty())
        return Item->threadName;

    QMutexLocker locker(&gLogThreadLock);
    return gLogThreadHash.value(Item->threadId, unknown);
}

static void EnqueueItem(LogItem *Item)
{
    QMutexLocker lock(&gLogQueueLock);

    gLogQueue.enqueue(Item);

    // the logging thread has gone away - process synchronously
    if (gLogThread && gLogThreadFinished && !gLogThread->isRunning())
    {
        while (!gLogQueue.isEmpty())
        {
            LogItem *item = gLogQueue.dequeue();
            lock.unlock();
            gLogThread->HandleItem(item);
            LogItem::Delete(item);
            lock.relock();
        }
    }
    else if (gLogThread && !gLogThreadFinished && (Item->type & kFlush))
    {
        gLogThread->Flush();
    }
}

void PrintLogLine(uint64_t Mask, LogLevel Level, const char *File, int Line,
                  const char *Function, const QString &Message)
{
    int type = kMessage;
    type |= (Mask & VB_FLUSH) ? kFlush : 0;
    type |= (Mask & VB_STDIO) ? kStandardIO : 0;

    LogItem *item = new LogItem(File, Function, Line, Level, type);
    item->message = Message.toLocal8Bit().left(LOGLINE_MAX);

    EnqueueItem(item);
}

void StartLogging(const QString &Logfile, LogLevel Level)
{
    RegisterLoggingThread(CASTOR_MAIN_THREAD);

    {
        QMutexLocker lock(&gLogQueueLock);
        if (!gLogThread)
            gLogThread = new LoggingThread();
    }

    if (gLogThread->isRunning())
        return;

    gLogLevel = Level;
    LOG(VB_GENERAL, LOG_NOTICE, QString("Setting level to LOG_%1")
             .arg(GetLogLevelName(gLogLevel).toUpper()));

    new FileLogger(QString(""));

    if (!Logfile.isEmpty())
        new FileLogger(Logfile);

    gLogThread->start();
}

void StopLogging(void)
{
    if (gLogThread)
    {
        gLogThread->Stop();
        gLogThread->wait();
    }

    {
        QMutexLocker lock(&gLogQueueLock);
        delete gLogThread;
        gLogThread = NULL;
        gLogThreadFinished = false;
    }

    {
        QMutexLocker locker(&gLoggerListLock);
        while (!gLoggerList.isEmpty())
            delete gLoggerList.takeFirst();
    }
}

void RegisterLoggingThread(const QString &Name)
{
    LogItem *item = new LogItem(__FILE__, __FUNCTION__, __LINE__,
                                (LogLevel)LOG_DEBUG, kRegistering);
    item->threadName = Name;
    EnqueueItem(item);
}

void DeregisterLoggingThread(void)
{
    LogItem *item = new LogItem(__FILE__, __FUNCTION__, __LINE__,
                                (LogLevel)LOG_DEBUG, kDeregistering);
    EnqueueItem(item);
}

LogLevel GetLogLevel(const QString &Level)
{
    if (!gVerboseInitialised)
        InitVerbose();

    QMutexLocker locker(&gLoglevelMapLock);
    for (LoglevelMap::iterator it = gLoglevelMap.begin(); it != gLoglevelMap.end(); ++it)
        if ((*it).name == Level.toLower())
            return (LogLevel)(*it).value;

    return LOG_UNKNOWN;
}

QString GetLogLevelName(LogLevel Level)
{
    if (!gVerboseInitialised)
        InitVerbose();

    QMutexLocker locker(&gLoglevelMapLock);
    LoglevelMap::iterator it = gLoglevelMap.find((int)Level);

    if (it == gLoglevelMap.end())
        return QString("unknown");

    return (*it).name;
}

void AddVerbose(uint64_t Mask, QString Name, bool Additive, const QString &Helptext)
{
    VerboseDef item;

    // VB_GENERAL -> general
    Name.remove(0, 3);
    Name = Name.toLower();

    item.mask     = Mask;
    item.name     = Name;
    item.additive = Additive;
    item.helpText = Helptext;

    gVerboseMap.insert(Name, item);
}

void AddLogLevel(int Value, QString Name, char Shortname)
{
    LoglevelDef item;

    // LOG_CRIT -> crit
    Name.remove(0, 4);
    Name = Name.toLower();

    item.value     = Value;
    item.name      = Name;
    item.shortname = Shortname;

    gLoglevelMap.insert(Value, item);
}

void InitVerbose(void)
{
    QMutexLocker locker(&gVerboseMapLock);
    QMutexLocker locker2(&gLoglevelMapLock);

    if (gVerboseInitialised)
        return;

    gVerboseMap.clear();
    gLoglevelMap.clear();

#undef CASTORLOGGINGDEFS_H_
#define _IMPLEMENT_VERBOSE
#include "castorloggingdefs.h"

    gVerboseInitialised = true;
}

void VerboseHelp(void)
{
    cerr << "Verbose debug levels.\n"
            "Accepts any combination (separated by comma) of:\n\n";

    for (VerboseMap::Iterator it = gVerboseMap.begin(); it != gVerboseMap.end(); ++it)
    {
        if (it.value().helpText.isEmpty())
            continue;
        QString name = QString("  %1").arg(it.value().name, -15, ' ');
        cerr << name.toLocal8Bit().constData() << " - " <<
                it.value().helpText.toLocal8Bit().constData() << endl;
    }

    cerr << endl <<
      "Most options are additive except for 'none' and 'all'.\n"
      "These two are semi-exclusive and take precedence over any\n"
      "other options. Additive options may also be subtracted from\n"
      "'all' by prefixing them with 'no', so you may use '-v all,nosocket'\n"
      "to view all but low level socket messages.\n\n";
}

/*! \brief Parse a comma separated list of verbose masks.
 *
 * Returns GENERIC_EXIT_INVALID_CMDLINE for unknown masks or if help was requested.
*/
int ParseVerboseArgument(const QString &Argument)
{
    if (!gVerboseInitialised)
        InitVerbose();

    QMutexLocker locker(&gVerboseMapLock);

    gVerboseMask   = gVerboseDefaultInt;
    gVerboseString = QString(gVerboseDefaultStr);

    if (Argument.startsWith('-'))
    {
        cerr << "Invalid or missing argument to -v/--verbose option\n";
        return GENERIC_EXIT_INVALID_CMDLINE;
    }

    QStringList options = Argument.split(QRegExp("\\W+"), QString::SkipEmptyParts);
    foreach (QString option, options)
    {
        option = option.toLower();
        bool reverse = false;

        if (option != "none" && option.startsWith("no"))
        {
            reverse = true;
            option = option.mid(2);
        }

        if (option == "help")
        {
            VerboseHelp();
            return GENERIC_EXIT_INVALID_CMDLINE;
        }

        if (option == "default")
        {
            gVerboseMask   = gVerboseDefaultInt;
            gVerboseString = QString(gVerboseDefaultStr);
            continue;
        }

        if (!gVerboseMap.contains(option))
        {
            cerr << "Unknown argument for -v/--verbose: " <<
                    option.toLocal8Bit().constData() << endl;
            return GENERIC_EXIT_INVALID_CMDLINE;
        }

        VerboseDef item = gVerboseMap.value(option);
        if (reverse)
        {
            gVerboseMask &= ~(item.mask);
            gVerboseString = gVerboseString.remove(' ' + item.name);
            gVerboseString += " no" + item.name;
        }
        else if (item.additive)
        {
            if (!(gVerboseMask & item.mask))
            {
                gVerboseMask |= item.mask;
                gVerboseString += ' ' + item.name;
            }
        }
        else
        {
            gVerboseMask = item.mask;
            gVerboseString = item.name;
        }
    }

    return GENERIC_EXIT_OK;
}

QString LogErrorToString(int Errnum)
{
    char buffer[256];
    buffer[0] = '\0';
#if defined(Q_OS_WIN)
    strerror_s(buffer, sizeof(buffer), Errnum);
    QString error(buffer);
#elif defined(_GNU_SOURCE) && !defined(__APPLE__)
    QString error(strerror_r(Errnum, buffer, sizeof(buffer)));
#else
    strerror_r(Errnum, buffer, sizeof(buffer));
    QString error(buffer);
#endif
    return QString("%1 (%2)").arg(error).arg(Errnum);
}

// vim:ts=4:sw=4:ai:et:si:sts=4
