/* Class CastorQThread
*
* This file is part of the Castor project.
*
* Copyright (C) Mark Kendall 2013
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

// Qt
#include <QDateTime>
#include <QTime>

// Castor
#include "castorlocaldefs.h"
#include "castorlogging.h"
#include "castorqthread.h"

/*! \class CastorQThread
 *  \brief A Castor specific wrapper around QThread.
 *
 * CastorQThread registers the thread name with the logging system and seeds the
 * random number generator when a new thread is started, and deregisters it when
 * the thread is exiting.
 *
 * Subclass CastorQThread and reimplement Start and Finish to add additional code that will
 * be executed in the new thread after initialisation and just before exiting respectively.
 * Subclasses that do not need an event loop may reimplement run, in which case they must
 * call Initialise and Deinitialise themselves.
*/

static QThread *gMainThread = NULL;

void CastorQThread::SetMainThread(void)
{
    gMainThread = QThread::currentThread();
}

bool CastorQThread::IsMainThread(void)
{
    if (gMainThread)
        return QThread::currentThread() == gMainThread;
    return QThread::currentThread()->objectName() == CASTOR_MAIN_THREAD;
}

CastorQThread::CastorQThread(const QString &Name)
  : QThread()
{
    setObjectName(Name);
}

CastorQThread::~CastorQThread()
{
}

void CastorQThread::run(void)
{
    Initialise();
    QThread::run();
    Deinitialise();
}

///\brief Performs Castor specific thread initialisation.
void CastorQThread::Initialise(void)
{
    RegisterLoggingThread(objectName());
    qsrand(QDateTime::currentDateTime().toTime_t() ^ QTime::currentTime().msec());

    Start();

    emit Started();
}

///\brief Performs Castor specific thread cleanup.
void CastorQThread::Deinitialise(void)
{
    Finish();

    emit Finished();

    DeregisterLoggingThread();
}
