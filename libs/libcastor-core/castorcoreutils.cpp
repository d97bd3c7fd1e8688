/* Class CastorCoreUtils
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

// Std
#include <stdlib.h>

// Qt
#include <QLocale>

// Castor
#include "castorlogging.h"
#include "castorcoreutils.h"

/*! \brief Format DateTime as an RFC 1123 date (e.g. 'Sun, 06 Nov 1994 08:49:37 GMT').
 *
 * Day and month names are always English, regardless of the system locale.
*/
QString CastorCoreUtils::DateTimeToRFC1123(const QDateTime &DateTime)
{
    return QLocale::c().toString(DateTime.toUTC(), "ddd, dd MMM yyyy HH:mm:ss 'GMT'");
}

/*! \brief A handler routine for Qt messages.
 *
 * This ensures Qt warnings are included in non-console logs.
*/
void CastorCoreUtils::QtMessage(QtMsgType Type, const QMessageLogContext &Context, const QString &Message)
{
    QString message = QString("(%1:%2) %3").arg(Context.file).arg(Context.line).arg(Message);

    switch (Type)
    {
        case QtFatalMsg:
            LOG(VB_GENERAL, LOG_CRIT, message);
            StopLogging();
            abort();
        case QtDebugMsg:
            LOG(VB_GENERAL, LOG_DEBUG, message);
            break;
        case QtWarningMsg:
            LOG(VB_GENERAL, LOG_WARNING, message);
            break;
        default:
            LOG(VB_GENERAL, LOG_ERR, message);
            break;
    }
}
