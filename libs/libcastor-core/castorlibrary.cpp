/* CastorLibrary
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

// Castor
#include "castorlogging.h"
#include "castorlibrary.h"

/*! \class CastorLibrary
 *  \brief A convenience wrapper around QLibrary
 *
 * CastorLibrary will attempt to dynamically load a library in a platform independent manner. If the
 * library cannot be loaded using the given path, it will fallback to a user defined directory that
 * can be set with the environment variable CASTOR_RUNTIME_LIBS.
*/
CastorLibrary::CastorLibrary(const QString &FileName)
  : QLibrary(FileName)
{
    Load();
}

CastorLibrary::~CastorLibrary()
{
}

void CastorLibrary::Load(void)
{
    if (!load())
    {
        LOG(VB_PLUGIN, LOG_WARNING, QString("Failed to load '%1' (Error: '%2')").arg(fileName()).arg(errorString()));

        QString dir = qgetenv("CASTOR_RUNTIME_LIBS");

        if (!dir.isEmpty())
        {
            if (!dir.endsWith("/"))
                dir.append("/");

            LOG(VB_PLUGIN, LOG_INFO, QString("Trying user defined directory: '%1'").arg(dir));
            setFileName(dir + fileName().section('/', -1));

            if (!load())
                LOG(VB_PLUGIN, LOG_WARNING, QString("Failed to load '%1' from fallback directory (Error: '%2')").arg(fileName()).arg(errorString()));
        }
    }

    if (isLoaded())
        LOG(VB_PLUGIN, LOG_INFO, QString("Loaded '%1'").arg(fileName()));
}
