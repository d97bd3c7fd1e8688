/* Class CastorReferenceCounter
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
#include "castorreferencecounted.h"

/*! \class CastorReferenceCounter
 *  \brief A reference counting implementation.
 *
 * The object is created with a reference count of 1 and deletes itself when the last
 * reference is released with DownRef.
*/
CastorReferenceCounter::CastorReferenceCounter(void)
{
    UpRef();
}

CastorReferenceCounter::~CastorReferenceCounter()
{
}

void CastorReferenceCounter::UpRef(void)
{
    m_refCount.ref();
}

///\brief Release a reference. Returns true if the object was deleted.
bool CastorReferenceCounter::DownRef(void)
{
    if (!m_refCount.deref())
    {
        delete this;
        return true;
    }

    return false;
}

bool CastorReferenceCounter::IsShared(void)
{
    return m_refCount.fetchAndAddOrdered(0) > 1;
}
