/* Copyright (C) 2014 J.F.Dockes
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU Lesser General Public License as published by
 *   the Free Software Foundation; either version 2.1 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU Lesser General Public License for more details.
 *
 *   You should have received a copy of the GNU Lesser General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */

// Measure time intervals.

#include "chrono.h"

using namespace std;

Chrono::Chrono()
    : m_orig(chrono::steady_clock::now())
{
}

long Chrono::restart()
{
    auto nnow = chrono::steady_clock::now();
    auto ms = chrono::duration_cast<chrono::milliseconds>(nnow - m_orig);
    m_orig = nnow;
    return ms.count();
}

long Chrono::millis() const
{
    return chrono::duration_cast<chrono::milliseconds>
        (chrono::steady_clock::now() - m_orig).count();
}

float Chrono::secs() const
{
    return chrono::duration_cast<chrono::duration<float>>
        (chrono::steady_clock::now() - m_orig).count();
}

long Chrono::remaining(long ms) const
{
    return ms - millis();
}
