/*
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

#include "exitsignal.h"

#include <fcntl.h>
#include <unistd.h>

#include <chrono>

#include "log.h"

using namespace std;

ExitSignal::ExitSignal()
{
    if (pipe(m_pipe) < 0) {
        LOGSYSERR("ExitSignal::ExitSignal", "pipe", "");
        m_pipe[0] = m_pipe[1] = -1;
        return;
    }
    for (int i = 0; i < 2; i++) {
        fcntl(m_pipe[i], F_SETFD, FD_CLOEXEC);
        fcntl(m_pipe[i], F_SETFL, O_NONBLOCK);
    }
}

ExitSignal::~ExitSignal()
{
    for (int i = 0; i < 2; i++) {
        if (m_pipe[i] >= 0) {
            close(m_pipe[i]);
        }
    }
}

void ExitSignal::set()
{
    unique_lock<mutex> lock(m_mutex);
    if (m_set) {
        return;
    }
    m_set = true;
    // Never read: the pipe stays readable for all pollers.
    if (m_pipe[1] >= 0) {
        char c = 'x';
        if (write(m_pipe[1], &c, 1) != 1) {
            LOGSYSERR("ExitSignal::set", "write", "");
        }
    }
    m_cv.notify_all();
}

bool ExitSignal::waitFor(int ms)
{
    unique_lock<mutex> lock(m_mutex);
    if (ms > 0) {
        m_cv.wait_for(lock, chrono::milliseconds(ms),
                      [this] {return m_set.load();});
    }
    return m_set;
}
