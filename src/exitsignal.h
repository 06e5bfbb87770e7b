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
#ifndef _EXITSIGNAL_H_INCLUDED_
#define _EXITSIGNAL_H_INCLUDED_

#include <atomic>
#include <condition_variable>
#include <mutex>

/**
 * One-way shutdown flag shared by all the threads of a session.
 *
 * Threads sleeping on a timer use waitFor(). Threads sleeping in
 * poll() add fd() to their fd set with POLLIN: it becomes readable
 * once set() has been called, and stays so.
 */
class ExitSignal {
public:
    ExitSignal();
    ~ExitSignal();

    /** Raise the flag and wake everybody up. Can be called several times */
    void set();

    bool isSet() const {
        return m_set;
    }

    /** Sleep for ms milliseconds or until set().
     * @return true if the flag is set. */
    bool waitFor(int ms);

    /** Read side of the wakeup pipe, for poll() */
    int fd() const {
        return m_pipe[0];
    }

private:
    std::atomic<bool> m_set{false};
    int m_pipe[2];
    std::mutex m_mutex;
    std::condition_variable m_cv;

    ExitSignal(const ExitSignal&);
    ExitSignal& operator=(const ExitSignal&);
};

#endif /* _EXITSIGNAL_H_INCLUDED_ */
