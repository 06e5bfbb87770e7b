/*   Copyright (C) 2016 J.F.Dockes
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
#ifndef _BUFFERXCHANGE_H_INCLUDED_
#define _BUFFERXCHANGE_H_INCLUDED_

#include <string>
#include <deque>
#include <mutex>
#include <chrono>
#include <condition_variable>

#include "log.h"

/**
 * A BufferXChange is a synchronized meeting point for threads
 * exchanging objects: one or several producers, one consumer.
 *
 * Examples: the relay thread passing AAC chunks to an HTTP client
 * connection, the controller tasks passing events to the front-end.
 *
 * T is a value type (use a shared_ptr for big objects). The queue is
 * bounded and the producer side never sleeps: it either fails
 * (tryPut()) or makes room by dropping the oldest entry
 * (putEvictOldest()). Only the consumer waits, with an optional
 * timeout.
 */
template <class T> class BufXChange {
public:

    /** Create a BufXChange.
     * @param name for message printing
     * @param hi max number of entries on the queue. 0 means no limit.
     */
    BufXChange(const std::string& name, size_t hi = 0)
        : m_name(name), m_high(hi) {
    }

    /** Add item to the queue if there is room. Does not wait.
     * @return false if the queue is full or terminated.
     */
    bool tryPut(const T& t) {
        std::unique_lock<std::mutex> lock(m_mutex);
        if (!ok()) {
            LOGDEB1("BufXChange::tryPut:"  << m_name << ": !ok\n");
            return false;
        }
        if (m_high > 0 && m_queue.size() >= m_high) {
            return false;
        }
        m_queue.push_back(t);
        if (m_workers_waiting > 0) {
            m_wcond.notify_one();
        }
        return true;
    }

    /** Add item, discarding the oldest entries if the queue is full.
     * The discard and the insertion happen under the same lock, so
     * the new item always finds room unless the queue is terminated.
     * @param evicted if not null, set to the number of entries dropped.
     * @return false if the queue is terminated.
     */
    bool putEvictOldest(const T& t, size_t *evicted = nullptr) {
        std::unique_lock<std::mutex> lock(m_mutex);
        size_t cnt = 0;
        if (!ok()) {
            if (evicted) {
                *evicted = 0;
            }
            return false;
        }
        while (m_high > 0 && m_queue.size() >= m_high) {
            m_queue.pop_front();
            cnt++;
        }
        m_evictcount += cnt;
        if (evicted) {
            *evicted = cnt;
        }
        m_queue.push_back(t);
        if (m_workers_waiting > 0) {
            m_wcond.notify_one();
        }
        return true;
    }

    /** Take item from queue. Called from the consumer.
     *
     * @param tp output.
     * @param timeoutms < 0: wait until something arrives or the queue
     *    is terminated. 0: do not wait. > 0: wait at most this long.
     * @return false on timeout or if the queue was terminated.
     */
    bool take(T* tp, int timeoutms = -1) {
        std::unique_lock<std::mutex> lock(m_mutex);
        auto deadline = std::chrono::steady_clock::now() +
            std::chrono::milliseconds(timeoutms > 0 ? timeoutms : 0);
        while (ok() && m_queue.empty()) {
            if (timeoutms == 0) {
                return false;
            }
            m_workers_waiting++;
            if (timeoutms < 0) {
                m_wcond.wait(lock);
            } else if (m_wcond.wait_until(lock, deadline) ==
                       std::cv_status::timeout && m_queue.empty()) {
                m_workers_waiting--;
                return false;
            }
            m_workers_waiting--;
        }
        if (!ok()) {
            return false;
        }
        *tp = m_queue.front();
        m_queue.pop_front();
        return true;
    }

    bool tryTake(T* tp) {
        return take(tp, 0);
    }

    /** Tell the consumer we're done here. Waiters are woken up, and
     * further put/take calls fail. Entries still queued are left
     * alone until drain() or destruction.
     */
    void setTerminate() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_ok = false;
        m_wcond.notify_all();
    }

    bool terminated() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return !ok();
    }

    /** Discard everything on the queue. @return the count of entries */
    size_t drain() {
        std::unique_lock<std::mutex> lock(m_mutex);
        size_t cnt = m_queue.size();
        m_queue.clear();
        return cnt;
    }

    size_t qsize() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    /** Total number of entries dropped by putEvictOldest() */
    size_t evictions() {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_evictcount;
    }

    size_t capacity() const {
        return m_high;
    }

    void reset() {
        // Reset to start state.
        std::unique_lock<std::mutex> lock(m_mutex);
        m_queue.clear();
        m_evictcount = 0;
        m_ok = true;
        m_wcond.notify_all();
    }

    const std::string& getname() const {return m_name;}

private:
    bool ok() {
        return m_ok;
    }

    // Configuration
    std::string m_name;
    size_t m_high;

    // Status
    bool m_ok{true};
    size_t m_evictcount{0};

    // Consumer threads currently waiting for an entry
    unsigned int m_workers_waiting{0};

    std::deque<T> m_queue;

    // Synchronization
    std::condition_variable m_wcond;
    std::mutex m_mutex;
};

#endif /* _BUFFERXCHANGE_H_INCLUDED_ */
