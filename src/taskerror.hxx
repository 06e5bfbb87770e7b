/*
 *   This program is free software; you can redistribute it and/or modify
 *   it under the terms of the GNU General Public License as published by
 *   the Free Software Foundation; either version 2 of the License, or
 *   (at your option) any later version.
 *
 *   This program is distributed in the hope that it will be useful,
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *   GNU General Public License for more details.
 *
 *   You should have received a copy of the GNU General Public License
 *   along with this program; if not, write to the
 *   Free Software Foundation, Inc.,
 *   59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _TASKERROR_H_X_INCLUDED_
#define _TASKERROR_H_X_INCLUDED_

#include <stdexcept>
#include <string>

/// How the controller must react to a task failure.
enum ErrKind {
    // Stop everything (bad server address, missing mandatory player)
    ERR_FATAL,
    // Disable the feature implemented by the task, keep the rest running
    ERR_FEATURE,
    // Log, report, and restart the task
    ERR_RECOVERABLE,
};

/// Exception thrown by a task body to hand a classified failure to
/// the controller. Anything else escaping a task is treated as
/// ERR_RECOVERABLE.
class TaskError : public std::runtime_error {
public:
    /** @param status for ERR_FEATURE, the stream status line to show
     *    (e.g. "Stream Err: Port 8080 in use"). */
    TaskError(ErrKind kind, const std::string& what,
              const std::string& status = std::string())
        : std::runtime_error(what), m_kind(kind), m_status(status) {}

    ErrKind kind() const {
        return m_kind;
    }
    const std::string& status() const {
        return m_status;
    }

private:
    ErrKind m_kind;
    std::string m_status;
};

#endif /* _TASKERROR_H_X_INCLUDED_ */
