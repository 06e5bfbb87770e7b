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
#ifndef _CONTROLLER_H_X_INCLUDED_
#define _CONTROLLER_H_X_INCLUDED_

#include <functional>
#include <memory>

#include "updates.hxx"

class ExitSignal;
struct RelayOptions;

/**
 * The relay supervisor.
 *
 * Runs the command forwarder, the metadata and audio channels, and,
 * if streaming is enabled, the AAC relay and the stream server, each
 * in its own thread. A monitor thread watches the tasks, applies the
 * failure policy (stop everything, disable streaming, or restart the
 * task), and performs the shutdown.
 *
 * The front-end talks to the controller only through the two queues
 * passed to the constructor. The Closed event is the last one ever
 * sent to the update bus.
 */
class Controller {
public:
    enum TaskKind {TASK_CMDFWD, TASK_META, TASK_AUDIO, TASK_RELAY,
                   TASK_STREAMSRV, TASK_COUNT};

    Controller(const RelayOptions& opts, UpdateBus& updates,
               CommandQueue& commands);
    /** Calls stop() */
    ~Controller();

    /** Start the tasks and return. A controller can only run once.
     * @return false if it was already started. */
    bool start();

    /** Shut down and wait for the tasks, within the configured grace
     * period. Any external process still alive after this is killed. */
    void stop();

    /** True between start() and the end of the shutdown */
    bool isRunning() const;

    /** Number of times a task kind was started */
    int spawnCount(TaskKind kind) const;

    static const char *taskName(TaskKind kind);

    /** Run body instead of the normal task code for this kind. Only
     * possible before start(). The body must return once exitsig is
     * set. Exceptions it throws go through the normal failure policy.
     * @return false if already started. */
    bool setTaskBody(TaskKind kind,
                     std::function<void(ExitSignal& exitsig)> body);

    class Internal;
private:
    std::unique_ptr<Internal> m;

    Controller(const Controller&);
    Controller& operator=(const Controller&);
};

#endif /* _CONTROLLER_H_X_INCLUDED_ */
