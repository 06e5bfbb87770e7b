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

#include "controller.hxx"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>

#include "aacrelay.hxx"
#include "audiochannel.hxx"
#include "bufxchange.h"
#include "fmdxutils.hxx"
#include "log.h"
#include "metachannel.hxx"
#include "session.hxx"
#include "streamserver.hxx"
#include "taskerror.hxx"

using namespace std;

class Controller::Internal {
public:
    Internal(const RelayOptions& _opts, UpdateBus& _updates,
             CommandQueue& _commands)
        : opts(_opts), updates(_updates), commands(_commands),
          session(opts, updates), meta(session), audio(session),
          relay(session), streamsrv(session, relay) {
        for (int i = 0; i < TASK_COUNT; i++) {
            spawncounts[i] = 0;
        }
    }

    struct Task {
        std::thread thread;
        bool running{false};
        std::exception_ptr error;
    };

    void monitorLoop();
    void spawn(TaskKind kind);
    void taskBody(TaskKind kind);
    void runTask(TaskKind kind);
    void handleCompletion(TaskKind kind);
    void taskFailed(TaskKind kind, const string& msg);
    void requestShutdown();
    void cmdForward();

    RelayOptions opts;
    UpdateBus& updates;
    CommandQueue& commands;
    Session session;
    MetaChannel meta;
    AudioChannel audio;
    AacRelay relay;
    StreamServer streamsrv;

    Task tasks[TASK_COUNT];
    std::function<void(ExitSignal&)> bodies[TASK_COUNT];
    // Task kinds, pushed by the task threads when they end
    BufXChange<int> completions{"completions"};
    std::atomic<int> spawncounts[TASK_COUNT];

    std::thread monitor;
    mutable std::mutex mmutex;
    std::condition_variable donecv;
    bool started{false};
    bool finished{false};
};

const char *Controller::taskName(TaskKind kind)
{
    switch (kind) {
    case TASK_CMDFWD: return "CmdFwd";
    case TASK_META: return "TxtWS";
    case TASK_AUDIO: return "AudWS";
    case TASK_RELAY: return "AACRelay";
    case TASK_STREAMSRV: return "StreamSrv";
    default: return "Unknown";
    }
}

Controller::Controller(const RelayOptions& opts, UpdateBus& updates,
                       CommandQueue& commands)
    : m(new Internal(opts, updates, commands))
{
}

Controller::~Controller()
{
    stop();
}

bool Controller::start()
{
    unique_lock<mutex> lock(m->mmutex);
    if (m->started) {
        LOGERR("Controller::start: already started\n");
        return false;
    }
    m->started = true;
    m->monitor = thread(bind(&Controller::Internal::monitorLoop, m.get()));
    return true;
}

bool Controller::setTaskBody(TaskKind kind,
                             std::function<void(ExitSignal&)> body)
{
    unique_lock<mutex> lock(m->mmutex);
    if (m->started || kind < 0 || kind >= TASK_COUNT) {
        return false;
    }
    m->bodies[kind] = body;
    return true;
}

bool Controller::isRunning() const
{
    unique_lock<mutex> lock(m->mmutex);
    return m->started && !m->finished;
}

int Controller::spawnCount(TaskKind kind) const
{
    if (kind < 0 || kind >= TASK_COUNT) {
        return 0;
    }
    return m->spawncounts[kind];
}

void Controller::stop()
{
    {
        unique_lock<mutex> lock(m->mmutex);
        if (!m->started) {
            return;
        }
    }
    m->requestShutdown();
    {
        unique_lock<mutex> lock(m->mmutex);
        if (!m->donecv.wait_for(lock, chrono::milliseconds(m->opts.stopgracems),
                                [this] {return m->finished;})) {
            LOGERR("Controller::stop: tasks still running after " <<
                   m->opts.stopgracems << " mS\n");
        }
    }
    // Whatever happened above, no process survives us.
    int killed = m->session.killAll();
    if (killed) {
        LOGINF("Controller::stop: killed " << killed << " process(es)\n");
    }
    if (m->monitor.joinable()) {
        m->monitor.join();
    }
}

void Controller::Internal::requestShutdown()
{
    if (!session.shuttingDown()) {
        LOGINF("Controller: shutting down\n");
    }
    session.requestExit();
    // Wake up the forwarder
    if (!commands.tryPut(TuneCommand::stop())) {
        commands.setTerminate();
    }
    completions.setTerminate();
}

void Controller::Internal::spawn(TaskKind kind)
{
    Task& task = tasks[kind];
    if (task.thread.joinable()) {
        task.thread.join();
    }
    task.error = std::exception_ptr();
    task.running = true;
    spawncounts[kind]++;
    LOGDEB("Controller: starting task " << taskName(kind) << endl);
    task.thread = thread(bind(&Controller::Internal::taskBody, this, kind));
}

void Controller::Internal::taskBody(TaskKind kind)
{
    try {
        runTask(kind);
    } catch (...) {
        // Handed over to the monitor, which classifies it.
        tasks[kind].error = current_exception();
    }
    completions.tryPut(int(kind));
}

void Controller::Internal::runTask(TaskKind kind)
{
    if (bodies[kind]) {
        bodies[kind](session.exitsig);
        return;
    }
    switch (kind) {
    case TASK_CMDFWD: cmdForward(); break;
    case TASK_META: meta.run(); break;
    case TASK_AUDIO: audio.run(); break;
    case TASK_RELAY: relay.run(); break;
    case TASK_STREAMSRV: streamsrv.run(); break;
    default: break;
    }
}

void Controller::Internal::cmdForward()
{
    TuneCommand cmd;
    while (!session.shuttingDown()) {
        if (!commands.take(&cmd)) {
            break;
        }
        if (cmd.kind == TuneCommand::CMD_STOP) {
            break;
        }
        if (!khzInBand(cmd.khz)) {
            LOGERR("Controller: tune request out of band: " << cmd.khz << endl);
            updates.error(string("Invalid frequency: ") + to_string(cmd.khz) +
                          " kHz");
            continue;
        }
        switch (meta.sendTune(cmd.khz)) {
        case MetaChannel::TUNE_SENT:
            // Don't wait for the server to confirm
            updates.currentFrequency(cmd.khz);
            break;
        case MetaChannel::TUNE_NOTCONNECTED:
            updates.status("Text WS not connected, cannot tune.");
            break;
        case MetaChannel::TUNE_FAILED:
            updates.status("Text WS closed, cannot send cmd.");
            break;
        }
    }
    LOGDEB("Controller::cmdForward: done\n");
}

void Controller::Internal::taskFailed(TaskKind kind, const string& msg)
{
    LOGERR("Controller: task " << taskName(kind) << " failed: " << msg << endl);
    updates.error(string("Task ") + taskName(kind) + " failed: " + msg);
    if (session.shuttingDown()) {
        return;
    }
    switch (kind) {
    case TASK_STREAMSRV:
        if (session.disableStreaming()) {
            updates.streamStatus("Stream: Server Failed");
        }
        return;
    case TASK_RELAY:
        if (!session.streaming) {
            return;
        }
        break;
    default:
        break;
    }
    // Avoid spinning on a task which fails immediately
    if (session.exitsig.waitFor(opts.settledelayms)) {
        return;
    }
    spawn(kind);
}

void Controller::Internal::handleCompletion(TaskKind kind)
{
    Task& task = tasks[kind];
    if (task.thread.joinable()) {
        task.thread.join();
    }
    task.running = false;
    std::exception_ptr error = task.error;
    task.error = std::exception_ptr();

    if (session.shuttingDown()) {
        LOGDEB("Controller: task " << taskName(kind) << " done (shutdown)\n");
        return;
    }
    if (!error) {
        LOGINF("Controller: task " << taskName(kind) << " returned\n");
        return;
    }

    try {
        rethrow_exception(error);
    } catch (const TaskError& e) {
        switch (e.kind()) {
        case ERR_FATAL:
            LOGERR("Controller: fatal error in " << taskName(kind) << ": " <<
                   e.what() << endl);
            updates.error(e.what());
            updates.error(string("Fatal error in ") + taskName(kind) +
                          ". Stopping.");
            requestShutdown();
            break;
        case ERR_FEATURE:
            LOGERR("Controller: " << taskName(kind) << ": " << e.what() <<
                   ". Disabling streaming.\n");
            session.disableStreaming();
            updates.streamStatus(e.status().empty() ?
                                 string("Stream: disabled") : e.status());
            updates.error(e.what());
            break;
        default:
            taskFailed(kind, e.what());
            break;
        }
    } catch (const std::exception& e) {
        taskFailed(kind, e.what());
    } catch (...) {
        taskFailed(kind, "unknown exception");
    }
}

void Controller::Internal::monitorLoop()
{
    LOGINF("Controller: starting, text " << opts.texturi << " audio " <<
           opts.audiouri << (session.streaming ? ", streaming" : "") <<
           (session.playback ? "" : ", no local playback") << endl);

    spawn(TASK_CMDFWD);
    spawn(TASK_META);
    spawn(TASK_AUDIO);
    if (session.streaming) {
        spawn(TASK_STREAMSRV);
        spawn(TASK_RELAY);
    } else {
        updates.streamStatus("Stream: disabled");
    }

    while (!session.shuttingDown()) {
        int kind;
        if (!completions.take(&kind, opts.monitorpollms)) {
            continue;
        }
        handleCompletion(TaskKind(kind));
    }

    // All tasks watch the exit signal, wait for them.
    for (int i = 0; i < TASK_COUNT; i++) {
        if (tasks[i].thread.joinable()) {
            tasks[i].thread.join();
        }
        tasks[i].running = false;
    }
    streamsrv.stop();
    audio.stopProcesses();
    session.killAll();
    updates.closed();
    LOGINF("Controller: stopped\n");

    unique_lock<mutex> lock(mmutex);
    finished = true;
    donecv.notify_all();
}
