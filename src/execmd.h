/* Copyright (C) 2004-2018 J.F.Dockes
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
#ifndef _EXECMD_H_INCLUDED_
#define _EXECMD_H_INCLUDED_

#include <sys/types.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

class ExitSignal;

/**
 * Execute a command as a child process, feeding its standard input
 * through a pipe, and optionally reading its standard output.
 *
 * Standard error is always captured and drained by an internal
 * thread, which logs the interesting lines and hands lines which look
 * fatal to an optional callback. Chatter known to be harmless ("header
 * missing", "invalid data", typical of decoders resyncing on a broken
 * MP3 stream) is discarded.
 *
 * terminate() is asynchronous: it closes the input and sends
 * SIGTERM, then returns. The status becomes available through
 * maybereap(). The destructor makes sure that the child is dead
 * and reaped (escalating to SIGKILL if needed).
 *
 * All methods can be called from any thread.
 */
class ExecCmd {
public:
    enum ExecStatus {EXEC_OK = 0, EXEC_NOTFOUND, EXEC_ERROR};

    /** @param name short name used in log messages, e.g. "ffplay" */
    ExecCmd(const std::string& name = std::string());
    ~ExecCmd();

    /**
     * Start the command.
     * @param args the command and its arguments. args[0] is looked up
     *    in the PATH if it does not contain a '/'.
     * @param wantstdout create a pipe for the child's standard output,
     *    accessible through stdoutFd(). Else the output goes to /dev/null.
     * @return EXEC_NOTFOUND if the executable could not be found,
     *    EXEC_ERROR for any other failure.
     */
    ExecStatus startExec(const std::vector<std::string>& args,
                         bool wantstdout = false);

    /** Error message for the last failure */
    const std::string& getreason() const;

    /** Log every stderr line, not only the ones with error/warning */
    void setLogAllStderr(bool onoff);

    /** Called from the stderr thread for lines which look fatal */
    void setStderrCallback(std::function<void(const std::string&)> cb);

    /**
     * Write data to the child's input. Waits for the pipe to become
     * writable, but gives up if the exit signal is raised.
     * @return false if the child input is closed (broken pipe, or
     *    terminate() was called), or if sig was raised.
     */
    bool send(const char *data, size_t cnt, ExitSignal *sig = nullptr);

    /** Read side of the child's stdout, or -1 */
    int stdoutFd() const;

    pid_t getChildPid() const;

    /** Check if the child exited, without waiting. Once this returned
     * true, the status stays available.
     * @param status wait() status, set if true is returned. */
    bool maybereap(int *status);

    /** Close the child input and send SIGTERM. Does not wait. */
    void terminate();
    /** True once terminate() has been called */
    bool terminated() const;

    /** SIGKILL if the child is still running. Does not wait. */
    void kill();

    /** Check that a command is executable, possibly looking it up in
     * the PATH. Sets the full path if found. */
    static bool which(const std::string& cmd, std::string& exepath,
                      const char* path = nullptr);

    /** Decide if a wait() status means something went wrong. A normal
     * 0 exit, or death by our own SIGTERM or SIGKILL are expected. */
    static bool unexpectedExit(int status);

    /** Human-readable exit status */
    static std::string statusString(int status);

    class Internal;
private:
    std::unique_ptr<Internal> m;

    ExecCmd(const ExecCmd&);
    ExecCmd& operator=(const ExecCmd&);
};

#endif /* _EXECMD_H_INCLUDED_ */
