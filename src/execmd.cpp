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

#include "execmd.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include <atomic>
#include <mutex>
#include <thread>

#include "exitsignal.h"
#include "fmdxutils.hxx"
#include "log.h"

using namespace std;

// We write to pipes: a dead reader must give us EPIPE, not kill us.
class SigPipeIgnore {
public:
    SigPipeIgnore() {
        struct sigaction action;
        memset(&action, 0, sizeof(action));
        action.sa_handler = SIG_IGN;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, 0);
    }
};
static SigPipeIgnore sigpipeignore;

// Decoder noise when the stream starts or resyncs
static const char *benignStderr[] = {"header missing", "invalid data"};
static const char *fatalStderr[] = {"fatal", "critical"};

class ExecCmd::Internal {
public:
    Internal(const string& nm)
        : name(nm) {}
    ~Internal() {
        closefd(pipein);
        closefd(pipeout);
        closefd(pipeerr);
    }

    static void closefd(int& fd) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    bool reap_nolock(int *st);
    void stderrWorker();
    void stderrLine(const string& line);

    string name;
    string reason;
    pid_t pid{-1};
    int pipein{-1};
    int pipeout{-1};
    int pipeerr{-1};
    bool isterminated{false};
    bool inputclosed{false};
    bool reaped{false};
    int status{0};
    bool logall{false};
    function<void(const string&)> errcb;
    std::thread errworker;
    std::atomic<bool> stopping{false};
    mutable std::mutex mmutex;
};

ExecCmd::ExecCmd(const string& name)
    : m(new Internal(name))
{
}

ExecCmd::~ExecCmd()
{
    if (m->pid > 0) {
        int status;
        if (!maybereap(&status)) {
            terminate();
            for (int i = 0; i < 25; i++) {
                if (maybereap(&status)) {
                    break;
                }
                usleep(20 * 1000);
            }
            unique_lock<mutex> lock(m->mmutex);
            if (!m->reaped) {
                LOGDEB("ExecCmd::~ExecCmd: " << m->name << ": SIGKILL\n");
                ::kill(m->pid, SIGKILL);
                if (waitpid(m->pid, &m->status, 0) == m->pid) {
                    m->reaped = true;
                }
            }
        }
    }
    m->stopping = true;
    if (m->errworker.joinable()) {
        m->errworker.join();
    }
}

const string& ExecCmd::getreason() const
{
    return m->reason;
}

void ExecCmd::setLogAllStderr(bool onoff)
{
    unique_lock<mutex> lock(m->mmutex);
    m->logall = onoff;
}

void ExecCmd::setStderrCallback(function<void(const string&)> cb)
{
    unique_lock<mutex> lock(m->mmutex);
    m->errcb = cb;
}

ExecCmd::ExecStatus ExecCmd::startExec(const vector<string>& args,
                                       bool wantstdout)
{
    if (m->pid > 0) {
        m->reason = "already started";
        LOGERR("ExecCmd::startExec: " << m->name << ": already started\n");
        return EXEC_ERROR;
    }
    if (args.empty()) {
        m->reason = "empty command";
        return EXEC_ERROR;
    }
    if (m->name.empty()) {
        m->name = args[0];
    }
    string exe;
    if (!which(args[0], exe)) {
        m->reason = string("command not found: ") + args[0];
        LOGDEB("ExecCmd::startExec: " << m->reason << endl);
        return EXEC_NOTFOUND;
    }

    // Everything the child needs is computed before the fork: only
    // async-signal-safe calls are allowed between fork and exec.
    vector<char*> argv;
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 0 || maxfd > 65536) {
        maxfd = 65536;
    }

    int inpipe[2] = {-1, -1};
    int outpipe[2] = {-1, -1};
    int errpipe[2] = {-1, -1};
    int execpipe[2] = {-1, -1};
    int devnull = -1;
    if (pipe2(inpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0 ||
        pipe2(execpipe, O_CLOEXEC) < 0 ||
        (wantstdout && pipe2(outpipe, O_CLOEXEC) < 0) ||
        (!wantstdout && (devnull = open("/dev/null",O_WRONLY|O_CLOEXEC)) < 0)) {
        m->reason = string("pipe: ") + strerror(errno);
        LOGSYSERR("ExecCmd::startExec", "pipe", m->name);
        for (int *fds : {inpipe, outpipe, errpipe, execpipe}) {
            Internal::closefd(fds[0]);
            Internal::closefd(fds[1]);
        }
        Internal::closefd(devnull);
        return EXEC_ERROR;
    }

    pid_t pid = fork();
    if (pid < 0) {
        m->reason = string("fork: ") + strerror(errno);
        LOGSYSERR("ExecCmd::startExec", "fork", m->name);
        for (int *fds : {inpipe, outpipe, errpipe, execpipe}) {
            Internal::closefd(fds[0]);
            Internal::closefd(fds[1]);
        }
        Internal::closefd(devnull);
        return EXEC_ERROR;
    }

    if (pid == 0) {
        // Child
        struct sigaction action;
        memset(&action, 0, sizeof(action));
        action.sa_handler = SIG_DFL;
        sigemptyset(&action.sa_mask);
        sigaction(SIGPIPE, &action, 0);
        sigaction(SIGINT, &action, 0);
        sigaction(SIGTERM, &action, 0);
        sigset_t sset;
        sigemptyset(&sset);
        sigprocmask(SIG_SETMASK, &sset, 0);

        dup2(inpipe[0], 0);
        dup2(wantstdout ? outpipe[1] : devnull, 1);
        dup2(errpipe[1], 2);
        // The child only gets 0-2, whatever the close-on-exec flags.
        for (int fd = 3; fd < maxfd; fd++) {
            if (fd != execpipe[1]) {
                close(fd);
            }
        }
        execv(exe.c_str(), &argv[0]);
        int err = errno;
        ssize_t ret = write(execpipe[1], &err, sizeof(err));
        (void)ret;
        _exit(127);
    }

    // Parent
    close(inpipe[0]);
    close(errpipe[1]);
    close(execpipe[1]);
    if (wantstdout) {
        close(outpipe[1]);
    } else {
        close(devnull);
    }

    // The exec pipe is closed by a successful exec. Else the child
    // sends us the errno.
    int childerr = 0;
    ssize_t n;
    while ((n = read(execpipe[0], &childerr, sizeof(childerr))) < 0 &&
           errno == EINTR)
        ;
    close(execpipe[0]);
    if (n > 0) {
        m->reason = string("exec ") + exe + ": " + strerror(childerr);
        LOGERR("ExecCmd::startExec: " << m->reason << endl);
        int status;
        waitpid(pid, &status, 0);
        close(inpipe[1]);
        close(errpipe[0]);
        if (wantstdout) {
            close(outpipe[0]);
        }
        return childerr == ENOENT ? EXEC_NOTFOUND : EXEC_ERROR;
    }

    fcntl(inpipe[1], F_SETFL, O_NONBLOCK);
    {
        unique_lock<mutex> lock(m->mmutex);
        m->pid = pid;
        m->pipein = inpipe[1];
        m->pipeerr = errpipe[0];
        m->pipeout = wantstdout ? outpipe[0] : -1;
    }
    m->errworker = std::thread(bind(&ExecCmd::Internal::stderrWorker,m.get()));
    LOGDEB("ExecCmd::startExec: " << m->name << " started, pid " << pid <<"\n");
    return EXEC_OK;
}

void ExecCmd::Internal::stderrLine(const string& line)
{
    if (line.empty()) {
        return;
    }
    string lower = stringtolower(line);
    for (auto benign : benignStderr) {
        if (lower.find(benign) != string::npos) {
            return;
        }
    }
    bool all;
    function<void(const string&)> cb;
    {
        unique_lock<mutex> lock(mmutex);
        all = logall;
        cb = errcb;
    }
    if (all || lower.find("error") != string::npos ||
        lower.find("warning") != string::npos) {
        LOGERR(name << " stderr: " << line << endl);
    } else {
        LOGDEB0(name << " stderr: " << line << endl);
    }
    if (cb) {
        for (auto fatal : fatalStderr) {
            if (lower.find(fatal) != string::npos) {
                cb(line);
                break;
            }
        }
    }
}

// Read and dispatch the child's stderr until it closes it (normally
// when exiting), or we are told to stop.
void ExecCmd::Internal::stderrWorker()
{
    string line;
    char buf[1024];
    for (;;) {
        struct pollfd pfd;
        pfd.fd = pipeerr;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, 200);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            LOGSYSERR("ExecCmd::stderrWorker", "poll", name);
            break;
        }
        if (ret == 0) {
            if (stopping)
                break;
            continue;
        }
        ssize_t n = read(pipeerr, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN)
                continue;
            LOGSYSERR("ExecCmd::stderrWorker", "read", name);
            break;
        }
        if (n == 0) {
            break;
        }
        for (ssize_t i = 0; i < n; i++) {
            if (buf[i] == '\n' || buf[i] == '\r') {
                stderrLine(line);
                line.clear();
            } else if (line.size() < 4096) {
                line += buf[i];
            }
        }
    }
    stderrLine(line);
    LOGDEB1("ExecCmd::stderrWorker: " << name << " done\n");
}

bool ExecCmd::send(const char *data, size_t cnt, ExitSignal *sig)
{
    size_t done = 0;
    while (done < cnt) {
        int fd;
        {
            unique_lock<mutex> lock(m->mmutex);
            if (m->isterminated || m->inputclosed || m->pipein < 0) {
                return false;
            }
            fd = m->pipein;
            ssize_t n = write(fd, data + done, cnt - done);
            if (n > 0) {
                done += n;
                continue;
            }
            if (n < 0 && errno != EAGAIN && errno != EINTR) {
                m->reason = string("write: ") + strerror(errno);
                if (errno == EPIPE) {
                    LOGDEB("ExecCmd::send: " << m->name << ": broken pipe\n");
                } else {
                    LOGSYSERR("ExecCmd::send", "write", m->name);
                }
                m->inputclosed = true;
                Internal::closefd(m->pipein);
                return false;
            }
        }
        // Pipe full: wait until the child reads some
        struct pollfd pfds[2];
        pfds[0].fd = fd;
        pfds[0].events = POLLOUT;
        pfds[1].fd = sig ? sig->fd() : -1;
        pfds[1].events = POLLIN;
        int ret = poll(pfds, 2, 1000);
        if (ret < 0 && errno != EINTR) {
            LOGSYSERR("ExecCmd::send", "poll", m->name);
            return false;
        }
        if (sig && sig->isSet()) {
            return false;
        }
    }
    return true;
}

int ExecCmd::stdoutFd() const
{
    unique_lock<mutex> lock(m->mmutex);
    return m->pipeout;
}

pid_t ExecCmd::getChildPid() const
{
    unique_lock<mutex> lock(m->mmutex);
    return m->pid;
}

bool ExecCmd::Internal::reap_nolock(int *st)
{
    if (reaped) {
        *st = status;
        return true;
    }
    if (pid <= 0) {
        return false;
    }
    int ret = waitpid(pid, &status, WNOHANG);
    if (ret == 0) {
        return false;
    }
    if (ret < 0) {
        if (errno == EINTR) {
            return false;
        }
        LOGSYSERR("ExecCmd::maybereap", "waitpid", name);
        status = 255 << 8;
    }
    reaped = true;
    closefd(pipein);
    *st = status;
    LOGDEB("ExecCmd: " << name << " (pid " << pid << ") " <<
           ExecCmd::statusString(status) << endl);
    return true;
}

bool ExecCmd::maybereap(int *status)
{
    unique_lock<mutex> lock(m->mmutex);
    return m->reap_nolock(status);
}

void ExecCmd::terminate()
{
    unique_lock<mutex> lock(m->mmutex);
    if (m->isterminated) {
        return;
    }
    m->isterminated = true;
    Internal::closefd(m->pipein);
    if (m->pid > 0 && !m->reaped) {
        LOGDEB("ExecCmd::terminate: " << m->name << " pid " << m->pid << endl);
        ::kill(m->pid, SIGTERM);
    }
}

bool ExecCmd::terminated() const
{
    unique_lock<mutex> lock(m->mmutex);
    return m->isterminated;
}

void ExecCmd::kill()
{
    unique_lock<mutex> lock(m->mmutex);
    if (m->pid > 0 && !m->reaped) {
        LOGDEB("ExecCmd::kill: " << m->name << " pid " << m->pid << endl);
        ::kill(m->pid, SIGKILL);
    }
}

bool ExecCmd::which(const string& cmd, string& exepath, const char* path)
{
    if (cmd.empty())
        return false;
    if (cmd.find('/') != string::npos) {
        if (access(cmd.c_str(), X_OK) == 0) {
            exepath = cmd;
            return true;
        }
        return false;
    }

    const char *pp = path;
    if (nullptr == pp) {
        pp = getenv("PATH");
    }
    if (nullptr == pp)
        return false;

    string spp(pp);
    string::size_type start = 0;
    for (;;) {
        string::size_type colon = spp.find(':', start);
        string dir = spp.substr(start, colon == string::npos ?
                                string::npos : colon - start);
        if (dir.empty())
            dir = ".";
        string candidate = dir + "/" + cmd;
        struct stat st;
        if (access(candidate.c_str(), X_OK) == 0 &&
            stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
            exepath = candidate;
            return true;
        }
        if (colon == string::npos)
            break;
        start = colon + 1;
    }
    return false;
}

bool ExecCmd::unexpectedExit(int status)
{
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status) != 0;
    }
    if (WIFSIGNALED(status)) {
        return WTERMSIG(status) != SIGTERM && WTERMSIG(status) != SIGKILL;
    }
    return true;
}

string ExecCmd::statusString(int status)
{
    if (WIFEXITED(status)) {
        return string("exited with code ") + to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return string("killed by signal ") + to_string(WTERMSIG(status));
    }
    return string("status ") + to_string(status);
}
