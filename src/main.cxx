/* Copyright (C) 2024 J.F.Dockes
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
/////////////////////////////////////////////////////////////////////
// Main program: command line, configuration, and a line-mode console
// front-end for the relay controller.

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include <json/json.h>

#include "conftree.h"
#include "controller.hxx"
#include "fmdxutils.hxx"
#include "log.h"
#include "session.hxx"
#include "updates.hxx"

using namespace std;

#ifndef FMDXRELAY_VERSION
#define FMDXRELAY_VERSION "unknown"
#endif

static char *thisprog;

static int op_flags;
#define OPT_MOINS 0x1
#define OPT_b     0x2
#define OPT_c     0x4
#define OPT_d     0x8
#define OPT_l     0x10
#define OPT_p     0x20
#define OPT_r     0x40
#define OPT_s     0x80
#define OPT_v     0x100

static char usage [] =
" -c configfile \t configuration file to use\n"
" -d logfilename\t debug messages to\n"
" -l loglevel\t  log level (0-7)\n"
" -s         \t serve the AAC stream on the local network\n"
" -p port    \t port for the AAC stream (default 8080)\n"
" -r         \t restream only: no local playback, implies -s\n"
" -b bitrate \t AAC bitrate (e.g. 96k)\n"
" -v         \tprint version info\n"
"server_address: host[:port] or http(s)://host[:port]\n"
"\n"
"Console commands: <MHz> tune, + / - step 100 kHz, q quit\n"
;

static void
versionInfo(FILE *fp)
{
    fprintf(fp, "fmdxrelay %s\n", FMDXRELAY_VERSION);
}

static void
Usage(FILE *fp = stderr)
{
    fprintf(fp, "%s: usage: %s [options] server_address\n%s",
            thisprog, thisprog, usage);
    versionInfo(fp);
    exit(1);
}

string g_configfilename;
ConfSimple *g_config;

static volatile sig_atomic_t gotsig;
static void onsig(int)
{
    gotsig = 1;
}

static const int catchedSigs[] = {SIGINT, SIGQUIT, SIGTERM};
static void setupsigs()
{
    struct sigaction action;
    action.sa_handler = onsig;
    action.sa_flags = 0;
    sigemptyset(&action.sa_mask);
    for (unsigned int i = 0; i < sizeof(catchedSigs) / sizeof(int); i++)
        if (signal(catchedSigs[i], SIG_IGN) != SIG_IGN) {
            if (sigaction(catchedSigs[i], &action, 0) < 0) {
                perror("Sigaction failed");
            }
        }
}

// Last frequency reported by the controller, for +/- stepping
static std::atomic<int> curkhz{0};
static std::atomic<bool> quitrequested{false};
static std::atomic<bool> consoledone{false};

static void printUpdate(const UpdateEvent& ev)
{
    switch (ev.kind) {
    case UpdateEvent::UPD_DATA:
        cout << recordSummary(ev.record) << endl;
        break;
    case UpdateEvent::UPD_CURFREQ:
        curkhz = ev.khz;
        cout << "Frequency: " << khzToMHzString(ev.khz) << " MHz" << endl;
        break;
    case UpdateEvent::UPD_STATUS:
        cout << ev.text << endl;
        break;
    case UpdateEvent::UPD_STREAMSTATUS:
        cout << ev.text << endl;
        break;
    case UpdateEvent::UPD_ERROR:
        cout << "Error: " << ev.text << endl;
        break;
    case UpdateEvent::UPD_CLOSED:
        cout << "Closed." << endl;
        break;
    }
}

// Handle one console line. Returns false for quit.
static bool consoleCommand(string line, CommandQueue& commands)
{
    trimstring(line);
    if (line.empty()) {
        return true;
    }
    if (line == "q" || line == "quit") {
        return false;
    }
    int khz;
    if (line == "+" || line == "-") {
        if (curkhz == 0) {
            cout << "Current frequency unknown" << endl;
            return true;
        }
        khz = clampKhz(curkhz + (line == "+" ? FREQ_STEP_KHZ : -FREQ_STEP_KHZ));
    } else if (!mhzToKhz(line, &khz)) {
        cout << "Invalid frequency: " << line << " (87.5-108.0 MHz)" << endl;
        return true;
    }
    if (!commands.tryPut(TuneCommand::tune(khz))) {
        LOGERR("console: command queue full, dropping tune to " << khz << endl);
        cout << "Busy, command dropped" << endl;
    }
    return true;
}

static void consoleInput(CommandQueue *commands)
{
    string acc;
    while (!consoledone) {
        struct pollfd pfd;
        pfd.fd = 0;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, 200);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            LOGSYSERR("consoleInput", "poll", 0);
            break;
        }
        if (ret == 0)
            continue;
        char buf[256];
        ssize_t cnt = read(0, buf, sizeof(buf));
        if (cnt <= 0) {
            // No console input (e.g. running detached). Keep running.
            LOGDEB("consoleInput: stdin closed\n");
            break;
        }
        acc.append(buf, cnt);
        string::size_type pos;
        while ((pos = acc.find('\n')) != string::npos) {
            string line = acc.substr(0, pos);
            acc.erase(0, pos + 1);
            if (!consoleCommand(line, *commands)) {
                quitrequested = true;
                return;
            }
        }
    }
}

static void getIntSecs(const char *name, int *msp)
{
    string value;
    if (g_config->get(name, value)) {
        *msp = atoi(value.c_str()) * 1000;
    }
}

int main(int argc, char *argv[])
{
    string logfilename;
    int loglevel(Logger::LLINF);
    string server;
    int streamport = -1;
    string bitrate;

    const char *cp;
    if ((cp = getenv("FMDX_CONFIG")))
        g_configfilename = cp;
    if ((cp = getenv("FMDX_SERVER")))
        server = cp;
    if ((cp = getenv("FMDX_STREAMPORT")))
        streamport = atoi(cp);

    thisprog = argv[0];
    argc--; argv++;
    while (argc > 0 && **argv == '-') {
        (*argv)++;
        if (!(**argv))
            Usage();
        while (**argv)
            switch (*(*argv)++) {
            case 'b':   op_flags |= OPT_b; if (argc < 2)  Usage();
                bitrate = *(++argv); argc--; goto b1;
            case 'c':   op_flags |= OPT_c; if (argc < 2)  Usage();
                g_configfilename = *(++argv); argc--; goto b1;
            case 'd':   op_flags |= OPT_d; if (argc < 2)  Usage();
                logfilename = *(++argv); argc--; goto b1;
            case 'l':   op_flags |= OPT_l; if (argc < 2)  Usage();
                loglevel = atoi(*(++argv)); argc--; goto b1;
            case 'p':   op_flags |= OPT_p; if (argc < 2)  Usage();
                streamport = atoi(*(++argv)); argc--; goto b1;
            case 'r':   op_flags |= OPT_r | OPT_s; break;
            case 's':   op_flags |= OPT_s; break;
            case 'v':   versionInfo(stdout); return 0;
            default: Usage();   break;
            }
    b1: argc--; argv++;
    }

    if (argc > 1) {
        Usage();
    }
    if (argc == 1) {
        server = *argv++; argc--;
    }

    RelayOptions opts;
    size_t updqueuesize = 500;
    size_t cmdqueuesize = 50;
    if (!g_configfilename.empty()) {
        g_config = new ConfSimple(g_configfilename, true);
        if (!g_config || !g_config->ok()) {
            cerr << "Could not open config: " << g_configfilename << endl;
            return 1;
        }
    } else {
        // No config file. Create an empty config anyway
        g_config = new ConfSimple(string(), true);
    }

    string value;
    if (!(op_flags & OPT_d))
        g_config->get("logfilename", logfilename);
    if (!(op_flags & OPT_l) && g_config->get("loglevel", value))
        loglevel = atoi(value.c_str());
    if (server.empty())
        g_config->get("server", server);
    if (!(op_flags & OPT_s))
        opts.streaming = confBool(*g_config, "stream", false);
    else
        opts.streaming = true;
    if (op_flags & OPT_r)
        opts.restreamonly = true;
    else
        opts.restreamonly = confBool(*g_config, "restreamonly", false);
    if (streamport < 0)
        streamport = confInt(*g_config, "streamport", opts.streamport);
    opts.streamport = streamport;
    g_config->get("streampath", opts.streampath);
    if (opts.streampath.empty() || opts.streampath[0] != '/')
        opts.streampath = string("/") + opts.streampath;
    if (!(op_flags & OPT_b))
        g_config->get("aacbitrate", bitrate);
    if (!bitrate.empty())
        opts.aacbitrate = bitrate;
    if (g_config->get("playercmd", value)) {
        vector<string> cmd;
        stringToStrings(value, cmd);
        if (!cmd.empty())
            opts.playercmd = cmd;
    }
    if (g_config->get("transcodercmd", value)) {
        vector<string> cmd;
        stringToStrings(value, cmd);
        if (!cmd.empty())
            opts.transcodercmd = cmd;
    }
    getIntSecs("reconnectdelay", &opts.reconnectdelayms);
    getIntSecs("audiorecvtimeout", &opts.audiorecvtimeoutms);
    getIntSecs("clienttimeout", &opts.clienttimeoutms);
    int sinksize = confInt(*g_config, "sinksize", int(opts.sinksize));
    if (sinksize > 0)
        opts.sinksize = sinksize;
    int qs = confInt(*g_config, "updqueuesize", int(updqueuesize));
    if (qs > 0)
        updqueuesize = qs;
    qs = confInt(*g_config, "cmdqueuesize", int(cmdqueuesize));
    if (qs > 0)
        cmdqueuesize = qs;

    if (streamport <= 0 || streamport > 65535) {
        cerr << "Bad stream port " << streamport << endl;
        Usage();
    }
    if (server.empty()) {
        cerr << "No server address given" << endl;
        Usage();
    }
    if (!buildWsUris(server, opts.audiouri, opts.texturi)) {
        cerr << "Bad server address: " << server << endl;
        return 1;
    }

    if (Logger::getTheLog(logfilename) == 0) {
        cerr << "Can't initialize log" << endl;
        return 1;
    }
    Logger::getTheLog("")->reopen(logfilename);
    Logger::getTheLog("")->setLogLevel(Logger::LogLevel(loglevel));

    setupsigs();

    UpdateBus updates(updqueuesize);
    CommandQueue commands("commands", cmdqueuesize);
    Controller controller(opts, updates, commands);

    cout << "Connecting to " << server << (opts.restreamonly ?
                                          " (restream only)" : "") << endl;
    if (!controller.start()) {
        return 1;
    }
    thread input(consoleInput, &commands);

    bool stopping = false;
    for (;;) {
        if (!stopping && (gotsig || quitrequested)) {
            LOGINF("fmdxrelay: stopping\n");
            stopping = true;
            // Closed is queued before stop() returns.
            controller.stop();
        }
        UpdateEvent ev;
        if (!updates.take(&ev, 200)) {
            continue;
        }
        printUpdate(ev);
        if (ev.kind == UpdateEvent::UPD_CLOSED) {
            break;
        }
    }
    controller.stop();
    consoledone = true;
    input.join();
    if (updates.drops()) {
        LOGINF("fmdxrelay: " << updates.drops() << " updates dropped\n");
    }
    return 0;
}
