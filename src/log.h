/* Copyright (C) 2014-2018 J.F.Dockes
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
#ifndef _LOG_H_INCLUDED_
#define _LOG_H_INCLUDED_

#include <errno.h>
#include <string.h>

#include <fstream>
#include <iostream>
#include <string>
#include <mutex>

/**
 * Process-wide logger. Messages go to stderr unless a file name was
 * set. All output is serialized by the logger mutex, so the macros
 * can be used from any thread.
 */
class Logger {
public:
    /** Initialize logging to file name. Use "stderr" for stderr
       output. Creates the singleton if necessary. */
    static Logger *getTheLog(const std::string& fn = std::string());

    bool reopen(const std::string& fn);

    std::ostream& getstream() {
        return m_tocerr ? std::cerr : m_stream;
    }

    enum LogLevel {LLNON=0, LLFAT=1, LLERR=2, LLINF=3, LLDEB=4,
                   LLDEB0=5, LLDEB1=6, LLDEB2=7};

    void setLogLevel(LogLevel level) {
        m_loglevel = level;
    }
    int getloglevel() const {
        return m_loglevel;
    }
    bool logisstderr() const {
        return m_tocerr;
    }
    const std::string& getfilename() const {
        return m_fn;
    }
    std::recursive_mutex& getmutex() {
        return m_mutex;
    }

private:
    bool m_tocerr{false};
    int m_loglevel{LLERR};
    std::string m_fn;
    std::ofstream m_stream;
    std::recursive_mutex m_mutex;

    Logger(const std::string& fn);
    Logger(const Logger &);
    Logger& operator=(const Logger &);
};

#define LOGGER_PRT (Logger::getTheLog()->getstream())
#define LOGGER_LOCK \
    std::unique_lock<std::recursive_mutex> lock(Logger::getTheLog()->getmutex())
#define LOGGER_LEVEL (Logger::getTheLog()->getloglevel())

#define LOGGER_DOLOG(L,X) {                                             \
        if (LOGGER_LEVEL >= L) {                                        \
            LOGGER_LOCK;                                                \
            LOGGER_PRT << ":" << L << ":" << __FILE__ << ":" <<         \
                __LINE__ << "::" << X;                                  \
            LOGGER_PRT.flush();                                         \
        }                                                               \
    }

#define LOGDEB2(X) LOGGER_DOLOG(Logger::LLDEB2, X)
#define LOGDEB1(X) LOGGER_DOLOG(Logger::LLDEB1, X)
#define LOGDEB0(X) LOGGER_DOLOG(Logger::LLDEB0, X)
#define LOGDEB(X) LOGGER_DOLOG(Logger::LLDEB, X)
#define LOGINF(X) LOGGER_DOLOG(Logger::LLINF, X)
#define LOGINFO LOGINF
#define LOGERR(X) LOGGER_DOLOG(Logger::LLERR, X)
#define LOGFAT(X) LOGGER_DOLOG(Logger::LLFAT, X)

#define LOGSYSERR(who, call, spar)                                      \
    LOGERR((who) << ": "  << (call) << "("  << (spar) << ") errno " <<  \
           (errno) << " ("  << (strerror(errno)) << ")\n")

#endif /* _LOG_H_INCLUDED_ */
