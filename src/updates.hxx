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
#ifndef _UPDATES_H_X_INCLUDED_
#define _UPDATES_H_X_INCLUDED_

// Messages exchanged between the relay controller and the front-end

#include <atomic>
#include <string>

#include <json/json.h>

#include "bufxchange.h"

/// Event sent from the controller to the front-end.
struct UpdateEvent {
    enum Kind {
        // A metadata record from the server: record is set
        UPD_DATA,
        // Informational text
        UPD_STATUS,
        // State of the local AAC stream server
        UPD_STREAMSTATUS,
        // Tuned frequency: khz is set
        UPD_CURFREQ,
        // Error text
        UPD_ERROR,
        // The controller is done. Last event ever sent.
        UPD_CLOSED,
    };

    UpdateEvent(Kind k = UPD_STATUS)
        : kind(k) {}

    static UpdateEvent data(const Json::Value& rec) {
        UpdateEvent ev(UPD_DATA);
        ev.record = rec;
        return ev;
    }
    static UpdateEvent textEvent(Kind k, const std::string& txt) {
        UpdateEvent ev(k);
        ev.text = txt;
        return ev;
    }
    static UpdateEvent frequency(int khz) {
        UpdateEvent ev(UPD_CURFREQ);
        ev.khz = khz;
        return ev;
    }
    static const char *kindName(Kind k);

    Kind kind;
    Json::Value record;
    std::string text;
    int khz{0};
};

/**
 * Scalar member of a metadata record as a string. Missing members and
 * members which are objects or arrays give dflt. Never throws.
 */
extern std::string recordField(const Json::Value& rec, const char *name,
                               const std::string& dflt = std::string());

/// One line console rendition of a metadata record.
extern std::string recordSummary(const Json::Value& rec);

/// Command sent from the front-end to the controller.
struct TuneCommand {
    enum Kind {CMD_TUNE, CMD_STOP};

    static TuneCommand tune(int khz) {
        TuneCommand cmd;
        cmd.kind = CMD_TUNE;
        cmd.khz = khz;
        return cmd;
    }
    // Sentinel used to wake up the forwarder at shutdown
    static TuneCommand stop() {
        TuneCommand cmd;
        cmd.kind = CMD_STOP;
        return cmd;
    }

    Kind kind{CMD_TUNE};
    int khz{0};
};

/// Front-end to controller channel. Bounded, tryPut() never blocks.
typedef BufXChange<TuneCommand> CommandQueue;

/**
 * Controller to front-end channel.
 *
 * Producers never wait: if the queue is full, the event is dropped
 * and the drop is logged. The one exception is the closing event,
 * which evicts the oldest entry if needed, so that the consumer
 * always gets to see it. Text payloads are truncated to a maximum
 * length.
 */
class UpdateBus {
public:
    UpdateBus(size_t capacity = 500, size_t msgcap = 300);

    bool put(const UpdateEvent& ev);

    bool data(const Json::Value& record) {
        return put(UpdateEvent::data(record));
    }
    bool status(const std::string& txt) {
        return put(UpdateEvent::textEvent(UpdateEvent::UPD_STATUS, txt));
    }
    bool streamStatus(const std::string& txt) {
        return put(UpdateEvent::textEvent(UpdateEvent::UPD_STREAMSTATUS, txt));
    }
    bool error(const std::string& txt) {
        return put(UpdateEvent::textEvent(UpdateEvent::UPD_ERROR, txt));
    }
    bool currentFrequency(int khz) {
        return put(UpdateEvent::frequency(khz));
    }
    bool closed();

    /** Consumer side. @see BufXChange::take() */
    bool take(UpdateEvent *ev, int timeoutms = -1) {
        return m_queue.take(ev, timeoutms);
    }

    /** Count of events lost because the consumer was not keeping up */
    size_t drops() const {
        return m_drops;
    }

    size_t qsize() {
        return m_queue.qsize();
    }

private:
    BufXChange<UpdateEvent> m_queue;
    size_t m_msgcap;
    std::atomic<size_t> m_drops{0};
};

#endif /* _UPDATES_H_X_INCLUDED_ */
