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

#include "updates.hxx"

#include "fmdxutils.hxx"
#include "log.h"

using namespace std;

const char *UpdateEvent::kindName(Kind k)
{
    switch (k) {
    case UPD_DATA: return "data";
    case UPD_STATUS: return "status";
    case UPD_STREAMSTATUS: return "stream_status";
    case UPD_CURFREQ: return "current_freq";
    case UPD_ERROR: return "error";
    case UPD_CLOSED: return "closed";
    }
    return "unknown";
}

string recordField(const Json::Value& rec, const char *name,
                   const string& dflt)
{
    if (!rec.isObject() || !rec.isMember(name)) {
        return dflt;
    }
    const Json::Value& val = rec[name];
    if (val.isNull() || !val.isConvertibleTo(Json::stringValue)) {
        return dflt;
    }
    return val.asString();
}

string recordSummary(const Json::Value& rec)
{
    string ps = recordField(rec, "ps");
    string rt0 = recordField(rec, "rt0");
    string rt1 = recordField(rec, "rt1");
    trimstring(ps);
    trimstring(rt0);
    trimstring(rt1);
    string out = "[" + recordField(rec, "freq") + "] PI " +
        recordField(rec, "pi", "----") + " PS '" + ps + "'";
    if (!rt0.empty())
        out += " RT0 '" + rt0 + "'";
    if (!rt1.empty())
        out += " RT1 '" + rt1 + "'";
    out += " users " + recordField(rec, "users", "N/A");
    return out;
}

UpdateBus::UpdateBus(size_t capacity, size_t msgcap)
    : m_queue("updates", capacity), m_msgcap(msgcap)
{
}

bool UpdateBus::put(const UpdateEvent& _ev)
{
    const UpdateEvent *evp = &_ev;
    UpdateEvent truncated;
    if (m_msgcap > 0 && _ev.text.size() > m_msgcap) {
        truncated = _ev;
        truncated.text = truncateText(_ev.text, m_msgcap);
        evp = &truncated;
    }
    LOGDEB1("UpdateBus::put: " << UpdateEvent::kindName(evp->kind) << " [" <<
            evp->text << "]\n");
    if (!m_queue.tryPut(*evp)) {
        m_drops++;
        LOGERR("UpdateBus: queue full, dropping " <<
               UpdateEvent::kindName(evp->kind) << " event [" <<
               evp->text << "]\n");
        return false;
    }
    return true;
}

bool UpdateBus::closed()
{
    size_t evicted = 0;
    bool ret = m_queue.putEvictOldest(UpdateEvent(UpdateEvent::UPD_CLOSED),
                                      &evicted);
    if (evicted) {
        m_drops += evicted;
        LOGERR("UpdateBus: queue full, dropped " << evicted <<
               " events to make room for the closing event\n");
    }
    return ret;
}
