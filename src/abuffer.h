/* Copyright (C) 2017-2018 J.F.Dockes
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
#ifndef _ABUFFER_H_INCLUDED_
#define _ABUFFER_H_INCLUDED_

#include <stdlib.h>
#include <string.h>

#include <memory>

/// Data buffer used for audio chunk exchanges between threads.
///
/// The producer allocates a buffer, copies data to it, setting the
/// 'bytes' value, then passes it on. From this point the buffer is
/// read-only: the same buffer is shared by all the consumers through
/// an ABufferP, and each consumer keeps track of its own offset.
///
/// A buffer with bytes == 0 signals the end of the stream.
struct ABuffer {
    ABuffer(size_t bufsize)
        : buf((char*)malloc(bufsize ? bufsize : 1)), allocbytes(bufsize),
          bytes(0) { }

    ABuffer(const char *data, size_t cnt)
        : buf((char*)malloc(cnt ? cnt : 1)), allocbytes(cnt), bytes(0) {
        if (buf && cnt) {
            memcpy(buf, data, cnt);
            bytes = cnt;
        }
    }

    ~ABuffer() {
        if (buf)
            free(buf);
    }

    bool eos() const {
        return bytes == 0;
    }

    char *buf;
    size_t allocbytes; // buffer size
    size_t bytes; // Useful bytes, set by producer.

private:
    ABuffer(const ABuffer&);
    ABuffer& operator=(const ABuffer&);
};

typedef std::shared_ptr<ABuffer> ABufferP;

/// The end of stream marker
inline ABufferP eosABuffer()
{
    return ABufferP(new ABuffer(size_t(0)));
}

#endif /* _ABUFFER_H_INCLUDED_ */
