/* -*- c-basic-offset: 4 indent-tabs-mode: nil -*-  vi:set ts=8 sts=4 sw=4: */

/*
    Termquay

    A C++/Qt library for adapting Redland RDF stores to an RDF term model.
    Copyright 2009-2016 Chris Cannam.
  
    Permission is hereby granted, free of charge, to any person
    obtaining a copy of this software and associated documentation
    files (the "Software"), to deal in the Software without
    restriction, including without limitation the rights to use, copy,
    modify, merge, publish, distribute, sublicense, and/or sell copies
    of the Software, and to permit persons to whom the Software is
    furnished to do so, subject to the following conditions:

    The above copyright notice and this permission notice shall be
    included in all copies or substantial portions of the Software.

    THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
    EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
    MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
    NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS BE LIABLE FOR
    ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF
    CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
    WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

    Except as contained in this notice, the name of Chris Cannam
    shall not be used in advertising or otherwise to promote the sale,
    use or other dealings in this Software without prior written
    authorization.
*/

#ifndef _TERMQUAY_STREAM_SINK_H_
#define _TERMQUAY_STREAM_SINK_H_

#include "Quad.h"

namespace Termquay
{

/**
 * \class StreamSink StreamSink.h <termquay/StreamSink.h>
 *
 * Receiver for a push-based stream of native RDF statements.  The
 * producer (for example BasicStore::streamTo) calls start() once, then
 * triple() or quad() once per statement in the stream, then
 * finish().  Prefix and base declarations may be passed along too
 * where the producer knows them.
 *
 * All methods do nothing by default; subclasses override those they
 * are interested in.  Exceptions thrown from a callback propagate to
 * the producer and end the stream.
 */
class StreamSink
{
public:
    virtual ~StreamSink() { }

    virtual void start() { }
    virtual void triple(const Triple &) { }
    virtual void quad(const Quad &) { }
    virtual void base(QString) { }
    virtual void prefix(QString, QString) { }
    virtual void finish() { }
};

}

#endif
