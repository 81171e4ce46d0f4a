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

#ifndef _TERMQUAY_STREAM_ADAPTER_H_
#define _TERMQUAY_STREAM_ADAPTER_H_

#include "StreamSink.h"
#include "Salt.h"

#include "termmodel/RDFTriple.h"

namespace Termquay
{

class RDFTermFactory;

/**
 * \class QuadConsumer StreamAdapter.h <termquay/StreamAdapter.h>
 *
 * Receiver for the strict quads produced by a QuadStreamAdapter.
 */
class QuadConsumer
{
public:
    virtual ~QuadConsumer() { }
    virtual void accept(RDFQuadPtr quad) = 0;
};

class GeneralizedTripleConsumer
{
public:
    virtual ~GeneralizedTripleConsumer() { }
    virtual void accept(GeneralizedTriplePtr triple) = 0;
};

class GeneralizedQuadConsumer
{
public:
    virtual ~GeneralizedQuadConsumer() { }
    virtual void accept(GeneralizedQuadPtr quad) = 0;
};

/**
 * \class QuadStreamAdapter StreamAdapter.h <termquay/StreamAdapter.h>
 *
 * A StreamSink that converts each native statement it receives into
 * an RDFQuad and passes it to a QuadConsumer.  Quad events keep their
 * graph name; triple events become quads in the default graph.
 *
 * The conversion is strict: a statement that is not a complete RDF
 * statement causes an RDFConversionException to be thrown from the
 * event callback, ending the stream.
 *
 * The consumer must outlive the adapter.
 */
class QuadStreamAdapter : public StreamSink
{
public:
    /**
     * Construct an adapter that converts blank nodes using the given
     * Salt.  A blank node label that recurs within the stream is
     * given the same unique reference each time it appears.
     */
    QuadStreamAdapter(const Salt &salt, QuadConsumer &consumer);

    /**
     * Construct an adapter that builds its quads using the given
     * factory, which must outlive the adapter.
     */
    QuadStreamAdapter(RDFTermFactory &factory, QuadConsumer &consumer);

    ~QuadStreamAdapter();

    void triple(const Triple &t);
    void quad(const Quad &q);

    /**
     * Return the number of quads passed to the consumer so far.
     */
    int getCount() const { return m_count; }

private:
    QuadStreamAdapter(const QuadStreamAdapter &);
    QuadStreamAdapter &operator=(const QuadStreamAdapter &);

    RDFQuadPtr convert(const Quad &q) const;

    // exactly one of these is set
    RDFTermFactory *m_factory;
    Salt *m_salt;

    QuadConsumer &m_consumer;
    int m_count;
};

/**
 * \class GeneralizedTripleStreamAdapter StreamAdapter.h <termquay/StreamAdapter.h>
 *
 * A StreamSink that converts each native triple event into a
 * GeneralizedTriple and passes it to a GeneralizedTripleConsumer.
 * Quad events are ignored.  Never throws on wildcard or variable
 * nodes.
 */
class GeneralizedTripleStreamAdapter : public StreamSink
{
public:
    GeneralizedTripleStreamAdapter(const Salt &salt,
                                   GeneralizedTripleConsumer &consumer);

    void triple(const Triple &t);

    int getCount() const { return m_count; }

private:
    Salt m_salt;
    GeneralizedTripleConsumer &m_consumer;
    int m_count;
};

/**
 * \class GeneralizedQuadStreamAdapter StreamAdapter.h <termquay/StreamAdapter.h>
 *
 * A StreamSink that converts each native quad event into a
 * GeneralizedQuad and passes it to a GeneralizedQuadConsumer.  Triple
 * events are ignored.
 */
class GeneralizedQuadStreamAdapter : public StreamSink
{
public:
    GeneralizedQuadStreamAdapter(const Salt &salt,
                                 GeneralizedQuadConsumer &consumer);

    void quad(const Quad &q);

    int getCount() const { return m_count; }

private:
    Salt m_salt;
    GeneralizedQuadConsumer &m_consumer;
    int m_count;
};

}

#endif
