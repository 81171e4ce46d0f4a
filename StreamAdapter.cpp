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

#include "StreamAdapter.h"
#include "TripleAdapter.h"

#include "termmodel/RDFTermFactory.h"

namespace Termquay
{

QuadStreamAdapter::QuadStreamAdapter(const Salt &salt, QuadConsumer &consumer) :
    m_factory(0),
    m_salt(new Salt(salt)),
    m_consumer(consumer),
    m_count(0)
{
}

QuadStreamAdapter::QuadStreamAdapter(RDFTermFactory &factory,
                                     QuadConsumer &consumer) :
    m_factory(&factory),
    m_salt(0),
    m_consumer(consumer),
    m_count(0)
{
}

QuadStreamAdapter::~QuadStreamAdapter()
{
    delete m_salt;
}

RDFQuadPtr
QuadStreamAdapter::convert(const Quad &q) const
{
    if (m_factory) return TripleAdapter::quadToRDFQuad(*m_factory, q);
    else return TripleAdapter::quadToRDFQuad(q, *m_salt);
}

void
QuadStreamAdapter::triple(const Triple &t)
{
    m_consumer.accept(convert(Quad(Node(), t)));
    ++m_count;
}

void
QuadStreamAdapter::quad(const Quad &q)
{
    m_consumer.accept(convert(q));
    ++m_count;
}

GeneralizedTripleStreamAdapter::GeneralizedTripleStreamAdapter
(const Salt &salt, GeneralizedTripleConsumer &consumer) :
    m_salt(salt),
    m_consumer(consumer),
    m_count(0)
{
}

void
GeneralizedTripleStreamAdapter::triple(const Triple &t)
{
    m_consumer.accept(TripleAdapter::tripleToGeneralizedTriple(t, m_salt));
    ++m_count;
}

GeneralizedQuadStreamAdapter::GeneralizedQuadStreamAdapter
(const Salt &salt, GeneralizedQuadConsumer &consumer) :
    m_salt(salt),
    m_consumer(consumer),
    m_count(0)
{
}

void
GeneralizedQuadStreamAdapter::quad(const Quad &q)
{
    m_consumer.accept(TripleAdapter::quadToGeneralizedQuad(q, m_salt));
    ++m_count;
}

}
