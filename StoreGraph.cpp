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

#include "StoreGraph.h"
#include "TermAdapter.h"
#include "TripleAdapter.h"
#include "RDFException.h"

#include "Debug.h"

namespace Termquay
{

StoreGraph::StoreGraph(QSharedPointer<Store> store, const Salt &salt) :
    m_store(store),
    m_salt(salt)
{
    if (!m_store) throw RDFInvalidArgument("Null store cannot be wrapped");
}

Triple
StoreGraph::pattern(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const
{
    Triple t;
    if (s) t.a = TermAdapter::termToNode(s);
    if (p) t.b = TermAdapter::termToNode(p);
    if (o) t.c = TermAdapter::termToNode(o);
    return t;
}

RDFTriples
StoreGraph::adapt(const Triples &tt) const
{
    RDFTriples result;
    for (int i = 0; i < tt.size(); ++i) {
        result.push_back(TripleAdapter::tripleToRDFTriple(tt[i], m_salt));
    }
    return result;
}

bool
StoreGraph::add(RDFTriplePtr t)
{
    return m_store->add(TripleAdapter::rdfTripleToTriple(t));
}

bool
StoreGraph::add(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o)
{
    if (!s || !p || !o) {
        throw RDFInvalidArgument("Incomplete triple in add");
    }
    return m_store->add(pattern(s, p, o));
}

bool
StoreGraph::remove(RDFTriplePtr t)
{
    return m_store->remove(TripleAdapter::rdfTripleToTriple(t));
}

int
StoreGraph::remove(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o)
{
    Triple t = pattern(s, p, o);
    int n = m_store->match(t).size();
    DEBUG << "StoreGraph::remove: " << n << " triple(s) match " << t;
    if (n > 0) m_store->remove(t);
    return n;
}

bool
StoreGraph::contains(RDFTriplePtr t) const
{
    return m_store->contains(TripleAdapter::rdfTripleToTriple(t));
}

bool
StoreGraph::contains(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const
{
    if (s && p && o) return m_store->contains(pattern(s, p, o));
    Triple t = m_store->matchFirst(pattern(s, p, o));
    return t.a.type != Node::Nothing;
}

RDFTriples
StoreGraph::triples() const
{
    return adapt(m_store->match(Triple()));
}

RDFTriples
StoreGraph::triples(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const
{
    return adapt(m_store->match(pattern(s, p, o)));
}

int
StoreGraph::size() const
{
    return m_store->size();
}

void
StoreGraph::clear()
{
    m_store->clear();
}

}
