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

#ifndef _TERMQUAY_STORE_GRAPH_H_
#define _TERMQUAY_STORE_GRAPH_H_

#include "termmodel/RDFGraph.h"
#include "Store.h"
#include "Salt.h"

namespace Termquay
{

/**
 * \class StoreGraph StoreGraph.h <termquay/StoreGraph.h>
 *
 * An RDFGraph that wraps a native Store.  Nothing is copied: every
 * read queries the store and adapts the results as they are
 * returned, and every write is passed straight through to the
 * store.  Changes made to the store directly are therefore visible
 * through the graph, and vice versa.
 *
 * Blank nodes read from the store are adapted using the Salt given
 * on construction.
 *
 * StoreGraph adds no locking of its own; it is as thread safe as the
 * Store it wraps.
 */
class StoreGraph : public RDFGraph
{
public:
    StoreGraph(QSharedPointer<Store> store, const Salt &salt);

    bool add(RDFTriplePtr t);
    bool add(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o);
    bool remove(RDFTriplePtr t);
    int remove(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o);
    bool contains(RDFTriplePtr t) const;
    bool contains(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const;
    RDFTriples triples() const;
    RDFTriples triples(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const;
    int size() const;
    void clear();

    QSharedPointer<Store> nativeStore() const { return m_store; }

    Salt getSalt() const { return m_salt; }

private:
    Triple pattern(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const;
    RDFTriples adapt(const Triples &tt) const;

    QSharedPointer<Store> m_store;
    Salt m_salt;
};

}

#endif
