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

#ifndef _TERMQUAY_BASIC_STORE_H_
#define _TERMQUAY_BASIC_STORE_H_

#include "Store.h"

namespace Termquay
{

class StreamSink;

/**
 * \class BasicStore BasicStore.h <termquay/BasicStore.h>
 *
 * In-memory RDF data store implementing the Store interface,
 * providing add, remove and matching operations for RDF triples.
 * BasicStore uses the Redland librdf datastore internally.
 *
 * All operations are thread safe.
 */
class BasicStore : public Store
{
public:
    BasicStore();
    ~BasicStore();

    // Store interface

    bool add(Triple t);
    bool remove(Triple t);

    bool contains(Triple t) const;
    Triples match(Triple t) const;
    Triple matchFirst(Triple t) const;

    int size() const;
    void clear();

    Node addBlankNode();

    /**
     * Push the current contents of the store to the given sink, as a
     * stream of statements: start(), then one event per triple, then
     * finish().
     *
     * If graph is a Nothing node (the default), each triple is passed
     * to StreamSink::triple().  Otherwise each is passed to
     * StreamSink::quad() as a quad in the graph with that name.
     *
     * The contents are captured before the first event is sent, and
     * the store is not locked while the sink is being called, so the
     * sink may safely modify the store.
     */
    void streamTo(StreamSink &sink, Node graph = Node()) const;

private:
    BasicStore(const BasicStore &);
    BasicStore &operator=(const BasicStore &);

    class D;
    D *m_d;
};

}

#endif
