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

#ifndef _TERMQUAY_GRAPH_ADAPTER_H_
#define _TERMQUAY_GRAPH_ADAPTER_H_

#include "termmodel/RDFGraph.h"
#include "Store.h"
#include "Salt.h"

namespace Termquay
{

class RDFTermFactory;

/**
 * \class GraphAdapter GraphAdapter.h <termquay/GraphAdapter.h>
 *
 * Conversion between native Stores and RDFGraphs.  There are two
 * strategies and the choice between them is always explicit:
 *
 * Wrapping (storeToGraph) returns a StoreGraph that shares the Store
 * and passes every read and write through to it.  This takes constant
 * time.
 *
 * Copying (graphToStore, copyStore) builds a new independent graph
 * containing a converted copy of every triple, in time proportional
 * to the size of the source.  Later changes to either side are not
 * seen by the other.  A conversion failure on any triple aborts the
 * copy.
 */
class GraphAdapter
{
public:
    /**
     * Wrap the given store in an RDFGraph, adapting its blank nodes
     * in a NEW session with a freshly generated Salt.  Wrapping the
     * same store twice therefore gives two graphs whose blank nodes
     * have different unique references.  Use the two-argument form to
     * wrap again within the same session.
     */
    static RDFGraphPtr storeToGraph(QSharedPointer<Store> store);

    /**
     * Wrap the given store in an RDFGraph, adapting its blank nodes
     * using the given Salt.
     */
    static RDFGraphPtr storeToGraph(QSharedPointer<Store> store,
                                    const Salt &salt);

    /**
     * Return a native Store with the contents of the given graph.  If
     * the graph wraps a Store, return that Store itself; otherwise
     * return a new BasicStore containing a copy of the graph.  Throw
     * RDFConversionException if the graph holds a triple that cannot
     * be stored natively.
     */
    static QSharedPointer<Store> graphToStore(RDFGraphPtr graph);

    /**
     * Copy the contents of the given store into a new graph created
     * by the given factory, converting every term through that
     * factory.
     */
    static RDFGraphPtr copyStore(RDFTermFactory &factory, const Store &store);
};

}

#endif
