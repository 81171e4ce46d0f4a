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

#include "GraphAdapter.h"
#include "StoreGraph.h"
#include "BasicStore.h"
#include "TripleAdapter.h"
#include "RDFException.h"

#include "termmodel/RDFTermFactory.h"

#include "Debug.h"

namespace Termquay
{

RDFGraphPtr
GraphAdapter::storeToGraph(QSharedPointer<Store> store)
{
    return storeToGraph(store, Salt::generate());
}

RDFGraphPtr
GraphAdapter::storeToGraph(QSharedPointer<Store> store, const Salt &salt)
{
    return RDFGraphPtr(new StoreGraph(store, salt));
}

QSharedPointer<Store>
GraphAdapter::graphToStore(RDFGraphPtr graph)
{
    if (!graph) throw RDFInvalidArgument("Null graph cannot be converted");

    QSharedPointer<Store> store = graph->nativeStore();
    if (store) {
        DEBUG << "GraphAdapter::graphToStore: graph wraps a store, returning it";
        return store;
    }

    RDFTriples tt = graph->triples();
    DEBUG << "GraphAdapter::graphToStore: copying " << tt.size()
          << " triple(s)";

    store = QSharedPointer<Store>(new BasicStore());
    for (int i = 0; i < tt.size(); ++i) {
        Triple t = TripleAdapter::rdfTripleToTriple(tt[i]);
        if (!t.a.isConcrete() || !t.b.isConcrete() || !t.c.isConcrete()) {
            throw RDFConversionException("Cannot store non-concrete triple",
                                         tt[i]->toString());
        }
        store->add(t);
    }
    return store;
}

RDFGraphPtr
GraphAdapter::copyStore(RDFTermFactory &factory, const Store &store)
{
    Triples tt = store.match(Triple());
    DEBUG << "GraphAdapter::copyStore: copying " << tt.size() << " triple(s)";

    RDFGraphPtr graph = factory.createGraph();
    for (int i = 0; i < tt.size(); ++i) {
        graph->add(TripleAdapter::tripleToRDFTriple(factory, tt[i]));
    }
    return graph;
}

}
