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

#ifndef _TERMQUAY_RDF_GRAPH_H_
#define _TERMQUAY_RDF_GRAPH_H_

#include "RDFTriple.h"

namespace Termquay
{

class Store;

/**
 * \class RDFGraph RDFGraph.h <termquay/termmodel/RDFGraph.h>
 *
 * A mutable set of RDFTriples.
 *
 * In the pattern methods (the remove, contains and triples overloads
 * that take three terms) a null term matches any term.
 */
class RDFGraph
{
public:
    virtual ~RDFGraph() { }

    /**
     * Add a triple to the graph.  Return false if it was already
     * present.
     */
    virtual bool add(RDFTriplePtr t) = 0;

    /**
     * Add the triple with the given terms to the graph.  None of the
     * terms may be null.  Return false if it was already present.
     */
    virtual bool add(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) = 0;

    /**
     * Remove a triple from the graph.  Return false if it was not
     * present.
     */
    virtual bool remove(RDFTriplePtr t) = 0;

    /**
     * Remove all triples matching the given pattern, and return the
     * number removed.
     */
    virtual int remove(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) = 0;

    virtual bool contains(RDFTriplePtr t) const = 0;
    virtual bool contains(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const = 0;

    /**
     * Return all triples in the graph.
     */
    virtual RDFTriples triples() const = 0;

    /**
     * Return all triples in the graph matching the given pattern.
     */
    virtual RDFTriples triples(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const = 0;

    virtual int size() const = 0;

    virtual void clear() = 0;

    /**
     * If this graph is a view of a native Store, return that Store;
     * otherwise return a null pointer.
     */
    virtual QSharedPointer<Store> nativeStore() const {
        return QSharedPointer<Store>();
    }
};

typedef QSharedPointer<RDFGraph> RDFGraphPtr;

}

#endif
