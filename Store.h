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

#ifndef _TERMQUAY_STORE_H_
#define _TERMQUAY_STORE_H_

#include "Triple.h"

namespace Termquay
{

/**
 * \class Store Store.h <termquay/Store.h>
 *
 * Abstract interface for native RDF data stores.  This is the
 * mutable graph that the term model adapters wrap or copy.
 */
class Store
{
public:
    virtual ~Store() { }

    /**
     * Add a triple to the store.  Return false if the triple was
     * already in the store.  (Duplicate triples are not permitted in
     * a store.)  Throw RDFException if the triple can not be added
     * for some other reason, for example because it is incomplete.
     */
    virtual bool add(Triple t) = 0;

    /**
     * Remove a triple from the store.  If some nodes in the triple
     * are Nothing or Variable nodes, remove all matching triples.
     * Return false if no matching triple was found in the store.
     * Throw RDFException if removal failed for some other reason.
     */
    virtual bool remove(Triple t) = 0;

    /**
     * Return true if the store contains the given triple, false
     * otherwise.  Throw RDFException if the triple is not complete or
     * if the test failed for any other reason.
     */
    virtual bool contains(Triple t) const = 0;

    /**
     * Return all triples matching the given wildcard triple.  A node
     * of type Nothing or Variable in any part of the triple matches
     * any node in the data store, so match(Triple()) returns every
     * triple in the store.  Return an empty list if there are no
     * matches; may throw RDFException if matching fails in some other
     * way.
     */
    virtual Triples match(Triple t) const = 0;

    /**
     * Return the first triple to match the given wildcard triple.
     * Return an empty triple (three Nothing nodes) if there are no
     * matches.  May throw RDFException.
     */
    virtual Triple matchFirst(Triple t) const = 0;

    /**
     * Return the number of triples in the store.
     */
    virtual int size() const = 0;

    /**
     * Remove every triple from the store.
     */
    virtual void clear() = 0;

    /**
     * Create and return a new blank node.  This node can only be
     * referred to using the given Node object, and only during its
     * lifetime within this instance of the store.
     */
    virtual Node addBlankNode() = 0;
};

}

#endif
