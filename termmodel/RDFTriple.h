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

#ifndef _TERMQUAY_RDF_TRIPLE_H_
#define _TERMQUAY_RDF_TRIPLE_H_

#include "RDFTerm.h"

namespace Termquay
{

class Triple;
class Quad;

/**
 * \class TripleLike RDFTriple.h <termquay/termmodel/RDFTriple.h>
 *
 * A statement of subject, predicate and object, with the term kind
 * permitted at each position given by the template arguments.
 *
 * TripleLike itself defines no equality or hash: only the strict
 * RDFTriple does.  The generalized form (GeneralizedTriple, below)
 * is a single-use view, typically of a native pattern, and cannot be
 * compared or used as a key.
 */
template <typename S, typename P, typename O>
class TripleLike
{
public:
    virtual ~TripleLike() { }

    virtual QSharedPointer<S> subject() const = 0;
    virtual QSharedPointer<P> predicate() const = 0;
    virtual QSharedPointer<O> object() const = 0;

    /**
     * If this statement is a view of a native Triple, return that
     * Triple; otherwise return 0.  The returned pointer is valid for
     * the lifetime of the statement.
     */
    virtual const Triple *nativeTriple() const { return 0; }
};

/**
 * \class QuadLike RDFTriple.h <termquay/termmodel/RDFTriple.h>
 *
 * A statement with a graph name.  A null graph name denotes the
 * default graph.
 */
template <typename G, typename S, typename P, typename O>
class QuadLike : public TripleLike<S, P, O>
{
public:
    virtual QSharedPointer<G> graphName() const = 0;

    /**
     * If this statement is a view of a native Quad, return that Quad;
     * otherwise return 0.
     */
    virtual const Quad *nativeQuad() const { return 0; }
};

/**
 * \class RDFTriple RDFTriple.h <termquay/termmodel/RDFTriple.h>
 *
 * An RDF triple: a BlankNode or IRI subject, an IRI predicate and
 * any term as object.  Two RDFTriples are equal if their three terms
 * are equal.
 */
class RDFTriple : public TripleLike<BlankNodeOrIRI, IRI, RDFTerm>
{
public:
    bool equals(const RDFTriple &other) const;
    unsigned int hash() const;

    /**
     * Return the N-Triples form of the statement, including the
     * terminating full stop.
     */
    QString toString() const;
};

/**
 * \class RDFQuad RDFTriple.h <termquay/termmodel/RDFTriple.h>
 *
 * An RDF quad: an RDFTriple with a BlankNode or IRI graph name, or a
 * null graph name for the default graph.
 */
class RDFQuad : public QuadLike<BlankNodeOrIRI, BlankNodeOrIRI, IRI, RDFTerm>
{
public:
    bool equals(const RDFQuad &other) const;
    unsigned int hash() const;

    /**
     * Return the N-Quads form of the statement, including the
     * terminating full stop.
     */
    QString toString() const;
};

/// A triple that may have any kind of term in any position.
typedef TripleLike<RDFTerm, RDFTerm, RDFTerm> GeneralizedTriple;

/// A quad that may have any kind of term in any position.
typedef QuadLike<RDFTerm, RDFTerm, RDFTerm, RDFTerm> GeneralizedQuad;

typedef QSharedPointer<RDFTriple> RDFTriplePtr;
typedef QSharedPointer<RDFQuad> RDFQuadPtr;
typedef QSharedPointer<GeneralizedTriple> GeneralizedTriplePtr;
typedef QSharedPointer<GeneralizedQuad> GeneralizedQuadPtr;

typedef QList<RDFTriplePtr> RDFTriples;

}

#endif
