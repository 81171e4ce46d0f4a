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

#ifndef _TERMQUAY_NODE_TERM_FACTORY_H_
#define _TERMQUAY_NODE_TERM_FACTORY_H_

#include "termmodel/RDFTermFactory.h"
#include "StreamAdapter.h"
#include "Store.h"
#include "Salt.h"

namespace Termquay
{

/**
 * \class NodeTermFactory NodeTermFactory.h <termquay/NodeTermFactory.h>
 *
 * NodeTermFactory is an RDFTermFactory whose terms, statements and
 * graphs are all backed by native Nodes, Triples and Stores.  It is
 * also the main entry point for adapting existing native objects to
 * the term model, and back again.
 *
 * Each NodeTermFactory owns a Salt for its whole lifetime, which is
 * used for every blank node it creates or adapts.  A blank node label
 * adapted twice through the same factory therefore gives equal blank
 * nodes, while two factories (unless constructed with the same Salt)
 * never share blank nodes.
 *
 * The static functions do not use any factory's Salt.  wrapStore()
 * in particular starts a new session each time it is called.
 *
 * NodeTermFactory may be used from multiple threads: its only state
 * is the Salt, which never changes.
 */
class NodeTermFactory : public RDFTermFactory
{
public:
    /**
     * Create a factory with a newly generated Salt.
     */
    NodeTermFactory();

    /**
     * Create a factory using the given Salt, for example to continue
     * the blank node session of an earlier factory.
     */
    explicit NodeTermFactory(const Salt &salt);

    virtual ~NodeTermFactory();

    Salt getSalt() const { return m_salt; }

    // RDFTermFactory interface

    BlankNodePtr createBlankNode();
    BlankNodePtr createBlankNode(QString name);

    /**
     * Create a new empty graph, wrapping a new BasicStore.
     */
    RDFGraphPtr createGraph();

    IRIPtr createIRI(QString iri);
    LiteralPtr createLiteral(QString lexicalForm);
    LiteralPtr createLiteral(QString lexicalForm, IRIPtr datatype);
    LiteralPtr createLiteral(QString lexicalForm, QString languageTag);
    RDFTriplePtr createTriple(BlankNodeOrIRIPtr subject,
                              IRIPtr predicate,
                              RDFTermPtr object);
    RDFQuadPtr createQuad(BlankNodeOrIRIPtr graphName,
                          BlankNodeOrIRIPtr subject,
                          IRIPtr predicate,
                          RDFTermPtr object);

    /**
     * Create a generalized triple, which may have any term in any
     * position.  A null term is taken to be a wildcard.
     */
    GeneralizedTriplePtr createGeneralizedTriple(RDFTermPtr subject,
                                                 RDFTermPtr predicate,
                                                 RDFTermPtr object);

    // Adapting native objects, using this factory's Salt

    /**
     * Adapt a concrete native node.  Throw RDFConversionException if
     * the node is not concrete.
     */
    RDFTermPtr adaptNode(const Node &node) const;

    /**
     * Adapt a native triple.  Throw RDFConversionException if it is
     * not a complete RDF triple.
     */
    RDFTriplePtr adaptTriple(const Triple &triple) const;

    RDFQuadPtr adaptQuad(const Quad &quad) const;

    /**
     * Adapt a native triple that may contain any nodes, including
     * wildcards and variables.
     */
    GeneralizedTriplePtr adaptGeneralizedTriple(const Triple &triple) const;

    GeneralizedQuadPtr adaptGeneralizedQuad(const Quad &quad) const;

    /**
     * Wrap a native store as a graph, within this factory's session.
     */
    RDFGraphPtr adaptStore(QSharedPointer<Store> store) const;

    // Streaming

    /**
     * Return a new StreamSink that adapts each triple event it
     * receives, using this factory's Salt, and passes it on to the
     * given consumer.  The caller owns the returned object.
     */
    GeneralizedTripleStreamAdapter *streamToGeneralizedTriples
    (GeneralizedTripleConsumer &consumer) const;

    GeneralizedQuadStreamAdapter *streamToGeneralizedQuads
    (GeneralizedQuadConsumer &consumer) const;

    QuadStreamAdapter *streamToQuads(QuadConsumer &consumer) const;

    /**
     * Return a new StreamSink that converts each statement event to a
     * quad built by the given factory.  The caller owns the returned
     * object.
     */
    static QuadStreamAdapter *streamToQuads(RDFTermFactory &factory,
                                            QuadConsumer &consumer);

    // Session-independent conversions

    /**
     * Wrap a native store as a graph, in a new session with a freshly
     * generated Salt.
     */
    static RDFGraphPtr wrapStore(QSharedPointer<Store> store);

    static Node toNode(RDFTermPtr term);
    static Triple toTriple(RDFTriplePtr triple);
    static Quad toQuad(RDFQuadPtr quad);

    /**
     * Convert a generalized triple or quad to native form.  A null
     * term in any position becomes a Nothing node, and so does a
     * null graph name.
     */
    static Triple toGeneralizedTriple(GeneralizedTriplePtr triple);
    static Quad toGeneralizedQuad(GeneralizedQuadPtr quad);

    /**
     * Return a native store holding the given graph: the wrapped
     * store if the graph is a view of one, or a new copy otherwise.
     */
    static QSharedPointer<Store> toStore(RDFGraphPtr graph);

    // Conversion into the term model of some other factory

    static RDFTermPtr convertNode(RDFTermFactory &factory, const Node &node);
    static RDFTriplePtr convertTriple(RDFTermFactory &factory,
                                      const Triple &triple);
    static RDFQuadPtr convertQuad(RDFTermFactory &factory, const Quad &quad);

    /**
     * Copy the contents of a native store into a new graph created
     * by the given factory.
     */
    static RDFGraphPtr convertStore(RDFTermFactory &factory,
                                    const Store &store);

private:
    Salt m_salt;
};

}

#endif
