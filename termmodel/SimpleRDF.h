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

#ifndef _TERMQUAY_SIMPLE_RDF_H_
#define _TERMQUAY_SIMPLE_RDF_H_

#include "RDFTermFactory.h"
#include "../Salt.h"

#include <QMap>

namespace Termquay
{

/**
 * \class SimpleRDFTermFactory SimpleRDF.h <termquay/termmodel/SimpleRDF.h>
 *
 * A self-contained implementation of the term model with no native
 * store behind it.  Terms hold their values directly and graphs are
 * kept in a map.
 *
 * This is useful as the target of a copy from a native Store (see
 * GraphAdapter::copyStore) and as a source of foreign terms, that is,
 * terms with no native node behind them.
 */
class SimpleRDFTermFactory : public RDFTermFactory
{
public:
    SimpleRDFTermFactory();
    explicit SimpleRDFTermFactory(const Salt &salt);

    Salt getSalt() const { return m_salt; }

    BlankNodePtr createBlankNode();
    BlankNodePtr createBlankNode(QString name);
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

private:
    Salt m_salt;
};

class SimpleIRI : public IRI
{
public:
    SimpleIRI(QString iri) : m_iri(iri) { }
    QString iriString() const { return m_iri; }

private:
    QString m_iri;
};

class SimpleBlankNode : public BlankNode
{
public:
    SimpleBlankNode(QString name, const Salt &salt);
    QString uniqueReference() const { return m_ref; }

private:
    QString m_ref;
};

class SimpleLiteral : public Literal
{
public:
    SimpleLiteral(QString lexicalForm, IRIPtr datatype, QString languageTag);

    QString lexicalForm() const { return m_lexical; }
    IRIPtr datatype() const { return m_datatype; }
    QString languageTag() const { return m_language; }

private:
    QString m_lexical;
    IRIPtr m_datatype;
    QString m_language;
};

class SimpleTriple : public RDFTriple
{
public:
    SimpleTriple(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) :
        m_s(s), m_p(p), m_o(o) { }

    BlankNodeOrIRIPtr subject() const { return m_s; }
    IRIPtr predicate() const { return m_p; }
    RDFTermPtr object() const { return m_o; }

private:
    BlankNodeOrIRIPtr m_s;
    IRIPtr m_p;
    RDFTermPtr m_o;
};

class SimpleQuad : public RDFQuad
{
public:
    SimpleQuad(BlankNodeOrIRIPtr g, BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) :
        m_g(g), m_s(s), m_p(p), m_o(o) { }

    BlankNodeOrIRIPtr graphName() const { return m_g; }
    BlankNodeOrIRIPtr subject() const { return m_s; }
    IRIPtr predicate() const { return m_p; }
    RDFTermPtr object() const { return m_o; }

private:
    BlankNodeOrIRIPtr m_g;
    BlankNodeOrIRIPtr m_s;
    IRIPtr m_p;
    RDFTermPtr m_o;
};

/**
 * \class SimpleGraph SimpleRDF.h <termquay/termmodel/SimpleRDF.h>
 *
 * An RDFGraph held in memory, keyed by the N-Triples form of each
 * triple.  Not thread safe.
 */
class SimpleGraph : public RDFGraph
{
public:
    SimpleGraph() { }

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

private:
    QMap<QString, RDFTriplePtr> m_triples;
};

}

#endif
