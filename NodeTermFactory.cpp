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

#include "NodeTermFactory.h"
#include "NodeTerms.h"
#include "NodeTriples.h"
#include "TermAdapter.h"
#include "TripleAdapter.h"
#include "GraphAdapter.h"
#include "StoreGraph.h"
#include "BasicStore.h"
#include "RDFException.h"

#include "Debug.h"

namespace Termquay
{

NodeTermFactory::NodeTermFactory() :
    m_salt(Salt::generate())
{
    DEBUG << "NodeTermFactory: new session " << m_salt.toString();
}

NodeTermFactory::NodeTermFactory(const Salt &salt) :
    m_salt(salt)
{
    DEBUG << "NodeTermFactory: continuing session " << m_salt.toString();
}

NodeTermFactory::~NodeTermFactory()
{
}

BlankNodePtr
NodeTermFactory::createBlankNode()
{
    QString label = QString::fromLatin1(QUuid::createUuid().toRfc4122().toHex());
    return BlankNodePtr(new NodeBlankNode(Node(Node::Blank, label), m_salt));
}

BlankNodePtr
NodeTermFactory::createBlankNode(QString name)
{
    return BlankNodePtr(new NodeBlankNode(Node(Node::Blank, name), m_salt));
}

RDFGraphPtr
NodeTermFactory::createGraph()
{
    return RDFGraphPtr
        (new StoreGraph(QSharedPointer<Store>(new BasicStore()), m_salt));
}

IRIPtr
NodeTermFactory::createIRI(QString iri)
{
    checkIRI(iri);
    return IRIPtr(new NodeIRI(Node(Node::URI, iri)));
}

LiteralPtr
NodeTermFactory::createLiteral(QString lexicalForm)
{
    return LiteralPtr(new NodeLiteral(Node(Node::Literal, lexicalForm)));
}

LiteralPtr
NodeTermFactory::createLiteral(QString lexicalForm, IRIPtr datatype)
{
    if (!datatype) {
        throw RDFInvalidArgument("Null datatype for literal", lexicalForm);
    }
    QString dt = datatype->iriString();
    // xsd:string is always held as a plain literal
    if (dt == Vocabulary::xsdString) dt = "";
    return LiteralPtr(new NodeLiteral(Node(Node::Literal, lexicalForm, dt)));
}

LiteralPtr
NodeTermFactory::createLiteral(QString lexicalForm, QString languageTag)
{
    checkLanguageTag(languageTag);
    return LiteralPtr
        (new NodeLiteral(Node(Node::Literal, lexicalForm, "", languageTag)));
}

RDFTriplePtr
NodeTermFactory::createTriple(BlankNodeOrIRIPtr subject,
                              IRIPtr predicate,
                              RDFTermPtr object)
{
    checkStatement(subject, predicate, object);
    Triple t(TermAdapter::termToNode(subject),
             TermAdapter::termToNode(predicate),
             TermAdapter::termToNode(object));
    return RDFTriplePtr(new NodeTriple(t, subject, predicate, object));
}

RDFQuadPtr
NodeTermFactory::createQuad(BlankNodeOrIRIPtr graphName,
                            BlankNodeOrIRIPtr subject,
                            IRIPtr predicate,
                            RDFTermPtr object)
{
    checkStatement(subject, predicate, object);
    Node g;
    if (graphName) g = TermAdapter::termToNode(graphName);
    Quad q(g,
           TermAdapter::termToNode(subject),
           TermAdapter::termToNode(predicate),
           TermAdapter::termToNode(object));
    return RDFQuadPtr(new NodeQuad(q, graphName, subject, predicate, object));
}

GeneralizedTriplePtr
NodeTermFactory::createGeneralizedTriple(RDFTermPtr subject,
                                         RDFTermPtr predicate,
                                         RDFTermPtr object)
{
    Triple t;
    if (subject) t.a = TermAdapter::termToNode(subject);
    if (predicate) t.b = TermAdapter::termToNode(predicate);
    if (object) t.c = TermAdapter::termToNode(object);
    return TripleAdapter::tripleToGeneralizedTriple(t, m_salt);
}

RDFTermPtr
NodeTermFactory::adaptNode(const Node &node) const
{
    return TermAdapter::nodeToTerm(node, m_salt);
}

RDFTriplePtr
NodeTermFactory::adaptTriple(const Triple &triple) const
{
    return TripleAdapter::tripleToRDFTriple(triple, m_salt);
}

RDFQuadPtr
NodeTermFactory::adaptQuad(const Quad &quad) const
{
    return TripleAdapter::quadToRDFQuad(quad, m_salt);
}

GeneralizedTriplePtr
NodeTermFactory::adaptGeneralizedTriple(const Triple &triple) const
{
    return TripleAdapter::tripleToGeneralizedTriple(triple, m_salt);
}

GeneralizedQuadPtr
NodeTermFactory::adaptGeneralizedQuad(const Quad &quad) const
{
    return TripleAdapter::quadToGeneralizedQuad(quad, m_salt);
}

RDFGraphPtr
NodeTermFactory::adaptStore(QSharedPointer<Store> store) const
{
    return GraphAdapter::storeToGraph(store, m_salt);
}

GeneralizedTripleStreamAdapter *
NodeTermFactory::streamToGeneralizedTriples(GeneralizedTripleConsumer &consumer) const
{
    return new GeneralizedTripleStreamAdapter(m_salt, consumer);
}

GeneralizedQuadStreamAdapter *
NodeTermFactory::streamToGeneralizedQuads(GeneralizedQuadConsumer &consumer) const
{
    return new GeneralizedQuadStreamAdapter(m_salt, consumer);
}

QuadStreamAdapter *
NodeTermFactory::streamToQuads(QuadConsumer &consumer) const
{
    return new QuadStreamAdapter(m_salt, consumer);
}

QuadStreamAdapter *
NodeTermFactory::streamToQuads(RDFTermFactory &factory, QuadConsumer &consumer)
{
    return new QuadStreamAdapter(factory, consumer);
}

RDFGraphPtr
NodeTermFactory::wrapStore(QSharedPointer<Store> store)
{
    return GraphAdapter::storeToGraph(store);
}

Node
NodeTermFactory::toNode(RDFTermPtr term)
{
    return TermAdapter::termToNode(term);
}

Triple
NodeTermFactory::toTriple(RDFTriplePtr triple)
{
    return TripleAdapter::rdfTripleToTriple(triple);
}

Quad
NodeTermFactory::toQuad(RDFQuadPtr quad)
{
    return TripleAdapter::rdfQuadToQuad(quad);
}

Triple
NodeTermFactory::toGeneralizedTriple(GeneralizedTriplePtr triple)
{
    return TripleAdapter::generalizedTripleToTriple(triple);
}

Quad
NodeTermFactory::toGeneralizedQuad(GeneralizedQuadPtr quad)
{
    return TripleAdapter::generalizedQuadToQuad(quad);
}

QSharedPointer<Store>
NodeTermFactory::toStore(RDFGraphPtr graph)
{
    return GraphAdapter::graphToStore(graph);
}

RDFTermPtr
NodeTermFactory::convertNode(RDFTermFactory &factory, const Node &node)
{
    return TermAdapter::nodeToTerm(factory, node);
}

RDFTriplePtr
NodeTermFactory::convertTriple(RDFTermFactory &factory, const Triple &triple)
{
    return TripleAdapter::tripleToRDFTriple(factory, triple);
}

RDFQuadPtr
NodeTermFactory::convertQuad(RDFTermFactory &factory, const Quad &quad)
{
    return TripleAdapter::quadToRDFQuad(factory, quad);
}

RDFGraphPtr
NodeTermFactory::convertStore(RDFTermFactory &factory, const Store &store)
{
    return GraphAdapter::copyStore(factory, store);
}

}
