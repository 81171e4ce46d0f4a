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

#ifndef _TEST_NODE_TERM_FACTORY_H_
#define _TEST_NODE_TERM_FACTORY_H_

#include <QObject>
#include <QtTest>

#include <termquay/NodeTermFactory.h>
#include <termquay/BasicStore.h>
#include <termquay/RDFException.h>
#include <termquay/termmodel/SimpleRDF.h>

namespace Termquay {

class TestNodeTermFactory : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        ex = "http://example.org/";
    }
    void createIRI() {
        NodeTermFactory f;
        IRIPtr iri = f.createIRI(ex + "a");
        QCOMPARE(iri->iriString(), ex + "a");
        QCOMPARE(NodeTermFactory::toNode(iri), Node(Node::URI, ex + "a"));
    }
    void createIRIInvalid() {
        NodeTermFactory f;
        const char *bad[] = { "http://example.org/a b",
                              "http://example.org/<a>",
                              "<http://example.org/a" };
        for (int i = 0; i < 3; ++i) {
            try {
                f.createIRI(bad[i]);
                QFAIL("Invalid IRI accepted");
            } catch (RDFInvalidArgument &) {
                QVERIFY(1);
            }
        }
    }
    void createLiterals() {
        NodeTermFactory f;
        LiteralPtr plain = f.createLiteral("x");
        QCOMPARE(plain->datatype()->iriString(), Vocabulary::xsdString);
        QCOMPARE(NodeTermFactory::toNode(plain), Node(Node::Literal, "x"));

        // explicit xsd:string is the same literal as a plain one
        LiteralPtr str = f.createLiteral("x", f.createIRI(Vocabulary::xsdString));
        QVERIFY(str->equals(*plain));
        QCOMPARE(NodeTermFactory::toNode(str), Node(Node::Literal, "x"));

        QString xsdInt = "http://www.w3.org/2001/XMLSchema#integer";
        LiteralPtr typed = f.createLiteral("1", f.createIRI(xsdInt));
        QCOMPARE(typed->datatype()->iriString(), xsdInt);

        LiteralPtr lang = f.createLiteral("hello", QString("en"));
        QCOMPARE(lang->languageTag(), QString("en"));
        QCOMPARE(lang->datatype()->iriString(), Vocabulary::rdfLangString);

        // language tags compare case-insensitively
        QVERIFY(lang->equals(*f.createLiteral("hello", QString("EN"))));
    }
    void createLiteralInvalidLanguage() {
        NodeTermFactory f;
        try {
            f.createLiteral("hello", QString("en gb"));
            QFAIL("Language tag with space accepted");
        } catch (RDFInvalidArgument &) {
            QVERIFY(1);
        }
        // an empty tag is no tag at all
        LiteralPtr plain = f.createLiteral("hello", QString(""));
        QVERIFY(!plain->hasLanguageTag());
        QVERIFY(plain->equals(*f.createLiteral("hello")));
    }
    void createBlankNodes() {
        NodeTermFactory f;
        BlankNodePtr a = f.createBlankNode("x");
        BlankNodePtr b = f.createBlankNode("x");
        BlankNodePtr c = f.createBlankNode("y");
        QVERIFY(a->equals(*b));
        QVERIFY(!a->equals(*c));
        QVERIFY(!f.createBlankNode()->equals(*f.createBlankNode()));

        // the same name in another session is another blank node
        NodeTermFactory g;
        QVERIFY(!a->equals(*g.createBlankNode("x")));

        // unless that session continues this one
        NodeTermFactory h(f.getSalt());
        QVERIFY(a->equals(*h.createBlankNode("x")));
    }
    void createGraph() {
        NodeTermFactory f;
        RDFGraphPtr graph = f.createGraph();
        QVERIFY(!graph->nativeStore().isNull());
        BlankNodePtr b = f.createBlankNode("b1");
        QVERIFY(graph->add(b, f.createIRI(ex + "says"),
                           f.createLiteral("hello", QString("en"))));
        QVERIFY(!graph->add(b, f.createIRI(ex + "says"),
                            f.createLiteral("hello", QString("en"))));
        RDFTriples tt = graph->triples();
        QCOMPARE(tt.size(), 1);
        // the blank node reads back as itself
        QVERIFY(tt[0]->subject()->equals(*b));
    }
    void createTriplesAndQuads() {
        NodeTermFactory f;
        RDFTriplePtr t = f.createTriple(f.createIRI(ex + "s"),
                                        f.createIRI(ex + "p"),
                                        f.createLiteral("o"));
        QCOMPARE(NodeTermFactory::toTriple(t),
                 Triple(ex + "s", ex + "p", Node(Node::Literal, "o")));
        RDFQuadPtr q = f.createQuad(f.createIRI(ex + "g"),
                                    f.createIRI(ex + "s"),
                                    f.createIRI(ex + "p"),
                                    f.createLiteral("o"));
        QCOMPARE(NodeTermFactory::toQuad(q).g, Node(Node::URI, ex + "g"));
        RDFQuadPtr dq = f.createQuad(BlankNodeOrIRIPtr(),
                                     f.createIRI(ex + "s"),
                                     f.createIRI(ex + "p"),
                                     f.createLiteral("o"));
        QVERIFY(NodeTermFactory::toQuad(dq).isDefaultGraph());
        try {
            f.createTriple(BlankNodeOrIRIPtr(), f.createIRI(ex + "p"),
                           f.createLiteral("o"));
            QFAIL("Triple with null subject created");
        } catch (RDFInvalidArgument &) {
            QVERIFY(1);
        }
    }
    void createGeneralizedTriple() {
        NodeTermFactory f;
        GeneralizedTriplePtr t = f.createGeneralizedTriple
            (f.createLiteral("s"), RDFTermPtr(), f.createBlankNode("o"));
        QCOMPARE(t->subject()->ntriplesString(), QString("\"s\""));
        QCOMPARE(t->predicate()->ntriplesString(), QString("[]"));
        QVERIFY(t->object()->equals(*f.createBlankNode("o")));
    }
    void adaptWithFactorySalt() {
        NodeTermFactory f;
        Node b1(Node::Blank, "b1");
        RDFTermPtr a = f.adaptNode(b1);
        QVERIFY(a->equals(*f.createBlankNode("b1")));

        Triple t(b1, Node(Node::URI, ex + "p"), Node(Node::Literal, "o"));
        RDFTriplePtr rt = f.adaptTriple(t);
        QVERIFY(rt->subject()->equals(*a));
        QCOMPARE(f.adaptQuad(Quad(Node(), t))->subject()->ntriplesString(),
                 a->ntriplesString());

        Triple gt(Node(Node::Variable, "s"), Node(), b1);
        QVERIFY(f.adaptGeneralizedTriple(gt)->object()->equals(*a));
        QVERIFY(f.adaptGeneralizedQuad(Quad(b1, gt))->graphName()->equals(*a));
        try {
            f.adaptTriple(gt);
            QFAIL("Generalized triple adapted strictly");
        } catch (RDFConversionException &) {
            QVERIFY(1);
        }
        try {
            f.adaptNode(Node(Node::Variable, "s"));
            QFAIL("Variable adapted strictly");
        } catch (RDFConversionException &) {
            QVERIFY(1);
        }
    }
    void generalizedToNative() {
        NodeTermFactory f;
        Triple t(Node(Node::Literal, "s"), Node(Node::Variable, "p"), Node());
        QCOMPARE(NodeTermFactory::toGeneralizedTriple
                 (f.adaptGeneralizedTriple(t)), t);
        Quad q(Node(Node::Variable, "g"), t);
        QCOMPARE(NodeTermFactory::toGeneralizedQuad
                 (f.adaptGeneralizedQuad(q)), q);

        // statements from elsewhere are converted term by term, with
        // null positions as wildcards
        SimpleRDFTermFactory simple;
        RDFTermPtr lit = simple.createLiteral("s");
        BlankNodePtr b1 = simple.createBlankNode("b1");
        GeneralizedTriplePtr gt(new Statement(RDFTermPtr(), lit, RDFTermPtr(), b1));
        QVERIFY(gt->nativeTriple() == 0);
        QCOMPARE(NodeTermFactory::toGeneralizedTriple(gt),
                 Triple(Node(Node::Literal, "s"), Node(),
                        Node(Node::Blank, b1->uniqueReference())));

        RDFTermPtr g = simple.createIRI(ex + "g");
        GeneralizedQuadPtr gq(new Statement(g, RDFTermPtr(), lit, RDFTermPtr()));
        QVERIFY(gq->nativeQuad() == 0);
        QCOMPARE(NodeTermFactory::toGeneralizedQuad(gq),
                 Quad(Node(Node::URI, ex + "g"), Node(),
                      Node(Node::Literal, "s"), Node()));

        try {
            NodeTermFactory::toGeneralizedTriple(GeneralizedTriplePtr());
            QFAIL("Null generalized triple converted");
        } catch (RDFInvalidArgument &) {
            QVERIFY(1);
        }
    }
    void adaptAndWrapStore() {
        QSharedPointer<Store> store(new BasicStore());
        store->add(Triple(Node(Node::Blank, "b1"), Node(Node::URI, ex + "p"),
                          Node(Node::Literal, "o")));
        NodeTermFactory f;
        RDFGraphPtr a = f.adaptStore(store);
        RDFGraphPtr b = f.adaptStore(store);
        QVERIFY(a->triples()[0]->equals(*b->triples()[0]));
        QVERIFY(a->triples()[0]->subject()->equals(*f.createBlankNode("b1")));

        RDFGraphPtr c = NodeTermFactory::wrapStore(store);
        QVERIFY(!a->triples()[0]->equals(*c->triples()[0]));
        QVERIFY(NodeTermFactory::toStore(c) == store);
    }
    void streams() {
        NodeTermFactory f;
        BasicStore store;
        store.add(Triple(Node(Node::Blank, "b1"), Node(Node::URI, ex + "p"),
                         Node(Node::Literal, "o")));

        Collector c;
        QuadStreamAdapter *sink = f.streamToQuads(c);
        store.streamTo(*sink);
        QCOMPARE(sink->getCount(), 1);
        QVERIFY(c.quads[0]->subject()->equals(*f.createBlankNode("b1")));
        delete sink;

        SimpleRDFTermFactory simple;
        Collector sc;
        sink = NodeTermFactory::streamToQuads(simple, sc);
        store.streamTo(*sink, Node(Node::URI, ex + "g"));
        QCOMPARE(sc.quads.size(), 1);
        QVERIFY(sc.quads[0]->subject()->equals(*simple.createBlankNode("b1")));
        delete sink;

        GeneralizedCollector gc;
        GeneralizedTripleStreamAdapter *gsink = f.streamToGeneralizedTriples(gc);
        store.streamTo(*gsink);
        QCOMPARE(gc.count, 1);
        delete gsink;

        GeneralizedQuadStreamAdapter *qsink = f.streamToGeneralizedQuads(gc);
        store.streamTo(*qsink, Node(Node::URI, ex + "g"));
        QCOMPARE(gc.count, 2);
        delete qsink;
    }
    void convertToFactory() {
        SimpleRDFTermFactory simple;
        Node b1(Node::Blank, "b1");
        QVERIFY(NodeTermFactory::convertNode(simple, b1)->equals
                (*simple.createBlankNode("b1")));
        Triple t(b1, Node(Node::URI, ex + "p"), Node(Node::Literal, "o", "", "en"));
        RDFTriplePtr rt = NodeTermFactory::convertTriple(simple, t);
        QCOMPARE(rt->object()->ntriplesString(), QString("\"o\"@en"));
        RDFQuadPtr rq = NodeTermFactory::convertQuad(simple, Quad(Node(), t));
        QVERIFY(!rq->graphName());
        BasicStore store;
        store.add(t);
        RDFGraphPtr g = NodeTermFactory::convertStore(simple, store);
        QVERIFY(g->contains(rt));
    }

private:
    class Statement : public GeneralizedQuad {
    public:
        Statement(RDFTermPtr g, RDFTermPtr s, RDFTermPtr p, RDFTermPtr o) :
            m_g(g), m_s(s), m_p(p), m_o(o) { }
        RDFTermPtr graphName() const { return m_g; }
        RDFTermPtr subject() const { return m_s; }
        RDFTermPtr predicate() const { return m_p; }
        RDFTermPtr object() const { return m_o; }
    private:
        RDFTermPtr m_g, m_s, m_p, m_o;
    };
    class Collector : public QuadConsumer {
    public:
        void accept(RDFQuadPtr q) { quads.push_back(q); }
        QList<RDFQuadPtr> quads;
    };
    class GeneralizedCollector : public GeneralizedTripleConsumer,
                                 public GeneralizedQuadConsumer {
    public:
        GeneralizedCollector() : count(0) { }
        void accept(GeneralizedTriplePtr) { ++count; }
        void accept(GeneralizedQuadPtr) { ++count; }
        int count;
    };

    QString ex;
};

}

#endif
