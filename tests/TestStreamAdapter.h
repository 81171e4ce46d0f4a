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

#ifndef _TEST_STREAM_ADAPTER_H_
#define _TEST_STREAM_ADAPTER_H_

#include <QObject>
#include <QtTest>

#include <termquay/StreamAdapter.h>
#include <termquay/BasicStore.h>
#include <termquay/TripleAdapter.h>
#include <termquay/RDFException.h>
#include <termquay/termmodel/SimpleRDF.h>

namespace Termquay {

class QuadCollector : public QuadConsumer
{
public:
    void accept(RDFQuadPtr q) { quads.push_back(q); }
    QList<RDFQuadPtr> quads;
};

class GeneralizedTripleCollector : public GeneralizedTripleConsumer
{
public:
    void accept(GeneralizedTriplePtr t) {
        // generalized triples are single-use, so keep their text only
        texts.push_back(termString(t->subject()) + " " +
                        termString(t->predicate()) + " " +
                        termString(t->object()));
    }
    QStringList texts;
};

class GeneralizedQuadCollector : public GeneralizedQuadConsumer
{
public:
    void accept(GeneralizedQuadPtr q) {
        quads.push_back(TripleAdapter::generalizedQuadToQuad(q));
    }
    Quads quads;
};

class TestStreamAdapter : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        ex = "http://example.org/";
        knows = Node(Node::URI, ex + "knows");
        alice = Node(Node::URI, ex + "alice");
        graph = Node(Node::URI, ex + "graph");
    }
    void quadsFromTriples() {
        Salt salt = Salt::generate();
        QuadCollector c;
        QuadStreamAdapter adapter(salt, c);
        Node b1(Node::Blank, "b1");
        adapter.start();
        adapter.triple(Triple(b1, knows, alice));
        adapter.triple(Triple(alice, knows, b1));
        adapter.finish();
        QCOMPARE(adapter.getCount(), 2);
        QCOMPARE(c.quads.size(), 2);
        QVERIFY(!c.quads[0]->graphName());
        // a blank node repeated within one stream has one identity
        QVERIFY(c.quads[0]->subject()->equals(*c.quads[1]->object()));
        BlankNodePtr b = qSharedPointerDynamicCast<BlankNode>
            (c.quads[0]->subject());
        QCOMPARE(b->uniqueReference(), Salt::combine("b1", salt));
    }
    void quadsFromStore() {
        BasicStore store;
        store.add(Triple(Node(Node::Blank, "b1"), knows, alice));
        store.add(Triple(alice, knows, Node(Node::Literal, "x")));
        QuadCollector c;
        QuadStreamAdapter adapter(Salt::generate(), c);
        store.streamTo(adapter, graph);
        QCOMPARE(adapter.getCount(), 2);
        for (int i = 0; i < c.quads.size(); ++i) {
            QCOMPARE(c.quads[i]->graphName()->ntriplesString(),
                     "<" + ex + "graph>");
        }
    }
    void quadsStrict() {
        QuadCollector c;
        QuadStreamAdapter adapter(Salt::generate(), c);
        try {
            adapter.quad(Quad(graph, Node(Node::Variable, "s"), knows, alice));
            QFAIL("Variable subject passed through strict stream");
        } catch (RDFConversionException &) {
            QVERIFY(1);
        }
        QCOMPARE(adapter.getCount(), 0);
        QCOMPARE(c.quads.size(), 0);
    }
    void quadsViaFactory() {
        SimpleRDFTermFactory f;
        QuadCollector c;
        QuadStreamAdapter adapter(f, c);
        adapter.quad(Quad(graph, Node(Node::Blank, "b1"), knows, alice));
        QCOMPARE(c.quads.size(), 1);
        QVERIFY(c.quads[0]->nativeQuad() == 0);
        QVERIFY(c.quads[0]->subject()->equals(*f.createBlankNode("b1")));
        adapter.triple(Triple(alice, knows, Node(Node::Blank, "b1")));
        QCOMPARE(adapter.getCount(), 2);
        QVERIFY(!c.quads[1]->graphName());
        QVERIFY(c.quads[1]->object()->equals(*c.quads[0]->subject()));
    }
    void adapterOutlivesSalt() {
        QuadCollector c;
        QuadStreamAdapter *adapter = 0;
        {
            Salt salt = Salt::generate();
            adapter = new QuadStreamAdapter(salt, c);
        }
        adapter->triple(Triple(Node(Node::Blank, "b1"), knows, alice));
        QCOMPARE(c.quads.size(), 1);
        delete adapter;
    }
    void generalizedTriples() {
        GeneralizedTripleCollector c;
        GeneralizedTripleStreamAdapter adapter(Salt::generate(), c);
        adapter.triple(Triple(Node(Node::Literal, "x"),
                              Node(Node::Variable, "p"),
                              Node()));
        // quads are not triples
        adapter.quad(Quad(graph, alice, knows, alice));
        QCOMPARE(adapter.getCount(), 1);
        QCOMPARE(c.texts.size(), 1);
        QCOMPARE(c.texts[0], QString("\"x\" ?p []"));
    }
    void generalizedQuads() {
        GeneralizedQuadCollector c;
        GeneralizedQuadStreamAdapter adapter(Salt::generate(), c);
        Quad q(Node(Node::Variable, "g"), alice, Node(), Node(Node::Literal, "y"));
        adapter.quad(q);
        adapter.triple(Triple(alice, knows, alice));
        QCOMPARE(adapter.getCount(), 1);
        QCOMPARE(c.quads.size(), 1);
        QCOMPARE(c.quads[0], q);
    }

private:
    QString ex;
    Node knows;
    Node alice;
    Node graph;
};

}

#endif
