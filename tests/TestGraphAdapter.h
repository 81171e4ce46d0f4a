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

#ifndef _TEST_GRAPH_ADAPTER_H_
#define _TEST_GRAPH_ADAPTER_H_

#include <QObject>
#include <QtTest>

#include <termquay/GraphAdapter.h>
#include <termquay/StoreGraph.h>
#include <termquay/BasicStore.h>
#include <termquay/TripleAdapter.h>
#include <termquay/NodeTerms.h>
#include <termquay/RDFException.h>
#include <termquay/termmodel/SimpleRDF.h>

namespace Termquay {

class TestGraphAdapter : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        ex = "http://example.org/";
        fred = Node(Node::URI, ex + "fred");
        knows = Node(Node::URI, ex + "knows");
        says = Node(Node::URI, ex + "says");
        alice = Node(Node::URI, ex + "alice");
    }
    void wrapSharesChanges() {
        QSharedPointer<Store> store(new BasicStore());
        store->add(Triple(fred, knows, alice));
        RDFGraphPtr graph = GraphAdapter::storeToGraph(store);
        QCOMPARE(graph->size(), 1);

        // native changes are seen through the graph
        store->add(Triple(alice, knows, fred));
        QCOMPARE(graph->size(), 2);

        // and graph changes are seen in the store
        SimpleRDFTermFactory f;
        QVERIFY(graph->add(f.createIRI(ex + "bob"),
                           f.createIRI(ex + "knows"),
                           f.createIRI(ex + "alice")));
        QCOMPARE(store->size(), 3);
        QVERIFY(store->contains(Triple(Node(Node::URI, ex + "bob"), knows, alice)));

        RDFTriples tt = graph->triples();
        QCOMPARE(tt.size(), 3);
        QVERIFY(graph->remove(tt[0]));
        QCOMPARE(store->size(), 2);

        graph->clear();
        QCOMPARE(store->size(), 0);
    }
    void wrapPatterns() {
        QSharedPointer<Store> store(new BasicStore());
        store->add(Triple(fred, knows, alice));
        store->add(Triple(fred, says, Node(Node::Literal, "hi")));
        store->add(Triple(alice, knows, fred));
        StoreGraph graph(store, Salt::generate());

        SimpleRDFTermFactory f;
        BlankNodeOrIRIPtr sFred = f.createIRI(ex + "fred");
        IRIPtr pKnows = f.createIRI(ex + "knows");

        QCOMPARE(graph.triples(sFred, IRIPtr(), RDFTermPtr()).size(), 2);
        QCOMPARE(graph.triples(BlankNodeOrIRIPtr(), pKnows, RDFTermPtr()).size(), 2);
        QVERIFY(graph.contains(sFred, pKnows, RDFTermPtr()));
        QVERIFY(!graph.contains(f.createIRI(ex + "nobody"), IRIPtr(), RDFTermPtr()));
        QVERIFY(graph.contains(sFred, f.createIRI(ex + "says"),
                               f.createLiteral("hi")));

        QCOMPARE(graph.remove(sFred, IRIPtr(), RDFTermPtr()), 2);
        QCOMPARE(graph.remove(sFred, IRIPtr(), RDFTermPtr()), 0);
        QCOMPARE(store->size(), 1);
    }
    void wrapTypedStringLiteral() {
        // a literal typed xsd:string natively is the same term as a
        // plain literal, and must be found by pattern as such
        QSharedPointer<Store> store(new BasicStore());
        store->add(Triple(fred, says,
                          Node(Node::Literal, "x", Vocabulary::xsdString)));
        StoreGraph graph(store, Salt::generate());

        SimpleRDFTermFactory f;
        BlankNodeOrIRIPtr sFred = f.createIRI(ex + "fred");
        IRIPtr pSays = f.createIRI(ex + "says");
        LiteralPtr x = f.createLiteral("x");

        QCOMPARE(graph.triples().size(), 1);
        QVERIFY(graph.triples()[0]->object()->equals(*x));
        QVERIFY(graph.contains(sFred, pSays, x));
        QVERIFY(graph.contains(f.createTriple(sFred, pSays, x)));
        QCOMPARE(graph.triples(BlankNodeOrIRIPtr(), IRIPtr(), x).size(), 1);
        QVERIFY(graph.contains(sFred, pSays,
                               f.createLiteral("x", f.createIRI
                                               (Vocabulary::xsdString))));
        QCOMPARE(graph.remove(sFred, pSays, x), 1);
        QCOMPARE(store->size(), 0);
    }
    void endToEnd() {
        QSharedPointer<Store> store(new BasicStore());
        store->add(Triple(Node(Node::Blank, "b1"), says,
                          Node(Node::Literal, "hello", "", "en")));

        Salt salt = Salt::generate();
        RDFGraphPtr graph = GraphAdapter::storeToGraph(store, salt);
        RDFTriples tt = graph->triples();
        QCOMPARE(tt.size(), 1);

        LiteralPtr lit = qSharedPointerDynamicCast<Literal>(tt[0]->object());
        QVERIFY(lit);
        QCOMPARE(lit->languageTag(), QString("en"));
        QCOMPARE(lit->lexicalForm(), QString("hello"));

        BlankNodePtr b = qSharedPointerDynamicCast<BlankNode>(tt[0]->subject());
        QVERIFY(b);
        QString ref = b->uniqueReference();
        QCOMPARE(ref, Salt::combine("b1", salt));

        // same store, same Salt: same blank node
        RDFGraphPtr again = GraphAdapter::storeToGraph(store, salt);
        BlankNodePtr b2 = qSharedPointerDynamicCast<BlankNode>
            (again->triples()[0]->subject());
        QCOMPARE(b2->uniqueReference(), ref);
        QVERIFY(again->triples()[0]->equals(*tt[0]));

        // same store, no Salt given: a new session
        RDFGraphPtr fresh = GraphAdapter::storeToGraph(store);
        BlankNodePtr b3 = qSharedPointerDynamicCast<BlankNode>
            (fresh->triples()[0]->subject());
        QVERIFY(b3->uniqueReference() != ref);
    }
    void unwrap() {
        QSharedPointer<Store> store(new BasicStore());
        RDFGraphPtr graph = GraphAdapter::storeToGraph(store);
        QVERIFY(graph->nativeStore() == store);
        QVERIFY(GraphAdapter::graphToStore(graph) == store);
    }
    void copyForeignGraph() {
        SimpleRDFTermFactory f;
        RDFGraphPtr graph = f.createGraph();
        QVERIFY(graph->nativeStore().isNull());
        graph->add(f.createBlankNode("b1"), f.createIRI(ex + "says"),
                   f.createLiteral("hello", "en"));
        graph->add(f.createIRI(ex + "fred"), f.createIRI(ex + "knows"),
                   f.createIRI(ex + "alice"));

        QSharedPointer<Store> store = GraphAdapter::graphToStore(graph);
        QCOMPARE(store->size(), 2);
        QVERIFY(store->contains(Triple(fred, knows, alice)));

        // the copy is independent of its source, both ways
        graph->clear();
        QCOMPARE(store->size(), 2);
        store->clear();
        graph->add(f.createIRI(ex + "fred"), f.createIRI(ex + "knows"),
                   f.createIRI(ex + "alice"));
        QCOMPARE(store->size(), 0);
        QCOMPARE(graph->size(), 1);
    }
    void copyToFactory() {
        BasicStore store;
        store.add(Triple(fred, knows, alice));
        store.add(Triple(Node(Node::Blank, "b1"), says,
                         Node(Node::Literal, "hello", "", "en")));

        SimpleRDFTermFactory f;
        RDFGraphPtr graph = GraphAdapter::copyStore(f, store);
        QCOMPARE(graph->size(), 2);
        QVERIFY(graph->nativeStore().isNull());
        QVERIFY(graph->contains(f.createBlankNode("b1"),
                                f.createIRI(ex + "says"),
                                f.createLiteral("hello", "en")));

        store.add(Triple(alice, knows, fred));
        QCOMPARE(graph->size(), 2);
        graph->clear();
        QCOMPARE(store.size(), 3);
    }
    void copyFailsFast() {
        // a graph that cannot be stored natively aborts the copy
        SimpleRDFTermFactory f;
        RDFGraphPtr graph = f.createGraph();
        graph->add(f.createIRI(ex + "fred"), f.createIRI(ex + "knows"),
                   f.createIRI(ex + "alice"));
        graph->add(RDFTriplePtr
                   (new SimpleTriple(f.createIRI(ex + "fred"),
                                     f.createIRI(ex + "knows"),
                                     RDFTermPtr(new NodeVariable
                                                (Node(Node::Variable, "x"))))));
        try {
            GraphAdapter::graphToStore(graph);
            QFAIL("Graph containing a variable was copied");
        } catch (RDFConversionException &e) {
            QVERIFY(e.message().contains("?x"));
        }
    }

private:
    QString ex;
    Node fred;
    Node knows;
    Node says;
    Node alice;
};

}

#endif
