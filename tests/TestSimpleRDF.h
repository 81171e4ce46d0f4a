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

#ifndef _TEST_SIMPLE_RDF_H_
#define _TEST_SIMPLE_RDF_H_

#include <QObject>
#include <QtTest>

#include <termquay/termmodel/SimpleRDF.h>
#include <termquay/RDFException.h>

namespace Termquay {

class TestSimpleRDF : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase() {
        ex = "http://example.org/";
    }
    void literalForms() {
        SimpleRDFTermFactory f;
        QCOMPARE(f.createLiteral("a \"quoted\"\nline")->ntriplesString(),
                 QString("\"a \\\"quoted\\\"\\nline\""));
        QCOMPARE(f.createLiteral("1", f.createIRI(ex + "type"))->ntriplesString(),
                 "\"1\"^^<" + ex + "type>");
        QCOMPARE(f.createLiteral("x", QString("fr"))->ntriplesString(),
                 QString("\"x\"@fr"));
    }
    void termEquality() {
        SimpleRDFTermFactory f;
        QVERIFY(f.createIRI(ex + "a")->equals(*f.createIRI(ex + "a")));
        QVERIFY(!f.createIRI(ex + "a")->equals(*f.createIRI(ex + "b")));
        QVERIFY(!f.createIRI(ex + "a")->equals(*f.createLiteral(ex + "a")));
        QVERIFY(!f.createLiteral("1")->equals
                (*f.createLiteral("1", f.createIRI(ex + "type"))));
        QVERIFY(!f.createLiteral("x")->equals(*f.createLiteral("x", QString("fr"))));
        QCOMPARE(f.createIRI(ex + "a")->hash(), f.createIRI(ex + "a")->hash());
    }
    void blankNodeSessions() {
        Salt salt = Salt::generate();
        SimpleRDFTermFactory f(salt);
        SimpleRDFTermFactory g(salt);
        SimpleRDFTermFactory h;
        QVERIFY(f.createBlankNode("b")->equals(*g.createBlankNode("b")));
        QVERIFY(!f.createBlankNode("b")->equals(*h.createBlankNode("b")));
        QCOMPARE(f.createBlankNode("b")->ntriplesString(),
                 "_:" + Salt::combine("b", salt));
    }
    void graphOperations() {
        SimpleRDFTermFactory f;
        RDFGraphPtr graph = f.createGraph();
        IRIPtr fred = f.createIRI(ex + "fred");
        IRIPtr knows = f.createIRI(ex + "knows");
        IRIPtr alice = f.createIRI(ex + "alice");
        IRIPtr bob = f.createIRI(ex + "bob");

        QVERIFY(graph->add(fred, knows, alice));
        QVERIFY(!graph->add(f.createTriple(fred, knows, alice)));
        QVERIFY(graph->add(fred, knows, bob));
        QVERIFY(graph->add(alice, knows, bob));
        QCOMPARE(graph->size(), 3);

        QVERIFY(graph->contains(f.createTriple(fred, knows, alice)));
        QVERIFY(graph->contains(BlankNodeOrIRIPtr(), IRIPtr(), bob));
        QVERIFY(!graph->contains(bob, IRIPtr(), RDFTermPtr()));
        QCOMPARE(graph->triples(fred, IRIPtr(), RDFTermPtr()).size(), 2);
        QCOMPARE(graph->triples(BlankNodeOrIRIPtr(), knows, bob).size(), 2);

        QVERIFY(graph->remove(f.createTriple(fred, knows, alice)));
        QVERIFY(!graph->remove(f.createTriple(fred, knows, alice)));
        QCOMPARE(graph->remove(BlankNodeOrIRIPtr(), IRIPtr(), bob), 2);
        QCOMPARE(graph->size(), 0);
    }
    void graphLanguageTagCase() {
        // "x"@EN and "x"@en are the same literal, so one triple
        SimpleRDFTermFactory f;
        RDFGraphPtr graph = f.createGraph();
        IRIPtr fred = f.createIRI(ex + "fred");
        IRIPtr says = f.createIRI(ex + "says");
        QVERIFY(graph->add(fred, says, f.createLiteral("x", QString("EN"))));
        QVERIFY(!graph->add(fred, says, f.createLiteral("x", QString("en"))));
        QCOMPARE(graph->size(), 1);
        QVERIFY(graph->contains(f.createTriple
                                (fred, says, f.createLiteral("x", QString("en")))));
        QVERIFY(graph->remove(f.createTriple
                              (fred, says, f.createLiteral("x", QString("eN")))));
        QCOMPARE(graph->size(), 0);
    }
    void emptyLanguageTag() {
        SimpleRDFTermFactory f;
        LiteralPtr lit = f.createLiteral("x", QString(""));
        QVERIFY(!lit->hasLanguageTag());
        QCOMPARE(lit->datatype()->iriString(), Vocabulary::xsdString);
        QVERIFY(lit->equals(*f.createLiteral("x")));
    }
    void quadForms() {
        SimpleRDFTermFactory f;
        RDFQuadPtr q = f.createQuad(f.createIRI(ex + "g"), f.createIRI(ex + "s"),
                                    f.createIRI(ex + "p"), f.createLiteral("o"));
        QCOMPARE(q->toString(),
                 "<" + ex + "s> <" + ex + "p> \"o\" <" + ex + "g> .");
        RDFQuadPtr d = f.createQuad(BlankNodeOrIRIPtr(), f.createIRI(ex + "s"),
                                    f.createIRI(ex + "p"), f.createLiteral("o"));
        QVERIFY(!q->equals(*d));
        QVERIFY(d->equals(*f.createQuad(BlankNodeOrIRIPtr(), f.createIRI(ex + "s"),
                                        f.createIRI(ex + "p"), f.createLiteral("o"))));
    }
    void invalidArguments() {
        SimpleRDFTermFactory f;
        try {
            f.createIRI("not an iri");
            QFAIL("IRI with spaces accepted");
        } catch (RDFInvalidArgument &) {
            QVERIFY(1);
        }
        try {
            f.createLiteral("x", IRIPtr());
            QFAIL("Null datatype accepted");
        } catch (RDFInvalidArgument &) {
            QVERIFY(1);
        }
    }

private:
    QString ex;
};

}

#endif
