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

#include "TripleAdapter.h"
#include "TermAdapter.h"
#include "NodeTriples.h"
#include "RDFException.h"

#include "termmodel/RDFTermFactory.h"

#include <QTextStream>

namespace Termquay
{

template <typename T>
static QString
statementString(const T &t)
{
    QString s;
    QTextStream ts(&s);
    ts << t;
    ts.flush();
    return s;
}

RDFTriplePtr
TripleAdapter::tripleToRDFTriple(const Triple &t, const Salt &salt)
{
    try {
        BlankNodeOrIRIPtr s =
            TermAdapter::asBlankNodeOrIRI(TermAdapter::nodeToTerm(t.a, salt));
        IRIPtr p = TermAdapter::asIRI(TermAdapter::nodeToTerm(t.b, salt));
        RDFTermPtr o = TermAdapter::nodeToTerm(t.c, salt);
        return RDFTriplePtr(new NodeTriple(t, s, p, o));
    } catch (const RDFConversionException &e) {
        throw RDFConversionException
            ("Cannot convert generalized triple: " + e.message(),
             statementString(t));
    }
}

RDFTriplePtr
TripleAdapter::tripleToRDFTriple(RDFTermFactory &factory, const Triple &t)
{
    try {
        BlankNodeOrIRIPtr s = TermAdapter::asBlankNodeOrIRI
            (TermAdapter::nodeToTerm(factory, t.a));
        IRIPtr p = TermAdapter::asIRI(TermAdapter::nodeToTerm(factory, t.b));
        RDFTermPtr o = TermAdapter::nodeToTerm(factory, t.c);
        return factory.createTriple(s, p, o);
    } catch (const RDFConversionException &e) {
        throw RDFConversionException
            ("Cannot convert generalized triple: " + e.message(),
             statementString(t));
    }
}

GeneralizedTriplePtr
TripleAdapter::tripleToGeneralizedTriple(const Triple &t, const Salt &salt)
{
    return GeneralizedTriplePtr
        (new NodeGeneralizedTriple(t,
                                   TermAdapter::nodeToGeneralizedTerm(t.a, salt),
                                   TermAdapter::nodeToGeneralizedTerm(t.b, salt),
                                   TermAdapter::nodeToGeneralizedTerm(t.c, salt)));
}

RDFQuadPtr
TripleAdapter::quadToRDFQuad(const Quad &q, const Salt &salt)
{
    try {
        BlankNodeOrIRIPtr g;
        if (!q.isDefaultGraph()) {
            g = TermAdapter::asBlankNodeOrIRI(TermAdapter::nodeToTerm(q.g, salt));
        }
        BlankNodeOrIRIPtr s =
            TermAdapter::asBlankNodeOrIRI(TermAdapter::nodeToTerm(q.a, salt));
        IRIPtr p = TermAdapter::asIRI(TermAdapter::nodeToTerm(q.b, salt));
        RDFTermPtr o = TermAdapter::nodeToTerm(q.c, salt);
        return RDFQuadPtr(new NodeQuad(q, g, s, p, o));
    } catch (const RDFConversionException &e) {
        throw RDFConversionException
            ("Cannot convert generalized quad: " + e.message(),
             statementString(q));
    }
}

RDFQuadPtr
TripleAdapter::quadToRDFQuad(RDFTermFactory &factory, const Quad &q)
{
    try {
        BlankNodeOrIRIPtr g;
        if (!q.isDefaultGraph()) {
            g = TermAdapter::asBlankNodeOrIRI
                (TermAdapter::nodeToTerm(factory, q.g));
        }
        BlankNodeOrIRIPtr s = TermAdapter::asBlankNodeOrIRI
            (TermAdapter::nodeToTerm(factory, q.a));
        IRIPtr p = TermAdapter::asIRI(TermAdapter::nodeToTerm(factory, q.b));
        RDFTermPtr o = TermAdapter::nodeToTerm(factory, q.c);
        return factory.createQuad(g, s, p, o);
    } catch (const RDFConversionException &e) {
        throw RDFConversionException
            ("Cannot convert generalized quad: " + e.message(),
             statementString(q));
    }
}

GeneralizedQuadPtr
TripleAdapter::quadToGeneralizedQuad(const Quad &q, const Salt &salt)
{
    RDFTermPtr g;
    if (!q.isDefaultGraph()) {
        g = TermAdapter::nodeToGeneralizedTerm(q.g, salt);
    }
    return GeneralizedQuadPtr
        (new NodeGeneralizedQuad(q, g,
                                 TermAdapter::nodeToGeneralizedTerm(q.a, salt),
                                 TermAdapter::nodeToGeneralizedTerm(q.b, salt),
                                 TermAdapter::nodeToGeneralizedTerm(q.c, salt)));
}

Triple
TripleAdapter::rdfTripleToTriple(const RDFTriplePtr &t)
{
    if (!t) throw RDFInvalidArgument("Null triple cannot be converted");
    const Triple *native = t->nativeTriple();
    if (native) return *native;
    return Triple(TermAdapter::termToNode(t->subject()),
                  TermAdapter::termToNode(t->predicate()),
                  TermAdapter::termToNode(t->object()));
}

Quad
TripleAdapter::rdfQuadToQuad(const RDFQuadPtr &q)
{
    if (!q) throw RDFInvalidArgument("Null quad cannot be converted");
    const Quad *native = q->nativeQuad();
    if (native) return *native;
    Node g;
    if (q->graphName()) g = TermAdapter::termToNode(q->graphName());
    return Quad(g,
                TermAdapter::termToNode(q->subject()),
                TermAdapter::termToNode(q->predicate()),
                TermAdapter::termToNode(q->object()));
}

// A null position in a generalized statement is a wildcard
static Node
generalizedNode(const RDFTermPtr &term)
{
    if (!term) return Node();
    return TermAdapter::termToNode(term);
}

Triple
TripleAdapter::generalizedTripleToTriple(const GeneralizedTriplePtr &t)
{
    if (!t) throw RDFInvalidArgument("Null triple cannot be converted");
    const Triple *native = t->nativeTriple();
    if (native) return *native;
    return Triple(generalizedNode(t->subject()),
                  generalizedNode(t->predicate()),
                  generalizedNode(t->object()));
}

Quad
TripleAdapter::generalizedQuadToQuad(const GeneralizedQuadPtr &q)
{
    if (!q) throw RDFInvalidArgument("Null quad cannot be converted");
    const Quad *native = q->nativeQuad();
    if (native) return *native;
    return Quad(generalizedNode(q->graphName()),
                generalizedNode(q->subject()),
                generalizedNode(q->predicate()),
                generalizedNode(q->object()));
}

}
