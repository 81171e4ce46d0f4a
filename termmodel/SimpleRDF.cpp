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

#include "SimpleRDF.h"

#include "../RDFException.h"

namespace Termquay
{

SimpleRDFTermFactory::SimpleRDFTermFactory() :
    m_salt(Salt::generate())
{
}

SimpleRDFTermFactory::SimpleRDFTermFactory(const Salt &salt) :
    m_salt(salt)
{
}

BlankNodePtr
SimpleRDFTermFactory::createBlankNode()
{
    return BlankNodePtr
        (new SimpleBlankNode(QString::fromLatin1(QUuid::createUuid().toRfc4122().toHex()), m_salt));
}

BlankNodePtr
SimpleRDFTermFactory::createBlankNode(QString name)
{
    return BlankNodePtr(new SimpleBlankNode(name, m_salt));
}

RDFGraphPtr
SimpleRDFTermFactory::createGraph()
{
    return RDFGraphPtr(new SimpleGraph());
}

IRIPtr
SimpleRDFTermFactory::createIRI(QString iri)
{
    checkIRI(iri);
    return IRIPtr(new SimpleIRI(iri));
}

LiteralPtr
SimpleRDFTermFactory::createLiteral(QString lexicalForm)
{
    return LiteralPtr
        (new SimpleLiteral(lexicalForm,
                           IRIPtr(new SimpleIRI(Vocabulary::xsdString)),
                           ""));
}

LiteralPtr
SimpleRDFTermFactory::createLiteral(QString lexicalForm, IRIPtr datatype)
{
    if (!datatype) {
        throw RDFInvalidArgument("Null datatype for literal", lexicalForm);
    }
    return LiteralPtr(new SimpleLiteral(lexicalForm, datatype, ""));
}

LiteralPtr
SimpleRDFTermFactory::createLiteral(QString lexicalForm, QString languageTag)
{
    checkLanguageTag(languageTag);
    if (languageTag == "") return createLiteral(lexicalForm);
    return LiteralPtr
        (new SimpleLiteral(lexicalForm,
                           IRIPtr(new SimpleIRI(Vocabulary::rdfLangString)),
                           languageTag));
}

RDFTriplePtr
SimpleRDFTermFactory::createTriple(BlankNodeOrIRIPtr subject,
                                   IRIPtr predicate,
                                   RDFTermPtr object)
{
    checkStatement(subject, predicate, object);
    return RDFTriplePtr(new SimpleTriple(subject, predicate, object));
}

RDFQuadPtr
SimpleRDFTermFactory::createQuad(BlankNodeOrIRIPtr graphName,
                                 BlankNodeOrIRIPtr subject,
                                 IRIPtr predicate,
                                 RDFTermPtr object)
{
    checkStatement(subject, predicate, object);
    return RDFQuadPtr(new SimpleQuad(graphName, subject, predicate, object));
}

SimpleBlankNode::SimpleBlankNode(QString name, const Salt &salt) :
    m_ref(Salt::combine(name, salt))
{
}

SimpleLiteral::SimpleLiteral(QString lexicalForm, IRIPtr datatype,
                             QString languageTag) :
    m_lexical(lexicalForm),
    m_datatype(datatype),
    m_language(languageTag)
{
}

static bool
matches(const RDFTriplePtr &t,
        const BlankNodeOrIRIPtr &s, const IRIPtr &p, const RDFTermPtr &o)
{
    if (s && !s->equals(*t->subject())) return false;
    if (p && !p->equals(*t->predicate())) return false;
    if (o && !o->equals(*t->object())) return false;
    return true;
}

// Triples equal by value have the same key: the N-Triples text, with
// any language tag on the object lower-cased
static QString
tripleKey(const RDFTriplePtr &t)
{
    QString key = t->toString();
    LiteralPtr lit = qSharedPointerDynamicCast<Literal>(t->object());
    if (lit && lit->hasLanguageTag()) {
        // the tag follows the last '@', and is followed by " ."
        int at = key.lastIndexOf('@');
        key = key.left(at) + key.mid(at).toLower();
    }
    return key;
}

bool
SimpleGraph::add(RDFTriplePtr t)
{
    if (!t) throw RDFInvalidArgument("Null triple in add");
    QString key = tripleKey(t);
    if (m_triples.contains(key)) return false;
    m_triples[key] = t;
    return true;
}

bool
SimpleGraph::add(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o)
{
    if (!s || !p || !o) {
        throw RDFInvalidArgument("Incomplete triple in add");
    }
    return add(RDFTriplePtr(new SimpleTriple(s, p, o)));
}

bool
SimpleGraph::remove(RDFTriplePtr t)
{
    if (!t) return false;
    return m_triples.remove(tripleKey(t)) > 0;
}

int
SimpleGraph::remove(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o)
{
    int count = 0;
    QMap<QString, RDFTriplePtr>::iterator i = m_triples.begin();
    while (i != m_triples.end()) {
        if (matches(i.value(), s, p, o)) {
            i = m_triples.erase(i);
            ++count;
        } else {
            ++i;
        }
    }
    return count;
}

bool
SimpleGraph::contains(RDFTriplePtr t) const
{
    if (!t) return false;
    return m_triples.contains(tripleKey(t));
}

bool
SimpleGraph::contains(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const
{
    foreach (RDFTriplePtr t, m_triples) {
        if (matches(t, s, p, o)) return true;
    }
    return false;
}

RDFTriples
SimpleGraph::triples() const
{
    return m_triples.values();
}

RDFTriples
SimpleGraph::triples(BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) const
{
    RDFTriples result;
    foreach (RDFTriplePtr t, m_triples) {
        if (matches(t, s, p, o)) result.push_back(t);
    }
    return result;
}

int
SimpleGraph::size() const
{
    return m_triples.size();
}

void
SimpleGraph::clear()
{
    m_triples.clear();
}

}
