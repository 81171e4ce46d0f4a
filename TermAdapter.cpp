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

#include "TermAdapter.h"
#include "NodeTerms.h"
#include "RDFException.h"

#include "termmodel/RDFTermFactory.h"

#include <QTextStream>

#include "Debug.h"

namespace Termquay
{

static QString
nodeString(const Node &n)
{
    QString s;
    QTextStream ts(&s);
    ts << n;
    ts.flush();
    return s;
}

RDFTermPtr
TermAdapter::nodeToTerm(const Node &node, const Salt &salt)
{
    switch (node.type) {
    case Node::URI:
        return RDFTermPtr(new NodeIRI(node));
    case Node::Literal:
        return RDFTermPtr(new NodeLiteral(node));
    case Node::Blank:
        return RDFTermPtr(new NodeBlankNode(node, salt));
    case Node::Nothing:
    case Node::Variable:
        break;
    }
    throw RDFConversionException("Node is not concrete", nodeString(node));
}

RDFTermPtr
TermAdapter::nodeToGeneralizedTerm(const Node &node, const Salt &salt)
{
    switch (node.type) {
    case Node::Nothing:
        return RDFTermPtr(new NodeAny());
    case Node::Variable:
        return RDFTermPtr(new NodeVariable(node));
    default:
        return nodeToTerm(node, salt);
    }
}

RDFTermPtr
TermAdapter::nodeToTerm(RDFTermFactory &factory, const Node &node)
{
    switch (node.type) {
    case Node::URI:
        return factory.createIRI(node.value);
    case Node::Literal:
        if (node.language != "") {
            return factory.createLiteral(node.value, node.language);
        }
        if (node.datatype == "" || node.datatype == Vocabulary::xsdString) {
            return factory.createLiteral(node.value);
        }
        return factory.createLiteral(node.value,
                                     factory.createIRI(node.datatype));
    case Node::Blank:
        return factory.createBlankNode(node.value);
    case Node::Nothing:
    case Node::Variable:
        break;
    }
    throw RDFConversionException("Node is not concrete", nodeString(node));
}

Node
TermAdapter::termToNode(const RDFTermPtr &term)
{
    if (!term) {
        throw RDFInvalidArgument("Null term cannot be converted to a node");
    }

    const Node *native = term->nativeNode();
    if (native) return *native;

    IRIPtr iri = qSharedPointerDynamicCast<IRI>(term);
    if (iri) {
        return Node(Node::URI, iri->iriString());
    }

    LiteralPtr lit = qSharedPointerDynamicCast<Literal>(term);
    if (lit) {
        QString lang = lit->languageTag();
        if (lang != "") {
            return Node(Node::Literal, lit->lexicalForm(), "", lang);
        }
        IRIPtr dt = lit->datatype();
        if (!dt || dt->iriString() == Vocabulary::xsdString) {
            return Node(Node::Literal, lit->lexicalForm());
        }
        return Node(Node::Literal, lit->lexicalForm(), dt->iriString());
    }

    BlankNodePtr blank = qSharedPointerDynamicCast<BlankNode>(term);
    if (blank) {
        return Node(Node::Blank, blank->uniqueReference());
    }

    DEBUG << "TermAdapter::termToNode: unknown term kind: "
          << term->ntriplesString();
    throw RDFConversionException("Not a concrete term", term->ntriplesString());
}

BlankNodeOrIRIPtr
TermAdapter::asBlankNodeOrIRI(const RDFTermPtr &term)
{
    BlankNodeOrIRIPtr b = qSharedPointerDynamicCast<BlankNodeOrIRI>(term);
    if (!b) {
        throw RDFConversionException("Term is not a blank node or IRI",
                                     termString(term));
    }
    return b;
}

IRIPtr
TermAdapter::asIRI(const RDFTermPtr &term)
{
    IRIPtr i = qSharedPointerDynamicCast<IRI>(term);
    if (!i) {
        throw RDFConversionException("Term is not an IRI", termString(term));
    }
    return i;
}

}
