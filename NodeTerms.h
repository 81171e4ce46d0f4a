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

#ifndef _TERMQUAY_NODE_TERMS_H_
#define _TERMQUAY_NODE_TERMS_H_

#include "termmodel/RDFTerm.h"
#include "Node.h"
#include "Salt.h"

namespace Termquay
{

/**
 * \class NodeIRI NodeTerms.h <termquay/NodeTerms.h>
 *
 * An IRI term that is a view of a native URI node.
 */
class NodeIRI : public IRI
{
public:
    explicit NodeIRI(const Node &node) : m_node(node) { }

    QString iriString() const { return m_node.value; }
    const Node *nativeNode() const { return &m_node; }

private:
    Node m_node;
};

/**
 * \class NodeLiteral NodeTerms.h <termquay/NodeTerms.h>
 *
 * A literal term that is a view of a native literal node.
 *
 * A node with a language tag has the datatype rdf:langString.  A node
 * with no datatype, or with the datatype xsd:string, has the implicit
 * xsd:string datatype.
 */
class NodeLiteral : public Literal
{
public:
    explicit NodeLiteral(const Node &node) : m_node(node) { }

    QString lexicalForm() const { return m_node.value; }
    IRIPtr datatype() const;
    QString languageTag() const { return m_node.language; }
    const Node *nativeNode() const { return &m_node; }

private:
    Node m_node;
};

/**
 * \class NodeBlankNode NodeTerms.h <termquay/NodeTerms.h>
 *
 * A blank node term that is a view of a native blank node.  Its
 * unique reference combines the native blank node label with the
 * Salt of the session it was adapted in.
 */
class NodeBlankNode : public BlankNode
{
public:
    NodeBlankNode(const Node &node, const Salt &salt);

    QString uniqueReference() const { return m_ref; }
    const Node *nativeNode() const { return &m_node; }

private:
    Node m_node;
    QString m_ref;
};

/**
 * \class NodeAny NodeTerms.h <termquay/NodeTerms.h>
 *
 * The wildcard term, a view of a Nothing node.  It appears only in
 * generalized triples and quads.  All wildcard terms are equal.
 */
class NodeAny : public RDFTerm
{
public:
    NodeAny() { }

    QString ntriplesString() const { return "[]"; }
    bool equals(const RDFTerm &other) const;
    unsigned int hash() const { return 0; }
    const Node *nativeNode() const { return &m_node; }

private:
    Node m_node;
};

/**
 * \class NodeVariable NodeTerms.h <termquay/NodeTerms.h>
 *
 * A named pattern variable term, a view of a Variable node.  It
 * appears only in generalized triples and quads.
 */
class NodeVariable : public RDFTerm
{
public:
    explicit NodeVariable(const Node &node) : m_node(node) { }

    QString name() const { return m_node.value; }

    QString ntriplesString() const { return "?" + m_node.value; }
    bool equals(const RDFTerm &other) const;
    unsigned int hash() const;
    const Node *nativeNode() const { return &m_node; }

private:
    Node m_node;
};

}

#endif
