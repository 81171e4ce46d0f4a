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

#include "NodeTerms.h"

#include <QHash>

namespace Termquay
{

IRIPtr
NodeLiteral::datatype() const
{
    QString dt;
    if (m_node.language != "") dt = Vocabulary::rdfLangString;
    else if (m_node.datatype == "") dt = Vocabulary::xsdString;
    else dt = m_node.datatype;
    return IRIPtr(new NodeIRI(Node(Node::URI, dt)));
}

NodeBlankNode::NodeBlankNode(const Node &node, const Salt &salt) :
    m_node(node),
    m_ref(Salt::combine(node.value, salt))
{
}

bool
NodeAny::equals(const RDFTerm &other) const
{
    return dynamic_cast<const NodeAny *>(&other) != 0;
}

bool
NodeVariable::equals(const RDFTerm &other) const
{
    const NodeVariable *v = dynamic_cast<const NodeVariable *>(&other);
    if (!v) return false;
    return m_node.value == v->m_node.value;
}

unsigned int
NodeVariable::hash() const
{
    return qHash(m_node.value);
}

}
