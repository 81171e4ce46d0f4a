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

#ifndef _TERMQUAY_NODE_H_
#define _TERMQUAY_NODE_H_

#include <QString>
#include <QList>

#include <iostream>

class QTextStream;

namespace Termquay
{

/**
 * \class Node Node.h <termquay/Node.h>
 *
 * A single native RDF node, as stored in and retrieved from a Store.
 *
 * Node is a plain value type.  Besides the three concrete node types
 * (URI, Literal, Blank) it can represent the two placeholder types
 * used when pattern matching: Nothing, which matches any node, and
 * Variable, a named pattern variable.  Placeholder nodes are not
 * concrete and cannot be stored.
 */
class Node
{
public:
    /**
     * Node type.
     */
    enum Type { Nothing, URI, Literal, Blank, Variable };

    /**
     * Construct a node with no node type (used for example as an
     * undefined node when pattern matching a triple).
     */
    Node() : type(Nothing), value() { }

    /**
     * Construct a node with the given node type and value, and with
     * no defined data type URI or language.
     *
     * For a URI node the value is the complete URI; for a Blank node
     * it is the blank node label, which is only meaningful within the
     * store it came from; for a Variable node it is the variable name.
     */
    Node(Type t, QString v) : type(t), value(v) { }

    /**
     * Construct a literal or other node with the given node type,
     * value, and data type URI.
     */
    Node(Type t, QString v, QString dt) : type(t), value(v), datatype(dt) { }

    /**
     * Construct a node with the given node type, value, data type
     * URI and language tag.  A literal should not have both a data
     * type and a language.
     */
    Node(Type t, QString v, QString dt, QString lang) :
        type(t), value(v), datatype(dt), language(lang) { }

    ~Node() { }

    /**
     * Return true if this node is an actual URI, literal or blank
     * node, false if it is a Nothing or Variable placeholder.
     */
    bool isConcrete() const {
        return (type == URI || type == Literal || type == Blank);
    }

    Type type;
    QString value;
    QString datatype;
    QString language;
};

/**
 * A list of node types.
 */
typedef QList<Node> Nodes;

bool operator==(const Node &a, const Node &b);
bool operator!=(const Node &a, const Node &b);
bool operator<(const Node &a, const Node &b);

std::ostream &operator<<(std::ostream &out, const Node &);
QTextStream &operator<<(QTextStream &out, const Node &);

}

#endif
