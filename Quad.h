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

#ifndef _TERMQUAY_QUAD_H_
#define _TERMQUAY_QUAD_H_

#include "Triple.h"

namespace Termquay
{

/**
 * \class Quad Quad.h <termquay/Quad.h>
 *
 * Quad represents a native RDF statement in a named graph: three
 * Node objects as in Triple, plus a fourth naming the graph.  A
 * Nothing graph node denotes the default graph.
 */
class Quad
{
public:
    /**
     * Construct a quad of four Nothing nodes.
     */
    Quad() { }

    /**
     * Construct a quad from a graph name node and the three nodes of
     * a statement.
     */
    Quad(Node _g, Node _a, Node _b, Node _c) :
        g(_g), a(_a), b(_b), c(_c) { }

    /**
     * Construct a quad from a graph name node and a triple.
     */
    Quad(Node _g, Triple t) :
        g(_g), a(t.a), b(t.b), c(t.c) { }

    ~Quad() { }

    /**
     * Return the statement part of the quad, without its graph name.
     */
    Triple triple() const { return Triple(a, b, c); }

    bool isDefaultGraph() const { return g.type == Node::Nothing; }

    Node g;
    Node a;
    Node b;
    Node c;
};

typedef QList<Quad> Quads;

bool operator==(const Quad &a, const Quad &b);
bool operator!=(const Quad &a, const Quad &b);

std::ostream &operator<<(std::ostream &out, const Quad &);
QTextStream &operator<<(QTextStream &out, const Quad &);

}

#endif
