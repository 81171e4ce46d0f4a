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

#ifndef _TERMQUAY_NODE_TRIPLES_H_
#define _TERMQUAY_NODE_TRIPLES_H_

#include "termmodel/RDFTriple.h"
#include "Quad.h"

namespace Termquay
{

/**
 * \class NodeTriple NodeTriples.h <termquay/NodeTriples.h>
 *
 * An RDFTriple that is a view of a native Triple.  The terms are
 * converted once, on construction, by TripleAdapter.
 */
class NodeTriple : public RDFTriple
{
public:
    NodeTriple(const Triple &t,
               BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) :
        m_triple(t), m_s(s), m_p(p), m_o(o) { }

    BlankNodeOrIRIPtr subject() const { return m_s; }
    IRIPtr predicate() const { return m_p; }
    RDFTermPtr object() const { return m_o; }

    const Triple *nativeTriple() const { return &m_triple; }

private:
    Triple m_triple;
    BlankNodeOrIRIPtr m_s;
    IRIPtr m_p;
    RDFTermPtr m_o;
};

/**
 * \class NodeQuad NodeTriples.h <termquay/NodeTriples.h>
 *
 * An RDFQuad that is a view of a native Quad.  The graph name is null
 * if the quad is in the default graph.
 */
class NodeQuad : public RDFQuad
{
public:
    NodeQuad(const Quad &q, BlankNodeOrIRIPtr g,
             BlankNodeOrIRIPtr s, IRIPtr p, RDFTermPtr o) :
        m_quad(q), m_triple(q.triple()), m_g(g), m_s(s), m_p(p), m_o(o) { }

    BlankNodeOrIRIPtr graphName() const { return m_g; }
    BlankNodeOrIRIPtr subject() const { return m_s; }
    IRIPtr predicate() const { return m_p; }
    RDFTermPtr object() const { return m_o; }

    const Triple *nativeTriple() const { return &m_triple; }
    const Quad *nativeQuad() const { return &m_quad; }

private:
    Quad m_quad;
    Triple m_triple;
    BlankNodeOrIRIPtr m_g;
    BlankNodeOrIRIPtr m_s;
    IRIPtr m_p;
    RDFTermPtr m_o;
};

/**
 * \class NodeGeneralizedTriple NodeTriples.h <termquay/NodeTriples.h>
 *
 * A GeneralizedTriple that is a view of a native Triple, which may
 * contain wildcards, variables or literal subjects.
 */
class NodeGeneralizedTriple : public GeneralizedTriple
{
public:
    NodeGeneralizedTriple(const Triple &t,
                          RDFTermPtr s, RDFTermPtr p, RDFTermPtr o) :
        m_triple(t), m_s(s), m_p(p), m_o(o) { }

    RDFTermPtr subject() const { return m_s; }
    RDFTermPtr predicate() const { return m_p; }
    RDFTermPtr object() const { return m_o; }

    const Triple *nativeTriple() const { return &m_triple; }

private:
    Triple m_triple;
    RDFTermPtr m_s;
    RDFTermPtr m_p;
    RDFTermPtr m_o;
};

/**
 * \class NodeGeneralizedQuad NodeTriples.h <termquay/NodeTriples.h>
 *
 * A GeneralizedQuad that is a view of a native Quad.
 */
class NodeGeneralizedQuad : public GeneralizedQuad
{
public:
    NodeGeneralizedQuad(const Quad &q, RDFTermPtr g,
                        RDFTermPtr s, RDFTermPtr p, RDFTermPtr o) :
        m_quad(q), m_triple(q.triple()), m_g(g), m_s(s), m_p(p), m_o(o) { }

    RDFTermPtr graphName() const { return m_g; }
    RDFTermPtr subject() const { return m_s; }
    RDFTermPtr predicate() const { return m_p; }
    RDFTermPtr object() const { return m_o; }

    const Triple *nativeTriple() const { return &m_triple; }
    const Quad *nativeQuad() const { return &m_quad; }

private:
    Quad m_quad;
    Triple m_triple;
    RDFTermPtr m_g;
    RDFTermPtr m_s;
    RDFTermPtr m_p;
    RDFTermPtr m_o;
};

}

#endif
