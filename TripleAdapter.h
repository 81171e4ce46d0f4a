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

#ifndef _TERMQUAY_TRIPLE_ADAPTER_H_
#define _TERMQUAY_TRIPLE_ADAPTER_H_

#include "termmodel/RDFTriple.h"
#include "Quad.h"
#include "Salt.h"

namespace Termquay
{

class RDFTermFactory;

/**
 * \class TripleAdapter TripleAdapter.h <termquay/TripleAdapter.h>
 *
 * Conversion between native Triples and Quads and the statements of
 * the term model.
 *
 * The strict conversions (tripleToRDFTriple, quadToRDFQuad) require
 * a complete statement: a URI or blank subject, a URI predicate and
 * a concrete object, and a URI or blank graph name or the default
 * graph.  Anything else is reported with an RDFConversionException
 * naming the statement.  The generalized conversions accept any
 * Nodes at all, including wildcards and variables, and never throw.
 *
 * A Quad whose graph name is a Nothing node is in the default graph,
 * and converts to a quad with a null graph name.
 */
class TripleAdapter
{
public:
    static RDFTriplePtr tripleToRDFTriple(const Triple &t, const Salt &salt);

    /**
     * Convert a native triple to a triple built by the given factory.
     * The result is not a view of the native triple.
     */
    static RDFTriplePtr tripleToRDFTriple(RDFTermFactory &factory,
                                          const Triple &t);

    static GeneralizedTriplePtr tripleToGeneralizedTriple(const Triple &t,
                                                          const Salt &salt);

    static RDFQuadPtr quadToRDFQuad(const Quad &q, const Salt &salt);

    static RDFQuadPtr quadToRDFQuad(RDFTermFactory &factory, const Quad &q);

    static GeneralizedQuadPtr quadToGeneralizedQuad(const Quad &q,
                                                    const Salt &salt);

    /**
     * Convert a triple to a native Triple.  If the triple is a view of
     * a native Triple, return that; otherwise convert each of its
     * terms with TermAdapter::termToNode().
     */
    static Triple rdfTripleToTriple(const RDFTriplePtr &t);

    static Quad rdfQuadToQuad(const RDFQuadPtr &q);

    static Triple generalizedTripleToTriple(const GeneralizedTriplePtr &t);

    static Quad generalizedQuadToQuad(const GeneralizedQuadPtr &q);
};

}

#endif
