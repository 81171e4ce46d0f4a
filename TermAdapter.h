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

#ifndef _TERMQUAY_TERM_ADAPTER_H_
#define _TERMQUAY_TERM_ADAPTER_H_

#include "termmodel/RDFTerm.h"
#include "Node.h"
#include "Salt.h"

namespace Termquay
{

class RDFTermFactory;

/**
 * \class TermAdapter TermAdapter.h <termquay/TermAdapter.h>
 *
 * Conversion between native Nodes and RDFTerms.
 *
 * Terms produced from Nodes are views of those Nodes, so converting
 * them back with termToNode() returns the original Node without
 * rebuilding it.  Blank nodes are given a unique reference derived
 * from their native label and the Salt supplied.
 */
class TermAdapter
{
public:
    /**
     * Convert a concrete Node to a term.  A URI node becomes an IRI,
     * a Literal node a Literal and a Blank node a BlankNode.  Throw
     * RDFConversionException if the node is a Nothing or Variable
     * node.
     */
    static RDFTermPtr nodeToTerm(const Node &node, const Salt &salt);

    /**
     * Convert any Node to a term.  As nodeToTerm(), except that a
     * Nothing node becomes a NodeAny wildcard term and a Variable
     * node a NodeVariable term.  Never throws.
     */
    static RDFTermPtr nodeToGeneralizedTerm(const Node &node, const Salt &salt);

    /**
     * Convert a concrete Node to a term created by the given
     * factory.  Blank node labels are passed to
     * RDFTermFactory::createBlankNode(QString), so their identity
     * follows the factory's own session.  Throw
     * RDFConversionException if the node is not concrete.
     */
    static RDFTermPtr nodeToTerm(RDFTermFactory &factory, const Node &node);

    /**
     * Convert a term to a native Node.  If the term is a view of a
     * Node (see RDFTerm::nativeNode()), return that Node.  Otherwise
     * an IRI becomes a URI node, a Literal a Literal node, and a
     * BlankNode a Blank node labelled with its unique reference.
     *
     * Throw RDFInvalidArgument if the term is null, or
     * RDFConversionException if it is of any other kind.
     */
    static Node termToNode(const RDFTermPtr &term);

    /**
     * Convert a strict term to the narrower kind required for the
     * subject or graph name of a statement.  Throw
     * RDFConversionException if the term is not an IRI or BlankNode.
     */
    static BlankNodeOrIRIPtr asBlankNodeOrIRI(const RDFTermPtr &term);

    /**
     * Convert a strict term to an IRI, as required for the predicate
     * of a statement.  Throw RDFConversionException if the term is
     * not an IRI.
     */
    static IRIPtr asIRI(const RDFTermPtr &term);
};

}

#endif
