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

#ifndef _TERMQUAY_RDF_TERM_FACTORY_H_
#define _TERMQUAY_RDF_TERM_FACTORY_H_

#include "RDFGraph.h"

namespace Termquay
{

/**
 * \class RDFTermFactory RDFTermFactory.h <termquay/termmodel/RDFTermFactory.h>
 *
 * Abstract factory for the terms, statements and graphs of one
 * implementation of the term model.
 *
 * Blank nodes created by a factory belong to that factory's session:
 * createBlankNode(name) called twice with the same name on the same
 * factory returns equal blank nodes, but the same name on two
 * different factories gives different ones.
 */
class RDFTermFactory
{
public:
    virtual ~RDFTermFactory() { }

    virtual BlankNodePtr createBlankNode() = 0;
    virtual BlankNodePtr createBlankNode(QString name) = 0;

    virtual RDFGraphPtr createGraph() = 0;

    /**
     * Create an IRI.  Throw RDFInvalidArgument if the string contains
     * a space or angle bracket.
     */
    virtual IRIPtr createIRI(QString iri) = 0;

    /**
     * Create a literal with the implicit xsd:string datatype.
     */
    virtual LiteralPtr createLiteral(QString lexicalForm) = 0;

    /**
     * Create a literal with the given datatype.
     */
    virtual LiteralPtr createLiteral(QString lexicalForm, IRIPtr datatype) = 0;

    /**
     * Create a language-tagged literal.  Throw RDFInvalidArgument if
     * the language tag contains a space.  An empty tag gives a plain
     * string literal.
     */
    virtual LiteralPtr createLiteral(QString lexicalForm, QString languageTag) = 0;

    virtual RDFTriplePtr createTriple(BlankNodeOrIRIPtr subject,
                                      IRIPtr predicate,
                                      RDFTermPtr object) = 0;

    /**
     * Create a quad.  A null graph name places the quad in the
     * default graph.
     */
    virtual RDFQuadPtr createQuad(BlankNodeOrIRIPtr graphName,
                                  BlankNodeOrIRIPtr subject,
                                  IRIPtr predicate,
                                  RDFTermPtr object) = 0;

protected:
    // Some simple validations - full IRI parsing is not cheap
    static void checkIRI(const QString &iri);
    static void checkLanguageTag(const QString &tag);
    static void checkStatement(const RDFTermPtr &s,
                               const RDFTermPtr &p,
                               const RDFTermPtr &o);
};

}

#endif
