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

#ifndef _TERMQUAY_RDF_TERM_H_
#define _TERMQUAY_RDF_TERM_H_

#include <QString>
#include <QSharedPointer>
#include <QList>

namespace Termquay
{

class Node;

/**
 * \class RDFTerm RDFTerm.h <termquay/termmodel/RDFTerm.h>
 *
 * RDFTerm is the abstract base of the immutable RDF term model: IRI,
 * Literal and BlankNode, plus any implementation-specific extension
 * kinds (such as the wildcard and variable terms produced when
 * adapting generalized native triples).
 *
 * Terms are compared by value using equals(), never by identity.
 * Terms are immutable and are passed around by shared pointer
 * (RDFTermPtr and friends below).
 */
class RDFTerm
{
public:
    virtual ~RDFTerm() { }

    /**
     * Return the N-Triples representation of this term.
     */
    virtual QString ntriplesString() const = 0;

    /**
     * Return true if this term has the same value as the given one.
     */
    virtual bool equals(const RDFTerm &other) const = 0;

    /**
     * Return a hash value consistent with equals().
     */
    virtual unsigned int hash() const = 0;

    /**
     * If this term is a view of a native Node (that is, it was
     * produced by the native adapters), return that Node; otherwise
     * return 0.  The returned pointer is valid for the lifetime of
     * the term.
     */
    virtual const Node *nativeNode() const { return 0; }
};

/**
 * \class BlankNodeOrIRI RDFTerm.h <termquay/termmodel/RDFTerm.h>
 *
 * Common base of IRI and BlankNode, the term kinds permitted in the
 * subject and graph name positions of a statement.
 */
class BlankNodeOrIRI : public RDFTerm
{
};

/**
 * \class IRI RDFTerm.h <termquay/termmodel/RDFTerm.h>
 *
 * An IRI term.  Two IRIs are equal if their strings are equal.
 */
class IRI : public BlankNodeOrIRI
{
public:
    virtual QString iriString() const = 0;

    QString ntriplesString() const;
    bool equals(const RDFTerm &other) const;
    unsigned int hash() const;
};

/**
 * \class BlankNode RDFTerm.h <termquay/termmodel/RDFTerm.h>
 *
 * A blank node term.  A blank node is identified solely by its
 * unique reference, which is only meaningful within the session
 * (Salt) in which the blank node was created or adapted.
 */
class BlankNode : public BlankNodeOrIRI
{
public:
    virtual QString uniqueReference() const = 0;

    QString ntriplesString() const;
    bool equals(const RDFTerm &other) const;
    unsigned int hash() const;
};

class Literal;

typedef QSharedPointer<RDFTerm> RDFTermPtr;
typedef QSharedPointer<BlankNodeOrIRI> BlankNodeOrIRIPtr;
typedef QSharedPointer<IRI> IRIPtr;
typedef QSharedPointer<BlankNode> BlankNodePtr;
typedef QSharedPointer<Literal> LiteralPtr;

typedef QList<RDFTermPtr> RDFTerms;

/**
 * \class Literal RDFTerm.h <termquay/termmodel/RDFTerm.h>
 *
 * A literal term, with a lexical form, a datatype IRI and an
 * optional language tag.
 *
 * Literals with no explicit datatype have the datatype xsd:string,
 * and language-tagged literals have rdf:langString.  In N-Triples the
 * xsd:string datatype is implicit and is not written out.
 */
class Literal : public RDFTerm
{
public:
    virtual QString lexicalForm() const = 0;
    virtual IRIPtr datatype() const = 0;

    /**
     * Return the language tag, or an empty string if the literal has
     * none.
     */
    virtual QString languageTag() const = 0;

    bool hasLanguageTag() const { return languageTag() != ""; }

    QString ntriplesString() const;
    bool equals(const RDFTerm &other) const;
    unsigned int hash() const;
};

namespace Vocabulary
{
extern const QString xsdString;
extern const QString rdfLangString;
}

/**
 * Return true if both terms are null, or both are non-null and equal.
 */
bool termsEqual(const RDFTermPtr &a, const RDFTermPtr &b);

/**
 * Return the N-Triples representation of the given term, or "[]" for
 * a null term.
 */
QString termString(const RDFTermPtr &t);

}

#endif
