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

#include "RDFTerm.h"

#include <QHash>

namespace Termquay
{

namespace Vocabulary
{
const QString xsdString("http://www.w3.org/2001/XMLSchema#string");
const QString rdfLangString("http://www.w3.org/1999/02/22-rdf-syntax-ns#langString");
}

static QString
escapeLiteral(const QString &s)
{
    QString out;
    out.reserve(s.length() + 2);
    for (int i = 0; i < s.length(); ++i) {
        QChar c = s[i];
        if (c == '\\') out += "\\\\";
        else if (c == '"') out += "\\\"";
        else if (c == '\n') out += "\\n";
        else if (c == '\r') out += "\\r";
        else out += c;
    }
    return out;
}

QString
IRI::ntriplesString() const
{
    return "<" + iriString() + ">";
}

bool
IRI::equals(const RDFTerm &other) const
{
    const IRI *i = dynamic_cast<const IRI *>(&other);
    if (!i) return false;
    return iriString() == i->iriString();
}

unsigned int
IRI::hash() const
{
    return qHash(iriString());
}

QString
BlankNode::ntriplesString() const
{
    return "_:" + uniqueReference();
}

bool
BlankNode::equals(const RDFTerm &other) const
{
    const BlankNode *b = dynamic_cast<const BlankNode *>(&other);
    if (!b) return false;
    return uniqueReference() == b->uniqueReference();
}

unsigned int
BlankNode::hash() const
{
    return qHash(uniqueReference());
}

QString
Literal::ntriplesString() const
{
    QString s = "\"" + escapeLiteral(lexicalForm()) + "\"";
    QString lang = languageTag();
    if (lang != "") {
        return s + "@" + lang;
    }
    IRIPtr dt = datatype();
    if (dt && dt->iriString() != Vocabulary::xsdString) {
        return s + "^^" + dt->ntriplesString();
    }
    return s;
}

bool
Literal::equals(const RDFTerm &other) const
{
    const Literal *l = dynamic_cast<const Literal *>(&other);
    if (!l) return false;
    if (lexicalForm() != l->lexicalForm()) return false;
    // language tags are case-insensitive
    if (languageTag().toLower() != l->languageTag().toLower()) return false;
    IRIPtr dt = datatype(), odt = l->datatype();
    QString ds = (dt ? dt->iriString() : Vocabulary::xsdString);
    QString ods = (odt ? odt->iriString() : Vocabulary::xsdString);
    return ds == ods;
}

unsigned int
Literal::hash() const
{
    return qHash(lexicalForm()) ^ qHash(languageTag().toLower());
}

bool
termsEqual(const RDFTermPtr &a, const RDFTermPtr &b)
{
    if (!a || !b) return (!a && !b);
    return a->equals(*b);
}

QString
termString(const RDFTermPtr &t)
{
    if (!t) return "[]";
    return t->ntriplesString();
}

}
