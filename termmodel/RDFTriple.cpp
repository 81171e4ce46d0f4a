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

#include "RDFTriple.h"

namespace Termquay
{

bool
RDFTriple::equals(const RDFTriple &other) const
{
    return termsEqual(subject(), other.subject()) &&
        termsEqual(predicate(), other.predicate()) &&
        termsEqual(object(), other.object());
}

unsigned int
RDFTriple::hash() const
{
    unsigned int h = 0;
    if (subject()) h ^= subject()->hash();
    if (predicate()) h ^= (predicate()->hash() << 1);
    if (object()) h ^= (object()->hash() << 2);
    return h;
}

QString
RDFTriple::toString() const
{
    return termString(subject()) + " " +
        termString(predicate()) + " " +
        termString(object()) + " .";
}

bool
RDFQuad::equals(const RDFQuad &other) const
{
    return termsEqual(graphName(), other.graphName()) &&
        termsEqual(subject(), other.subject()) &&
        termsEqual(predicate(), other.predicate()) &&
        termsEqual(object(), other.object());
}

unsigned int
RDFQuad::hash() const
{
    unsigned int h = 0;
    if (subject()) h ^= subject()->hash();
    if (predicate()) h ^= (predicate()->hash() << 1);
    if (object()) h ^= (object()->hash() << 2);
    if (graphName()) h ^= (graphName()->hash() << 3);
    return h;
}

QString
RDFQuad::toString() const
{
    QString s = termString(subject()) + " " +
        termString(predicate()) + " " +
        termString(object());
    if (graphName()) s += " " + graphName()->ntriplesString();
    return s + " .";
}

}
