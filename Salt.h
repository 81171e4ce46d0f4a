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

#ifndef _TERMQUAY_SALT_H_
#define _TERMQUAY_SALT_H_

#include <QUuid>
#include <QString>

namespace Termquay
{

/**
 * \class Salt Salt.h <termquay/Salt.h>
 *
 * Salt is the identity of a blank node adaptation session: an
 * immutable random 128-bit value used to turn store-scoped blank node
 * labels into blank node references that cannot collide with those
 * of any other session.
 *
 * The same label adapted with the same Salt always yields the same
 * reference; the same label adapted with two different Salts yields
 * two different references.  So two documents loaded independently,
 * each with its own blank node "b1", do not end up sharing a blank
 * node unless they were deliberately adapted using the same Salt.
 *
 * A Salt is never modified after construction and may be read from
 * any number of threads.
 */
class Salt
{
public:
    /**
     * Construct a Salt from the given UUID, for example in order to
     * continue an earlier session.  Throw RDFInvalidArgument if the
     * UUID is null.
     */
    explicit Salt(const QUuid &uuid);

    /**
     * Return a new random Salt, distinct from every other Salt
     * generated in this process (with overwhelming probability).
     */
    static Salt generate();

    /**
     * Return the blank node reference for the given native blank
     * node label in the session identified by the given Salt.  The
     * result is a 32-character lower-case hex string.
     */
    static QString combine(const QString &label, const Salt &salt);

    QUuid toUuid() const { return m_uuid; }
    QString toString() const;

    bool operator==(const Salt &s) const { return m_uuid == s.m_uuid; }
    bool operator!=(const Salt &s) const { return m_uuid != s.m_uuid; }

private:
    QUuid m_uuid;
};

}

#endif
