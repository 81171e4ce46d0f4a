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

#include "Salt.h"
#include "RDFException.h"

#include <QByteArray>

namespace Termquay
{

Salt::Salt(const QUuid &uuid) :
    m_uuid(uuid)
{
    if (m_uuid.isNull()) {
        throw RDFInvalidArgument("Salt may not be a null UUID");
    }
}

Salt
Salt::generate()
{
    return Salt(QUuid::createUuid());
}

QString
Salt::combine(const QString &label, const Salt &salt)
{
    // Name-based (SHA-1) UUID of the label within the salt's namespace
    QUuid ref = QUuid::createUuidV5(salt.m_uuid, label);
    return QString::fromLatin1(ref.toRfc4122().toHex());
}

QString
Salt::toString() const
{
    return QString::fromLatin1(m_uuid.toRfc4122().toHex());
}

}
