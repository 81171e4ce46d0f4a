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

#ifndef _TERMQUAY_EXCEPTION_H_
#define _TERMQUAY_EXCEPTION_H_

#include <QString>
#include <QByteArray>
#include <exception>

namespace Termquay
{

/**
 * \class RDFException RDFException.h <termquay/RDFException.h>
 *
 * RDFException is an exception that results from incorrect usage of
 * the RDF store or term interfaces or unsuitable data provided to a
 * function.  For example, this exception would be thrown in response
 * to trying to add an incomplete triple to the store.
 */
class RDFException : virtual public std::exception
{
public:
    RDFException(QString message) throw() : m_message(message) {
        m_local = m_message.toLocal8Bit();
    }
    RDFException(QString message, QString data) throw() {
        m_message = QString("%1 [with string \"%2\"]").arg(message).arg(data);
        m_local = m_message.toLocal8Bit();
    }
    virtual ~RDFException() throw() { }
    virtual const char *what() const throw() {
        return m_local.constData();
    }

    QString message() const { return m_message; }

protected:
    QString m_message;
    QByteArray m_local;
};

/**
 * \class RDFInternalError RDFException.h <termquay/RDFException.h>
 *
 * RDFInternalError is an exception that results from an internal
 * error in the underlying RDF library, such as a failure to create
 * its storage.
 */
class RDFInternalError : virtual public RDFException
{
public:
    RDFInternalError(QString message, QString data = "") throw() :
        RDFException(message, data) { }
};

/**
 * \class RDFConversionException RDFException.h <termquay/RDFException.h>
 *
 * RDFConversionException results from an attempt to adapt a native
 * node, triple or quad that cannot be represented in the requested
 * form: a non-concrete node (wildcard or variable) where a concrete
 * term is required, or a generalized triple (e.g. with a literal
 * subject) passed to a strict triple conversion.  It is also thrown
 * when a term of an unknown kind is converted to a native node.
 */
class RDFConversionException : virtual public RDFException
{
public:
    RDFConversionException(QString message, QString data = "") throw() :
        RDFException(message, data) { }
};

/**
 * \class RDFInvalidArgument RDFException.h <termquay/RDFException.h>
 *
 * RDFInvalidArgument results from passing a syntactically unusable
 * value when creating a term, for example an IRI containing a space
 * or angle bracket, or a language tag containing a space.  The checks
 * are cheap guards only; passing them does not mean the value is
 * well-formed.
 */
class RDFInvalidArgument : virtual public RDFException
{
public:
    RDFInvalidArgument(QString message, QString data = "") throw() :
        RDFException(message, data) { }
};

}

#endif
