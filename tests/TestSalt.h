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

#ifndef _TEST_SALT_H_
#define _TEST_SALT_H_

#include <QObject>
#include <QtTest>
#include <QRegExp>

#include <termquay/Salt.h>
#include <termquay/RDFException.h>

namespace Termquay {

class TestSalt : public QObject
{
    Q_OBJECT

private slots:
    void generateDistinct() {
        Salt a = Salt::generate();
        Salt b = Salt::generate();
        QVERIFY(a != b);
        QVERIFY(!a.toUuid().isNull());
    }
    void fromUuid() {
        QUuid u = QUuid::createUuid();
        Salt a(u);
        Salt b(u);
        QVERIFY(a == b);
        QCOMPARE(a.toUuid(), u);
        QCOMPARE(a.toString().length(), 32);
    }
    void nullUuidRejected() {
        try {
            Salt s((QUuid()));
            QFAIL("Null UUID was accepted as a Salt");
        } catch (RDFInvalidArgument &) {
            QVERIFY(1);
        }
    }
    void combineSameSalt() {
        Salt s = Salt::generate();
        QCOMPARE(Salt::combine("b1", s), Salt::combine("b1", s));
        QCOMPARE(Salt::combine("b1", s), Salt::combine("b1", Salt(s.toUuid())));
    }
    void combineDifferentSalts() {
        Salt s1 = Salt::generate();
        Salt s2 = Salt::generate();
        QVERIFY(Salt::combine("b1", s1) != Salt::combine("b1", s2));
    }
    void combineDifferentLabels() {
        Salt s = Salt::generate();
        QVERIFY(Salt::combine("b1", s) != Salt::combine("b2", s));
        QVERIFY(Salt::combine("", s) != Salt::combine("b1", s));
    }
    void combineFormat() {
        QString ref = Salt::combine("b1", Salt::generate());
        QCOMPARE(ref.length(), 32);
        QVERIFY(QRegExp("[0-9a-f]{32}").exactMatch(ref));
    }
    void combineKnownValue() {
        // A name-based UUID is a pure function of namespace and name
        Salt s(QUuid("{6ba7b810-9dad-11d1-80b4-00c04fd430c8}"));
        QString ref = Salt::combine("b1", s);
        QCOMPARE(ref, QString::fromLatin1
                 (QUuid::createUuidV5
                  (QUuid("{6ba7b810-9dad-11d1-80b4-00c04fd430c8}"),
                   QString("b1")).toRfc4122().toHex()));
    }
};

}

#endif
