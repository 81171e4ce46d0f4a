/* -*- c-basic-offset: 4 indent-tabs-mode: nil -*-  vi:set ts=8 sts=4 sw=4: */

#include "Quad.h"

#include <QTextStream>

namespace Termquay
{

bool
operator==(const Quad &a, const Quad &b)
{
    return (a.g == b.g && a.a == b.a && a.b == b.b && a.c == b.c);
}

bool
operator!=(const Quad &a, const Quad &b)
{
    return !operator==(a, b);
}

std::ostream &
operator<<(std::ostream &out, const Quad &q)
{
    return out << "( " << q.a << " " << q.b << " " << q.c
               << " in " << q.g << " )";
}

QTextStream &
operator<<(QTextStream &out, const Quad &q)
{
    return out << "( " << q.a << " " << q.b << " " << q.c
               << " in " << q.g << " )";
}

}
