/* -*- c-basic-offset: 4 indent-tabs-mode: nil -*-  vi:set ts=8 sts=4 sw=4: */

#include "Triple.h"

#include <QTextStream>

namespace Termquay
{

bool
operator==(const Triple &a, const Triple &b)
{
    if (a.a == b.a &&
        a.b == b.b &&
        a.c == b.c) return true;
    return false;
}

bool
operator!=(const Triple &a, const Triple &b)
{
    return !operator==(a, b);
}

std::ostream &
operator<<(std::ostream &out, const Triple &t)
{
    return out << "( " << t.a << " " << t.b << " " << t.c << " )";
}

QTextStream &
operator<<(QTextStream &out, const Triple &t)
{
    return out << "( " << t.a << " " << t.b << " " << t.c << " )";
}

}
