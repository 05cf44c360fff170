// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrfbtypes.h"

#include <QtCore/QtEndian>

QT_BEGIN_NAMESPACE

bool QRfb::isKnownSecurityType(SecurityType type)
{
    switch (type) {
    case SecurityTypeInvalid:
    case SecurityTypeNone:
    case SecurityTypeVncAuthentication:
    case SecurityTypeRA2:
    case SecurityTypeRA2ne:
    case SecurityTypeTight:
    case SecurityTypeUltra:
    case SecurityTypeTLS:
    case SecurityTypeVeNCrypt:
    case SecurityTypeGtkVncSasl:
    case SecurityTypeMd5HashAuthentication:
    case SecurityTypeColinDeanXvp:
        return true;
    }
    return false;
}

/*!
    Decodes a pixel format from the 16 bytes at \a data.

    Layout: bpp, depth, big-endian flag, true-colour flag, three big-endian
    16-bit channel maxima, three shifts and three bytes of padding.
*/
QRfbPixelFormat QRfbPixelFormat::fromWire(const char *data)
{
    QRfbPixelFormat format;
    format.bitsPerPixel = quint8(data[0]);
    format.depth = quint8(data[1]);
    format.bigEndianFlag = quint8(data[2]);
    format.trueColourFlag = quint8(data[3]);
    format.redMax = qFromBigEndian<quint16>(data + 4);
    format.greenMax = qFromBigEndian<quint16>(data + 6);
    format.blueMax = qFromBigEndian<quint16>(data + 8);
    format.redShift = quint8(data[10]);
    format.greenShift = quint8(data[11]);
    format.blueShift = quint8(data[12]);
    return format;
}

QByteArray QRfbPixelFormat::toWire() const
{
    QByteArray data(WireSize, '\0');
    data[0] = char(bitsPerPixel);
    data[1] = char(depth);
    data[2] = char(bigEndianFlag);
    data[3] = char(trueColourFlag);
    qToBigEndian<quint16>(redMax, data.data() + 4);
    qToBigEndian<quint16>(greenMax, data.data() + 6);
    qToBigEndian<quint16>(blueMax, data.data() + 8);
    data[10] = char(redShift);
    data[11] = char(greenShift);
    data[12] = char(blueShift);
    return data;
}

QRfbPixelFormat QRfbPixelFormat::rgb32()
{
    QRfbPixelFormat format;
    format.bitsPerPixel = 32;
    format.depth = 24;
    format.bigEndianFlag = 0;
    format.trueColourFlag = 1;
    format.redMax = 255;
    format.greenMax = 255;
    format.blueMax = 255;
    format.redShift = 16;
    format.greenShift = 8;
    format.blueShift = 0;
    return format;
}

QDebug operator<<(QDebug debug, const QRfbRectangle &rectangle)
{
    QDebugStateSaver saver(debug);
    debug.nospace() << "QRfbRectangle(" << rectangle.x << ", " << rectangle.y << ' '
                    << rectangle.width << 'x' << rectangle.height
                    << ", encoding=" << rectangle.encoding << ')';
    return debug;
}

QT_END_NAMESPACE
