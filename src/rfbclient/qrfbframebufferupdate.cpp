// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrfbframebufferupdate.h"

#include <QtCore/QtEndian>

QT_BEGIN_NAMESPACE

void QRfbFramebufferUpdateParser::setFramebufferSize(quint16 width, quint16 height)
{
    m_framebufferWidth = width;
    m_framebufferHeight = height;
}

/*!
    Parses one FramebufferUpdate message at the start of \a buffer.

    Only the framing "message type 0, padding 0, one rectangle" with raw
    encoding is accepted. Anything else is fatal rather than being skipped,
    since a misparsed rectangle desynchronizes the rest of the stream.

    The payload size is validated before the parser decides to wait for it,
    so a hostile header can never make the caller buffer more than
    maximumPayloadSize() bytes.
*/
QRfbParseResult QRfbFramebufferUpdateParser::parse(const QByteArray &buffer) const
{
    if (buffer.size() < HeaderSize) {
        qCDebug(lcRfbClient) << "Waiting for rectangle header:" << buffer.size() << "of" << HeaderSize;
        return QRfbParseResult::needMoreBytes();
    }

    const char *data = buffer.constData();
    if (quint8(data[0]) != QRfb::FramebufferUpdate || quint8(data[1]) != 0
        || qFromBigEndian<quint16>(data + 2) != 1) {
        return QRfbParseResult::fatal(u"unknown packet header %1"_s
                                          .arg(QString::fromLatin1(buffer.left(4).toHex())));
    }

    QRfbRectangle rect;
    rect.x = qFromBigEndian<quint16>(data + 4);
    rect.y = qFromBigEndian<quint16>(data + 6);
    rect.width = qFromBigEndian<quint16>(data + 8);
    rect.height = qFromBigEndian<quint16>(data + 10);
    rect.encoding = qFromBigEndian<qint32>(data + 12);

    if (rect.encoding != QRfb::RawEncoding)
        return QRfbParseResult::fatal(u"invalid encoding: %1"_s.arg(rect.encoding));

    if (int(rect.x) + rect.width > m_framebufferWidth || int(rect.y) + rect.height > m_framebufferHeight) {
        return QRfbParseResult::fatal(u"rectangle %1,%2 %3x%4 is outside the %5x%6 framebuffer"_s
                                          .arg(rect.x).arg(rect.y).arg(rect.width).arg(rect.height)
                                          .arg(m_framebufferWidth).arg(m_framebufferHeight));
    }

    const qint64 payloadSize = rect.payloadSize();
    if (payloadSize > m_maximumPayloadSize) {
        return QRfbParseResult::fatal(u"rectangle payload of %1 bytes exceeds the limit of %2 bytes"_s
                                          .arg(payloadSize).arg(m_maximumPayloadSize));
    }

    const qsizetype total = HeaderSize + qsizetype(payloadSize);
    if (buffer.size() < total) {
        qCDebug(lcRfbClient) << "Waiting for rectangle payload:" << buffer.size() << "of" << total;
        return QRfbParseResult::needMoreBytes();
    }

    qCDebug(lcRfbClient) << "Screen update:" << rect;
    QRfbParseResult result = QRfbParseResult::consumed(total, QRfb::ParseState::SteadyStateUpdates);
    result.rectangle = rect;
    result.pixels = buffer.mid(HeaderSize, qsizetype(payloadSize));
    return result;
}

QT_END_NAMESPACE
