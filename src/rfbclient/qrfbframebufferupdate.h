// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBFRAMEBUFFERUPDATE_H
#define QRFBFRAMEBUFFERUPDATE_H

#include "qrfbtypes.h"

QT_BEGIN_NAMESPACE

/*!
    \class QRfbFramebufferUpdateParser
    \brief Decodes single-rectangle raw-encoded FramebufferUpdate messages.

    The parser is stateless apart from its limits: the framebuffer geometry
    announced in ServerInit and the largest payload it is willing to wait for.
*/
class QRfbFramebufferUpdateParser
{
public:
    // message type, padding, rectangle count, x, y, w, h, encoding
    static constexpr qsizetype HeaderSize = 1 + 1 + 2 + 2 + 2 + 2 + 2 + 4;
    static constexpr qint64 DefaultMaximumPayloadSize = 64 * 1024 * 1024;

    void setFramebufferSize(quint16 width, quint16 height);
    quint16 framebufferWidth() const { return m_framebufferWidth; }
    quint16 framebufferHeight() const { return m_framebufferHeight; }

    void setMaximumPayloadSize(qint64 size) { m_maximumPayloadSize = size; }
    qint64 maximumPayloadSize() const { return m_maximumPayloadSize; }

    QRfbParseResult parse(const QByteArray &buffer) const;

private:
    quint16 m_framebufferWidth = 0;
    quint16 m_framebufferHeight = 0;
    qint64 m_maximumPayloadSize = DefaultMaximumPayloadSize;
};

QT_END_NAMESPACE

#endif // QRFBFRAMEBUFFERUPDATE_H
