// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBTYPES_H
#define QRFBTYPES_H

#include "qtrfbclientglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <QtCore/QMetaType>
#include <QtCore/QObject>
#include <QtCore/QRect>

#include <optional>

QT_BEGIN_NAMESPACE

namespace QRfb {
Q_NAMESPACE

/*!
    \enum QRfb::ParseState
    \brief Identifies which parser owns the bytes arriving from the server.

    A session walks through the states in declaration order and never goes
    back. A fatal error is not a state; it collapses the session instead.
*/
enum class ParseState {
    AwaitingSecurityHandshake, ///< Waiting for the list of security types
    AwaitingSecurityResult,    ///< Waiting for the 32-bit security result
    AwaitingClientInit,        ///< Waiting for the ServerInit message
    SteadyStateUpdates,        ///< Parsing framebuffer updates
};
Q_ENUM_NS(ParseState)

// Unknown codes are kept as-is; the underlying type is fixed so any byte is representable.
enum SecurityType : quint8 {
    SecurityTypeInvalid = 0,
    SecurityTypeNone = 1,
    SecurityTypeVncAuthentication = 2,
    SecurityTypeRA2 = 5,
    SecurityTypeRA2ne = 6,
    SecurityTypeTight = 16,
    SecurityTypeUltra = 17,
    SecurityTypeTLS = 18,
    SecurityTypeVeNCrypt = 19,
    SecurityTypeGtkVncSasl = 20,
    SecurityTypeMd5HashAuthentication = 21,
    SecurityTypeColinDeanXvp = 22,
};
Q_ENUM_NS(SecurityType)

enum ClientMessageType : quint8 {
    SetPixelFormat = 0x00,
    SetEncodings = 0x02,
    FramebufferUpdateRequest = 0x03,
};

enum ServerMessageType : quint8 {
    FramebufferUpdate = 0x00,
};

enum EncodingType : qint32 {
    RawEncoding = 0,
};

bool isKnownSecurityType(SecurityType type);

} // namespace QRfb

/*!
    \struct QRfbPixelFormat
    \brief The 16-byte pixel format descriptor sent in ServerInit and SetPixelFormat.
*/
struct QRfbPixelFormat
{
    static constexpr qsizetype WireSize = 16;

    quint8 bitsPerPixel = 0;
    quint8 depth = 0;
    quint8 bigEndianFlag = 0;
    quint8 trueColourFlag = 0;
    quint16 redMax = 0;
    quint16 greenMax = 0;
    quint16 blueMax = 0;
    quint8 redShift = 0;
    quint8 greenShift = 0;
    quint8 blueShift = 0;

    // data must hold at least WireSize bytes
    static QRfbPixelFormat fromWire(const char *data);
    QByteArray toWire() const;

    // 32 bpp, depth 24, little endian, 8 bits per channel at shifts 16/8/0
    static QRfbPixelFormat rgb32();
};

/*!
    \struct QRfbServerInit
    \brief The decoded ServerInit message.

    Immutable once parsed. \c name holds the raw name bytes as sent by the server.
*/
struct QRfbServerInit
{
    quint16 framebufferWidth = 0;
    quint16 framebufferHeight = 0;
    QRfbPixelFormat pixelFormat;
    QByteArray name;

    QString sessionName() const { return QString::fromUtf8(name); }
};

/*!
    \struct QRfbRectangle
    \brief One rectangle header of a framebuffer update.
*/
struct QRfbRectangle
{
    quint16 x = 0;
    quint16 y = 0;
    quint16 width = 0;
    quint16 height = 0;
    qint32 encoding = QRfb::RawEncoding;

    // Widened so that 65535 * 65535 * 4 cannot overflow.
    qint64 payloadSize() const { return qint64(width) * qint64(height) * 4; }
    QRect toRect() const { return QRect(x, y, width, height); }
};

/*!
    \struct QRfbParseResult
    \brief The outcome of running one parser state over the buffered bytes.

    A result is one of three things:
    \list
    \li \c NeedMoreBytes: the buffer does not hold a complete message. Nothing
        was consumed and nothing must be done.
    \li \c Consumed: \c bytesConsumed bytes were parsed. The caller switches to
        \c nextState and sends \c reply if it is not empty.
    \li \c Fatal: the input is a protocol violation described by \c reason.
    \endlist

    Handlers never touch session state themselves; they describe what should
    happen and QRfbClientProtocol::feed() applies it.
*/
struct QRfbParseResult
{
    enum Status {
        NeedMoreBytes,
        Consumed,
        Fatal,
    };

    Status status = NeedMoreBytes;
    qsizetype bytesConsumed = 0;
    QRfb::ParseState nextState = QRfb::ParseState::AwaitingSecurityHandshake;
    QString reason;

    QByteArray reply;
    QList<QRfb::SecurityType> securityTypes;
    std::optional<QRfbServerInit> serverInit;
    std::optional<QRfbRectangle> rectangle;
    QByteArray pixels;

    static QRfbParseResult needMoreBytes() { return QRfbParseResult(); }
    static QRfbParseResult consumed(qsizetype bytes, QRfb::ParseState next)
    {
        QRfbParseResult result;
        result.status = Consumed;
        result.bytesConsumed = bytes;
        result.nextState = next;
        return result;
    }
    static QRfbParseResult fatal(const QString &reason)
    {
        QRfbParseResult result;
        result.status = Fatal;
        result.reason = reason;
        return result;
    }
};

QDebug operator<<(QDebug debug, const QRfbRectangle &rectangle);

QT_END_NAMESPACE

Q_DECLARE_METATYPE(QRfbPixelFormat)
Q_DECLARE_METATYPE(QRfbServerInit)
Q_DECLARE_METATYPE(QRfbRectangle)

#endif // QRFBTYPES_H
