// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

//
// QRfbClientProtocol
// ==================
//
// Incremental parser for the client side of an RFB session, from the
// security handshake to steady-state framebuffer updates.
//
// The owner keeps an accumulation buffer of undispatched bytes and calls
// feed() with all of it whenever more data arrives. feed() runs exactly one
// state handler and returns how many bytes it consumed:
//
// - 0 means the current message is incomplete (or the session has been
//   aborted). Nothing was sent and the state did not change.
// - N > 0 means the first N bytes were a complete message. The remainder
//   belongs to the next state and must be offered again.
//
// Protocol version exchange happens before this parser is involved; see
// QRfbClient.
//
#include "qrfbclientprotocol.h"
#include "qrfbframebufferupdate.h"

#include <QtCore/QtEndian>

/*!
    \internal
    \class QRfbClientProtocol::Private
    \brief Holds the session state and the per-state handlers.

    Each handler is a const function of the buffered bytes that returns a
    QRfbParseResult. Only feed() applies a result to the session, which keeps
    every transition in one place.
*/
class QRfbClientProtocol::Private
{
public:
    Private(QRfbClientProtocol *parent);

    QRfbParseResult parseSecurityHandshake(const QByteArray &buffer) const;
    QRfbParseResult parseSecurityResult(const QByteArray &buffer) const;
    QRfbParseResult parseClientInit(const QByteArray &buffer) const;

    void apply(const QRfbParseResult &result);
    void abort(const QByteArray &packet, const QString &reason);

private:
    QRfbClientProtocol *q;

public:
    QRfb::ParseState state = QRfb::ParseState::AwaitingSecurityHandshake;
    bool aborted = false;
    QString abortReason;
    QList<QRfb::SecurityType> securityTypes;
    QRfbServerInit serverInit;
    quint32 maximumNameLength = DefaultMaximumNameLength;
    QRfbFramebufferUpdateParser updateParser;
};

QRfbClientProtocol::Private::Private(QRfbClientProtocol *parent)
    : q(parent)
{
}

/*!
    \internal
    Parses the security type list: one count byte followed by that many
    type codes.

    A count of zero means the server refused the connection. Only "none"
    is supported, and it has to be the server's first choice.
*/
QRfbParseResult QRfbClientProtocol::Private::parseSecurityHandshake(const QByteArray &buffer) const
{
    if (buffer.size() < 1) {
        qCDebug(lcRfbClient) << "Waiting for security type count";
        return QRfbParseResult::needMoreBytes();
    }
    const quint8 numberOfSecurityTypes = quint8(buffer.at(0));
    if (numberOfSecurityTypes == 0)
        return QRfbParseResult::fatal(u"cannot parse security handshake '%1'"_s
                                          .arg(QString::fromLatin1(buffer.left(1).toHex())));

    if (buffer.size() < 1 + numberOfSecurityTypes) {
        qCDebug(lcRfbClient) << "Waiting for security types:" << buffer.size() - 1 << "of" << numberOfSecurityTypes;
        return QRfbParseResult::needMoreBytes();
    }

    QList<QRfb::SecurityType> types;
    types.reserve(numberOfSecurityTypes);
    for (int i = 0; i < numberOfSecurityTypes; i++)
        types.append(static_cast<QRfb::SecurityType>(quint8(buffer.at(1 + i))));
    qCDebug(lcRfbClient) << "Security types:" << types;

    if (types.first() != QRfb::SecurityTypeNone) {
        QRfbParseResult result = QRfbParseResult::fatal(u"security type %1 not supported"_s.arg(int(types.first())));
        result.securityTypes = types;
        return result;
    }

    QRfbParseResult result = QRfbParseResult::consumed(1 + numberOfSecurityTypes,
                                                       QRfb::ParseState::AwaitingSecurityResult);
    result.securityTypes = types;
    result.reply = QByteArray(1, '\0'); // selector: no authentication
    return result;
}

/*!
    \internal
    Parses the 32-bit security result. Anything but zero is a refusal.
*/
QRfbParseResult QRfbClientProtocol::Private::parseSecurityResult(const QByteArray &buffer) const
{
    if (buffer.size() < 4) {
        qCDebug(lcRfbClient) << "Waiting for security result:" << buffer.size() << "of 4";
        return QRfbParseResult::needMoreBytes();
    }
    const quint32 status = qFromBigEndian<quint32>(buffer.constData());
    if (status != 0)
        return QRfbParseResult::fatal(u"authentication denied, server returned %1"_s.arg(status));

    qCDebug(lcRfbClient) << "Security result: success";
    QRfbParseResult result = QRfbParseResult::consumed(4, QRfb::ParseState::AwaitingClientInit);
    const bool share = false;
    result.reply = QByteArray(1, char(share ? 1 : 0));
    return result;
}

/*!
    \internal
    Parses the ServerInit message.

    The fixed header ends with the length of the server name, so the
    message is only complete once header and name are both buffered.
    The name length is bounded to keep a hostile server from making us
    wait for gigabytes.
*/
QRfbParseResult QRfbClientProtocol::Private::parseClientInit(const QByteArray &buffer) const
{
    if (buffer.size() < ServerInitHeaderSize) {
        qCDebug(lcRfbClient) << "Waiting for server init data:" << buffer.size() << "of" << ServerInitHeaderSize;
        return QRfbParseResult::needMoreBytes();
    }

    const char *data = buffer.constData();
    const quint32 nameLength = qFromBigEndian<quint32>(data + ServerInitHeaderSize - 4);
    if (nameLength > maximumNameLength)
        return QRfbParseResult::fatal(u"server name length %1 exceeds the limit of %2"_s
                                          .arg(nameLength).arg(maximumNameLength));

    const qsizetype total = ServerInitHeaderSize + qsizetype(nameLength);
    if (buffer.size() < total) {
        qCDebug(lcRfbClient) << "Waiting for name data:" << buffer.size() << "of" << total;
        return QRfbParseResult::needMoreBytes();
    }

    QRfbServerInit init;
    init.framebufferWidth = qFromBigEndian<quint16>(data);
    init.framebufferHeight = qFromBigEndian<quint16>(data + 2);
    init.pixelFormat = QRfbPixelFormat::fromWire(data + 4);
    init.name = buffer.mid(ServerInitHeaderSize, qsizetype(nameLength));

    QRfbParseResult result = QRfbParseResult::consumed(total, QRfb::ParseState::SteadyStateUpdates);
    result.serverInit = init;
    result.reply = setEncodingsMessage({ QRfb::RawEncoding });
    return result;
}

/*!
    \internal
    Applies a successful result: records the decoded data, advances the
    state and emits the reply and the decoded messages.
*/
void QRfbClientProtocol::Private::apply(const QRfbParseResult &result)
{
    if (!result.securityTypes.isEmpty()) {
        securityTypes = result.securityTypes;
        emit q->securityTypesReceived(securityTypes);
    }

    if (result.serverInit) {
        serverInit = *result.serverInit;
        updateParser.setFramebufferSize(serverInit.framebufferWidth, serverInit.framebufferHeight);
        qCInfo(lcRfbClient) << "RFB server session" << serverInit.sessionName()
                            << serverInit.framebufferWidth << "x" << serverInit.framebufferHeight;
        qCDebug(lcRfbClient) << "Pixel format:";
        qCDebug(lcRfbClient) << "  Bits per pixel:" << serverInit.pixelFormat.bitsPerPixel;
        qCDebug(lcRfbClient) << "  Depth:" << serverInit.pixelFormat.depth;
        qCDebug(lcRfbClient) << "  Big endian:" << serverInit.pixelFormat.bigEndianFlag;
        qCDebug(lcRfbClient) << "  True color:" << serverInit.pixelFormat.trueColourFlag;
    }

    const bool changed = state != result.nextState;
    state = result.nextState;

    if (!result.reply.isEmpty())
        emit q->outgoingData(result.reply);
    if (result.serverInit)
        emit q->serverInitReceived(serverInit);
    if (result.rectangle)
        emit q->rectangleReceived(*result.rectangle, result.pixels);
    if (changed) {
        qCDebug(lcRfbClient) << "State changed to:" << state;
        emit q->stateChanged(state);
    }
}

void QRfbClientProtocol::Private::abort(const QByteArray &packet, const QString &reason)
{
    aborted = true;
    abortReason = reason;
    qCWarning(lcRfbClient) << "Protocol error:" << reason;
    emit q->aborted(packet, reason);
}

/*!
    \class QRfbClientProtocol
    \inmodule QtRfbClient

    \brief The QRfbClientProtocol class parses the server side of an RFB
    session after the protocol version has been agreed.

    The class performs no I/O. Bytes to be sent to the server are emitted
    through outgoingData(), and fatal errors through aborted().

    \sa QRfbClient
*/

/*!
    Constructs a protocol parser in the AwaitingSecurityHandshake state with
    the given \a parent.
*/
QRfbClientProtocol::QRfbClientProtocol(QObject *parent)
    : QObject(parent)
    , d(new Private(this))
{
}

/*!
    Destroys the parser.
*/
QRfbClientProtocol::~QRfbClientProtocol() = default;

/*!
    Offers the undispatched bytes in \a buffer to the current state.

    Returns the number of bytes consumed from the front of \a buffer, or 0 if
    more data is needed. The caller removes the consumed bytes and calls
    feed() again with what remains.

    A protocol violation emits aborted() once and returns 0. The parser stays
    collapsed afterwards and ignores any further input.
*/
qsizetype QRfbClientProtocol::feed(const QByteArray &buffer)
{
    if (d->aborted)
        return 0;

    QRfbParseResult result;
    switch (d->state) {
    case QRfb::ParseState::AwaitingSecurityHandshake:
        result = d->parseSecurityHandshake(buffer);
        break;
    case QRfb::ParseState::AwaitingSecurityResult:
        result = d->parseSecurityResult(buffer);
        break;
    case QRfb::ParseState::AwaitingClientInit:
        result = d->parseClientInit(buffer);
        break;
    case QRfb::ParseState::SteadyStateUpdates:
        result = d->updateParser.parse(buffer);
        break;
    }

    switch (result.status) {
    case QRfbParseResult::NeedMoreBytes:
        return 0;
    case QRfbParseResult::Fatal:
        if (!result.securityTypes.isEmpty())
            d->securityTypes = result.securityTypes;
        d->abort(buffer, result.reason);
        return 0;
    case QRfbParseResult::Consumed:
        break;
    }

    Q_ASSERT(result.bytesConsumed > 0 && result.bytesConsumed <= buffer.size());
    d->apply(result);
    return result.bytesConsumed;
}

/*!
    Returns the state that will receive the next bytes.
*/
QRfb::ParseState QRfbClientProtocol::state() const
{
    return d->state;
}

/*!
    Returns true once a protocol violation has been reported.
*/
bool QRfbClientProtocol::isAborted() const
{
    return d->aborted;
}

/*!
    Returns the reason passed to aborted(), or an empty string.
*/
QString QRfbClientProtocol::abortReason() const
{
    return d->abortReason;
}

/*!
    Returns the security types the server advertised, in the server's order.
    Codes this library does not know are kept as they were received.
*/
QList<QRfb::SecurityType> QRfbClientProtocol::advertisedSecurityTypes() const
{
    return d->securityTypes;
}

/*!
    Returns the decoded ServerInit message. Only meaningful once the state
    has reached SteadyStateUpdates.
*/
QRfbServerInit QRfbClientProtocol::serverInit() const
{
    return d->serverInit;
}

qint64 QRfbClientProtocol::maximumPayloadSize() const
{
    return d->updateParser.maximumPayloadSize();
}

/*!
    Sets the largest rectangle payload, in bytes, the parser will wait for
    to \a size. Larger rectangles abort the session.
*/
void QRfbClientProtocol::setMaximumPayloadSize(qint64 size)
{
    d->updateParser.setMaximumPayloadSize(size);
}

quint32 QRfbClientProtocol::maximumNameLength() const
{
    return d->maximumNameLength;
}

void QRfbClientProtocol::setMaximumNameLength(quint32 length)
{
    d->maximumNameLength = length;
}

/*!
    Builds a SetEncodings message: message type, one padding byte, a
    big-endian 16-bit count and one big-endian 32-bit code per entry of
    \a encodings.
*/
QByteArray QRfbClientProtocol::setEncodingsMessage(const QList<qint32> &encodings)
{
    QByteArray message(4 + 4 * encodings.size(), '\0');
    message[0] = char(QRfb::SetEncodings);
    message[1] = 0; // padding
    qToBigEndian<quint16>(quint16(encodings.size()), message.data() + 2);
    for (qsizetype i = 0; i < encodings.size(); i++)
        qToBigEndian<qint32>(encodings.at(i), message.data() + 4 + 4 * i);
    return message;
}
