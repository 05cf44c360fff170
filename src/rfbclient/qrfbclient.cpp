// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

//
// QRfbClient
// ==========
//
// Drives a QRfbClientProtocol from a QTcpSocket:
// - exchanges the "RFB 003.008\n" protocol version banner
// - keeps the accumulation buffer and re-offers undispatched bytes to the
//   protocol until it stops making progress
// - writes the protocol's replies to the socket
// - requests framebuffer updates and paints raw rectangles into a QImage
// - reports protocol violations as connectionFailed() and drops the socket
//
#include "qrfbclient.h"
#include "qrfbclientprotocol.h"

#include <QtCore/QDebug>
#include <QtCore/QPointer>
#include <QtCore/QtEndian>

/*!
    \internal
    \class QRfbClient::Private
    \brief Transport-side state of one QRfbClient.
*/
class QRfbClient::Private
{
public:
    /*!
        \internal
        \enum QRfbClient::Private::TransportState
        \brief Which layer currently owns incoming bytes.
    */
    enum TransportState {
        ProtocolVersionState, ///< Waiting for the server's version banner
        ProtocolState,        ///< Bytes go to QRfbClientProtocol
        FailedState,          ///< The session is dead, input is dropped
    };

    Private(QRfbClient *parent);

private:
    bool isValid() const {
        return socket && socket->state() == QTcpSocket::ConnectedState;
    }

    void reset();
    void createProtocol();
    void read();
    bool parseProtocolVersion();
    void fail(const QString &reason);

    void write(const QByteArray &data) {
        if (isValid())
            socket->write(data);
    }

    void serverInitReceived(const QRfbServerInit &serverInit);
    void setPixelFormat(const QRfbPixelFormat &format);
    void framebufferUpdateRequest(bool incremental = true, const QRect &rect = QRect());
    void handleRawEncoding(const QRfbRectangle &rect, const QByteArray &pixels);

private:
    QRfbClient *q;
    QPointer<QTcpSocket> prev;
    TransportState state = ProtocolVersionState;
    QByteArray buffer;
    QRfbPixelFormat pixelFormat = QRfbPixelFormat::rgb32();
public:
    QTcpSocket *socket = nullptr;
    QRfbClientProtocol *protocol = nullptr;
    ProtocolVersion protocolVersion = ProtocolVersionUnknown;
    QString serverName;
    QImage image;
    int frameBufferWidth = 0;
    int frameBufferHeight = 0;
};

QRfbClient::Private::Private(QRfbClient *parent)
    : q(parent)
{
    createProtocol();

    connect(q, &QRfbClient::socketChanged, q, [this](QTcpSocket *socket) {
        if (prev) {
            disconnect(prev, nullptr, q, nullptr);
        }

        if (socket) {
            connect(socket, &QTcpSocket::connected, q, [this]() {
                qCInfo(lcRfbClient) << "Connected to RFB server";
                reset();
                emit q->connectionStateChanged(true);
                read();
            });
            connect(socket, &QTcpSocket::disconnected, q, [this]() {
                qCInfo(lcRfbClient) << "Disconnected from RFB server";
                emit q->connectionStateChanged(false);
            });
            connect(socket, &QTcpSocket::readyRead, q, [this]() {
                read();
            });
        }
        prev = socket;
    });
}

/*!
    \internal
    Starts a fresh session. Every connection gets its own protocol parser so
    that nothing leaks from one session into the next.
*/
void QRfbClient::Private::reset()
{
    state = ProtocolVersionState;
    buffer.clear();
    serverName.clear();
    q->setProtocolVersion(ProtocolVersionUnknown);
    createProtocol();
}

void QRfbClient::Private::createProtocol()
{
    delete protocol;
    protocol = new QRfbClientProtocol(q);
    connect(protocol, &QRfbClientProtocol::outgoingData, q, [this](const QByteArray &data) {
        write(data);
    });
    connect(protocol, &QRfbClientProtocol::aborted, q, [this](const QByteArray &, const QString &reason) {
        fail(reason);
    });
    connect(protocol, &QRfbClientProtocol::serverInitReceived, q, [this](const QRfbServerInit &serverInit) {
        serverInitReceived(serverInit);
    });
    connect(protocol, &QRfbClientProtocol::rectangleReceived, q,
            [this](const QRfbRectangle &rect, const QByteArray &pixels) {
        handleRawEncoding(rect, pixels);
    });
}

/*!
    \internal
    Appends whatever the socket has to the accumulation buffer and hands the
    buffer to the current layer until it stops consuming.
*/
void QRfbClient::Private::read()
{
    if (!socket)
        return;
    buffer += socket->readAll();

    if (state == ProtocolVersionState && !parseProtocolVersion())
        return;

    while (state == ProtocolState && !buffer.isEmpty()) {
        const qsizetype consumed = protocol->feed(buffer);
        if (consumed == 0)
            break;
        buffer.remove(0, consumed);
    }
}

/*!
    \internal
    Parses the 12-byte "RFB xxx.yyy\n" banner.

    Only 3.8 and later 3.x servers send the security result that the
    protocol parser expects, so older servers are refused. Returns true once
    the banner has been answered.
*/
bool QRfbClient::Private::parseProtocolVersion()
{
    if (buffer.size() < 12) {
        qCDebug(lcRfbClient) << "Waiting for more protocol version data:" << buffer;
        return false;
    }
    const QByteArray value = buffer.left(12);
    buffer.remove(0, 12);

    bool majorOk = false;
    bool minorOk = false;
    const int major = value.mid(4, 3).toInt(&majorOk);
    const int minor = value.mid(8, 3).toInt(&minorOk);
    if (!value.startsWith("RFB ") || value.at(7) != '.' || value.at(11) != '\n' || !majorOk || !minorOk) {
        fail(u"invalid protocol version banner '%1'"_s.arg(QString::fromLatin1(value.toHex())));
        return false;
    }
    if (major != 3 || minor < 8) {
        fail(u"unsupported protocol version %1.%2"_s.arg(major).arg(minor));
        return false;
    }

    qCDebug(lcRfbClient) << "Server protocol version:" << value.trimmed();
    write("RFB 003.008\n");
    state = ProtocolState;
    q->setProtocolVersion(ProtocolVersion38);
    return true;
}

void QRfbClient::Private::fail(const QString &reason)
{
    if (state == FailedState)
        return;
    state = FailedState;
    buffer.clear();
    qCWarning(lcRfbClient) << "Connection failed:" << reason;
    emit q->connectionFailed(reason);
    if (socket)
        socket->abort();
}

void QRfbClient::Private::serverInitReceived(const QRfbServerInit &serverInit)
{
    frameBufferWidth = serverInit.framebufferWidth;
    frameBufferHeight = serverInit.framebufferHeight;
    emit q->framebufferSizeChanged(frameBufferWidth, frameBufferHeight);

    image = QImage(frameBufferWidth, frameBufferHeight, QImage::Format_RGB32);
    image.fill(Qt::black);

    serverName = serverInit.sessionName();
    emit q->serverNameChanged(serverName);

    // raw rectangles are sized at 4 bytes per pixel
    setPixelFormat(pixelFormat);
    framebufferUpdateRequest(false);
}

/*!
    \internal
    Sends a SetPixelFormat message: message type, three bytes of padding
    and the 16-byte pixel format.
*/
void QRfbClient::Private::setPixelFormat(const QRfbPixelFormat &format)
{
    QByteArray message(4, '\0');
    message[0] = char(QRfb::SetPixelFormat);
    write(message + format.toWire());
}

/*!
    \internal
    Sends a FramebufferUpdateRequest for \a rect, or for the whole
    framebuffer if \a rect is empty.
*/
void QRfbClient::Private::framebufferUpdateRequest(bool incremental, const QRect &rect)
{
    const QRect area = rect.isEmpty() ? QRect(0, 0, frameBufferWidth, frameBufferHeight) : rect;
    QByteArray message(10, '\0');
    message[0] = char(QRfb::FramebufferUpdateRequest);
    message[1] = char(incremental ? 1 : 0);
    qToBigEndian<quint16>(quint16(area.x()), message.data() + 2);
    qToBigEndian<quint16>(quint16(area.y()), message.data() + 4);
    qToBigEndian<quint16>(quint16(area.width()), message.data() + 6);
    qToBigEndian<quint16>(quint16(area.height()), message.data() + 8);
    write(message);
}

/*!
    \internal
    Paints a raw rectangle. The protocol parser has already checked that the
    rectangle lies inside the framebuffer and that \a pixels holds
    width * height 32-bit pixels.
*/
void QRfbClient::Private::handleRawEncoding(const QRfbRectangle &rect, const QByteArray &pixels)
{
    const char *data = pixels.constData();
    for (int y = 0; y < rect.height; y++) {
        QRgb *line = reinterpret_cast<QRgb *>(image.scanLine(rect.y + y)) + rect.x;
        for (int x = 0; x < rect.width; x++) {
            const quint32 color = qFromLittleEndian<quint32>(data);
            data += 4;
            const auto r = (color >> pixelFormat.redShift) & pixelFormat.redMax;
            const auto g = (color >> pixelFormat.greenShift) & pixelFormat.greenMax;
            const auto b = (color >> pixelFormat.blueShift) & pixelFormat.blueMax;
            line[x] = qRgb(r, g, b);
        }
    }
    emit q->imageChanged(rect.toRect());
    framebufferUpdateRequest();
}

/*!
    \class QRfbClient
    \inmodule QtRfbClient

    \brief The QRfbClient class connects a QRfbClientProtocol to a QTcpSocket.

    QRfbClient performs the protocol version exchange, feeds received bytes
    to the protocol parser, and keeps an image of the remote framebuffer.

    \sa QRfbClientProtocol
*/

/*!
    Constructs an RFB client with the given \a parent object.
*/
QRfbClient::QRfbClient(QObject *parent)
    : QObject(parent)
    , d(new Private(this))
{
}

/*!
    Destroys the client.
*/
QRfbClient::~QRfbClient() = default;

/*!
    Returns the TCP socket used for the connection.

    \sa setSocket()
*/
QTcpSocket *QRfbClient::socket() const
{
    return d->socket;
}

/*!
    Sets the socket used for RFB communication to \a socket.

    \note The socket is created and connected by the caller. The handshake
    starts once the socket reports that it is connected.

    \sa socket()
*/
void QRfbClient::setSocket(QTcpSocket *socket)
{
    if (d->socket == socket) return;
    d->socket = socket;
    emit socketChanged(socket);
}

/*!
    Returns the negotiated protocol version.
*/
QRfbClient::ProtocolVersion QRfbClient::protocolVersion() const
{
    return d->protocolVersion;
}

void QRfbClient::setProtocolVersion(QRfbClient::ProtocolVersion protocolVersion)
{
    if (d->protocolVersion == protocolVersion) return;
    d->protocolVersion = protocolVersion;
    emit protocolVersionChanged(protocolVersion);
}

/*!
    Returns the desktop name announced by the server, or an empty string
    before ServerInit has been received.
*/
QString QRfbClient::serverName() const
{
    return d->serverName;
}

int QRfbClient::framebufferWidth() const
{
    return d->frameBufferWidth;
}

int QRfbClient::framebufferHeight() const
{
    return d->frameBufferHeight;
}

/*!
    Returns the current framebuffer image.

    \sa imageChanged()
*/
QImage QRfbClient::image() const
{
    return d->image;
}

/*!
    Returns the protocol parser of the current session. A new parser is
    created for every connection.
*/
QRfbClientProtocol *QRfbClient::protocol() const
{
    return d->protocol;
}
