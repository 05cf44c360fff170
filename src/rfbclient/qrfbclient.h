// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBCLIENT_H
#define QRFBCLIENT_H

#include "qrfbtypes.h"
#include <QtNetwork/QTcpSocket>
#include <QtGui/QImage>
#include <QtCore/QScopedPointer>

QT_BEGIN_NAMESPACE

class QRfbClientProtocol;

class /*Q_RFBCLIENT_EXPORT*/ QRfbClient : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QTcpSocket *socket READ socket WRITE setSocket NOTIFY socketChanged)
    Q_PROPERTY(ProtocolVersion protocolVersion READ protocolVersion NOTIFY protocolVersionChanged)
    Q_PROPERTY(QString serverName READ serverName NOTIFY serverNameChanged)
public:
    enum ProtocolVersion {
        ProtocolVersionUnknown,
        ProtocolVersion38 = 0x0308,
    };
    Q_ENUM(ProtocolVersion)

    explicit QRfbClient(QObject *parent = nullptr);
    ~QRfbClient() override;

    QTcpSocket *socket() const;
    ProtocolVersion protocolVersion() const;
    QString serverName() const;

    // Get framebuffer size
    int framebufferWidth() const;
    int framebufferHeight() const;

    // Get current image
    QImage image() const;

    QRfbClientProtocol *protocol() const;

public slots:
    void setSocket(QTcpSocket *socket);

private:
    void setProtocolVersion(ProtocolVersion protocolVersion);

signals:
    void socketChanged(QTcpSocket *socket);
    void protocolVersionChanged(ProtocolVersion protocolVersion);
    void serverNameChanged(const QString &serverName);
    void framebufferSizeChanged(int width, int height);
    void imageChanged(const QRect &rect);
    void connectionStateChanged(bool connected);
    void connectionFailed(const QString &reason);

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QRFBCLIENT_H
