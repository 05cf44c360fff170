// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBCLIENTPROTOCOL_H
#define QRFBCLIENTPROTOCOL_H

#include "qrfbtypes.h"
#include <QtCore/QObject>
#include <QtCore/QScopedPointer>

QT_BEGIN_NAMESPACE

class /*Q_RFBCLIENT_EXPORT*/ QRfbClientProtocol : public QObject
{
    Q_OBJECT
    Q_PROPERTY(QRfb::ParseState state READ state NOTIFY stateChanged)
public:
    // width, height, pixel format, name length
    static constexpr qsizetype ServerInitHeaderSize = 2 + 2 + QRfbPixelFormat::WireSize + 4;
    static constexpr quint32 DefaultMaximumNameLength = 4096;

    explicit QRfbClientProtocol(QObject *parent = nullptr);
    ~QRfbClientProtocol() override;

    qsizetype feed(const QByteArray &buffer);

    QRfb::ParseState state() const;
    bool isAborted() const;
    QString abortReason() const;

    QList<QRfb::SecurityType> advertisedSecurityTypes() const;
    QRfbServerInit serverInit() const;

    qint64 maximumPayloadSize() const;
    void setMaximumPayloadSize(qint64 size);
    quint32 maximumNameLength() const;
    void setMaximumNameLength(quint32 length);

    static QByteArray setEncodingsMessage(const QList<qint32> &encodings);

signals:
    void outgoingData(const QByteArray &data);
    void aborted(const QByteArray &packet, const QString &reason);
    void stateChanged(QRfb::ParseState state);
    void securityTypesReceived(const QList<QRfb::SecurityType> &securityTypes);
    void serverInitReceived(const QRfbServerInit &serverInit);
    void rectangleReceived(const QRfbRectangle &rectangle, const QByteArray &pixels);

private:
    class Private;
    QScopedPointer<Private> d;
};

QT_END_NAMESPACE

#endif // QRFBCLIENTPROTOCOL_H
