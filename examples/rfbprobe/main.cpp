// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtCore/QCoreApplication>
#include <QtCore/QCommandLineParser>
#include <QtCore/QMetaEnum>
#include <QtCore/QSettings>
#include <QtCore/QTextStream>
#include <QtCore/QTimer>
#include <QtNetwork/QTcpSocket>

#include "qrfbbackendvalidator.h"
#include "qrfbclient.h"
#include "qrfbclientprotocol.h"
#include "qrfbopensslbackend.h"

static QString securityTypeName(QRfb::SecurityType type)
{
    if (!QRfb::isKnownSecurityType(type))
        return u"unknown(%1)"_s.arg(int(type));
    const QMetaEnum metaEnum = QMetaEnum::fromType<QRfb::SecurityType>();
    return QString::fromLatin1(metaEnum.valueToKey(type));
}

static int checkCrypto(QTextStream &out)
{
    const QRfbOpenSslBackend ctr(QRfbCipherBackend::CTR);
    const QRfbOpenSslBackend cfb(QRfbCipherBackend::CFB);
    const QRfbBackendValidator validator;

    int failures = 0;
    for (const QRfbCipherBackend *backend : { static_cast<const QRfbCipherBackend *>(&ctr),
                                              static_cast<const QRfbCipherBackend *>(&cfb) }) {
        QString errorString;
        if (validator.validate(*backend, &errorString)) {
            out << backend->name() << ": ok" << Qt::endl;
        } else {
            out << backend->name() << ": FAILED (" << errorString << ")" << Qt::endl;
            failures++;
        }
    }

    const QRfbCipherBackend *selected = validator.selectBackend({ validator.config().mode == QRfbCipherBackend::CTR ? &ctr : &cfb,
                                                                  &ctr, &cfb });
    out << "Selected backend: " << (selected ? selected->name() : u"none"_s) << Qt::endl;
    return failures == 0 ? 0 : 1;
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName(QStringLiteral("Signal Slot Inc."));
    app.setOrganizationDomain("signal-slot.co.jp");
    app.setApplicationName("rfbprobe");
    app.setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(u"Connects to an RFB server and reports its session parameters."_s);
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(u"host"_s, u"Server to probe. Defaults to the last host used."_s, u"[host]"_s);
    QCommandLineOption portOption({ u"p"_s, u"port"_s }, u"Server port."_s, u"port"_s);
    QCommandLineOption timeoutOption({ u"t"_s, u"timeout"_s }, u"Give up after <ms> milliseconds."_s, u"ms"_s, u"10000"_s);
    QCommandLineOption cryptoOption(u"check-crypto"_s, u"Validate the cipher backends and exit."_s);
    parser.addOption(portOption);
    parser.addOption(timeoutOption);
    parser.addOption(cryptoOption);
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    if (parser.isSet(cryptoOption))
        return checkCrypto(out);

    QSettings settings;
    settings.beginGroup("Probe");
    const QStringList positional = parser.positionalArguments();
    const QString host = positional.isEmpty() ? settings.value("server", u"localhost"_s).toString() : positional.first();
    bool ok = true;
    const int port = parser.isSet(portOption) ? parser.value(portOption).toInt(&ok) : settings.value("port", 5900).toInt();
    if (!ok || port <= 0 || port > 65535) {
        err << "Invalid port: " << parser.value(portOption) << Qt::endl;
        return 2;
    }
    const int timeout = parser.value(timeoutOption).toInt(&ok);
    if (!ok || timeout <= 0) {
        err << "Invalid timeout: " << parser.value(timeoutOption) << Qt::endl;
        return 2;
    }
    settings.setValue("server", host);
    settings.setValue("port", port);
    settings.endGroup();

    QTcpSocket socket;
    QRfbClient client;
    client.setSocket(&socket);

    QObject::connect(&client, &QRfbClient::serverNameChanged, &app, [&]() {
        out << "Server:   " << host << ':' << port << Qt::endl;
        out << "Session:  " << client.serverName() << Qt::endl;
        out << "Geometry: " << client.framebufferWidth() << 'x' << client.framebufferHeight() << Qt::endl;
        QStringList types;
        for (QRfb::SecurityType type : client.protocol()->advertisedSecurityTypes())
            types << securityTypeName(type);
        out << "Security: " << types.join(u", "_s) << Qt::endl;
        socket.disconnectFromHost();
        app.exit(0);
    });
    QObject::connect(&client, &QRfbClient::connectionFailed, &app, [&](const QString &reason) {
        err << host << ':' << port << ": " << reason << Qt::endl;
        app.exit(1);
    });
    QObject::connect(&socket, &QTcpSocket::errorOccurred, &app, [&](QAbstractSocket::SocketError) {
        err << host << ':' << port << ": " << socket.errorString() << Qt::endl;
        app.exit(1);
    });
    QTimer::singleShot(timeout, &app, [&]() {
        err << host << ':' << port << ": no ServerInit within " << timeout << " ms" << Qt::endl;
        app.exit(1);
    });

    socket.connectToHost(host, quint16(port));
    return app.exec();
}
