// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include <QtTest/QtTest>
#include <QtTest/QSignalSpy>
#include <QtCore/QObject>
#include <QtCore/QtEndian>

#include <cstring>

#include <qrfbclientprotocol.h>
#include <qrfbframebufferupdate.h>

class tst_qrfbclientprotocol : public QObject
{
    Q_OBJECT

private slots:
    void initialState();

    void securityHandshakeIncomplete_data();
    void securityHandshakeIncomplete();
    void securityHandshakeAccepted();
    void securityHandshakeKeepsTrailingBytes();
    void securityHandshakeUnsupportedType();
    void securityHandshakeUnknownTypesPreserved();
    void securityHandshakeEmptyList();

    void securityResultIncomplete();
    void securityResultDenied();
    void securityResultSuccess();

    void clientInitWaitsForName();
    void clientInitByteAtATime();
    void clientInitNameTooLong();

    void rectangleRaw();
    void rectangleZeroSized();
    void rectangleConsecutive();
    void rectangleNonRawEncoding();
    void rectangleBadHeader_data();
    void rectangleBadHeader();
    void rectangleOutsideFramebuffer();
    void rectanglePayloadLimit();

    void feedAfterAbortIsIgnored();

private:
    static QByteArray securityTypes(const QList<quint8> &types);
    static QByteArray securityResult(quint32 status);
    static QByteArray serverInit(quint16 width, quint16 height, const QByteArray &name);
    static QByteArray rectangle(quint16 x, quint16 y, quint16 w, quint16 h, qint32 encoding = 0);
    static void toSteadyState(QRfbClientProtocol *protocol, quint16 width = 64, quint16 height = 48);
    static qsizetype deliver(QRfbClientProtocol *protocol, QByteArray *pending, const QByteArray &chunk);
};

QByteArray tst_qrfbclientprotocol::securityTypes(const QList<quint8> &types)
{
    QByteArray data;
    data.append(char(types.size()));
    for (quint8 type : types)
        data.append(char(type));
    return data;
}

QByteArray tst_qrfbclientprotocol::securityResult(quint32 status)
{
    QByteArray data(4, '\0');
    qToBigEndian<quint32>(status, data.data());
    return data;
}

QByteArray tst_qrfbclientprotocol::serverInit(quint16 width, quint16 height, const QByteArray &name)
{
    QByteArray data(QRfbClientProtocol::ServerInitHeaderSize, '\0');
    qToBigEndian<quint16>(width, data.data());
    qToBigEndian<quint16>(height, data.data() + 2);
    const QByteArray format = QRfbPixelFormat::rgb32().toWire();
    memcpy(data.data() + 4, format.constData(), format.size());
    qToBigEndian<quint32>(quint32(name.size()), data.data() + 20);
    return data + name;
}

QByteArray tst_qrfbclientprotocol::rectangle(quint16 x, quint16 y, quint16 w, quint16 h, qint32 encoding)
{
    QByteArray data(QRfbFramebufferUpdateParser::HeaderSize, '\0');
    data[0] = 0; // FramebufferUpdate
    data[1] = 0; // padding
    qToBigEndian<quint16>(1, data.data() + 2);
    qToBigEndian<quint16>(x, data.data() + 4);
    qToBigEndian<quint16>(y, data.data() + 6);
    qToBigEndian<quint16>(w, data.data() + 8);
    qToBigEndian<quint16>(h, data.data() + 10);
    qToBigEndian<qint32>(encoding, data.data() + 12);
    return data;
}

void tst_qrfbclientprotocol::toSteadyState(QRfbClientProtocol *protocol, quint16 width, quint16 height)
{
    QCOMPARE(protocol->feed(securityTypes({ 1 })), 2);
    QCOMPARE(protocol->feed(securityResult(0)), 4);
    const QByteArray init = serverInit(width, height, "test");
    QCOMPARE(protocol->feed(init), init.size());
    QCOMPARE(protocol->state(), QRfb::ParseState::SteadyStateUpdates);
}

// Appends chunk to the accumulation buffer and dispatches like a transport would.
qsizetype tst_qrfbclientprotocol::deliver(QRfbClientProtocol *protocol, QByteArray *pending, const QByteArray &chunk)
{
    pending->append(chunk);
    qsizetype total = 0;
    while (!pending->isEmpty()) {
        const qsizetype consumed = protocol->feed(*pending);
        if (consumed == 0)
            break;
        pending->remove(0, consumed);
        total += consumed;
    }
    return total;
}

void tst_qrfbclientprotocol::initialState()
{
    QRfbClientProtocol protocol;
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingSecurityHandshake);
    QVERIFY(!protocol.isAborted());
    QVERIFY(protocol.abortReason().isEmpty());
    QVERIFY(protocol.advertisedSecurityTypes().isEmpty());
    QCOMPARE(protocol.feed(QByteArray()), 0);
}

void tst_qrfbclientprotocol::securityHandshakeIncomplete_data()
{
    QTest::addColumn<QByteArray>("message");

    QTest::newRow("one type") << securityTypes({ 1 });
    QTest::newRow("two types") << securityTypes({ 1, 2 });
    QTest::newRow("five types") << securityTypes({ 1, 2, 16, 18, 19 });
}

void tst_qrfbclientprotocol::securityHandshakeIncomplete()
{
    QFETCH(QByteArray, message);

    QRfbClientProtocol protocol;
    QSignalSpy outgoingSpy(&protocol, &QRfbClientProtocol::outgoingData);
    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    QSignalSpy stateSpy(&protocol, &QRfbClientProtocol::stateChanged);

    for (qsizetype length = 0; length < message.size(); length++) {
        // re-feeding the same prefix must be idempotent
        QCOMPARE(protocol.feed(message.left(length)), 0);
        QCOMPARE(protocol.feed(message.left(length)), 0);
    }
    QCOMPARE(outgoingSpy.count(), 0);
    QCOMPARE(abortSpy.count(), 0);
    QCOMPARE(stateSpy.count(), 0);
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingSecurityHandshake);

    QCOMPARE(protocol.feed(message), message.size());
}

void tst_qrfbclientprotocol::securityHandshakeAccepted()
{
    QRfbClientProtocol protocol;
    QSignalSpy outgoingSpy(&protocol, &QRfbClientProtocol::outgoingData);
    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    QSignalSpy stateSpy(&protocol, &QRfbClientProtocol::stateChanged);

    QCOMPARE(protocol.feed(securityTypes({ 1, 2 })), 3);

    QCOMPARE(abortSpy.count(), 0);
    QCOMPARE(outgoingSpy.count(), 1);
    QCOMPARE(outgoingSpy.at(0).at(0).toByteArray(), QByteArray(1, '\0'));
    QCOMPARE(stateSpy.count(), 1);
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingSecurityResult);

    const QList<QRfb::SecurityType> types = protocol.advertisedSecurityTypes();
    QCOMPARE(types.size(), 2);
    QCOMPARE(types.at(0), QRfb::SecurityTypeNone);
    QCOMPARE(types.at(1), QRfb::SecurityTypeVncAuthentication);
}

void tst_qrfbclientprotocol::securityHandshakeKeepsTrailingBytes()
{
    QRfbClientProtocol protocol;
    const QByteArray data = securityTypes({ 1 }) + securityResult(0);

    QCOMPARE(protocol.feed(data), 2);
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingSecurityResult);
    QCOMPARE(protocol.feed(data.mid(2)), 4);
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingClientInit);
}

void tst_qrfbclientprotocol::securityHandshakeUnsupportedType()
{
    QRfbClientProtocol protocol;
    QSignalSpy outgoingSpy(&protocol, &QRfbClientProtocol::outgoingData);
    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);

    // "none" is offered, but not as the server's first choice
    QCOMPARE(protocol.feed(securityTypes({ 2, 1 })), 0);

    QCOMPARE(abortSpy.count(), 1);
    QCOMPARE(outgoingSpy.count(), 0);
    QVERIFY(protocol.isAborted());
    QVERIFY(abortSpy.at(0).at(1).toString().contains(u"not supported"));
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingSecurityHandshake);
    QCOMPARE(protocol.advertisedSecurityTypes().size(), 2);
}

void tst_qrfbclientprotocol::securityHandshakeUnknownTypesPreserved()
{
    QRfbClientProtocol protocol;
    QCOMPARE(protocol.feed(securityTypes({ 1, 200, 7 })), 4);

    const QList<QRfb::SecurityType> types = protocol.advertisedSecurityTypes();
    QCOMPARE(types.size(), 3);
    QCOMPARE(int(types.at(1)), 200);
    QCOMPARE(int(types.at(2)), 7);
    QVERIFY(QRfb::isKnownSecurityType(types.at(0)));
    QVERIFY(!QRfb::isKnownSecurityType(types.at(1)));
    QVERIFY(!QRfb::isKnownSecurityType(types.at(2)));
}

void tst_qrfbclientprotocol::securityHandshakeEmptyList()
{
    QRfbClientProtocol protocol;
    QSignalSpy outgoingSpy(&protocol, &QRfbClientProtocol::outgoingData);
    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);

    // a count of zero is followed by a reason string we never read
    QByteArray data(1, '\0');
    data += securityResult(6) + "denied";
    QCOMPARE(protocol.feed(data), 0);

    QCOMPARE(abortSpy.count(), 1);
    QCOMPARE(outgoingSpy.count(), 0);
    QVERIFY(protocol.isAborted());
    QCOMPARE(abortSpy.at(0).at(0).toByteArray(), data);
}

void tst_qrfbclientprotocol::securityResultIncomplete()
{
    QRfbClientProtocol protocol;
    QCOMPARE(protocol.feed(securityTypes({ 1 })), 2);

    QSignalSpy outgoingSpy(&protocol, &QRfbClientProtocol::outgoingData);
    const QByteArray result = securityResult(0);
    for (qsizetype length = 0; length < result.size(); length++)
        QCOMPARE(protocol.feed(result.left(length)), 0);
    QCOMPARE(outgoingSpy.count(), 0);
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingSecurityResult);
}

void tst_qrfbclientprotocol::securityResultDenied()
{
    QRfbClientProtocol protocol;
    QCOMPARE(protocol.feed(securityTypes({ 1 })), 2);

    QSignalSpy outgoingSpy(&protocol, &QRfbClientProtocol::outgoingData);
    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    QCOMPARE(protocol.feed(securityResult(1)), 0);

    QCOMPARE(abortSpy.count(), 1);
    QCOMPARE(outgoingSpy.count(), 0);
    QVERIFY(protocol.abortReason().contains(u"authentication denied"));
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingSecurityResult);
}

void tst_qrfbclientprotocol::securityResultSuccess()
{
    QRfbClientProtocol protocol;
    QCOMPARE(protocol.feed(securityTypes({ 1 })), 2);

    QSignalSpy outgoingSpy(&protocol, &QRfbClientProtocol::outgoingData);
    QCOMPARE(protocol.feed(securityResult(0)), 4);

    QCOMPARE(outgoingSpy.count(), 1);
    // share flag: do not share the desktop
    QCOMPARE(outgoingSpy.at(0).at(0).toByteArray(), QByteArray(1, '\0'));
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingClientInit);
}

void tst_qrfbclientprotocol::clientInitWaitsForName()
{
    QRfbClientProtocol protocol;
    QCOMPARE(protocol.feed(securityTypes({ 1 }) ), 2);
    QCOMPARE(protocol.feed(securityResult(0)), 4);

    QSignalSpy initSpy(&protocol, &QRfbClientProtocol::serverInitReceived);
    const QByteArray init = serverInit(1024, 768, "desktop");

    // complete header, incomplete name
    QCOMPARE(protocol.feed(init.left(QRfbClientProtocol::ServerInitHeaderSize)), 0);
    QCOMPARE(protocol.feed(init.left(init.size() - 1)), 0);
    QCOMPARE(initSpy.count(), 0);

    QCOMPARE(protocol.feed(init + "extra"), init.size());
    QCOMPARE(initSpy.count(), 1);
    QCOMPARE(protocol.state(), QRfb::ParseState::SteadyStateUpdates);
}

void tst_qrfbclientprotocol::clientInitByteAtATime()
{
    const QByteArray session = securityTypes({ 1, 2 }) + securityResult(0)
                               + serverInit(800, 600, "byte at a time") + rectangle(1, 2, 2, 2)
                               + QByteArray(16, 'p');

    QRfbClientProtocol whole;
    QSignalSpy wholeOutgoing(&whole, &QRfbClientProtocol::outgoingData);
    QSignalSpy wholeRects(&whole, &QRfbClientProtocol::rectangleReceived);
    QByteArray pending;
    QCOMPARE(deliver(&whole, &pending, session), session.size());
    QVERIFY(pending.isEmpty());

    QRfbClientProtocol trickled;
    QSignalSpy trickledOutgoing(&trickled, &QRfbClientProtocol::outgoingData);
    QSignalSpy trickledRects(&trickled, &QRfbClientProtocol::rectangleReceived);
    pending.clear();
    qsizetype total = 0;
    for (qsizetype i = 0; i < session.size(); i++)
        total += deliver(&trickled, &pending, session.mid(i, 1));
    QCOMPARE(total, session.size());
    QVERIFY(pending.isEmpty());

    QVERIFY(!trickled.isAborted());
    QCOMPARE(trickled.state(), whole.state());
    QCOMPARE(trickled.serverInit().framebufferWidth, quint16(800));
    QCOMPARE(trickled.serverInit().framebufferHeight, quint16(600));
    QCOMPARE(trickled.serverInit().name, whole.serverInit().name);
    QCOMPARE(trickled.serverInit().sessionName(), u"byte at a time"_s);
    QCOMPARE(trickledOutgoing.count(), wholeOutgoing.count());
    for (int i = 0; i < wholeOutgoing.count(); i++)
        QCOMPARE(trickledOutgoing.at(i).at(0).toByteArray(), wholeOutgoing.at(i).at(0).toByteArray());
    QCOMPARE(trickledRects.count(), 1);
    QCOMPARE(wholeRects.count(), 1);

    // security selector, share flag, SetEncodings(raw)
    QCOMPARE(wholeOutgoing.count(), 3);
    QCOMPARE(wholeOutgoing.at(2).at(0).toByteArray(), QByteArray::fromHex("0200000100000000"));
}

void tst_qrfbclientprotocol::clientInitNameTooLong()
{
    QRfbClientProtocol protocol;
    protocol.setMaximumNameLength(8);
    QCOMPARE(protocol.feed(securityTypes({ 1 })), 2);
    QCOMPARE(protocol.feed(securityResult(0)), 4);

    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    // only the header is present: the length alone is enough to refuse
    const QByteArray init = serverInit(640, 480, "a much too long name");
    QCOMPARE(protocol.feed(init.left(QRfbClientProtocol::ServerInitHeaderSize)), 0);
    QCOMPARE(abortSpy.count(), 1);
    QVERIFY(protocol.isAborted());
}

void tst_qrfbclientprotocol::rectangleRaw()
{
    QRfbClientProtocol protocol;
    toSteadyState(&protocol);

    QSignalSpy rectSpy(&protocol, &QRfbClientProtocol::rectangleReceived);
    const QByteArray pixels = QByteArray::fromHex("00112233445566778899aabbccddeeff");
    const QByteArray message = rectangle(3, 4, 2, 2) + pixels;
    QCOMPARE(message.size(), QRfbFramebufferUpdateParser::HeaderSize + 16);

    for (qsizetype length = 0; length < message.size(); length++)
        QCOMPARE(protocol.feed(message.left(length)), 0);
    QCOMPARE(rectSpy.count(), 0);

    QCOMPARE(protocol.feed(message), message.size());
    QCOMPARE(rectSpy.count(), 1);
    const QRfbRectangle rect = rectSpy.at(0).at(0).value<QRfbRectangle>();
    QCOMPARE(rect.x, quint16(3));
    QCOMPARE(rect.y, quint16(4));
    QCOMPARE(rect.width, quint16(2));
    QCOMPARE(rect.height, quint16(2));
    QCOMPARE(rect.encoding, qint32(QRfb::RawEncoding));
    QCOMPARE(rect.toRect(), QRect(3, 4, 2, 2));
    QCOMPARE(rectSpy.at(0).at(1).toByteArray(), pixels);
    QCOMPARE(protocol.state(), QRfb::ParseState::SteadyStateUpdates);
}

void tst_qrfbclientprotocol::rectangleZeroSized()
{
    QRfbClientProtocol protocol;
    toSteadyState(&protocol);

    QCOMPARE(protocol.feed(rectangle(0, 0, 0, 0).left(QRfbFramebufferUpdateParser::HeaderSize - 1)), 0);
    QCOMPARE(protocol.feed(rectangle(0, 0, 0, 0)), QRfbFramebufferUpdateParser::HeaderSize);
}

void tst_qrfbclientprotocol::rectangleConsecutive()
{
    QRfbClientProtocol protocol;
    toSteadyState(&protocol);

    QSignalSpy rectSpy(&protocol, &QRfbClientProtocol::rectangleReceived);
    QByteArray pending;
    const QByteArray data = rectangle(0, 0, 1, 1) + QByteArray(4, 'a')
                            + rectangle(10, 10, 3, 1) + QByteArray(12, 'b')
                            + rectangle(0, 0, 1, 1);
    QCOMPARE(deliver(&protocol, &pending, data), data.size() - QRfbFramebufferUpdateParser::HeaderSize);
    QCOMPARE(rectSpy.count(), 2);
    QCOMPARE(rectSpy.at(1).at(0).value<QRfbRectangle>().width, quint16(3));
    QCOMPARE(rectSpy.at(1).at(1).toByteArray(), QByteArray(12, 'b'));

    QCOMPARE(deliver(&protocol, &pending, QByteArray(4, 'c')), QRfbFramebufferUpdateParser::HeaderSize + 4);
    QCOMPARE(rectSpy.count(), 3);
}

void tst_qrfbclientprotocol::rectangleNonRawEncoding()
{
    QRfbClientProtocol protocol;
    toSteadyState(&protocol);

    QSignalSpy rectSpy(&protocol, &QRfbClientProtocol::rectangleReceived);
    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    // ZRLE, with a complete payload so nothing is missing but the encoding
    QCOMPARE(protocol.feed(rectangle(0, 0, 2, 2, 16) + QByteArray(16, '\0')), 0);

    QCOMPARE(abortSpy.count(), 1);
    QCOMPARE(rectSpy.count(), 0);
    QVERIFY(protocol.abortReason().contains(u"invalid encoding"));
}

void tst_qrfbclientprotocol::rectangleBadHeader_data()
{
    QTest::addColumn<QByteArray>("message");

    QByteArray bell = rectangle(0, 0, 1, 1);
    bell[0] = 2;
    QTest::newRow("bell message") << bell;

    QByteArray padding = rectangle(0, 0, 1, 1);
    padding[1] = 1;
    QTest::newRow("non-zero padding") << padding;

    QByteArray twoRects = rectangle(0, 0, 1, 1);
    qToBigEndian<quint16>(2, twoRects.data() + 2);
    QTest::newRow("two rectangles") << twoRects;

    QByteArray noRects = rectangle(0, 0, 1, 1);
    qToBigEndian<quint16>(0, noRects.data() + 2);
    QTest::newRow("no rectangles") << noRects;
}

void tst_qrfbclientprotocol::rectangleBadHeader()
{
    QFETCH(QByteArray, message);

    QRfbClientProtocol protocol;
    toSteadyState(&protocol);

    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    QCOMPARE(protocol.feed(message + QByteArray(4, '\0')), 0);
    QCOMPARE(abortSpy.count(), 1);
    QVERIFY(protocol.abortReason().contains(u"unknown packet"));
}

void tst_qrfbclientprotocol::rectangleOutsideFramebuffer()
{
    QRfbClientProtocol protocol;
    toSteadyState(&protocol, 64, 48);

    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    QCOMPARE(protocol.feed(rectangle(60, 0, 8, 1)), 0);
    QCOMPARE(abortSpy.count(), 1);
}

void tst_qrfbclientprotocol::rectanglePayloadLimit()
{
    QRfbClientProtocol protocol;
    toSteadyState(&protocol, 65535, 65535);
    QCOMPARE(protocol.maximumPayloadSize(), QRfbFramebufferUpdateParser::DefaultMaximumPayloadSize);

    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    // 65535 * 65535 * 4 bytes: refused from the header alone
    QCOMPARE(protocol.feed(rectangle(0, 0, 65535, 65535)), 0);
    QCOMPARE(abortSpy.count(), 1);
    QVERIFY(protocol.abortReason().contains(u"exceeds"));

    QRfbClientProtocol limited;
    limited.setMaximumPayloadSize(64);
    toSteadyState(&limited);
    QCOMPARE(limited.feed(rectangle(0, 0, 4, 4) + QByteArray(64, 'x')), QRfbFramebufferUpdateParser::HeaderSize + 64);
    QCOMPARE(limited.feed(rectangle(0, 0, 5, 4)), 0);
    QVERIFY(limited.isAborted());
}

void tst_qrfbclientprotocol::feedAfterAbortIsIgnored()
{
    QRfbClientProtocol protocol;
    QSignalSpy abortSpy(&protocol, &QRfbClientProtocol::aborted);
    QSignalSpy outgoingSpy(&protocol, &QRfbClientProtocol::outgoingData);

    QCOMPARE(protocol.feed(QByteArray(1, '\0')), 0);
    QCOMPARE(abortSpy.count(), 1);

    QCOMPARE(protocol.feed(securityTypes({ 1 })), 0);
    QCOMPARE(abortSpy.count(), 1);
    QCOMPARE(outgoingSpy.count(), 0);
    QCOMPARE(protocol.state(), QRfb::ParseState::AwaitingSecurityHandshake);
}

QTEST_GUILESS_MAIN(tst_qrfbclientprotocol)
#include "tst_qrfbclientprotocol.moc"
