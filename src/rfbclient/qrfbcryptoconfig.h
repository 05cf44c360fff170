// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBCRYPTOCONFIG_H
#define QRFBCRYPTOCONFIG_H

#include "qrfbcipher.h"

QT_BEGIN_NAMESPACE

/*!
    \struct QRfbCryptoConfig
    \brief Default key-stretching parameters and the self-test fixture.

    These are configuration constants, never negotiated with a peer.
*/
struct QRfbCryptoConfig
{
    QByteArray salt = QByteArrayLiteral("0000000000000000");
    int iterations = 1000;
    int blockSize = 32; // key length in bytes
    QByteArray iv = QByteArrayLiteral("0000000000000000");
    QRfbCipherBackend::Mode mode = QRfbCipherBackend::CTR;
    QCryptographicHash::Algorithm keyHash = QCryptographicHash::Sha1;

    // Built-in defaults with QTRFBCLIENT_CRYPTO_* environment overrides applied.
    static QRfbCryptoConfig defaults();
    static QRfbCryptoConfig fromEnvironment(const QRfbCryptoConfig &base);
};

QT_END_NAMESPACE

#endif // QRFBCRYPTOCONFIG_H
