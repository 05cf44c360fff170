// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrfbcryptoconfig.h"
#include "qrfbkeyderivation.h"

QT_BEGIN_NAMESPACE

static bool readPositiveInt(const char *name, int *value)
{
    if (!qEnvironmentVariableIsSet(name))
        return false;
    bool ok = false;
    const int v = qEnvironmentVariableIntValue(name, &ok);
    if (!ok || v < 1) {
        qCWarning(lcRfbCrypto) << "Ignoring invalid" << name << "=" << qEnvironmentVariable(name);
        return false;
    }
    *value = v;
    return true;
}

QRfbCryptoConfig QRfbCryptoConfig::defaults()
{
    return fromEnvironment(QRfbCryptoConfig());
}

/*!
    Returns \a base with every valid QTRFBCLIENT_CRYPTO_* variable applied.

    Invalid values are logged and skipped, leaving the base value in place.
*/
QRfbCryptoConfig QRfbCryptoConfig::fromEnvironment(const QRfbCryptoConfig &base)
{
    QRfbCryptoConfig config = base;

    if (qEnvironmentVariableIsSet("QTRFBCLIENT_CRYPTO_SALT")) {
        const QByteArray salt = qgetenv("QTRFBCLIENT_CRYPTO_SALT");
        if (salt.isEmpty())
            qCWarning(lcRfbCrypto) << "Ignoring empty QTRFBCLIENT_CRYPTO_SALT";
        else
            config.salt = salt;
    }

    readPositiveInt("QTRFBCLIENT_CRYPTO_ITERATIONS", &config.iterations);
    readPositiveInt("QTRFBCLIENT_CRYPTO_BLOCK_SIZE", &config.blockSize);

    if (qEnvironmentVariableIsSet("QTRFBCLIENT_CRYPTO_IV")) {
        const QByteArray iv = qgetenv("QTRFBCLIENT_CRYPTO_IV");
        if (iv.isEmpty())
            qCWarning(lcRfbCrypto) << "Ignoring empty QTRFBCLIENT_CRYPTO_IV";
        else
            config.iv = iv;
    }

    if (qEnvironmentVariableIsSet("QTRFBCLIENT_CRYPTO_MODE")) {
        const QString value = qEnvironmentVariable("QTRFBCLIENT_CRYPTO_MODE");
        if (!QRfbCipherBackend::modeFromName(value, &config.mode))
            qCWarning(lcRfbCrypto) << "Ignoring unknown QTRFBCLIENT_CRYPTO_MODE" << value;
    }

    if (qEnvironmentVariableIsSet("QTRFBCLIENT_CRYPTO_KEY_HASH")) {
        const QString value = qEnvironmentVariable("QTRFBCLIENT_CRYPTO_KEY_HASH");
        if (!QRfbKeyDerivation::hashFromName(value, &config.keyHash))
            qCWarning(lcRfbCrypto) << "Ignoring unknown QTRFBCLIENT_CRYPTO_KEY_HASH" << value;
    }

    return config;
}

QT_END_NAMESPACE
