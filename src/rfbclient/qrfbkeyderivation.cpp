// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrfbkeyderivation.h"

#include <QtNetwork/QPasswordDigestor>

QT_BEGIN_NAMESPACE

static void setError(QRfbCryptoError *error, QRfbCryptoError::Error code, const QString &message)
{
    qCWarning(lcRfbCrypto) << "Key derivation failed:" << message;
    if (error) {
        error->error = code;
        error->message = message;
    }
}

/*!
    Derives a \a keySize byte key from \a passphrase and \a salt with
    PBKDF2-HMAC using \a hash and exactly \a iterations rounds.

    The function is pure: the same arguments always give the same key, and
    it can be called from several threads at once. The iteration count is
    never adjusted; a count below one is rejected as a ConfigurationError.
*/
QByteArray QRfbKeyDerivation::deriveKey(const QByteArray &passphrase, const QByteArray &salt, int iterations,
                                        int keySize, QCryptographicHash::Algorithm hash,
                                        QRfbCryptoError *error)
{
    if (iterations < 1) {
        setError(error, QRfbCryptoError::ConfigurationError, u"iteration count %1 is below 1"_s.arg(iterations));
        return QByteArray();
    }
    if (salt.isEmpty()) {
        setError(error, QRfbCryptoError::ConfigurationError, u"the salt is empty"_s);
        return QByteArray();
    }
    if (keySize <= 0) {
        setError(error, QRfbCryptoError::ConfigurationError, u"key size %1 is invalid"_s.arg(keySize));
        return QByteArray();
    }
    if (hashName(hash).isEmpty()) {
        setError(error, QRfbCryptoError::ConfigurationError, u"unsupported key hash %1"_s.arg(int(hash)));
        return QByteArray();
    }

    const QByteArray key = QPasswordDigestor::deriveKeyPbkdf2(hash, passphrase, salt, iterations, quint64(keySize));
    if (key.size() != keySize) {
        setError(error, QRfbCryptoError::BackendError, u"PBKDF2 with %1 produced no key"_s.arg(hashName(hash)));
        return QByteArray();
    }
    qCDebug(lcRfbCrypto) << "Derived" << keySize << "byte key with PBKDF2" << hashName(hash) << iterations << "iterations";
    return key;
}

QString QRfbKeyDerivation::hashName(QCryptographicHash::Algorithm hash)
{
    switch (hash) {
    case QCryptographicHash::Sha1:
        return u"SHA1"_s;
    case QCryptographicHash::Sha256:
        return u"SHA256"_s;
    case QCryptographicHash::Sha512:
        return u"SHA512"_s;
    default:
        return QString();
    }
}

bool QRfbKeyDerivation::hashFromName(const QString &name, QCryptographicHash::Algorithm *hash)
{
    const QString upper = name.trimmed().toUpper().remove(u'-');
    if (upper == "SHA1"_L1)
        *hash = QCryptographicHash::Sha1;
    else if (upper == "SHA256"_L1)
        *hash = QCryptographicHash::Sha256;
    else if (upper == "SHA512"_L1)
        *hash = QCryptographicHash::Sha512;
    else
        return false;
    return true;
}

QT_END_NAMESPACE
