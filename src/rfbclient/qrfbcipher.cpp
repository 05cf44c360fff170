// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrfbcipher.h"
#include "qrfbkeyderivation.h"

QT_BEGIN_NAMESPACE

QString QRfbCryptoError::errorString() const
{
    switch (error) {
    case NoError:
        return u"no error"_s;
    case ConfigurationError:
        return u"configuration error: %1"_s.arg(message);
    case BackendError:
        return u"backend error: %1"_s.arg(message);
    }
    return message;
}

/*!
    Stretches \a passphrase into a key of \a keySize bytes for this backend.

    Fails with QRfbCryptoError::ConfigurationError if the backend's cipher
    does not accept keys of that size; otherwise defers to
    QRfbKeyDerivation::deriveKey().
*/
QByteArray QRfbCipherBackend::deriveKey(const QByteArray &passphrase, const QByteArray &salt, int iterations,
                                        int keySize, QCryptographicHash::Algorithm hash,
                                        QRfbCryptoError *error) const
{
    if (!supportedKeySizes().contains(keySize)) {
        if (error) {
            error->error = QRfbCryptoError::ConfigurationError;
            error->message = u"key size %1 is not supported by %2 in %3 mode"_s
                                 .arg(keySize).arg(name(), modeName(mode()));
        }
        qCWarning(lcRfbCrypto) << "Unsupported key size" << keySize << "for" << name();
        return QByteArray();
    }
    return QRfbKeyDerivation::deriveKey(passphrase, salt, iterations, keySize, hash, error);
}

QString QRfbCipherBackend::modeName(Mode mode)
{
    switch (mode) {
    case CTR:
        return u"CTR"_s;
    case CFB:
        return u"CFB"_s;
    }
    return QString();
}

bool QRfbCipherBackend::modeFromName(const QString &name, Mode *mode)
{
    const QString upper = name.trimmed().toUpper();
    if (upper == "CTR"_L1) {
        *mode = CTR;
        return true;
    }
    if (upper == "CFB"_L1) {
        *mode = CFB;
        return true;
    }
    return false;
}

QT_END_NAMESPACE
