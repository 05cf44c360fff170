// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBCIPHER_H
#define QRFBCIPHER_H

#include "qtrfbclientglobal.h"
#include <QtCore/QByteArray>
#include <QtCore/QCryptographicHash>
#include <QtCore/QList>

#include <memory>

QT_BEGIN_NAMESPACE

/*!
    \struct QRfbCryptoError
    \brief Reports why a key derivation or cipher construction failed.

    Used as an optional out parameter, like QJsonParseError.
*/
struct QRfbCryptoError
{
    enum Error {
        NoError,
        ConfigurationError, ///< Parameters the cipher or mode cannot use
        BackendError,       ///< The cryptographic provider failed or is missing
    };

    QString errorString() const;

    Error error = NoError;
    QString message;
};

/*!
    \class QRfbEncryptor
    \brief One direction of a stream cipher, bound to one key and IV.

    Cipher state carries over from one call to the next, so a message
    split over several encrypt() calls yields the same bytes as a single
    call. Instances are not thread-safe.
*/
class QRfbEncryptor
{
public:
    virtual ~QRfbEncryptor() = default;
    virtual QByteArray encrypt(const QByteArray &plaintext, bool *ok = nullptr) = 0;
};

/*!
    \class QRfbDecryptor
    \brief The receiving counterpart of QRfbEncryptor.
*/
class QRfbDecryptor
{
public:
    virtual ~QRfbDecryptor() = default;
    virtual QByteArray decrypt(const QByteArray &ciphertext, bool *ok = nullptr) = 0;
};

/*!
    \class QRfbCipherBackend
    \brief Abstract provider of key derivation and stream ciphers.

    A backend must pass QRfbBackendValidator before it is used for a live
    session.
*/
class QRfbCipherBackend
{
public:
    enum Mode {
        CTR,
        CFB,
    };

    virtual ~QRfbCipherBackend() = default;

    virtual QString name() const = 0;
    virtual Mode mode() const = 0;
    virtual bool isAvailable() const = 0;
    virtual QList<int> supportedKeySizes() const = 0;
    virtual int ivSize() const = 0;

    QByteArray deriveKey(const QByteArray &passphrase, const QByteArray &salt, int iterations,
                         int keySize,
                         QCryptographicHash::Algorithm hash = QCryptographicHash::Sha1,
                         QRfbCryptoError *error = nullptr) const;

    virtual std::unique_ptr<QRfbEncryptor> createEncryptor(const QByteArray &key, const QByteArray &iv,
                                                           QRfbCryptoError *error = nullptr) const = 0;
    virtual std::unique_ptr<QRfbDecryptor> createDecryptor(const QByteArray &key, const QByteArray &iv,
                                                           QRfbCryptoError *error = nullptr) const = 0;

    static QString modeName(Mode mode);
    static bool modeFromName(const QString &name, Mode *mode);
};

QT_END_NAMESPACE

#endif // QRFBCIPHER_H
