// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBOPENSSLBACKEND_H
#define QRFBOPENSSLBACKEND_H

#include "qrfbcipher.h"

QT_BEGIN_NAMESPACE

/*!
    \class QRfbOpenSslBackend
    \brief AES stream ciphers provided by OpenSSL's EVP interface.

    The key size picks AES-128, AES-192 or AES-256. Both modes are stream
    modes: the counter (CTR) or the feedback register (CFB-128) advances
    with every byte, so encryptors and decryptors must be used in order and
    never shared between sessions.
*/
class QRfbOpenSslBackend : public QRfbCipherBackend
{
public:
    explicit QRfbOpenSslBackend(Mode mode = CTR);

    QString name() const override;
    Mode mode() const override { return m_mode; }
    bool isAvailable() const override;
    QList<int> supportedKeySizes() const override;
    int ivSize() const override;

    std::unique_ptr<QRfbEncryptor> createEncryptor(const QByteArray &key, const QByteArray &iv,
                                                   QRfbCryptoError *error = nullptr) const override;
    std::unique_ptr<QRfbDecryptor> createDecryptor(const QByteArray &key, const QByteArray &iv,
                                                   QRfbCryptoError *error = nullptr) const override;

private:
    Mode m_mode;
};

QT_END_NAMESPACE

#endif // QRFBOPENSSLBACKEND_H
