// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBBACKENDVALIDATOR_H
#define QRFBBACKENDVALIDATOR_H

#include "qrfbcipher.h"
#include "qrfbcryptoconfig.h"

QT_BEGIN_NAMESPACE

class QRfbBackendValidator
{
public:
    explicit QRfbBackendValidator(const QRfbCryptoConfig &config = QRfbCryptoConfig::defaults());

    QRfbCryptoConfig config() const { return m_config; }

    bool validate(const QRfbCipherBackend &backend, QString *errorString = nullptr) const;
    const QRfbCipherBackend *selectBackend(const QList<const QRfbCipherBackend *> &candidates) const;

    static QByteArray passphrase();

private:
    bool checkRoundTrip(const QRfbCipherBackend &backend, const QByteArray &key,
                        const QByteArray &message, QString *errorString) const;
    bool checkStreaming(const QRfbCipherBackend &backend, const QByteArray &key,
                        const QByteArray &message, QString *errorString) const;

    QRfbCryptoConfig m_config;
};

QT_END_NAMESPACE

#endif // QRFBBACKENDVALIDATOR_H
