// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only
#ifndef QRFBKEYDERIVATION_H
#define QRFBKEYDERIVATION_H

#include "qrfbcipher.h"

QT_BEGIN_NAMESPACE

class QRfbKeyDerivation
{
public:
    static QByteArray deriveKey(const QByteArray &passphrase, const QByteArray &salt, int iterations,
                                int keySize,
                                QCryptographicHash::Algorithm hash = QCryptographicHash::Sha1,
                                QRfbCryptoError *error = nullptr);

    static QString hashName(QCryptographicHash::Algorithm hash);
    static bool hashFromName(const QString &name, QCryptographicHash::Algorithm *hash);
};

QT_END_NAMESPACE

#endif // QRFBKEYDERIVATION_H
