// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrfbbackendvalidator.h"

QT_BEGIN_NAMESPACE

static bool fail(QString *errorString, const QString &message)
{
    if (errorString)
        *errorString = message;
    return false;
}

QRfbBackendValidator::QRfbBackendValidator(const QRfbCryptoConfig &config)
    : m_config(config)
{
}

QByteArray QRfbBackendValidator::passphrase()
{
    return QByteArrayLiteral("this is our secret");
}

/*!
    Runs the known-answer self test against \a backend.

    The test derives a key from the fixed passphrase and the configured
    salt, iteration count and key size, then drives encryptors and
    decryptors built from that key and the configured IV over empty, short,
    17 byte and 4096 byte messages. Each stage must produce output, results
    must be repeatable, and decryption must invert encryption both in one
    call and when the message is split over several calls.

    Returns false and sets \a errorString on the first failed check. A
    backend that fails must not be offered for encrypted sessions.
*/
bool QRfbBackendValidator::validate(const QRfbCipherBackend &backend, QString *errorString) const
{
    const QString backendName = backend.name();
    auto reject = [&](const QString &message) {
        qCWarning(lcRfbCrypto) << "Backend" << backendName << "failed validation:" << message;
        return fail(errorString, message);
    };

    if (!backend.isAvailable())
        return reject(u"backend is not available"_s);

    QRfbCryptoError error;
    const QByteArray key = backend.deriveKey(passphrase(), m_config.salt, m_config.iterations,
                                             m_config.blockSize, m_config.keyHash, &error);
    if (key.isEmpty())
        return reject(u"key derivation failed: %1"_s.arg(error.errorString()));
    if (key.size() != m_config.blockSize)
        return reject(u"derived key has %1 bytes, expected %2"_s.arg(key.size()).arg(m_config.blockSize));

    const QByteArray again = backend.deriveKey(passphrase(), m_config.salt, m_config.iterations,
                                               m_config.blockSize, m_config.keyHash, &error);
    if (again != key)
        return reject(u"key derivation is not deterministic"_s);

    const QByteArray other = backend.deriveKey(passphrase() + '!', m_config.salt, m_config.iterations,
                                               m_config.blockSize, m_config.keyHash, &error);
    if (other.isEmpty() || other == key)
        return reject(u"key derivation ignores the passphrase"_s);

    if (m_config.iv.size() != backend.ivSize())
        return reject(u"IV has %1 bytes, backend requires %2"_s.arg(m_config.iv.size()).arg(backend.ivSize()));

    const QList<QByteArray> messages {
        QByteArray(),
        QByteArrayLiteral("some message1234"),
        QByteArrayLiteral("seventeen bytes!!"),
        QByteArrayLiteral("0123456789ABCDEF").repeated(256),
    };
    QString reason;
    for (const QByteArray &message : messages) {
        if (!checkRoundTrip(backend, key, message, &reason))
            return reject(reason);
    }
    if (!checkStreaming(backend, key, messages.last(), &reason))
        return reject(reason);

    qCInfo(lcRfbCrypto) << "Backend" << backendName << "passed validation";
    return true;
}

/*!
    Returns the first backend in \a candidates that passes validate(), or
    \nullptr if none does.
*/
const QRfbCipherBackend *QRfbBackendValidator::selectBackend(const QList<const QRfbCipherBackend *> &candidates) const
{
    for (const QRfbCipherBackend *backend : candidates) {
        if (backend && validate(*backend))
            return backend;
    }
    qCWarning(lcRfbCrypto) << "No usable cipher backend, encryption will not be offered";
    return nullptr;
}

bool QRfbBackendValidator::checkRoundTrip(const QRfbCipherBackend &backend, const QByteArray &key,
                                          const QByteArray &message, QString *errorString) const
{
    QRfbCryptoError error;
    std::unique_ptr<QRfbEncryptor> encryptor = backend.createEncryptor(key, m_config.iv, &error);
    std::unique_ptr<QRfbEncryptor> encryptor2 = backend.createEncryptor(key, m_config.iv, &error);
    std::unique_ptr<QRfbDecryptor> decryptor = backend.createDecryptor(key, m_config.iv, &error);
    if (!encryptor || !encryptor2 || !decryptor)
        return fail(errorString, u"cipher construction failed: %1"_s.arg(error.errorString()));

    bool ok = false;
    const QByteArray encrypted = encryptor->encrypt(message, &ok);
    if (!ok)
        return fail(errorString, u"encryption of %1 bytes failed"_s.arg(message.size()));
    if (!message.isEmpty() && (encrypted.isEmpty() || encrypted == message))
        return fail(errorString, u"encryption of %1 bytes left the data unchanged"_s.arg(message.size()));
    if (encryptor2->encrypt(message, &ok) != encrypted || !ok)
        return fail(errorString, u"encryption of %1 bytes is not repeatable"_s.arg(message.size()));

    const QByteArray decrypted = decryptor->decrypt(encrypted, &ok);
    if (!ok)
        return fail(errorString, u"decryption of %1 bytes failed"_s.arg(encrypted.size()));
    if (decrypted != message)
        return fail(errorString, u"decryption does not invert encryption for %1 bytes"_s.arg(message.size()));
    return true;
}

/*!
    \internal
    Checks that cipher state carries across calls: encrypting \a message in
    uneven pieces must match encrypting it at once, and decrypting with a
    different split must give the message back.
*/
bool QRfbBackendValidator::checkStreaming(const QRfbCipherBackend &backend, const QByteArray &key,
                                          const QByteArray &message, QString *errorString) const
{
    QRfbCryptoError error;
    std::unique_ptr<QRfbEncryptor> whole = backend.createEncryptor(key, m_config.iv, &error);
    std::unique_ptr<QRfbEncryptor> pieces = backend.createEncryptor(key, m_config.iv, &error);
    std::unique_ptr<QRfbDecryptor> decryptor = backend.createDecryptor(key, m_config.iv, &error);
    if (!whole || !pieces || !decryptor)
        return fail(errorString, u"cipher construction failed: %1"_s.arg(error.errorString()));

    bool ok = false;
    const QByteArray expected = whole->encrypt(message, &ok);
    if (!ok)
        return fail(errorString, u"encryption failed"_s);

    QByteArray streamed;
    const qsizetype encryptSplits[] = { 1, 16, 17, 1000 };
    qsizetype offset = 0;
    for (qsizetype length : encryptSplits) {
        streamed += pieces->encrypt(message.mid(offset, length), &ok);
        if (!ok)
            return fail(errorString, u"streaming encryption failed"_s);
        offset += length;
    }
    streamed += pieces->encrypt(message.mid(offset), &ok);
    if (!ok || streamed != expected)
        return fail(errorString, u"streaming encryption differs from single-call encryption"_s);

    QByteArray decrypted;
    for (offset = 0; offset < expected.size(); offset += 333) {
        decrypted += decryptor->decrypt(expected.mid(offset, 333), &ok);
        if (!ok)
            return fail(errorString, u"streaming decryption failed"_s);
    }
    if (decrypted != message)
        return fail(errorString, u"streaming decryption does not invert encryption"_s);
    return true;
}

QT_END_NAMESPACE
