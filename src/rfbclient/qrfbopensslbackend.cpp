// Copyright (C) 2025 Signal Slot Inc.
// SPDX-License-Identifier: LGPL-3.0-only OR GPL-2.0-only OR GPL-3.0-only

#include "qrfbopensslbackend.h"

#include <openssl/err.h>
#include <openssl/evp.h>

QT_BEGIN_NAMESPACE

namespace {

constexpr int AesBlockSize = 16;
// EVP_CipherUpdate takes an int length
constexpr qsizetype MaximumChunkSize = 1 << 30;

struct EvpCipherContextDeleter {
    void operator()(EVP_CIPHER_CTX *ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
struct EvpCipherDeleter {
    void operator()(EVP_CIPHER *cipher) const { EVP_CIPHER_free(cipher); }
};
using EvpCipherContextPtr = std::unique_ptr<EVP_CIPHER_CTX, EvpCipherContextDeleter>;
using EvpCipherPtr = std::unique_ptr<EVP_CIPHER, EvpCipherDeleter>;

QString openSslErrorString()
{
    const unsigned long code = ERR_get_error();
    if (code == 0)
        return u"unknown OpenSSL error"_s;
    char buffer[256];
    ERR_error_string_n(code, buffer, sizeof(buffer));
    ERR_clear_error();
    return QString::fromLatin1(buffer);
}

QByteArray cipherName(QRfbCipherBackend::Mode mode, int keySize)
{
    const char *suffix = mode == QRfbCipherBackend::CTR ? "CTR" : "CFB";
    return QByteArray("AES-") + QByteArray::number(keySize * 8) + '-' + suffix;
}

void setError(QRfbCryptoError *error, QRfbCryptoError::Error code, const QString &message)
{
    qCWarning(lcRfbCrypto) << "OpenSSL cipher setup failed:" << message;
    if (error) {
        error->error = code;
        error->message = message;
    }
}

/*!
    \internal
    One EVP cipher context running in a single direction.
*/
class OpenSslStream
{
public:
    static std::unique_ptr<OpenSslStream> create(QRfbCipherBackend::Mode mode, const QByteArray &key,
                                                 const QByteArray &iv, bool encrypt, QRfbCryptoError *error);

    QByteArray update(const QByteArray &input, bool *ok);

private:
    explicit OpenSslStream(EvpCipherContextPtr context)
        : ctx(std::move(context))
    {
    }

    EvpCipherContextPtr ctx;
};

std::unique_ptr<OpenSslStream> OpenSslStream::create(QRfbCipherBackend::Mode mode, const QByteArray &key,
                                                     const QByteArray &iv, bool encrypt, QRfbCryptoError *error)
{
    if (key.size() != 16 && key.size() != 24 && key.size() != 32) {
        setError(error, QRfbCryptoError::BackendError, u"invalid AES key length %1"_s.arg(key.size()));
        return nullptr;
    }
    if (iv.size() != AesBlockSize) {
        setError(error, QRfbCryptoError::BackendError,
                 u"invalid IV length %1, expected %2"_s.arg(iv.size()).arg(AesBlockSize));
        return nullptr;
    }

    const QByteArray name = cipherName(mode, int(key.size()));
    EvpCipherPtr cipher(EVP_CIPHER_fetch(nullptr, name.constData(), nullptr));
    if (!cipher) {
        setError(error, QRfbCryptoError::BackendError,
                 u"cipher %1 is unavailable: %2"_s.arg(QString::fromLatin1(name), openSslErrorString()));
        return nullptr;
    }

    EvpCipherContextPtr context(EVP_CIPHER_CTX_new());
    if (!context) {
        setError(error, QRfbCryptoError::BackendError, u"failed to create cipher context"_s);
        return nullptr;
    }
    if (EVP_CipherInit_ex(context.get(), cipher.get(), nullptr,
                          reinterpret_cast<const unsigned char *>(key.constData()),
                          reinterpret_cast<const unsigned char *>(iv.constData()), encrypt ? 1 : 0) != 1) {
        setError(error, QRfbCryptoError::BackendError,
                 u"failed to initialize %1: %2"_s.arg(QString::fromLatin1(name), openSslErrorString()));
        return nullptr;
    }
    EVP_CIPHER_CTX_set_padding(context.get(), 0);

    qCDebug(lcRfbCrypto) << "Created" << (encrypt ? "encryptor" : "decryptor") << name;
    return std::unique_ptr<OpenSslStream>(new OpenSslStream(std::move(context)));
}

QByteArray OpenSslStream::update(const QByteArray &input, bool *ok)
{
    if (ok)
        *ok = false;

    QByteArray output(input.size(), Qt::Uninitialized);
    qsizetype written = 0;
    for (qsizetype offset = 0; offset < input.size(); offset += MaximumChunkSize) {
        const int chunk = int(qMin(MaximumChunkSize, input.size() - offset));
        int outLength = 0;
        if (EVP_CipherUpdate(ctx.get(), reinterpret_cast<unsigned char *>(output.data()) + written, &outLength,
                             reinterpret_cast<const unsigned char *>(input.constData()) + offset, chunk) != 1) {
            qCWarning(lcRfbCrypto) << "EVP_CipherUpdate failed:" << openSslErrorString();
            return QByteArray();
        }
        written += outLength;
    }
    // stream modes never hold back partial blocks
    Q_ASSERT(written == input.size());
    output.truncate(written);

    if (ok)
        *ok = true;
    return output;
}

class OpenSslEncryptor : public QRfbEncryptor
{
public:
    explicit OpenSslEncryptor(std::unique_ptr<OpenSslStream> stream)
        : m_stream(std::move(stream))
    {
    }

    QByteArray encrypt(const QByteArray &plaintext, bool *ok) override
    {
        return m_stream->update(plaintext, ok);
    }

private:
    std::unique_ptr<OpenSslStream> m_stream;
};

class OpenSslDecryptor : public QRfbDecryptor
{
public:
    explicit OpenSslDecryptor(std::unique_ptr<OpenSslStream> stream)
        : m_stream(std::move(stream))
    {
    }

    QByteArray decrypt(const QByteArray &ciphertext, bool *ok) override
    {
        return m_stream->update(ciphertext, ok);
    }

private:
    std::unique_ptr<OpenSslStream> m_stream;
};

} // namespace

QRfbOpenSslBackend::QRfbOpenSslBackend(Mode mode)
    : m_mode(mode)
{
}

QString QRfbOpenSslBackend::name() const
{
    return u"OpenSSL AES-%1"_s.arg(modeName(m_mode));
}

/*!
    Returns true if the default OpenSSL provider can supply every AES key
    size in this backend's mode.
*/
bool QRfbOpenSslBackend::isAvailable() const
{
    for (int keySize : supportedKeySizes()) {
        EvpCipherPtr cipher(EVP_CIPHER_fetch(nullptr, cipherName(m_mode, keySize).constData(), nullptr));
        if (!cipher) {
            qCWarning(lcRfbCrypto) << cipherName(m_mode, keySize) << "is unavailable:" << openSslErrorString();
            return false;
        }
    }
    return true;
}

QList<int> QRfbOpenSslBackend::supportedKeySizes() const
{
    return { 16, 24, 32 };
}

int QRfbOpenSslBackend::ivSize() const
{
    return AesBlockSize;
}

std::unique_ptr<QRfbEncryptor> QRfbOpenSslBackend::createEncryptor(const QByteArray &key, const QByteArray &iv,
                                                                   QRfbCryptoError *error) const
{
    std::unique_ptr<OpenSslStream> stream = OpenSslStream::create(m_mode, key, iv, true, error);
    if (!stream)
        return nullptr;
    return std::make_unique<OpenSslEncryptor>(std::move(stream));
}

std::unique_ptr<QRfbDecryptor> QRfbOpenSslBackend::createDecryptor(const QByteArray &key, const QByteArray &iv,
                                                                   QRfbCryptoError *error) const
{
    std::unique_ptr<OpenSslStream> stream = OpenSslStream::create(m_mode, key, iv, false, error);
    if (!stream)
        return nullptr;
    return std::make_unique<OpenSslDecryptor>(std::move(stream));
}

QT_END_NAMESPACE
