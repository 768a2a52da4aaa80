/**
 * @file LocalIdentity.cpp
 * @brief Identity generation, persistence and TLS installation
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#include "fastdrop/LocalIdentity.h"
#include "fastdrop/Debug.h"
#include "fastdrop/UuidGenerator.h"
#include "fastdrop/config.h"

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <filesystem>

namespace FastDrop {

namespace {

// X.509 CN is limited to 64 characters
std::string clampCommonName(const std::string& name) {
    std::string cn = name.empty() ? std::string(SERVICE_NAME) : name;
    if (cn.size() > 64) {
        cn.resize(64);
    }
    return cn;
}

std::string readCommonName(X509* cert) {
    X509_NAME* name = X509_get_subject_name(cert);
    if (!name) {
        return {};
    }
    char cnBuffer[256];
    const int cnLen = X509_NAME_get_text_by_NID(name, NID_commonName,
                                                cnBuffer, sizeof(cnBuffer));
    if (cnLen <= 0) {
        return {};
    }
    return std::string(cnBuffer, static_cast<size_t>(cnLen));
}

}  // namespace

//=============================================================================
// Fingerprint
//=============================================================================

bool certificateIdentity(X509* cert, PeerIdentity& out, std::string& errorMsg) {
    if (!cert) {
        errorMsg = "No certificate";
        return false;
    }

    unsigned char* der = nullptr;
    const int derLen = i2d_X509(cert, &der);
    if (derLen <= 0) {
        errorMsg = "Failed to encode certificate";
        return false;
    }

    PeerIdentity::Bytes digest{};
    unsigned int digestLen = 0;
    const int ok = EVP_Digest(der, static_cast<size_t>(derLen), digest.data(),
                              &digestLen, EVP_sha256(), nullptr);
    OPENSSL_free(der);

    if (ok != 1 || digestLen != HASH_SIZE) {
        errorMsg = "Failed to hash certificate";
        return false;
    }

    out = PeerIdentity::fromBytes(digest);
    return true;
}

//=============================================================================
// LocalIdentity: Construction
//=============================================================================

LocalIdentity::LocalIdentity(Passkey, X509* cert, EVP_PKEY* key)
    : m_cert(cert)
    , m_key(key)
{
    std::string err;
    if (!certificateIdentity(m_cert, m_identity, err)) {
        LOG_ERROR("[LocalIdentity] " << err);
    }
    m_commonName = readCommonName(m_cert);
}

LocalIdentity::~LocalIdentity() {
    if (m_cert) {
        X509_free(m_cert);
        m_cert = nullptr;
    }
    if (m_key) {
        EVP_PKEY_free(m_key);
        m_key = nullptr;
    }
}

std::shared_ptr<const LocalIdentity> LocalIdentity::generate(const std::string& commonName,
                                                             std::string& errorMsg) {
    EVP_PKEY* pkey = nullptr;
    X509* cert = nullptr;
    bool success = false;
    const std::string cn = clampCommonName(commonName);

    do {
        // Ed25519 key pair
        EVP_PKEY_CTX* pkeyCtx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
        if (!pkeyCtx) {
            errorMsg = "Failed to create key context";
            break;
        }
        if (EVP_PKEY_keygen_init(pkeyCtx) <= 0 || EVP_PKEY_keygen(pkeyCtx, &pkey) <= 0) {
            EVP_PKEY_CTX_free(pkeyCtx);
            errorMsg = "Failed to generate Ed25519 key";
            break;
        }
        EVP_PKEY_CTX_free(pkeyCtx);

        cert = X509_new();
        if (!cert) {
            errorMsg = "Failed to create X509 certificate";
            break;
        }

        // X509v3
        if (X509_set_version(cert, 2) != 1) {
            errorMsg = "Failed to set certificate version";
            break;
        }

        // Random serial so regenerated identities never share a serial
        uint64_t serial = 0;
        if (!UuidGenerator::randomU64(serial)) {
            errorMsg = "Failed to generate certificate serial";
            break;
        }
        ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert), serial >> 1);

        X509_gmtime_adj(X509_get_notBefore(cert), -60);
        X509_gmtime_adj(X509_get_notAfter(cert),
                        static_cast<long>(CERT_VALIDITY_DAYS) * 24 * 60 * 60);

        if (X509_set_pubkey(cert, pkey) != 1) {
            errorMsg = "Failed to set public key";
            break;
        }

        X509_NAME* name = X509_get_subject_name(cert);
        if (!name ||
            X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_UTF8,
                                       reinterpret_cast<const unsigned char*>(cn.c_str()),
                                       -1, -1, 0) != 1 ||
            X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                       reinterpret_cast<const unsigned char*>(CERT_ORGANIZATION),
                                       -1, -1, 0) != 1) {
            errorMsg = "Failed to set certificate subject";
            break;
        }

        // Self-signed
        if (X509_set_issuer_name(cert, name) != 1) {
            errorMsg = "Failed to set issuer name";
            break;
        }

        // Ed25519 signs without a separate digest
        if (X509_sign(cert, pkey, nullptr) <= 0) {
            errorMsg = "Failed to sign certificate";
            break;
        }

        success = true;
    } while (false);

    if (!success) {
        if (cert) X509_free(cert);
        if (pkey) EVP_PKEY_free(pkey);
        return nullptr;
    }

    std::shared_ptr<const LocalIdentity> identity = std::make_shared<LocalIdentity>(Passkey(), cert, pkey);
    if (!identity->peerIdentity().isValid()) {
        errorMsg = "Failed to compute certificate fingerprint";
        return nullptr;
    }

    LOG_DEBUG("[LocalIdentity] Generated identity " << identity->peerIdentity()
              << " for '" << cn << "'");
    return identity;
}

//=============================================================================
// LocalIdentity: Persistence
//=============================================================================

bool LocalIdentity::loadFromFiles(const std::string& certPath,
                                  const std::string& keyPath,
                                  X509*& cert,
                                  EVP_PKEY*& key,
                                  std::string& errorMsg) {
    cert = nullptr;
    key = nullptr;

    BIO* certBio = BIO_new_file(certPath.c_str(), "r");
    if (!certBio) {
        errorMsg = "Failed to open certificate file: " + certPath;
        return false;
    }
    cert = PEM_read_bio_X509(certBio, nullptr, nullptr, nullptr);
    BIO_free(certBio);
    if (!cert) {
        errorMsg = "Failed to read certificate: " + certPath;
        return false;
    }

    BIO* keyBio = BIO_new_file(keyPath.c_str(), "r");
    if (!keyBio) {
        X509_free(cert);
        cert = nullptr;
        errorMsg = "Failed to open key file: " + keyPath;
        return false;
    }
    key = PEM_read_bio_PrivateKey(keyBio, nullptr, nullptr, nullptr);
    BIO_free(keyBio);
    if (!key) {
        X509_free(cert);
        cert = nullptr;
        errorMsg = "Failed to read private key: " + keyPath;
        return false;
    }

    // Reject expired certificates and mismatched key pairs
    if (X509_cmp_time(X509_get0_notAfter(cert), nullptr) <= 0 ||
        X509_check_private_key(cert, key) != 1) {
        X509_free(cert);
        EVP_PKEY_free(key);
        cert = nullptr;
        key = nullptr;
        errorMsg = "Stored certificate is expired or does not match its key";
        return false;
    }

    return true;
}

std::shared_ptr<const LocalIdentity> LocalIdentity::loadOrCreate(const std::string& directory,
                                                                 const std::string& commonName,
                                                                 std::string& errorMsg) {
    const std::filesystem::path dir(directory);
    const std::string certPath = (dir / CERT_FILENAME).string();
    const std::string keyPath = (dir / KEY_FILENAME).string();

    X509* cert = nullptr;
    EVP_PKEY* key = nullptr;
    std::string loadError;
    if (loadFromFiles(certPath, keyPath, cert, key, loadError)) {
        std::shared_ptr<const LocalIdentity> identity = std::make_shared<LocalIdentity>(Passkey(), cert, key);
        if (identity->peerIdentity().isValid()) {
            LOG_INFO("[LocalIdentity] Loaded identity " << identity->peerIdentity()
                     << " from " << directory);
            return identity;
        }
    }
    LOG_DEBUG("[LocalIdentity] No usable stored identity (" << loadError << "), generating");

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        errorMsg = "Failed to create identity directory " + directory + ": " + ec.message();
        return nullptr;
    }

    auto identity = generate(commonName, errorMsg);
    if (!identity) {
        return nullptr;
    }
    if (!identity->saveToFiles(certPath, keyPath, errorMsg)) {
        return nullptr;
    }
    return identity;
}

bool LocalIdentity::saveToFiles(const std::string& certPath,
                                const std::string& keyPath,
                                std::string& errorMsg) const {
    BIO* certBio = BIO_new_file(certPath.c_str(), "w");
    if (!certBio) {
        errorMsg = "Failed to create certificate file: " + certPath;
        return false;
    }
    const bool certOk = PEM_write_bio_X509(certBio, m_cert) == 1;
    BIO_free(certBio);
    if (!certOk) {
        errorMsg = "Failed to write certificate";
        return false;
    }

    BIO* keyBio = BIO_new_file(keyPath.c_str(), "w");
    if (!keyBio) {
        errorMsg = "Failed to create key file: " + keyPath;
        return false;
    }
    const bool keyOk =
        PEM_write_bio_PrivateKey(keyBio, m_key, nullptr, nullptr, 0, nullptr, nullptr) == 1;
    BIO_free(keyBio);
    if (!keyOk) {
        errorMsg = "Failed to write private key";
        return false;
    }

    // Private key readable by the owner only
    std::error_code ec;
    std::filesystem::permissions(keyPath,
                                 std::filesystem::perms::owner_read |
                                 std::filesystem::perms::owner_write,
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        LOG_WARNING("[LocalIdentity] Could not restrict key permissions: " << ec.message());
    }
    return true;
}

//=============================================================================
// LocalIdentity: TLS
//=============================================================================

bool LocalIdentity::applyTo(SSL_CTX* ctx, std::string& errorMsg) const {
    if (!ctx) {
        errorMsg = "SSL context is null";
        return false;
    }

    if (SSL_CTX_use_certificate(ctx, m_cert) != 1) {
        errorMsg = "Failed to install certificate";
        return false;
    }

    if (SSL_CTX_use_PrivateKey(ctx, m_key) != 1) {
        errorMsg = "Failed to install private key";
        return false;
    }

    if (SSL_CTX_check_private_key(ctx) != 1) {
        errorMsg = "Private key does not match certificate";
        return false;
    }

    return true;
}

}  // namespace FastDrop
