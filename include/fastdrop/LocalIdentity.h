/**
 * @file LocalIdentity.h
 * @brief The process identity: key pair, self-signed certificate, PeerIdentity
 *
 * (c) 2026 FastDrop Project
 * Licensed under MIT License
 */

#pragma once

#include "PeerIdentity.h"

#include <memory>
#include <string>

// Forward declarations to avoid pulling OpenSSL headers into every user
typedef struct ssl_ctx_st SSL_CTX;
typedef struct x509_st X509;
typedef struct evp_pkey_st EVP_PKEY;

namespace FastDrop {

/**
 * @brief Compute the PeerIdentity of a certificate (SHA-256 of its DER form)
 */
bool certificateIdentity(X509* cert, PeerIdentity& out, std::string& errorMsg);

/**
 * @class LocalIdentity
 * @brief Ed25519 key pair and self-signed X.509v3 certificate of this process
 *
 * Created once by the session controller and shared (read-only) with every
 * TLS socket it opens. The certificate is presented on both sides of every
 * handshake; its fingerprint is the PeerIdentity carried in tickets.
 *
 * Thread Safety: immutable after construction.
 */
class LocalIdentity {
public:
    /// Construction token for the factories below
    class Passkey {
        friend class LocalIdentity;
        Passkey() {}
    };

    /// Takes ownership of cert and key
    LocalIdentity(Passkey, X509* cert, EVP_PKEY* key);
    ~LocalIdentity();

    LocalIdentity(const LocalIdentity&) = delete;
    LocalIdentity& operator=(const LocalIdentity&) = delete;

    /**
     * @brief Generate a fresh in-memory identity
     * @param commonName CN of the certificate (device display name)
     * @param errorMsg Reason on failure
     * @return nullptr on failure
     */
    static std::shared_ptr<const LocalIdentity> generate(const std::string& commonName,
                                                         std::string& errorMsg);

    /**
     * @brief Load the identity stored in a directory, or create and store one
     *
     * Files: CERT_FILENAME and KEY_FILENAME inside directory. A certificate
     * that fails to load or has expired is replaced.
     */
    static std::shared_ptr<const LocalIdentity> loadOrCreate(const std::string& directory,
                                                             const std::string& commonName,
                                                             std::string& errorMsg);

    /**
     * @brief Write certificate and private key as PEM files
     */
    bool saveToFiles(const std::string& certPath,
                     const std::string& keyPath,
                     std::string& errorMsg) const;

    /**
     * @brief Install certificate and key into an SSL context
     */
    bool applyTo(SSL_CTX* ctx, std::string& errorMsg) const;

    const PeerIdentity& peerIdentity() const { return m_identity; }

    const std::string& commonName() const { return m_commonName; }

private:
    static bool loadFromFiles(const std::string& certPath,
                              const std::string& keyPath,
                              X509*& cert,
                              EVP_PKEY*& key,
                              std::string& errorMsg);

    X509* m_cert;
    EVP_PKEY* m_key;
    PeerIdentity m_identity;
    std::string m_commonName;
};

}  // namespace FastDrop
