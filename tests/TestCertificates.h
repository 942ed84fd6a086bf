#pragma once

#include <cstdio>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

namespace testcerts {

struct CertFiles {
    std::filesystem::path cert;
    std::filesystem::path key;
};

namespace detail {

inline void addExtension(X509* cert, int nid, const std::string& value) {
    X509V3_CTX ctx;
    X509V3_set_ctx_nodb(&ctx);
    X509V3_set_ctx(&ctx, cert, cert, nullptr, nullptr, 0);
    X509_EXTENSION* ext = X509V3_EXT_conf_nid(nullptr, &ctx, nid, value.c_str());
    if (ext == nullptr) {
        throw std::runtime_error("cannot build extension " + value);
    }
    const int added = X509_add_ext(cert, ext, -1);
    X509_EXTENSION_free(ext);
    if (added != 1) {
        throw std::runtime_error("cannot add extension " + value);
    }
}

inline void writePem(const std::filesystem::path& path, const std::function<int(FILE*)>& write) {
    std::unique_ptr<FILE, decltype(&std::fclose)> file(std::fopen(path.c_str(), "w"), &std::fclose);
    if (!file || write(file.get()) != 1) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

}  // namespace detail

// Writes a one hour self-signed P-256 certificate for dnsName (CN and SAN) and its key.
inline CertFiles writeSelfSigned(const std::filesystem::path& dir, const std::string& dnsName) {
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> keyCtx(EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr),
                                                                      &EVP_PKEY_CTX_free);
    EVP_PKEY* rawKey = nullptr;
    if (!keyCtx || EVP_PKEY_keygen_init(keyCtx.get()) <= 0
        || EVP_PKEY_CTX_set_ec_paramgen_curve_nid(keyCtx.get(), NID_X9_62_prime256v1) <= 0
        || EVP_PKEY_keygen(keyCtx.get(), &rawKey) <= 0) {
        throw std::runtime_error("key generation failed");
    }
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(rawKey, &EVP_PKEY_free);

    std::unique_ptr<X509, decltype(&X509_free)> cert(X509_new(), &X509_free);
    if (!cert) {
        throw std::runtime_error("X509_new failed");
    }
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), -60);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()), 3600);
    X509_set_pubkey(cert.get(), key.get());
    X509_NAME* name = X509_get_subject_name(cert.get());
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(dnsName.c_str()),
                               -1, -1, 0);
    X509_set_issuer_name(cert.get(), name);
    detail::addExtension(cert.get(), NID_basic_constraints, "critical,CA:TRUE");
    detail::addExtension(cert.get(), NID_subject_alt_name, "DNS:" + dnsName);
    if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
        throw std::runtime_error("certificate signing failed");
    }

    CertFiles files{dir / (dnsName + ".crt"), dir / (dnsName + ".key")};
    detail::writePem(files.cert, [&](FILE* out) { return PEM_write_X509(out, cert.get()); });
    detail::writePem(files.key, [&](FILE* out) {
        return PEM_write_PrivateKey(out, key.get(), nullptr, nullptr, 0, nullptr, nullptr);
    });
    return files;
}

}  // namespace testcerts
