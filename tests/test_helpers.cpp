#include "test_helpers.hpp"

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <climits>
#include <memory>
#include <new>

namespace acmeflow {
namespace test {

namespace {

struct X509Free {
    void operator()(X509* cert) const { X509_free(cert); }
};
struct ExtensionFree {
    void operator()(X509_EXTENSION* ext) const { X509_EXTENSION_free(ext); }
};

std::string drain(BIO* bio) {
    char* data = nullptr;
    long len = BIO_get_mem_data(bio, &data);
    return len > 0 ? std::string(data, static_cast<size_t>(len)) : std::string();
}

}  // namespace

std::string makeCertificatePem(const CertificateParams& params) {
    const AccountKeyPair& key = rsaAccountKey();
    EVP_PKEY* pkey = key.native();

    std::unique_ptr<X509, X509Free> cert(X509_new());
    if (!cert) {
        throw std::runtime_error("X509_new failed");
    }
    X509_set_version(cert.get(), 2);
    ASN1_INTEGER_set(X509_get_serialNumber(cert.get()), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert.get()), params.valid_from_seconds);
    X509_gmtime_adj(X509_getm_notAfter(cert.get()),
                    params.valid_from_seconds + params.valid_for_seconds);
    X509_set_pubkey(cert.get(), pkey);

    X509_NAME* name = X509_get_subject_name(cert.get());
    if (params.common_name) {
        X509_NAME_add_entry_by_txt(
            name, "CN", MBSTRING_ASC,
            reinterpret_cast<const unsigned char*>(params.common_name->c_str()), -1, -1, 0);
    } else {
        X509_NAME_add_entry_by_txt(name, "O", MBSTRING_ASC,
                                   reinterpret_cast<const unsigned char*>("acmeflow tests"),
                                   -1, -1, 0);
    }
    X509_set_issuer_name(cert.get(), name);

    if (!params.dns_names.empty()) {
        std::string value;
        for (const auto& dns : params.dns_names) {
            if (!value.empty()) {
                value += ",";
            }
            value += "DNS:" + dns;
        }
        X509V3_CTX ctx;
        X509V3_set_ctx_nodb(&ctx);
        X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
        std::unique_ptr<X509_EXTENSION, ExtensionFree> ext(
            X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, value.c_str()));
        if (!ext || X509_add_ext(cert.get(), ext.get(), -1) != 1) {
            throw std::runtime_error("failed to add subjectAltName");
        }
    }

    if (X509_sign(cert.get(), pkey, EVP_sha256()) <= 0) {
        throw std::runtime_error("X509_sign failed");
    }

    BIO* bio = BIO_new(BIO_s_mem());
    PEM_write_bio_X509(bio, cert.get());
    std::string pem = drain(bio);
    BIO_free(bio);

    if (params.include_private_key) {
        pem += key.privateKeyPem();
    }
    return pem;
}

std::unique_ptr<char[]> oversizedBuffer(size_t& size) {
    size = static_cast<size_t>(INT_MAX) + 1;
    return std::unique_ptr<char[]>(new (std::nothrow) char[size]);
}

}  // namespace test
}  // namespace acmeflow
