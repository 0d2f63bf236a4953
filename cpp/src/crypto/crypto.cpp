// ==============================================================================
// crypto.cpp - Дайджесты, X.509, проверка подписей (OpenSSL 3)
// ==============================================================================
//
// Все объекты OpenSSL живут в unique_ptr с соответствующей *_free функцией.
// Очередь ошибок OpenSSL вычитывается в текст результата и не протекает
// между вызовами.
//
// ==============================================================================

#include <raven/crypto.hpp>

#include <openssl/asn1.h>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/cms.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/pem.h>
#include <openssl/pkcs7.h>
#include <openssl/x509.h>
#include <openssl/x509_vfy.h>

#include <algorithm>
#include <cstring>
#include <functional>
#include <memory>

namespace raven::crypto {

namespace {

// ----------------------------------------------------------------------------
// RAII-обёртки
// ----------------------------------------------------------------------------

using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&X509_free)>;
using StorePtr = std::unique_ptr<X509_STORE, decltype(&X509_STORE_free)>;
using StoreCtxPtr = std::unique_ptr<X509_STORE_CTX, decltype(&X509_STORE_CTX_free)>;
using PkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using Pkcs7Ptr = std::unique_ptr<PKCS7, decltype(&PKCS7_free)>;
using CmsPtr = std::unique_ptr<CMS_ContentInfo, decltype(&CMS_ContentInfo_free)>;
using AlgorPtr = std::unique_ptr<X509_ALGOR, decltype(&X509_ALGOR_free)>;
using AsnTimePtr = std::unique_ptr<ASN1_TIME, decltype(&ASN1_STRING_free)>;

struct X509StackDeleter {
    void operator()(STACK_OF(X509) * stack) const { sk_X509_pop_free(stack, X509_free); }
};
using X509StackPtr = std::unique_ptr<STACK_OF(X509), X509StackDeleter>;

constexpr const char* SPC_INDIRECT_DATA_OID = "1.3.6.1.4.1.311.2.1.4";

/// Вычитать очередь ошибок OpenSSL в одну строку
std::string openssl_error(const std::string& context) {
    std::string out = context;
    unsigned long code = 0;
    bool first = true;
    while ((code = ERR_get_error()) != 0) {
        char buf[256];
        ERR_error_string_n(code, buf, sizeof(buf));
        out += first ? ": " : "; ";
        out += buf;
        first = false;
    }
    return out;
}

BioPtr memory_bio(const void* data, std::size_t size) {
    return BioPtr(BIO_new_mem_buf(data, static_cast<int>(size)), &BIO_free);
}

std::string bio_to_string(BIO* bio) {
    char* data = nullptr;
    const long len = BIO_get_mem_data(bio, &data);
    if (len <= 0 || data == nullptr) {
        return {};
    }
    return std::string(data, static_cast<std::size_t>(len));
}

std::string name_to_string(const X509_NAME* name) {
    BioPtr bio(BIO_new(BIO_s_mem()), &BIO_free);
    if (!bio || name == nullptr) {
        return {};
    }
    X509_NAME_print_ex(bio.get(), name, 0, XN_FLAG_RFC2253);
    return bio_to_string(bio.get());
}

std::int64_t asn1_time_to_unix(const ASN1_TIME* time) {
    if (time == nullptr) {
        return 0;
    }
    AsnTimePtr epoch(ASN1_TIME_set(nullptr, 0), &ASN1_STRING_free);
    int days = 0;
    int seconds = 0;
    if (!epoch || ASN1_TIME_diff(&days, &seconds, epoch.get(), time) != 1) {
        return 0;
    }
    return static_cast<std::int64_t>(days) * 86400 + seconds;
}

std::optional<Certificate> from_x509(X509* x509) {
    if (x509 == nullptr) {
        return std::nullopt;
    }
    const int len = i2d_X509(x509, nullptr);
    if (len <= 0) {
        ERR_clear_error();
        return std::nullopt;
    }
    Certificate cert;
    cert.der.resize(static_cast<std::size_t>(len));
    unsigned char* out = cert.der.data();
    i2d_X509(x509, &out);

    cert.subject = name_to_string(X509_get_subject_name(x509));
    cert.issuer = name_to_string(X509_get_issuer_name(x509));

    const ASN1_INTEGER* serial = X509_get0_serialNumber(x509);
    if (serial != nullptr) {
        BIGNUM* bn = ASN1_INTEGER_to_BN(serial, nullptr);
        if (bn != nullptr) {
            char* hex = BN_bn2hex(bn);
            if (hex != nullptr) {
                cert.serial = hex;
                OPENSSL_free(hex);
            }
            BN_free(bn);
        }
    }

    cert.not_before = asn1_time_to_unix(X509_get0_notBefore(x509));
    cert.not_after = asn1_time_to_unix(X509_get0_notAfter(x509));
    return cert;
}

X509Ptr to_x509(const Certificate& cert) {
    const unsigned char* p = cert.der.data();
    return X509Ptr(d2i_X509(nullptr, &p, static_cast<long>(cert.der.size())), &X509_free);
}

std::vector<Certificate> from_stack(const STACK_OF(X509) * stack) {
    std::vector<Certificate> out;
    if (stack == nullptr) {
        return out;
    }
    for (int i = 0; i < sk_X509_num(stack); ++i) {
        if (auto cert = from_x509(sk_X509_value(stack, i))) {
            out.push_back(std::move(*cert));
        }
    }
    return out;
}

/// Хранилище якорей доверия с фиксированным временем проверки
StorePtr make_store(const std::vector<std::string>& anchor_pems, std::int64_t at_time,
                    std::size_t& anchor_count) {
    StorePtr store(X509_STORE_new(), &X509_STORE_free);
    anchor_count = 0;
    if (!store) {
        return store;
    }
    for (const auto& pem : anchor_pems) {
        for (const auto& anchor : certificates_from_pem(pem)) {
            X509Ptr x509 = to_x509(anchor);
            if (x509 && X509_STORE_add_cert(store.get(), x509.get()) == 1) {
                ++anchor_count;
            }
        }
    }
    ERR_clear_error();
    X509_VERIFY_PARAM* param = X509_STORE_get0_param(store.get());
    X509_VERIFY_PARAM_set_time(param, static_cast<time_t>(at_time));
    X509_STORE_set_purpose(store.get(), X509_PURPOSE_ANY);
    return store;
}

/// Открытые ключи из PEM: блоки "PUBLIC KEY" и "CERTIFICATE"
std::vector<PkeyPtr> load_public_keys(const std::vector<std::string>& pems) {
    std::vector<PkeyPtr> keys;
    for (const auto& pem : pems) {
        BioPtr bio = memory_bio(pem.data(), pem.size());
        if (!bio) {
            continue;
        }
        for (;;) {
            char* name = nullptr;
            char* header = nullptr;
            unsigned char* data = nullptr;
            long len = 0;
            if (PEM_read_bio(bio.get(), &name, &header, &data, &len) != 1) {
                break;
            }
            const unsigned char* p = data;
            if (std::strcmp(name, PEM_STRING_PUBLIC) == 0) {
                EVP_PKEY* key = d2i_PUBKEY(nullptr, &p, len);
                if (key != nullptr) {
                    keys.emplace_back(key, &EVP_PKEY_free);
                }
            } else if (std::strcmp(name, PEM_STRING_X509) == 0) {
                X509Ptr x509(d2i_X509(nullptr, &p, len), &X509_free);
                if (x509) {
                    EVP_PKEY* key = X509_get_pubkey(x509.get());
                    if (key != nullptr) {
                        keys.emplace_back(key, &EVP_PKEY_free);
                    }
                }
            }
            OPENSSL_free(name);
            OPENSSL_free(header);
            OPENSSL_free(data);
        }
    }
    ERR_clear_error();
    return keys;
}

const EVP_MD* digest_by_name(const std::string& algorithm) {
    if (algorithm == "sha1") {
        return EVP_sha1();
    }
    if (algorithm == "sha256") {
        return EVP_sha256();
    }
    if (algorithm == "sha384") {
        return EVP_sha384();
    }
    if (algorithm == "sha512") {
        return EVP_sha512();
    }
    return nullptr;
}

/// Пройти источник блоками, пропуская excluded диапазоны
bool for_each_included(
    const io::ByteSource& source, const std::vector<ByteRange>& excluded,
    const std::function<bool(const std::uint8_t* data, std::size_t len)>& visitor) {
    std::vector<ByteRange> ranges;
    for (const auto& r : excluded) {
        if (!r.empty()) {
            ranges.push_back(r);
        }
    }
    std::sort(ranges.begin(), ranges.end(),
              [](const ByteRange& a, const ByteRange& b) { return a.offset < b.offset; });

    return source.for_each_chunk([&](std::uint64_t offset, const std::uint8_t* data,
                                     std::size_t len) {
        std::uint64_t pos = offset;
        const std::uint64_t end = offset + len;
        while (pos < end) {
            std::uint64_t next_stop = end;
            bool skipped = false;
            for (const auto& r : ranges) {
                if (r.contains(pos)) {
                    pos = std::min<std::uint64_t>(r.end(), end);
                    skipped = true;
                    break;
                }
                if (r.offset > pos) {
                    next_stop = std::min<std::uint64_t>(next_stop, r.offset);
                    break;
                }
            }
            if (skipped) {
                continue;
            }
            if (!visitor(data + (pos - offset), static_cast<std::size_t>(next_stop - pos))) {
                return false;
            }
            pos = next_stop;
        }
        return true;
    });
}

}  // namespace

// ----------------------------------------------------------------------------
// Дайджесты
// ----------------------------------------------------------------------------

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0F]);
    }
    return out;
}

std::string to_hex(const std::vector<std::uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

DigestResult digest_bytes(const std::uint8_t* data, std::size_t size,
                          const std::string& algorithm) {
    io::MemorySource source(std::vector<std::uint8_t>(data, data + size));
    return digest_source(source, algorithm);
}

DigestResult digest_source(const io::ByteSource& source, const std::string& algorithm,
                           const std::vector<ByteRange>& excluded) {
    DigestResult result;
    const EVP_MD* md = digest_by_name(algorithm);
    if (md == nullptr) {
        result.error = "unsupported digest algorithm '" + algorithm + "'";
        return result;
    }

    MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1) {
        result.error = openssl_error("EVP_DigestInit_ex failed");
        return result;
    }

    bool update_failed = false;
    const bool read_ok = for_each_included(source, excluded,
                                           [&](const std::uint8_t* data, std::size_t len) {
                                               if (EVP_DigestUpdate(ctx.get(), data, len) != 1) {
                                                   update_failed = true;
                                                   return false;
                                               }
                                               return true;
                                           });
    if (update_failed) {
        result.error = openssl_error("EVP_DigestUpdate failed");
        return result;
    }
    if (!read_ok) {
        result.error = "failed to read binary while hashing";
        return result;
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        result.error = openssl_error("EVP_DigestFinal_ex failed");
        return result;
    }

    result.ok = true;
    result.hex = to_hex(digest, digest_len);
    return result;
}

DigestResult digest_range(const io::ByteSource& source, std::uint64_t offset, std::uint64_t size,
                          const std::string& algorithm) {
    const std::uint64_t total = source.size();
    if (offset > total || size > total - offset) {
        DigestResult result;
        result.error = "range out of bounds";
        return result;
    }
    std::vector<ByteRange> excluded;
    if (offset > 0) {
        excluded.push_back({0, offset});
    }
    if (offset + size < total) {
        excluded.push_back({offset + size, total - offset - size});
    }
    return digest_source(source, algorithm, excluded);
}

bool collect_without(const io::ByteSource& source, const std::vector<ByteRange>& excluded,
                     std::vector<std::uint8_t>& out) {
    out.clear();
    return for_each_included(source, excluded, [&](const std::uint8_t* data, std::size_t len) {
        out.insert(out.end(), data, data + len);
        return true;
    });
}

// ----------------------------------------------------------------------------
// Сертификаты
// ----------------------------------------------------------------------------

std::optional<Certificate> describe_certificate(const std::vector<std::uint8_t>& der) {
    if (der.empty()) {
        return std::nullopt;
    }
    const unsigned char* p = der.data();
    X509Ptr x509(d2i_X509(nullptr, &p, static_cast<long>(der.size())), &X509_free);
    if (!x509) {
        ERR_clear_error();
        return std::nullopt;
    }
    return from_x509(x509.get());
}

std::vector<Certificate> certificates_from_pem(const std::string& pem) {
    std::vector<Certificate> out;
    BioPtr bio = memory_bio(pem.data(), pem.size());
    if (!bio) {
        return out;
    }
    for (;;) {
        X509Ptr x509(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
        if (!x509) {
            break;
        }
        if (auto cert = from_x509(x509.get())) {
            out.push_back(std::move(*cert));
        }
    }
    // Конец PEM-потока OpenSSL тоже сообщает как ошибку
    ERR_clear_error();
    return out;
}

std::vector<Certificate> certificates_from_pkcs7(const std::vector<std::uint8_t>& der) {
    const unsigned char* p = der.data();
    Pkcs7Ptr p7(d2i_PKCS7(nullptr, &p, static_cast<long>(der.size())), &PKCS7_free);
    if (!p7 || !PKCS7_type_is_signed(p7.get()) || p7->d.sign == nullptr) {
        ERR_clear_error();
        return {};
    }
    return from_stack(p7->d.sign->cert);
}

std::vector<Certificate> certificates_from_cms(const std::vector<std::uint8_t>& der) {
    const unsigned char* p = der.data();
    CmsPtr cms(d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(der.size())),
               &CMS_ContentInfo_free);
    if (!cms) {
        ERR_clear_error();
        return {};
    }
    X509StackPtr certs(CMS_get1_certs(cms.get()));
    return from_stack(certs.get());
}

VerifyResult verify_chain(const std::vector<Certificate>& chain,
                          const std::vector<std::string>& trust_anchor_pems,
                          std::int64_t at_time) {
    VerifyResult result;
    if (chain.empty()) {
        result.message = "no certificate to verify";
        return result;
    }

    std::size_t anchors = 0;
    StorePtr store = make_store(trust_anchor_pems, at_time, anchors);
    if (!store) {
        result.message = openssl_error("X509_STORE_new failed");
        return result;
    }
    if (anchors == 0) {
        result.message = "no trust anchors configured";
        return result;
    }

    X509Ptr leaf = to_x509(chain.front());
    if (!leaf) {
        result.message = openssl_error("embedded certificate is not valid DER");
        return result;
    }

    X509StackPtr untrusted(sk_X509_new_null());
    for (std::size_t i = 1; i < chain.size(); ++i) {
        X509Ptr cert = to_x509(chain[i]);
        if (cert && sk_X509_push(untrusted.get(), cert.get()) > 0) {
            cert.release();
        }
    }

    StoreCtxPtr ctx(X509_STORE_CTX_new(), &X509_STORE_CTX_free);
    if (!ctx || X509_STORE_CTX_init(ctx.get(), store.get(), leaf.get(), untrusted.get()) != 1) {
        result.message = openssl_error("X509_STORE_CTX_init failed");
        return result;
    }

    if (X509_verify_cert(ctx.get()) == 1) {
        result.ok = true;
        result.message = "chain of " + std::to_string(chain.size()) +
                         " certificate(s) verified against " + std::to_string(anchors) +
                         " trust anchor(s)";
        return result;
    }

    const int err = X509_STORE_CTX_get_error(ctx.get());
    result.message = std::string("certificate chain verification failed: ") +
                     X509_verify_cert_error_string(err);
    ERR_clear_error();
    return result;
}

// ----------------------------------------------------------------------------
// Подписи
// ----------------------------------------------------------------------------

VerifyResult verify_raw_signature(const std::vector<std::uint8_t>& signature,
                                  const io::ByteSource& source,
                                  const std::vector<ByteRange>& excluded,
                                  const std::vector<std::string>& trusted_key_pems) {
    VerifyResult result;
    if (signature.empty()) {
        result.message = "signature blob is empty";
        return result;
    }
    const std::vector<PkeyPtr> keys = load_public_keys(trusted_key_pems);
    if (keys.empty()) {
        result.message = "no trusted keys configured";
        return result;
    }

    // Ed25519/Ed448 не поддерживают потоковую проверку
    std::vector<std::uint8_t> message;
    bool message_loaded = false;

    for (std::size_t i = 0; i < keys.size(); ++i) {
        EVP_PKEY* key = keys[i].get();
        const int id = EVP_PKEY_get_base_id(key);
        MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!ctx) {
            continue;
        }

        int rc = 0;
        if (id == EVP_PKEY_ED25519 || id == EVP_PKEY_ED448) {
            if (!message_loaded) {
                if (!collect_without(source, excluded, message)) {
                    result.message = "failed to read binary while verifying signature";
                    return result;
                }
                message_loaded = true;
            }
            if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key) == 1) {
                rc = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                                      message.data(), message.size());
            }
        } else {
            if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key) == 1) {
                const bool read_ok =
                    for_each_included(source, excluded,
                                      [&](const std::uint8_t* data, std::size_t len) {
                                          return EVP_DigestVerifyUpdate(ctx.get(), data, len) == 1;
                                      });
                if (read_ok) {
                    rc = EVP_DigestVerifyFinal(ctx.get(), signature.data(), signature.size());
                }
            }
        }
        ERR_clear_error();

        if (rc == 1) {
            result.ok = true;
            result.message = std::string("signature verified with trusted ") +
                             OBJ_nid2sn(id) + " key #" + std::to_string(i + 1);
            return result;
        }
    }

    result.message = "signature does not verify with any of " + std::to_string(keys.size()) +
                     " trusted key(s)";
    return result;
}

VerifyResult verify_authenticode(const std::vector<std::uint8_t>& pkcs7_der,
                                 const io::ByteSource& source,
                                 const std::vector<ByteRange>& excluded,
                                 const std::vector<std::string>& trust_anchor_pems,
                                 std::int64_t at_time) {
    VerifyResult result;
    const unsigned char* p = pkcs7_der.data();
    Pkcs7Ptr p7(d2i_PKCS7(nullptr, &p, static_cast<long>(pkcs7_der.size())), &PKCS7_free);
    if (!p7 || !PKCS7_type_is_signed(p7.get()) || p7->d.sign == nullptr) {
        result.message = openssl_error("Authenticode blob is not PKCS#7 SignedData");
        return result;
    }

    PKCS7* contents = p7->d.sign->contents;
    char oid[128] = {};
    if (contents == nullptr || contents->type == nullptr ||
        OBJ_obj2txt(oid, sizeof(oid), contents->type, 1) <= 0 ||
        std::strcmp(oid, SPC_INDIRECT_DATA_OID) != 0) {
        result.message = "PKCS#7 content is not SpcIndirectDataContent";
        return result;
    }
    ASN1_TYPE* other = contents->d.other;
    if (other == nullptr || other->type != V_ASN1_SEQUENCE || other->value.sequence == nullptr) {
        result.message = "SpcIndirectDataContent is not a SEQUENCE";
        return result;
    }

    const unsigned char* seq = other->value.sequence->data;
    const long seq_len = other->value.sequence->length;

    // Подписывается содержимое SEQUENCE без внешнего заголовка
    const unsigned char* inner = seq;
    long inner_len = 0;
    int tag = 0;
    int xclass = 0;
    if (ASN1_get_object(&inner, &inner_len, &tag, &xclass, seq_len) & 0x80) {
        result.message = openssl_error("malformed SpcIndirectDataContent");
        return result;
    }
    const long header_len = static_cast<long>(inner - seq);

    std::size_t anchors = 0;
    StorePtr store = make_store(trust_anchor_pems, at_time, anchors);
    if (!store || anchors == 0) {
        result.message = "no trust anchors configured";
        return result;
    }

    BioPtr content = memory_bio(inner, static_cast<std::size_t>(seq_len - header_len));
    if (!content || PKCS7_verify(p7.get(), nullptr, store.get(), content.get(), nullptr, 0) != 1) {
        result.message = openssl_error("Authenticode signature verification failed");
        return result;
    }

    // messageDigest: SEQUENCE { SpcAttributeTypeAndOptionalValue, DigestInfo }
    const unsigned char* q = inner;
    const unsigned char* end = inner + inner_len;
    long len = 0;
    if ((ASN1_get_object(&q, &len, &tag, &xclass, end - q) & 0x80) || tag != V_ASN1_SEQUENCE) {
        result.message = "malformed SpcAttributeTypeAndOptionalValue";
        return result;
    }
    q += len;
    if ((ASN1_get_object(&q, &len, &tag, &xclass, end - q) & 0x80) || tag != V_ASN1_SEQUENCE) {
        result.message = "malformed DigestInfo";
        return result;
    }
    AlgorPtr alg(d2i_X509_ALGOR(nullptr, &q, end - q), &X509_ALGOR_free);
    if (!alg) {
        result.message = openssl_error("malformed DigestInfo algorithm");
        return result;
    }
    const ASN1_OBJECT* alg_oid = nullptr;
    X509_ALGOR_get0(&alg_oid, nullptr, nullptr, alg.get());
    const int nid = OBJ_obj2nid(alg_oid);
    const std::string algorithm = nid == NID_sha1 ? "sha1" : nid == NID_sha256 ? "sha256" : "";
    if (algorithm.empty()) {
        result.message = std::string("unsupported Authenticode digest ") + OBJ_nid2sn(nid);
        return result;
    }
    if ((ASN1_get_object(&q, &len, &tag, &xclass, end - q) & 0x80) ||
        tag != V_ASN1_OCTET_STRING) {
        result.message = "malformed DigestInfo digest";
        return result;
    }
    const std::string declared = to_hex(q, static_cast<std::size_t>(len));

    const DigestResult actual = digest_source(source, algorithm, excluded);
    if (!actual) {
        result.message = actual.error;
        return result;
    }
    if (actual.hex != declared) {
        result.message = "Authenticode image digest mismatch (signed " + declared +
                         ", actual " + actual.hex + ")";
        return result;
    }

    result.ok = true;
    result.message = "Authenticode signature and " + algorithm + " image digest verified";
    return result;
}

VerifyResult verify_cms_detached(const std::vector<std::uint8_t>& cms_der,
                                 const std::vector<std::uint8_t>& content,
                                 const std::vector<std::string>& trust_anchor_pems,
                                 std::int64_t at_time) {
    VerifyResult result;
    const unsigned char* p = cms_der.data();
    CmsPtr cms(d2i_CMS_ContentInfo(nullptr, &p, static_cast<long>(cms_der.size())),
               &CMS_ContentInfo_free);
    if (!cms) {
        result.message = openssl_error("code signature blob is not CMS SignedData");
        return result;
    }

    std::size_t anchors = 0;
    StorePtr store = make_store(trust_anchor_pems, at_time, anchors);
    if (!store || anchors == 0) {
        result.message = "no trust anchors configured";
        return result;
    }

    BioPtr data = memory_bio(content.data(), content.size());
    if (!data ||
        CMS_verify(cms.get(), nullptr, store.get(), data.get(), nullptr, CMS_BINARY) != 1) {
        result.message = openssl_error("CMS signature over CodeDirectory failed");
        return result;
    }

    result.ok = true;
    result.message = "CMS signature over CodeDirectory verified";
    return result;
}

// ----------------------------------------------------------------------------
// PE
// ----------------------------------------------------------------------------

std::optional<std::uint32_t> pe_image_checksum(const io::ByteSource& source,
                                               std::uint64_t checksum_offset) {
    std::uint64_t sum = 0;
    int pending = -1;  // непарный байт с прошлого блока
    std::uint64_t pending_offset = 0;

    auto add_word = [&](std::uint64_t word_offset, std::uint32_t word) {
        if (word_offset == checksum_offset || word_offset == checksum_offset + 2) {
            return;
        }
        sum += word;
        sum = (sum & 0xFFFF) + (sum >> 16);
    };

    const bool ok = source.for_each_chunk(
        [&](std::uint64_t offset, const std::uint8_t* data, std::size_t len) {
            std::size_t i = 0;
            if (pending >= 0 && len > 0) {
                add_word(pending_offset, static_cast<std::uint32_t>(pending) |
                                             (static_cast<std::uint32_t>(data[0]) << 8));
                pending = -1;
                i = 1;
            }
            for (; i + 1 < len; i += 2) {
                add_word(offset + i, static_cast<std::uint32_t>(data[i]) |
                                         (static_cast<std::uint32_t>(data[i + 1]) << 8));
            }
            if (i < len) {
                pending = data[i];
                pending_offset = offset + i;
            }
            return true;
        });
    if (!ok) {
        return std::nullopt;
    }
    if (pending >= 0) {
        add_word(pending_offset, static_cast<std::uint32_t>(pending));
    }

    sum = (sum & 0xFFFF) + (sum >> 16);
    sum &= 0xFFFF;
    return static_cast<std::uint32_t>(sum + source.size());
}

}  // namespace raven::crypto
