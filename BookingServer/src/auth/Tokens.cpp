#include "Tokens.h"
#include <memory>
#include <stdexcept>
#include <vector>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace auth {

std::string base64_encode(const std::string& in) {
    if (in.empty()) return std::string();
    std::unique_ptr<BIO, decltype(&BIO_free_all)> chain(BIO_new(BIO_f_base64()), &BIO_free_all);
    BIO* bmem = BIO_new(BIO_s_mem());
    if (!chain || !bmem) {
        if (bmem) BIO_free(bmem);
        throw std::runtime_error("BIO_new failed");
    }
    BIO_set_flags(chain.get(), BIO_FLAGS_BASE64_NO_NL);
    BIO* b64 = BIO_push(chain.get(), bmem);
    if (BIO_write(b64, in.data(), int(in.size())) <= 0 || BIO_flush(b64) != 1) {
        throw std::runtime_error("base64 encoding failed");
    }
    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);
    return std::string(bptr->data, bptr->length);
}

std::string base64url_encode(const std::string& in) {
    std::string out = base64_encode(in);
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string random_token(std::size_t bytes) {
    std::vector<unsigned char> buf(bytes);
    if (RAND_bytes(buf.data(), int(buf.size())) != 1) throw std::runtime_error("RAND_bytes failed");
    return base64url_encode(std::string(buf.begin(), buf.end()));
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

}
