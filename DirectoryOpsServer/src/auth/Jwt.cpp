#include "Jwt.h"
#include "../net/MiniJson.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/crypto.h>
#include <ctime>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace {

std::string base64url_encode(const std::string& in) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new(BIO_s_mem());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    b64 = BIO_push(b64, bmem);
    BIO_write(b64, in.data(), static_cast<int>(in.size()));
    (void)BIO_flush(b64);
    BUF_MEM* bptr = nullptr;
    BIO_get_mem_ptr(b64, &bptr);
    std::string out(bptr->data, bptr->length);
    BIO_free_all(b64);
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    while (!out.empty() && out.back() == '=') out.pop_back();
    return out;
}

std::string base64url_decode(const std::string& in) {
    std::string s = in;
    for (auto& c : s) {
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
    }
    while (s.size() % 4) s.push_back('=');
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bmem = BIO_new_mem_buf(s.data(), static_cast<int>(s.size()));
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bmem = BIO_push(b64, bmem);
    std::vector<char> out(s.size());
    int outlen = BIO_read(bmem, out.data(), static_cast<int>(out.size()));
    BIO_free_all(bmem);
    if (outlen <= 0) return std::string();
    return std::string(out.data(), outlen);
}

std::string hmac_sha256(const std::string& key, const std::string& data) {
    unsigned int len = EVP_MAX_MD_SIZE;
    unsigned char md[EVP_MAX_MD_SIZE];
    HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(), md, &len);
    return std::string(reinterpret_cast<char*>(md), len);
}

}

namespace auth {

std::string create_jwt(const Claims& c, const std::string& secret) {
    const std::string header_s = "{\"alg\":\"HS256\",\"typ\":\"JWT\"}";
    std::ostringstream oss;
    oss << "{\"sub\":\"" << json_escape_resp(c.sub) << "\"";
    if (!c.name.empty()) oss << ",\"name\":\"" << json_escape_resp(c.name) << "\"";
    oss << ",\"iat\":" << c.iat << ",\"exp\":" << c.exp << "}";
    std::string to_sign = base64url_encode(header_s) + "." + base64url_encode(oss.str());
    return to_sign + "." + base64url_encode(hmac_sha256(secret, to_sign));
}

std::optional<Claims> verify_jwt(const std::string& token, const std::string& secret) {
    const size_t MAX_TOKEN = 8 * 1024;
    if (secret.empty() || token.empty() || token.size() > MAX_TOKEN) return std::nullopt;
    size_t p1 = token.find('.');
    if (p1 == std::string::npos) return std::nullopt;
    size_t p2 = token.find('.', p1 + 1);
    if (p2 == std::string::npos || token.find('.', p2 + 1) != std::string::npos) return std::nullopt;
    std::string h_enc = token.substr(0, p1);
    std::string p_enc = token.substr(p1 + 1, p2 - p1 - 1);
    std::string sig = base64url_decode(token.substr(p2 + 1));
    std::string expected_sig = hmac_sha256(secret, h_enc + "." + p_enc);
    if (sig.size() != expected_sig.size()) return std::nullopt;
    if (CRYPTO_memcmp(sig.data(), expected_sig.data(), sig.size()) != 0) return std::nullopt;

    Claims cl;
    try {
        std::string header_s = base64url_decode(h_enc);
        if (json_extract_string(header_s, "alg") != "HS256") return std::nullopt;
        auto typ = json_extract_string_present(header_s, "typ");
        if (typ.first && typ.second != "JWT") return std::nullopt;

        std::string payload_s = base64url_decode(p_enc);
        cl.sub = json_extract_string(payload_s, "sub");
        cl.name = json_extract_string(payload_s, "name");
        cl.iat = json_extract_int_opt(payload_s, "iat").value_or(0);
        cl.exp = json_extract_int_opt(payload_s, "exp").value_or(0);
    } catch (const std::runtime_error&) {
        return std::nullopt;
    }
    if (cl.sub.empty()) return std::nullopt;
    auto now = static_cast<int64_t>(std::time(nullptr));
    if (cl.exp != 0 && now > cl.exp) return std::nullopt;
    if (cl.iat != 0 && cl.iat > now + 60) return std::nullopt;
    return cl;
}

std::optional<std::string> bearer_token(const std::string& header_value) {
    const std::string prefix = "Bearer ";
    if (header_value.size() <= prefix.size()) return std::nullopt;
    if (header_value.compare(0, prefix.size(), prefix) != 0) return std::nullopt;
    return header_value.substr(prefix.size());
}

}
