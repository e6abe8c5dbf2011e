#include "base64.h"
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>

static bool isBase64Char(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

std::optional<std::string> base64Decode(const std::string& input) {
    std::string clean;
    clean.reserve(input.size());
    size_t padding = 0;
    for (unsigned char c : input) {
        if (c == '=') {
            ++padding;
            clean.push_back('=');
        } else if (isBase64Char(c)) {
            // data after padding
            if (padding) return std::nullopt;
            clean.push_back(static_cast<char>(c));
        }
    }

    if (clean.empty() || clean.size() % 4 != 0 || padding > 2)
        return std::nullopt;

    BIO* bio = BIO_new_mem_buf(clean.data(), static_cast<int>(clean.size()));
    BIO* b64 = BIO_new(BIO_f_base64());
    if (!bio || !b64) {
        BIO_free(bio);
        BIO_free(b64);
        return std::nullopt;
    }
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    bio = BIO_push(b64, bio);

    std::string output(clean.size(), '\0');
    size_t total = 0;
    int len = 0;
    while (total < output.size() &&
           (len = BIO_read(bio, &output[total], static_cast<int>(output.size() - total))) > 0)
        total += static_cast<size_t>(len);
    BIO_free_all(bio);

    if (total == 0) return std::nullopt;
    output.resize(total);
    return output;
}

std::string base64Encode(const std::string& input) {
    if (input.empty()) return {};

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    BIO_set_flags(b64, BIO_FLAGS_BASE64_NO_NL);
    BIO* bio = BIO_push(b64, mem);

    BIO_write(bio, input.data(), static_cast<int>(input.size()));
    (void)BIO_flush(bio);

    BUF_MEM* ptr = nullptr;
    BIO_get_mem_ptr(bio, &ptr);
    std::string out = ptr ? std::string(ptr->data, ptr->length) : std::string();
    BIO_free_all(bio);
    return out;
}
