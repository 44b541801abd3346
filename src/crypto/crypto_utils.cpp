#include <rsp/crypto/crypto_utils.h>

#include <openssl/evp.h>
#include <cctype>

namespace rsp {
namespace crypto {
namespace utils {

// Random utilities
Result<std::vector<uint8_t>> random_bytes(CryptoProvider& provider, size_t length) {
    RandomParams params;
    params.length = length;
    params.cryptographically_secure = true;

    return provider.generate_random(params);
}

Result<std::string> random_hex(CryptoProvider& provider, size_t byte_count) {
    auto bytes = random_bytes(provider, byte_count);
    if (!bytes) {
        return make_error<std::string>(bytes.error());
    }
    return to_hex(*bytes, true);
}

// Hash utilities
Result<std::vector<uint8_t>> sha256(CryptoProvider& provider, const std::vector<uint8_t>& data) {
    HashParams params;
    params.data = data;
    params.algorithm = HashAlgorithm::SHA256;
    return provider.compute_hash(params);
}

Result<std::string> sha256_hex(CryptoProvider& provider, const std::string& text) {
    auto digest = sha256(provider, to_bytes(text));
    if (!digest) {
        return make_error<std::string>(digest.error());
    }
    return to_hex(*digest);
}

Result<std::vector<uint8_t>> hmac_sha256(CryptoProvider& provider,
                                         const std::vector<uint8_t>& key,
                                         const std::vector<uint8_t>& data) {
    HMACParams params;
    params.key = key;
    params.data = data;
    params.algorithm = HashAlgorithm::SHA256;
    return provider.compute_hmac(params);
}

// Timing-safe comparison
bool constant_time_compare(const std::vector<uint8_t>& a, const std::vector<uint8_t>& b) {
    if (a.size() != b.size()) {
        return false;
    }

    uint8_t result = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        result |= (a[i] ^ b[i]);
    }

    return result == 0;
}

// Secure memory utilities
void secure_zero(std::vector<uint8_t>& data) {
    if (!data.empty()) {
        secure_zero(data.data(), data.size());
        data.clear();
    }
}

void secure_zero(uint8_t* data, size_t length) {
    if (data && length > 0) {
        // Use volatile to prevent compiler optimization
        volatile uint8_t* volatile_ptr = data;
        for (size_t i = 0; i < length; ++i) {
            volatile_ptr[i] = 0;
        }
    }
}

// Encoding utilities
std::string to_hex(const std::vector<uint8_t>& data, bool uppercase) {
    const char* digits = uppercase ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string hex;
    hex.reserve(data.size() * 2);
    for (uint8_t byte : data) {
        hex.push_back(digits[byte >> 4]);
        hex.push_back(digits[byte & 0x0F]);
    }
    return hex;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

Result<std::vector<uint8_t>> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>>(RSPError::DECODE_ERROR);
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_value(hex[i]);
        int low = hex_value(hex[i + 1]);
        if (high < 0 || low < 0) {
            return Result<std::vector<uint8_t>>(RSPError::DECODE_ERROR);
        }
        bytes.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return Result<std::vector<uint8_t>>(std::move(bytes));
}

std::string base64_encode(const std::vector<uint8_t>& data) {
    if (data.empty()) {
        return std::string();
    }

    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&encoded[0]),
                                  data.data(), static_cast<int>(data.size()));
    encoded.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return encoded;
}

Result<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return Result<std::vector<uint8_t>>(std::vector<uint8_t>());
    }
    if (encoded.size() % 4 != 0) {
        return Result<std::vector<uint8_t>>(RSPError::DECODE_ERROR);
    }

    size_t padding = 0;
    for (size_t i = 0; i < encoded.size(); ++i) {
        char c = encoded[i];
        if (c == '=') {
            if (i < encoded.size() - 2) {
                return Result<std::vector<uint8_t>>(RSPError::DECODE_ERROR);
            }
            ++padding;
        } else if (padding > 0 ||
                   !(std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/')) {
            return Result<std::vector<uint8_t>>(RSPError::DECODE_ERROR);
        }
    }

    std::vector<uint8_t> decoded(encoded.size() / 4 * 3);
    int written = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0 || static_cast<size_t>(written) < padding) {
        return Result<std::vector<uint8_t>>(RSPError::DECODE_ERROR);
    }

    // EVP_DecodeBlock counts the padding positions as output bytes
    decoded.resize(static_cast<size_t>(written) - padding);
    return Result<std::vector<uint8_t>>(std::move(decoded));
}

std::vector<uint8_t> to_bytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

void append(std::vector<uint8_t>& out, const std::vector<uint8_t>& part) {
    out.insert(out.end(), part.begin(), part.end());
}

void append(std::vector<uint8_t>& out, const std::string& part) {
    out.insert(out.end(), part.begin(), part.end());
}

void append_be32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

} // namespace utils
} // namespace crypto
} // namespace rsp
