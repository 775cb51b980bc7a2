#include "encoding.hpp"
#include <algorithm>

#include <openssl/evp.h>

namespace {
constexpr char kBase58Alphabet[] =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";
}

std::string base58Encode(std::span<const uint8_t> bytes) {
    size_t leading_zeros = 0;
    while (leading_zeros < bytes.size() && bytes[leading_zeros] == 0) {
        ++leading_zeros;
    }

    // log(256) / log(58) < 1.38
    std::vector<uint8_t> digits((bytes.size() - leading_zeros) * 138 / 100 + 1, 0);
    size_t length = 0;

    for (size_t i = leading_zeros; i < bytes.size(); ++i) {
        int carry = bytes[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); (carry != 0 || j < length) && it != digits.rend();
             ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        length = j;
    }

    auto it = digits.begin() + static_cast<std::ptrdiff_t>(digits.size() - length);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(leading_zeros, '1');
    result.reserve(leading_zeros + static_cast<size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) {
        result.push_back(kBase58Alphabet[*it]);
    }
    return result;
}

std::optional<std::vector<uint8_t>> base64Decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::vector<uint8_t>{};
    }
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    std::vector<uint8_t> decoded(encoded.size() / 4 * 3);
    int written = EVP_DecodeBlock(decoded.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock keeps the bytes produced by '=' padding
    size_t padding = static_cast<size_t>(
        std::count(encoded.end() - std::min<size_t>(2, encoded.size()), encoded.end(), '='));
    decoded.resize(static_cast<size_t>(written) - padding);
    return decoded;
}
