#include "encoding.hpp"
#include <boost/beast/core/detail/base64.hpp>
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace namesys {
namespace encoding {

namespace {

constexpr char BASE58_ALPHABET[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int base58_digit(char c) {
    const char* pos = std::find(BASE58_ALPHABET, BASE58_ALPHABET + 58, c);
    return pos == BASE58_ALPHABET + 58 ? -1 : static_cast<int>(pos - BASE58_ALPHABET);
}

bool is_base64_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

}

std::string to_hex(const uint8_t* data, size_t size) {
    std::stringstream ss;
    for (size_t i = 0; i < size; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)data[i];
    }
    return ss.str();
}

std::optional<Bytes> from_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) return std::nullopt;
    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!std::isxdigit(static_cast<unsigned char>(hex[i])) ||
            !std::isxdigit(static_cast<unsigned char>(hex[i + 1]))) {
            return std::nullopt;
        }
        out.push_back(static_cast<uint8_t>(std::stoi(hex.substr(i, 2), nullptr, 16)));
    }
    return out;
}

// Repeated division of the big-endian byte string by 58.
std::string base58_encode(const Bytes& data) {
    size_t zeros = 0;
    while (zeros < data.size() && data[zeros] == 0) ++zeros;

    std::vector<uint8_t> digits;
    digits.reserve(data.size() * 138 / 100 + 1);
    for (size_t i = zeros; i < data.size(); ++i) {
        int carry = data[i];
        for (auto& d : digits) {
            carry += d * 256;
            d = static_cast<uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string result(zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        result += BASE58_ALPHABET[*it];
    }
    return result;
}

std::optional<Bytes> base58_decode(const std::string& text) {
    size_t ones = 0;
    while (ones < text.size() && text[ones] == '1') ++ones;

    std::vector<uint8_t> bytes;
    bytes.reserve(text.size() * 733 / 1000 + 1);
    for (size_t i = ones; i < text.size(); ++i) {
        int carry = base58_digit(text[i]);
        if (carry < 0) return std::nullopt;
        for (auto& b : bytes) {
            carry += b * 58;
            b = static_cast<uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    Bytes result(ones, 0);
    result.insert(result.end(), bytes.rbegin(), bytes.rend());
    return result;
}

std::string base64_encode(const Bytes& data) {
    std::string out;
    out.resize(boost::beast::detail::base64::encoded_size(data.size()));
    auto written = boost::beast::detail::base64::encode(out.data(), data.data(), data.size());
    out.resize(written);
    return out;
}

std::optional<Bytes> base64_decode(const std::string& text) {
    // beast's decoder stops silently at the first invalid character
    size_t body = text.size();
    while (body > 0 && text[body - 1] == '=') --body;
    if (text.size() % 4 != 0 || text.size() - body > 2) return std::nullopt;
    if (!std::all_of(text.begin(), text.begin() + body, is_base64_char)) return std::nullopt;

    Bytes out;
    out.resize(boost::beast::detail::base64::decoded_size(text.size()));
    auto result = boost::beast::detail::base64::decode(out.data(), text.data(), text.size());
    out.resize(result.first);
    return out;
}

std::string base64url_encode(const Bytes& data) {
    std::string out = base64_encode(data);
    while (!out.empty() && out.back() == '=') out.pop_back();
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

}
}
