#include "encoding.hpp"
#include "errors.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <sodium.h>

namespace keyward {

std::string base64_encode(const uint8_t* data, size_t len) {
    const size_t encoded_len = sodium_base64_ENCODED_LEN(len, sodium_base64_VARIANT_ORIGINAL);
    std::string out(encoded_len, '\0');
    sodium_bin2base64(&out[0], encoded_len, data, len, sodium_base64_VARIANT_ORIGINAL);
    out.resize(encoded_len - 1); // drop the terminating NUL
    return out;
}

std::string base64_encode(const Bytes& data) {
    return base64_encode(data.data(), data.size());
}

Bytes base64_decode(const std::string& text) {
    if (text.empty()) return {};
    Bytes out(text.size() / 4 * 3 + 3);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), text.data(), text.size(),
                          nullptr, &bin_len, &end,
                          sodium_base64_VARIANT_ORIGINAL) != 0 ||
        end != text.data() + text.size()) {
        throw KeywardError("invalid base64");
    }
    out.resize(bin_len);
    return out;
}

std::string hex_encode(const uint8_t* data, size_t len) {
    std::string out(len * 2 + 1, '\0');
    sodium_bin2hex(&out[0], out.size(), data, len);
    out.resize(len * 2);
    return out;
}

Bytes hex_decode(const std::string& hex) {
    if (hex.size() % 2 != 0) throw KeywardError("invalid hex: odd length");
    Bytes out(hex.size() / 2);
    size_t bin_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                       nullptr, &bin_len, &end) != 0 ||
        end != hex.data() + hex.size()) {
        throw KeywardError("invalid hex");
    }
    out.resize(bin_len);
    return out;
}

std::string uuid_v4() {
    uint8_t b[16];
    randombytes_buf(b, sizeof(b));
    b[6] = static_cast<uint8_t>((b[6] & 0x0f) | 0x40);
    b[8] = static_cast<uint8_t>((b[8] & 0x3f) | 0x80);
    std::string hex = hex_encode(b, sizeof(b));
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

std::string format_iso8601(Timestamp t) {
    auto time_t = std::chrono::system_clock::to_time_t(t);
    std::tm tm_buf;
#ifdef _WIN32
    gmtime_s(&tm_buf, &time_t);
#else
    gmtime_r(&time_t, &tm_buf);
#endif
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        t.time_since_epoch()).count() % 1000;
    if (ms < 0) ms += 1000;

    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    out << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return out.str();
}

Timestamp parse_iso8601(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &month, &day, &sep, &hour, &minute, &second, &consumed) != 7 ||
        (sep != 'T' && sep != 't' && sep != ' ')) {
        throw KeywardError("invalid timestamp: " + text);
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 ||
        hour > 23 || minute > 59 || second > 60) {
        throw KeywardError("invalid timestamp: " + text);
    }

    size_t pos = static_cast<size_t>(consumed);
    std::chrono::microseconds fraction{0};
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int64_t micros = 0;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) throw KeywardError("invalid timestamp: " + text);
        while (digits < 6) { micros *= 10; ++digits; }
        fraction = std::chrono::microseconds(micros);
    }

    std::chrono::minutes offset{0};
    if (pos < text.size()) {
        char c = text[pos];
        if ((c == 'Z' || c == 'z') && pos + 1 == text.size()) {
            ++pos;
        } else if ((c == '+' || c == '-') && text.size() - pos == 6 && text[pos + 3] == ':') {
            int oh = 0, om = 0;
            if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
                throw KeywardError("invalid timestamp offset: " + text);
            }
            offset = std::chrono::minutes(oh * 60 + om);
            if (c == '-') offset = -offset;
            pos = text.size();
        } else {
            throw KeywardError("invalid timestamp: " + text);
        }
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
#ifdef _WIN32
    std::time_t secs = _mkgmtime(&tm_buf);
#else
    std::time_t secs = timegm(&tm_buf);
#endif
    if (secs == static_cast<std::time_t>(-1)) {
        throw KeywardError("invalid timestamp: " + text);
    }

    auto tp = std::chrono::system_clock::from_time_t(secs);
    tp += std::chrono::duration_cast<std::chrono::system_clock::duration>(fraction);
    tp -= std::chrono::duration_cast<std::chrono::system_clock::duration>(offset);
    return tp;
}

int64_t to_unix_millis(Timestamp t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

} // namespace keyward
