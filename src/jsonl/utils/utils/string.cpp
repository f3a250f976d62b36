#include <jsonl/utils/utils/string.h>

#include <cstdint>

namespace jsonl::utils::string {

namespace {
constexpr const char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

// Length of the valid UTF-8 sequence starting at data[pos], or 0 if the
// bytes there are not valid. On failure `consumed` holds the length of the
// maximal invalid subpart (at least 1).
std::size_t valid_sequence_length(std::string_view data, std::size_t pos,
                                  std::size_t &consumed) {
    const auto byte = [&](std::size_t i) {
        return static_cast<std::uint8_t>(data[i]);
    };
    std::uint8_t lead = byte(pos);
    consumed = 1;
    if (lead < 0x80) return 1;

    std::size_t length;
    std::uint8_t lower = 0x80;
    std::uint8_t upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) lower = 0xA0;
        if (lead == 0xED) upper = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) lower = 0x90;
        if (lead == 0xF4) upper = 0x8F;
    } else {
        return 0;
    }

    for (std::size_t k = 1; k < length; ++k) {
        if (pos + k >= data.size()) return 0;
        std::uint8_t b = byte(pos + k);
        std::uint8_t lo = (k == 1) ? lower : 0x80;
        std::uint8_t hi = (k == 1) ? upper : 0xBF;
        if (b < lo || b > hi) return 0;
        consumed = k + 1;
    }
    return length;
}
}  // namespace

std::size_t whitespace_length(std::string_view data, std::size_t pos) {
    const auto byte = [&](std::size_t i) {
        return static_cast<std::uint8_t>(data[pos + i]);
    };
    std::size_t available = data.size() - pos;
    if (available == 0) return 0;

    std::uint8_t lead = byte(0);
    if (lead == ' ' || (lead >= '\t' && lead <= '\r')) return 1;
    if (available < 2) return 0;

    if (lead == 0xC2) {
        // U+0085, U+00A0
        return (byte(1) == 0x85 || byte(1) == 0xA0) ? 2 : 0;
    }
    if (available < 3) return 0;

    std::uint8_t b1 = byte(1);
    std::uint8_t b2 = byte(2);
    switch (lead) {
        case 0xE1:
            // U+1680
            return (b1 == 0x9A && b2 == 0x80) ? 3 : 0;
        case 0xE2:
            // U+2000-U+200A, U+2028, U+2029, U+202F
            if (b1 == 0x80 && ((b2 >= 0x80 && b2 <= 0x8A) || b2 == 0xA8 ||
                               b2 == 0xA9 || b2 == 0xAF)) {
                return 3;
            }
            // U+205F
            return (b1 == 0x81 && b2 == 0x9F) ? 3 : 0;
        case 0xE3:
            // U+3000
            return (b1 == 0x80 && b2 == 0x80) ? 3 : 0;
        default:
            return 0;
    }
}

std::string_view trim(std::string_view data) {
    std::size_t begin = 0;
    std::size_t end = data.size();
    while (begin < end) {
        std::size_t n = whitespace_length(data.substr(0, end), begin);
        if (n == 0) break;
        begin += n;
    }
    // Lead bytes never double as continuation bytes, so a whitespace
    // sequence ending at `end` is found by trying each encoded length
    while (end > begin) {
        std::size_t n = 0;
        for (std::size_t k = 1; k <= 3 && k <= end - begin; ++k) {
            if (whitespace_length(data.substr(0, end), end - k) == k) {
                n = k;
                break;
            }
        }
        if (n == 0) break;
        end -= n;
    }
    return data.substr(begin, end - begin);
}

std::string to_utf8_lossy(std::string_view data) {
    std::string out;
    out.reserve(data.size());

    std::size_t pos = 0;
    while (pos < data.size()) {
        std::size_t consumed;
        std::size_t length = valid_sequence_length(data, pos, consumed);
        if (length > 0) {
            out.append(data.data() + pos, length);
            pos += length;
        } else {
            out.append(REPLACEMENT_CHARACTER);
            pos += consumed;
        }
    }
    return out;
}

}  // namespace jsonl::utils::string
