#include "text_utils.hpp"

namespace {

const char REPLACEMENT_CHAR[] = "\xEF\xBF\xBD";

bool isContinuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

// Length of the well-formed sequence starting at pos, or 0 if there is none.
// 'valid_prefix' receives how many bytes belong to the broken sequence so the
// caller can skip them as a single replacement.
size_t sequenceLength(const std::string& s, size_t pos, size_t& valid_prefix) {
    unsigned char lead = static_cast<unsigned char>(s[pos]);
    valid_prefix = 1;

    if (lead < 0x80) {
        return 1;
    }

    size_t need = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;

    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead == 0xE0) {
        need = 2; lo = 0xA0;
    } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
        need = 2;
    } else if (lead == 0xED) {
        need = 2; hi = 0x9F;
    } else if (lead == 0xF0) {
        need = 3; lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        need = 3;
    } else if (lead == 0xF4) {
        need = 3; hi = 0x8F;
    } else {
        return 0;
    }

    for (size_t i = 1; i <= need; ++i) {
        if (pos + i >= s.size()) {
            return 0;
        }
        unsigned char c = static_cast<unsigned char>(s[pos + i]);
        bool ok = (i == 1) ? (c >= lo && c <= hi) : isContinuation(c);
        if (!ok) {
            return 0;
        }
        valid_prefix = i + 1;
    }

    return need + 1;
}

}

std::string decodeUtf8Lossy(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t pos = 0;
    while (pos < bytes.size()) {
        size_t prefix = 0;
        size_t len = sequenceLength(bytes, pos, prefix);
        if (len == 0) {
            out += REPLACEMENT_CHAR;
            pos += prefix;
        } else {
            out.append(bytes, pos, len);
            pos += len;
        }
    }

    return out;
}

bool isValidUtf8(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size()) {
        size_t prefix = 0;
        size_t len = sequenceLength(text, pos, prefix);
        if (len == 0) {
            return false;
        }
        pos += len;
    }
    return true;
}

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;

    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        std::string line = text.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);

        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }

    return lines;
}

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}
