//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Encoding.cpp
// Purpose: UTF-8 validation and ascii/latin-1 conversions
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <cstdint>

#include <fmt/format.h>

#include "toolgate/errors/Errors.h"
#include "toolgate/tools/Encoding.h"

namespace toolgate {
namespace tools {

namespace {

// Length of the UTF-8 sequence starting at bytes[i], or 0 when invalid. code receives the code point.
std::size_t utf8SequenceAt(std::string_view bytes, std::size_t i, uint32_t& code) {
    const auto b0 = static_cast<unsigned char>(bytes[i]);
    std::size_t len = 0;
    uint32_t min = 0;
    if (b0 < 0x80) { code = b0; return 1; }
    if ((b0 & 0xE0) == 0xC0) { len = 2; code = b0 & 0x1F; min = 0x80; }
    else if ((b0 & 0xF0) == 0xE0) { len = 3; code = b0 & 0x0F; min = 0x800; }
    else if ((b0 & 0xF8) == 0xF0) { len = 4; code = b0 & 0x07; min = 0x10000; }
    else { return 0; }
    if (i + len > bytes.size()) return 0;
    for (std::size_t k = 1; k < len; ++k) {
        const auto b = static_cast<unsigned char>(bytes[i + k]);
        if ((b & 0xC0) != 0x80) return 0;
        code = (code << 6) | (b & 0x3F);
    }
    if (code < min || code > 0x10FFFF || (code >= 0xD800 && code <= 0xDFFF)) return 0;
    return len;
}

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

TextEncoding ParseEncoding(const std::string& name) {
    const std::string n = lower(name);
    if (n == "utf-8" || n == "utf8") return TextEncoding::Utf8;
    if (n == "ascii" || n == "us-ascii") return TextEncoding::Ascii;
    if (n == "latin-1" || n == "latin1" || n == "iso-8859-1") return TextEncoding::Latin1;
    throw errors::validationError("unsupported encoding '" + name + "'");
}

const char* EncodingName(TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8: return "utf-8";
        case TextEncoding::Ascii: return "ascii";
        case TextEncoding::Latin1: return "latin-1";
    }
    return "utf-8";
}

bool IsValidUtf8(std::string_view bytes) {
    std::size_t i = 0;
    uint32_t code = 0;
    while (i < bytes.size()) {
        std::size_t n = utf8SequenceAt(bytes, i, code);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

std::string DecodeBytes(const std::string& bytes, TextEncoding encoding, const std::string& path) {
    switch (encoding) {
        case TextEncoding::Utf8: {
            std::size_t i = 0;
            uint32_t code = 0;
            while (i < bytes.size()) {
                std::size_t n = utf8SequenceAt(bytes, i, code);
                if (n == 0) {
                    throw errors::GatewayError(errors::ErrorCategory::Decode,
                        fmt::format("invalid utf-8 byte 0x{:02x} at offset {} in {}",
                                    static_cast<unsigned char>(bytes[i]), i, path));
                }
                i += n;
            }
            return bytes;
        }
        case TextEncoding::Ascii: {
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (static_cast<unsigned char>(bytes[i]) >= 0x80) {
                    throw errors::GatewayError(errors::ErrorCategory::Decode,
                        fmt::format("non-ascii byte 0x{:02x} at offset {} in {}",
                                    static_cast<unsigned char>(bytes[i]), i, path));
                }
            }
            return bytes;
        }
        case TextEncoding::Latin1: {
            std::string out;
            out.reserve(bytes.size());
            for (char c : bytes) {
                const auto b = static_cast<unsigned char>(c);
                if (b < 0x80) {
                    out.push_back(c);
                } else {
                    out.push_back(static_cast<char>(0xC0 | (b >> 6)));
                    out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
                }
            }
            return out;
        }
    }
    return bytes;
}

std::string EncodeText(const std::string& text, TextEncoding encoding) {
    switch (encoding) {
        case TextEncoding::Utf8:
            if (!IsValidUtf8(text)) {
                throw errors::validationError("content is not valid utf-8");
            }
            return text;
        case TextEncoding::Ascii:
            for (std::size_t i = 0; i < text.size(); ++i) {
                if (static_cast<unsigned char>(text[i]) >= 0x80) {
                    throw errors::validationError(fmt::format("content is not encodable as ascii (offset {})", i));
                }
            }
            return text;
        case TextEncoding::Latin1: {
            std::string out;
            out.reserve(text.size());
            std::size_t i = 0;
            uint32_t code = 0;
            while (i < text.size()) {
                std::size_t n = utf8SequenceAt(text, i, code);
                if (n == 0) {
                    throw errors::validationError("content is not valid utf-8");
                }
                if (code > 0xFF) {
                    throw errors::validationError(
                        fmt::format("content is not encodable as latin-1 (U+{:04X} at offset {})", code, i));
                }
                out.push_back(static_cast<char>(code));
                i += n;
            }
            return out;
        }
    }
    return text;
}

} // namespace tools
} // namespace toolgate
