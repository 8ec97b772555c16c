//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Encoding.h
// Purpose: Text encodings accepted by the file actions and conversions to/from UTF-8
//==========================================================================================================

#pragma once

#include <string>
#include <string_view>

namespace toolgate {
namespace tools {

enum class TextEncoding { Utf8, Ascii, Latin1 };

// Accepts utf-8/utf8, ascii, latin-1/latin1/iso-8859-1 (case-insensitive). Throws GatewayError(Validation).
TextEncoding ParseEncoding(const std::string& name);
// Canonical name ("utf-8", "ascii", "latin-1").
const char* EncodingName(TextEncoding encoding);

// Strict UTF-8 check: no overlong forms, no surrogates, nothing above U+10FFFF.
bool IsValidUtf8(std::string_view bytes);

//==========================================================================================================
// DecodeBytes
// Purpose: Converts raw file bytes in the given encoding to UTF-8.
// Throws:
//   GatewayError(Decode) naming the byte offset and path when the bytes are invalid.
//==========================================================================================================
std::string DecodeBytes(const std::string& bytes, TextEncoding encoding, const std::string& path);

//==========================================================================================================
// EncodeText
// Purpose: Converts UTF-8 text to the given encoding for writing.
// Throws:
//   GatewayError(Validation) when a character cannot be represented.
//==========================================================================================================
std::string EncodeText(const std::string& text, TextEncoding encoding);

} // namespace tools
} // namespace toolgate
