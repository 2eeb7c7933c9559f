// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef UTF_H_01832479146991573473545
#define UTF_H_01832479146991573473545

#include <optional>
#include "string_tools.h" //copyStringTo


namespace zen
{
using CodePoint = uint32_t;

//convert char- and wchar_t-based "string-like" objects applying UTF conversions (but only if necessary!)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

bool isValidUtf8(std::string_view str); //check for UTF-8 encoding errors

size_t unicodeLength(std::string_view str); //number of code points; each invalid byte counts as one

template <class Function>
void codePointToUtf8(CodePoint cp, Function writeOutput); //"writeOutput" is a unary function taking a char

std::string codePointToUtf8(CodePoint cp);


struct Utf8Char
{
    CodePoint cp = 0;
    std::string_view bytes; //encoded form inside the source string
    bool valid = true;      //false: "bytes" is a single byte not part of a valid UTF-8 sequence
};

/* strict decoding: overlong forms, surrogates, code points > U+10FFFF and truncated sequences are invalid
   => reported byte by byte, so that the original byte sequence can always be reconstructed from "bytes" */
class Utf8Decoder
{
public:
    explicit Utf8Decoder(std::string_view str) : it_(str.data()), last_(str.data() + str.size()) {}

    std::optional<Utf8Char> getNext();

private:
    bool decodeTrail(const char*& it, CodePoint& cp) const;

    const char* it_;
    const char* const last_;
};








//----------------------- implementation ----------------------------------
namespace impl
{
const CodePoint LEAD_SURROGATE      = 0xd800;
const CodePoint TRAIL_SURROGATE_MAX = 0xdfff;
const CodePoint REPLACEMENT_CHAR    = 0xfffd;
const CodePoint CODE_POINT_MAX      = 0x10ffff;
}


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput)
{
    using namespace impl;
    //https://en.wikipedia.org/wiki/UTF-8
    if (cp <= 0b111'1111)
        writeOutput(static_cast<char>(cp));
    else if (cp <= 0b0111'1111'1111)
    {
        writeOutput(static_cast<char>((cp >> 6)        | 0b1100'0000)); //110x xxxx
        writeOutput(static_cast<char>((cp & 0b11'1111) | 0b1000'0000)); //10xx xxxx
    }
    else if (cp <= 0b1111'1111'1111'1111)
    {
        if (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX) //[0xd800, 0xdfff]
            codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
        else
        {
            writeOutput(static_cast<char>( (cp >> 12)             | 0b1110'0000)); //1110 xxxx
            writeOutput(static_cast<char>(((cp >> 6) & 0b11'1111) | 0b1000'0000)); //10xx xxxx
            writeOutput(static_cast<char>( (cp       & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        }
    }
    else if (cp <= CODE_POINT_MAX)
    {
        writeOutput(static_cast<char>( (cp >> 18)              | 0b1111'0000)); //1111 0xxx
        writeOutput(static_cast<char>(((cp >> 12) & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        writeOutput(static_cast<char>(((cp >> 6)  & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        writeOutput(static_cast<char>( (cp        & 0b11'1111) | 0b1000'0000)); //10xx xxxx
    }
    else //invalid code point
        codePointToUtf8(REPLACEMENT_CHAR, writeOutput); //resolves to 3-byte UTF8
}


inline
std::string codePointToUtf8(CodePoint cp)
{
    std::string output;
    codePointToUtf8(cp, [&](char c) { output += c; });
    return output;
}


inline
bool Utf8Decoder::decodeTrail(const char*& it, CodePoint& cp) const
{
    if (it != last_)
    {
        const auto ch = static_cast<unsigned char>(*it);
        if (ch >> 6 == 0b10) //trail byte expected!
        {
            cp = (cp << 6) + (ch & 0b11'1111);
            ++it;
            return true;
        }
    }
    return false;
}


inline
std::optional<Utf8Char> Utf8Decoder::getNext()
{
    using namespace impl;
    if (it_ == last_)
        return std::nullopt;

    const char* const first = it_;
    const char* it = it_;
    const auto ch = static_cast<unsigned char>(*it++);
    CodePoint cp = ch;
    bool valid = true;

    if (ch < 0x80) //1 byte
        ;
    else if (ch >> 5 == 0b110) //2 bytes
    {
        cp &= 0b1'1111;
        valid = decodeTrail(it, cp) &&
                cp > 0b111'1111; //overlong encoding: "correct encoding of a code point uses only the minimum number of bytes required"
    }
    else if (ch >> 4 == 0b1110) //3 bytes
    {
        cp &= 0b1111;
        valid = decodeTrail(it, cp) && decodeTrail(it, cp) &&
                cp > 0b0111'1111'1111 &&
                !(LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX); //[0xd800, 0xdfff] are invalid code points
    }
    else if (ch >> 3 == 0b11110) //4 bytes
    {
        cp &= 0b111;
        valid = decodeTrail(it, cp) && decodeTrail(it, cp) && decodeTrail(it, cp) &&
                cp > 0b1111'1111'1111'1111 && cp <= CODE_POINT_MAX;
    }
    else //invalid begin of UTF8 encoding
        valid = false;

    if (!valid)
    {
        it_ = first + 1;
        return Utf8Char{.cp = REPLACEMENT_CHAR, .bytes = std::string_view(first, 1), .valid = false};
    }

    it_ = it;
    return Utf8Char{.cp = cp, .bytes = std::string_view(first, it - first), .valid = true};
}


inline
bool isValidUtf8(std::string_view str)
{
    Utf8Decoder decoder(str);
    while (const std::optional<Utf8Char> uc = decoder.getNext())
        if (!uc->valid)
            return false;
    return true;
}


inline
size_t unicodeLength(std::string_view str)
{
    size_t uniLen = 0;
    Utf8Decoder decoder(str);
    while (decoder.getNext())
        ++uniLen;
    return uniLen;
}

//-------------------------------------------------------------------------------------------

namespace impl
{
static_assert(sizeof(wchar_t) == 4); //Linux/macOS: UTF32-wchar_t

template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str, std::true_type) { return copyStringTo<TargetString>(str); }


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str, std::false_type)
{
    using CharSrc = GetCharTypeT<SourceString>;
    TargetString output;

    if constexpr (std::is_same_v<CharSrc, char>) //UTF-8 -> UTF-32
    {
        Utf8Decoder decoder(strView(str));
        while (const std::optional<Utf8Char> uc = decoder.getNext())
            output += static_cast<wchar_t>(uc->cp);
    }
    else //UTF-32 -> UTF-8
        for (const wchar_t c : strView(str))
            codePointToUtf8(static_cast<CodePoint>(c), [&](char ch) { output += ch; });

    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    return impl::utfTo<TargetString>(str, std::bool_constant<std::is_same_v<impl::GetCharTypeT<SourceString>,
                                           typename TargetString::value_type>>());
}
}

#endif //UTF_H_01832479146991573473545
