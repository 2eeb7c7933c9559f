// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "char_encoder.h"

using namespace zen;
using namespace rsh;


namespace
{
enum class RulePosition
{
    anywhere,
    first, //first character of a name only
    last,  //last character of a name only
};

struct CharMapping
{
    CharEncodingRule rule;
    CodePoint original;
    CodePoint replacement;
    RulePosition pos = RulePosition::anywhere;
};

//ENC_CTL, ENC_DOT and ENC_INVALID_UTF8 are not simple character mappings => see below
constexpr CharMapping charMappings[] =
{
    {ENC_ZERO,         0,    0x2400},
    {ENC_SLASH,        '/',  0xff0f},
    {ENC_LT_GT,        '<',  0xff1c},
    {ENC_LT_GT,        '>',  0xff1e},
    {ENC_DOUBLE_QUOTE, '"',  0xff02},
    {ENC_SINGLE_QUOTE, '\'', 0xff07},
    {ENC_BACK_QUOTE,   '`',  0xff40},
    {ENC_DOLLAR,       '$',  0xff04},
    {ENC_COLON,        ':',  0xff1a},
    {ENC_QUESTION,     '?',  0xff1f},
    {ENC_ASTERISK,     '*',  0xff0a},
    {ENC_PIPE,         '|',  0xff5c},
    {ENC_HASH,         '#',  0xff03},
    {ENC_PERCENT,      '%',  0xff05},
    {ENC_BACK_SLASH,   '\\', 0xff3c},
    {ENC_CR_LF,        '\r', 0x240d},
    {ENC_CR_LF,        '\n', 0x240a},
    {ENC_DEL,          0x7f, 0x2421},

    {ENC_LEFT_SPACE,       ' ',  0x2420, RulePosition::first},
    {ENC_LEFT_PERIOD,      '.',  0xff0e, RulePosition::first},
    {ENC_LEFT_TILDE,       '~',  0xff5e, RulePosition::first},
    {ENC_LEFT_CR_LF_HT_VT, '\t', 0x2409, RulePosition::first},
    {ENC_LEFT_CR_LF_HT_VT, '\n', 0x240a, RulePosition::first},
    {ENC_LEFT_CR_LF_HT_VT, '\v', 0x240b, RulePosition::first},
    {ENC_LEFT_CR_LF_HT_VT, '\r', 0x240d, RulePosition::first},

    {ENC_RIGHT_SPACE,       ' ',  0x2420, RulePosition::last},
    {ENC_RIGHT_PERIOD,      '.',  0xff0e, RulePosition::last},
    {ENC_RIGHT_CR_LF_HT_VT, '\t', 0x2409, RulePosition::last},
    {ENC_RIGHT_CR_LF_HT_VT, '\n', 0x240a, RulePosition::last},
    {ENC_RIGHT_CR_LF_HT_VT, '\v', 0x240b, RulePosition::last},
    {ENC_RIGHT_CR_LF_HT_VT, '\r', 0x240d, RulePosition::last},

    {ENC_SQUARE_BRACKET, '[', 0xff3b},
    {ENC_SQUARE_BRACKET, ']', 0xff3d},
    {ENC_SEMICOLON,      ';', 0xff1b},
    {ENC_EXCLAMATION,    '!', 0xff01},
};

//ENC_CTL: U+0001..U+001F <-> U+2401..U+241F ("Control Pictures" block)
const CodePoint CTL_FIRST = 0x01;
const CodePoint CTL_LAST  = 0x1f;
const CodePoint CTL_PICTURES_BASE = 0x2400;

const CodePoint FULLWIDTH_PERIOD = 0xff0e; //'．'

const Zstring FULLWIDTH_PERIOD_UTF8 = codePointToUtf8(FULLWIDTH_PERIOD);


struct RuleName
{
    CharEncoding enc;
    const char* name;
};

constexpr RuleName ruleNames[] =
{
    {ENC_ZERO,              "Zero"},
    {ENC_SLASH,             "Slash"},
    {ENC_LT_GT,             "LtGt"},
    {ENC_DOUBLE_QUOTE,      "DoubleQuote"},
    {ENC_SINGLE_QUOTE,      "SingleQuote"},
    {ENC_BACK_QUOTE,        "BackQuote"},
    {ENC_DOLLAR,            "Dollar"},
    {ENC_COLON,             "Colon"},
    {ENC_QUESTION,          "Question"},
    {ENC_ASTERISK,          "Asterisk"},
    {ENC_PIPE,              "Pipe"},
    {ENC_HASH,              "Hash"},
    {ENC_PERCENT,           "Percent"},
    {ENC_BACK_SLASH,        "BackSlash"},
    {ENC_CR_LF,             "CrLf"},
    {ENC_DEL,               "Del"},
    {ENC_CTL,               "Ctl"},
    {ENC_LEFT_SPACE,        "LeftSpace"},
    {ENC_LEFT_PERIOD,       "LeftPeriod"},
    {ENC_LEFT_TILDE,        "LeftTilde"},
    {ENC_LEFT_CR_LF_HT_VT,  "LeftCrLfHtVt"},
    {ENC_RIGHT_SPACE,       "RightSpace"},
    {ENC_RIGHT_PERIOD,      "RightPeriod"},
    {ENC_RIGHT_CR_LF_HT_VT, "RightCrLfHtVt"},
    {ENC_SQUARE_BRACKET,    "SquareBracket"},
    {ENC_SEMICOLON,         "Semicolon"},
    {ENC_EXCLAMATION,       "Exclamation"},
    {ENC_DOT,               "Dot"},
    {ENC_INVALID_UTF8,      "InvalidUtf8"},
};

constexpr RuleName presetNames[] =
{
    {ENC_PRESET_NONE,     "None"},
    {ENC_PRESET_STANDARD, "Standard"},
    {ENC_PRESET_WIN,      "Win"},
};


bool positionMatches(RulePosition pos, bool first, bool last)
{
    switch (pos)
    {
        case RulePosition::anywhere:
            return true;
        case RulePosition::first:
            return first;
        case RulePosition::last:
            return last;
    }
    assert(false);
    return false;
}


std::optional<CodePoint> encodeChar(CharEncoding enc, CodePoint cp, bool first, bool last)
{
    if ((enc & ENC_CTL) && CTL_FIRST <= cp && cp <= CTL_LAST)
        return CTL_PICTURES_BASE + cp;

    for (const CharMapping& m : charMappings)
        if ((enc & m.rule) && m.original == cp && positionMatches(m.pos, first, last))
            return m.replacement;
    return std::nullopt;
}


std::optional<CodePoint> decodeChar(CharEncoding enc, CodePoint cp, bool first, bool last)
{
    if ((enc & ENC_CTL) && CTL_PICTURES_BASE + CTL_FIRST <= cp && cp <= CTL_PICTURES_BASE + CTL_LAST)
        return cp - CTL_PICTURES_BASE;

    for (const CharMapping& m : charMappings)
        if ((enc & m.rule) && m.replacement == cp && positionMatches(m.pos, first, last))
            return m.original;
    return std::nullopt;
}


//may a quote character precede "cp" in encoded form?
bool isReplacementChar(CharEncoding enc, CodePoint cp)
{
    if ((enc & ENC_DOT) && cp == FULLWIDTH_PERIOD)
        return true;
    return decodeChar(enc, cp, true /*first*/, true /*last*/).has_value();
}


bool isUpperHexDigit(const Utf8Char& uc)
{
    return uc.valid && (('0' <= uc.cp && uc.cp <= '9') || ('A' <= uc.cp && uc.cp <= 'F'));
}


void appendCodePoint(Zstring& output, CodePoint cp)
{
    codePointToUtf8(cp, [&](char c) { output += c; });
}
}


CharEncoding rsh::parseCharEncoding(const std::string& names) //throw SysError
{
    CharEncoding enc = ENC_PRESET_NONE;

    split(names, ',', [&](std::string_view name)
    {
        name = trimCpy(name);
        if (name.empty())
            return;

        for (const RuleName& rn : presetNames)
            if (name == rn.name)
            {
                enc |= rn.enc;
                return;
            }

        for (const RuleName& rn : ruleNames)
            if (name == rn.name)
            {
                enc |= rn.enc;
                return;
            }

        throw SysError(replaceCpy(_("Unknown character encoding %x."), L"%x", L'"' + utfTo<std::wstring>(name) + L'"'));
    });
    return enc;
}


std::string rsh::formatCharEncoding(CharEncoding enc)
{
    std::string output;
    for (const RuleName& rn : ruleNames)
        if (enc & rn.enc)
        {
            if (!output.empty())
                output += ',';
            output += rn.name;
        }

    return output.empty() ? "None" : output;
}


Zstring CharEncoder::encodeName(const Zstring& name, bool quoteLiteralPeriods) const
{
    const size_t charCount = unicodeLength(name);

    Zstring output;
    size_t pos = 0;

    Utf8Decoder decoder(name);
    while (const std::optional<Utf8Char> uc = decoder.getNext())
    {
        const bool first = pos == 0;
        const bool last  = pos + 1 == charCount;
        ++pos;

        if (!uc->valid)
        {
            if (enc_ & ENC_INVALID_UTF8)
            {
                const auto [high, low] = hexify(static_cast<unsigned char>(uc->bytes[0]));
                appendCodePoint(output, QUOTE_CHAR);
                output += high;
                output += low;
            }
            else
                output += uc->bytes;
            continue;
        }

        if (uc->cp == QUOTE_CHAR)
        {
            appendCodePoint(output, QUOTE_CHAR);
            appendCodePoint(output, QUOTE_CHAR);
            continue;
        }

        if (const std::optional<CodePoint> replacement = encodeChar(enc_, uc->cp, first, last))
        {
            appendCodePoint(output, *replacement);
            continue;
        }

        //literal replacement character: protect against being decoded
        if (decodeChar(enc_, uc->cp, first, last) || (quoteLiteralPeriods && uc->cp == FULLWIDTH_PERIOD))
            appendCodePoint(output, QUOTE_CHAR);

        output += uc->bytes;
    }
    return output;
}


Zstring CharEncoder::fromStandardName(const Zstring& name) const
{
    if (isIdentity())
        return name;

    if (enc_ & ENC_DOT)
    {
        if (name == Zstr("."))
            return FULLWIDTH_PERIOD_UTF8;
        if (name == Zstr(".."))
            return FULLWIDTH_PERIOD_UTF8 + FULLWIDTH_PERIOD_UTF8;
    }

    Zstring output = encodeName(name, false /*quoteLiteralPeriods*/);

    //an encoded name must not collide with the encoded "." or ".."
    if ((enc_ & ENC_DOT) &&
        (output == FULLWIDTH_PERIOD_UTF8 ||
         output == FULLWIDTH_PERIOD_UTF8 + FULLWIDTH_PERIOD_UTF8))
        output = encodeName(name, true /*quoteLiteralPeriods*/);

    return output;
}


Zstring CharEncoder::toStandardName(const Zstring& name) const
{
    if (isIdentity())
        return name;

    if (enc_ & ENC_DOT)
    {
        if (name == FULLWIDTH_PERIOD_UTF8)
            return Zstr(".");
        if (name == FULLWIDTH_PERIOD_UTF8 + FULLWIDTH_PERIOD_UTF8)
            return Zstr("..");
    }

    std::vector<Utf8Char> chars;
    Utf8Decoder decoder(name);
    while (const std::optional<Utf8Char> uc = decoder.getNext())
        chars.push_back(*uc);

    Zstring output;
    for (size_t i = 0; i < chars.size(); ++i)
    {
        const Utf8Char& uc = chars[i];

        if (uc.valid && uc.cp == QUOTE_CHAR && i + 1 < chars.size())
        {
            const Utf8Char& next = chars[i + 1];
            if (next.valid && (next.cp == QUOTE_CHAR || isReplacementChar(enc_, next.cp)))
            {
                output += next.bytes;
                ++i;
                continue;
            }

            if ((enc_ & ENC_INVALID_UTF8) && i + 2 < chars.size() &&
                isUpperHexDigit(next) && isUpperHexDigit(chars[i + 2]))
            {
                output += unhexify(static_cast<char>(next.cp), static_cast<char>(chars[i + 2].cp));
                i += 2;
                continue;
            }
        }

        if (uc.valid)
            if (const std::optional<CodePoint> original = decodeChar(enc_, uc.cp, i == 0, i + 1 == chars.size()))
            {
                appendCodePoint(output, *original);
                continue;
            }

        output += uc.bytes; //including invalid UTF-8 and a dangling quote character
    }
    return output;
}


Zstring CharEncoder::fromStandardPath(const Zstring& path) const
{
    if (isIdentity())
        return path;

    Zstring output;
    bool firstSegment = true;
    split(path, Zstr('/'), [&](ZstringView segment)
    {
        if (!firstSegment)
            output += Zstr('/');
        firstSegment = false;

        if (!segment.empty())
            output += fromStandardName(Zstring(segment));
    });
    return output;
}


Zstring CharEncoder::toStandardPath(const Zstring& path) const
{
    if (isIdentity())
        return path;

    Zstring output;
    bool firstSegment = true;
    split(path, Zstr('/'), [&](ZstringView segment)
    {
        if (!firstSegment)
            output += Zstr('/');
        firstSegment = false;

        if (!segment.empty())
            output += toStandardName(Zstring(segment));
    });
    return output;
}
