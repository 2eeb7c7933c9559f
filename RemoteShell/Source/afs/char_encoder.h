// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CHAR_ENCODER_H_4830917256340189273
#define CHAR_ENCODER_H_4830917256340189273

#include <zen/sys_error.h>


namespace rsh
{
/*  reversible substitution of characters a remote file system or shell cannot store safely

        "file:name?.txt"  ->  "file：name？.txt"    (Win)
        "trailing."       ->  "trailing．"

    - every rule maps an original character to a look-alike replacement (positional rules only at the first/last character of a name)
    - QUOTE_CHAR (U+201B) escapes a literal replacement character so that decoding leaves it alone
    - decode(encode(x)) == x for every active rule combination                                            */

enum CharEncodingRule : uint32_t
{
    ENC_ZERO               = 1 << 0,
    ENC_SLASH              = 1 << 1,
    ENC_LT_GT              = 1 << 2,
    ENC_DOUBLE_QUOTE       = 1 << 3,
    ENC_SINGLE_QUOTE       = 1 << 4,
    ENC_BACK_QUOTE         = 1 << 5,
    ENC_DOLLAR             = 1 << 6,
    ENC_COLON              = 1 << 7,
    ENC_QUESTION           = 1 << 8,
    ENC_ASTERISK           = 1 << 9,
    ENC_PIPE               = 1 << 10,
    ENC_HASH               = 1 << 11,
    ENC_PERCENT            = 1 << 12,
    ENC_BACK_SLASH         = 1 << 13,
    ENC_CR_LF              = 1 << 14,
    ENC_DEL                = 1 << 15,
    ENC_CTL                = 1 << 16,
    ENC_LEFT_SPACE         = 1 << 17,
    ENC_LEFT_PERIOD        = 1 << 18,
    ENC_LEFT_TILDE         = 1 << 19,
    ENC_LEFT_CR_LF_HT_VT   = 1 << 20,
    ENC_RIGHT_SPACE        = 1 << 21,
    ENC_RIGHT_PERIOD       = 1 << 22,
    ENC_RIGHT_CR_LF_HT_VT  = 1 << 23,
    ENC_SQUARE_BRACKET     = 1 << 24,
    ENC_SEMICOLON          = 1 << 25,
    ENC_EXCLAMATION        = 1 << 26,
    ENC_DOT                = 1 << 27,
    ENC_INVALID_UTF8       = 1 << 28,
};

using CharEncoding = uint32_t; //combination of CharEncodingRule

const CharEncoding ENC_PRESET_NONE = 0;
const CharEncoding ENC_PRESET_STANDARD = ENC_ZERO | ENC_SLASH | ENC_CTL | ENC_DEL | ENC_DOT;
const CharEncoding ENC_PRESET_WIN = ENC_LT_GT | ENC_DOUBLE_QUOTE | ENC_COLON | ENC_QUESTION | ENC_ASTERISK | ENC_PIPE |
                                    ENC_RIGHT_SPACE | ENC_RIGHT_PERIOD;

const zen::CodePoint QUOTE_CHAR = 0x201b; //'‛'


//comma-separated rule or preset names, e.g. "Win,Hash" or "Slash,Dot"; "None" or empty: identity
CharEncoding parseCharEncoding(const std::string& names); //throw SysError
std::string formatCharEncoding(CharEncoding enc);         //comma-separated rule names, "None" for identity


class CharEncoder
{
public:
    CharEncoder() {}
    explicit CharEncoder(CharEncoding enc) : enc_(enc) {}

    //'/'-separated paths: each segment is encoded independently, separators are left alone
    Zstring fromStandardPath(const Zstring& path) const;
    Zstring toStandardPath  (const Zstring& path) const;

    //single path segment
    Zstring fromStandardName(const Zstring& name) const;
    Zstring toStandardName  (const Zstring& name) const;

    CharEncoding getEncoding() const { return enc_; }
    bool isIdentity() const { return enc_ == ENC_PRESET_NONE; }

    bool operator==(const CharEncoder&) const = default;

private:
    Zstring encodeName(const Zstring& name, bool quoteLiteralPeriods) const;

    CharEncoding enc_ = ENC_PRESET_NONE;
};
}

#endif //CHAR_ENCODER_H_4830917256340189273
