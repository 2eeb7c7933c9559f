// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <gtest/gtest.h>
#include "afs/char_encoder.h"

using namespace zen;
using namespace rsh;


namespace
{
const char QUOTE_UTF8[] = "\xe2\x80\x9b"; //U+201B

const CharEncoding ENC_ALL_RULES = (ENC_INVALID_UTF8 << 1) - 1;

//names that exercise every rule, quoting and the whole-name cases
const std::vector<Zstring> trickyNames =
{
    "simple.txt",
    "with:colon.txt",
    "with?question.txt",
    "with*asterisk.txt",
    "with<angle>brackets.txt",
    "with|pipe.txt",
    "with\"quote.txt",
    "trailing space ",
    "trailing.",
    " leading space",
    ".leading period",
    "~tilde",
    "\ttab\t",
    "line\nfeed\r",
    "ctl\x01\x1f\x7f",
    std::string("zero\0byte", 9),
    "semi;colon!bang[x]#hash%per$dollar'single`back\\slash",
    "complex:path?with*many<special>chars|here.txt",
    ".",
    "..",
    "...",
    "\xef\xbc\x8e",                 //"．"
    "\xef\xbc\x8e\xef\xbc\x8e",     //"．．"
    "\xef\xbc\x8e.",                //"．."
    "literal\xef\xbc\x9a" "colon",  //"literal：colon"
    "literal\xef\xbc\x8e",          //"literal．"
    "\xe2\x90\xa0" "space",         //"␠space"
    "quote\xe2\x80\x9b",            //"quote‛"
    "\xe2\x80\x9b" "AB",            //"‛AB"
    "\xe2\x80\x9b\xe2\x80\x9b",     //"‛‛"
    "invalid\xff" "utf8\xc3",
    "\xe4\xbd\xa0\xe5\xa5\xbd",     //"你好"
};
}


TEST(CharEncoder, WinPreset)
{
    const CharEncoder enc(ENC_PRESET_WIN);

    EXPECT_EQ(enc.fromStandardName("test:file.txt"), "test\xef\xbc\x9a" "file.txt"); //"test：file.txt"
    EXPECT_EQ(enc.fromStandardName("file:name?.txt"), "file\xef\xbc\x9aname\xef\xbc\x9f.txt");
    EXPECT_EQ(enc.fromStandardName("trailing space "), "trailing space\xe2\x90\xa0");
    EXPECT_EQ(enc.fromStandardName("trailing."), "trailing\xef\xbc\x8e");
    EXPECT_EQ(enc.fromStandardName("file<1>.txt"), "file\xef\xbc\x9c" "1\xef\xbc\x9e.txt");

    //position rules: only the last character is substituted
    EXPECT_EQ(enc.fromStandardName("a b.c"), "a b.c");

    EXPECT_EQ(enc.toStandardName("test\xef\xbc\x9a" "file.txt"), "test:file.txt");
    EXPECT_EQ(enc.toStandardName("file\xef\xbc\x9f.txt"), "file?.txt");
}


TEST(CharEncoder, WinRoundTrip)
{
    const CharEncoder enc(parseCharEncoding("Win"));

    for (const Zstring& path :
         {
             "simple.txt",
             "with:colon.txt",
             "with?question.txt",
             "with*asterisk.txt",
             "with<angle>brackets.txt",
             "with|pipe.txt",
             "with\"quote.txt",
             "trailing space ",
             "trailing.",
             "complex:path?with*many<special>chars|here.txt",
             "nested/dir:name/file?.txt",
         })
    {
        const Zstring encoded = enc.fromStandardPath(path);
        EXPECT_EQ(enc.toStandardPath(encoded), path) << "encoded as: " << encoded;
    }
}


TEST(CharEncoder, RoundTripAllRuleSets)
{
    std::vector<CharEncoding> encodings = {ENC_PRESET_STANDARD, ENC_PRESET_WIN, ENC_ALL_RULES, ENC_DOT | ENC_RIGHT_PERIOD};
    for (CharEncoding rule = ENC_ZERO; rule <= ENC_INVALID_UTF8; rule <<= 1)
        encodings.push_back(rule);

    for (const CharEncoding encoding : encodings)
    {
        const CharEncoder enc(encoding);
        for (const Zstring& name : trickyNames)
        {
            const Zstring encoded = enc.fromStandardName(name);
            EXPECT_EQ(enc.toStandardName(encoded), name) << "encoding: " << formatCharEncoding(encoding) << " encoded as: " << encoded;
        }
    }
}


TEST(CharEncoder, IdentityPreset)
{
    const CharEncoder enc(parseCharEncoding("None"));
    EXPECT_TRUE(enc.isIdentity());

    for (const Zstring& name : trickyNames)
    {
        EXPECT_EQ(enc.fromStandardName(name), name);
        EXPECT_EQ(enc.toStandardName  (name), name);
        EXPECT_EQ(enc.fromStandardPath("dir/" + name), "dir/" + name);
        EXPECT_EQ(enc.toStandardPath  ("dir/" + name), "dir/" + name);
    }
}


TEST(CharEncoder, QuoteLiteralReplacement)
{
    const CharEncoder enc(ENC_PRESET_WIN);

    //a literal "：" would otherwise decode to ':'
    EXPECT_EQ(enc.fromStandardName("a\xef\xbc\x9a" "b"), std::string("a") + QUOTE_UTF8 + "\xef\xbc\x9a" "b");

    //the quote character itself is always doubled
    EXPECT_EQ(enc.fromStandardName(QUOTE_UTF8), std::string(QUOTE_UTF8) + QUOTE_UTF8);

    //"．" decodes to '.' only as last character => quoting elsewhere is not needed
    EXPECT_EQ(enc.fromStandardName("\xef\xbc\x8e" "a"), "\xef\xbc\x8e" "a");
    EXPECT_EQ(enc.fromStandardName("a\xef\xbc\x8e"), std::string("a") + QUOTE_UTF8 + "\xef\xbc\x8e");

    //dangling quote character is kept
    EXPECT_EQ(enc.toStandardName(std::string("x") + QUOTE_UTF8), std::string("x") + QUOTE_UTF8);
}


TEST(CharEncoder, DotNames)
{
    const CharEncoder enc(ENC_PRESET_STANDARD);

    EXPECT_EQ(enc.fromStandardName("."),  "\xef\xbc\x8e");
    EXPECT_EQ(enc.fromStandardName(".."), "\xef\xbc\x8e\xef\xbc\x8e");
    EXPECT_EQ(enc.fromStandardName("..."), "...");
    EXPECT_EQ(enc.toStandardName("\xef\xbc\x8e"), ".");
    EXPECT_EQ(enc.toStandardName("\xef\xbc\x8e\xef\xbc\x8e"), "..");

    //literal "．" must not collide with the encoded "."
    const Zstring encoded = enc.fromStandardName("\xef\xbc\x8e");
    EXPECT_EQ(encoded, std::string(QUOTE_UTF8) + "\xef\xbc\x8e");
    EXPECT_EQ(enc.toStandardName(encoded), "\xef\xbc\x8e");
}


TEST(CharEncoder, ControlCharacters)
{
    const CharEncoder enc(ENC_PRESET_STANDARD);

    EXPECT_EQ(enc.fromStandardName("a\x01" "b"), "a\xe2\x90\x81" "b"); //U+2401
    EXPECT_EQ(enc.fromStandardName(std::string("a\0b", 3)), "a\xe2\x90\x80" "b"); //U+2400
    EXPECT_EQ(enc.fromStandardName("del\x7f"), "del\xe2\x90\xa1"); //U+2421
    EXPECT_EQ(enc.toStandardName("a\xe2\x90\x81" "b"), "a\x01" "b");
}


TEST(CharEncoder, InvalidUtf8)
{
    const CharEncoder enc(ENC_INVALID_UTF8);

    EXPECT_EQ(enc.fromStandardName("a\xff" "b"), std::string("a") + QUOTE_UTF8 + "FFb");
    EXPECT_EQ(enc.toStandardName(std::string("a") + QUOTE_UTF8 + "FFb"), "a\xff" "b");

    //lower-case hex is not produced by the encoder => taken literally
    EXPECT_EQ(enc.toStandardName(std::string("a") + QUOTE_UTF8 + "ffb"), std::string("a") + QUOTE_UTF8 + "ffb");

    //without the rule, invalid bytes pass through
    EXPECT_EQ(CharEncoder(ENC_PRESET_WIN).fromStandardName("a\xff:"), "a\xff\xef\xbc\x9a");
}


TEST(CharEncoder, PathSegments)
{
    const CharEncoder enc(ENC_PRESET_WIN | ENC_SLASH);

    EXPECT_EQ(enc.fromStandardPath("dir:name/file?.txt"), "dir\xef\xbc\x9aname/file\xef\xbc\x9f.txt");
    EXPECT_EQ(enc.toStandardPath("dir\xef\xbc\x9aname/file\xef\xbc\x9f.txt"), "dir:name/file?.txt");

    //separators are never substituted, empty segments stay empty
    EXPECT_EQ(enc.fromStandardPath("/a//b/"), "/a//b/");
    EXPECT_EQ(enc.fromStandardPath(""), "");

    //but a slash inside a single name is
    EXPECT_EQ(enc.fromStandardName("a/b"), "a\xef\xbc\x8f" "b");
    EXPECT_EQ(enc.toStandardName("a\xef\xbc\x8f" "b"), "a/b");
}


TEST(CharEncoder, ParseAndFormat)
{
    EXPECT_EQ(parseCharEncoding("Win"), ENC_PRESET_WIN);
    EXPECT_EQ(parseCharEncoding("Standard"), ENC_PRESET_STANDARD);
    EXPECT_EQ(parseCharEncoding("Slash,Dot"), ENC_SLASH | ENC_DOT);
    EXPECT_EQ(parseCharEncoding(" Slash , Dot "), ENC_SLASH | ENC_DOT);
    EXPECT_EQ(parseCharEncoding("Win,Hash"), ENC_PRESET_WIN | ENC_HASH);
    EXPECT_EQ(parseCharEncoding("None"), ENC_PRESET_NONE);
    EXPECT_EQ(parseCharEncoding(""), ENC_PRESET_NONE);

    EXPECT_THROW(parseCharEncoding("win"), SysError); //case sensitive
    EXPECT_THROW(parseCharEncoding("Slash,Bogus"), SysError);

    EXPECT_EQ(formatCharEncoding(ENC_PRESET_NONE), "None");
    EXPECT_EQ(formatCharEncoding(ENC_SLASH | ENC_DOT), "Slash,Dot");

    for (const CharEncoding enc : {ENC_PRESET_NONE, ENC_PRESET_STANDARD, ENC_PRESET_WIN, ENC_ALL_RULES})
        EXPECT_EQ(parseCharEncoding(formatCharEncoding(enc)), enc);
}
