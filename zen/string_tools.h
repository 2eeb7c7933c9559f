// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STRING_TOOLS_H_213458973046
#define STRING_TOOLS_H_213458973046

#include <cassert>
#include <cstdint>
#include <algorithm>
#include <charconv>
#include <compare>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//enhance std::basic_string, std::basic_string_view and char/wchar_t literals with useful non-member functions:
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!
template <class Char> bool isHexDigit  (Char c);
template <class Char> bool isAsciiChar (Char c);
template <class Char> bool isAsciiAlpha(Char c);
template <class Char> Char asciiToLower(Char c);
template <class Char> Char asciiToUpper(Char c);

//both S and T can be strings, string views, char/wchar_t arrays or single char/wchar_t
template <class S, class T> bool contains(const S& str, const T& term);

template <class S, class T> bool startsWith           (const S& str, const T& prefix);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);
template <class S, class T> bool endsWith             (const S& str, const T& postfix);

template <class S, class T> bool equalAsciiNoCase(const S& lhs, const T& rhs);
template <class S, class T> std::weak_ordering compareAsciiNoCase(const S& lhs, const T& rhs); //basic case-insensitive comparison (considering A-Z only!)

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);
template <class S, class Function1, class Function2> void split2(const S& str, Function1 isDelimiter, Function2 onStringPart);
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> [[nodiscard]] S trimCpy(const S& str, TrimSide side = TrimSide::both);
template <class S>                     void trim(S& str, TrimSide side = TrimSide::both);
template <class S, class Function>     void trim(S& str, TrimSide side, Function trimThisChar);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

//conversion between integers and strings
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //lenient: leading white space is skipped, trailing garbage ignored, 0 if no number

std::pair<char, char> hexify  (unsigned char c, bool upperCase = true);
char                  unhexify(char high, char low);
std::string formatAsHexString(const std::string_view& blob); //bytes -> (human-readable) lower-case hex string

template <class T, class S> T copyStringTo(const S& str); //char-compatible string conversion, no UTF decoding!











//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
    //following std::isspace() for default locale but without the interface insanity:
    //  - std::isspace() takes an int, but expects an unsigned char
    //  - some parts of UTF-8 chars are erroneously seen as whitespace
}

template <class Char> inline
bool isLineBreak(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>('\r') || c == static_cast<Char>('\n');
}


template <class Char> inline
bool isDigit(Char c) //similar to implementation of std::isdigit()!
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


template <class Char> inline
bool isHexDigit(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return (static_cast<Char>('0') <= c && c <= static_cast<Char>('9')) ||
           (static_cast<Char>('A') <= c && c <= static_cast<Char>('F')) ||
           (static_cast<Char>('a') <= c && c <= static_cast<Char>('f'));
}


template <class Char> inline
bool isAsciiChar(Char c)
{
    return static_cast<std::make_unsigned_t<Char>>(c) < 128;
}


template <class Char> inline
bool isAsciiAlpha(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z')) ||
           (static_cast<Char>('a') <= c && c <= static_cast<Char>('z'));
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class Char> inline
Char asciiToUpper(Char c)
{
    if (static_cast<Char>('a') <= c && c <= static_cast<Char>('z'))
        return static_cast<Char>(c - static_cast<Char>('a') + static_cast<Char>('A'));
    return c;
}


namespace impl
{
//view on all supported "string-like" arguments:
template <class Char> inline std::basic_string_view<Char> strView(const std::basic_string<Char>& str) { return str; }
template <class Char> inline std::basic_string_view<Char> strView(std::basic_string_view<Char> str) { return str; }
template <class Char> inline std::basic_string_view<Char> strView(const Char* str) { return str; }
inline std::basic_string_view<char   > strView(const char&    ch) { return {&ch, 1}; }
inline std::basic_string_view<wchar_t> strView(const wchar_t& ch) { return {&ch, 1}; }

template <class S>
using GetCharTypeT = typename decltype(strView(std::declval<const S&>()))::value_type;


template <class Char1, class Char2> inline
std::weak_ordering strcmpAsciiNoCase(const Char1* lhs, const Char2* rhs, size_t len)
{
    while (len-- > 0)
    {
        const Char1 charL = asciiToLower(*lhs++); //ordering: lower-case chars have higher code points than uppper-case
        const Char2 charR = asciiToLower(*rhs++); //
        if (charL != charR)
            return static_cast<std::make_unsigned_t<Char1>>(charL) <=> static_cast<std::make_unsigned_t<Char2>>(charR); //unsigned char-comparison is the convention!
    }
    return std::weak_ordering::equivalent;
}
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto strv = impl::strView(str);
    const auto pfv  = impl::strView(prefix);
    return strv.size() >= pfv.size() && std::equal(pfv.begin(), pfv.end(), strv.begin());
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto strv = impl::strView(str);
    const auto pfv  = impl::strView(prefix);
    return strv.size() >= pfv.size() && impl::strcmpAsciiNoCase(strv.data(), pfv.data(), pfv.size()) == std::weak_ordering::equivalent;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto strv = impl::strView(str);
    const auto pfv  = impl::strView(postfix);
    return strv.size() >= pfv.size() && std::equal(pfv.begin(), pfv.end(), strv.end() - pfv.size());
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsv = impl::strView(lhs);
    const auto rhsv = impl::strView(rhs);
    return lhsv.size() == rhsv.size() && impl::strcmpAsciiNoCase(lhsv.data(), rhsv.data(), lhsv.size()) == std::weak_ordering::equivalent;
}


template <class S, class T> inline
std::weak_ordering compareAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsv = impl::strView(lhs);
    const auto rhsv = impl::strView(rhs);

    if (const std::weak_ordering cmp = impl::strcmpAsciiNoCase(lhsv.data(), rhsv.data(), std::min(lhsv.size(), rhsv.size()));
        cmp != std::weak_ordering::equivalent)
        return cmp;
    return lhsv.size() <=> rhsv.size();
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    static_assert(std::is_same_v<impl::GetCharTypeT<S>, impl::GetCharTypeT<T>>);
    return impl::strView(str).find(impl::strView(term)) != std::basic_string_view<impl::GetCharTypeT<S>>::npos;
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    static_assert(std::is_same_v<impl::GetCharTypeT<S>, impl::GetCharTypeT<T>>);
    const auto strv  = impl::strView(str);
    const auto termv = impl::strView(term);
    assert(!termv.empty());

    const size_t pos = strv.rfind(termv);
    if (pos == strv.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    const auto rest = strv.substr(pos + termv.size());
    return S(rest.data(), rest.size());
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    static_assert(std::is_same_v<impl::GetCharTypeT<S>, impl::GetCharTypeT<T>>);
    const auto strv  = impl::strView(str);
    const auto termv = impl::strView(term);
    assert(!termv.empty());

    const size_t pos = strv.rfind(termv);
    if (pos == strv.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strv.data(), pos);
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    static_assert(std::is_same_v<impl::GetCharTypeT<S>, impl::GetCharTypeT<T>>);
    const auto strv  = impl::strView(str);
    const auto termv = impl::strView(term);
    assert(!termv.empty());

    const size_t pos = strv.find(termv);
    if (pos == strv.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    const auto rest = strv.substr(pos + termv.size());
    return S(rest.data(), rest.size());
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    static_assert(std::is_same_v<impl::GetCharTypeT<S>, impl::GetCharTypeT<T>>);
    const auto strv  = impl::strView(str);
    const auto termv = impl::strView(term);
    assert(!termv.empty());

    const size_t pos = strv.find(termv);
    if (pos == strv.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(strv.data(), pos);
}


template <class S, class Function1, class Function2> inline
void split2(const S& str, Function1 isDelimiter, Function2 onStringPart)
{
    const auto strv = impl::strView(str);
    auto blockFirst = strv.begin();

    for (;;)
    {
        const auto blockLast = std::find_if(blockFirst, strv.end(), isDelimiter);
        onStringPart(strv.substr(blockFirst - strv.begin(), blockLast - blockFirst));

        if (blockLast == strv.end())
            return;

        blockFirst = blockLast + 1;
    }
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    static_assert(std::is_same_v<impl::GetCharTypeT<S>, Char>);
    split2(str, [delimiter](Char c) { return c == delimiter; }, onStringPart);
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    static_assert(std::is_same_v<impl::GetCharTypeT<S>, Char>);
    std::vector<S> output;

    split2(str, [delimiter](Char c) { return c == delimiter; }, [&, soe](std::basic_string_view<Char> block)
    {
        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block.data(), block.size());
    });
    return output;
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    static_assert(std::is_same_v<impl::GetCharTypeT<S>, impl::GetCharTypeT<T>>);
    static_assert(std::is_same_v<impl::GetCharTypeT<T>, impl::GetCharTypeT<U>>);
    const auto oldv = impl::strView(oldTerm);
    const auto newv = impl::strView(newTerm);
    if (oldv.empty())
        return;

    size_t pos = str.find(oldv);
    if (pos == S::npos)
        return; //optimize "oldTerm not found"

    S output(str.data(), pos);
    size_t posLast = 0;
    do
    {
        output.append(newv.data(), newv.size());
        posLast = pos + oldv.size();
        pos = str.find(oldv, posLast);
        output.append(str.data() + posLast, (pos == S::npos ? str.size() : pos) - posLast);
    }
    while (pos != S::npos);

    str = std::move(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Function> inline
void trim(S& str, TrimSide side, Function trimThisChar)
{
    const auto strv = impl::strView(str);
    size_t first = 0;
    size_t last = strv.size();

    if (side == TrimSide::right || side == TrimSide::both)
        while (first != last && trimThisChar(strv[last - 1]))
            --last;

    if (side == TrimSide::left || side == TrimSide::both)
        while (first != last && trimThisChar(strv[first]))
            ++first;

    if (first != 0 || last != strv.size())
        str = S(strv.data() + first, last - first);
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    using CharType = impl::GetCharTypeT<S>;
    trim(str, side, [](CharType c) { return isWhiteSpace(c); });
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    S tmp = str;
    trim(tmp, side);
    return tmp;
}


template <class T, class S> inline
T copyStringTo(const S& str)
{
    const auto strv = impl::strView(str);
    return T(strv.begin(), strv.end());
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num>);

    char buffer[32]; //sufficient for any 64-bit integer
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(rv.ec == std::errc());

    S output;
    for (const char* it = buffer; it != rv.ptr; ++it)
        output += static_cast<impl::GetCharTypeT<S>>(*it);
    return output;
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);
    using CharType = impl::GetCharTypeT<S>;
    const auto strv = impl::strView(str);

    auto it = std::find_if(strv.begin(), strv.end(), [](CharType c) { return !isWhiteSpace(c); });

    std::string digits; //ASCII-only => narrowing is fine
    if (it != strv.end() && (*it == static_cast<CharType>('-') || *it == static_cast<CharType>('+')))
    {
        if (*it == static_cast<CharType>('-'))
            digits += '-';
        ++it;
    }
    for (; it != strv.end() && isDigit(*it); ++it)
        digits += static_cast<char>(*it);

    Num number = 0;
    if (std::from_chars(digits.data(), digits.data() + digits.size(), number).ec != std::errc())
        return 0;
    return number;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num && num <= 15);  //guaranteed by design below!
        if (num <= 9)
            return static_cast<char>('0' + num); //no signed/unsigned char problem here!

        if (upperCase)
            return static_cast<char>('A' + (num - 10));
        else
            return static_cast<char>('a' + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}


inline
char unhexify(char high, char low)
{
    auto unhexifyDigit = [](char hex) -> int //input 0-9, a-f, A-F; output range: [0, 15]
    {
        if ('0' <= hex && hex <= '9') //no signed/unsigned char problem here!
            return hex - '0';
        else if ('A' <= hex && hex <= 'F')
            return (hex - 'A') + 10;
        else if ('a' <= hex && hex <= 'f')
            return (hex - 'a') + 10;
        assert(false);
        return 0;
    };
    return static_cast<unsigned char>(16 * unhexifyDigit(high) + unhexifyDigit(low)); //[!] convert to unsigned char first, then to char (which may be signed)
}


inline
std::string formatAsHexString(const std::string_view& blob)
{
    std::string output;
    for (const char c : blob)
    {
        const auto [high, low] = hexify(c, false /*upperCase*/);
        output += high;
        output += low;
    }
    return output;
}
}

#endif //STRING_TOOLS_H_213458973046
