// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ZSTRING_H_73425873425789
#define ZSTRING_H_73425873425789

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include "utf.h"     //


    using Zchar = char;
    #define Zstr(x) x

//native path string: UTF-8 encoded byte sequence, no normalization applied
using Zstring     = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

//strictly UTF-8 (e.g. log messages)
using Zstringc = std::string;


//common Unicode characters
const wchar_t EN_DASH = L'–'; //–
const wchar_t LTR_MARK = L'‎'; //UTF-8: E2 80 8E
const wchar_t RTL_MARK = L'‏'; //UTF-8: E2 80 8F
const wchar_t* const SPACED_DASH = L" – "; //using 'EN DASH'

const char FILE_NAME_SEPARATOR = '/';

#endif //ZSTRING_H_73425873425789
