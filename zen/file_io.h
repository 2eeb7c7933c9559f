// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_IO_H_89578342758342572345
#define FILE_IO_H_89578342758342572345

#include "file_error.h"


namespace zen
{
//small local files only, e.g. SSH private keys
[[nodiscard]] std::string getFileContent(const Zstring& filePath); //throw FileError
}

#endif //FILE_IO_H_89578342758342572345
