/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-6-2

Description: Common macros shared by every enumkit module

**************************************************/

#ifndef ENUMKIT_MACRO_HPP
#define ENUMKIT_MACRO_HPP

#define ENUMKIT_FILE_NAME __FILE__
#define ENUMKIT_FILE_LINE __LINE__
#define ENUMKIT_FUNC_NAME __func__

#ifndef ENUMKIT_ENABLE_DEBUG
#define ENUMKIT_ENABLE_DEBUG 0
#endif

#endif  // ENUMKIT_MACRO_HPP
