#pragma once
/**
 * @file
 *
 * @brief Some ANSI escape sequences.
 */

namespace artcache {

#define ANSI_NORMAL "\e[0m"
#define ANSI_RED "\e[31;1m"
#define ANSI_GREEN "\e[32;1m"
#define ANSI_WARNING "\e[35;1m"

} // namespace artcache
