//
// Created by Giuseppe Francione on 18/01/26.
//

#ifndef WEBPRESS_CLI_COLOR_HPP
#define WEBPRESS_CLI_COLOR_HPP

// ANSI escape sequences used for console output
#define RESET  "\033[0m"
#define RED    "\033[1;31m"
#define GREEN  "\033[1;32m"
#define YELLOW "\033[1;33m"
#define CYAN   "\033[1;36m"

#endif // WEBPRESS_CLI_COLOR_HPP
