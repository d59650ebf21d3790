// Logging utilities

#include "log.h"

#include <stdio.h>
#include <unistd.h>

bool log_debug = false;
bool log_color = false;

void log_init()
{
    auto noColor = getenv("NO_COLOR");
    log_color = isatty(fileno(stderr)) && !(noColor && noColor[0] != 0);
}
