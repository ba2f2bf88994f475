#pragma once

#define DEFAULT_CONFIG_PATH "conf/nginx.conf"

// Minimum level printed by LOG(...): 0 = DEBUG, 1 = INFO, 2 = ERROR.
// Override at build time with -DLOG_LEVEL=N.
#ifndef LOG_LEVEL
#define LOG_LEVEL 1
#endif

#define DEFAULT_STYLE_NAME "indented"
#define DEFAULT_INDENT_WIDTH 4

// Deepest block nesting the parser accepts
#define MAX_NESTING_DEPTH 256
