#ifndef INC_MSLOG_VERSION_H_
#define INC_MSLOG_VERSION_H_

#define MSLOG_VERSION_MAJOR 2
#define MSLOG_VERSION_MINOR 1

#define MSLOG_STRINGIFY_HELPER(x) #x
#define MSLOG_STRINGIFY(x) MSLOG_STRINGIFY_HELPER(x)

#define MSLOG_VERSION_STRING MSLOG_STRINGIFY(MSLOG_VERSION_MAJOR) "." MSLOG_STRINGIFY(MSLOG_VERSION_MINOR)

#endif  // INC_MSLOG_VERSION_H_
