#pragma once

#include <string>

/** String variable with the folder for writing logs if logging is enabled.
 */
extern std::string loggingPath;
/** Boolean variable whether loggingPath is non-empty. */
extern bool loggingEnabled;

/** Boolean variable controlling whether debug mode is enabled
 * during this run. Debug mode prints one line per simulation tick.
 */
extern bool debugEnabled;

/** Boolean variable controlling whether core logging is enabled
 * during this run.
 */
extern bool coreLoggingEnabled;
