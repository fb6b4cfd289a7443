#ifndef INCLUDE_CODERUN_LOGGER_H_
#define INCLUDE_CODERUN_LOGGER_H_

// 0 = warn, 1 = info, 2+ = debug
void SetVerbosity(int verbosity);
// Keep the console sinks consistent across fork() while other threads are logging.
void InitLogger();

#endif  // INCLUDE_CODERUN_LOGGER_H_
