#ifndef INCLUDE_RUNBOX_LOGGER_H_
#define INCLUDE_RUNBOX_LOGGER_H_

// Call once in main before any thread is created
void InitLogger();

#endif  // INCLUDE_RUNBOX_LOGGER_H_
