#ifndef INCLUDE_RUNBOX_UTILS_H_
#define INCLUDE_RUNBOX_UTILS_H_

#include <string>

#include "execution.h"

const char* OutcomeToDesc(Outcome);
bool IsServiceError(Outcome);

// number of code points, assuming UTF-8
size_t Utf8Length(const std::string&);

#endif  // INCLUDE_RUNBOX_UTILS_H_
