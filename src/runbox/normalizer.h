#ifndef RUNBOX_NORMALIZER_H_
#define RUNBOX_NORMALIZER_H_

#include <string>

#include <runbox/execution.h>
#include "launcher.h"

extern const char kTruncationMarker[];

// Cuts str to limit bytes and appends kTruncationMarker if it is longer; returns whether it did
bool TruncateOutput(std::string& str, size_t limit);

ExecutionResult Normalize(RawOutcome&&, const SandboxSpec&);

#endif  // RUNBOX_NORMALIZER_H_
