#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace asyncprof::util {

struct StackFrame {
  std::string function;
  std::string module;
  std::string address;
};

/*
  Captures up to max_depth frames of the calling stack, innermost first,
  skipping `skip` frames above the caller. Symbol names are demangled when
  possible; frames from stripped binaries keep the raw address only.
*/
std::vector<StackFrame> CaptureStack(std::size_t max_depth, std::size_t skip = 0);

/*
  Captures up to max_depth frames of the calling stack that lie outside the
  innermost frame whose demangled name starts with `boundary`. Used to report
  the code that called into the runtime rather than the hooks it ran through.
  When no frame matches, behaves like CaptureStack(max_depth, skip).
*/
std::vector<StackFrame> CaptureStackBelow(std::string_view boundary, std::size_t max_depth, std::size_t skip = 0);

std::string Demangle(const char* name);

} // namespace asyncprof::util
