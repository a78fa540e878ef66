#include "stack_capture.hpp"

#include <cxxabi.h>
#include <execinfo.h>

#include <algorithm>
#include <cstdlib>
#include <memory>

namespace asyncprof::util {

namespace {

constexpr std::size_t kMaxFrames = 128;

// backtrace_symbols() lines look like "module(symbol+0x1f) [0x55d0c]".
StackFrame ParseSymbol(const char* symbol) {
  StackFrame frame;
  std::string line(symbol ? symbol : "");

  const auto open    = line.find('(');
  const auto plus    = line.find('+', open == std::string::npos ? 0 : open);
  const auto bracket = line.find('[');

  frame.module = line.substr(0, open == std::string::npos ? bracket : open);
  while (!frame.module.empty() && frame.module.back() == ' ') frame.module.pop_back();

  if (open != std::string::npos && plus != std::string::npos && plus > open + 1) {
    frame.function = Demangle(line.substr(open + 1, plus - open - 1).c_str());
  }

  if (bracket != std::string::npos) {
    const auto close = line.find(']', bracket);
    frame.address    = line.substr(bracket + 1, close == std::string::npos ? std::string::npos : close - bracket - 1);
  }

  if (frame.function.empty()) frame.function = "??";
  return frame;
}

} // namespace

std::string Demangle(const char* name) {
  if (!name || !*name) return "??";

  int  status = 0;
  auto demangled =
      std::unique_ptr<char, decltype(&std::free)>(abi::__cxa_demangle(name, nullptr, nullptr, &status), &std::free);
  if (status == 0 && demangled) {
    return demangled.get();
  }
  return name;
}

std::vector<StackFrame> CaptureStack(std::size_t max_depth, std::size_t skip) {
  std::vector<StackFrame> frames;
  if (max_depth == 0) return frames;

  // +1 for this function's own frame.
  const std::size_t wanted = std::min(kMaxFrames, max_depth + skip + 1);
  void*             buffer[kMaxFrames];
  const int         depth = backtrace(buffer, static_cast<int>(wanted));
  if (depth <= 0) return frames;

  auto symbols = std::unique_ptr<char*, decltype(&std::free)>(backtrace_symbols(buffer, depth), &std::free);
  if (!symbols) return frames;

  for (int i = static_cast<int>(skip) + 1; i < depth && frames.size() < max_depth; ++i) {
    frames.push_back(ParseSymbol(symbols.get()[i]));
  }
  return frames;
}

std::vector<StackFrame> CaptureStackBelow(std::string_view boundary, std::size_t max_depth, std::size_t skip) {
  std::vector<StackFrame> frames;
  if (max_depth == 0) return frames;

  void*     buffer[kMaxFrames];
  const int depth = backtrace(buffer, static_cast<int>(kMaxFrames));
  if (depth <= 0) return frames;

  auto symbols = std::unique_ptr<char*, decltype(&std::free)>(backtrace_symbols(buffer, depth), &std::free);
  if (!symbols) return frames;

  // Frame 0 is this function.
  int first = -1;
  for (int i = 1; i < depth; ++i) {
    if (ParseSymbol(symbols.get()[i]).function.starts_with(boundary)) {
      first = i + 1;
      break;
    }
  }
  if (first < 0) first = static_cast<int>(skip) + 1;

  for (int i = first; i < depth && frames.size() < max_depth; ++i) {
    frames.push_back(ParseSymbol(symbols.get()[i]));
  }
  return frames;
}

} // namespace asyncprof::util
