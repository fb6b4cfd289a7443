#include "output.h"

const char kTruncatedMarker[] = "\n\n[output truncated]";

namespace {

const char kReplacementChar[] = "\xEF\xBF\xBD"; // U+FFFD

inline bool InRange(unsigned char c, unsigned char lo, unsigned char hi) {
  return c >= lo && c <= hi;
}

// Length of the valid sequence starting at pos; otherwise 0, with *bad set to the
// length of the maximal invalid prefix (always at least 1).
size_t ValidSequence(std::string_view str, size_t pos, size_t* bad) {
  unsigned char c = str[pos];
  size_t len;
  unsigned char lo = 0x80, hi = 0xBF; // range of the second byte
  if (c < 0x80) return 1;
  if (InRange(c, 0xC2, 0xDF)) {
    len = 2;
  } else if (InRange(c, 0xE0, 0xEF)) {
    len = 3;
    if (c == 0xE0) lo = 0xA0;
    if (c == 0xED) hi = 0x9F; // surrogates
  } else if (InRange(c, 0xF0, 0xF4)) {
    len = 4;
    if (c == 0xF0) lo = 0x90;
    if (c == 0xF4) hi = 0x8F;
  } else {
    *bad = 1;
    return 0;
  }
  for (size_t i = 1; i < len; i++) {
    if (pos + i >= str.size() ||
        !InRange(str[pos + i], i == 1 ? lo : 0x80, i == 1 ? hi : 0xBF)) {
      *bad = i;
      return 0;
    }
  }
  return len;
}

std::string DecodeUtf8(std::string_view raw) {
  std::string ret;
  ret.reserve(raw.size());
  for (size_t pos = 0; pos < raw.size();) {
    size_t bad = 0;
    size_t len = ValidSequence(raw, pos, &bad);
    if (len) {
      ret.append(raw.data() + pos, len);
      pos += len;
    } else {
      ret += kReplacementChar;
      pos += bad;
    }
  }
  return ret;
}

} // namespace

std::string SanitizeOutput(std::string_view raw, size_t max_bytes) {
  std::string ret = DecodeUtf8(raw);
  if (ret.size() <= max_bytes) return ret;
  size_t cut = max_bytes;
  while (cut > 0 && ((unsigned char)ret[cut] & 0xC0) == 0x80) cut--;
  ret.resize(cut);
  ret += kTruncatedMarker;
  return ret;
}

Status Classify(bool timed_out, std::optional<int> exit_code,
                const std::string& output, const std::string& error) {
  if (timed_out) return Status::TIMEOUT;
  int code = exit_code.value_or(-1);
  if (code != 0 && output.empty() && error.empty()) return Status::KILLED;
  if (code != 0) return Status::RUNTIME_ERROR;
  return Status::SUCCESS;
}
