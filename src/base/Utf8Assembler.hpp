#ifndef __TG_UTF8_ASSEMBLER__
#define __TG_UTF8_ASSEMBLER__

#include "Headers.hpp"

namespace tg {
/**
 * @brief Re-assembles UTF-8 text that arrives as arbitrary byte chunks.
 *
 * A pty read can end in the middle of a multi-byte code point.  `append()`
 * holds back such an incomplete trailing sequence until the next chunk
 * completes it, so every returned chunk can be serialized on its own.
 * Invalid bytes are passed through untouched; JSON serialization replaces
 * them later.
 */
class Utf8Assembler {
 public:
  /** @brief Returns the decodable prefix of pending + `bytes`. */
  string append(const string& bytes) {
    string data = pending + bytes;
    pending.clear();
    size_t cut = incompleteTailStart(data);
    if (cut < data.size()) {
      pending = data.substr(cut);
      data.resize(cut);
    }
    return data;
  }

  /** @brief Returns and clears whatever is still held back. */
  string flush() {
    string rv = pending;
    pending.clear();
    return rv;
  }

  inline bool hasPending() const { return !pending.empty(); }

 protected:
  /** @brief Bytes of an unfinished code point from the previous chunk. */
  string pending;

  static size_t sequenceLength(unsigned char lead) {
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
  }

  // Finds where a trailing, valid-but-incomplete sequence starts.  Returns
  // data.size() when the data ends on a boundary (or in garbage that no
  // further byte could complete).
  static size_t incompleteTailStart(const string& data) {
    size_t n = data.size();
    // A sequence is at most 4 bytes, so the lead byte is in the last 3.
    for (size_t back = 1; back <= 3 && back <= n; back++) {
      unsigned char c = (unsigned char)data[n - back];
      if (c >= 0x80 && c <= 0xBF) {
        continue;
      }
      size_t expected = sequenceLength(c);
      if (expected > back) {
        return n - back;
      }
      return n;
    }
    return n;
  }
};
}  // namespace tg

#endif  // __TG_UTF8_ASSEMBLER__
