#ifndef MCPGATE_PROTOCOL_ENVELOPE_CODEC_H
#define MCPGATE_PROTOCOL_ENVELOPE_CODEC_H

#include <cstddef>
#include <string>

#include "mcpgate/protocol/envelope.h"

namespace mcpgate {
namespace protocol {

struct CodecLimits {
  size_t max_message_bytes = 10000;
  size_t max_method_length = 100;  // characters, not bytes
};

/**
 * Boundary between raw frames and typed envelopes.
 *
 * decode() is total: every input yields either a RequestEnvelope or a
 * DecodeFailure, and it never throws. Checks run in this order:
 *   1. byte length above the limit  -> OversizedMessage (not parsed)
 *   2. invalid JSON                 -> MalformedSyntax (id null)
 *   3. not an object, bad jsonrpc/id/method/params -> InvalidShape
 *
 * encode() serializes "jsonrpc", "id", then "result" or "error", in that
 * order.
 */
class EnvelopeCodec {
 public:
  EnvelopeCodec() = default;
  explicit EnvelopeCodec(const CodecLimits& limits) : limits_(limits) {}

  DecodeResult decode(const std::string& frame) const;

  std::string encode(const ResponseEnvelope& response) const;

  const CodecLimits& limits() const { return limits_; }

 private:
  CodecLimits limits_;
};

// Trims ASCII whitespace then cuts to max_chars UTF-8 code points
std::string boundMethodName(const std::string& method, size_t max_chars);

}  // namespace protocol
}  // namespace mcpgate

#endif  // MCPGATE_PROTOCOL_ENVELOPE_CODEC_H
