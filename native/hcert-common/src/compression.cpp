// Copyright (c) Microsoft Corporation.
// Licensed under the MIT License.

#include "hcert/common/compression.h"

#include <array>
#include <cstddef>
#include <limits>
#include <utility>

#include <zlib.h>

namespace hcert::common {

namespace {

class InflateStream final {
 public:
  InflateStream() { ok_ = inflateInit(&stream_) == Z_OK; }
  ~InflateStream() {
    if (ok_) {
      inflateEnd(&stream_);
    }
  }

  InflateStream(const InflateStream&) = delete;
  InflateStream& operator=(const InflateStream&) = delete;

  bool ok() const { return ok_; }
  z_stream* get() { return &stream_; }

 private:
  z_stream stream_{};
  bool ok_ = false;
};

bool Fail(std::string* out_error, std::string message) {
  if (out_error) *out_error = std::move(message);
  return false;
}

std::string ZlibMessage(const z_stream* zs, int ret) {
  if (zs->msg) {
    return zs->msg;
  }
  return zError(ret);
}

} // namespace

bool LooksLikeZlibStream(std::span<const std::uint8_t> bytes) {
  if (bytes.size() < 2) {
    return false;
  }

  const std::uint8_t cmf = bytes[0];
  const std::uint8_t flg = bytes[1];
  if ((cmf & 0x0F) != Z_DEFLATED) {
    return false;
  }
  if ((cmf >> 4) > 7) {
    return false;
  }
  return ((static_cast<unsigned>(cmf) << 8) | flg) % 31 == 0;
}

bool ZlibInflate(std::span<const std::uint8_t> compressed,
                 std::vector<std::uint8_t>& out,
                 std::size_t max_output,
                 std::string* out_error) {
  if (out_error) out_error->clear();
  out.clear();

  if (compressed.size() > std::numeric_limits<uInt>::max()) {
    return Fail(out_error, "compressed input too large");
  }

  InflateStream stream;
  if (!stream.ok()) {
    return Fail(out_error, "inflateInit failed");
  }

  z_stream* zs = stream.get();
  zs->next_in = const_cast<Bytef*>(compressed.data());
  zs->avail_in = static_cast<uInt>(compressed.size());

  std::array<std::uint8_t, 16 * 1024> chunk{};
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    zs->next_out = chunk.data();
    zs->avail_out = static_cast<uInt>(chunk.size());

    ret = inflate(zs, Z_NO_FLUSH);
    if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
      return Fail(out_error, "inflate failed: " + ZlibMessage(zs, ret));
    }
    if (ret == Z_BUF_ERROR) {
      // Output space was available, so the input ran out before the end of the stream.
      return Fail(out_error, "truncated zlib stream");
    }

    const std::size_t produced = chunk.size() - zs->avail_out;
    if (out.size() + produced > max_output) {
      return Fail(out_error, "inflated size exceeds limit of " + std::to_string(max_output) + " bytes");
    }
    out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
  }

  return true;
}

bool ZlibDeflate(std::span<const std::uint8_t> bytes, std::vector<std::uint8_t>& out, int level, std::string* out_error) {
  if (out_error) out_error->clear();

  uLongf dest_len = compressBound(static_cast<uLong>(bytes.size()));
  out.resize(dest_len);
  const int ret = compress2(out.data(), &dest_len, bytes.data(), static_cast<uLong>(bytes.size()), level);
  if (ret != Z_OK) {
    out.clear();
    return Fail(out_error, std::string("compress2 failed: ") + zError(ret));
  }

  out.resize(dest_len);
  return true;
}

} // namespace hcert::common
