#include "redirect_binding.h"

#include <zlib.h>

#include <stdexcept>
#include <string>

#include "warden/auth/encoding.h"

namespace warden::federation {
namespace {

constexpr int kRawDeflateWindowBits = -15;
constexpr size_t kChunkSize = 16 * 1024;

}  // namespace

std::string DeflateRaw(std::string_view data) {
  z_stream stream{};
  if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                   kRawDeflateWindowBits, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
    throw std::runtime_error("deflateInit2 failed");
  }
  stream.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::string out;
  unsigned char buffer[kChunkSize];
  int rc = Z_OK;
  do {
    stream.next_out = buffer;
    stream.avail_out = sizeof(buffer);
    rc = deflate(&stream, Z_FINISH);
    if (rc == Z_STREAM_ERROR) {
      deflateEnd(&stream);
      throw std::runtime_error("deflate failed");
    }
    out.append(reinterpret_cast<char*>(buffer),
               sizeof(buffer) - stream.avail_out);
  } while (rc != Z_STREAM_END);
  deflateEnd(&stream);
  return out;
}

std::string InflateRaw(std::string_view data, size_t max_output) {
  z_stream stream{};
  if (inflateInit2(&stream, kRawDeflateWindowBits) != Z_OK) {
    throw std::runtime_error("inflateInit2 failed");
  }
  stream.next_in =
      reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
  stream.avail_in = static_cast<uInt>(data.size());

  std::string out;
  unsigned char buffer[kChunkSize];
  int rc = Z_OK;
  while (rc != Z_STREAM_END) {
    stream.next_out = buffer;
    stream.avail_out = sizeof(buffer);
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      inflateEnd(&stream);
      throw std::runtime_error("inflate failed");
    }
    const size_t produced = sizeof(buffer) - stream.avail_out;
    if (out.size() + produced > max_output) {
      inflateEnd(&stream);
      throw std::runtime_error("inflated message exceeds size limit");
    }
    out.append(reinterpret_cast<char*>(buffer), produced);
    if (rc == Z_OK && produced == 0 && stream.avail_in == 0) {
      inflateEnd(&stream);
      throw std::runtime_error("truncated deflate stream");
    }
  }
  inflateEnd(&stream);
  return out;
}

std::string EncodeRedirectPayload(std::string_view xml) {
  return auth::Base64Encode(DeflateRaw(xml));
}

std::string DecodeBindingPayload(std::string_view encoded, bool deflated,
                                 size_t max_output) {
  std::string raw;
  try {
    raw = auth::Base64Decode(encoded);
  } catch (const std::invalid_argument& ex) {
    throw std::runtime_error(std::string("invalid base64: ") + ex.what());
  }
  if (!deflated) {
    if (raw.size() > max_output) {
      throw std::runtime_error("message exceeds size limit");
    }
    return raw;
  }
  return InflateRaw(raw, max_output);
}

std::string AppendQuery(const std::string& url, const QueryParams& params) {
  std::string out = url;
  char separator = url.find('?') == std::string::npos ? '?' : '&';
  if (!out.empty() && (out.back() == '?' || out.back() == '&')) {
    separator = '\0';
  }
  for (const auto& [key, value] : params) {
    if (separator != '\0') {
      out += separator;
    }
    out += auth::UrlEncode(key);
    out += '=';
    out += auth::UrlEncode(value);
    separator = '&';
  }
  return out;
}

}  // namespace warden::federation
