#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace warden::federation {

// Raw DEFLATE (no zlib header) as the HTTP-Redirect binding requires.
std::string DeflateRaw(std::string_view data);

// Throws std::runtime_error on corrupt or oversized input.
std::string InflateRaw(std::string_view data, size_t max_output);

// base64(deflate(xml)), not yet URL-encoded.
std::string EncodeRedirectPayload(std::string_view xml);

// Inverse of EncodeRedirectPayload when `deflated`, plain base64 otherwise.
// Throws std::runtime_error.
std::string DecodeBindingPayload(std::string_view encoded, bool deflated,
                                 size_t max_output);

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Appends URL-encoded params, joining with '&' when the URL already has a
// query string.
std::string AppendQuery(const std::string& url, const QueryParams& params);

}  // namespace warden::federation
