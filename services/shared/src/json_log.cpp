#include "warden/shared/json_log.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace warden::shared {
namespace {

std::mutex& OutputMutex() {
  static std::mutex mutex;
  return mutex;
}

}  // namespace

std::string JsonEscape(std::string_view input) {
  std::string out;
  out.reserve(input.size());
  for (char ch : input) {
    switch (ch) {
      case '\\':
        out += "\\\\";
        break;
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(ch) < 0x20) {
          char escaped[7];
          std::snprintf(escaped, sizeof(escaped), "\\u%04x",
                        static_cast<unsigned int>(static_cast<unsigned char>(ch)));
          out += escaped;
        } else {
          out += ch;
        }
        break;
    }
  }
  return out;
}

std::string UtcTimestampNow() {
  const auto now = std::chrono::system_clock::now();
  const auto tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return os.str();
}

void WriteEventLine(std::string_view component, std::string_view action,
                    const grpc::Status& status, std::string_view detail) {
  std::ostringstream line;
  line << "{\"timestamp\":\"" << UtcTimestampNow() << "\",\"component\":\""
       << JsonEscape(component) << "\""
       << ",\"action\":\"" << JsonEscape(action) << "\""
       << ",\"status\":\"" << status.error_code() << "\"";
  if (!detail.empty()) {
    line << ",\"detail\":\"" << JsonEscape(detail) << "\"";
  }
  if (!status.ok()) {
    line << ",\"error\":\"" << JsonEscape(status.error_message()) << "\"";
  }
  line << "}\n";
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line.str() << std::flush;
}

void WriteWarningLine(std::string_view component, std::string_view action,
                      std::string_view detail) {
  std::ostringstream line;
  line << "{\"timestamp\":\"" << UtcTimestampNow() << "\",\"component\":\""
       << JsonEscape(component) << "\""
       << ",\"level\":\"warning\""
       << ",\"action\":\"" << JsonEscape(action) << "\"";
  if (!detail.empty()) {
    line << ",\"detail\":\"" << JsonEscape(detail) << "\"";
  }
  line << "}\n";
  std::lock_guard<std::mutex> lock(OutputMutex());
  std::cout << line.str() << std::flush;
}

}  // namespace warden::shared
