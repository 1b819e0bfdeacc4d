#include "time.hpp"

namespace streamgate::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{std::chrono::milliseconds(ms)};
}

std::chrono::seconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::seconds(d.seconds());
}

google::protobuf::Duration ToProto(std::chrono::seconds s) {
  google::protobuf::Duration d;
  d.set_seconds(s.count());
  return d;
}

} // namespace streamgate::util
