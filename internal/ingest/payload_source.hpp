#pragma once

#include <string>
#include <string_view>

namespace relay::ingest {

// One inbound message: one file.
struct PayloadEvent {
  std::string subsystem;
  std::string filename;
  std::string content;
  std::string run_identifier;
};

/*
  Where new payloads come from.

  Implementations: the live gRPC ingest endpoint and the replay engine.
  Both hand every event to the Receiver; a process runs exactly one.
*/
class PayloadSource {
 public:
  virtual ~PayloadSource() = default;

  virtual std::string_view Name() const = 0;

  virtual void Start() = 0;
  virtual void Stop()  = 0;

  // True once the source will never produce another event.
  virtual bool Finished() const = 0;

  // True once the source stopped on a condition an operator must clear.
  virtual bool Fatal() const {
    return false;
  }
};

} // namespace relay::ingest
