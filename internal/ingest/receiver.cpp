#include "internal/ingest/receiver.hpp"

#include <exception>

#include "internal/ingest/registration.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/staging/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace relay::ingest {

using relay::observability::IntField;
using relay::observability::Metrics;
using relay::observability::StringField;

Receiver::Receiver(const config::PipelineSettings& settings, std::shared_ptr<staging::StagingStore> staging,
                   std::shared_ptr<db::Repository> repository)
    : settings_(settings), staging_(std::move(staging)), repository_(std::move(repository)) {
}

ReceiveResult Receiver::Receive(std::string_view subsystem, std::string_view filename, std::string_view bytes, std::string_view run_identifier) {
  ReceiveResult result;

  if (!settings_.IsKnownSubsystem(subsystem)) {
    RELAY_LOG_WARN("Rejected payload from unknown subsystem", {StringField("subsystem", subsystem), StringField("filename", filename)});
    Metrics::Instance().RecordReceive(subsystem, false);
    result.status = util::Status::Err(util::ErrorCode::kUnknownSubsystem, "unknown subsystem: " + std::string(subsystem));
    return result;
  }

  try {
    staging::ValidateFilename(filename);
  } catch (const util::InvalidArgument& e) {
    RELAY_LOG_WARN("Rejected payload with invalid filename", {StringField("subsystem", subsystem), StringField("error", e.what())});
    Metrics::Instance().RecordReceive(subsystem, false);
    result.status = util::Status::Err(util::ErrorCode::kInvalidArgument, e.what());
    return result;
  }

  if (!run_identifier.empty() && !model::IsRunIdentifier(run_identifier)) {
    Metrics::Instance().RecordReceive(subsystem, false);
    result.status = util::Status::Err(util::ErrorCode::kInvalidArgument, "run identifier must look like Run<number>: " + std::string(run_identifier));
    return result;
  }

  auto& ref          = result.ref;
  ref.subsystem      = std::string(subsystem);
  ref.filename       = std::string(filename);
  ref.run_identifier = run_identifier.empty() ? model::FindRunIdentifier(filename) : std::string(run_identifier);
  ref.size_bytes     = bytes.size();
  ref.received_at    = util::Now();

  try {
    result.status = staging_->Admit(ref, bytes);
  } catch (const util::ResourceExhausted& e) {
    exhausted_ = true;
    RELAY_LOG_ERROR("Staging volume exhausted", {StringField("payload", ref.Key()), StringField("error", e.what())});
    Metrics::Instance().RecordReceive(subsystem, false);
    result.status = util::Status::Err(util::ErrorCode::kResourceExhausted, e.what());
    return result;
  }

  if (!result.status) {
    RELAY_LOG_ERROR("Failed to stage payload", {StringField("payload", ref.Key()), StringField("error", result.status.message)});
    Metrics::Instance().RecordReceive(subsystem, false);
    return result;
  }

  Register(ref);

  Metrics::Instance().RecordReceive(subsystem, true);
  RELAY_LOG_INFO("Received payload", {StringField("payload", ref.Key()), StringField("run", ref.run_identifier),
                                      IntField("size_bytes", static_cast<std::int64_t>(ref.size_bytes))});
  return result;
}

void Receiver::Register(const model::PayloadRef& ref) {
  // The file is already durable in Incoming. A missing record is recovered
  // by the transfer manager's adoption scan, so failures here only warn.
  try {
    auto tx       = repository_->Begin();
    auto existing = repository_->GetPayload(*tx, ref.Key());
    if (existing && existing->location == model::StagingLocation::kTempStorage) {
      if (!existing->flagged) {
        // older copy still being delivered; the new one is tracked once it settles
        RELAY_LOG_INFO("Older copy still staged, new copy waits in Incoming", {StringField("payload", ref.Key())});
        tx->Rollback();
        return;
      }
      // the flagged copy would hold the key forever; move it out of the way
      if (auto set_aside = staging_->SetAside(ref.subsystem, ref.filename); !set_aside) {
        RELAY_LOG_ERROR("Could not set flagged payload aside, new copy waits in Incoming",
                        {StringField("payload", ref.Key()), StringField("error", set_aside.message)});
        tx->Rollback();
        return;
      }
      RELAY_LOG_WARN("New copy replaces payload flagged for inspection",
                     {StringField("payload", ref.Key()), StringField("set_aside", staging_->InspectionDir(ref.subsystem).string())});
    }

    if (auto registered = RegisterPending(*repository_, *tx, ref, settings_.transfer.destinations, model::StagingLocation::kIncoming);
        !registered) {
      RELAY_LOG_WARN("Could not register deliveries", {StringField("payload", ref.Key()), StringField("error", registered.message)});
      tx->Rollback();
      return;
    }
    tx->Commit();
  } catch (const std::exception& e) {
    RELAY_LOG_WARN("Could not register deliveries", {StringField("payload", ref.Key()), StringField("error", e.what())});
  }
}

} // namespace relay::ingest
