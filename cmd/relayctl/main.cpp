#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>

#include "relay/v1.hpp"

using namespace relay::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  relayctl <addr> publish <subsystem> <file> [RunNNN] [--retries N]\n"
            << "  relayctl <addr> stats\n"
            << "  relayctl <addr> deliveries [--failed]\n"
            << "  relayctl <addr> reset <payload_key> [destination]\n";
}

static const char* StateName(DeliveryState state) {
  switch (state) {
    case DELIVERY_STATE_PENDING:
      return "pending";
    case DELIVERY_STATE_IN_FLIGHT:
      return "in_flight";
    case DELIVERY_STATE_DELIVERED:
      return "delivered";
    case DELIVERY_STATE_FAILED:
      return "failed";
    default:
      return "unknown";
  }
}

static bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  return !in.bad();
}

static std::string BaseName(const std::string& path) {
  const auto pos = path.find_last_of('/');
  return pos == std::string::npos ? path : path.substr(pos + 1);
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto ingest_stub = PayloadIngestService::NewStub(channel);
  auto admin_stub  = RelayAdminService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "publish") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    PublishRequest req;
    req.set_subsystem(argv[3]);
    req.set_filename(BaseName(argv[4]));

    int retries = 5;
    for (int i = 5; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--retries" && i + 1 < argc) {
        retries = std::stoi(argv[++i]);
      } else {
        req.set_run_identifier(arg);
      }
    }

    std::string content;
    if (!ReadFile(argv[4], &content)) {
      std::cerr << "cannot read " << argv[4] << "\n";
      return 1;
    }
    req.set_content(std::move(content));

    // the receiver never retries; UNAVAILABLE is ours to retry
    auto backoff = std::chrono::milliseconds(200);
    for (int attempt = 0;; ++attempt) {
      grpc::ClientContext ctx;
      PublishResponse     resp;

      auto status = ingest_stub->Publish(&ctx, req, &resp);
      if (status.ok()) {
        std::cout << "key=" << resp.payload_key() << "\n";
        std::cout << "size_bytes=" << resp.size_bytes() << "\n";
        return 0;
      }
      if (status.error_code() != grpc::StatusCode::UNAVAILABLE || attempt >= retries) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }
      std::cerr << "unavailable, retrying in " << backoff.count() << "ms: " << status.error_message() << "\n";
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, std::chrono::milliseconds(10'000));
    }
  }

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;

    auto status = admin_stub->Stats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "incoming=" << resp.payloads_incoming() << "\n";
    std::cout << "temp_storage=" << resp.payloads_temp_storage() << "\n";
    std::cout << "pending=" << resp.deliveries_pending() << "\n";
    std::cout << "in_flight=" << resp.deliveries_in_flight() << "\n";
    std::cout << "delivered=" << resp.deliveries_delivered() << "\n";
    std::cout << "failed=" << resp.deliveries_failed() << "\n";
    std::cout << "terminal=" << resp.terminal_failures() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "deliveries") {
    ListDeliveriesRequest req;
    req.set_only_terminal(argc >= 4 && std::string(argv[3]) == "--failed");

    ListDeliveriesResponse resp;

    auto status = admin_stub->ListDeliveries(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    for (const auto& d : resp.deliveries()) {
      std::cout << d.payload_key() << " " << d.destination() << " " << StateName(d.state()) << " attempts=" << d.attempt_count()
                << (d.terminal() ? " terminal" : "");
      if (!d.last_error().empty()) {
        std::cout << " error=\"" << d.last_error() << "\"";
      }
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reset") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ResetDeliveryRequest req;
    req.set_payload_key(argv[3]);
    if (argc >= 5) req.set_destination(argv[4]);

    ResetDeliveryResponse resp;

    auto status = admin_stub->ResetDelivery(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "reset=" << resp.reset_count() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
