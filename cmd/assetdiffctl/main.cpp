#include <grpcpp/grpcpp.h>

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "assetdiff/v1.hpp"

using namespace assetdiff::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  assetdiffctl <addr> enqueue <request.json>\n"
            << "  assetdiffctl <addr> cleanup\n"
            << "  assetdiffctl <addr> stats\n";
}

static bool ReadRequest(const std::string& path, DiffRequest* out) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "cannot open " << path << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto status             = google::protobuf::util::JsonStringToMessage(buffer.str(), out, options);
  if (!status.ok()) {
    std::cerr << "invalid request json: " << status.message() << "\n";
    return false;
  }
  return true;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = DiffIntakeService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "enqueue") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    EnqueueRequest req;
    if (!ReadRequest(argv[3], req.mutable_request())) return 1;

    EnqueueResponse resp;

    auto status = stub->Enqueue(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "sequence=" << resp.sequence() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cleanup") {
    RequestCleanupRequest  req;
    RequestCleanupResponse resp;

    auto status = stub->RequestCleanup(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "sequence=" << resp.sequence() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    QueueStatsRequest  req;
    QueueStatsResponse resp;

    auto status = stub->QueueStats(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "pending=" << resp.pending() << "\n"
              << "next_sequence=" << resp.next_sequence() << "\n"
              << "segments=" << resp.segments() << "\n"
              << "jobs_completed=" << resp.jobs_completed() << "\n"
              << "jobs_failed=" << resp.jobs_failed() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
