#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include "chains/analyzer/v1_grpc.hpp"
#include "internal/assembly/forest_serializer.hpp"
#include "internal/core/chain_analyzer.hpp"
#include "internal/util/errors.hpp"

using namespace chains::analyzer::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  chainsctl analyze <request.json>\n"
            << "  chainsctl <addr> compute <request.json>\n"
            << "  chainsctl <addr> stats\n";
}

static ComputeChainsRequest LoadRequest(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw chains::util::InvalidArgument("cannot open request file: " + path);
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  ComputeChainsRequest req;
  auto                 status = google::protobuf::util::JsonStringToMessage(buffer.str(), &req);
  if (!status.ok()) {
    throw chains::util::InvalidArgument("invalid request JSON in " + path + ": " + status.ToString());
  }
  return req;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------

    if (std::string(argv[1]) == "analyze") {
      auto req = LoadRequest(argv[2]);

      chains::core::ChainAnalyzer analyzer;
      std::cout << chains::assembly::ToJson(analyzer.Compute(req), true) << "\n";
      return 0;
    }

    std::string addr = argv[1];
    std::string cmd  = argv[2];

    auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

    auto chain_stub = CriticalChainService::NewStub(channel);
    auto admin_stub = ChainAdminService::NewStub(channel);

    grpc::ClientContext ctx;

    // ------------------------------------------------------------

    if (cmd == "compute") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto req = LoadRequest(argv[3]);

      ComputeChainsResponse resp;

      auto status = chain_stub->ComputeChains(&ctx, req, &resp);

      if (!status.ok()) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }

      std::cout << chains::assembly::ToJson(resp.chains(), true) << "\n";
      std::cout << "from_cache=" << (resp.from_cache() ? "true" : "false") << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "stats") {
      StatsRequest  req;
      StatsResponse resp;

      auto status = admin_stub->Stats(&ctx, req, &resp);

      if (!status.ok()) {
        std::cerr << status.error_message() << "\n";
        return 2;
      }

      std::cout << "computations=" << resp.computations() << "\n"
                << "failed_computations=" << resp.failed_computations() << "\n"
                << "cache_hits=" << resp.cache_hits() << "\n"
                << "cache_misses=" << resp.cache_misses() << "\n"
                << "cache_entries=" << resp.cache_entries() << "\n";
      return 0;
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
