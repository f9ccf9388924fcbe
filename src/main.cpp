// Repository: Reelforge
// Component: Reelforge Server
// Purpose: Hosts the JobControl gRPC service on top of StoryService.
// Copyright (c) 2025 Reelforge

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>

#include "job_control_service.h"
#include "reelforge/codec/FFmpegCodecRuntime.hpp"
#include "reelforge/encode/FFmpegEncoderFactory.hpp"
#include "reelforge/mux/Mp4Muxer.hpp"
#include "reelforge/service/ServiceConfig.hpp"
#include "reelforge/service/StoryService.hpp"
#include "reelforge/source/FFmpegFrameSource.hpp"
#include "reelforge/time/IWaitStrategy.hpp"
#include "reelforge/time/SystemTimeSource.hpp"
#include "reelforge/util/Logger.hpp"

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string config_path;
  std::string listen_address;  // overrides config
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Vertical-story render service (JobControl gRPC API).\n"
            << "\n"
            << "  --config PATH        ServiceConfig JSON file (default: built-in defaults)\n"
            << "  --listen ADDR:PORT   Listen address (default: 0.0.0.0:50071)\n"
            << "  --port N             Shorthand for --listen 0.0.0.0:N\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "Set REELFORGE_DEBUG=1 for debug logging.\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      const std::string port = argv[++i];
      if (port.empty() || port.find_first_not_of("0123456789") != std::string::npos) {
        args.error = "Invalid port: " + port;
        return args;
      }
      args.listen_address = "0.0.0.0:" + port;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }
  args.valid = true;
  return args;
}

bool ReadFile(const std::string& path, std::string* out) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  *out = buffer.str();
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace reelforge;

  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  service::ServiceConfig config;
  if (!args.config_path.empty()) {
    std::string json;
    if (!ReadFile(args.config_path, &json)) {
      util::Logger::Error("[Server] Cannot read config file: " + args.config_path);
      return 1;
    }
    auto parsed = service::ServiceConfig::FromJson(json);
    if (!parsed) {
      util::Logger::Error("[Server] Invalid config file: " + args.config_path);
      return 1;
    }
    config = *parsed;
  }
  if (!args.listen_address.empty()) {
    config.listen_address = args.listen_address;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  codec::FFmpegCodecRuntime runtime;
  encode::FFmpegEncoderFactory backends;
  mux::Mp4Muxer muxer;
  time::SystemTimeSource clock;
  time::RealtimeWaitStrategy waiter;

  if (!mux::Mp4Muxer::IsAvailable()) {
    util::Logger::Error("[Server] libavformat has no mp4 muxer");
    return 1;
  }

  service::StoryServiceDeps deps;
  deps.open_source = &source::OpenFFmpegFrameSource;
  deps.runtime = &runtime;
  deps.backends = &backends;
  deps.muxer = &muxer;
  deps.clock = &clock;
  deps.waiter = &waiter;

  service::StoryService story(config, deps);
  util::Logger::Info("[Server] " + story.GetSupportDescription());
  story.Start();

  rpc::JobControlImpl rpc_service(story);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&rpc_service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server) {
    util::Logger::Error("[Server] Failed to listen on " + config.listen_address);
    story.Shutdown();
    return 1;
  }
  util::Logger::Info("[Server] JobControl listening on " + config.listen_address);

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  util::Logger::Info("[Server] Shutting down");
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(5));
  story.Shutdown();
  return 0;
}
