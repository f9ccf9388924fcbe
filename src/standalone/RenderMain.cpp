// Repository: Reelforge
// Component: Standalone Render CLI
// Purpose: Renders one landscape video into a vertical MP4 without the job
//          service, for diagnostics and local use.
// Copyright (c) 2025 Reelforge

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "reelforge/codec/CapabilityProber.hpp"
#include "reelforge/codec/FFmpegCodecRuntime.hpp"
#include "reelforge/encode/FFmpegEncoderFactory.hpp"
#include "reelforge/mux/Mp4Muxer.hpp"
#include "reelforge/pipeline/CompositionPipeline.hpp"
#include "reelforge/recovery/ErrorPolicy.hpp"
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
  std::string input_path;
  std::string output_path;
  reelforge::compose::StyleConfig style;
  bool video_only = false;
  bool reduced = false;
  int64_t fps_num = 30;
  int64_t fps_den = 1;
  int64_t bitrate_bps = 6000000;
  bool capabilities = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --input PATH --output PATH [OPTIONS]\n"
            << "\n"
            << "Renders a landscape video as a 1080x1920 vertical story MP4.\n"
            << "\n"
            << "  --input PATH         Source video (any container FFmpeg can read)\n"
            << "  --output PATH        Destination .mp4\n"
            << "  --mode blur|crop     Composition mode (default: blur)\n"
            << "  --title TEXT         Title overlay (truncated to fit)\n"
            << "  --channel TEXT       Channel name overlay\n"
            << "  --subscribers TEXT   Subscriber label overlay\n"
            << "  --safe-zones         Draw top/bottom safe-zone guides\n"
            << "  --video-only         Do not encode an audio track\n"
            << "  --reduced            Cap resolution at 720x1280\n"
            << "  --fps N[/D]          Output frame rate (default: 30)\n"
            << "  --bitrate BPS        Video bitrate (default: 6000000)\n"
            << "  --capabilities       Print encoder support and exit\n"
            << "  --help               Show this help message\n";
}

bool ParseFps(const std::string& text, int64_t* num, int64_t* den) {
  const size_t slash = text.find('/');
  try {
    *num = std::stoll(text.substr(0, slash));
    *den = slash == std::string::npos ? 1 : std::stoll(text.substr(slash + 1));
  } catch (const std::exception&) {
    return false;
  }
  return *num > 0 && *den > 0;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--input" && i + 1 < argc) {
      args.input_path = argv[++i];
    } else if (arg == "--output" && i + 1 < argc) {
      args.output_path = argv[++i];
    } else if (arg == "--mode" && i + 1 < argc) {
      auto mode = reelforge::compose::ParseCompositionMode(argv[++i]);
      if (!mode) {
        args.error = std::string("Unknown mode: ") + argv[i];
        return args;
      }
      args.style.mode = *mode;
    } else if (arg == "--title" && i + 1 < argc) {
      args.style.metadata.title = argv[++i];
    } else if (arg == "--channel" && i + 1 < argc) {
      args.style.metadata.channel_name = argv[++i];
    } else if (arg == "--subscribers" && i + 1 < argc) {
      args.style.metadata.subscriber_count_label = argv[++i];
    } else if (arg == "--safe-zones") {
      args.style.show_safe_zones = true;
    } else if (arg == "--video-only") {
      args.video_only = true;
    } else if (arg == "--reduced") {
      args.reduced = true;
    } else if (arg == "--fps" && i + 1 < argc) {
      if (!ParseFps(argv[++i], &args.fps_num, &args.fps_den)) {
        args.error = std::string("Invalid frame rate: ") + argv[i];
        return args;
      }
    } else if (arg == "--bitrate" && i + 1 < argc) {
      try {
        args.bitrate_bps = std::stoll(argv[++i]);
      } catch (const std::exception&) {
        args.error = std::string("Invalid bitrate: ") + argv[i];
        return args;
      }
    } else if (arg == "--capabilities") {
      args.capabilities = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.capabilities) {
    args.valid = true;
    return args;
  }
  if (args.input_path.empty() || args.output_path.empty()) {
    args.error = "Both --input and --output are required";
    return args;
  }
  if (args.bitrate_bps <= 0) {
    args.error = "--bitrate must be positive";
    return args;
  }
  args.valid = true;
  return args;
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

  codec::FFmpegCodecRuntime runtime;
  pipeline::PipelineOptions options;
  options.style = args.style;
  options.fps = media::RationalFps(args.fps_num, args.fps_den);
  options.video_bitrate_bps = args.bitrate_bps;
  options.include_audio = !args.video_only;
  options.prefer_reduced_resolution = args.reduced;

  if (args.capabilities) {
    codec::ProbeRequest probe;
    probe.fps = options.fps;
    probe.video_bitrate_bps = options.video_bitrate_bps;
    probe.audio = options.audio;
    codec::CapabilityProber prober(runtime, probe);
    std::cout << prober.GetSupportDescription() << std::endl;
    return prober.IsEncodingSupported() ? 0 : 2;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::string err;
  auto source = source::OpenFFmpegFrameSource(args.input_path, &err);
  if (!source) {
    util::Logger::Error("[Render] " + err);
    return 1;
  }

  encode::FFmpegEncoderFactory backends;
  mux::Mp4Muxer muxer;
  time::SystemTimeSource clock;
  time::RealtimeWaitStrategy waiter;
  recovery::ErrorPolicy errors(clock, waiter);

  pipeline::CompositionPipeline pipeline(*source, runtime, backends, muxer, errors, options);
  int last_percent = -1;
  pipeline.SetProgressCallback([&last_percent](const pipeline::PipelineProgress& p) {
    const int percent = static_cast<int>(p.percentage);
    if (percent != last_percent) {
      last_percent = percent;
      std::cerr << "\r[Render] " << std::setw(3) << percent << "% " << p.status << std::flush;
    }
  });

  std::atomic<bool> done{false};
  std::thread watcher([&] {
    while (!done.load(std::memory_order_acquire)) {
      if (g_termination_requested.load(std::memory_order_acquire)) {
        pipeline.Cancel();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  const int64_t total_frames = pipeline::TotalFramesFor(source->DurationUs(), options.fps);
  const pipeline::PipelineOutcome outcome = pipeline.Run(total_frames);
  done.store(true, std::memory_order_release);
  watcher.join();
  std::cerr << "\n";

  for (const auto& w : outcome.warnings) {
    util::Logger::Warn("[Render] " + w);
  }
  if (outcome.cancelled) {
    util::Logger::Warn("[Render] Cancelled");
    return 130;
  }
  if (!outcome.success) {
    if (!outcome.error) {
      util::Logger::Error("[Render] Render failed");
      return 1;
    }
    const recovery::ProcessingError& error = *outcome.error;
    std::cerr << recovery::ErrorPolicy::GetUserFriendlyMessage(error) << "\n";
    for (const auto& action : recovery::ErrorPolicy::GetSuggestedActions(error)) {
      std::cerr << "  - " << action << "\n";
    }
    return 1;
  }

  if (!service::WriteOutputFile(args.output_path, outcome.output.buffer, &err)) {
    util::Logger::Error("[Render] " + err);
    return 1;
  }
  util::Logger::Info("[Render] Wrote " + args.output_path + " (" +
                     std::to_string(outcome.output.size) + " bytes, " +
                     std::to_string(outcome.frames_processed) + " frames)");
  return 0;
}
