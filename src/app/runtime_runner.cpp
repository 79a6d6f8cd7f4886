#include "app/runtime_runner.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/signal_set.hpp>

#include "mpb/bench/harness.hpp"
#include "mpb/checksum/checksum.hpp"
#include "mpb/core/error.hpp"
#include "mpb/core/log.hpp"
#include "mpb/net/server.hpp"
#include "mpb/net/transfer.hpp"
#include "mpb/process/process.hpp"
#include "mpb/runtime/runtime.hpp"

namespace {

namespace asio = boost::asio;

using AppError = mpb::Error;

template <typename T>
using Result = mpb::Expected<T>;

using mpb::app::Command;
using mpb::app::Config;
using mpb::BenchmarkHarness;
using mpb::BenchmarkResult;
using mpb::Protocol;
using mpb::tcp;

struct NamedOperation {
  std::string label;
  BenchmarkHarness::Operation op;
};

std::vector<NamedOperation> operations_for(const Config& cfg, const std::filesystem::path& file) {
  const auto limit = std::chrono::duration<double>(cfg.transcode_seconds);
  const Protocol protocol = cfg.protocol;
  const tcp::endpoint local{asio::ip::address_v4::loopback(), cfg.port};

  std::vector<NamedOperation> ops;
  ops.push_back({"Read file", [file]() { return mpb::hash_file(file); }});
  ops.push_back({"Read file again", [file]() { return mpb::hash_file(file); }});
  ops.push_back({"Transcoded file", [file, limit, program = cfg.ffmpeg]() {
                   return mpb::transcode(file, limit, mpb::TranscodeOptions{program});
                 }});
  ops.push_back({"Transferred data locally", [file, local, protocol]() {
                   return mpb::transfer(file, local, protocol);
                 }});
  if (cfg.remote_ip.has_value()) {
    const tcp::endpoint remote{asio::ip::make_address(*cfg.remote_ip), cfg.port};
    ops.push_back({"Transferred data in LAN", [file, remote, protocol]() {
                     return mpb::transfer(file, remote, protocol);
                   }});
  }
  return ops;
}

Result<int> run_benchmark(const Config& cfg) {
  std::unique_ptr<mpb::Runtime> runtime;
  try {
    runtime = mpb::make_runtime(mpb::RuntimeConfig{cfg.threads});
  } catch (const AppError& e) {
    return std::unexpected(e);
  }

  const BenchmarkHarness harness;
  std::vector<BenchmarkResult> results;

  for (const auto& file : cfg.files) {
    if (cfg.files.size() > 1) {
      std::cout << "== " << file.string() << " ==\n";
    }
    for (auto& named : operations_for(cfg, file)) {
      BenchmarkResult result{};
      try {
        result = runtime->block_on(harness.run(named.label, cfg.iterations, std::move(named.op)));
      } catch (const AppError& e) {
        return std::unexpected(e);
      }
      std::cout << mpb::format_report(result) << std::flush;
      results.push_back(std::move(result));
    }
  }
  return mpb::exit_status(results);
}

Result<int> run_server(const Config& cfg) {
  mpb::ServerConfig scfg{};
  scfg.address = cfg.listen_address;
  scfg.port = cfg.port;
  scfg.protocol = cfg.protocol;
  scfg.max_connections = cfg.max_connections;

  std::unique_ptr<mpb::Runtime> runtime;
  std::unique_ptr<mpb::Server> server;
  try {
    runtime = mpb::make_runtime(mpb::RuntimeConfig{cfg.threads});
    server = std::make_unique<mpb::Server>(*runtime, scfg);
  } catch (const AppError& e) {
    return std::unexpected(e);
  }

  server->start();
  mpb::log_info("Listening on {}:{} ({} protocol, {})", scfg.address, server->port(),
                mpb::app::protocol_to_string(cfg.protocol),
                cfg.max_connections == 0 ? std::string{"no connection limit"}
                                         : std::to_string(cfg.max_connections) + " connections max");

  asio::signal_set signals(runtime->get_executor(), SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int sig) {
    if (ec) {
      return;
    }
    mpb::log_info("Received signal {}, shutting down", sig);
    server->stop();
    runtime->stop();
  });

  runtime->join();
  return 0;
}

}  // namespace

namespace mpb::app {

std::string protocol_to_string(Protocol protocol) {
  return protocol == Protocol::Echo ? "echo" : "checksum";
}

Result<Protocol> parse_protocol(const std::string& s) {
  if (s == "checksum") {
    return Protocol::RemoteChecksum;
  }
  if (s == "echo") {
    return Protocol::Echo;
  }
  return std::unexpected(AppError{mpb::ErrorCode::InvalidArgument, "invalid --protocol: " + s});
}

Result<Config> parse_args(int argc, char** argv) {
  Config cfg{};

  argparse::ArgumentParser program("mpb");

  argparse::ArgumentParser bench_cmd("benchmark");
  bench_cmd.add_description("Time disk read, transcode and network transfer of media files");
  bench_cmd.add_argument("--file").required().append().help("input file, may be repeated");
  bench_cmd.add_argument("--transcode-seconds").scan<'g', double>().default_value(30.0);
  bench_cmd.add_argument("--port").scan<'u', uint16_t>().default_value(mpb::kDefaultPort);
  bench_cmd.add_argument("--remote-ip").default_value(std::string(""));
  bench_cmd.add_argument("--iterations").scan<'u', uint32_t>().default_value(1u);
  bench_cmd.add_argument("--protocol").default_value(std::string("checksum"));
  bench_cmd.add_argument("--ffmpeg").default_value(std::string("ffmpeg"));
  bench_cmd.add_argument("--threads").scan<'u', uint32_t>().default_value(cfg.threads);

  argparse::ArgumentParser server_cmd("server");
  server_cmd.add_description("Serve the transfer peer protocol");
  server_cmd.add_argument("--port").scan<'u', uint16_t>().default_value(mpb::kDefaultPort);
  server_cmd.add_argument("--address").default_value(std::string("0.0.0.0"));
  server_cmd.add_argument("--protocol").default_value(std::string("checksum"));
  server_cmd.add_argument("--max-connections").scan<'u', uint32_t>().default_value(0u);
  server_cmd.add_argument("--threads").scan<'u', uint32_t>().default_value(cfg.threads);

  program.add_subparser(bench_cmd);
  program.add_subparser(server_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << "\n";
    std::cerr << program;
    return std::unexpected(AppError{mpb::ErrorCode::InvalidArgument, "argument parsing failed"});
  }

  argparse::ArgumentParser* cmd = nullptr;
  if (program.is_subcommand_used("benchmark")) {
    cfg.command = Command::Benchmark;
    cmd = &bench_cmd;
  } else if (program.is_subcommand_used("server")) {
    cfg.command = Command::Server;
    cmd = &server_cmd;
  } else {
    std::cerr << program;
    return std::unexpected(
        AppError{mpb::ErrorCode::InvalidArgument, "expected a command: benchmark or server"});
  }

  auto protocol = parse_protocol(cmd->get<std::string>("--protocol"));
  if (!protocol) {
    return std::unexpected(protocol.error());
  }
  cfg.protocol = *protocol;
  cfg.port = cmd->get<uint16_t>("--port");
  cfg.threads = cmd->get<uint32_t>("--threads");

  if (cfg.command == Command::Benchmark) {
    for (const auto& f : bench_cmd.get<std::vector<std::string>>("--file")) {
      cfg.files.emplace_back(f);
    }
    cfg.transcode_seconds = bench_cmd.get<double>("--transcode-seconds");
    cfg.iterations = bench_cmd.get<uint32_t>("--iterations");
    cfg.ffmpeg = bench_cmd.get<std::string>("--ffmpeg");
    const auto remote = bench_cmd.get<std::string>("--remote-ip");
    if (!remote.empty()) {
      boost::system::error_code ec;
      asio::ip::make_address(remote, ec);
      if (ec) {
        return std::unexpected(
            AppError{mpb::ErrorCode::InvalidArgument, "invalid --remote-ip: " + remote});
      }
      cfg.remote_ip = remote;
    }
  } else {
    cfg.listen_address = server_cmd.get<std::string>("--address");
    cfg.max_connections = server_cmd.get<uint32_t>("--max-connections");
  }

  if (cfg.command == Command::Benchmark && (cfg.files.empty() || cfg.iterations == 0)) {
    return std::unexpected(AppError{mpb::ErrorCode::InvalidArgument,
                                    "benchmark needs at least one --file and --iterations > 0"});
  }
  if (cfg.threads == 0) {
    return std::unexpected(AppError{mpb::ErrorCode::InvalidArgument, "--threads must be > 0"});
  }
  if (cfg.transcode_seconds <= 0.0) {
    return std::unexpected(
        AppError{mpb::ErrorCode::InvalidArgument, "--transcode-seconds must be > 0"});
  }
  return cfg;
}

}  // namespace mpb::app

int run_cli_impl(int argc, char** argv) {
  auto cfg = mpb::app::parse_args(argc, argv);
  if (!cfg) {
    std::cerr << "error: " << mpb::describe(cfg.error()) << "\n";
    return 2;
  }

  auto run = cfg->command == Command::Server ? run_server(*cfg) : run_benchmark(*cfg);
  if (!run) {
    mpb::log_error("{}", mpb::describe(run.error()));
    return 1;
  }
  return *run;
}
