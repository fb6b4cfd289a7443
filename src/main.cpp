#include <cstdlib>
#include <thread>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iostream>
#include <filesystem>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <coderun/config.h>
#include <coderun/logger.h>
#include <coderun/executor.h>
#include "coderun/utils.h"
#include "coderun/docker_runtime.h"

namespace {

std::string ReadAll(std::istream& in) {
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

Language GuessLanguage(const fs::path& file) {
  if (file.extension() == ".js") return Language::JAVASCRIPT;
  return Language::PYTHON;
}

nlohmann::json ResultToJson(const ExecutionResult& res) {
  nlohmann::json ret = {
    {"status", StatusToAbr(res.status)},
    {"description", StatusToDesc(res.status)},
    {"output", res.output},
    {"error", res.error},
    {"return_code", nullptr},
    {"timed_out", res.timed_out},
    {"message", res.message},
  };
  if (res.exit_code) ret["return_code"] = res.exit_code.value();
  return ret;
}

int ExitStatus(Status status) {
  switch (status) {
    case Status::SUCCESS: [[fallthrough]];
    case Status::RUNTIME_ERROR: [[fallthrough]];
    case Status::KILLED: [[fallthrough]];
    case Status::TIMEOUT: return 0;
    case Status::BUSY: [[fallthrough]];
    case Status::VALIDATION_ERROR: return 1;
    case Status::NUL: [[fallthrough]];
    case Status::SYSTEM_ERROR: return 2;
  }
  __builtin_unreachable();
}

void PrintJson(const nlohmann::json& json) {
  std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

int RunInline(Executor& executor, const std::vector<std::string>& files, const std::string& lang) {
  if (files.empty()) {
    Language language = lang.empty() ? Language::PYTHON : GetLanguage(lang);
    auto res = executor.ExecuteInline(ReadAll(std::cin), language);
    PrintJson(ResultToJson(res));
    return ExitStatus(res.status);
  }
  // every file runs on its own thread; the gate bounds the parallelism
  std::vector<ExecutionResult> results(files.size());
  std::vector<std::thread> threads;
  for (size_t i = 0; i < files.size(); i++) {
    std::ifstream fin(files[i]);
    if (!fin) {
      spdlog::error("Cannot open {}", files[i]);
      results[i].status = Status::VALIDATION_ERROR;
      results[i].message = "Cannot open " + files[i];
      continue;
    }
    Language language = lang.empty() ? GuessLanguage(files[i]) : GetLanguage(lang);
    threads.emplace_back([&executor, &results, i, language, code = ReadAll(fin)]() {
      results[i] = executor.ExecuteInline(code, language);
    });
  }
  for (auto& i : threads) i.join();
  if (files.size() == 1) {
    PrintJson(ResultToJson(results[0]));
    return ExitStatus(results[0].status);
  }
  nlohmann::json ret = nlohmann::json::array();
  int status = 0;
  for (size_t i = 0; i < files.size(); i++) {
    auto json = ResultToJson(results[i]);
    json["file"] = files[i];
    ret.push_back(std::move(json));
    status = std::max(status, ExitStatus(results[i].status));
  }
  PrintJson(ret);
  return status;
}

int RunArchive(Executor& executor, const fs::path& project, bool in_place) {
  fs::path dir = project;
  if (!in_place) {
    // execute a private copy, which the executor deletes afterwards
    char tmp[] = "/tmp/coderun_project_XXXXXX";
    if (!mkdtemp(tmp)) {
      spdlog::error("Failed to create a temporary directory");
      return 2;
    }
    dir = tmp;
    std::error_code ec;
    fs::copy(project, dir, fs::copy_options::recursive, ec);
    if (ec) {
      spdlog::error("Failed to copy {}: {}", project.c_str(), ec.message());
      RemoveAll(dir);
      return 2;
    }
  }
  auto res = executor.ExecuteArchive(dir);
  PrintJson(ResultToJson(res));
  return ExitStatus(res.status);
}

} // namespace

int main(int argc, char** argv) {
  InitLogger();

  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "coderun");
  parser.add_argument("-c", "--config")
    .default_value(std::string("/etc/coderun.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel sandboxes");
  parser.add_argument("-t", "--timeout")
    .scan<'g', double>()
    .help("Execution timeout in seconds");

  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Execute source files (or stdin) inline");
  run_cmd.add_argument("-l", "--language")
    .default_value(std::string(""))
    .help("python or javascript; guessed from the file extension if omitted");
  run_cmd.add_argument("files")
    .remaining()
    .help("Source files; read stdin if none");

  argparse::ArgumentParser archive_cmd("archive");
  archive_cmd.add_description("Execute an extracted project directory");
  archive_cmd.add_argument("project")
    .help("Project directory containing main.py or index.js");
  archive_cmd.add_argument("--in-place")
    .default_value(false)
    .implicit_value(true)
    .help("Execute the directory itself and delete it afterwards");

  argparse::ArgumentParser history_cmd("history");
  history_cmd.add_description("Print the execution log");

  parser.add_subparser(run_cmd);
  parser.add_subparser(archive_cmd);
  parser.add_subparser(history_cmd);

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return 1;
  }

  SetVerbosity(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  // the configuration file is optional unless given explicitly
  if (!ParseConfig(config_file) && parser.is_used("--config")) {
    spdlog::error("Failed to parse configuration file {}", config_file.c_str());
    return 1;
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<double>("--timeout")) {
    kExecutionTimeout = std::chrono::milliseconds(long(val.value() * 1000));
  }
  if (kMaxParallel <= 0) {
    spdlog::error("Invalid number of parallel sandboxes: {}", kMaxParallel);
    return 1;
  }

  FileExecutionLog log(kLogFile);
  if (parser.is_subcommand_used("history")) {
    std::cout << log.History() << std::endl;
    return 0;
  }

  AdmissionGate gate(kMaxParallel);
  DockerRuntime runtime;
  Executor executor(gate, runtime, log);
  if (parser.is_subcommand_used("run")) {
    std::vector<std::string> files;
    if (run_cmd.is_used("files")) files = run_cmd.get<std::vector<std::string>>("files");
    return RunInline(executor, files, run_cmd.get<std::string>("--language"));
  }
  if (parser.is_subcommand_used("archive")) {
    return RunArchive(executor, archive_cmd.get<std::string>("project"),
                      archive_cmd.get<bool>("--in-place"));
  }
  std::cerr << parser;
  return 1;
}
