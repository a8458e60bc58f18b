#include "cli/CliMain.hpp"

#include "cli/CliParse.hpp"

#include "estimap/AsciiGrid.hpp"
#include "estimap/ConfigIO.hpp"
#include "estimap/DefaultRules.hpp"
#include "estimap/Json.hpp"
#include "estimap/Log.hpp"
#include "estimap/Pipeline.hpp"
#include "estimap/RuleTable.hpp"
#include "estimap/Version.hpp"
#include "estimap/ZonalStats.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace estimap;
using namespace estimap::cli;

void PrintHelp()
{
  std::cout
      << "estimap_cli " << EstimapFullVersionString() << " (recreation potential, opportunity, demand and flow)\n\n"
      << "Usage:\n"
      << "  estimap_cli run --config <cfg.json> --input <dir> --output <dir>\n"
      << "                  [--threads <N>] [--outputs <a,b,...>] [--capacity-per-cell <F>]\n"
      << "                  [--log <file>] [--log-keep <N>] [--log-tags <0|1>] [--log-level <lvl>]\n"
      << "                  [--report <file.json>] [--print-config]\n"
      << "  estimap_cli univar <grid.asc> [--reference <stats.txt>]\n"
      << "  estimap_cli rules <text|path>\n"
      << "  estimap_cli rules --builtin <corine|iucn|maes>\n"
      << "  estimap_cli --version\n\n"
      << "run:\n"
      << "  Input grids are read as <input>/<name>.asc, using the names given in the\n"
      << "  config \"inputs\" section. Grids are written as <output>/<name>.asc and\n"
      << "  tables as <output>/<name>.csv.\n"
      << "  --threads <N>             Worker threads (0 = all hardware threads).\n"
      << "  --outputs <a,b,...>       Replace the configured outputs. Known names:\n"
      << "                            ";
  const std::vector<std::string>& names = AllRecreationOutputNames();
  for (std::size_t i = 0; i < names.size(); ++i) std::cout << (i ? "," : "") << names[i];
  std::cout
      << "\n"
      << "  --capacity-per-cell <F>   Fixed supply capacity (<= 0 balances supply with demand).\n"
      << "  --log <file>              Copy console output to a log file (rotated).\n"
      << "  --log-keep <N>            Rotated log files to keep (default: 3).\n"
      << "  --log-tags <0|1>          Timestamp and tag log file lines (default: 1).\n"
      << "  --log-level <lvl>         debug|info|warn|error|none (default: info).\n"
      << "  --report <file.json>      Write a JSON run report (outputs, statistics, warnings).\n"
      << "  --print-config            Print the effective configuration and exit.\n\n"
      << "univar:\n"
      << "  Prints univariate statistics of a grid. With --reference, compares the\n"
      << "  statistics text and exits 1 on the first differing line.\n\n"
      << "Exit codes: 0 success, 1 run failure, 2 usage error.\n";
}

void PrintError(const Error& err)
{
  Log(LogLevel::Error, FormatError(err));
}

void PrintWarnings(const std::vector<std::string>& warnings)
{
  for (const std::string& w : warnings) Log(LogLevel::Warn, w);
}

JsonValue StatsToJson(const UnivariateStats& s)
{
  JsonValue o = JsonValue::MakeObject();
  o.add("n", JsonValue::MakeNumber(static_cast<double>(s.n)));
  o.add("null_cells", JsonValue::MakeNumber(static_cast<double>(s.nullCells)));
  o.add("min", JsonValue::MakeNumber(s.min));
  o.add("max", JsonValue::MakeNumber(s.max));
  o.add("mean", JsonValue::MakeNumber(s.mean));
  o.add("stddev", JsonValue::MakeNumber(s.stddev));
  o.add("sum", JsonValue::MakeNumber(s.sum));
  return o;
}

bool WriteRunReport(const fs::path& path, const RecreationConfig& cfg, const PipelineResult& res, double seconds,
                    Error& outError)
{
  JsonValue root = JsonValue::MakeObject();
  root.add("version", JsonValue::MakeString(EstimapVersionString()));
  root.add("git_sha", JsonValue::MakeString(EstimapGitSha()));
  root.add("seconds", JsonValue::MakeNumber(seconds));
  root.add("threads", JsonValue::MakeNumber(cfg.threads));

  JsonValue region = JsonValue::MakeObject();
  region.add("cols", JsonValue::MakeNumber(res.geometry.cols));
  region.add("rows", JsonValue::MakeNumber(res.geometry.rows));
  region.add("west", JsonValue::MakeNumber(res.geometry.west));
  region.add("south", JsonValue::MakeNumber(res.geometry.south));
  region.add("cell_size", JsonValue::MakeNumber(res.geometry.cellSize));
  root.add("region", std::move(region));

  if (res.plan.supply) root.add("supply_capacity", JsonValue::MakeNumber(res.supplyCapacity));

  JsonValue written = JsonValue::MakeArray();
  for (const std::string& n : res.written) written.arrayValue.push_back(JsonValue::MakeString(n));
  root.add("written", std::move(written));

  JsonValue stats = JsonValue::MakeObject();
  for (const auto& s : res.gridStats) stats.add(s.first, StatsToJson(s.second));
  root.add("grid_stats", std::move(stats));

  JsonValue warnings = JsonValue::MakeArray();
  for (const std::string& w : res.warnings) warnings.arrayValue.push_back(JsonValue::MakeString(w));
  root.add("warnings", std::move(warnings));

  if (!EnsureParentDir(path)) {
    return Fail(outError, ErrorCode::Io, "cannot create directory for report '" + path.string() + "'");
  }
  std::ofstream f(path, std::ios::binary);
  if (!f) return Fail(outError, ErrorCode::Io, "cannot write report '" + path.string() + "'");
  f << JsonStringify(root, 2) << "\n";
  if (!f) return Fail(outError, ErrorCode::Io, "cannot write report '" + path.string() + "'");
  return true;
}

int CmdRun(int argc, char** argv)
{
  std::string configPath;
  std::string inputDir;
  std::string outputDir;
  std::string logPath;
  std::string reportPath;
  std::string outputsOverride;
  bool printConfig = false;
  bool logTags = true;
  int logKeep = 3;
  int threads = 0;
  bool haveThreads = false;
  double capacity = 0.0;
  bool haveCapacity = false;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string val;

    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--config") {
      if (!requireValue(i, configPath)) {
        std::cerr << "--config requires a path\n";
        return 2;
      }
    } else if (arg == "--input") {
      if (!requireValue(i, inputDir)) {
        std::cerr << "--input requires a directory\n";
        return 2;
      }
    } else if (arg == "--output") {
      if (!requireValue(i, outputDir)) {
        std::cerr << "--output requires a directory\n";
        return 2;
      }
    } else if (arg == "--threads") {
      if (!requireValue(i, val) || !ParseI32(val, &threads) || threads < 0) {
        std::cerr << "--threads requires a non-negative integer\n";
        return 2;
      }
      haveThreads = true;
    } else if (arg == "--outputs") {
      if (!requireValue(i, outputsOverride)) {
        std::cerr << "--outputs requires a comma separated list\n";
        return 2;
      }
    } else if (arg == "--capacity-per-cell") {
      if (!requireValue(i, val) || !ParseF64(val, &capacity)) {
        std::cerr << "--capacity-per-cell requires a number\n";
        return 2;
      }
      haveCapacity = true;
    } else if (arg == "--log") {
      if (!requireValue(i, logPath)) {
        std::cerr << "--log requires a path\n";
        return 2;
      }
    } else if (arg == "--log-keep") {
      if (!requireValue(i, val) || !ParseI32(val, &logKeep) || logKeep < 0) {
        std::cerr << "--log-keep requires a non-negative integer\n";
        return 2;
      }
    } else if (arg == "--log-tags") {
      if (!requireValue(i, val) || !ParseBool01(val, &logTags)) {
        std::cerr << "--log-tags requires 0 or 1\n";
        return 2;
      }
    } else if (arg == "--log-level") {
      LogLevel level = LogLevel::Info;
      if (!requireValue(i, val) || !ParseLogLevel(val, &level)) {
        std::cerr << "--log-level requires debug|info|warn|error|none\n";
        return 2;
      }
      SetLogLevel(level);
    } else if (arg == "--report") {
      if (!requireValue(i, reportPath)) {
        std::cerr << "--report requires a path\n";
        return 2;
      }
    } else if (arg == "--print-config") {
      printConfig = true;
    } else {
      std::cerr << "Unknown arg: " << arg << "\n";
      PrintHelp();
      return 2;
    }
  }

  if (configPath.empty()) {
    std::cerr << "run requires --config\n";
    return 2;
  }

  RecreationConfig cfg;
  Error err;
  if (!LoadRecreationConfigJsonFile(configPath, cfg, err)) {
    PrintError(err);
    return 1;
  }
  if (haveThreads) cfg.threads = threads;
  if (haveCapacity) cfg.capacityPerCell = capacity;
  if (!outputsOverride.empty()) {
    RecreationOutputs o;
    for (const std::string& name : SplitCommaList(outputsOverride)) {
      if (!EnableRecreationOutput(name, o)) {
        std::cerr << "--outputs: unknown output '" << name << "'\n";
        return 2;
      }
    }
    cfg.outputs = o;
  }

  if (printConfig) {
    std::cout << RecreationConfigToJson(cfg);
    return 0;
  }

  if (inputDir.empty() || outputDir.empty()) {
    std::cerr << "run requires --input and --output\n";
    return 2;
  }
  if (!EnsureDir(outputDir)) {
    std::cerr << "cannot create output directory '" << outputDir << "'\n";
    return 1;
  }

  RunLog runLog;
  if (!logPath.empty()) {
    RunLogOptions opt;
    opt.path = logPath;
    opt.keepFiles = logKeep;
    opt.tagLines = logTags;
    if (!runLog.open(opt, err)) {
      PrintError(err);
      return 1;
    }
  }

  Log(LogLevel::Info, "estimap " + EstimapFullVersionString());
  Log(LogLevel::Debug, "config: " + configPath);
  if (runLog.isOpen()) Log(LogLevel::Debug, "log: " + runLog.path().string());
  Log(LogLevel::Debug, "input: " + inputDir + ", output: " + outputDir);

  AsciiGridStore store(inputDir, outputDir);
  PipelineResult res;
  const auto t0 = std::chrono::steady_clock::now();
  const bool ok = RunRecreationPipeline(cfg, store, res, err);
  const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();

  PrintWarnings(res.warnings);
  if (!ok) {
    PrintError(err);
    return 1;
  }

  Log(LogLevel::Info, "region " + DescribeGeometry(res.geometry));
  for (const auto& s : res.gridStats) {
    std::ostringstream oss;
    oss << "wrote " << s.first << ": n=" << s.second.n << " min=" << FormatStatNumber(s.second.min)
        << " max=" << FormatStatNumber(s.second.max) << " mean=" << FormatStatNumber(s.second.mean);
    Log(LogLevel::Info, oss.str());
  }
  Log(LogLevel::Info, "wrote " + std::to_string(res.written.size()) + " outputs to " + outputDir);

  if (!reportPath.empty() && !WriteRunReport(reportPath, cfg, res, seconds, err)) {
    PrintError(err);
    return 1;
  }
  return 0;
}

bool ReadText(const std::string& path, std::string& out)
{
  std::ifstream f(path, std::ios::binary);
  if (!f) return false;
  std::ostringstream oss;
  oss << f.rdbuf();
  out = oss.str();
  return true;
}

int CmdUnivar(int argc, char** argv)
{
  std::string gridPath;
  std::string referencePath;

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--reference") {
      if (i + 1 >= argc) {
        std::cerr << "--reference requires a path\n";
        return 2;
      }
      referencePath = argv[++i];
    } else if (gridPath.empty() && (arg.empty() || arg[0] != '-')) {
      gridPath = arg;
    } else {
      std::cerr << "Unknown arg: " << arg << "\n";
      return 2;
    }
  }
  if (gridPath.empty()) {
    std::cerr << "univar requires a grid path\n";
    return 2;
  }

  Grid g;
  Error err;
  if (!ReadAsciiGrid(gridPath, g, err)) {
    PrintError(err);
    return 1;
  }
  const std::string text = FormatUnivariateStats(ComputeUnivariateStats(g));
  std::cout << text;

  if (!referencePath.empty()) {
    std::string expected;
    if (!ReadText(referencePath, expected)) {
      PrintError(Error{ErrorCode::Io, "cannot read reference '" + referencePath + "'"});
      return 1;
    }
    std::string diff;
    if (!CompareUnivariateText(expected, text, diff)) {
      std::cerr << "MISMATCH " << diff << "\n";
      return 1;
    }
    std::cerr << "MATCH\n";
  }
  return 0;
}

int CmdRules(int argc, char** argv)
{
  if (argc < 3) {
    std::cerr << "rules requires rule text, a path or --builtin <name>\n";
    return 2;
  }

  const std::string arg = argv[2];
  RuleTable table;
  Error err;

  if (arg == "--builtin") {
    Nomenclature n = Nomenclature::None;
    if (argc < 4 || !ParseNomenclature(argv[3], &n) || n == Nomenclature::None) {
      std::cerr << "--builtin requires corine|iucn|maes\n";
      return 2;
    }
    if (!BuiltinRuleTable(n, table, err)) {
      PrintError(err);
      return 1;
    }
  } else if (!LoadRuleTable(RuleSource::FromConfigString(arg), table, err)) {
    PrintError(err);
    return 1;
  }

  std::cout << "# " << table.size() << " rules\n" << RuleTableToString(table) << "\n";
  return 0;
}

} // namespace

namespace estimap {

int EstimapCliMain(int argc, char** argv)
{
  if (argc < 2) {
    PrintHelp();
    return 2;
  }

  const std::string cmd = argv[1];
  if (cmd == "--help" || cmd == "-h" || cmd == "help") {
    PrintHelp();
    return 0;
  }
  if (cmd == "--version") {
    std::cout << EstimapFullVersionString() << "\n";
    return 0;
  }
  if (cmd == "run") return CmdRun(argc, argv);
  if (cmd == "univar") return CmdUnivar(argc, argv);
  if (cmd == "rules") return CmdRules(argc, argv);

  std::cerr << "Unknown command: " << cmd << "\n";
  PrintHelp();
  return 2;
}

} // namespace estimap
