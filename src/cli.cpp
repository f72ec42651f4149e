#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "agentreplay/config.hpp"
#include "agentreplay/diff.hpp"
#include "agentreplay/export.hpp"
#include "agentreplay/jsonlite.hpp"
#include "agentreplay/observability.hpp"
#include "agentreplay/replay.hpp"
#include "agentreplay/trace.hpp"
#include "agentreplay/version.hpp"
#include "agentreplay/viewer.hpp"

// Exit codes:
//   0: success (diff: no critical divergence)
//   1: diff found at least one critical divergence
//   2: usage error, missing file, malformed trace, write failure

namespace {

constexpr int kExitOk = 0;
constexpr int kExitCritical = 1;
constexpr int kExitError = 2;

const char* kUsage =
    "usage: agentreplay [--stats] [--event-log PATH] [--preview N] <command> ...\n"
    "\n"
    "commands:\n"
    "  show FILE [--tree]                     display a trace\n"
    "  replay FILE                            step through a trace interactively\n"
    "  diff A B [--json]                      compare two traces\n"
    "  export FILE [-o OUT] [--format json|html]\n"
    "  info FILE                              summary, digest and fingerprint\n"
    "  version                                version manifest\n";

int usage(const std::string& message = "") {
  if (!message.empty()) {
    std::cerr << "{\"error\":\"usage\",\"message\":\"" << agentreplay::jsonlite::escape(message)
              << "\"}\n";
  }
  std::cerr << kUsage;
  return kExitError;
}

int report(const agentreplay::TraceError& err) {
  std::cerr << "{\"error\":\"" << agentreplay::to_string(err.code) << "\",\"message\":\""
            << agentreplay::jsonlite::escape(err.message) << "\"}\n";
  return kExitError;
}

int cmd_show(const std::vector<std::string>& args) {
  std::string file;
  bool tree = false;
  for (const auto& a : args) {
    if (a == "--tree") tree = true;
    else if (file.empty()) file = a;
    else return usage("show takes one FILE");
  }
  if (file.empty()) return usage("show requires FILE");

  agentreplay::TraceError err;
  auto trace = agentreplay::Trace::load(file, &err);
  if (!trace) return report(err);
  std::cout << (tree ? agentreplay::render_tree(*trace) : agentreplay::render_trace(*trace));
  return kExitOk;
}

void print_matches(const agentreplay::Replayer& r, const std::vector<std::size_t>& hits) {
  if (hits.empty()) {
    std::cout << "no matches\n";
    return;
  }
  for (std::size_t i : hits) {
    const auto s = r.at(i);
    std::cout << "  [" << (i + 1) << "] " << s->span->name() << "  "
              << agentreplay::to_string(s->event->event_type) << "\n";
  }
}

int cmd_replay(const std::vector<std::string>& args) {
  if (args.size() != 1) return usage("replay requires exactly one FILE");

  agentreplay::TraceError err;
  auto replayer = agentreplay::Replayer::from_file(args[0], &err);
  if (!replayer) return report(err);
  auto& r = *replayer;

  std::cout << "Replay: " << r.trace().name() << "\n"
            << r.total_steps()
            << " events. Commands: (n)ext, (p)rev, (j)ump N, (s)earch TEXT, (c)urrent span, "
               "(r)eset, (q)uit\n\n";

  std::string line;
  while (true) {
    std::cout << agentreplay::render_step(r) << "> " << std::flush;
    if (!std::getline(std::cin, line)) break;

    const auto first = line.find_first_not_of(" \t");
    const std::string cmd = first == std::string::npos ? "" : line.substr(first);
    const std::string verb = cmd.substr(0, cmd.find(' '));
    const std::string rest =
        cmd.find(' ') == std::string::npos ? "" : cmd.substr(cmd.find(' ') + 1);

    if (verb == "q" || verb == "quit" || verb == "exit") {
      break;
    } else if (verb.empty() || verb == "n" || verb == "next") {
      r.step();
    } else if (verb == "p" || verb == "prev" || verb == "back") {
      r.step_back();
    } else if (verb == "j" || verb == "jump") {
      char* end = nullptr;
      const long n = std::strtol(rest.c_str(), &end, 10);
      if (rest.empty() || !end || *end != '\0' || n < 1) {
        std::cout << "Usage: j <position>\n";
        continue;
      }
      agentreplay::TraceError jerr;
      if (!r.jump(static_cast<std::size_t>(n - 1), &jerr)) std::cout << jerr.message << "\n";
    } else if (verb == "s" || verb == "search") {
      if (rest.empty()) {
        std::cout << "Usage: s <text>\n";
        continue;
      }
      print_matches(r, r.search(rest));
    } else if (verb == "c" || verb == "current") {
      for (const auto& s : r.current_span_events()) {
        std::cout << "  [" << (s.index + 1) << "] " << agentreplay::to_string(s.event->event_type)
                  << "  " << agentreplay::event_preview(*s.event, agentreplay::global_config().preview_chars)
                  << "\n";
      }
    } else if (verb == "r" || verb == "reset") {
      r.reset();
    } else {
      std::cout << "Unknown command\n";
    }
  }
  return kExitOk;
}

int cmd_diff(const std::vector<std::string>& args) {
  std::vector<std::string> files;
  bool as_json = false;
  for (const auto& a : args) {
    if (a == "--json") as_json = true;
    else files.push_back(a);
  }
  if (files.size() != 2) return usage("diff requires two files");

  agentreplay::TraceError err;
  auto a = agentreplay::Trace::load(files[0], &err);
  if (!a) return report(err);
  auto b = agentreplay::Trace::load(files[1], &err);
  if (!b) return report(err);

  const auto result = agentreplay::diff_traces(*a, *b);
  if (as_json) {
    std::cout << agentreplay::jsonlite::to_json_pretty(result.to_json(), 2) << "\n";
  } else {
    std::cout << agentreplay::render_diff(result);
  }
  return result.critical_count() > 0 ? kExitCritical : kExitOk;
}

int cmd_export(const std::vector<std::string>& args) {
  std::string file, out, format = "json";
  for (std::size_t i = 0; i < args.size(); ++i) {
    if ((args[i] == "-o" || args[i] == "--output") && i + 1 < args.size()) {
      out = args[++i];
    } else if (args[i] == "--format" && i + 1 < args.size()) {
      format = args[++i];
    } else if (file.empty()) {
      file = args[i];
    } else {
      return usage("export takes one FILE");
    }
  }
  if (file.empty()) return usage("export requires FILE");
  if (format != "json" && format != "html") return usage("--format must be json or html");
  if (out.empty()) out = std::filesystem::path(file).replace_extension("." + format).string();

  agentreplay::TraceError err;
  auto trace = agentreplay::Trace::load(file, &err);
  if (!trace) return report(err);
  const bool ok = format == "json" ? agentreplay::export_json(*trace, out, &err)
                                   : agentreplay::export_html(*trace, out, &err);
  if (!ok) return report(err);
  std::cout << "Exported to " << out << "\n";
  return kExitOk;
}

int cmd_info(const std::vector<std::string>& args) {
  if (args.size() != 1) return usage("info requires exactly one FILE");

  agentreplay::TraceError err;
  auto trace = agentreplay::Trace::load(args[0], &err);
  if (!trace) return report(err);

  char duration[48] = "N/A";
  if (trace->duration()) std::snprintf(duration, sizeof(duration), "%.3fs", *trace->duration());

  const agentreplay::Replayer replayer(*trace);
  std::cout << trace->name() << " (" << trace->trace_id() << ")\n"
            << "  Spans:       " << trace->spans().size() << "\n"
            << "  Events:      " << trace->event_count() << "\n"
            << "  Duration:    " << duration << "\n"
            << "  Metadata:    " << agentreplay::jsonlite::to_json(trace->metadata()) << "\n"
            << "  Digest:      " << agentreplay::trace_digest(*trace) << "\n"
            << "  Fingerprint: " << replayer.fingerprint() << "\n";
  return kExitOk;
}

}  // namespace

int main(int argc, char** argv) {
  agentreplay::Config config = agentreplay::load_config();
  bool print_stats = false;
  std::string cmd;
  std::vector<std::string> args;

  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (cmd.empty() && a == "--stats") {
      print_stats = true;
    } else if (cmd.empty() && a == "--event-log" && i + 1 < argc) {
      config.event_log_path = argv[++i];
    } else if (cmd.empty() && a == "--preview" && i + 1 < argc) {
      const long n = std::strtol(argv[++i], nullptr, 10);
      if (n <= 0) return usage("--preview must be positive");
      config.preview_chars = static_cast<std::size_t>(n);
    } else if (cmd.empty() && (a == "-h" || a == "--help")) {
      std::cout << kUsage;
      return kExitOk;
    } else if (cmd.empty()) {
      cmd = a;
    } else {
      args.push_back(a);
    }
  }
  agentreplay::set_global_config(config);

  int rc = kExitError;
  if (cmd.empty()) {
    rc = usage();
  } else if (cmd == "show") {
    rc = cmd_show(args);
  } else if (cmd == "replay") {
    rc = cmd_replay(args);
  } else if (cmd == "diff") {
    rc = cmd_diff(args);
  } else if (cmd == "export") {
    rc = cmd_export(args);
  } else if (cmd == "info") {
    rc = cmd_info(args);
  } else if (cmd == "version") {
    std::cout << agentreplay::version::manifest_to_json(agentreplay::version::current_manifest())
              << "\n";
    rc = kExitOk;
  } else {
    rc = usage("unknown command: " + cmd);
  }

  if (print_stats) std::cerr << agentreplay::global_engine_stats().to_json() << "\n";
  return rc;
}
