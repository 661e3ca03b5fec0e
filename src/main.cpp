// main.cpp
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "engine.h"
#include "errors.h"
#include "instance_io.h"
#include "json_io.h"
#include "model.h"
#include "solution.h"

using json = nlohmann::json;

// ---------------- Minimal CLI ----------------
struct Flags {
  std::string instance_path;      // required
  std::string config_path;        // optional
  std::string export_name;        // optional, overrides EXPORT_MODEL
  std::string result_name;        // optional, overrides RESULT_OUT
  bool dry_run = false;           // print the request, do not call the engine
  bool verbose = true;            // flipped by --quiet
};

static void print_usage() {
  std::cout <<
R"(Usage:
  vrpeasy_cli --instance model.json [--config config.json] [--export NAME] [--result NAME] [--dry-run] [--quiet]

Required:
  --instance PATH     Request-shaped model document (compact or exported form)

Optional:
  --config PATH       Engine/CLI settings (LIBRARY_ROOT, LIBRARY_NAME, RELAUNCH_FOR_LOADER_PATH,
                      LOG_LOADING, RESULT_OUT, EXPORT_MODEL, PARAMETERS)
  --export NAME       Write the full model to NAME.json
  --result NAME       Write the engine response to NAME.json
  --dry-run           Print the request document and stop
  --quiet             Less logging
  --help
)";
}

static Flags parse_flags(int argc, char** argv) {
  Flags f;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    auto need = [&](const char* name) {
      if (i + 1 >= argc) { std::cerr << "Missing value for " << name << "\n"; std::exit(2); }
      return std::string(argv[++i]);
    };
    if (a == "--help" || a == "-h") { print_usage(); std::exit(0); }
    else if (a == "--instance") f.instance_path = need("--instance");
    else if (a == "--config")   f.config_path = need("--config");
    else if (a == "--export")   f.export_name = need("--export");
    else if (a == "--result")   f.result_name = need("--result");
    else if (a == "--dry-run")  f.dry_run = true;
    else if (a == "--quiet")    f.verbose = false;
    else { std::cerr << "Unknown flag: " << a << "\n"; print_usage(); std::exit(2); }
  }
  if (f.instance_path.empty()) {
    std::cerr << "Missing required --instance.\n"; print_usage(); std::exit(2);
  }
  return f;
}

// ---------------- Config helpers ----------------
struct Cfg {
  vrpeasy::EngineOptions engine;
  std::string result_out;
  std::string export_model;
  json parameters;                // overrides applied on top of the instance
};

static Cfg parse_config(const json& j) {
  Cfg c;
  c.engine.library_root             = j.value("LIBRARY_ROOT", std::string());
  c.engine.library_name             = j.value("LIBRARY_NAME", std::string());
  c.engine.relaunch_for_loader_path = j.value("RELAUNCH_FOR_LOADER_PATH", false);
  c.engine.log_loading              = j.value("LOG_LOADING", false);
  c.result_out                      = j.value("RESULT_OUT", std::string());
  c.export_model                    = j.value("EXPORT_MODEL", std::string());
  c.parameters                      = j.value("PARAMETERS", json::object());
  return c;
}

static void print_solution(const vrpeasy::Solution& s) {
  std::cout << "[cli] status " << s.status() << ": " << s.message() << "\n";
  if (!s.statistics().empty()) {
    const auto& st = s.statistics();
    std::cout << std::fixed << std::setprecision(2)
              << "[cli] value=" << st.solution_value()
              << " time=" << st.solution_time() << "s"
              << " bestLB=" << st.best_lb()
              << " rootLB=" << st.root_lb()
              << " rootTime=" << st.root_time() << "s"
              << " nodes=" << st.nb_branch_and_bound_nodes() << "\n";
  }
  for (const auto& r : s.routes()) {
    std::cout << "[cli] vehicle type " << r.vehicle_type_id() << " cost " << r.route_cost() << ":";
    for (size_t i = 0; i < r.size(); ++i) std::cout << " " << r.point_ids()[i];
    std::cout << "\n";
  }
}

// ---------------- Main ----------------
int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);
  const Flags flags = parse_flags(argc, argv);

  Cfg cfg;
  if (!flags.config_path.empty()) {
    try { cfg = parse_config(vrpeasy::load_json(flags.config_path)); }
    catch (const std::exception& e) { std::cerr << "Failed to load config: " << e.what() << "\n"; return 1; }
  }
  if (!flags.export_name.empty()) cfg.export_model = flags.export_name;
  if (!flags.result_name.empty()) cfg.result_out = flags.result_name;

  // May re-exec on Linux; nothing has been built yet.
  if (!flags.dry_run) {
    try { vrpeasy::prepare_engine_environment(cfg.engine); }
    catch (const std::exception& e) { std::cerr << "Engine environment: " << e.what() << "\n"; return 3; }
  }

  vrpeasy::Model model;
  try {
    model = vrpeasy::load_model_file(flags.instance_path);
    if (!cfg.parameters.empty()) vrpeasy::apply_parameters(cfg.parameters, model.parameters());
  } catch (const std::exception& e) {
    std::cerr << "Failed to load instance: " << e.what() << "\n"; return 1;
  }

  if (flags.verbose) {
    std::cout << "[cli] instance " << flags.instance_path
              << ": vehicle types=" << model.vehicle_types().size()
              << " points=" << model.points().size()
              << " links=" << model.links().size() << "\n";
  }

  std::string request;
  try { request = model.to_string(); }
  catch (const std::exception& e) { std::cerr << "Invalid model: " << e.what() << "\n"; return 1; }

  if (!cfg.export_model.empty()) {
    try { model.export_to(cfg.export_model); }
    catch (const std::exception& e) { std::cerr << e.what() << "\n"; return 4; }
    if (flags.verbose) std::cout << "[cli] model written to " << cfg.export_model << ".json\n";
  }

  if (flags.dry_run) {
    std::cout << request << "\n";
    return 0;
  }

  try { model.solve(cfg.engine); }
  catch (const std::exception& e) { std::cerr << "Solve failed: " << e.what() << "\n"; return 3; }

  if (flags.verbose) print_solution(model.solution());

  if (!cfg.result_out.empty()) {
    try { model.solution().export_to(cfg.result_out); }
    catch (const std::exception& e) { std::cerr << e.what() << "\n"; return 4; }
    if (flags.verbose) std::cout << "[cli] solution written to " << cfg.result_out << ".json\n";
  }
  return 0;
}
