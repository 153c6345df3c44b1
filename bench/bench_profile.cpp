#include "metrics/timers.hpp"
#include "io/input_file.hpp"
#include "csv/csv_reader.hpp"
#include "profile/profiler.hpp"
#include "report/emit_profile_json.hpp"
#include <fmt/format.h>
#include <string>
#include <string_view>
#include <filesystem>
#include <exception>

using std::string;

int main(int argc, char** argv) try {
  // Defaults
  string dataPath;
  unsigned threads = 1;
  int repeats = 3;

  // Supported:
  //   --data <file>  | --data=<file>
  //   --threads <N>  | --threads=<N>
  //   --repeat <N>   | --repeat=<N>
  // Fallback positional: <input.csv>
  for (int i=1;i<argc;++i){
    std::string_view a(argv[i]);

    auto eat_next = [&](std::string_view name, string* out)->bool{
      if (i+1<argc){ *out = argv[++i]; return true; }
      fmt::print(stderr, "missing value for {}\n", name);
      return false;
    };

    string v;
    if (a.rfind("--data=",0)==0) {
      dataPath = string(a.substr(7));
    } else if (a == "--data") {
      if (!eat_next("--data", &dataPath)) return 2;
    } else if (a.rfind("--threads=",0)==0) {
      threads = static_cast<unsigned>(std::stoul(string(a.substr(10))));
    } else if (a == "--threads") {
      if (!eat_next("--threads", &v)) return 2;
      threads = static_cast<unsigned>(std::stoul(v));
    } else if (a.rfind("--repeat=",0)==0) {
      repeats = std::stoi(string(a.substr(9)));
    } else if (a == "--repeat") {
      if (!eat_next("--repeat", &v)) return 2;
      repeats = std::stoi(v);
    } else if (dataPath.empty() && !a.empty() && a[0] != '-') {
      dataPath = string(a);
    } else {
      fmt::print(stderr, "ignoring unknown argument {}\n", a);
    }
  }

  if (dataPath.empty() || repeats < 1){
    fmt::print(stderr,
      "usage:\n"
      "  bprof_bench <input.csv>\n"
      "  bprof_bench --data <input.csv> [--threads N] [--repeat N]\n");
    return 2;
  }

  const auto bytes = bprof::file_size_bytes(dataPath);

  bprof::WallTimer wt_load; wt_load.start();
  const bprof::table t = bprof::read_csv(dataPath);
  wt_load.stop();

  bprof::profile_options opt;
  opt.threads = threads;

  double best_ms = 0.0;
  std::size_t json_bytes = 0;
  for (int r = 0; r < repeats; ++r) {
    bprof::WallTimer wt; wt.start();
    const auto p = bprof::profile(t, opt);
    wt.stop();
    json_bytes = bprof::profile_to_json(p).size();
    if (r == 0 || wt.ms() < best_ms) best_ms = wt.ms();
  }

  const double mb   = double(bytes)/(1024.0*1024.0);
  const double load_mbps = wt_load.ms()>0? (mb/(wt_load.ms()/1000.0)) : 0.0;
  const double cells = double(t.row_count()) * double(t.column_count());
  const double cps  = best_ms>0? (cells/(best_ms/1000.0)) : 0.0;

  fmt::print("bench_profile,file={},rows={},cols={},bytes={},threads={},load_ms={:.3f},load_MB/s={:.2f},"
             "profile_ms={:.3f},cells/s={:.0f},json_bytes={}\n",
             dataPath, t.row_count(), t.column_count(), bytes, threads,
             wt_load.ms(), load_mbps, best_ms, cps, json_bytes);
  return 0;
}
catch (const std::exception& e) {
  fmt::print(stderr, "ERROR: {}\n", e.what());
  return 4;
}
