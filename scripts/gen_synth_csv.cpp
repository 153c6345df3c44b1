#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <random>
#include <fstream>
#include <iostream>

// Synthetic profiler input: one column per logical type, with missing cells.
int main(int argc, char** argv){
  if (argc < 4){
    std::cerr << "usage: gen_synth_csv <out.csv> <rows> <quoted:0|1> [missing_pct=5]\n";
    return 2;
  }
  const std::string out = argv[1];
  const std::uint64_t rows = std::strtoull(argv[2], nullptr, 10);
  const bool quoted = std::string(argv[3]) == "1";
  const int missing_pct = argc > 4 ? std::atoi(argv[4]) : 5;

  std::ofstream f(out, std::ios::binary);
  if (!f){ std::cerr << "open failed: " << out << "\n"; return 2; }

  // header
  f << "id,int_col,float_col,bool_col,date_col,str_col\n";

  std::mt19937_64 rng(42);
  std::uniform_int_distribution<long long> di(-100000, 100000);
  std::normal_distribution<double> dn(50.0, 12.5);
  std::uniform_int_distribution<int> pct(0, 99);
  // skewed categories so top_values has a clear ranking
  std::discrete_distribution<int> dw({40, 25, 15, 10, 5, 3, 2});
  const char* words[] = {"alpha","bravo","charlie","delta","echo","foxtrot","golf"};

  auto maybe_missing = [&](const std::string& x) -> std::string {
    if (pct(rng) < missing_pct) return (pct(rng) % 2) ? "" : "NA";
    return x;
  };

  for (std::uint64_t i=1;i<=rows;++i){
    long long iv = di(rng);
    double fv = dn(rng);
    bool bv = (i % 3) == 0;
    int y = 2023 + int(i % 3), m = 1 + int(i % 12), d = 1 + int(i % 28);
    char datebuf[32];
    std::snprintf(datebuf, sizeof(datebuf), "%04d-%02d-%02d", y, m, d);
    std::string s = words[dw(rng)];

    auto emit = [&](const std::string& x){
      if (!quoted) { f << x; return; }
      f << '"';
      for (char c: x){ if (c=='"') f << "\"\""; else f << c; }
      f << '"';
    };

    emit(std::to_string(i)); f << ",";
    emit(maybe_missing(std::to_string(iv))); f << ",";
    emit(maybe_missing(std::to_string(fv))); f << ",";
    emit(maybe_missing(bv ? "true" : "false")); f << ",";
    emit(maybe_missing(datebuf)); f << ",";
    // embedded delimiters/quotes/newlines only make sense in quoted mode
    if (quoted && (i % 17 == 0)) s += ", said \"hi\"";
    if (quoted && (i % 101 == 0)) s += "\nsecond line";
    emit(maybe_missing(s));
    f << "\n";
  }
  std::cerr << "wrote " << rows << " rows to " << out << "\n";
  return 0;
}
