#include <benchmark/benchmark.h>
#include <lexplain/explain/neighborhood.hpp>
#include <lexplain/explain/text_explainer.hpp>
#include <lexplain/kernels/distance.hpp>
#include <lexplain/text/indexed_document.hpp>

#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

using namespace lexplain;

static std::string make_text(std::size_t words){
  static const char* vocab[] = {"the","movie","was","good","bad","plot","acting","slow","great","ending",
                                "cast","music","long","funny","dull","script","scene","love","hate","fine"};
  std::mt19937_64 rng(7);
  std::string s;
  for (std::size_t i=0;i<words;++i){
    if (i) s += (i % 9 == 0) ? ". " : " ";
    s += vocab[rng() % 20];
    if (i % 5 == 0) s += std::to_string(i);
  }
  return s;
}

static explain::ProbabilityMatrix fake_predict(const std::vector<std::string>& docs){
  explain::ProbabilityMatrix out;
  out.reserve(docs.size());
  for (const auto& d : docs){
    const double p = static_cast<double>(d.size() % 97) / 97.0;
    out.push_back({1.0 - p, p});
  }
  return out;
}

static void BenchIndexDocument(benchmark::State& state){
  const auto text = make_text(static_cast<std::size_t>(state.range(0)));
  for (auto _ : state) {
    text::IndexedDocument doc(text);
    benchmark::DoNotOptimize(doc.num_features());
  }
}
BENCHMARK(BenchIndexDocument)->Arg(64)->Arg(512)->Arg(4096);

static void BenchRemoveHalf(benchmark::State& state){
  text::IndexedDocument doc(make_text(static_cast<std::size_t>(state.range(0))));
  std::vector<text::feature_id> ids;
  for (text::feature_id i=0;i<doc.num_features();i+=2) ids.push_back(i);
  for (auto _ : state) {
    auto out = doc.remove(ids);
    benchmark::DoNotOptimize(out);
  }
}
BENCHMARK(BenchRemoveHalf)->Arg(64)->Arg(512)->Arg(4096);

static void BenchDistancesToFirstRow(benchmark::State& state){
  const std::size_t rows = 5000, cols = static_cast<std::size_t>(state.range(0));
  std::vector<float> data(rows * cols, 1.0f);
  std::mt19937_64 rng(3);
  for (std::size_t i=cols;i<data.size();++i) data[i] = (rng() & 1) ? 1.0f : 0.0f;
  for (auto _ : state) {
    benchmark::DoNotOptimize(kernels::distances_to_first_row(data, rows, cols));
  }
}
BENCHMARK(BenchDistancesToFirstRow)->Arg(32)->Arg(256);

static void BenchSampleNeighborhood(benchmark::State& state){
  text::IndexedDocument doc(make_text(128));
  std::mt19937_64 rng(11);
  const explain::PredictFn predict = fake_predict;
  for (auto _ : state) {
    auto nb = explain::sample_neighborhood(doc, predict, static_cast<std::size_t>(state.range(0)), rng);
    benchmark::DoNotOptimize(nb);
  }
}
BENCHMARK(BenchSampleNeighborhood)->Arg(500)->Arg(5000);

static void BenchExplainInstance(benchmark::State& state){
  const auto text = make_text(64);
  explain::ExplainerConfig config;
  config.feature_selection = state.range(0) == 0 ? explain::FeatureSelection::highest_weights
                                                 : explain::FeatureSelection::forward_selection;
  auto explainer = explain::TextExplainer::create(config).value();
  explain::ExplainOptions options;
  options.num_features = 6;
  options.num_samples = 2000;
  std::mt19937_64 rng(13);
  for (auto _ : state) {
    auto exp = explainer.explain_instance(text, fake_predict, options, rng);
    benchmark::DoNotOptimize(exp);
  }
}
BENCHMARK(BenchExplainInstance)->Arg(0)->Arg(1)->Unit(benchmark::kMillisecond);

BENCHMARK_MAIN();
