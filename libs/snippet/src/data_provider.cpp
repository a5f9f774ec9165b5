#include "evoguard/snippet/data_provider.h"

#include <algorithm>
#include <cmath>
#include <kj/debug.h>
#include <random>

namespace evoguard::snippet {

void InMemoryDataProvider::set_column(kj::StringPtr name, kj::Array<double> values) {
  if (columns_.size() == 0) {
    length_ = values.size();
  } else {
    KJ_REQUIRE(values.size() == length_, "column length mismatch", name, values.size(), length_);
  }
  columns_.upsert(kj::str(name), kj::mv(values),
                  [](kj::Array<double>& existing, kj::Array<double>&& replacement) {
                    existing = kj::mv(replacement);
                  });
}

kj::Maybe<kj::ArrayPtr<const double>> InMemoryDataProvider::column(kj::StringPtr name) const {
  KJ_IF_SOME(values, columns_.find(name)) {
    return values.asPtr();
  }
  return kj::none;
}

kj::Array<kj::String> InMemoryDataProvider::column_names() const {
  auto builder = kj::heapArrayBuilder<kj::String>(columns_.size());
  for (auto& entry : columns_) {
    builder.add(kj::str(entry.key));
  }
  return builder.finish();
}

kj::Own<InMemoryDataProvider> make_synthetic_ohlcv(size_t bars, uint64_t seed, double start_price,
                                                   double daily_volatility) {
  KJ_REQUIRE(bars > 0, "need at least one bar");
  KJ_REQUIRE(start_price > 0.0, "start price must be positive", start_price);

  std::mt19937_64 rng(seed);
  std::normal_distribution<double> ret_dist(0.0003, daily_volatility);
  std::uniform_real_distribution<double> range_dist(0.0, daily_volatility);
  std::lognormal_distribution<double> volume_dist(13.0, 0.4);

  auto open = kj::heapArray<double>(bars);
  auto high = kj::heapArray<double>(bars);
  auto low = kj::heapArray<double>(bars);
  auto close = kj::heapArray<double>(bars);
  auto volume = kj::heapArray<double>(bars);

  double prev_close = start_price;
  for (size_t i = 0; i < bars; ++i) {
    double o = prev_close * (1.0 + ret_dist(rng) * 0.25);
    double c = prev_close * std::exp(ret_dist(rng));
    double h = std::max(o, c) * (1.0 + range_dist(rng));
    double l = std::min(o, c) * (1.0 - range_dist(rng));
    open[i] = o;
    high[i] = h;
    low[i] = l;
    close[i] = c;
    volume[i] = std::floor(volume_dist(rng));
    prev_close = c;
  }

  auto provider = kj::heap<InMemoryDataProvider>();
  provider->set_column("open"_kj, kj::mv(open));
  provider->set_column("high"_kj, kj::mv(high));
  provider->set_column("low"_kj, kj::mv(low));
  provider->set_column("close"_kj, kj::mv(close));
  provider->set_column("volume"_kj, kj::mv(volume));
  return provider;
}

} // namespace evoguard::snippet
