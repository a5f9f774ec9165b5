#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/string.h>

namespace evoguard::snippet {

/**
 * @brief Read-only source of named, equally long price columns
 *
 * Snippets reach it through `data.get('close')` or `data['close']`; it is
 * the only way executed code can see market data.
 */
class DataProvider {
public:
  virtual ~DataProvider() noexcept(false) = default;

  [[nodiscard]] virtual kj::Maybe<kj::ArrayPtr<const double>> column(kj::StringPtr name) const = 0;
  [[nodiscard]] virtual kj::Array<kj::String> column_names() const = 0;
  [[nodiscard]] virtual size_t length() const = 0;
};

class InMemoryDataProvider final : public DataProvider {
public:
  InMemoryDataProvider() = default;
  ~InMemoryDataProvider() noexcept(false) override = default;

  /// All columns must have the same length as the first one added
  void set_column(kj::StringPtr name, kj::Array<double> values);

  [[nodiscard]] kj::Maybe<kj::ArrayPtr<const double>> column(kj::StringPtr name) const override;
  [[nodiscard]] kj::Array<kj::String> column_names() const override;
  [[nodiscard]] size_t length() const override {
    return length_;
  }

private:
  kj::TreeMap<kj::String, kj::Array<double>> columns_;
  size_t length_ = 0;
};

/**
 * @brief Geometric random walk with open/high/low/close/volume columns
 *
 * Deterministic for a given seed.
 */
[[nodiscard]] kj::Own<InMemoryDataProvider> make_synthetic_ohlcv(size_t bars, uint64_t seed,
                                                                 double start_price = 100.0,
                                                                 double daily_volatility = 0.02);

} // namespace evoguard::snippet
