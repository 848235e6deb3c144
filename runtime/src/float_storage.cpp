#include "mpfloat/float_storage.h"

#include <atomic>
#include <cstdio>
#include <string>

#include "mpfloat/defaults.h"
#include "mpfloat/env_config.h"
#include "mpfloat/errors.h"

namespace mpfloat {

namespace {

std::atomic<std::size_t> g_live_storage{0};
std::atomic<std::size_t> g_clone_total{0};

void trace_storage(const char* event, const FloatStorage& storage) {
  if (!storage_trace_enabled()) {
    return;
  }
  std::fprintf(stderr, "[mpfloat-storage] %s %p prec=%ld live=%zu clones=%zu\n", event,
               static_cast<const void*>(&storage), storage.precision(),
               g_live_storage.load(std::memory_order_relaxed),
               g_clone_total.load(std::memory_order_relaxed));
}

}  // namespace

long precision_min() {
  return static_cast<long>(MPFR_PREC_MIN);
}

long precision_max() {
  return static_cast<long>(MPFR_PREC_MAX);
}

void check_precision(long precision) {
  if (precision < precision_min() || precision > precision_max()) {
    throw ContractViolation("precision " + std::to_string(precision) + " outside [" +
                            std::to_string(precision_min()) + ", " + std::to_string(precision_max()) +
                            "]");
  }
}

mpfr_rnd_t engine_rounding(RoundingMode mode) {
  return static_cast<mpfr_rnd_t>(rounding_mode_to_engine(mode));
}

FloatStorage::FloatStorage(long precision) {
  check_precision(precision);
  mpfr_init2(value, static_cast<mpfr_prec_t>(precision));
  g_live_storage.fetch_add(1, std::memory_order_relaxed);
}

FloatStorage::~FloatStorage() {
  g_live_storage.fetch_sub(1, std::memory_order_relaxed);
  trace_storage("release", *this);
  mpfr_clear(value);
}

std::shared_ptr<FloatStorage> FloatStorage::create(long precision) {
  auto storage = std::make_shared<FloatStorage>(precision);
  trace_storage("create", *storage);
  return storage;
}

std::shared_ptr<FloatStorage> FloatStorage::clone(const FloatStorage& source) {
  auto storage = std::make_shared<FloatStorage>(source.precision());
  // Same precision on both sides, so the copy is exact.
  mpfr_set(storage->value, source.value, MPFR_RNDN);
  g_clone_total.fetch_add(1, std::memory_order_relaxed);
  trace_storage("clone", *storage);
  return storage;
}

long FloatStorage::precision() const {
  return static_cast<long>(mpfr_get_prec(value));
}

void FloatStorage::set_precision(long precision) {
  check_precision(precision);
  mpfr_prec_round(value, static_cast<mpfr_prec_t>(precision), engine_rounding(Defaults::rounding_mode()));
  trace_storage("reprecision", *this);
}

std::size_t FloatStorage::live_count() {
  return g_live_storage.load(std::memory_order_relaxed);
}

std::size_t FloatStorage::clone_count() {
  return g_clone_total.load(std::memory_order_relaxed);
}

}  // namespace mpfloat
