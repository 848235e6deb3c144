#include <cassert>

#include "mpfloat/float_storage.h"
#include "value_support.h"

namespace value_test {
namespace {

using mpfloat::Float;
using mpfloat::FloatStorage;

void test_storage_create_and_clone() {
  const auto before = FloatStorage::live_count();
  {
    auto storage = FloatStorage::create(80);
    assert(storage->precision() == 80);
    assert(mpfr_nan_p(storage->value));
    assert(FloatStorage::live_count() == before + 1);

    mpfr_set_d(storage->value, 0.1, MPFR_RNDN);
    auto copy = FloatStorage::clone(*storage);
    assert(copy->precision() == 80);
    assert(mpfr_equal_p(copy->value, storage->value));
    assert(FloatStorage::live_count() == before + 2);
  }
  assert(FloatStorage::live_count() == before);
}

void test_storage_rejects_bad_precision() {
  assert(throws_contract_violation([] { (void)FloatStorage::create(mpfloat::precision_min() - 1); }));
  assert(throws_contract_violation([] { (void)Float::with_precision(0); }));
  assert(throws_contract_violation([] { (void)Float::from_double(1.0, -4); }));
}

void test_copies_share_until_written() {
  auto a = Float::from_double(1.0, 64);
  assert(a.storage_is_unique());

  Float b = a;
  assert(!a.storage_is_unique());
  assert(!b.storage_is_unique());

  const auto clones = FloatStorage::clone_count();
  assert(b.to_double() == 1.0);
  assert(b.precision() == 64);
  assert(b == a);
  assert(FloatStorage::clone_count() == clones);

  assert(b.set_double(2.0) == 0);
  assert(FloatStorage::clone_count() == clones + 1);
  assert(a.storage_is_unique());
  assert(b.storage_is_unique());
  assert(a.to_double() == 1.0);
  assert(b.to_double() == 2.0);
  assert(b.precision() == 64);
}

void test_unique_value_mutates_in_place() {
  auto a = Float::from_long(3, 64);
  const auto clones = FloatStorage::clone_count();
  (void)a.set_long(4);
  (void)a.set_string("5");
  a.set_precision(80);
  assert(FloatStorage::clone_count() == clones);
  assert(a.to_long() == 5);
}

void test_live_count_tracks_copies() {
  const auto before = FloatStorage::live_count();
  {
    auto x = Float::with_precision(64);
    Float y = x;
    Float z = y;
    assert(FloatStorage::live_count() == before + 1);
    (void)y.set_long(3);
    assert(FloatStorage::live_count() == before + 2);
    z = y;
    assert(FloatStorage::live_count() == before + 2);
  }
  assert(FloatStorage::live_count() == before);
}

void test_precision_change_leaves_copies_alone() {
  auto a = Float::from_double(2.7, 53);
  const Float b = a;
  a.set_precision(2);
  assert(a.precision() == 2);
  assert(a.to_double() == 3.0);
  assert(b.precision() == 53);
  assert(b.to_double() == 2.7);
  assert(a.storage_is_unique() && b.storage_is_unique());
}

void test_swap() {
  auto a = Float::from_long(1, 32);
  auto b = Float::from_long(2, 96);
  const Float a_copy = a;
  swap(a, b);
  assert(a.to_long() == 2 && a.precision() == 96);
  assert(b.to_long() == 1 && b.precision() == 32);
  assert(a_copy.to_long() == 1);
  assert(a.storage_is_unique() && b.storage_is_unique());

  a.swap(a);
  assert(a.to_long() == 2);
}

}  // namespace

void run_storage_tests() {
  test_storage_create_and_clone();
  test_storage_rejects_bad_precision();
  test_copies_share_until_written();
  test_unique_value_mutates_in_place();
  test_live_count_tracks_copies();
  test_precision_change_leaves_copies_alone();
  test_swap();
}

}  // namespace value_test
