#include "testutil.hpp"

#include "checksum.hpp"

#include <unity.h>
#include <cstring>

using namespace byteframe;

void setUp() {}

void tearDown() {}

static uint32_t fnv_str(const char *s) {
  return fnv1a32(reinterpret_cast<const uint8_t *>(s), std::strlen(s));
}

void test_empty_is_offset_basis() {
  TEST_ASSERT_EQUAL_HEX32(kFnvOffsetBasis, fnv1a32(nullptr, 0));
  TEST_ASSERT_EQUAL_HEX32(0x811C9DC5u, fnv_str(""));
}

void test_known_vectors() {
  TEST_ASSERT_EQUAL_HEX32(0xE40C292Cu, fnv_str("a"));
  TEST_ASSERT_EQUAL_HEX32(0x4F9F2CABu, fnv_str("hello"));
  TEST_ASSERT_EQUAL_HEX32(0xAFD071E5u, fnv_str("test"));
}

void test_order_dependent() {
  TEST_ASSERT_TRUE(fnv_str("ab") != fnv_str("ba"));
  TEST_ASSERT_TRUE(fnv_str("hello") != fnv_str("hellp"));
}

void test_zero_bytes_change_hash() {
  const uint8_t zeros[32] = {0};
  TEST_ASSERT_EQUAL_HEX32(0x0B2AE445u, fnv1a32(zeros, sizeof(zeros)));
  TEST_ASSERT_TRUE(fnv1a32(zeros, 1) != fnv1a32(zeros, 2));
}

int main(void) {
  UNITY_BEGIN();

  setup_test_environment();

  RUN_TEST(test_empty_is_offset_basis);
  RUN_TEST(test_known_vectors);
  RUN_TEST(test_order_dependent);
  RUN_TEST(test_zero_bytes_change_hash);

  return UNITY_END();
}
