/***
 * Name: test_memory_variable_storage
 * Purpose: Verify the in-memory variable store and its sharing across holders.
 */
#include <gtest/gtest.h>
#include <memory>
#include "runtime/MemoryVariableStorage.h"

using namespace spindle;

TEST(MemoryVariableStorage, SetGetClear) {
  rt::MemoryVariableStorage store;
  EXPECT_FALSE(store.get("$gold").has_value());
  store.set("$gold", rt::Value::Number(10.0));
  ASSERT_TRUE(store.get("$gold").has_value());
  EXPECT_EQ(*store.get("$gold"), rt::Value::Number(10.0));
  EXPECT_TRUE(store.contains("$gold"));
  store.set("$gold", rt::Value::String("lots"));
  EXPECT_EQ(*store.get("$gold"), rt::Value::String("lots"));
  store.clear();
  EXPECT_FALSE(store.contains("$gold"));
}

TEST(MemoryVariableStorage, SharedHandleSeesWrites) {
  auto store = std::make_shared<rt::MemoryVariableStorage>();
  std::shared_ptr<const rt::VariableStorage> reader = store;
  store->set("$name", rt::Value::String("Ada"));
  EXPECT_EQ(*reader->get("$name"), rt::Value::String("Ada"));
}
