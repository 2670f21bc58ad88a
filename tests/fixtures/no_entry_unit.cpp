// Test unit library without an entry point. Built as
// <test_units>/fixtures/NoEntry.so.

extern "C" __attribute__((visibility("default"))) auto
forklift_fixture_no_entry_marker() -> int {
  return 1;
}
