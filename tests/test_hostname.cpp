#include "minitest.hpp"
#include "app/HostnameGen.hpp"
#include <string>

using dockhand::app::generate_hostname;
using dockhand::app::kMaxHostnameLength;
using dockhand::app::sanitize_hostname;

static bool only_allowed(const std::string& s) {
  for (char c : s) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-';
    if (!ok) return false;
  }
  return true;
}

TEST(hostname_from_fqdn_and_task_id) {
  ASSERT_EQ(generate_hostname("hostA.example.com", "marathon.myapp.abc123"), "hostA-abc123");
}

TEST(hostname_without_dots) {
  ASSERT_EQ(generate_hostname("box", "task42"), "box-task42");
}

TEST(hostname_sanitize_collapses_runs) {
  ASSERT_EQ(sanitize_hostname("a__b..c"), "a-b-c");
  ASSERT_EQ(sanitize_hostname("a_-b"), "a--b");
  ASSERT_EQ(sanitize_hostname("ok-Name-9"), "ok-Name-9");
}

TEST(hostname_long_task_segment_truncated) {
  std::string task = "chronos.job." + std::string(70, 'x');
  auto h = generate_hostname("my_host.example.com", task);
  ASSERT_EQ(h.size(), kMaxHostnameLength);
  ASSERT_TRUE(only_allowed(h));
  ASSERT_EQ(h.substr(0, 8), "my-host-");
}

TEST(hostname_disallowed_chars_after_first_label) {
  std::string task = "svc." + std::string(35, 'a') + "_" + std::string(34, 'b');
  auto h = generate_hostname("node7.dc_1.example.com", task);
  ASSERT_EQ(h.size(), 63u);
  ASSERT_TRUE(only_allowed(h));
}

TEST(hostname_sanitize_idempotent) {
  const char* samples[] = {"", "plain", "we!rd##name", "__", "x.y.z", "a b\tc",
                           "0123456789012345678901234567890123456789012345678901234567890123456789"};
  for (const char* s : samples) {
    auto once = sanitize_hostname(s);
    ASSERT_EQ(sanitize_hostname(once), once);
    ASSERT_TRUE(once.size() <= kMaxHostnameLength);
    ASSERT_TRUE(only_allowed(once));
  }
}
