#include "minitest.hpp"
#include "app/ArgScanner.hpp"
#include <string>
#include <vector>

using dockhand::app::already_has_hostname;
using dockhand::app::find_run;
using dockhand::app::has_flag;
using dockhand::app::parse_env_args;

TEST(env_args_separate_value) {
  auto env = parse_env_args({"docker", "run", "-e", "MESOS_TASK_ID=app.abc", "busybox"});
  ASSERT_EQ(env.size(), 1u);
  ASSERT_EQ(env["MESOS_TASK_ID"], "app.abc");
}

TEST(env_args_long_and_inline_forms) {
  auto env = parse_env_args({"run", "--env=A=1", "--env", "B=2", "-e=C=3", "-te", "D=4"});
  ASSERT_EQ(env["A"], "1");
  ASSERT_EQ(env["B"], "2");
  ASSERT_EQ(env["C"], "3");
  ASSERT_EQ(env["D"], "4");
}

TEST(env_args_value_keeps_extra_equals) {
  auto env = parse_env_args({"run", "-e", "OPTS=a=b=c"});
  ASSERT_EQ(env["OPTS"], "a=b=c");
}

TEST(env_args_last_occurrence_wins) {
  auto env = parse_env_args({"run", "-e", "K=first", "--env=K=second"});
  ASSERT_EQ(env["K"], "second");
}

TEST(env_args_value_without_equals_ignored) {
  auto env = parse_env_args({"run", "-e", "NOVALUE", "-e", "K=v"});
  ASSERT_EQ(env.size(), 1u);
  ASSERT_EQ(env["K"], "v");
}

TEST(env_args_unrelated_flags_ignored) {
  auto env = parse_env_args({"run", "--name=A=B", "-v", "/a:/b", "--envfile", "X=Y", "image"});
  ASSERT_TRUE(env.empty());
}

TEST(env_args_flag_at_end_without_value) {
  auto env = parse_env_args({"run", "image", "-e"});
  ASSERT_TRUE(env.empty());
}

TEST(env_args_megabyte_inline_value) {
  std::string value(1 << 20, 'x');
  auto env = parse_env_args({"docker", "run", "--env=CONFIG_JSON=" + value, "image"});
  ASSERT_EQ(env.size(), 1u);
  ASSERT_EQ(env["CONFIG_JSON"].size(), value.size());
}

TEST(env_args_megabyte_short_cluster) {
  auto cluster = "-" + std::string(1 << 20, 'e');
  auto env = parse_env_args({"run", cluster, "K=v", cluster + "=L=w", "-" + std::string(1 << 20, 't')});
  ASSERT_EQ(env.size(), 2u);
  ASSERT_EQ(env["K"], "v");
  ASSERT_EQ(env["L"], "w");
}

TEST(env_args_inline_value_edge_forms) {
  // Empty or whitespace-led inline values are not env flags at all
  auto env = parse_env_args({"run", "--env=", "A=1", "-e= B=2", "--env=C=3", "-x=D=4", "-e-x", "E=5"});
  ASSERT_EQ(env.size(), 1u);
  ASSERT_EQ(env["C"], "3");
}

TEST(hostname_long_form_detected) {
  ASSERT_TRUE(already_has_hostname({"run", "--hostname=foo", "image"}));
  ASSERT_TRUE(already_has_hostname({"run", "--hostname", "foo", "image"}));
}

TEST(hostname_short_form_detected) {
  ASSERT_TRUE(already_has_hostname({"run", "-h", "foo", "image"}));
  ASSERT_TRUE(already_has_hostname({"run", "-th", "foo", "image"}));
  ASSERT_TRUE(already_has_hostname({"run", "-h=foo", "image"}));
}

TEST(hostname_not_detected_in_values) {
  ASSERT_FALSE(already_has_hostname({"run", "-e=HOME=/home", "image"}));
  ASSERT_FALSE(already_has_hostname({"run", "--health-cmd=true", "image"}));
  ASSERT_FALSE(already_has_hostname({"run", "-it", "image", "sh"}));
  ASSERT_FALSE(already_has_hostname({"run", "-", "image"}));
}

TEST(has_flag_bare_and_valued) {
  ASSERT_TRUE(has_flag({"run", "--cpuset-cpus=0,1"}, "--cpuset-cpus"));
  ASSERT_TRUE(has_flag({"run", "--cpuset-cpus", "0"}, "--cpuset-cpus"));
  ASSERT_FALSE(has_flag({"run", "--cpuset-cpusx=0"}, "--cpuset-cpus"));
  ASSERT_FALSE(has_flag({"run", "--cpuset-mems=0"}, "--cpuset-cpus"));
}

TEST(find_run_first_token) {
  ASSERT_FALSE(find_run({"docker", "ps"}).has_value());
  ASSERT_EQ(*find_run({"docker", "-H", "x", "run", "img", "run"}), 3u);
}
