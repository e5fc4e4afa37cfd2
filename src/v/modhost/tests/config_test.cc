/*
 * Copyright 2024 Redpanda Data, Inc.
 *
 * Use of this software is governed by the Business Source License
 * included in the file licenses/BSL.md
 *
 * As of the Change Date specified in that file, in accordance with
 * the Business Source License, use of this software will be governed
 * by the Apache License, Version 2.0
 */
#include "modhost/capability.h"
#include "modhost/config.h"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

namespace modhost {

TEST(runtime_config, defaults) {
    runtime_config cfg;
    EXPECT_FALSE(cfg.max_memory_pages.has_value());
    EXPECT_FALSE(cfg.fuel_per_invocation.has_value());
    EXPECT_EQ(cfg.max_wasm_stack, 512_KiB);
    EXPECT_TRUE(cfg.optimize);
    EXPECT_EQ(parse_yaml<runtime_config>("{}"), cfg);
}

TEST(runtime_config, parse) {
    auto cfg = parse_yaml<runtime_config>(R"(
max_memory_pages: 16
fuel_per_invocation: 1000000
max_wasm_stack: 1048576
optimize: false
)");
    EXPECT_EQ(cfg.max_memory_pages, 16);
    EXPECT_EQ(cfg.fuel_per_invocation, 1000000);
    EXPECT_EQ(cfg.max_wasm_stack, 1_MiB);
    EXPECT_FALSE(cfg.optimize);

    auto unbounded = parse_yaml<runtime_config>("max_memory_pages: ~");
    EXPECT_FALSE(unbounded.max_memory_pages.has_value());
}

TEST(runtime_config, parse_errors) {
    EXPECT_THROW(
      parse_yaml<runtime_config>("max_memory_pages: lots"), YAML::Exception);
    EXPECT_THROW(parse_yaml<runtime_config>("optimize: 3"), YAML::Exception);
    EXPECT_THROW(parse_yaml<runtime_config>("[1, 2]"), YAML::Exception);
    EXPECT_THROW(parse_yaml<runtime_config>("{"), YAML::Exception);
}

TEST(runtime_config, encode) {
    runtime_config cfg{
      .max_memory_pages = 4, .fuel_per_invocation = 100, .optimize = false};
    YAML::Node node(cfg);
    EXPECT_EQ(node["max_memory_pages"].as<uint32_t>(), 4);
    EXPECT_EQ(node["optimize"].as<bool>(), false);
    EXPECT_EQ(node.as<runtime_config>(), cfg);

    YAML::Node unbounded{runtime_config{}};
    EXPECT_TRUE(unbounded["max_memory_pages"].IsNull());
}

TEST(capability_policy, parse) {
    auto policy = parse_yaml<capability_policy>(R"(
allow: [stdio, clock, filesystem]
preopened_dirs:
  - host: /tmp/a
    guest: /a
  - host: /tmp/b
)");
    EXPECT_TRUE(policy.allows(capability::stdio));
    EXPECT_TRUE(policy.allows(capability::clock));
    EXPECT_TRUE(policy.allows(capability::filesystem));
    EXPECT_FALSE(policy.allows(capability::network));
    ASSERT_EQ(policy.preopened_dirs().size(), 2);
    EXPECT_EQ(
      policy.preopened_dirs()[0],
      (preopened_dir{.host_path = "/tmp/a", .guest_path = "/a"}));
    EXPECT_EQ(
      policy.preopened_dirs()[1],
      (preopened_dir{.host_path = "/tmp/b", .guest_path = "/tmp/b"}));

    EXPECT_EQ(parse_yaml<capability_policy>("{}"), capability_policy{});
    YAML::Node node(policy);
    EXPECT_EQ(node.as<capability_policy>(), policy);
}

TEST(capability_policy, parse_errors) {
    EXPECT_THROW(
      parse_yaml<capability_policy>("allow: [stdio, teleport]"),
      YAML::Exception);
    EXPECT_THROW(
      parse_yaml<capability_policy>("allow: stdio"), YAML::Exception);
    EXPECT_THROW(
      parse_yaml<capability_policy>("preopened_dirs: [{guest: /a}]"),
      YAML::Exception);
}

} // namespace modhost
