#include <gtest/gtest.h>

#include "env_resolver.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <set>

using namespace mcphub;
using mcphub::testing::map_lookup;

TEST(EnvResolver, ExpandsFromLookup)
{
    auto lookup = map_lookup({{"TOKEN", "abc"}, {"HOST", "example.org"}});
    EXPECT_EQ(expand_placeholders("Bearer ${TOKEN}", lookup, "s"), "Bearer abc");
    EXPECT_EQ(expand_placeholders("${HOST}:${TOKEN}", lookup, "s"), "example.org:abc");
    EXPECT_EQ(expand_placeholders("no refs", lookup, "s"), "no refs");
}

TEST(EnvResolver, DefaultUsedOnlyWhenUnset)
{
    auto lookup = map_lookup({{"SET", "yes"}});
    EXPECT_EQ(expand_placeholders("${UNSET:-fallback}", lookup, "s"), "fallback");
    EXPECT_EQ(expand_placeholders("${SET:-fallback}", lookup, "s"), "yes");
    EXPECT_EQ(expand_placeholders("${UNSET:-}", lookup, "s"), "");
}

TEST(EnvResolver, StrictModeThrowsMissingVariable)
{
    auto lookup = map_lookup({});
    try {
        expand_placeholders("${API_KEY}", lookup, "github");
        FAIL() << "expected MissingEnvironmentVariable";
    } catch (const HubError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::missing_env_var);
        EXPECT_EQ(e.server(), "github");
        EXPECT_NE(std::string(e.what()).find("API_KEY"), std::string::npos);
    }
}

TEST(EnvResolver, LenientModeKeepsReference)
{
    auto lookup = map_lookup({});
    EXPECT_EQ(expand_placeholders("x=${API_KEY}", lookup, "s", false), "x=${API_KEY}");
}

TEST(EnvResolver, UnterminatedReferenceIsLiteral)
{
    auto lookup = map_lookup({{"A", "1"}});
    EXPECT_EQ(expand_placeholders("${A", lookup, "s"), "${A");
}

TEST(EnvResolver, PortPlaceholdersSurviveEnvExpansion)
{
    auto lookup = map_lookup({});
    EXPECT_TRUE(is_port_placeholder("PORT"));
    EXPECT_TRUE(is_port_placeholder("PORT_1"));
    EXPECT_FALSE(is_port_placeholder("PORTS"));
    EXPECT_FALSE(is_port_placeholder("PORT_X"));
    EXPECT_EQ(expand_placeholders("--port=${PORT}", lookup, "s"), "--port=${PORT}");
}

TEST(EnvResolver, ExpandPortsByIndex)
{
    std::vector<int> ports = {3000, 3001};
    EXPECT_EQ(expand_ports("${PORT}", ports), "3000");
    EXPECT_EQ(expand_ports("${PORT_0}/${PORT_1}", ports), "3000/3001");
    EXPECT_EQ(expand_ports("${PORT_5}", ports), "${PORT_5}");
    EXPECT_EQ(expand_ports("${PORT}", {}), "${PORT}");
}

TEST(EnvResolver, ReferencedVarsListsEachOnce)
{
    McpServerConfig cfg;
    cfg.command = "${RUNNER}";
    cfg.args = {"--token", "${TOKEN}", "${PORT}"};
    cfg.env = {{"A", "${TOKEN}"}, {"B", "${HOME_DIR:-/tmp}"}};
    auto vars = referenced_env_vars(cfg);
    std::set<std::string> got(vars.begin(), vars.end());
    EXPECT_EQ(vars.size(), 3u);
    EXPECT_TRUE(got.count("RUNNER"));
    EXPECT_TRUE(got.count("TOKEN"));
    EXPECT_TRUE(got.count("HOME_DIR"));
}

TEST(EnvResolver, ResolveLaunchSeesResolvedEnvMap)
{
    McpServerConfig cfg;
    cfg.command = "node";
    cfg.args = {"server.js", "--key=${KEY}"};
    cfg.env = {{"KEY", "${SECRET}"}};
    cfg.cwd = "/srv/${APP:-app}";

    auto launch = resolve_launch(cfg, "s", map_lookup({{"SECRET", "s3cr3t"}}));
    EXPECT_EQ(launch.command, "node");
    ASSERT_EQ(launch.args.size(), 2u);
    EXPECT_EQ(launch.args[1], "--key=s3cr3t");
    EXPECT_EQ(launch.env.at("KEY"), "s3cr3t");
    EXPECT_EQ(launch.cwd, "/srv/app");
}

TEST(EnvResolver, ResolveLaunchPackageShorthand)
{
    McpServerConfig cfg;
    cfg.package_name = "@modelcontextprotocol/server-memory";
    auto launch = resolve_launch(cfg, "memory", map_lookup({}));
    EXPECT_EQ(launch.command, "npx");
    ASSERT_EQ(launch.args.size(), 2u);
    EXPECT_EQ(launch.args[0], "-y");
    EXPECT_EQ(launch.args[1], "@modelcontextprotocol/server-memory");
}

TEST(EnvResolver, BindPortsFillsArgsAndDefaultsPortVar)
{
    ResolvedLaunch launch;
    launch.command = "server";
    launch.args = {"--listen", "${PORT}", "--admin", "${PORT_1}"};
    launch.env = {{"URL", "http://localhost:${PORT}"}};
    bind_ports(launch, {4100, 4101});

    EXPECT_EQ(launch.args[1], "4100");
    EXPECT_EQ(launch.args[3], "4101");
    EXPECT_EQ(launch.env.at("URL"), "http://localhost:4100");
    EXPECT_EQ(launch.env.at("PORT"), "4100");
}

TEST(EnvResolver, BindPortsKeepsExplicitPortVar)
{
    ResolvedLaunch launch;
    launch.env = {{"PORT", "9999"}};
    bind_ports(launch, {4100});
    EXPECT_EQ(launch.env.at("PORT"), "9999");
}

TEST(EnvResolver, OversizedPortSlotIsConfigError)
{
    McpServerConfig cfg;
    cfg.command = "server";
    cfg.args = {"--port", "${PORT_99999999999999999999}"};
    try {
        resolve_launch(cfg, "huge", map_lookup({}));
        FAIL() << "expected ConfigError";
    } catch (const HubError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::config_error);
        EXPECT_EQ(e.server(), "huge");
    }

    // Lenient resolution and port binding leave it alone
    EXPECT_NO_THROW(resolve_launch(cfg, "huge", map_lookup({}), false));
    EXPECT_EQ(expand_ports("${PORT_99999999999999999999}", {4100}), "${PORT_99999999999999999999}");
}
