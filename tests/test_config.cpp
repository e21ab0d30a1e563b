#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"

#include <fstream>

using namespace mcphub;
using mcphub::testing::TempDir;

TEST(Config, ParsesServersAndHubSettings)
{
    auto j = nlohmann::json::parse(R"({
        "hub": {"port_base": 5000, "stop_grace_ms": 250, "cache_tools": false},
        "mcpServers": {
            "fs": {
                "command": "npx",
                "args": ["-y", "@modelcontextprotocol/server-filesystem", "."],
                "env": {"TOKEN": "${GH_TOKEN}", "DEBUG": 1},
                "workingDirectory": "/tmp",
                "setupScript": "npm install",
                "ports": [0, 8080],
                "tags": ["files"]
            }
        }
    })");
    Config c = Config::from_json(j);

    EXPECT_EQ(c.hub.port_base, 5000);
    EXPECT_EQ(c.hub.stop_grace_ms, 250);
    EXPECT_FALSE(c.hub.cache_tools);
    EXPECT_EQ(c.hub.port_attempts, 100);

    ASSERT_TRUE(c.has_server("fs"));
    auto& fs_srv = c.server("fs");
    EXPECT_EQ(fs_srv.command, "npx");
    ASSERT_EQ(fs_srv.args.size(), 3u);
    EXPECT_EQ(fs_srv.env.at("TOKEN"), "${GH_TOKEN}");
    EXPECT_EQ(fs_srv.env.at("DEBUG"), "1");
    EXPECT_EQ(fs_srv.cwd, "/tmp");
    EXPECT_EQ(fs_srv.setup_script, "npm install");
    EXPECT_EQ(fs_srv.ports, (std::vector<int>{0, 8080}));
    EXPECT_EQ(fs_srv.tags, std::vector<std::string>{"files"});
}

TEST(Config, CamelCaseKeyWinsOverSnakeCase)
{
    auto j = nlohmann::json::parse(R"({
        "mcp_servers": {"a": {"command": "old"}, "b": {"command": "only-snake"}},
        "mcpServers": {"a": {"command": "new"}}
    })");
    Config c = Config::from_json(j);
    EXPECT_EQ(c.server("a").command, "new");
    EXPECT_EQ(c.server("b").command, "only-snake");
}

TEST(Config, UnknownServerThrowsNotFound)
{
    Config c;
    try {
        c.server("nope");
        FAIL() << "expected ServerNotFound";
    } catch (const HubError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::server_not_found);
        EXPECT_EQ(e.server(), "nope");
    }
}

TEST(Config, SaveAndLoadKeepsServers)
{
    TempDir tmp;
    Config c;
    c.hub.request_timeout_ms = 1234;
    McpServerConfig srv;
    srv.command = "uvx";
    srv.args = {"mcp-server-time"};
    srv.env = {{"TZ", "UTC"}};
    srv.description = "clock";
    c.mcp_servers["time"] = srv;

    std::string path = tmp.file("nested/.mcphub.json");
    c.save(path);
    Config loaded = Config::load(path);

    EXPECT_EQ(loaded.hub.request_timeout_ms, 1234);
    ASSERT_TRUE(loaded.has_server("time"));
    EXPECT_EQ(loaded.server("time").args, std::vector<std::string>{"mcp-server-time"});
    EXPECT_EQ(loaded.server("time").env.at("TZ"), "UTC");
    EXPECT_EQ(loaded.server("time").description, "clock");
}

TEST(Config, DefaultsAreNotWritten)
{
    Config c;
    auto j = c.to_json();
    EXPECT_FALSE(j.contains("hub"));
    EXPECT_TRUE(j["mcpServers"].is_object());
}

TEST(Config, MissingOrBrokenFileFallsBackToDefaults)
{
    TempDir tmp;
    Config missing = Config::load(tmp.file("absent.json"));
    EXPECT_TRUE(missing.mcp_servers.empty());

    std::ofstream(tmp.file("broken.json")) << "{ not json";
    Config broken = Config::load(tmp.file("broken.json"));
    EXPECT_TRUE(broken.mcp_servers.empty());
    EXPECT_EQ(broken.hub.port_base, 3000);
}

TEST(Config, RemoveServer)
{
    Config c;
    c.mcp_servers["x"] = McpServerConfig{};
    EXPECT_TRUE(c.remove_server("x"));
    EXPECT_FALSE(c.remove_server("x"));
}

TEST(Config, ErrorStatusMapping)
{
    EXPECT_EQ(http_status_for(ErrorKind::server_not_found), 404);
    EXPECT_EQ(http_status_for(ErrorKind::invalid_transition), 409);
    EXPECT_EQ(http_status_for(ErrorKind::request_timeout), 504);
    EXPECT_EQ(http_status_for(ErrorKind::transport_closed), 502);
    EXPECT_EQ(http_status_for(ErrorKind::setup_failed), 500);

    HubError e(ErrorKind::port_conflict, "s1", "port 3000 was taken");
    EXPECT_EQ(e.describe(), "[PortConflict] s1: port 3000 was taken");
}
