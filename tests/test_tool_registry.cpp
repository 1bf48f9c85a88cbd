#include <gtest/gtest.h>

#include "fake_process_runner.hpp"
#include "local_rpc_server.hpp"
#include "tool_registry.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace toolbridge;
using toolbridge::testing::FakeProcessRunner;
using toolbridge::testing::IsInspect;
using toolbridge::testing::LocalRpcServer;
using toolbridge::testing::MakeResult;

namespace {

nlohmann::json CatalogServer(const nlohmann::json& req) {
  const std::string method = req.value("method", "");
  if (method == "tools/list") {
    nlohmann::json tools = nlohmann::json::array();
    tools.push_back({{"name", "search"},
                     {"description", "Search the docs"},
                     {"inputSchema", {{"type", "object"}, {"properties", {{"q", {{"type", "string"}}}}}}}});
    tools.push_back({{"name", "fetch"}, {"title", "Fetch a page"}});
    return {{"jsonrpc", "2.0"}, {"id", 1}, {"result", {{"tools", tools}}}};
  }
  if (method == "tools/call") {
    const std::string text = "called " + req["params"]["name"].get<std::string>();
    return {{"jsonrpc", "2.0"}, {"id", 1}, {"result", text}};
  }
  return {{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", -32601}, {"message", "unknown"}}}};
}

ToolDefinition CommandTool(const std::string& name, const std::string& tmpl) {
  ToolDefinition def;
  def.name = name;
  def.enabled = true;
  def.type = ToolType::Command;
  def.command.command_template = tmpl;
  return def;
}

ToolDefinition ProxyTool(const std::string& name, const std::string& url) {
  ToolDefinition def;
  def.name = name;
  def.enabled = true;
  def.type = ToolType::McpServer;
  def.mcp_server.server_url = url;
  def.mcp_server.timeout_seconds = 5;
  return def;
}

class ThrowingExecutor : public IToolExecutor {
 public:
  std::string Kind() const override { return "throwing"; }
  ValidationResult ValidateArguments(const nlohmann::json&) const override { return {}; }
  std::string Execute(const nlohmann::json&, const ToolCallContext&) override {
    throw std::runtime_error("kaboom");
  }
};

}  // namespace

class ToolRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    runner_ = std::make_shared<FakeProcessRunner>();
    runner_->SetHandler([](const std::vector<std::string>& argv, std::string*) -> std::optional<ProcessResult> {
      if (IsInspect(argv)) return MakeResult(0, "");
      const std::string& script = argv.back();
      if (script.rfind("echo ", 0) == 0) return MakeResult(0, script.substr(5) + "\n");
      return MakeResult(0, "");
    });
    SandboxOptions opts;
    sandbox_ = std::make_unique<SandboxExecutor>(opts, runner_);
    registry_ = std::make_unique<ToolRegistry>(sandbox_.get(), PathMapping{});
  }

  std::shared_ptr<FakeProcessRunner> runner_;
  std::unique_ptr<SandboxExecutor> sandbox_;
  std::unique_ptr<ToolRegistry> registry_;
};

TEST_F(ToolRegistryTest, StatusToolEndToEnd) {
  auto def = CommandTool("status", "echo {x}");
  def.command.default_args = {{"x", "ok"}};
  EXPECT_EQ(registry_->Load({def}), 1);
  EXPECT_EQ(registry_->ExecuteTool("status", nlohmann::json::object()), "ok");
}

TEST_F(ToolRegistryTest, UnknownToolIsText) {
  EXPECT_EQ(registry_->ExecuteTool("nope", nlohmann::json::object()), "Error: Unknown tool 'nope'");
}

TEST_F(ToolRegistryTest, ValidationFailureSkipsExecution) {
  registry_->Load({CommandTool("pair", "{a}{b}")});
  EXPECT_EQ(registry_->ExecuteTool("pair", {{"a", 1}}), "Validation error: Missing: b");
  EXPECT_TRUE(runner_->Calls().empty());
}

TEST_F(ToolRegistryTest, ExceptionsBecomeText) {
  const size_t id = registry_->AddExecutor(std::make_shared<ThrowingExecutor>());
  ToolBinding binding;
  binding.executor_id = id;
  binding.descriptor = MakeDescriptor("boom", "", nullptr);
  ASSERT_TRUE(registry_->Bind("boom", binding));
  EXPECT_EQ(registry_->ExecuteTool("boom", nlohmann::json::object()), "Error: kaboom");
}

TEST_F(ToolRegistryTest, DisabledAndBrokenToolsAreSkipped) {
  auto disabled = CommandTool("off", "ls");
  disabled.enabled = false;
  auto no_template = CommandTool("empty", "");
  auto bad_url = ProxyTool("bad", "ftp://example.com");
  auto ok = CommandTool("ok", "ls");

  EXPECT_EQ(registry_->Load({disabled, no_template, bad_url, ok}), 1);
  EXPECT_FALSE(registry_->HasTool("off"));
  EXPECT_FALSE(registry_->HasTool("empty"));
  EXPECT_FALSE(registry_->HasTool("bad"));
  EXPECT_TRUE(registry_->HasTool("ok"));
}

TEST_F(ToolRegistryTest, DuplicateNamesKeepTheFirst) {
  EXPECT_EQ(registry_->Load({CommandTool("dup", "echo first"), CommandTool("dup", "echo second")}), 1);
  EXPECT_EQ(registry_->ExecuteTool("dup", nlohmann::json::object()), "first");
}

TEST_F(ToolRegistryTest, ListToolsKeepsOrderAndDefaults) {
  auto a = CommandTool("alpha", "ls");
  a.description = "List files";
  a.input_schema = {{"type", "object"}, {"properties", {{"path", {{"type", "string"}}}}}};
  registry_->Load({CommandTool("zeta", "ls"), a});

  auto tools = registry_->ListTools();
  ASSERT_EQ(tools.size(), 2u);
  EXPECT_EQ(tools[0].name, "zeta");
  EXPECT_EQ(tools[0].description, "Tool with no description");
  EXPECT_EQ(tools[0].input_schema["type"], "object");
  EXPECT_TRUE(tools[0].input_schema["required"].is_array());
  EXPECT_EQ(tools[1].name, "alpha");
  EXPECT_EQ(tools[1].description, "List files");
  EXPECT_TRUE(tools[1].input_schema["properties"].contains("path"));

  auto def = registry_->GetToolDefinition("alpha");
  ASSERT_TRUE(def.has_value());
  EXPECT_EQ(def->description, "List files");
  EXPECT_FALSE(registry_->GetToolDefinition("missing").has_value());
}

TEST_F(ToolRegistryTest, PlainProxyToolForwards) {
  LocalRpcServer server(CatalogServer);
  EXPECT_EQ(registry_->Load({ProxyTool("docs", server.Url())}), 1);
  EXPECT_EQ(registry_->ExecuteTool("docs", {{"method", "tools/call"}, {"params", {{"name", "x"}}}}), "called x");
  EXPECT_FALSE(registry_->GetDiscoveryState("docs").has_value());
}

TEST_F(ToolRegistryTest, RemoteToolsFanOutOverOneExecutor) {
  LocalRpcServer server(CatalogServer);
  auto def = ProxyTool("docs", server.Url());
  def.mcp_server.expose_remote_tools = true;
  def.mcp_server.tool_prefix = "docs_";

  EXPECT_EQ(registry_->Load({def}), 2);
  EXPECT_EQ(registry_->ExecutorCount(), 1u);
  EXPECT_FALSE(registry_->HasTool("docs"));
  EXPECT_EQ(registry_->GetDiscoveryState("docs"), DiscoveryState::Expanded);

  auto search = registry_->GetToolDefinition("docs_search");
  ASSERT_TRUE(search.has_value());
  EXPECT_EQ(search->description, "Search the docs");
  EXPECT_TRUE(search->input_schema["properties"].contains("q"));
  EXPECT_EQ(registry_->GetToolDefinition("docs_fetch")->description, "Fetch a page");
  EXPECT_EQ(registry_->RemoteToolName("docs_fetch").value_or(""), "fetch");

  EXPECT_EQ(registry_->ExecuteTool("docs_search", {{"q", "hooks"}, {"method", "ignored"}}), "called search");
  auto reqs = server.Requests();
  ASSERT_FALSE(reqs.empty());
  EXPECT_EQ(reqs.back()["method"], "tools/call");
  EXPECT_EQ(reqs.back()["params"]["name"], "search");
  EXPECT_EQ(reqs.back()["params"]["arguments"]["q"], "hooks");
}

TEST_F(ToolRegistryTest, KeepProxyToolAlongsideDerived) {
  LocalRpcServer server(CatalogServer);
  auto def = ProxyTool("docs", server.Url());
  def.mcp_server.expose_remote_tools = true;
  def.mcp_server.keep_proxy_tool = true;

  EXPECT_EQ(registry_->Load({def}), 3);
  EXPECT_EQ(registry_->ExecutorCount(), 1u);
  EXPECT_TRUE(registry_->HasTool("docs"));
  EXPECT_TRUE(registry_->HasTool("search"));
  EXPECT_FALSE(registry_->RemoteToolName("docs").has_value());
}

TEST_F(ToolRegistryTest, FailedDiscoveryRegistersNothing) {
  LocalRpcServer server(CatalogServer);
  server.SetStatus(500);
  auto def = ProxyTool("docs", server.Url());
  def.mcp_server.expose_remote_tools = true;

  EXPECT_EQ(registry_->Load({def}), 0);
  EXPECT_EQ(registry_->ToolCount(), 0u);
  EXPECT_EQ(registry_->GetDiscoveryState("docs"), DiscoveryState::Failed);
}

TEST_F(ToolRegistryTest, DiscoveryIsBoundedByInitTimeout) {
  LocalRpcServer server([](const nlohmann::json& req) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1500));
    return CatalogServer(req);
  });
  auto def = ProxyTool("slow", server.Url());
  def.mcp_server.expose_remote_tools = true;
  def.mcp_server.init_timeout_seconds = 0.2;

  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(registry_->Load({def, CommandTool("after", "ls")}), 1);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_LT(elapsed, std::chrono::milliseconds(1200));
  EXPECT_EQ(registry_->GetDiscoveryState("slow"), DiscoveryState::Failed);
  EXPECT_TRUE(registry_->HasTool("after"));
}

TEST_F(ToolRegistryTest, LateDiscoveryWorkerIsJoinedOnDestruction) {
  auto finished = std::make_shared<std::atomic<bool>>(false);
  LocalRpcServer server([finished](const nlohmann::json& req) {
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    finished->store(true);
    return CatalogServer(req);
  });
  auto def = ProxyTool("slow", server.Url());
  def.mcp_server.expose_remote_tools = true;
  def.mcp_server.init_timeout_seconds = 0.1;

  EXPECT_EQ(registry_->Load({def}), 0);
  EXPECT_FALSE(finished->load());
  registry_.reset();
  EXPECT_TRUE(finished->load());
  EXPECT_EQ(server.Requests().size(), 1u);
}

TEST_F(ToolRegistryTest, PendingProxiesStartIdle) {
  LocalRpcServer server([](const nlohmann::json& req) {
    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    return CatalogServer(req);
  });
  auto first = ProxyTool("first", server.Url());
  first.mcp_server.expose_remote_tools = true;
  first.mcp_server.tool_prefix = "a_";
  auto second = ProxyTool("second", server.Url());
  second.mcp_server.expose_remote_tools = true;
  second.mcp_server.tool_prefix = "b_";

  std::thread loader([&] { registry_->Load({first, second}); });
  const auto give_up = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (registry_->GetDiscoveryState("first") != DiscoveryState::Fetching &&
         std::chrono::steady_clock::now() < give_up) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  EXPECT_EQ(registry_->GetDiscoveryState("first"), DiscoveryState::Fetching);
  EXPECT_EQ(registry_->GetDiscoveryState("second"), DiscoveryState::Idle);
  loader.join();

  EXPECT_EQ(registry_->GetDiscoveryState("first"), DiscoveryState::Expanded);
  EXPECT_EQ(registry_->GetDiscoveryState("second"), DiscoveryState::Expanded);
  EXPECT_EQ(registry_->ToolCount(), 4u);
}

TEST_F(ToolRegistryTest, DiscoveryStateNames) {
  EXPECT_STREQ(DiscoveryStateName(DiscoveryState::Idle), "idle");
  EXPECT_STREQ(DiscoveryStateName(DiscoveryState::Expanded), "expanded");
  EXPECT_STREQ(DiscoveryStateName(DiscoveryState::Failed), "failed");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
