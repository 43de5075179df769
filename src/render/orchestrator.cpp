#include "render/orchestrator.hpp"

#include "core/logging/logger.hpp"
#include "host/action_host.hpp"
#include "render/engine_selector.hpp"
#include "render/engine_support.hpp"

#include <memory>
#include <string>
#include <utility>

namespace kbake::render {

namespace {

bool ReportFailure(EngineServices& services, const BakeError& error, std::string message,
                   BakeRunResult& result) {
  services.logger.Error("bake action failed",
                        {{"code", ToStableErrorCode(error.kind)}, {"error", error.message}});
  services.host.SetFailed(message);
  result.succeeded = false;
  result.error = error;
  result.failure_message = std::move(message);
  return false;
}

} // namespace

bool RunBakeAction(EngineServices services, BakeRunResult& result) {
  result = BakeRunResult{};

  BakeError error;
  std::string engine_name;
  if (!ReadEngineInput(services, "renderEngine", true, engine_name, error)) {
    return ReportFailure(services, error, error.message, result);
  }

  services.host.Info("in run");
  services.host.Debug("in run");
  std::unique_ptr<IRenderEngine> engine;
  if (!SelectRenderEngine(engine_name, services, engine, error)) {
    return ReportFailure(services, error, error.message, result);
  }

  services.logger.SetEngine(std::string(ToString(engine->Kind())));
  services.logger.Info("bake started");

  std::filesystem::path manifest_path;
  if (!engine->Bake(manifest_path, error)) {
    return ReportFailure(services, error, "Failed to run bake action. Error: " + error.message,
                         result);
  }

  result.succeeded = true;
  result.manifest_path = manifest_path;
  return true;
}

} // namespace kbake::render
