#pragma once

#include "render/bake_error.hpp"
#include "render/render_engine.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kbake::render {

// Tags accepted by the renderEngine input, in display order.
std::vector<std::string_view> SupportedEngineNames();

// Maps a renderEngine tag onto an EngineKind. Matching is exact: "Helm2" and
// "helm3" are unknown. Failure is kUnknownEngine naming the offending value.
bool ParseEngineKind(std::string_view name, EngineKind& kind, BakeError& error);

// Builds the engine for `kind`. Never returns nullptr.
std::unique_ptr<IRenderEngine> CreateRenderEngine(EngineKind kind, EngineServices services);

// ParseEngineKind + CreateRenderEngine.
bool SelectRenderEngine(std::string_view name, EngineServices services,
                        std::unique_ptr<IRenderEngine>& engine, BakeError& error);

} // namespace kbake::render
