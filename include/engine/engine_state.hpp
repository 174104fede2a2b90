#pragma once

namespace engine {
enum class EngineState { Success = 0, ConfigError, InitError, RunError };
} // namespace engine
