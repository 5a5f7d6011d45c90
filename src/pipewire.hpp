#pragma once
#include "sound.hpp"

namespace sound {
// backend running its own pipewire thread loop. returns null if pipewire is not reachable
auto create_pipewire_backend() -> std::unique_ptr<Backend>;
} // namespace sound
