#pragma once

#include <memory>

#include "backend/backend.h"

namespace backend {

// Global backend registry.
//
// - Loss semantics stay in `loss::*`; kernels are swappable here.
// - Default backend is CPU.
KernelBackend& get();

// Replaces the global backend.
void set(std::unique_ptr<KernelBackend> backend);

// Device of the current backend.
Device current_device();

} // namespace backend
