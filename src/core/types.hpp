#pragma once

#include <filesystem>
#include <memory>

namespace verdict {

namespace fs = std::filesystem;

class Error;

/// Errors are immutable once built and shared between Results.
using ErrorPtr = std::shared_ptr<const Error>;

} // namespace verdict
