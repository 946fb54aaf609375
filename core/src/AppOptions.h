#pragma once

#include <string>
#include <vector>

#include "core/BlobSession.h"
#include "core/ShapeConfig.h"

namespace softblob::ui {

// Start-up configuration assembled from the command line.
struct AppOptions {
    ShapeConfig config;
    DisplayToggles toggles;
};

// Parse command-line tokens (arguments[0] is the program name) into
// `options`. Unknown flags, malformed numbers and geometry rejected by
// ValidateShapeConfig all fail with a message plus the usage text in
// `error`; `options` is only written on success.
bool ParseAppOptions(const std::vector<std::string>& arguments,
                     AppOptions& options, std::string* error = nullptr);

// One-line summary used for the start-up log entry.
[[nodiscard]] std::string DescribeAppOptions(const AppOptions& options);

}  // namespace softblob::ui
