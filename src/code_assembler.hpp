#pragma once
#include <string>

// File the instrumentation saves the first shown figure to, relative to the
// interpreter's working directory.
inline constexpr const char* kArtifactFilename = "plot.png";

// Preamble that forces a headless matplotlib backend and turns the first
// pyplot.show() into a save to kArtifactFilename. Later calls only close.
const std::string& instrumentation_preamble();

// instrumentation_preamble() followed by the user code.
std::string assemble_script(const std::string& user_code);

// Drops the lines the preamble itself prints to stderr.
std::string filter_instrumentation_lines(const std::string& stderr_text);
