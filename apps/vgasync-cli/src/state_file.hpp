#pragma once

#include <vgasync/state/state_timing.hpp>

#include <filesystem>
#include <string>

namespace app {

/// @brief Reads a save state written by `WriteStateFile`.
/// @param[in] path the state file
/// @param[out] state the state read from the file
/// @param[out] error receives the reason the file could not be read
/// @return `true` if the state was read
bool ReadStateFile(const std::filesystem::path &path, vgasync::state::TimingState &state, std::string &error);

/// @brief Writes a save state in cereal's portable binary format.
/// @param[in] path the state file
/// @param[in] state the state to write
/// @param[out] error receives the reason the file could not be written
/// @return `true` if the state was written
bool WriteStateFile(const std::filesystem::path &path, const vgasync::state::TimingState &state, std::string &error);

} // namespace app
