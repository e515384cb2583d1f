#include "state_file.hpp"

#include <serdes/state_cereal.hpp>

#include <cereal/archives/portable_binary.hpp>

#include <fmt/format.h>

#include <fstream>

namespace app {

bool ReadStateFile(const std::filesystem::path &path, vgasync::state::TimingState &state, std::string &error) {
    std::ifstream in{path, std::ios::binary};
    if (!in) {
        error = "file could not be opened";
        return false;
    }

    try {
        cereal::PortableBinaryInputArchive archive{in};
        archive(state);
    } catch (const cereal::Exception &e) {
        error = fmt::format("malformed state file: {}", e.what());
        return false;
    }
    return true;
}

bool WriteStateFile(const std::filesystem::path &path, const vgasync::state::TimingState &state, std::string &error) {
    std::ofstream out{path, std::ios::binary};
    if (!out) {
        error = "file could not be created";
        return false;
    }

    {
        cereal::PortableBinaryOutputArchive archive{out};
        archive(state);
    }
    if (!out) {
        error = "write failed";
        return false;
    }
    return true;
}

} // namespace app
