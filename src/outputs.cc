#include <fstream>
#include <sstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "outputs.h"

namespace {

std::string VersionOrEmpty(const std::optional<SemanticVersion>& v) {
    return v ? v->ToString() : "";
}

const char* Bool(bool b) { return b ? "true" : "false"; }

}  // namespace

std::string FormatOutputs(const Resolution& resolution, const std::string& project) {
    std::ostringstream out;

    // release
    out << "latest_version=" << VersionOrEmpty(resolution.latest_version) << "\n";
    out << "new_version=" << VersionOrEmpty(resolution.new_version) << "\n";
    out << "release_kind=" << ReleaseKindNames().at(resolution.release_kind) << "\n";
    out << "release_ref=" << resolution.release_ref << "\n";
    out << "project=" << project << "\n";
    // docker
    out << "is_latest_tag=" << Bool(resolution.is_latest_tag) << "\n";
    out << "is_version_tag=" << Bool(resolution.is_version_tag) << "\n";
    out << "docker_tag=" << resolution.docker_tag << "\n";

    return out.str();
}

void AppendOutputsFile(const std::string& fpath, const std::string& text) {
    std::ofstream out(fpath, std::ios::app);
    if (!out.is_open()) {
        throw std::runtime_error("Cannot open output file: " + fpath);
    }
    out << text;
    if (!out) {
        throw std::runtime_error("Failed to write output file: " + fpath);
    }

    spdlog::debug("Appended outputs to: {}", fpath);
}
