#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "outputs.h"
#include "repository.h"
#include "resolver.h"
#include "utils.h"
#include "version.h"

namespace {

int RunResolve(const argparse::ArgumentParser& cmd) {
  ResolverInput input;
  input.ref_type = ParseRefType(cmd.get<std::string>("--ref-type"));
  input.ref_name = cmd.get<std::string>("--ref-name");
  input.base_ref = cmd.get<std::string>("--base-ref");
  input.release_kind = ParseReleaseKind(cmd.get<std::string>("--release"));
  input.trunk = cmd.get<std::string>("--trunk");

  std::string project = cmd.get<std::string>("--project");
  if (project.empty()) {
    project = ProjectNameFromUrl(GetEnv("GITHUB_REPOSITORY"));
  }

  // The repository is only opened for what the caller did not provide.
  std::unique_ptr<Repository> repo;
  auto open_repo = [&]() -> Repository& {
    if (!repo) {
      repo = std::make_unique<Repository>(cmd.get<std::string>("--repo"));
    }
    return *repo;
  };

  std::vector<std::string> tags;
  if (cmd.is_used("--tags")) {
    tags = cmd.get<std::vector<std::string>>("--tags");
  } else {
    tags = open_repo().ListTags();
  }
  if (project.empty()) {
    project = open_repo().ProjectName();
  }

  Resolution resolution = Resolve(input, tags);
  std::string text = FormatOutputs(resolution, project);
  std::cout << text;

  std::string output = cmd.get<std::string>("--output");
  if (!output.empty()) {
    AppendOutputsFile(output, text);
  }

  spdlog::info("Resolved {} on {}: docker tag {}, new version {}",
               ReleaseKindNames().at(resolution.release_kind),
               resolution.release_ref, resolution.docker_tag,
               resolution.new_version ? resolution.new_version->ToString()
                                      : "<none>");
  return EXIT_SUCCESS;
}

int RunBump(const argparse::ArgumentParser& cmd) {
  SemanticVersion base = SemanticVersion::Parse(cmd.get<std::string>("version"));
  ReleaseKind kind = ParseReleaseKind(cmd.get<std::string>("kind"));

  std::optional<SemanticVersion> next = ComputeNextVersion(base, kind);
  if (!next) {
    spdlog::error("Release kind {} does not produce a version",
                  ReleaseKindNames().at(kind));
    return EXIT_FAILURE;
  }
  std::cout << next->ToString() << "\n";
  return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("relver"));

  argparse::ArgumentParser program("relver", RELVER_VERSION);

  program.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Enable verbose logging");

  argparse::ArgumentParser resolve_cmd("resolve");
  resolve_cmd.add_description(
      "Resolve docker tag, latest and new release version from git tags");

  resolve_cmd.add_argument("--release")
      .required()
      .help("Release kind: patch, minor, major or no_release");

  resolve_cmd.add_argument("--ref-type")
      .default_value(GetEnv("GITHUB_REF_TYPE", "branch"))
      .help("Type of the triggering ref: branch or tag");

  resolve_cmd.add_argument("--ref-name")
      .default_value(GetEnv("GITHUB_REF_NAME"))
      .help("Name of the triggering branch or tag");

  resolve_cmd.add_argument("--base-ref")
      .default_value(GetEnv("GITHUB_BASE_REF"))
      .help("Pull request base branch; overrides --ref-name as release line");

  resolve_cmd.add_argument("--trunk")
      .default_value(std::string{kDefaultTrunk})
      .help("Name of the trunk release line");

  resolve_cmd.add_argument("-r", "--repo")
      .default_value(std::string{"."})
      .help("Path to git repository");

  resolve_cmd.add_argument("-t", "--tags")
      .nargs(argparse::nargs_pattern::any)
      .default_value(std::vector<std::string>{})
      .help("Use these tags instead of reading them from the repository");

  resolve_cmd.add_argument("-p", "--project")
      .default_value(std::string())
      .help("Project name (e.g., openvas-scanner)");

  resolve_cmd.add_argument("-o", "--output")
      .default_value(GetEnv("GITHUB_OUTPUT"))
      .help("File to append the key=value results to");

  argparse::ArgumentParser bump_cmd("bump");
  bump_cmd.add_description("Print the version following VERSION for KIND");
  bump_cmd.add_argument("version").help("Base version (e.g., 1.2.3 or v1.2.3)");
  bump_cmd.add_argument("kind").help("Release kind: patch, minor or major");

  program.add_subparser(resolve_cmd);
  program.add_subparser(bump_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    spdlog::error("{}", err.what());
    std::cerr << program;
    return EXIT_FAILURE;
  }

  if (program.get<bool>("--verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  try {
    if (program.is_subcommand_used(resolve_cmd)) {
      return RunResolve(resolve_cmd);
    }
    if (program.is_subcommand_used(bump_cmd)) {
      return RunBump(bump_cmd);
    }
  } catch (const std::exception& err) {
    spdlog::error("{}", err.what());
    return EXIT_FAILURE;
  }

  std::cerr << program;
  return EXIT_FAILURE;
}
