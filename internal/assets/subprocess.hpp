#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace assetdiff::assets {

struct ProcessResult {
  int         exit_code = -1;
  std::string out;
  std::string err;

  bool Ok() const {
    return exit_code == 0;
  }
};

/*
  Runs argv[0] (PATH lookup) to completion and captures both output streams.

  Throws std::runtime_error only when the process cannot be started; a
  non-zero exit is reported through ProcessResult.
*/
ProcessResult RunProcess(const std::vector<std::string>& argv, const std::filesystem::path& cwd = {});

} // namespace assetdiff::assets
