#pragma once

#include "outlier_detect/core/exposure.hpp"

#include <cstdint>
#include <filesystem>
#include <streambuf>
#include <string>
#include <vector>

namespace outlier_detect::runner {

std::string format_bytes(uint64_t bytes);

// Sorted FITS files in input_dir matching pattern, truncated to max_frames
// when max_frames > 0.
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path &input_dir,
                                                  const std::string &pattern,
                                                  int max_frames);

uint64_t estimate_total_file_bytes(const std::vector<std::filesystem::path> &paths);

// make_output_path() with the directory replaced by output_dir.
std::string output_path_in(const std::filesystem::path &output_dir,
                           const std::string &basepath, const std::string &suffix);

// 0 complete, 2 partial, 1 anything else.
int exit_code_for_status(const std::string &status);

// Writes bytes to two stream buffers.
class TeeBuf : public std::streambuf {
public:
  TeeBuf(std::streambuf *a, std::streambuf *b);

protected:
  int overflow(int c) override;
  int sync() override;

private:
  std::streambuf *a_;
  std::streambuf *b_;
};

} // namespace outlier_detect::runner
