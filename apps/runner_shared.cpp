#include "runner_shared.hpp"

#include "outlier_detect/core/utils.hpp"
#include "outlier_detect/detection/products.hpp"
#include "outlier_detect/io/fits_io.hpp"

#include <algorithm>
#include <cstdio>
#include <iomanip>
#include <limits>
#include <sstream>

namespace outlier_detect::runner {

namespace fs = std::filesystem;

std::string format_bytes(uint64_t bytes) {
  static const char *kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < (sizeof(kUnits) / sizeof(kUnits[0]))) {
    value /= 1024.0;
    ++unit;
  }
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(unit == 0 ? 0 : 2) << value << " "
      << kUnits[unit];
  return oss.str();
}

std::vector<fs::path> collect_inputs(const fs::path &input_dir,
                                     const std::string &pattern,
                                     int max_frames) {
  auto frames = core::discover_frames(input_dir, pattern);
  frames.erase(
      std::remove_if(frames.begin(), frames.end(),
                     [](const fs::path &p) { return !io::is_fits_image_path(p); }),
      frames.end());
  std::sort(frames.begin(), frames.end());
  if (max_frames > 0 && frames.size() > static_cast<size_t>(max_frames)) {
    frames.resize(static_cast<size_t>(max_frames));
  }
  return frames;
}

uint64_t estimate_total_file_bytes(const std::vector<fs::path> &paths) {
  uint64_t total = 0;
  for (const auto &p : paths) {
    std::error_code ec;
    const auto sz = fs::file_size(p, ec);
    if (ec) {
      continue;
    }
    if (total <= std::numeric_limits<uint64_t>::max() - static_cast<uint64_t>(sz)) {
      total += static_cast<uint64_t>(sz);
    } else {
      total = std::numeric_limits<uint64_t>::max();
      break;
    }
  }
  return total;
}

std::string output_path_in(const fs::path &output_dir, const std::string &basepath,
                           const std::string &suffix) {
  const fs::path p(detection::make_output_path(basepath, suffix));
  return (output_dir / p.filename()).string();
}

int exit_code_for_status(const std::string &status) {
  if (status == "complete") return 0;
  if (status == "partial") return 2;
  return 1;
}

TeeBuf::TeeBuf(std::streambuf *a, std::streambuf *b) : a_(a), b_(b) {}

int TeeBuf::overflow(int c) {
  if (c == EOF)
    return EOF;
  const int ra = a_ ? a_->sputc(static_cast<char>(c)) : c;
  const int rb = b_ ? b_->sputc(static_cast<char>(c)) : c;
  return (ra == EOF || rb == EOF) ? EOF : c;
}

int TeeBuf::sync() {
  int ra = a_ ? a_->pubsync() : 0;
  int rb = b_ ? b_->pubsync() : 0;
  return (ra == 0 && rb == 0) ? 0 : -1;
}

} // namespace outlier_detect::runner
